#pragma once

#include "brainforge/brain/agent.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/util/id.hpp"
#include "brainforge/util/json.hpp"
#include "brainforge/util/retry.hpp"
#include "brainforge/util/string_hash.hpp"

#include <ankerl/unordered_dense.h>

#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace brainforge {

/// Lets a step publish an HTML page tied to its run.
class PagePublisher {
public:
  virtual ~PagePublisher() = default;
  /// Returns the blob key the page was stored under.
  [[nodiscard]] virtual auto publish(std::string slug, std::string html,
                                     bool persist)
      -> task<Result<std::string>> = 0;
};

struct StepContext {
  RunId run_id;
  const JsonValue &state;
  /// Response of the webhook the previous block waited on.
  std::optional<JsonValue> webhook_response;
  PagePublisher *pages{nullptr};
};

struct StepOutput {
  JsonValue state;
  std::optional<WaitRequest> wait;
};

using StepFn =
    std::move_only_function<task<Result<StepOutput>>(const StepContext &)
                                const>;

struct StepBlock {
  std::string title;
  std::shared_ptr<StepFn> action;
  RetryConfig retry{};
};

struct AgentBlock {
  std::string title;
  AgentConfig config;
};

using Block = std::variant<StepBlock, AgentBlock>;

struct Brain {
  std::string title;
  std::string description;
  std::vector<Block> blocks;
};

[[nodiscard]] inline auto step_id_for(std::size_t index) -> std::string {
  return std::format("step-{}", index);
}

[[nodiscard]] inline auto block_title(const Block &block) -> const std::string & {
  return std::visit([](const auto &b) -> const std::string & { return b.title; },
                    block);
}

class BrainRegistry {
public:
  [[nodiscard]] auto add(std::shared_ptr<const Brain> brain) -> Result<void>;
  [[nodiscard]] auto find(std::string_view title) const
      -> std::shared_ptr<const Brain>;
  [[nodiscard]] auto list() const -> std::vector<std::shared_ptr<const Brain>>;

private:
  mutable std::mutex mu_;
  ankerl::unordered_dense::map<std::string, std::shared_ptr<const Brain>,
                               StringHash, StringEqual>
      brains_;
};

} // namespace brainforge
