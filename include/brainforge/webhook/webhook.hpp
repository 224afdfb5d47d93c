#pragma once

#include "brainforge/app/http/http_types.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/util/json.hpp"
#include "brainforge/util/string_hash.hpp"

#include <ankerl/unordered_dense.h>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace brainforge::webhook {

/// What a handler sees: the raw request plus its decoded body (JSON, or the
/// form fields with the CSRF token stripped).
struct WebhookRequest {
  const http::HttpRequest &http;
  JsonValue body;
};

/// Provider handshake (Slack, Stripe, ...): echo the challenge back.
struct VerificationChallenge {
  std::string challenge;
};

struct WebhookDelivery {
  std::string identifier;
  JsonValue response;
};

using WebhookHandlerResult = std::variant<VerificationChallenge, WebhookDelivery>;

using WebhookHandler =
    std::move_only_function<task<Result<WebhookHandlerResult>>(
        const WebhookRequest &) const>;

struct WebhookDefinition {
  std::string slug;
  std::string description;
  std::shared_ptr<WebhookHandler> handler;
};

/// Lookup of user webhooks (`/webhooks/{slug}`) and system webhooks
/// (`/webhooks/system/{slug}`), kept apart so a user slug never shadows a
/// system one.
class WebhookRegistry {
public:
  [[nodiscard]] auto add(WebhookDefinition definition) -> Result<void>;
  [[nodiscard]] auto add_system(WebhookDefinition definition) -> Result<void>;

  [[nodiscard]] auto find(std::string_view slug, bool system = false) const
      -> std::shared_ptr<const WebhookDefinition>;
  /// User webhooks only, ordered by slug.
  [[nodiscard]] auto list() const
      -> std::vector<std::shared_ptr<const WebhookDefinition>>;

private:
  using Table =
      ankerl::unordered_dense::map<std::string,
                                   std::shared_ptr<const WebhookDefinition>,
                                   StringHash, StringEqual>;

  [[nodiscard]] auto insert(Table &table, WebhookDefinition definition)
      -> Result<void>;

  mutable std::mutex mu_;
  Table user_;
  Table system_;
};

} // namespace brainforge::webhook
