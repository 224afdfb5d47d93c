#pragma once

#include "brainforge/app/http/http_types.hpp"
#include "brainforge/core/coroutine.hpp"
#include "brainforge/core/error.hpp"
#include "brainforge/engine/actor_host.hpp"
#include "brainforge/storage/monitor_store.hpp"
#include "brainforge/storage/signal_store.hpp"
#include "brainforge/util/enum.hpp"
#include "brainforge/webhook/webhook.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace brainforge::webhook {

enum class WebhookAction : std::uint8_t { Resumed, NotFound, Queued, Ignored };
BOOST_DESCRIBE_ENUM(WebhookAction, Resumed, NotFound, Queued, Ignored)
BRAINFORGE_DEFINE_ENUM_SERDE(WebhookAction, WebhookAction::NotFound)

struct WebhookOutcome {
  bool received{true};
  WebhookAction action{WebhookAction::NotFound};
  std::string identifier;
  std::optional<RunId> run_id;
  std::optional<std::string> reason;
};

/// `{received, action, identifier, run_id?, reason?}`.
[[nodiscard]] auto outcome_to_json(const WebhookOutcome &outcome) -> JsonValue;

using HandleResult = std::variant<VerificationChallenge, WebhookOutcome>;

inline constexpr std::string_view kUiFormSlug = "ui-form";

/// Routes an inbound webhook to the run waiting on it.
class WebhookCoordinator {
public:
  WebhookCoordinator(const WebhookRegistry &registry,
                     storage::MonitorStore &monitor,
                     storage::SignalStore &signals, ActorHost &host)
      : registry_(&registry), monitor_(&monitor), signals_(&signals),
        host_(&host) {}

  /// Find the waiting run, check the form token and the run status, claim
  /// the registration, queue WEBHOOK_RESPONSE and wake the run. Rejections
  /// are `ignored` outcomes, not errors.
  [[nodiscard]] auto
  queue_webhook_and_wake_up(std::string_view slug, std::string identifier,
                            JsonValue response,
                            std::optional<std::string> token)
      -> task<Result<WebhookOutcome>>;

  /// Full inbound path for `POST /webhooks[/system]/{slug}`. NotFound for an
  /// unknown slug, ParseError for an undecodable body, HandlerFailed when the
  /// handler fails.
  [[nodiscard]] auto handle(std::string_view slug,
                            const http::HttpRequest &request, bool system)
      -> task<Result<HandleResult>>;

private:
  const WebhookRegistry *registry_;
  storage::MonitorStore *monitor_;
  storage::SignalStore *signals_;
  ActorHost *host_;
};

/// The built-in `ui-form` system webhook: resumes a run waiting on a
/// generated form page. The identifier comes from the `identifier` query
/// parameter and the form fields are the response.
[[nodiscard]] auto make_ui_form_webhook() -> WebhookDefinition;

} // namespace brainforge::webhook
