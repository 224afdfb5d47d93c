#include "brainforge/webhook/coordination.hpp"

#include "brainforge/brain/state_machine.hpp"
#include "brainforge/util/log.hpp"
#include "brainforge/webhook/form_data.hpp"
#include "brainforge/webhook/token.hpp"

#include <format>
#include <utility>

namespace brainforge::webhook {

namespace {

auto ignored(std::string identifier, const RunId &run_id, std::string reason)
    -> WebhookOutcome {
  return WebhookOutcome{.received = true,
                        .action = WebhookAction::Ignored,
                        .identifier = std::move(identifier),
                        .run_id = run_id,
                        .reason = std::move(reason)};
}

struct DecodedBody {
  JsonValue body;
  std::optional<std::string> token;
};

auto decode_body(const http::HttpRequest &request) -> Result<DecodedBody> {
  if (request.content_type() == "application/x-www-form-urlencoded") {
    auto form = parse_form_data(request.body);
    if (!form) {
      return fail(form.error());
    }
    return DecodedBody{.body = std::move(form->data),
                       .token = std::move(form->token)};
  }
  if (request.body.empty()) {
    return DecodedBody{.body = make_json_object(), .token = std::nullopt};
  }
  auto json = parse_json(request.body);
  if (!json) {
    return fail(Error::ParseError);
  }
  return DecodedBody{.body = std::move(*json), .token = std::nullopt};
}

} // namespace

auto outcome_to_json(const WebhookOutcome &outcome) -> JsonValue {
  auto out = make_json_object();
  out["received"] = outcome.received;
  out["action"] = std::string(to_string_view(outcome.action));
  out["identifier"] = outcome.identifier;
  if (outcome.run_id) {
    out["run_id"] = outcome.run_id->str();
  }
  if (outcome.reason) {
    out["reason"] = *outcome.reason;
  }
  return out;
}

auto WebhookCoordinator::queue_webhook_and_wake_up(
    std::string_view slug, std::string identifier, JsonValue response,
    std::optional<std::string> token) -> task<Result<WebhookOutcome>> {
  auto waiting = co_await monitor_->find_waiting_run(slug, identifier);
  if (!waiting) {
    co_return fail(waiting.error());
  }
  if (!*waiting) {
    log::debug("No run waiting for webhook {}/{}", slug, identifier);
    co_return WebhookOutcome{.received = true,
                             .action = WebhookAction::NotFound,
                             .identifier = std::move(identifier)};
  }
  const auto run_id = (*waiting)->run_id;

  if (auto check = validate_webhook_token((*waiting)->token, token);
      !check.valid) {
    log::warn("Webhook {}/{} for run {} rejected: {}", slug, identifier,
              run_id, *check.reason);
    co_return ignored(std::move(identifier), run_id, *check.reason);
  }

  auto run = co_await monitor_->get_run(run_id);
  if (!run) {
    co_return fail(run.error());
  }
  if (*run) {
    auto gate = is_signal_valid(brain_machine(), (*run)->status,
                                SignalType::WebhookResponse);
    if (!gate.valid) {
      co_return ignored(std::move(identifier), run_id,
                        gate.reason.value_or("Signal not valid"));
    }
  }

  auto claimed = co_await monitor_->take_waiting(slug, identifier, run_id);
  if (!claimed) {
    co_return fail(claimed.error());
  }
  if (!*claimed) {
    co_return ignored(std::move(identifier), run_id,
                      "Run is no longer waiting for this webhook");
  }

  auto signal = make_signal(SignalType::WebhookResponse, std::move(response));
  signal.webhook =
      WebhookKey{.slug = std::string(slug), .identifier = identifier};
  if (auto r = co_await signals_->queue_signal(run_id, std::move(signal));
      !r) {
    log::error("Cannot queue webhook response for run {}: {}", run_id,
               r.error().message());
    co_return fail(r.error());
  }
  if (auto r = co_await host_->wake_up(run_id); !r) {
    // The signal is queued; the next wake or recovery delivers it.
    log::warn("Wake of run {} after webhook {} failed: {}", run_id, slug,
              r.error().message());
  }

  log::info("Webhook {}/{} resumed run {}", slug, identifier, run_id);
  co_return WebhookOutcome{.received = true,
                           .action = WebhookAction::Resumed,
                           .identifier = std::move(identifier),
                           .run_id = run_id};
}

auto WebhookCoordinator::handle(std::string_view slug,
                                const http::HttpRequest &request, bool system)
    -> task<Result<HandleResult>> {
  auto definition = registry_->find(slug, system);
  if (!definition) {
    co_return fail(Error::NotFound);
  }

  auto decoded = decode_body(request);
  if (!decoded) {
    log::warn("Webhook {}: cannot decode body", slug);
    co_return fail(decoded.error());
  }

  std::optional<Result<WebhookHandlerResult>> handled;
  try {
    handled.emplace(co_await (*definition->handler)(
        WebhookRequest{.http = request, .body = std::move(decoded->body)}));
  } catch (const std::exception &e) {
    log::error("Error receiving webhook {}: {}", slug, e.what());
    co_return fail(Error::HandlerFailed);
  }
  if (!*handled) {
    log::error("Error receiving webhook {}: {}", slug,
               handled->error().message());
    co_return fail(Error::HandlerFailed);
  }

  if (auto *challenge = std::get_if<VerificationChallenge>(&**handled)) {
    co_return HandleResult{std::move(*challenge)};
  }
  auto &delivery = std::get<WebhookDelivery>(**handled);
  auto outcome = co_await queue_webhook_and_wake_up(
      slug, std::move(delivery.identifier), std::move(delivery.response),
      std::move(decoded->token));
  if (!outcome) {
    co_return fail(outcome.error());
  }
  // User webhooks may arrive before any run waits on them.
  if (!system && outcome->action == WebhookAction::NotFound) {
    outcome->action = WebhookAction::Queued;
  }
  co_return HandleResult{std::move(*outcome)};
}

auto make_ui_form_webhook() -> WebhookDefinition {
  return WebhookDefinition{
      .slug = std::string(kUiFormSlug),
      .description = "Form submissions from generated pages",
      .handler = std::make_shared<WebhookHandler>(
          [](const WebhookRequest &request)
              -> task<Result<WebhookHandlerResult>> {
            auto identifier = request.http.query().get("identifier");
            if (!identifier || identifier->empty()) {
              co_return fail(Error::InvalidArgument);
            }
            co_return WebhookHandlerResult{
                WebhookDelivery{.identifier = std::move(*identifier),
                                .response = request.body}};
          }),
  };
}

} // namespace brainforge::webhook
