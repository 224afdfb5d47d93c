#include "brainforge/app/api/api_server.hpp"

#include "brainforge/app/application.hpp"
#include "brainforge/app/http/http_server.hpp"
#include "brainforge/app/http/router.hpp"
#include "brainforge/brain/event_codec.hpp"
#include "brainforge/brain/signal.hpp"
#include "brainforge/engine/engine.hpp"
#include "brainforge/util/json.hpp"
#include "brainforge/util/log.hpp"
#include "brainforge/util/overloaded.hpp"
#include "brainforge/util/time.hpp"
#include "brainforge/webhook/coordination.hpp"

#include <boost/lexical_cast.hpp>

#include <algorithm>
#include <cstddef>
#include <format>
#include <string>
#include <utility>
#include <vector>

namespace brainforge {

using namespace http;

namespace api_dto {

struct RunSummaryDto {
  std::string run_id;
  std::string brain_title;
  std::string status;
  std::string error;
  std::string created_at;
  std::string started_at;
  std::string completed_at;
};

struct RunsResponseDto {
  std::vector<RunSummaryDto> runs;
};

struct WebhookDto {
  std::string slug;
  std::string description;
};

struct WebhooksResponseDto {
  std::vector<WebhookDto> webhooks;
  std::size_t count{0};
};

struct BrainDto {
  std::string title;
  std::string description;
  std::vector<std::string> blocks;
};

struct BrainsResponseDto {
  std::vector<BrainDto> brains;
};

} // namespace api_dto

} // namespace brainforge

namespace glz {

template <> struct meta<brainforge::api_dto::RunSummaryDto> {
  using T = brainforge::api_dto::RunSummaryDto;
  static constexpr auto value =
      object("run_id", &T::run_id, "brain_title", &T::brain_title, "status",
             &T::status, "error", &T::error, "created_at", &T::created_at,
             "started_at", &T::started_at, "completed_at", &T::completed_at);
};

template <> struct meta<brainforge::api_dto::RunsResponseDto> {
  using T = brainforge::api_dto::RunsResponseDto;
  static constexpr auto value = object("runs", &T::runs);
};

template <> struct meta<brainforge::api_dto::WebhookDto> {
  using T = brainforge::api_dto::WebhookDto;
  static constexpr auto value =
      object("slug", &T::slug, "description", &T::description);
};

template <> struct meta<brainforge::api_dto::WebhooksResponseDto> {
  using T = brainforge::api_dto::WebhooksResponseDto;
  static constexpr auto value =
      object("webhooks", &T::webhooks, "count", &T::count);
};

template <> struct meta<brainforge::api_dto::BrainDto> {
  using T = brainforge::api_dto::BrainDto;
  static constexpr auto value = object("title", &T::title, "description",
                                       &T::description, "blocks", &T::blocks);
};

template <> struct meta<brainforge::api_dto::BrainsResponseDto> {
  using T = brainforge::api_dto::BrainsResponseDto;
  static constexpr auto value = object("brains", &T::brains);
};

} // namespace glz

namespace brainforge {

namespace {

constexpr std::size_t kDefaultRunListLimit = 50;
constexpr std::size_t kMaxRunListLimit = 1000;

auto status_from_error(const std::error_code &ec) -> HttpStatus {
  if (ec.category() == error_category()) {
    switch (static_cast<Error>(ec.value())) {
    case Error::NotFound:
    case Error::FileNotFound:
      return HttpStatus::NotFound;
    case Error::InvalidArgument:
    case Error::ParseError:
      return HttpStatus::BadRequest;
    case Error::AlreadyExists:
    case Error::InvalidState:
      return HttpStatus::Conflict;
    case Error::Timeout:
    case Error::Cancelled:
    case Error::SystemNotRunning:
      return HttpStatus::ServiceUnavailable;
    default:
      break;
    }
  }
  return HttpStatus::InternalServerError;
}

auto error_response(const std::error_code &ec) -> HttpResponse {
  return HttpResponse::error(status_from_error(ec), ec.message());
}

template <typename T>
auto json_response_glz(const T &value, HttpStatus status = HttpStatus::Ok)
    -> HttpResponse {
  std::string buffer;
  if (auto ec = glz::write_json(value, buffer); ec) {
    log::error("JSON serialization failed for API response");
    return HttpResponse::internal_error();
  }
  return HttpResponse::json(std::string_view(buffer), status);
}

auto to_dto(const storage::RunRecord &run) -> api_dto::RunSummaryDto {
  return api_dto::RunSummaryDto{
      .run_id = run.run_id.str(),
      .brain_title = run.brain_title,
      .status = std::string(to_string_view(run.status)),
      .error = run.error.value_or(""),
      .created_at = util::format_iso8601(run.created_at),
      .started_at = util::format_iso8601(run.started_at),
      .completed_at = util::format_iso8601(run.completed_at),
  };
}

auto run_info_to_json(const RunInfo &info) -> JsonValue {
  const auto &run = info.record;
  auto out = make_json_object();
  out["run_id"] = run.run_id.str();
  out["brain_title"] = run.brain_title;
  out["status"] = std::string(to_string_view(run.status));
  if (run.error) {
    out["error"] = *run.error;
  }
  out["created_at"] = util::format_iso8601(run.created_at);
  out["started_at"] = util::format_iso8601(run.started_at);
  out["completed_at"] = util::format_iso8601(run.completed_at);
  out["event_count"] = static_cast<std::int64_t>(info.event_count);
  out["state"] = info.state;
  return out;
}

auto parse_limit(const HttpRequest &req) -> std::size_t {
  auto raw = req.query().get("limit");
  if (!raw) {
    return kDefaultRunListLimit;
  }
  try {
    return std::clamp<std::size_t>(boost::lexical_cast<std::size_t>(*raw), 1,
                                   kMaxRunListLimit);
  } catch (const boost::bad_lexical_cast &) {
    return kDefaultRunListLimit;
  }
}

auto signal_response(const Result<SignalValidation> &sent, SignalType type)
    -> HttpResponse {
  if (!sent) {
    return error_response(sent.error());
  }
  if (!sent->valid) {
    return HttpResponse::error(HttpStatus::Conflict,
                               sent->reason.value_or("Signal not valid"));
  }
  auto body = make_json_object();
  body["queued"] = true;
  body["signal"] = std::string(signal_type_name(type));
  return HttpResponse::json(body, HttpStatus::Accepted);
}

} // namespace

struct ApiServer::Impl : std::enable_shared_from_this<Impl> {
  Application &app_;
  std::shared_ptr<HttpServer> server_;

  explicit Impl(Application &app)
      : app_(app), server_(std::make_shared<HttpServer>(app.runtime())) {}

  auto handle_webhook(HttpRequest req, bool system) -> task<HttpResponse> {
    auto slug = req.path_param("slug");
    if (!slug) {
      co_return HttpResponse::bad_request();
    }
    auto handled = co_await app_.coordinator().handle(*slug, req, system);
    if (!handled) {
      const auto ec = handled.error();
      if (ec == make_error_code(Error::NotFound)) {
        co_return HttpResponse::error(
            HttpStatus::NotFound, std::format("Webhook '{}' not found", *slug));
      }
      if (ec == make_error_code(Error::ParseError)) {
        co_return HttpResponse::error(HttpStatus::BadRequest,
                                      "Malformed webhook body");
      }
      co_return HttpResponse::error(HttpStatus::InternalServerError,
                                    "Failed to process webhook");
    }
    co_return std::visit(
        overloaded{
            [](const webhook::VerificationChallenge &challenge) {
              auto body = make_json_object();
              body["challenge"] = challenge.challenge;
              return HttpResponse::json(body);
            },
            [](const webhook::WebhookOutcome &outcome) {
              return HttpResponse::json(webhook::outcome_to_json(outcome));
            },
        },
        *handled);
  }

  void setup_routes() {
    std::weak_ptr<Impl> weak_self = shared_from_this();
    auto &router = server_->router();

    router.get("/api/health", [](HttpRequest) -> task<HttpResponse> {
      auto body = make_json_object();
      body["status"] = std::string("healthy");
      co_return HttpResponse::json(body);
    });

    router.get("/webhooks", [weak_self](HttpRequest) -> task<HttpResponse> {
      auto self = weak_self.lock();
      if (!self) {
        co_return HttpResponse::error(HttpStatus::ServiceUnavailable,
                                      "Service Unavailable");
      }
      api_dto::WebhooksResponseDto dto;
      for (const auto &hook : self->app_.webhooks().list()) {
        dto.webhooks.push_back(api_dto::WebhookDto{
            .slug = hook->slug, .description = hook->description});
      }
      dto.count = dto.webhooks.size();
      co_return json_response_glz(dto);
    });

    router.post("/webhooks/{slug}",
                [weak_self](HttpRequest req) -> task<HttpResponse> {
                  auto self = weak_self.lock();
                  if (!self) {
                    co_return HttpResponse::error(
                        HttpStatus::ServiceUnavailable, "Service Unavailable");
                  }
                  co_return co_await self->handle_webhook(std::move(req),
                                                          false);
                });

    router.post("/webhooks/system/{slug}",
                [weak_self](HttpRequest req) -> task<HttpResponse> {
                  auto self = weak_self.lock();
                  if (!self) {
                    co_return HttpResponse::error(
                        HttpStatus::ServiceUnavailable, "Service Unavailable");
                  }
                  co_return co_await self->handle_webhook(std::move(req),
                                                          true);
                });

    router.get("/brains", [weak_self](HttpRequest) -> task<HttpResponse> {
      auto self = weak_self.lock();
      if (!self) {
        co_return HttpResponse::error(HttpStatus::ServiceUnavailable,
                                      "Service Unavailable");
      }
      api_dto::BrainsResponseDto dto;
      for (const auto &brain : self->app_.brains().list()) {
        api_dto::BrainDto entry{.title = brain->title,
                                .description = brain->description,
                                .blocks = {}};
        for (const auto &block : brain->blocks) {
          entry.blocks.push_back(block_title(block));
        }
        dto.brains.push_back(std::move(entry));
      }
      std::ranges::sort(dto.brains, {}, &api_dto::BrainDto::title);
      co_return json_response_glz(dto);
    });

    router.post("/brains/runs",
                [weak_self](HttpRequest req) -> task<HttpResponse> {
                  auto self = weak_self.lock();
                  if (!self) {
                    co_return HttpResponse::error(
                        HttpStatus::ServiceUnavailable, "Service Unavailable");
                  }
                  auto parsed = parse_json(req.body);
                  if (!parsed || !parsed->is_object()) {
                    co_return HttpResponse::error(
                        HttpStatus::BadRequest,
                        "Request body must be a JSON object");
                  }
                  auto title = json_string_field(*parsed, "brain_title");
                  if (!title || title->empty()) {
                    co_return HttpResponse::error(HttpStatus::BadRequest,
                                                  "Missing brain_title");
                  }
                  auto initial = json_field(*parsed, "initial_state");
                  if (!initial.is_null() && !initial.is_object()) {
                    co_return HttpResponse::error(
                        HttpStatus::BadRequest,
                        "initial_state must be an object");
                  }

                  auto run_id = co_await self->app_.engine().start_run(
                      *title, std::move(initial));
                  if (!run_id) {
                    co_return error_response(run_id.error());
                  }
                  auto body = make_json_object();
                  body["brain_run_id"] = run_id->str();
                  co_return HttpResponse::json(body, HttpStatus::Created);
                });

    router.get("/brains/runs",
               [weak_self](HttpRequest req) -> task<HttpResponse> {
                 auto self = weak_self.lock();
                 if (!self) {
                   co_return HttpResponse::error(
                       HttpStatus::ServiceUnavailable, "Service Unavailable");
                 }
                 auto runs =
                     co_await self->app_.engine().list_runs(parse_limit(req));
                 if (!runs) {
                   co_return error_response(runs.error());
                 }
                 api_dto::RunsResponseDto dto;
                 dto.runs.reserve(runs->size());
                 for (const auto &run : *runs) {
                   dto.runs.push_back(to_dto(run));
                 }
                 co_return json_response_glz(dto);
               });

    router.get("/brains/runs/{run_id}",
               [weak_self](HttpRequest req) -> task<HttpResponse> {
                 auto self = weak_self.lock();
                 if (!self) {
                   co_return HttpResponse::error(
                       HttpStatus::ServiceUnavailable, "Service Unavailable");
                 }
                 auto run_id = req.path_param("run_id");
                 if (!run_id) {
                   co_return HttpResponse::bad_request();
                 }
                 auto info =
                     co_await self->app_.engine().run_info(RunId{*run_id});
                 if (!info) {
                   co_return error_response(info.error());
                 }
                 co_return HttpResponse::json(run_info_to_json(*info));
               });

    router.get("/brains/runs/{run_id}/events",
               [weak_self](HttpRequest req) -> task<HttpResponse> {
                 auto self = weak_self.lock();
                 if (!self) {
                   co_return HttpResponse::error(
                       HttpStatus::ServiceUnavailable, "Service Unavailable");
                 }
                 auto run_id = req.path_param("run_id");
                 if (!run_id) {
                   co_return HttpResponse::bad_request();
                 }
                 auto events =
                     co_await self->app_.engine().load_events(RunId{*run_id});
                 if (!events) {
                   co_return error_response(events.error());
                 }
                 if (events->empty()) {
                   co_return HttpResponse::not_found();
                 }
                 auto list = make_json_array();
                 for (const auto &event : *events) {
                   auto encoded = encode_event(event);
                   encoded["event_id"] = event.event_id;
                   list.get_array().push_back(std::move(encoded));
                 }
                 auto body = make_json_object();
                 body["count"] = static_cast<std::int64_t>(events->size());
                 body["events"] = std::move(list);
                 co_return HttpResponse::json(body);
               });

    router.post(
        "/brains/runs/{run_id}/signals",
        [weak_self](HttpRequest req) -> task<HttpResponse> {
          auto self = weak_self.lock();
          if (!self) {
            co_return HttpResponse::error(HttpStatus::ServiceUnavailable,
                                          "Service Unavailable");
          }
          auto run_id = req.path_param("run_id");
          if (!run_id) {
            co_return HttpResponse::bad_request();
          }
          auto parsed = parse_json(req.body);
          if (!parsed || !parsed->is_object()) {
            co_return HttpResponse::error(HttpStatus::BadRequest,
                                          "Request body must be a JSON object");
          }
          auto type_name = json_string_field(*parsed, "type").value_or("");
          auto type = parse_signal_type(type_name);
          if (!type) {
            co_return HttpResponse::error(
                HttpStatus::BadRequest,
                std::format("Unknown signal type: {}", type_name));
          }
          // Webhook responses only enter through the webhook routes.
          if (*type == SignalType::WebhookResponse) {
            co_return HttpResponse::error(
                HttpStatus::BadRequest,
                "WEBHOOK_RESPONSE must be delivered through /webhooks");
          }

          JsonValue payload;
          if (*type == SignalType::UserMessage) {
            auto content = json_string_field(*parsed, "content");
            if (!content) {
              co_return HttpResponse::error(HttpStatus::BadRequest,
                                            "USER_MESSAGE requires content");
            }
            payload = make_json_object();
            payload["content"] = std::move(*content);
          }

          auto sent = co_await self->app_.engine().send_signal(
              RunId{*run_id}, make_signal(*type, std::move(payload)));
          co_return signal_response(sent, *type);
        });

    router.del("/brains/runs/{run_id}",
               [weak_self](HttpRequest req) -> task<HttpResponse> {
                 auto self = weak_self.lock();
                 if (!self) {
                   co_return HttpResponse::error(
                       HttpStatus::ServiceUnavailable, "Service Unavailable");
                 }
                 auto run_id = req.path_param("run_id");
                 if (!run_id) {
                   co_return HttpResponse::bad_request();
                 }
                 auto sent = co_await self->app_.engine().send_signal(
                     RunId{*run_id}, make_signal(SignalType::Kill));
                 co_return signal_response(sent, SignalType::Kill);
               });
  }

  auto start() -> Result<void> {
    const auto &api_cfg = app_.config().api;
    return app_.sync_wait(server_->start(api_cfg.host, api_cfg.port));
  }

  void stop() {
    if (server_) {
      server_->stop();
    }
  }
};

ApiServer::ApiServer(Application &app) : impl_(std::make_shared<Impl>(app)) {
  impl_->setup_routes();
}

ApiServer::~ApiServer() = default;

auto ApiServer::start() -> Result<void> { return impl_->start(); }

void ApiServer::stop() { impl_->stop(); }

bool ApiServer::is_running() const { return impl_->server_->is_running(); }

auto ApiServer::port() const -> std::uint16_t { return impl_->server_->port(); }

auto ApiServer::handle(HttpRequest req) -> task<HttpResponse> {
  co_return co_await impl_->server_->router().route(std::move(req));
}

} // namespace brainforge
