#include "brainforge/app/api/api_server.hpp"
#include "brainforge/app/application.hpp"
#include "brainforge/engine/engine.hpp"
#include "brainforge/util/json.hpp"

#include "test_utils.hpp"

#include <memory>
#include <string>

#include "gtest/gtest.h"

using namespace brainforge;
using namespace brainforge::http;
using brainforge::test::json;
using brainforge::test::merge_step;
using brainforge::test::capture_response_step;
using brainforge::test::wait_for;

namespace {

// Keys the delivery on the `id` query parameter and forwards the body.
auto approval_webhook() -> webhook::WebhookDefinition {
  return webhook::WebhookDefinition{
      .slug = "approval",
      .description = "manual approval",
      .handler = std::make_shared<webhook::WebhookHandler>(
          [](const webhook::WebhookRequest &request)
              -> task<Result<webhook::WebhookHandlerResult>> {
            auto id = request.http.query().get("id");
            if (!id) {
              co_return fail(Error::InvalidArgument);
            }
            co_return webhook::WebhookHandlerResult{webhook::WebhookDelivery{
                .identifier = *id, .response = request.body}};
          }),
  };
}

class ApiTest : public ::testing::Test {
protected:
  void SetUp() override {
    SystemConfig cfg;
    cfg.api.enabled = false;
    cfg.engine.shards = 2;
    app = std::make_unique<Application>(std::move(cfg));

    ASSERT_TRUE(app->brains().add(test::make_brain(
        "greeter", {merge_step("hello", json(R"({"greeting":"hi"})"))})));
    ASSERT_TRUE(app->brains().add(test::make_brain(
        "approver", {merge_step("ask", json("{}"),
                                wait_for("approval", "req-7")),
                     capture_response_step("record", "decision")})));
    ASSERT_TRUE(app->webhooks().add(approval_webhook()));

    ASSERT_TRUE(app->start());
    server = std::make_unique<ApiServer>(*app);
  }

  void TearDown() override {
    server.reset();
    app->stop();
  }

  auto send(HttpMethod method, std::string_view target, std::string body = {})
      -> HttpResponse {
    HttpRequest req;
    req.method = method;
    const auto q = target.find('?');
    req.path = std::string(target.substr(0, q));
    if (q != std::string_view::npos) {
      req.query_string = std::string(target.substr(q + 1));
    }
    if (!body.empty()) {
      req.headers.emplace("content-type", "application/json");
    }
    req.body = std::move(body);
    return app->sync_wait(server->handle(std::move(req)));
  }

  auto start_run(std::string_view title) -> std::string {
    auto resp = send(HttpMethod::POST, "/brains/runs",
                     std::string(R"({"brain_title":")") + std::string(title) +
                         R"("})");
    EXPECT_EQ(resp.status, HttpStatus::Created);
    auto id = json_string_field(json(resp.body), "brain_run_id");
    if (!id) {
      throw std::runtime_error("no brain_run_id in " + resp.body);
    }
    settle(*id);
    return *id;
  }

  auto settle(const std::string &id) -> void {
    (void)app->sync_wait(app->engine().run_until_idle(RunId{id}));
  }

  auto run_status(const std::string &id) -> std::string {
    auto resp = send(HttpMethod::GET, "/brains/runs/" + id);
    EXPECT_EQ(resp.status, HttpStatus::Ok);
    return json_string_field(json(resp.body), "status").value_or("");
  }

  std::unique_ptr<Application> app;
  std::unique_ptr<ApiServer> server;
};

} // namespace

TEST(ApiServerTest, ConstructsWithoutListening) {
  SystemConfig cfg;
  cfg.api.enabled = false;
  Application app(std::move(cfg));
  EXPECT_EQ(app.config().api.host, "127.0.0.1");
  ASSERT_TRUE(app.start());
  EXPECT_EQ(app.api_server(), nullptr);
  ApiServer server(app);
  EXPECT_FALSE(server.is_running());
  app.stop();
}

TEST_F(ApiTest, Health) {
  auto resp = send(HttpMethod::GET, "/api/health");
  EXPECT_EQ(resp.status, HttpStatus::Ok);
  EXPECT_EQ(json_string_field(json(resp.body), "status"), "healthy");
}

TEST_F(ApiTest, UnknownRouteIsNotFound) {
  EXPECT_EQ(send(HttpMethod::GET, "/nope").status, HttpStatus::NotFound);
}

TEST_F(ApiTest, ListsUserWebhooksOnly) {
  auto resp = send(HttpMethod::GET, "/webhooks");
  ASSERT_EQ(resp.status, HttpStatus::Ok);
  auto body = json(resp.body);
  EXPECT_EQ(json_int_field(body, "count"), 1);
  const auto &hooks = body.get_object().at("webhooks").get_array();
  ASSERT_EQ(hooks.size(), 1U);
  EXPECT_EQ(json_string_field(hooks[0], "slug"), "approval");
  EXPECT_EQ(json_string_field(hooks[0], "description"), "manual approval");
}

TEST_F(ApiTest, ListsBrainsWithBlockTitles) {
  auto resp = send(HttpMethod::GET, "/brains");
  ASSERT_EQ(resp.status, HttpStatus::Ok);
  const auto &brains = json(resp.body).get_object().at("brains").get_array();
  ASSERT_EQ(brains.size(), 2U);
  EXPECT_EQ(json_string_field(brains[0], "title"), "approver");
  EXPECT_EQ(json_string_field(brains[1], "title"), "greeter");
  EXPECT_TRUE(json_equal(json_field(brains[0], "blocks"),
                         json(R"(["ask","record"])")));
}

TEST_F(ApiTest, StartRunAndInspect) {
  auto id = start_run("greeter");
  EXPECT_EQ(run_status(id), "complete");

  auto detail = json(send(HttpMethod::GET, "/brains/runs/" + id).body);
  EXPECT_EQ(json_string_field(detail, "brain_title"), "greeter");
  EXPECT_TRUE(
      json_equal(json_field(detail, "state"), json(R"({"greeting":"hi"})")));
  EXPECT_EQ(json_int_field(detail, "event_count"), 5);

  auto events = send(HttpMethod::GET, "/brains/runs/" + id + "/events");
  ASSERT_EQ(events.status, HttpStatus::Ok);
  auto log = json(events.body);
  EXPECT_EQ(json_int_field(log, "count"), 5);
  const auto &list = log.get_object().at("events").get_array();
  ASSERT_EQ(list.size(), 5U);
  EXPECT_EQ(json_string_field(list.front(), "type"), "start");
  EXPECT_EQ(json_string_field(list.back(), "type"), "complete");
  EXPECT_TRUE(json_int_field(list.front(), "event_id").has_value());

  auto runs = send(HttpMethod::GET, "/brains/runs?limit=10");
  ASSERT_EQ(runs.status, HttpStatus::Ok);
  const auto &summaries = json(runs.body).get_object().at("runs").get_array();
  ASSERT_EQ(summaries.size(), 1U);
  EXPECT_EQ(json_string_field(summaries[0], "run_id"), id);
  EXPECT_EQ(json_string_field(summaries[0], "status"), "complete");
}

TEST_F(ApiTest, StartRunRejectsBadRequests) {
  EXPECT_EQ(send(HttpMethod::POST, "/brains/runs", "not json").status,
            HttpStatus::BadRequest);
  EXPECT_EQ(send(HttpMethod::POST, "/brains/runs", "{}").status,
            HttpStatus::BadRequest);
  EXPECT_EQ(send(HttpMethod::POST, "/brains/runs",
                 R"({"brain_title":"greeter","initial_state":[1]})")
                .status,
            HttpStatus::BadRequest);
  EXPECT_EQ(send(HttpMethod::POST, "/brains/runs",
                 R"({"brain_title":"nobody"})")
                .status,
            HttpStatus::NotFound);
}

TEST_F(ApiTest, UnknownRunIsNotFound) {
  EXPECT_EQ(send(HttpMethod::GET, "/brains/runs/missing").status,
            HttpStatus::NotFound);
  EXPECT_EQ(send(HttpMethod::GET, "/brains/runs/missing/events").status,
            HttpStatus::NotFound);
  EXPECT_EQ(send(HttpMethod::POST, "/brains/runs/missing/signals",
                 R"({"type":"KILL"})")
                .status,
            HttpStatus::NotFound);
}

TEST_F(ApiTest, WebhookResumesWaitingRun) {
  auto id = start_run("approver");
  EXPECT_EQ(run_status(id), "waiting");

  auto resp = send(HttpMethod::POST, "/webhooks/approval?id=req-7",
                   R"({"approved":true})");
  ASSERT_EQ(resp.status, HttpStatus::Ok);
  auto outcome = json(resp.body);
  EXPECT_EQ(json_string_field(outcome, "action"), "resumed");
  EXPECT_EQ(json_string_field(outcome, "run_id"), id);

  settle(id);
  EXPECT_EQ(run_status(id), "complete");
  auto detail = json(send(HttpMethod::GET, "/brains/runs/" + id).body);
  EXPECT_TRUE(json_equal(json_field(detail, "state"),
                         json(R"({"decision":{"approved":true}})")));
}

TEST_F(ApiTest, WebhookErrors) {
  EXPECT_EQ(send(HttpMethod::POST, "/webhooks/unknown", "{}").status,
            HttpStatus::NotFound);
  EXPECT_EQ(send(HttpMethod::POST, "/webhooks/approval?id=x", "{oops").status,
            HttpStatus::BadRequest);
  // Handler rejects a delivery without an identifier.
  EXPECT_EQ(send(HttpMethod::POST, "/webhooks/approval", "{}").status,
            HttpStatus::InternalServerError);

  auto early = send(HttpMethod::POST, "/webhooks/approval?id=nobody", "{}");
  ASSERT_EQ(early.status, HttpStatus::Ok);
  EXPECT_EQ(json_string_field(json(early.body), "action"), "queued");
}

TEST_F(ApiTest, SignalsAreGatedByRunStatus) {
  auto id = start_run("approver");
  const auto signals = "/brains/runs/" + id + "/signals";

  auto pause = send(HttpMethod::POST, signals, R"({"type":"PAUSE"})");
  EXPECT_EQ(pause.status, HttpStatus::Conflict);
  EXPECT_EQ(json_string_field(json(pause.body), "error"),
            "Cannot PAUSE brain in 'waiting' state");

  EXPECT_EQ(send(HttpMethod::POST, signals, R"({"type":"BOGUS"})").status,
            HttpStatus::BadRequest);
  EXPECT_EQ(
      send(HttpMethod::POST, signals, R"({"type":"WEBHOOK_RESPONSE"})").status,
      HttpStatus::BadRequest);
  EXPECT_EQ(send(HttpMethod::POST, signals, "[]").status,
            HttpStatus::BadRequest);

  auto kill = send(HttpMethod::DELETE, "/brains/runs/" + id);
  ASSERT_EQ(kill.status, HttpStatus::Accepted);
  auto body = json(kill.body);
  EXPECT_TRUE(json_equal(json_field(body, "queued"), json("true")));
  EXPECT_EQ(json_string_field(body, "signal"), "KILL");

  settle(id);
  EXPECT_EQ(run_status(id), "cancelled");
  EXPECT_EQ(send(HttpMethod::DELETE, "/brains/runs/" + id).status,
            HttpStatus::Conflict);
}
