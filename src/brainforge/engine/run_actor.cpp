#include "brainforge/engine/run_actor.hpp"

#include "brainforge/core/asio_awaitable.hpp"
#include "brainforge/core/when_all.hpp"
#include "brainforge/engine/agent_context.hpp"
#include "brainforge/engine/state_reconstructor.hpp"
#include "brainforge/util/json_patch.hpp"
#include "brainforge/util/log.hpp"
#include "brainforge/util/overloaded.hpp"
#include "brainforge/util/retry.hpp"
#include "brainforge/util/time.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <chrono>
#include <format>
#include <unordered_set>
#include <utility>

namespace brainforge {

RunActor::RunActor(Executor executor, RunId run_id,
                   std::shared_ptr<const Brain> brain, RunServices &services)
    : executor_(std::move(executor)), run_id_(std::move(run_id)),
      brain_(std::move(brain)), services_(&services),
      pages_(run_id_, services.blobs, services.monitor),
      tool_slots_(static_cast<std::size_t>(
          std::max(1, services.max_parallel_tools))),
      state_(make_json_object()), alarm_timer_(executor_) {}

auto RunActor::start(JsonValue initial_state) -> task<Result<void>> {
  auto self = shared_from_this();
  co_return co_await co_spawn(
      executor_,
      [self, state = std::move(initial_state)]() mutable
          -> task<Result<void>> {
        self->created_at_ = util::now_millis();
        self->state_ = state.is_null() ? make_json_object() : std::move(state);
        co_return co_await self->emit(
            StartEvent{.title = self->brain_->title,
                       .description = self->brain_->description,
                       .initial_state = self->state_});
      },
      use_awaitable);
}

auto RunActor::restore(std::vector<Event> events) -> task<Result<void>> {
  auto self = shared_from_this();
  co_return co_await co_spawn(
      executor_,
      [self, events = std::move(events)]() mutable -> task<Result<void>> {
        RunStateMachine machine;
        for (const auto &event : events) {
          if (auto r = machine.apply(event); !r) {
            log::error("Run {}: event {} ({}) rejected during replay",
                       self->run_id_, event.event_id,
                       to_string_view(event.type()));
            co_return fail(Error::CorruptEventLog);
          }
        }
        auto state = reconstruct_current_state(events);
        if (!state) {
          co_return fail(state.error());
        }

        self->machine_ = machine;
        self->state_ = std::move(*state);
        self->created_at_ =
            events.empty() ? util::now_millis() : events.front().timestamp;
        self->events_ = std::move(events);

        const auto &snap = self->machine_.snapshot();
        if (snap.response_pending) {
          auto last = co_await self->services_->loader.load_event_by_type(
              self->run_id_, EventType::WebhookResponse,
              storage::EventOrder::Descending);
          if (!last) {
            co_return fail(last.error());
          }
          if (*last) {
            if (const auto *resp = (*last)->as<WebhookResponseEvent>()) {
              self->webhook_response_ = resp->response;
            }
          }
        }

        if (snap.status == RunStatus::Waiting) {
          auto deadline =
              co_await self->services_->monitor.get_timeout(self->run_id_);
          if (!deadline) {
            co_return fail(deadline.error());
          }
          if (*deadline) {
            self->arm_alarm(**deadline);
          }
        }
        log::debug("Run {} restored at {} events ({})", self->run_id_,
                   self->events_.size(), to_string_view(snap.status));
        co_return ok();
      },
      use_awaitable);
}

auto RunActor::wake_up() -> void {
  boost::asio::post(executor_,
                    [self = shared_from_this()] { self->request_tick(); });
}

auto RunActor::run_until_idle() -> task<Result<void>> {
  auto self = shared_from_this();
  co_return co_await co_spawn(
      executor_,
      [self]() -> task<Result<void>> {
        self->request_tick();
        if (self->ticking_) {
          auto waiter = std::make_shared<IdleChannel>(self->executor_, 1);
          self->idle_waiters_.push_back(waiter);
          auto [ec] = co_await waiter->async_receive(use_nothrow);
          if (ec) {
            co_return fail(Error::Cancelled);
          }
        }
        if (self->last_exception_) {
          std::rethrow_exception(self->last_exception_);
        }
        if (self->last_error_) {
          co_return fail(self->last_error_);
        }
        co_return ok();
      },
      use_awaitable);
}

auto RunActor::shutdown() -> void {
  boost::asio::post(executor_, [self = shared_from_this()] {
    ++self->alarm_generation_;
    self->alarm_deadline_.reset();
    self->alarm_timer_.cancel();
  });
}

auto RunActor::request_tick() -> void {
  if (ticking_) {
    wake_pending_ = true;
    return;
  }
  ticking_ = true;
  wake_pending_ = true;
  co_spawn(
      executor_,
      [self = shared_from_this()]() -> task<void> {
        co_await self->run_ticks();
      },
      detached);
}

auto RunActor::run_ticks() -> task<void> {
  last_error_.clear();
  last_exception_ = nullptr;
  while (wake_pending_) {
    wake_pending_ = false;
    try {
      if (auto r = co_await tick(); !r) {
        last_error_ = r.error();
        log::error("Run {} tick failed: {}", run_id_, r.error().message());
      }
    } catch (const std::exception &e) {
      last_exception_ = std::current_exception();
      log::error("Run {} step threw: {}", run_id_, e.what());
    }
  }
  ticking_ = false;
  for (auto &waiter : idle_waiters_) {
    (void)waiter->try_send(boost::system::error_code{});
  }
  idle_waiters_.clear();
}

auto RunActor::tick() -> task<Result<void>> {
  if (is_terminal(machine_.snapshot().status)) {
    co_return ok();
  }
  if (auto running = co_await handle_control_signals(); !running) {
    co_return fail(running.error());
  }
  if (machine_.snapshot().status == RunStatus::Waiting) {
    if (auto r = co_await handle_webhook_signals(); !r) {
      co_return r;
    }
  }
  if (machine_.snapshot().status != RunStatus::Running) {
    co_return ok();
  }
  co_return co_await drive();
}

auto RunActor::emit(EventBody body) -> task<Result<void>> {
  Event event{.run_id = run_id_,
              .timestamp = util::now_millis(),
              .body = std::move(body)};
  if (!machine_.can_apply(event.type())) {
    log::warn("Run {}: {} not allowed while {}", run_id_,
              to_string_view(event.type()),
              to_string_view(machine_.snapshot().status));
    co_return fail(Error::InvalidState);
  }
  if (auto r = co_await services_->log.append(event); !r) {
    co_return r;
  }
  if (auto r = machine_.apply(event); !r) {
    co_return r;
  }
  events_.push_back(std::move(event));

  const AdapterContext ctx{.event = events_.back(),
                           .snapshot = machine_.snapshot(),
                           .brain_title = brain_->title,
                           .created_at = created_at_,
                           .alarm = *this};
  for (const auto &adapter : services_->adapters) {
    if (auto r = co_await adapter->dispatch(ctx); !r) {
      log::error("Run {}: adapter failed on {}: {}", run_id_,
                 to_string_view(ctx.event.type()), r.error().message());
    }
  }
  log::trace("Run {} emitted {} #{}", run_id_, to_string_view(ctx.event.type()),
             ctx.event.event_id);
  co_return ok();
}

auto RunActor::handle_control_signals() -> task<Result<bool>> {
  auto signals = co_await services_->signals.get_and_consume_signals(
      run_id_, SignalFilter::Control);
  if (!signals) {
    co_return fail(signals.error());
  }

  for (const auto &signal : *signals) {
    const auto status = machine_.snapshot().status;
    if (auto v = is_signal_valid(brain_machine(), status, signal.type);
        !v.valid) {
      log::warn("Run {} dropped {}: {}", run_id_, signal_type_name(signal.type),
                v.reason.value_or("not valid"));
      continue;
    }

    Result<void> applied = ok();
    switch (signal.type) {
    case SignalType::Kill: {
      CancelledEvent cancelled{.title = brain_->title};
      if (json_string_field(signal.payload, "reason") == "timeout") {
        cancelled.error =
            ErrorInfo{.name = "WebhookTimeoutError",
                      .message = "Webhook response did not arrive in time"};
      }
      applied = co_await emit(std::move(cancelled));
      break;
    }
    case SignalType::Pause:
      applied = co_await emit(PausedEvent{});
      break;
    case SignalType::Resume:
      applied = co_await emit(ResumedEvent{});
      break;
    case SignalType::UserMessage:
      user_messages_.push_back(
          json_string_field(signal.payload, "content").value_or(""));
      break;
    case SignalType::WebhookResponse:
      break;
    }
    if (!applied) {
      co_return fail(applied.error());
    }
  }
  co_return machine_.snapshot().status == RunStatus::Running;
}

auto RunActor::handle_webhook_signals() -> task<Result<void>> {
  auto signals = co_await services_->signals.get_and_consume_signals(
      run_id_, SignalFilter::Webhook);
  if (!signals) {
    co_return fail(signals.error());
  }
  const auto &pending = machine_.snapshot().pending_wait;
  auto answers_wait = [&](const Signal &signal) {
    if (!signal.webhook || !pending) {
      return true;
    }
    return std::ranges::any_of(pending->wait_for, [&](const WaitFor &w) {
      return w.slug == signal.webhook->slug &&
             w.identifier == signal.webhook->identifier;
    });
  };

  auto first = std::ranges::find_if(*signals, answers_wait);
  for (auto it = signals->begin(); it != signals->end(); ++it) {
    if (it == first) {
      continue;
    }
    if (it->webhook) {
      log::warn("Run {} dropped webhook response {} for {}/{}", run_id_,
                it->id, it->webhook->slug, it->webhook->identifier);
    } else {
      log::warn("Run {} dropped extra webhook response {}", run_id_, it->id);
    }
  }
  if (first == signals->end()) {
    co_return ok();
  }
  if (auto r = co_await emit(WebhookResponseEvent{.response = first->payload});
      !r) {
    co_return r;
  }
  webhook_response_ = std::move(first->payload);
  co_return ok();
}

auto RunActor::drive() -> task<Result<void>> {
  const auto &blocks = brain_->blocks;
  while (true) {
    auto running = co_await handle_control_signals();
    if (!running) {
      co_return fail(running.error());
    }
    if (!*running) {
      co_return ok();
    }

    const auto &done = machine_.snapshot().completed_steps;
    std::size_t index = 0;
    while (index < blocks.size() && done.contains(step_id_for(index))) {
      ++index;
    }
    if (index == blocks.size()) {
      co_return co_await emit(CompleteEvent{.title = brain_->title});
    }

    auto outcome = co_await std::visit(
        overloaded{
            [&](const StepBlock &b) { return run_step(index, b); },
            [&](const AgentBlock &b) { return run_agent(index, b); },
        },
        blocks[index]);
    if (!outcome) {
      co_return fail(outcome.error());
    }
    if (*outcome != BlockOutcome::Completed) {
      co_return ok();
    }
  }
}

auto RunActor::run_step(std::size_t index, const StepBlock &block)
    -> task<Result<BlockOutcome>> {
  const auto step_id = step_id_for(index);
  if (auto r = co_await emit(
          StepStartEvent{.step_id = step_id, .step_title = block.title});
      !r) {
    co_return fail(r.error());
  }
  if (!block.action) {
    if (auto r = co_await fail_step(
            index, ErrorInfo{.name = "StepError",
                             .message = std::format("Step '{}' has no action",
                                                    block.title)});
        !r) {
      co_return fail(r.error());
    }
    co_return fail(Error::InvalidArgument);
  }

  const StepContext ctx{.run_id = run_id_,
                        .state = state_,
                        .webhook_response = webhook_response_,
                        .pages = &pages_};
  std::vector<RetryFailure> pending_retries;
  std::optional<std::error_code> emit_error;

  auto attempt = [&]() -> task<Result<StepOutput>> {
    for (const auto &failure : pending_retries) {
      auto r = co_await emit(StepRetryEvent{
          .step_id = step_id,
          .step_title = block.title,
          .error = ErrorInfo{.name = failure.exception ? "Error" : "StepError",
                             .message = failure.message},
          .attempt = failure.attempt});
      if (!r) {
        emit_error = r.error();
        break;
      }
    }
    pending_retries.clear();
    if (emit_error) {
      co_return fail(*emit_error);
    }
    co_return co_await (*block.action)(ctx);
  };

  std::optional<Result<StepOutput>> result;
  std::exception_ptr thrown;
  ErrorInfo thrown_info;
  try {
    result.emplace(co_await execute_with_retry(
        attempt, block.retry,
        [&](const RetryFailure &failure) {
          log::warn("Run {} step '{}' attempt {} failed: {}", run_id_,
                    block.title, failure.attempt, failure.message);
          pending_retries.push_back(failure);
        }));
  } catch (const std::exception &e) {
    thrown = std::current_exception();
    thrown_info = ErrorInfo{.name = "Error", .message = e.what()};
  }

  if (emit_error) {
    co_return fail(*emit_error);
  }
  if (thrown) {
    if (auto r = co_await fail_step(index, std::move(thrown_info)); !r) {
      co_return fail(r.error());
    }
    std::rethrow_exception(thrown);
  }
  if (!*result) {
    const auto code = result->error();
    if (auto r = co_await fail_step(
            index, ErrorInfo{.name = "StepError", .message = code.message()});
        !r) {
      co_return fail(r.error());
    }
    co_return fail(code);
  }

  auto output = std::move(**result);
  if (auto r = co_await complete_step(index, std::move(output.state)); !r) {
    co_return fail(r.error());
  }
  if (output.wait) {
    if (auto r = co_await emit_wait(*output.wait); !r) {
      co_return fail(r.error());
    }
    co_return BlockOutcome::Suspended;
  }
  co_return BlockOutcome::Completed;
}

auto RunActor::run_agent(std::size_t index, const AgentBlock &block)
    -> task<Result<BlockOutcome>> {
  const auto step_id = step_id_for(index);
  const auto &cfg = block.config;

  std::vector<AgentMessage> messages;
  int iteration = 0;
  std::int64_t total_tokens = 0;

  if (webhook_response_ && pending_agent_webhook(step_id)) {
    auto resumed = reconstruct_agent_context(events_, *webhook_response_);
    if (!resumed) {
      co_return fail(resumed.error());
    }
    if (!*resumed) {
      co_return fail(Error::CorruptEventLog);
    }
    auto &context = **resumed;
    if (auto r = co_await emit(AgentToolResultEvent{
            .step_id = step_id,
            .tool_call_id = context.pending_tool_call_id,
            .tool_name = context.pending_tool_name,
            .result = context.webhook_response});
        !r) {
      co_return fail(r.error());
    }
    messages = std::move(context.messages);
    iteration = context.iterations;
    total_tokens = context.total_tokens;
    webhook_response_.reset();
  } else if (auto progress = reconstruct_agent_progress(events_, step_id)) {
    log::debug("Run {} agent '{}' continues at iteration {}", run_id_,
               block.title, progress->iterations);
    messages = std::move(progress->messages);
    iteration = progress->iterations;
    total_tokens = progress->total_tokens;
  } else {
    std::vector<std::string> tool_names;
    tool_names.reserve(cfg.tools.size());
    for (const auto &tool : cfg.tools) {
      tool_names.push_back(tool.name);
    }
    if (auto r = co_await emit(AgentStartEvent{.step_id = step_id,
                                               .step_title = block.title,
                                               .prompt = cfg.prompt,
                                               .system = cfg.system,
                                               .tools = std::move(tool_names)});
        !r) {
      co_return fail(r.error());
    }
    messages.push_back(
        AgentMessage{.role = MessageRole::User, .content = cfg.prompt});
  }

  if (!cfg.model) {
    if (auto r = co_await fail_step(
            index, ErrorInfo{.name = "AgentError",
                             .message = std::format("Agent '{}' has no model",
                                                    block.title)});
        !r) {
      co_return fail(r.error());
    }
    co_return fail(Error::InvalidArgument);
  }

  while (true) {
    auto running = co_await handle_control_signals();
    if (!running) {
      co_return fail(running.error());
    }
    if (!*running) {
      co_return BlockOutcome::Stopped;
    }

    while (!user_messages_.empty()) {
      auto content = std::move(user_messages_.front());
      user_messages_.pop_front();
      if (auto r = co_await emit(
              AgentUserMessageEvent{.step_id = step_id, .content = content});
          !r) {
        co_return fail(r.error());
      }
      messages.push_back(AgentMessage{.role = MessageRole::User,
                                      .content = std::move(content)});
    }

    if (iteration >= cfg.max_iterations) {
      log::warn("Run {} agent '{}' hit {} iterations", run_id_, block.title,
                cfg.max_iterations);
      if (auto r = co_await complete_step(index, state_); !r) {
        co_return fail(r.error());
      }
      co_return BlockOutcome::Completed;
    }
    ++iteration;

    std::optional<Result<ModelResponse>> generated;
    std::exception_ptr thrown;
    std::string thrown_message;
    try {
      generated.emplace(co_await cfg.model->generate(ModelRequest{
          .system = cfg.system, .messages = messages, .tools = cfg.tools}));
    } catch (const std::exception &e) {
      thrown = std::current_exception();
      thrown_message = e.what();
    }
    if (thrown) {
      if (auto r = co_await fail_step(
              index, ErrorInfo{.name = "Error", .message = thrown_message});
          !r) {
        co_return fail(r.error());
      }
      std::rethrow_exception(thrown);
    }
    if (!*generated) {
      const auto code = generated->error();
      if (auto r = co_await fail_step(
              index, ErrorInfo{.name = "ModelError", .message = code.message()});
          !r) {
        co_return fail(r.error());
      }
      co_return fail(code);
    }
    auto &response = **generated;

    total_tokens += response.tokens;
    if (auto r = co_await emit(AgentIterationEvent{.step_id = step_id,
                                                   .iteration = iteration,
                                                   .tokens = response.tokens,
                                                   .total_tokens =
                                                       total_tokens});
        !r) {
      co_return fail(r.error());
    }
    if (cfg.max_tokens && total_tokens > *cfg.max_tokens) {
      if (auto r = co_await emit(
              AgentTokenLimitEvent{.step_id = step_id,
                                   .total_tokens = total_tokens,
                                   .max_tokens = *cfg.max_tokens});
          !r) {
        co_return fail(r.error());
      }
      if (auto r = co_await complete_step(index, state_); !r) {
        co_return fail(r.error());
      }
      co_return BlockOutcome::Completed;
    }

    if (auto r = co_await emit(AgentAssistantMessageEvent{
            .step_id = step_id,
            .iteration = iteration,
            .content = response.content,
            .tool_calls = response.tool_calls,
            .provider_metadata = response.provider_metadata});
        !r) {
      co_return fail(r.error());
    }
    messages.push_back(
        AgentMessage{.role = MessageRole::Assistant,
                     .content = response.content,
                     .tool_calls = response.tool_calls,
                     .provider_metadata = response.provider_metadata});

    if (response.tool_calls.empty()) {
      if (auto r = co_await complete_step(index, state_); !r) {
        co_return fail(r.error());
      }
      co_return BlockOutcome::Completed;
    }

    std::vector<std::pair<const ToolCall *, const AgentTool *>> runnable;
    const ToolCall *terminal = nullptr;
    for (const auto &call : response.tool_calls) {
      auto tool = std::ranges::find(cfg.tools, call.name, &AgentTool::name);
      if (tool == cfg.tools.end()) {
        if (auto r = co_await fail_step(
                index, ErrorInfo{.name = "ToolError",
                                 .message =
                                     std::format("Unknown tool: {}", call.name)});
            !r) {
          co_return fail(r.error());
        }
        co_return fail(Error::InvalidArgument);
      }
      if (auto r = co_await emit(AgentToolCallEvent{.step_id = step_id,
                                                    .iteration = iteration,
                                                    .tool_call_id = call.id,
                                                    .tool_name = call.name,
                                                    .input = call.input});
          !r) {
        co_return fail(r.error());
      }
      if (tool->kind == ToolKind::Terminal) {
        terminal = &call;
        break;
      }
      if (!tool->execute) {
        if (auto r = co_await fail_step(
                index, ErrorInfo{.name = "ToolError",
                                 .message = std::format(
                                     "Tool {} has no implementation", call.name)});
            !r) {
          co_return fail(r.error());
        }
        co_return fail(Error::InvalidArgument);
      }
      runnable.emplace_back(&call, &*tool);
    }

    std::vector<task<ToolRun>> jobs;
    jobs.reserve(runnable.size());
    for (const auto &[call, tool] : runnable) {
      jobs.push_back(execute_tool(*call, *tool));
    }
    auto results = co_await when_all(std::move(jobs));

    // A webhook tool suspends the run after the rest of the turn's results.
    const ToolCall *webhook_call = nullptr;
    std::optional<WaitRequest> webhook_wait;
    for (std::size_t k = 0; k < results.size(); ++k) {
      const auto *call = runnable[k].first;
      auto &run = results[k];
      if (run.thrown) {
        if (auto r = co_await fail_step(
                index, ErrorInfo{.name = "Error", .message = run.message});
            !r) {
          co_return fail(r.error());
        }
        std::rethrow_exception(run.thrown);
      }
      if (!run.outcome) {
        const auto code = run.outcome.error();
        if (auto r = co_await fail_step(
                index, ErrorInfo{.name = "ToolError",
                                 .message = std::format("Tool {} failed: {}",
                                                        call->name,
                                                        code.message())});
            !r) {
          co_return fail(r.error());
        }
        co_return fail(code);
      }
      if (run.outcome->wait) {
        if (webhook_call != nullptr) {
          log::warn("Run {} tool {} also asked for a webhook, keeping {}",
                    run_id_, call->name, webhook_call->name);
        } else {
          webhook_call = call;
          webhook_wait = std::move(run.outcome->wait);
        }
        continue;
      }
      if (auto r = co_await emit(
              AgentToolResultEvent{.step_id = step_id,
                                   .tool_call_id = call->id,
                                   .tool_name = call->name,
                                   .result = run.outcome->result});
          !r) {
        co_return fail(r.error());
      }
      messages.push_back(AgentMessage{.role = MessageRole::Tool,
                                      .tool_call_id = call->id,
                                      .tool_name = call->name,
                                      .result = run.outcome->result});
    }

    if (webhook_call != nullptr && terminal != nullptr) {
      log::warn("Run {} agent '{}' ends on {}, dropping the wait of {}",
                run_id_, block.title, terminal->name, webhook_call->name);
    } else if (webhook_call != nullptr) {
      if (auto r = co_await emit(AgentWebhookEvent{
              .step_id = step_id,
              .tool_call_id = webhook_call->id,
              .tool_name = webhook_call->name,
              .input = webhook_call->input});
          !r) {
        co_return fail(r.error());
      }
      if (auto r = co_await emit_wait(*webhook_wait); !r) {
        co_return fail(r.error());
      }
      co_return BlockOutcome::Suspended;
    }

    if (terminal != nullptr) {
      if (auto r = co_await emit(AgentCompleteEvent{.step_id = step_id,
                                                    .terminal_tool =
                                                        terminal->name,
                                                    .result = terminal->input,
                                                    .iterations = iteration,
                                                    .total_tokens =
                                                        total_tokens});
          !r) {
        co_return fail(r.error());
      }
      JsonValue next = state_;
      if (next.is_object() && terminal->input.is_object()) {
        for (const auto &[key, value] : terminal->input.get_object()) {
          next.get_object().insert_or_assign(key, value);
        }
      }
      if (auto r = co_await complete_step(index, std::move(next)); !r) {
        co_return fail(r.error());
      }
      co_return BlockOutcome::Completed;
    }
  }
}

auto RunActor::execute_tool(const ToolCall &call, const AgentTool &tool)
    -> task<ToolRun> {
  auto permit = co_await tool_slots_.scoped();
  if (!permit) {
    co_return ToolRun{.outcome = fail(permit.error())};
  }
  try {
    co_return ToolRun{.outcome = co_await (*tool.execute)(
                          ToolInvocation{.run_id = run_id_,
                                         .tool_call_id = call.id,
                                         .input = call.input,
                                         .state = state_})};
  } catch (const std::exception &e) {
    log::error("Run {} tool {} threw: {}", run_id_, call.name, e.what());
    co_return ToolRun{.outcome = fail(Error::StepFailed),
                      .thrown = std::current_exception(),
                      .message = e.what()};
  }
}

auto RunActor::complete_step(std::size_t index, JsonValue new_state)
    -> task<Result<void>> {
  auto patch = create_patch(state_, new_state);
  if (auto r = co_await emit(StepCompleteEvent{
          .step_id = step_id_for(index),
          .step_title = block_title(brain_->blocks[index]),
          .patch = std::move(patch)});
      !r) {
    co_return r;
  }
  state_ = std::move(new_state);
  webhook_response_.reset();
  co_return co_await emit(step_status(index, "complete"));
}

auto RunActor::fail_step(std::size_t index, ErrorInfo error)
    -> task<Result<void>> {
  log::error("Run {} step '{}' failed: {}", run_id_,
             block_title(brain_->blocks[index]), error.message);
  if (auto r = co_await emit(
          ErrorEvent{.title = brain_->title, .error = std::move(error)});
      !r) {
    co_return r;
  }
  co_return co_await emit(step_status(index, "error"));
}

auto RunActor::emit_wait(const WaitRequest &wait) -> task<Result<void>> {
  WebhookEvent event{.wait_for = wait.wait_for};
  if (wait.timeout) {
    event.timeout_ms = wait.timeout->count();
  }
  co_return co_await emit(std::move(event));
}

auto RunActor::step_status(std::size_t current, std::string_view status) const
    -> StepStatusEvent {
  StepStatusEvent event;
  const auto &done = machine_.snapshot().completed_steps;
  for (std::size_t i = 0; i < brain_->blocks.size(); ++i) {
    auto id = step_id_for(i);
    std::string s = done.contains(id) ? "complete"
                    : i == current    ? std::string(status)
                                      : "pending";
    event.steps.push_back(StepStatusEntry{.id = std::move(id),
                                          .title = block_title(
                                              brain_->blocks[i]),
                                          .status = std::move(s)});
  }
  return event;
}

auto RunActor::pending_agent_webhook(const std::string &step_id) const
    -> bool {
  std::unordered_set<std::string> answered;
  for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
    if (const auto *result = it->as<AgentToolResultEvent>();
        result != nullptr && result->step_id == step_id) {
      answered.insert(result->tool_call_id);
    } else if (const auto *webhook = it->as<AgentWebhookEvent>();
               webhook != nullptr && webhook->step_id == step_id) {
      return !answered.contains(webhook->tool_call_id);
    } else if (const auto *start = it->as<AgentStartEvent>();
               start != nullptr && start->step_id == step_id) {
      return false;
    }
  }
  return false;
}

auto RunActor::arm_alarm(std::int64_t deadline_ms) -> void {
  if (alarm_deadline_ && *alarm_deadline_ <= deadline_ms) {
    return;
  }
  alarm_deadline_ = deadline_ms;
  const auto generation = ++alarm_generation_;
  const auto delay =
      std::max<std::int64_t>(0, deadline_ms - util::now_millis());
  alarm_timer_.expires_after(std::chrono::milliseconds(delay));
  co_spawn(
      executor_,
      [self = shared_from_this(), generation]() -> task<void> {
        co_await self->alarm_wait(generation);
      },
      detached);
}

auto RunActor::alarm_wait(std::uint64_t generation) -> task<void> {
  auto [ec] = co_await alarm_timer_.async_wait(use_nothrow);
  if (generation != alarm_generation_) {
    co_return;
  }
  alarm_deadline_.reset();
  if (ec) {
    co_return;
  }
  if (auto r = co_await on_alarm(); !r) {
    log::error("Run {} alarm failed: {}", run_id_, r.error().message());
  }
}

auto RunActor::on_alarm() -> task<Result<void>> {
  auto stored = co_await services_->monitor.get_timeout(run_id_);
  if (!stored) {
    co_return fail(stored.error());
  }
  if (!*stored) {
    co_return ok();
  }
  if (**stored > util::now_millis()) {
    arm_alarm(**stored);
    co_return ok();
  }
  if (machine_.snapshot().status != RunStatus::Waiting) {
    co_return ok();
  }
  log::info("Run {} webhook deadline passed, cancelling", run_id_);
  auto payload = make_json_object();
  payload["reason"] = std::string("timeout");
  if (auto r = co_await services_->signals.queue_signal(
          run_id_, make_signal(SignalType::Kill, std::move(payload)));
      !r) {
    co_return r;
  }
  request_tick();
  co_return ok();
}

} // namespace brainforge
