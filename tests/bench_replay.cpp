// bench_replay.cpp

#include "brainforge/brain/event_codec.hpp"
#include "brainforge/engine/state_reconstructor.hpp"
#include "brainforge/util/json_patch.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <vector>

namespace brainforge {
namespace {

auto parse_or_throw(std::string_view text) -> JsonValue {
  auto parsed = parse_json(text);
  if (!parsed) {
    throw std::runtime_error("bad benchmark fixture");
  }
  return std::move(*parsed);
}

// START followed by `steps` STEP_COMPLETE events, each adding one field.
auto make_log(std::int64_t steps) -> std::vector<Event> {
  const RunId run{"bench-run"};
  std::vector<Event> events;
  events.reserve(static_cast<std::size_t>(steps) + 1);
  events.push_back(Event{.event_id = 1,
                         .run_id = run,
                         .timestamp = 1,
                         .body = StartEvent{.title = "bench",
                                            .initial_state = parse_or_throw(
                                                R"({"items":[]})")}});
  for (std::int64_t i = 0; i < steps; ++i) {
    JsonPatch patch{
        PatchOperation{.op = PatchOpKind::Add,
                       .path = std::format("/field{}", i),
                       .value = parse_or_throw(std::format(
                           R"({{"index":{},"label":"step {}"}})", i, i))},
        PatchOperation{.op = PatchOpKind::Add,
                       .path = "/items/-",
                       .value = parse_or_throw(std::to_string(i))},
    };
    events.push_back(Event{
        .event_id = i + 2,
        .run_id = run,
        .timestamp = i + 2,
        .body = StepCompleteEvent{.step_id = step_id_for(
                                      static_cast<std::size_t>(i)),
                                  .step_title = "bench step",
                                  .patch = std::move(patch)}});
  }
  return events;
}

void BM_ReconstructCurrentState(benchmark::State &state) {
  const auto events = make_log(state.range(0));
  for (auto _ : state) {
    auto result = reconstruct_current_state(events);
    if (!result) {
      state.SkipWithError("replay failed");
      return;
    }
    benchmark::DoNotOptimize(result);
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<std::int64_t>(events.size()));
}

void BM_ReconstructStateMidway(benchmark::State &state) {
  const auto events = make_log(state.range(0));
  const auto target = static_cast<std::ptrdiff_t>(events.size() / 2);
  for (auto _ : state) {
    auto result = reconstruct_state_at_event(events, target);
    benchmark::DoNotOptimize(result);
  }
}

void BM_ApplyPatch(benchmark::State &state) {
  auto document = make_json_object();
  for (std::int64_t i = 0; i < state.range(0); ++i) {
    document[std::format("key{}", i)] = parse_or_throw(std::to_string(i));
  }
  const JsonPatch patch{
      PatchOperation{.op = PatchOpKind::Replace,
                     .path = "/key0",
                     .value = parse_or_throw(R"("changed")")},
      PatchOperation{.op = PatchOpKind::Add,
                     .path = "/extra",
                     .value = parse_or_throw(R"({"nested":[1,2,3]})")},
  };
  for (auto _ : state) {
    auto result = apply_patch(document, patch);
    benchmark::DoNotOptimize(result);
  }
}

void BM_CreatePatch(benchmark::State &state) {
  auto before = make_json_object();
  for (std::int64_t i = 0; i < state.range(0); ++i) {
    before[std::format("key{}", i)] = parse_or_throw(std::to_string(i));
  }
  auto after = before;
  after["key0"] = parse_or_throw(R"("changed")");
  after["added"] = parse_or_throw("true");
  for (auto _ : state) {
    auto patch = create_patch(before, after);
    benchmark::DoNotOptimize(patch);
  }
}

void BM_EventCodecRoundTrip(benchmark::State &state) {
  const auto events = make_log(1);
  const auto &event = events.back();
  for (auto _ : state) {
    auto text = serialize_event(event);
    auto decoded = deserialize_event(text);
    benchmark::DoNotOptimize(decoded);
  }
}

BENCHMARK(BM_ReconstructCurrentState)->RangeMultiplier(4)->Range(16, 1024);
BENCHMARK(BM_ReconstructStateMidway)->Arg(256);
BENCHMARK(BM_ApplyPatch)->Arg(16)->Arg(256);
BENCHMARK(BM_CreatePatch)->Arg(16)->Arg(256);
BENCHMARK(BM_EventCodecRoundTrip);

} // namespace
} // namespace brainforge
