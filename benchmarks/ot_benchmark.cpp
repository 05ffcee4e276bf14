// ot-cpp benchmarks — measures throughput of transform, commit and checkpoint.

#include <ot-cpp/ot.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace ot_cpp;

static auto editors() -> std::shared_ptr<PermissionTable> {
    return std::make_shared<PermissionTable>(Role::editor);
}

// =============================================================================
// Transform
// =============================================================================

static void bm_transform_insert_insert(benchmark::State& state) {
    const auto a = make_insert({"a", 1}, 10, "hello");
    const auto b = make_insert({"b", 1}, 5, "world");
    for (auto _ : state) {
        benchmark::DoNotOptimize(transform(a, b));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_transform_insert_insert);

static void bm_transform_delete_delete(benchmark::State& state) {
    const auto a = make_delete({"a", 1}, 10, 20);
    const auto b = make_delete({"b", 1}, 15, 30);
    for (auto _ : state) {
        benchmark::DoNotOptimize(transform(a, b));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_transform_delete_delete);

// An operation based far behind the head, transformed against the whole gap.
static void bm_transform_against_history(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto history = std::vector<Operation>{};
    history.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        history.push_back(make_insert({"b", i + 1}, i % 7, "x"));
    }
    const auto op = make_insert({"a", 1}, 3, "late");
    for (auto _ : state) {
        auto current = op;
        for (const auto& entry : history) {
            current = transform(current, entry);
        }
        benchmark::DoNotOptimize(current);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(n));
}
BENCHMARK(bm_transform_against_history)->Range(8, 4096);

// =============================================================================
// Commit
// =============================================================================

static void bm_submit_at_head(benchmark::State& state) {
    auto controller = SyncController{"bench", editors()};
    std::uint64_t counter = 0;
    for (auto _ : state) {
        auto base = controller.revision();
        benchmark::DoNotOptimize(controller.submit(
            {"w", make_insert({"w", ++counter}, 0, "x", base)}));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_submit_at_head);

static void bm_submit_behind(benchmark::State& state) {
    const auto lag = state.range(0);
    auto controller = SyncController{"bench", editors()};
    std::uint64_t counter = 0;
    for (Revision r = 0; r < lag; ++r) {
        controller.submit({"w", make_insert({"w", ++counter}, 0, "x", r)});
    }
    for (auto _ : state) {
        auto base = controller.revision() - lag;
        benchmark::DoNotOptimize(controller.submit(
            {"w", make_insert({"w", ++counter}, 0, "x", base)}));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_submit_behind)->Arg(1)->Arg(16)->Arg(256);

static void bm_session_round_trip(benchmark::State& state) {
    auto service = CollaborationService{ServiceOptions{.default_role = Role::editor}};
    auto doc = service.create_document("bench", "host");
    auto alice = service.join(doc, "alice", "Alice");
    service.join(doc, "bob", "Bob");
    for (auto _ : state) {
        benchmark::DoNotOptimize(alice->insert(0, "x"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_session_round_trip);

// =============================================================================
// Checkpoint
// =============================================================================

static auto document_with(std::size_t n) -> DocumentState {
    auto doc = DocumentState{};
    for (std::size_t i = 0; i < n; ++i) {
        doc.apply(make_insert({"w", i + 1}, doc.size(), "some text ",
                              static_cast<Revision>(i)));
    }
    return doc;
}

static void bm_save_checkpoint(benchmark::State& state) {
    const auto doc = document_with(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(save_checkpoint(doc));
    }
}
BENCHMARK(bm_save_checkpoint)->Arg(100)->Arg(10000);

static void bm_load_checkpoint(benchmark::State& state) {
    const auto bytes = save_checkpoint(document_with(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        benchmark::DoNotOptimize(load_checkpoint(bytes));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(bytes.size()));
}
BENCHMARK(bm_load_checkpoint)->Arg(100)->Arg(10000);
