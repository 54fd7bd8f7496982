// docsync-cpp benchmarks: throughput of local and remote mutation application.

#include <docsync-cpp/docsync.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace docsync_cpp;

static auto make_key() -> DocumentKey { return DocumentKey::from_path_string("rooms/bench"); }

static auto make_data(int fields) -> ObjectValue {
    auto map = ObjectValue::Map{};
    for (int i = 0; i < fields; ++i) {
        map.emplace("f" + std::to_string(i), FieldValue{std::int64_t{i}});
    }
    return ObjectValue{std::move(map)};
}

static auto make_doc(int fields) -> std::optional<MaybeDocument> {
    return Document{make_key(), SnapshotVersion{Timestamp{3, 0}}, make_data(fields)};
}

static const auto write_time = Timestamp{1'700'000'000, 0};

// =============================================================================
// Set
// =============================================================================

static void bm_set_local(benchmark::State& state) {
    const auto doc = make_doc(static_cast<int>(state.range(0)));
    const auto m = SetMutation{make_key(), make_data(static_cast<int>(state.range(0)))};
    for (auto _ : state) {
        auto result = m.apply_to_local_view(doc, doc, write_time);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_set_local)->Range(8, 512);

static void bm_set_remote(benchmark::State& state) {
    const auto doc = make_doc(static_cast<int>(state.range(0)));
    const auto m = SetMutation{make_key(), make_data(static_cast<int>(state.range(0)))};
    const auto ack = MutationResult{SnapshotVersion{Timestamp{4, 0}}};
    for (auto _ : state) {
        auto result = m.apply_to_remote_document(doc, ack);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_set_remote)->Range(8, 512);

// =============================================================================
// Patch
// =============================================================================

static void bm_patch_local(benchmark::State& state) {
    const auto doc = make_doc(512);
    const auto n = static_cast<int>(state.range(0));
    auto paths = std::vector<FieldPath>{};
    auto data = ObjectValue::Map{};
    for (int i = 0; i < n; ++i) {
        auto name = "f" + std::to_string(i * 2);
        paths.push_back(FieldPath{name});
        data.emplace(name, FieldValue{"patched"});
    }
    const auto m = PatchMutation{make_key(), ObjectValue{std::move(data)},
                                 FieldMask{std::move(paths)}, Precondition::exists(true)};
    for (auto _ : state) {
        auto result = m.apply_to_local_view(doc, doc, write_time);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_patch_local)->Range(1, 128);

static void bm_patch_nested(benchmark::State& state) {
    const auto depth = static_cast<int>(state.range(0));
    auto segments = std::vector<std::string>{};
    for (int i = 0; i < depth; ++i) segments.push_back("level" + std::to_string(i));
    const auto path = FieldPath{std::move(segments)};
    const auto m = PatchMutation{make_key(), ObjectValue{}.set(path, FieldValue{1}),
                                 FieldMask{path}};
    const auto doc = make_doc(64);
    for (auto _ : state) {
        auto result = m.apply_to_local_view(doc, doc, write_time);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_patch_nested)->Arg(1)->Arg(4)->Arg(16);

// =============================================================================
// Transform
// =============================================================================

static void bm_transform_local(benchmark::State& state) {
    const auto doc = make_doc(64);
    const auto m = TransformMutation{make_key(), {
        FieldTransform{FieldPath{"f1"}, TransformOperation::server_timestamp()},
        FieldTransform{FieldPath{"updated"}, TransformOperation::server_timestamp()},
    }};
    for (auto _ : state) {
        auto result = m.apply_to_local_view(doc, doc, write_time);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_transform_local);

static void bm_transform_remote(benchmark::State& state) {
    const auto doc = make_doc(64);
    const auto m = TransformMutation{make_key(), {
        FieldTransform{FieldPath{"f1"}, TransformOperation::server_timestamp()},
        FieldTransform{FieldPath{"updated"}, TransformOperation::server_timestamp()},
    }};
    const auto committed = FieldValue{Timestamp{1'700'000'001, 0}};
    const auto ack = MutationResult{SnapshotVersion{Timestamp{4, 0}},
                                    std::vector<FieldValue>{committed, committed}};
    for (auto _ : state) {
        auto result = m.apply_to_remote_document(doc, ack);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_transform_remote);

// =============================================================================
// Delete / batches
// =============================================================================

static void bm_delete_local(benchmark::State& state) {
    const auto doc = make_doc(64);
    const auto m = DeleteMutation{make_key()};
    for (auto _ : state) {
        auto result = m.apply_to_local_view(doc, doc, write_time);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_delete_local);

static void bm_batch_local(benchmark::State& state) {
    const auto batch = std::vector<Mutation>{
        SetMutation{make_key(), make_data(32)},
        PatchMutation{make_key(), make_object({{"f3", "x"}}), FieldMask{FieldPath{"f3"}},
                      Precondition::exists(true)},
        TransformMutation{make_key(), {
            FieldTransform{FieldPath{"updated"}, TransformOperation::server_timestamp()},
        }},
    };
    const auto base = make_doc(32);
    for (auto _ : state) {
        auto doc = base;
        for (const auto& m : batch) {
            doc = apply_to_local_view(m, doc, base, write_time);
        }
        benchmark::DoNotOptimize(doc);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * batch.size()));
}
BENCHMARK(bm_batch_local);
