// packops-cpp benchmarks: throughput of the transformation pipeline.

#include <packops-cpp/packops.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace packops_cpp;

// A domain pack with `n` entities and `n` key terms.
static auto make_pack(std::size_t n) -> Node {
    auto entities = Sequence{};
    auto terms = Sequence{};
    for (std::size_t i = 0; i < n; ++i) {
        const auto suffix = std::to_string(i);
        entities.emplace_back(Mapping{
            {"name", "Entity" + suffix},
            {"type", "ENTITY_" + suffix},
            {"attributes", Sequence{"name", "id"}},
        });
        terms.emplace_back("term" + suffix);
    }
    return Node{Mapping{
        {"name", "Legal"},
        {"description", "Legal domain"},
        {"version", "1.0.0"},
        {"key_terms", std::move(terms)},
        {"entities", std::move(entities)},
    }};
}

// =============================================================================
// Paths
// =============================================================================

static void bm_parse_path(benchmark::State& state) {
    for (auto _ : state) {
        auto path = parse_path("entities[12].attributes[3]");
        benchmark::DoNotOptimize(path);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_path);

static void bm_resolve(benchmark::State& state) {
    const auto doc = make_pack(static_cast<std::size_t>(state.range(0)));
    const auto path = parse_path("entities[5].attributes[1]");
    for (auto _ : state) {
        auto value = get_value(doc, path);
        benchmark::DoNotOptimize(value);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_resolve)->Range(10, 1000);

// =============================================================================
// Operations
// =============================================================================

static void bm_apply_append(benchmark::State& state) {
    const auto doc = make_pack(static_cast<std::size_t>(state.range(0)));
    const auto op = Operation{AddOp{parse_path("key_terms"), "new_term"}};
    for (auto _ : state) {
        auto result = apply_operation(doc, op);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_append)->Range(10, 1000);

static void bm_apply_batch(benchmark::State& state) {
    const auto doc = make_pack(100);
    const auto n = static_cast<std::size_t>(state.range(0));
    auto ops = std::vector<Operation>{};
    for (std::size_t i = 0; i < n; ++i) {
        ops.push_back(UpdateOp{parse_path("entities[" + std::to_string(i % 100) + "]"),
                               Mapping{{"type", "UPDATED"}}});
    }
    for (auto _ : state) {
        auto result = apply_batch(doc, ops);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_apply_batch)->Range(1, 64);

// =============================================================================
// Validation and diff
// =============================================================================

static void bm_validate_domain_pack(benchmark::State& state) {
    const auto doc = make_pack(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto ok = Schema::domain_pack().is_valid(doc);
        benchmark::DoNotOptimize(ok);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_validate_domain_pack)->Range(10, 1000);

static void bm_diff_one_change(benchmark::State& state) {
    const auto before = make_pack(static_cast<std::size_t>(state.range(0)));
    auto after = before.clone();
    after.mapping_mut().set("version", "1.0.1");
    for (auto _ : state) {
        auto diff = compute_diff(before, after);
        benchmark::DoNotOptimize(diff);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_diff_one_change)->Range(10, 1000);

// =============================================================================
// Full pipeline
// =============================================================================

static void bm_execute_transformation(benchmark::State& state) {
    const auto doc = make_pack(static_cast<std::size_t>(state.range(0)));
    const auto ops = std::vector<Operation>{
        UpdateOp{Path{}, Mapping{{"version", "1.1.0"}}},
        AddUniqueOp{parse_path("key_terms"), "statute"},
        AssertOp{parse_path("entities[0].name"), Node{"Entity0"}, {}},
    };
    for (auto _ : state) {
        auto result = execute_transformation(doc, ops);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_execute_transformation)->Range(10, 1000);

static void bm_execute_all(benchmark::State& state) {
    auto requests = std::vector<TransformationRequest>(static_cast<std::size_t>(state.range(0)));
    for (auto& request : requests) {
        request.document = make_pack(100);
        request.operations = {UpdateOp{Path{}, Mapping{{"version", "1.1.0"}}}};
    }
    for (auto _ : state) {
        auto results = execute_all(requests);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_execute_all)->Range(1, 64);

static void bm_service_transform_yaml(benchmark::State& state) {
    const auto text = serialize_yaml(make_pack(static_cast<std::size_t>(state.range(0))));
    const auto ops = nlohmann::json::parse(
        R"([{"action": "update", "path": [], "updates": {"version": "2.0.0"}}])");
    for (auto _ : state) {
        auto response = service::transform(text, "yaml", ops);
        benchmark::DoNotOptimize(response);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_service_transform_yaml)->Range(10, 1000);
