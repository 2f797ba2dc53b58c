// parallel_transform_demo: independent transformations in parallel
//
// Every transformation works on its own copy of its input, so unrelated
// requests can run side by side. execute_all() hands them to the shared
// Taskflow executor and returns results in request order.
//
// Build: cmake -S . -B build -DCMAKE_BUILD_TYPE=Release && cmake --build build
// Run:   ./build/examples/parallel_transform_demo

#include <packops-cpp/packops.hpp>

#include <chrono>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

namespace po = packops_cpp;

struct Timer {
    std::chrono::steady_clock::time_point start =
        std::chrono::steady_clock::now();
    auto ms() const -> double {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
    }
};

static auto make_pack(int id, int entities) -> po::Node {
    auto list = po::Sequence{};
    for (int i = 0; i < entities; ++i) {
        list.emplace_back(po::Mapping{
            {"name", "Entity" + std::to_string(i)},
            {"type", "ENTITY_" + std::to_string(i)},
            {"attributes", po::Sequence{"name"}},
        });
    }
    return po::Node{po::Mapping{
        {"name", "Pack" + std::to_string(id)},
        {"description", "Generated pack"},
        {"version", "1.0.0"},
        {"entities", std::move(list)},
    }};
}

int main() {
    constexpr int pack_count = 64;
    constexpr int entities_per_pack = 500;

    std::printf("Hardware threads: %u\n", std::thread::hardware_concurrency());

    auto requests = std::vector<po::TransformationRequest>{};
    for (int i = 0; i < pack_count; ++i) {
        auto request = po::TransformationRequest{};
        request.document = make_pack(i, entities_per_pack);
        request.operations = {
            po::UpdateOp{po::Path{}, po::Mapping{{"version", "1.1.0"}}},
            po::UpdateOp{po::parse_path("entities[0]"), po::Mapping{{"type", "PRIMARY"}}},
            po::AssertOp{po::parse_path("entities[499].name"), po::Node{"Entity499"}, {}},
        };
        requests.push_back(std::move(request));
    }
    // One request that must fail does not affect the others.
    requests[7].operations = {po::DeleteOp{po::parse_path("name")}};

    // -- Sequential baseline --------------------------------------------------
    auto sequential_ok = 0;
    {
        auto t = Timer{};
        for (const auto& r : requests) {
            const auto result = po::execute_transformation(r.document, r.operations);
            if (result.success) ++sequential_ok;
        }
        std::printf("Sequential: %d/%d succeeded in %.1f ms\n",
                    sequential_ok, pack_count, t.ms());
    }

    // -- Parallel -------------------------------------------------------------
    {
        auto t = Timer{};
        const auto results = po::execute_all(requests);
        const auto elapsed = t.ms();

        auto parallel_ok = 0;
        for (const auto& result : results) {
            if (result.success) ++parallel_ok;
        }
        std::printf("Parallel:   %d/%d succeeded in %.1f ms\n", parallel_ok, pack_count, elapsed);
        std::printf("Request 7:  %s\n", results[7].errors.front().code.c_str());
        std::printf("Same outcome: %s\n", parallel_ok == sequential_ok ? "yes" : "no");
    }

    return 0;
}
