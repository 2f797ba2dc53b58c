// basic_usage: demonstrates the core packops-cpp API
//
// Builds a domain pack in memory, applies operations one at a time and as
// an atomic batch, and prints the diff and any blocking errors.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <packops-cpp/packops.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace po = packops_cpp;

static void print_errors(const std::vector<po::TransformationError>& errors) {
    for (const auto& e : errors) {
        std::printf("  [%s] %s: %s\n", std::string{po::to_string_view(e.phase)}.c_str(),
                    e.code.c_str(), e.message.c_str());
    }
}

int main() {
    auto pack = po::Node{po::Mapping{
        {"name", "Legal"},
        {"description", "Entities and relations for contract review"},
        {"version", "1.0.0"},
        {"key_terms", po::Sequence{"contract", "indemnity"}},
        {"entities", po::Sequence{
            po::Mapping{
                {"name", "Attorney"},
                {"type", "ATTORNEY"},
                {"attributes", po::Sequence{"name", "bar_number"}},
            },
        }},
    }};

    // -- Paths ----------------------------------------------------------------
    const auto path = po::parse_path("entities[0].attributes");
    if (auto attributes = po::get_value(pack, path)) {
        std::printf("%s has %zu items\n", po::to_string(path).c_str(), attributes->size());
    }

    // -- Single operations never touch their input ----------------------------
    const auto appended = po::apply_operation(
        pack, po::AddOp{po::parse_path("key_terms"), "limitation"});
    std::printf("key_terms before: %zu, after: %zu\n",
                pack.at("key_terms").size(), appended.at("key_terms").size());

    // -- Atomic batch ---------------------------------------------------------
    const auto ops = std::vector<po::Operation>{
        po::UpdateOp{po::Path{}, po::Mapping{{"version", "1.1.0"}}},
        po::AddUniqueOp{po::parse_path("key_terms"), "contract"},
        po::AddOp{po::parse_path("entities"), po::Mapping{
            {"name", "Client"},
            {"type", "CLIENT"},
            {"attributes", po::Sequence{"name"}},
        }},
        po::AssertOp{po::parse_path("entities[1].type"), po::Node{"CLIENT"}, {}},
    };

    // Appending to existing keys raises overwrite warnings; accept them.
    const auto result = po::execute_transformation(pack, ops, po::Schema::domain_pack(),
                                                   po::ExecutionOptions{.strict_mode = false});
    if (result.success) {
        std::printf("Batch applied in %.3f ms\n", result.metadata.duration_ms);
        for (const auto& change : result.diff->changed) {
            std::printf("  changed %s\n", po::to_string(change.path).c_str());
        }
        for (const auto& added : result.diff->added) {
            std::printf("  added   %s\n", po::to_string(added.path).c_str());
        }
        for (const auto& w : result.warnings) {
            std::printf("  warning %s\n", w.code.c_str());
        }
    } else {
        std::printf("Batch failed:\n");
        print_errors(result.errors);
    }

    // -- A blocked batch leaves the document unchanged ------------------------
    const auto blocked = po::execute_transformation(
        result.document, std::vector<po::Operation>{po::DeleteOp{po::parse_path("version")}});
    std::printf("Deleting version: %s\n", blocked.success ? "applied" : "blocked");
    print_errors(blocked.errors);

    // -- Serialize ------------------------------------------------------------
    std::printf("%s", po::serialize_yaml(result.document).c_str());

    std::printf("Done.\n");
    return 0;
}
