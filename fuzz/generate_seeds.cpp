// Helper to generate seed corpus files for fuzz_transform.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <packops-cpp/packops.hpp>

#include <filesystem>
#include <fstream>
#include <string>

static void write_seed(const std::string& path, const std::string& document,
                       const std::string& operations) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs << document;
    ofs.put('\0');
    ofs << operations;
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    const auto minimal = packops_cpp::serialize_yaml(packops_cpp::Node{packops_cpp::Mapping{
        {"name", "T"},
        {"description", "T"},
        {"version", "1.0.0"},
    }});

    // Seed 1: no operations
    write_seed(dir + "/seed_empty.bin", minimal, "[]");

    // Seed 2: root update
    write_seed(dir + "/seed_update.bin", minimal,
               R"([{"action": "update", "path": [], "updates": {"version": "2.0.0"}}])");

    // Seed 3: add then append
    write_seed(dir + "/seed_add.bin", minimal,
               R"([{"action": "add", "path": ["key_terms"], "value": ["contract"]},)"
               R"( {"action": "add", "path": "key_terms", "value": "tort"}])");

    // Seed 4: nested merge and assert
    write_seed(dir + "/seed_merge.bin",
               "name: T\ndescription: T\nversion: 1.0.0\nbusiness_context:\n  litigation: [motion]\n",
               R"([{"action": "merge", "path": ["business_context"],)"
               R"(  "value": {"litigation": ["appeal"], "tax": ["audit"]}},)"
               R"( {"action": "assert", "path": "business_context.tax[0]", "equals": "audit"}])");

    // Seed 5: failing delete
    write_seed(dir + "/seed_delete.bin", minimal,
               R"([{"action": "delete", "path": ["name"]}])");

    return 0;
}
