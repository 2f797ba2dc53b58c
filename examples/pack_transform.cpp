// pack_transform: apply a JSON operation list to a domain pack file
//
// Usage:
//   pack_transform <pack.yaml|pack.json> <operations.json> [options]
//   pack_transform --validate <pack.yaml|pack.json> [--schema schema.json]
//   pack_transform --schema-dump
//
// Options:
//   --schema <file>   JSON schema to validate against (default: domain pack)
//   --options <file>  JSON execution options
//   --preview         dry run; print the preview instead of the result
//   --write <file>    write the transformed document on success
//
// The response is printed as JSON. Exit status is 0 on success, 1 when the
// transformation or validation fails and 2 on usage or I/O errors.

#include <packops-cpp/packops.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace po = packops_cpp;
using json = nlohmann::json;

static auto read_file(const std::string& path) -> std::optional<std::string> {
    auto ifs = std::ifstream{path, std::ios::binary};
    if (!ifs) return std::nullopt;
    auto ss = std::ostringstream{};
    ss << ifs.rdbuf();
    return ss.str();
}

static auto read_json_file(const std::string& path) -> std::optional<json> {
    const auto text = read_file(path);
    if (!text) return std::nullopt;
    auto j = json::parse(*text, nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    return j;
}

static auto usage() -> int {
    std::fprintf(stderr,
                 "usage: pack_transform <pack> <operations.json> [--schema f] [--options f]"
                 " [--preview] [--write f]\n"
                 "       pack_transform --validate <pack> [--schema f]\n"
                 "       pack_transform --schema-dump\n");
    return 2;
}

struct Arguments {
    std::vector<std::string> positional;
    std::optional<std::string> schema_file;
    std::optional<std::string> options_file;
    std::optional<std::string> output_file;
    bool preview{false};
    bool validate{false};
    bool schema_dump{false};
};

static auto parse_arguments(int argc, char** argv) -> std::optional<Arguments> {
    auto args = Arguments{};
    for (int i = 1; i < argc; ++i) {
        const auto arg = std::string_view{argv[i]};
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string{argv[++i]};
        };
        if (arg == "--preview") {
            args.preview = true;
        } else if (arg == "--validate") {
            args.validate = true;
        } else if (arg == "--schema-dump") {
            args.schema_dump = true;
        } else if (arg == "--schema") {
            if (!(args.schema_file = next())) return std::nullopt;
        } else if (arg == "--options") {
            if (!(args.options_file = next())) return std::nullopt;
        } else if (arg == "--write") {
            if (!(args.output_file = next())) return std::nullopt;
        } else if (arg.starts_with("--")) {
            return std::nullopt;
        } else {
            args.positional.emplace_back(arg);
        }
    }
    return args;
}

int main(int argc, char** argv) {
    const auto args = parse_arguments(argc, argv);
    if (!args) return usage();

    if (args->schema_dump) {
        std::printf("%s\n", json(po::service::get_schema()).dump(2).c_str());
        return 0;
    }

    const auto expected = args->validate ? std::size_t{1} : std::size_t{2};
    if (args->positional.size() != expected) return usage();

    const auto& pack_file = args->positional[0];
    const auto format = po::detect_format(pack_file);
    if (!format) {
        std::fprintf(stderr, "cannot tell the format of %s (use .yaml, .yml or .json)\n",
                     pack_file.c_str());
        return 2;
    }
    const auto text = read_file(pack_file);
    if (!text) {
        std::fprintf(stderr, "cannot read %s\n", pack_file.c_str());
        return 2;
    }

    auto schema = std::optional<json>{};
    if (args->schema_file) {
        if (!(schema = read_json_file(*args->schema_file))) {
            std::fprintf(stderr, "cannot read JSON from %s\n", args->schema_file->c_str());
            return 2;
        }
    }

    const auto format_name = std::string{po::to_string_view(*format)};

    // -- Validation only ------------------------------------------------------
    if (args->validate) {
        const auto result = po::service::validate(*text, format_name, schema);
        std::printf("%s\n", json(result).dump(2).c_str());
        return result.valid ? 0 : 1;
    }

    const auto operations = read_json_file(args->positional[1]);
    if (!operations) {
        std::fprintf(stderr, "cannot read JSON from %s\n", args->positional[1].c_str());
        return 2;
    }
    auto options = std::optional<json>{};
    if (args->options_file) {
        if (!(options = read_json_file(*args->options_file))) {
            std::fprintf(stderr, "cannot read JSON from %s\n", args->options_file->c_str());
            return 2;
        }
    }

    // -- Dry run --------------------------------------------------------------
    if (args->preview) {
        const auto result = po::service::preview(*text, format_name, *operations, schema, options);
        std::printf("%s\n", json(result).dump(2).c_str());
        return result.would_succeed ? 0 : 1;
    }

    // -- Transform ------------------------------------------------------------
    const auto response = po::service::transform(*text, format_name, *operations, schema, options);
    auto report = json(response);
    report.erase("serialized");
    std::printf("%s\n", report.dump(2).c_str());
    if (!response.result.success) return 1;

    if (args->output_file) {
        auto ofs = std::ofstream{*args->output_file, std::ios::binary};
        ofs << response.serialized;
        if (!ofs) {
            std::fprintf(stderr, "cannot write %s\n", args->output_file->c_str());
            return 2;
        }
    }
    return 0;
}
