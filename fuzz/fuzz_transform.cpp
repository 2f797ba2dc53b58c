// Fuzz target for the text-level entry point. The input is split at the
// first NUL byte into YAML document text and a JSON operation list.
// service::transform() must never throw, and a failed run must hand back
// the parsed document unchanged.

#include <packops-cpp/packops.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\0');
    if (split == std::string_view::npos) return 0;

    const auto document = input.substr(0, split);
    const auto operations = nlohmann::json::parse(input.substr(split + 1), nullptr, false);
    if (operations.is_discarded()) return 0;

    const auto response = packops_cpp::service::transform(
        document, "yaml", operations, std::nullopt,
        nlohmann::json{{"strict_mode", false}, {"auto_create_paths", true}});

    if (!response.result.success) {
        if (!response.serialized.empty()) std::abort();
        if (response.result.errors.empty()) std::abort();
    }
    return 0;
}
