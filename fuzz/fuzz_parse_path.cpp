// Fuzz target for the path grammar: parse_path() either throws
// invalid_path_syntax or returns a path that renders back to a string
// which parses to the same path.

#include <packops-cpp/path.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        const auto path = packops_cpp::parse_path(text);
        const auto rendered = packops_cpp::to_string(path);
        if (packops_cpp::parse_path(rendered) != path) std::abort();
    } catch (const packops_cpp::Exception& e) {
        if (e.kind() != packops_cpp::ErrorKind::invalid_path_syntax) std::abort();
    }
    return 0;
}
