// Fuzz target for FieldPath::from_dot_separated(). Any path that parses must
// survive a set/field round trip through an ObjectValue.

#include <docsync-cpp/docsync.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        const auto path = docsync_cpp::FieldPath::from_dot_separated(input);
        const auto object = docsync_cpp::ObjectValue::empty().set(path, docsync_cpp::FieldValue{1});
        if (object.field(path) != docsync_cpp::FieldValue{1}) std::abort();
        if (!object.remove(path).field(path).has_value()) return 0;
        std::abort();
    } catch (const docsync_cpp::Exception&) {
        // Malformed paths are rejected, not crashed on.
    }
    return 0;
}
