// Fuzz target for JSON mutation decoding. Anything that decodes is applied
// to an empty cache on both paths and re-encoded.

#include <docsync-cpp/docsync.hpp>
#include <docsync-cpp/json.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    using namespace docsync_cpp;

    auto parsed = nlohmann::json::parse(data, data + size, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) return 0;

    try {
        const auto mutation = json::decode_mutation(parsed);
        const auto unknown = std::optional<MaybeDocument>{};
        auto local = apply_to_local_view(mutation, unknown, unknown, Timestamp{});
        (void)local;

        // Transform acknowledgments need one result per field transform.
        auto result = MutationResult{SnapshotVersion{Timestamp{1, 0}}};
        if (const auto* t = std::get_if<TransformMutation>(&mutation)) {
            result.transform_results =
                std::vector<FieldValue>(t->field_transforms().size(), FieldValue{Timestamp{1, 0}});
        }
        auto remote = apply_to_remote_document(mutation, unknown, result);
        (void)remote;

        auto encoded = nlohmann::json(mutation).dump();
        (void)encoded;
    } catch (const Exception&) {
        // Rejected input.
    }
    return 0;
}
