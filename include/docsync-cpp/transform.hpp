/// @file transform.hpp
/// @brief Field transforms applied atomically with a write.

#pragma once

#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace docsync_cpp {

/// The kinds of transform a TransformMutation can carry.
enum class TransformType : std::uint8_t {
    server_timestamp,  ///< Replace the field with the commit time.
};

/// Convert a TransformType to its string representation.
constexpr auto to_string_view(TransformType type) noexcept -> std::string_view {
    switch (type) {
        case TransformType::server_timestamp: return "server_timestamp";
    }
    return "unknown";
}

/// A transform to perform on a single field.
///
/// Transforms are stateless apart from their kind, so two operations of the
/// same kind are equal.
class TransformOperation {
public:
    explicit constexpr TransformOperation(TransformType type) : type_{type} {}

    /// Transforms a value into a server-generated timestamp.
    static constexpr auto server_timestamp() -> TransformOperation {
        return TransformOperation{TransformType::server_timestamp};
    }

    constexpr auto type() const -> TransformType { return type_; }

    auto operator==(const TransformOperation&) const -> bool = default;

private:
    TransformType type_;
};

/// A field path and the TransformOperation to perform upon it.
struct FieldTransform {
    FieldPath field;               ///< The field to transform.
    TransformOperation transform;  ///< What to do to it.

    FieldTransform(FieldPath f, TransformOperation t)
        : field{std::move(f)}, transform{t} {}

    auto operator==(const FieldTransform&) const -> bool = default;
};

// -- Per-kind result synthesis ------------------------------------------------
//
// Each transform kind contributes one case to each of these functions.
// A kind not handled here is a programming error and aborts.

/// The value a transform produces in the local view before the backend has
/// run it.
/// @param op The transform.
/// @param previous_value The field's value before the batch, if any.
/// @param local_write_time The local write time of the batch.
auto local_transform_result(const TransformOperation& op,
                            const std::optional<FieldValue>& previous_value,
                            const Timestamp& local_write_time) -> FieldValue;

/// The value a transform leaves in the remote document once the backend
/// has acknowledged it with `transform_result`.
/// @param op The transform.
/// @param previous_value The field's current value in the document, if any.
/// @param transform_result The value computed by the backend.
auto remote_transform_result(const TransformOperation& op,
                             const std::optional<FieldValue>& previous_value,
                             FieldValue transform_result) -> FieldValue;

}  // namespace docsync_cpp
