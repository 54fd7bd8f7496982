/// @file mutation_result.hpp
/// @brief MutationResult: the backend's acknowledgment of a write.

#pragma once

#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>

#include <optional>
#include <utility>
#include <vector>

namespace docsync_cpp {

/// The result of successfully applying a mutation to the backend.
struct MutationResult {
    /// The version at which the mutation was committed, or nullopt for a
    /// delete.
    std::optional<SnapshotVersion> version;

    /// The values the backend computed for a TransformMutation, one per
    /// FieldTransform in order. nullopt for every other mutation kind.
    std::optional<std::vector<FieldValue>> transform_results;

    MutationResult() = default;
    MutationResult(std::optional<SnapshotVersion> v,
                   std::optional<std::vector<FieldValue>> results = std::nullopt)
        : version{v}, transform_results{std::move(results)} {}

    auto operator==(const MutationResult&) const -> bool = default;
};

}  // namespace docsync_cpp
