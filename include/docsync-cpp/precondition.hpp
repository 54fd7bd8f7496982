/// @file precondition.hpp
/// @brief Precondition: a guard on when a mutation may take effect.

#pragma once

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace docsync_cpp {

/// The kinds of precondition.
enum class PreconditionType : std::uint8_t {
    none,         ///< Always valid.
    exists,       ///< Valid iff the document's existence matches a flag.
    update_time,  ///< Valid iff the document exists at an exact version.
};

/// Convert a PreconditionType to its string representation.
constexpr auto to_string_view(PreconditionType type) noexcept -> std::string_view {
    switch (type) {
        case PreconditionType::none:        return "none";
        case PreconditionType::exists:      return "exists";
        case PreconditionType::update_time: return "update_time";
    }
    return "unknown";
}

/// Encodes a precondition for a mutation. Mirrors what the backend accepts,
/// plus an explicit "none" meaning no precondition.
///
/// A precondition specifies either an exists flag or an update time, never
/// both; the factories are the only way to build one.
class Precondition {
public:
    /// No precondition.
    Precondition() = default;

    /// No precondition.
    static auto none() -> Precondition { return Precondition{}; }

    /// Require the document to exist (true) or not exist (false).
    static auto exists(bool exists) -> Precondition {
        return Precondition{std::nullopt, exists};
    }

    /// Require the document to exist at exactly `version`.
    static auto update_time(SnapshotVersion version) -> Precondition {
        return Precondition{version, std::nullopt};
    }

    auto type() const -> PreconditionType;
    auto is_none() const -> bool { return type() == PreconditionType::none; }

    /// The required update time, if this is an update-time precondition.
    auto update_time() const -> const std::optional<SnapshotVersion>& { return update_time_; }
    /// The required existence, if this is an exists precondition.
    auto exists() const -> const std::optional<bool>& { return exists_; }

    /// Whether the precondition holds for `maybe_doc` (empty if the client
    /// knows nothing about the document).
    auto is_valid_for(const std::optional<MaybeDocument>& maybe_doc) const -> bool;

    auto operator==(const Precondition&) const -> bool = default;

private:
    Precondition(std::optional<SnapshotVersion> update_time, std::optional<bool> exists)
        : update_time_{update_time}, exists_{exists} {}

    std::optional<SnapshotVersion> update_time_;
    std::optional<bool> exists_;
};

}  // namespace docsync_cpp
