/// @file types.hpp
/// @brief Core identity types: Timestamp, SnapshotVersion, FieldPath,
/// ResourcePath, DocumentKey.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace docsync_cpp {

/// A point in time with nanosecond precision.
///
/// Used as the local write time of a batch and as the payload of a
/// SnapshotVersion. Ordered by (seconds, nanoseconds).
struct Timestamp {
    std::int64_t seconds{0};      ///< Seconds since Unix epoch.
    std::int32_t nanoseconds{0};  ///< Fraction of a second, [0, 999'999'999].

    constexpr Timestamp() = default;

    /// Construct from seconds and nanoseconds.
    /// @throws Exception if nanoseconds is out of range.
    Timestamp(std::int64_t s, std::int32_t ns);

    /// The current wall-clock time.
    static auto now() -> Timestamp;

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;
};

/// A version of a document as assigned by the backend.
///
/// Two sentinels exist that do not correspond to any server version:
/// min() for documents that never existed or whose delete was acknowledged,
/// and for_deleted_doc() for client-side deletes awaiting acknowledgment.
/// They compare unequal.
class SnapshotVersion {
public:
    constexpr SnapshotVersion() = default;
    explicit constexpr SnapshotVersion(Timestamp ts) : timestamp_{ts} {}

    /// The smallest version.
    static auto min() -> SnapshotVersion { return SnapshotVersion{}; }

    /// The version of a local tombstone. Sorts after min() and before any
    /// server-assigned version.
    static auto for_deleted_doc() -> SnapshotVersion;

    auto timestamp() const -> const Timestamp& { return timestamp_; }

    auto operator<=>(const SnapshotVersion&) const = default;
    auto operator==(const SnapshotVersion&) const -> bool = default;

private:
    Timestamp timestamp_{};
};

/// A path to a field within a document, e.g. `address.city`.
///
/// Segments are kept verbatim; a segment may itself contain dots when
/// constructed from segments rather than parsed.
class FieldPath {
public:
    FieldPath() = default;
    explicit FieldPath(std::vector<std::string> segments)
        : segments_{std::move(segments)} {}
    FieldPath(std::initializer_list<std::string> segments)
        : segments_{segments} {}

    /// Parse a dot-separated path ("a.b.c").
    /// @throws Exception on an empty path or an empty segment.
    static auto from_dot_separated(std::string_view path) -> FieldPath;

    auto size() const -> std::size_t { return segments_.size(); }
    auto empty() const -> bool { return segments_.empty(); }

    auto first_segment() const -> const std::string&;
    auto last_segment() const -> const std::string&;

    /// A path with the first segment removed.
    auto pop_first() const -> FieldPath;
    /// A path with the last segment removed.
    auto pop_last() const -> FieldPath;
    /// A path with the given segment appended.
    auto append(std::string segment) const -> FieldPath;

    /// True if every segment of this path starts `other`.
    auto is_prefix_of(const FieldPath& other) const -> bool;

    /// Dot-joined form; segments that are not simple identifiers are
    /// back-quoted.
    auto canonical_string() const -> std::string;

    auto segments() const -> const std::vector<std::string>& { return segments_; }
    auto begin() const { return segments_.begin(); }
    auto end() const { return segments_.end(); }

    auto operator<=>(const FieldPath&) const = default;
    auto operator==(const FieldPath&) const -> bool = default;

private:
    std::vector<std::string> segments_;
};

/// A slash-separated path to a collection or document.
class ResourcePath {
public:
    ResourcePath() = default;
    explicit ResourcePath(std::vector<std::string> segments)
        : segments_{std::move(segments)} {}

    /// Parse "rooms/abc/messages/1". Empty segments are skipped.
    static auto from_string(std::string_view path) -> ResourcePath;

    auto size() const -> std::size_t { return segments_.size(); }
    auto empty() const -> bool { return segments_.empty(); }
    auto segments() const -> const std::vector<std::string>& { return segments_; }

    /// Slash-joined form.
    auto canonical_string() const -> std::string;

    auto operator<=>(const ResourcePath&) const = default;
    auto operator==(const ResourcePath&) const -> bool = default;

private:
    std::vector<std::string> segments_;
};

/// Identifies a document: a resource path with an even number of segments.
class DocumentKey {
public:
    /// Construct from a validated path.
    /// @throws Exception if the path does not name a document.
    explicit DocumentKey(ResourcePath path);

    /// Parse and validate "collection/document".
    static auto from_path_string(std::string_view path) -> DocumentKey;

    /// True if the path has an even, non-zero number of segments.
    static auto is_document_key(const ResourcePath& path) -> bool;

    auto path() const -> const ResourcePath& { return path_; }
    auto to_string() const -> std::string { return path_.canonical_string(); }

    auto operator<=>(const DocumentKey&) const = default;
    auto operator==(const DocumentKey&) const -> bool = default;

private:
    ResourcePath path_;
};

}  // namespace docsync_cpp

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<docsync_cpp::FieldPath> {
    auto operator()(const docsync_cpp::FieldPath& path) const noexcept -> std::size_t {
        auto h = std::size_t{0};
        for (const auto& segment : path) {
            h = h * 31 + std::hash<std::string>{}(segment);
        }
        return h;
    }
};

template <>
struct std::hash<docsync_cpp::DocumentKey> {
    auto operator()(const docsync_cpp::DocumentKey& key) const noexcept -> std::size_t {
        auto h = std::size_t{0};
        for (const auto& segment : key.path().segments()) {
            h = h * 31 + std::hash<std::string>{}(segment);
        }
        return h;
    }
};

/// @endcond
