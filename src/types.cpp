#include <docsync-cpp/types.hpp>

#include <docsync-cpp/error.hpp>

#include <absl/log/absl_check.h>

#include <algorithm>
#include <chrono>
#include <cctype>
#include <ranges>
#include <string>

namespace docsync_cpp {

// -- Timestamp ----------------------------------------------------------------

Timestamp::Timestamp(std::int64_t s, std::int32_t ns)
    : seconds{s}, nanoseconds{ns} {
    if (ns < 0 || ns > 999'999'999) {
        throw Exception{ErrorKind::invalid_timestamp,
                        "timestamp nanoseconds out of range: " + std::to_string(ns)};
    }
}

auto Timestamp::now() -> Timestamp {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
    return Timestamp{secs.count(), static_cast<std::int32_t>(nanos.count())};
}

// -- SnapshotVersion ----------------------------------------------------------

auto SnapshotVersion::for_deleted_doc() -> SnapshotVersion {
    return SnapshotVersion{Timestamp{0, 1}};
}

// -- FieldPath ----------------------------------------------------------------

namespace {

auto is_simple_identifier(std::string_view segment) -> bool {
    if (segment.empty()) return false;
    const auto first = static_cast<unsigned char>(segment.front());
    if (!std::isalpha(first) && first != '_') return false;
    return std::ranges::all_of(segment, [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || uc == '_';
    });
}

auto quote_segment(std::string_view segment) -> std::string {
    auto result = std::string{"`"};
    for (char c : segment) {
        if (c == '`' || c == '\\') result.push_back('\\');
        result.push_back(c);
    }
    result.push_back('`');
    return result;
}

}  // anonymous namespace

auto FieldPath::from_dot_separated(std::string_view path) -> FieldPath {
    if (path.empty()) {
        throw Exception{ErrorKind::invalid_field_path, "field path must not be empty"};
    }
    auto segments = std::vector<std::string>{};
    auto pos = std::size_t{0};
    while (true) {
        auto next = path.find('.', pos);
        auto segment = path.substr(pos, next - pos);
        if (segment.empty()) {
            throw Exception{ErrorKind::invalid_field_path,
                            "field path has an empty segment: " + std::string{path}};
        }
        segments.emplace_back(segment);
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return FieldPath{std::move(segments)};
}

auto FieldPath::first_segment() const -> const std::string& {
    ABSL_CHECK(!segments_.empty()) << "first_segment() on empty FieldPath";
    return segments_.front();
}

auto FieldPath::last_segment() const -> const std::string& {
    ABSL_CHECK(!segments_.empty()) << "last_segment() on empty FieldPath";
    return segments_.back();
}

auto FieldPath::pop_first() const -> FieldPath {
    ABSL_CHECK(!segments_.empty()) << "pop_first() on empty FieldPath";
    return FieldPath{std::vector<std::string>(segments_.begin() + 1, segments_.end())};
}

auto FieldPath::pop_last() const -> FieldPath {
    ABSL_CHECK(!segments_.empty()) << "pop_last() on empty FieldPath";
    return FieldPath{std::vector<std::string>(segments_.begin(), segments_.end() - 1)};
}

auto FieldPath::append(std::string segment) const -> FieldPath {
    auto segments = segments_;
    segments.push_back(std::move(segment));
    return FieldPath{std::move(segments)};
}

auto FieldPath::is_prefix_of(const FieldPath& other) const -> bool {
    if (size() > other.size()) return false;
    return std::ranges::equal(segments_,
        std::ranges::subrange(other.segments_.begin(),
                              other.segments_.begin() + static_cast<std::ptrdiff_t>(size())));
}

auto FieldPath::canonical_string() const -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (i > 0) result.push_back('.');
        if (is_simple_identifier(segments_[i])) {
            result += segments_[i];
        } else {
            result += quote_segment(segments_[i]);
        }
    }
    return result;
}

// -- ResourcePath -------------------------------------------------------------

auto ResourcePath::from_string(std::string_view path) -> ResourcePath {
    auto segments = std::vector<std::string>{};
    auto pos = std::size_t{0};
    while (pos <= path.size()) {
        auto next = path.find('/', pos);
        auto segment = path.substr(pos, next - pos);
        if (!segment.empty()) segments.emplace_back(segment);
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return ResourcePath{std::move(segments)};
}

auto ResourcePath::canonical_string() const -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (i > 0) result.push_back('/');
        result += segments_[i];
    }
    return result;
}

// -- DocumentKey --------------------------------------------------------------

DocumentKey::DocumentKey(ResourcePath path) : path_{std::move(path)} {
    if (!is_document_key(path_)) {
        throw Exception{ErrorKind::invalid_key,
                        "invalid document key path: " + path_.canonical_string()};
    }
}

auto DocumentKey::from_path_string(std::string_view path) -> DocumentKey {
    return DocumentKey{ResourcePath::from_string(path)};
}

auto DocumentKey::is_document_key(const ResourcePath& path) -> bool {
    return !path.empty() && path.size() % 2 == 0;
}

}  // namespace docsync_cpp
