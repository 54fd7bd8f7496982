/// @file document.hpp
/// @brief Cached document states: Document, NoDocument, MaybeDocument.

#pragma once

#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>

#include <optional>
#include <utility>
#include <variant>

namespace docsync_cpp {

/// A document known to exist, with its contents.
///
/// `has_local_mutations` marks a view produced by applying writes that
/// the backend has not yet acknowledged.
///
/// @code
/// auto doc = Document{DocumentKey::from_path_string("rooms/eros"),
///                     SnapshotVersion{Timestamp{42, 0}},
///                     make_object({{"topic", "chat"}})};
/// auto topic = doc.field(FieldPath{"topic"});
/// @endcode
class Document {
public:
    Document(DocumentKey key, SnapshotVersion version, ObjectValue data,
             bool has_local_mutations = false)
        : key_{std::move(key)},
          version_{version},
          data_{std::move(data)},
          has_local_mutations_{has_local_mutations} {}

    auto key() const -> const DocumentKey& { return key_; }
    auto version() const -> const SnapshotVersion& { return version_; }
    auto data() const -> const ObjectValue& { return data_; }
    auto has_local_mutations() const -> bool { return has_local_mutations_; }

    /// Get the value at a field path, or nullopt if absent.
    auto field(const FieldPath& path) const -> std::optional<FieldValue> {
        return data_.field(path);
    }

    auto operator==(const Document&) const -> bool = default;

private:
    DocumentKey key_;
    SnapshotVersion version_;
    ObjectValue data_;
    bool has_local_mutations_;
};

/// A document known not to exist at the given version.
class NoDocument {
public:
    NoDocument(DocumentKey key, SnapshotVersion version)
        : key_{std::move(key)}, version_{version} {}

    auto key() const -> const DocumentKey& { return key_; }
    auto version() const -> const SnapshotVersion& { return version_; }

    auto operator==(const NoDocument&) const -> bool = default;

private:
    DocumentKey key_;
    SnapshotVersion version_;
};

/// What the client knows about a document: it exists, or it does not.
/// Absence of any knowledge is an empty std::optional<MaybeDocument>.
using MaybeDocument = std::variant<Document, NoDocument>;

/// Key of either alternative.
inline auto key_of(const MaybeDocument& maybe_doc) -> const DocumentKey& {
    return std::visit([](const auto& d) -> const DocumentKey& { return d.key(); }, maybe_doc);
}

/// Version of either alternative.
inline auto version_of(const MaybeDocument& maybe_doc) -> const SnapshotVersion& {
    return std::visit([](const auto& d) -> const SnapshotVersion& { return d.version(); },
                      maybe_doc);
}

/// The Document held by `maybe_doc`, or null if it is absent or a NoDocument.
inline auto as_document(const std::optional<MaybeDocument>& maybe_doc) -> const Document* {
    return maybe_doc ? std::get_if<Document>(&*maybe_doc) : nullptr;
}

/// True if `maybe_doc` holds a Document.
inline auto is_document(const std::optional<MaybeDocument>& maybe_doc) -> bool {
    return as_document(maybe_doc) != nullptr;
}

/// True if `maybe_doc` holds a NoDocument.
inline auto is_no_document(const std::optional<MaybeDocument>& maybe_doc) -> bool {
    return maybe_doc && std::holds_alternative<NoDocument>(*maybe_doc);
}

}  // namespace docsync_cpp
