/// @file mutation.hpp
/// @brief Mutations: self-contained writes to a single document.
///
/// A mutation describes a change to one document: create or replace it
/// (SetMutation), update some of its fields (PatchMutation), transform some
/// of its fields (TransformMutation), or delete it (DeleteMutation).
///
/// Mutations act on the version of the document as well as its contents.
/// Set, Patch and Transform keep the version of an existing document;
/// Delete resets it. The transitions are:
///
///     MUTATION           APPLIED TO            RESULTS IN
///
///     SetMutation        Document(v3)          Document(v3)
///     SetMutation        NoDocument(v3)        Document(v0)
///     SetMutation        nullopt               Document(v0)
///     PatchMutation      Document(v3)          Document(v3)
///     PatchMutation      NoDocument(v3)        NoDocument(v3)
///     PatchMutation      nullopt               nullopt
///     TransformMutation  Document(v3)          Document(v3)
///     TransformMutation  NoDocument(v3)        NoDocument(v3)
///     TransformMutation  nullopt               nullopt
///     DeleteMutation     Document(v3)          NoDocument(v0)
///     DeleteMutation     NoDocument(v3)        NoDocument(v0)
///     DeleteMutation     nullopt               NoDocument(v0)
///
/// where v0 is SnapshotVersion::min() on the remote path. A local delete
/// produces SnapshotVersion::for_deleted_doc() instead.
///
/// TransformMutations never create a Document from a NoDocument or from
/// nothing, even though the backend would. The client always pairs a
/// transform with a preceding Set or Patch in the same batch, and the
/// transform should only apply if that step produced a Document.
///
/// Each mutation type offers two operations:
///
///  - apply_to_remote_document(): the document after the backend
///    acknowledged the write, given its MutationResult.
///  - apply_to_local_view(): the optimistic document before the backend
///    has answered.
///
/// Both require a non-empty `maybe_doc` to have the mutation's key and
/// abort otherwise. A precondition that does not hold is not an error: the
/// input is returned unchanged.

#pragma once

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/field_mask.hpp>
#include <docsync-cpp/mutation_result.hpp>
#include <docsync-cpp/precondition.hpp>
#include <docsync-cpp/transform.hpp>
#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace docsync_cpp {

/// The four kinds of mutation.
enum class MutationType : std::uint8_t {
    set,        ///< Create or replace a document.
    patch,      ///< Update the fields named by a mask.
    transform,  ///< Apply server-side field transforms.
    del,        ///< Delete a document.
};

/// Convert a MutationType to its string representation.
constexpr auto to_string_view(MutationType type) noexcept -> std::string_view {
    switch (type) {
        case MutationType::set:       return "set";
        case MutationType::patch:     return "patch";
        case MutationType::transform: return "transform";
        case MutationType::del:       return "delete";
    }
    return "unknown";
}

/// Creates or replaces the document at a key with the given contents.
class SetMutation {
public:
    static constexpr auto type = MutationType::set;

    SetMutation(DocumentKey key, ObjectValue value,
                Precondition precondition = Precondition::none())
        : key_{std::move(key)},
          value_{std::move(value)},
          precondition_{std::move(precondition)} {}

    auto key() const -> const DocumentKey& { return key_; }
    auto value() const -> const ObjectValue& { return value_; }
    auto precondition() const -> const Precondition& { return precondition_; }

    /// The precondition is not checked: the backend accepted the write, so
    /// it held.
    auto apply_to_remote_document(const std::optional<MaybeDocument>& maybe_doc,
                                  const MutationResult& mutation_result) const
        -> std::optional<MaybeDocument>;

    auto apply_to_local_view(const std::optional<MaybeDocument>& maybe_doc,
                             const std::optional<MaybeDocument>& base_doc,
                             const Timestamp& local_write_time) const
        -> std::optional<MaybeDocument>;

    auto operator==(const SetMutation&) const -> bool = default;

private:
    DocumentKey key_;
    ObjectValue value_;
    Precondition precondition_;
};

/// Modifies fields of the document at a key. Values are applied through a
/// field mask:
///
///  - A field in both the mask and the values is updated.
///  - A field in neither is left alone.
///  - A field in the mask but not the values is deleted.
///  - A field in the values but not the mask is ignored.
class PatchMutation {
public:
    static constexpr auto type = MutationType::patch;

    PatchMutation(DocumentKey key, ObjectValue data, FieldMask field_mask,
                  Precondition precondition = Precondition::none())
        : key_{std::move(key)},
          data_{std::move(data)},
          field_mask_{std::move(field_mask)},
          precondition_{std::move(precondition)} {}

    auto key() const -> const DocumentKey& { return key_; }
    auto data() const -> const ObjectValue& { return data_; }
    auto field_mask() const -> const FieldMask& { return field_mask_; }
    auto precondition() const -> const Precondition& { return precondition_; }

    /// Unlike SetMutation, the precondition is checked here too: without a
    /// cached base document, patching would put a partial document into
    /// the cache.
    auto apply_to_remote_document(const std::optional<MaybeDocument>& maybe_doc,
                                  const MutationResult& mutation_result) const
        -> std::optional<MaybeDocument>;

    auto apply_to_local_view(const std::optional<MaybeDocument>& maybe_doc,
                             const std::optional<MaybeDocument>& base_doc,
                             const Timestamp& local_write_time) const
        -> std::optional<MaybeDocument>;

    /// Apply the mask to `data`. Does not check the precondition.
    auto patch_object(ObjectValue data) const -> ObjectValue;

    auto operator==(const PatchMutation&) const -> bool = default;

private:
    auto patch_document(const std::optional<MaybeDocument>& maybe_doc) const -> ObjectValue;

    DocumentKey key_;
    ObjectValue data_;
    FieldMask field_mask_;
    Precondition precondition_;
};

/// Modifies specific fields of a document with transform operations.
///
/// Behaves like a PatchMutation that has no effect on a missing document.
/// The precondition is always exists(true): transforms are only ever
/// combined with a prior Set or Patch that leaves an existing document.
class TransformMutation {
public:
    static constexpr auto type = MutationType::transform;

    TransformMutation(DocumentKey key, std::vector<FieldTransform> field_transforms)
        : key_{std::move(key)}, field_transforms_{std::move(field_transforms)} {}

    auto key() const -> const DocumentKey& { return key_; }
    auto field_transforms() const -> const std::vector<FieldTransform>& {
        return field_transforms_;
    }
    auto precondition() const -> const Precondition& { return precondition_; }

    /// Requires `mutation_result` to carry one transform result per field
    /// transform.
    auto apply_to_remote_document(const std::optional<MaybeDocument>& maybe_doc,
                                  const MutationResult& mutation_result) const
        -> std::optional<MaybeDocument>;

    /// `base_doc` supplies the previous value of each transformed field.
    auto apply_to_local_view(const std::optional<MaybeDocument>& maybe_doc,
                             const std::optional<MaybeDocument>& base_doc,
                             const Timestamp& local_write_time) const
        -> std::optional<MaybeDocument>;

    auto operator==(const TransformMutation&) const -> bool = default;

private:
    auto require_document(const std::optional<MaybeDocument>& maybe_doc) const
        -> const Document&;
    auto local_transform_results(const std::optional<MaybeDocument>& base_doc,
                                 const Timestamp& local_write_time) const
        -> std::vector<FieldValue>;
    auto transform_object(ObjectValue data,
                          const std::vector<FieldValue>& transform_results,
                          bool remote) const -> ObjectValue;

    DocumentKey key_;
    std::vector<FieldTransform> field_transforms_;
    Precondition precondition_ = Precondition::exists(true);
};

/// Deletes the document at a key.
class DeleteMutation {
public:
    static constexpr auto type = MutationType::del;

    explicit DeleteMutation(DocumentKey key,
                            Precondition precondition = Precondition::none())
        : key_{std::move(key)}, precondition_{std::move(precondition)} {}

    auto key() const -> const DocumentKey& { return key_; }
    auto precondition() const -> const Precondition& { return precondition_; }

    /// The precondition is not checked: the backend accepted the write.
    auto apply_to_remote_document(const std::optional<MaybeDocument>& maybe_doc,
                                  const MutationResult& mutation_result) const
        -> std::optional<MaybeDocument>;

    auto apply_to_local_view(const std::optional<MaybeDocument>& maybe_doc,
                             const std::optional<MaybeDocument>& base_doc,
                             const Timestamp& local_write_time) const
        -> std::optional<MaybeDocument>;

    auto operator==(const DeleteMutation&) const -> bool = default;

private:
    DocumentKey key_;
    Precondition precondition_;
};

/// Any mutation. Consumers dispatch with std::visit, so adding a kind
/// fails to compile until every visitor handles it.
using Mutation = std::variant<SetMutation, PatchMutation, TransformMutation, DeleteMutation>;

/// The kind of `mutation`.
auto type_of(const Mutation& mutation) -> MutationType;

/// The key `mutation` writes to.
auto key_of(const Mutation& mutation) -> const DocumentKey&;

/// The precondition of `mutation`.
auto precondition_of(const Mutation& mutation) -> const Precondition&;

/// Dispatch to the alternative's apply_to_remote_document().
auto apply_to_remote_document(const Mutation& mutation,
                              const std::optional<MaybeDocument>& maybe_doc,
                              const MutationResult& mutation_result)
    -> std::optional<MaybeDocument>;

/// Dispatch to the alternative's apply_to_local_view().
auto apply_to_local_view(const Mutation& mutation,
                         const std::optional<MaybeDocument>& maybe_doc,
                         const std::optional<MaybeDocument>& base_doc,
                         const Timestamp& local_write_time)
    -> std::optional<MaybeDocument>;

}  // namespace docsync_cpp
