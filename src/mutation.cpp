#include <docsync-cpp/mutation.hpp>

#include <docsync-cpp/log.hpp>

#include <absl/base/attributes.h>
#include <absl/log/absl_check.h>
#include <absl/log/absl_log.h>

namespace docsync_cpp {

namespace {

ABSL_CONST_INIT VerboseFlag mutation_logging("mutation");

void verify_key_matches(const DocumentKey& key, const std::optional<MaybeDocument>& maybe_doc) {
    if (maybe_doc) {
        ABSL_CHECK(key_of(*maybe_doc) == key)
            << "Can only apply a mutation to a document with the same key: mutation key "
            << key.to_string() << ", document key " << key_of(*maybe_doc).to_string();
    }
}

// Mutations keep the version of an existing document. Deleted and unknown
// documents have a post-mutation version of SnapshotVersion::min().
auto post_mutation_version(const std::optional<MaybeDocument>& maybe_doc) -> SnapshotVersion {
    if (const auto* doc = as_document(maybe_doc)) return doc->version();
    return SnapshotVersion::min();
}

void log_precondition_rejected(MutationType type, const DocumentKey& key,
                               const Precondition& precondition) {
    ABSL_LOG_IF(INFO, mutation_logging)
        << "Precondition " << to_string_view(precondition.type()) << " rejected "
        << to_string_view(type) << " of " << key.to_string();
}

}  // anonymous namespace

// -- SetMutation --------------------------------------------------------------

auto SetMutation::apply_to_remote_document(const std::optional<MaybeDocument>& maybe_doc,
                                           const MutationResult& mutation_result) const
    -> std::optional<MaybeDocument> {
    verify_key_matches(key_, maybe_doc);
    ABSL_CHECK(!mutation_result.transform_results)
        << "Transform results received by SetMutation";

    const auto version = post_mutation_version(maybe_doc);
    ABSL_LOG_IF(INFO, mutation_logging) << "Acknowledged set of " << key_.to_string();
    return Document{key_, version, value_, /*has_local_mutations=*/false};
}

auto SetMutation::apply_to_local_view(const std::optional<MaybeDocument>& maybe_doc,
                                      const std::optional<MaybeDocument>& /*base_doc*/,
                                      const Timestamp& /*local_write_time*/) const
    -> std::optional<MaybeDocument> {
    verify_key_matches(key_, maybe_doc);

    if (!precondition_.is_valid_for(maybe_doc)) {
        log_precondition_rejected(type, key_, precondition_);
        return maybe_doc;
    }

    const auto version = post_mutation_version(maybe_doc);
    return Document{key_, version, value_, /*has_local_mutations=*/true};
}

// -- PatchMutation ------------------------------------------------------------

auto PatchMutation::apply_to_remote_document(const std::optional<MaybeDocument>& maybe_doc,
                                             const MutationResult& mutation_result) const
    -> std::optional<MaybeDocument> {
    verify_key_matches(key_, maybe_doc);
    ABSL_CHECK(!mutation_result.transform_results)
        << "Transform results received by PatchMutation";

    if (!precondition_.is_valid_for(maybe_doc)) {
        log_precondition_rejected(type, key_, precondition_);
        return maybe_doc;
    }

    const auto version = post_mutation_version(maybe_doc);
    ABSL_LOG_IF(INFO, mutation_logging) << "Acknowledged patch of " << key_.to_string();
    return Document{key_, version, patch_document(maybe_doc), /*has_local_mutations=*/false};
}

auto PatchMutation::apply_to_local_view(const std::optional<MaybeDocument>& maybe_doc,
                                        const std::optional<MaybeDocument>& /*base_doc*/,
                                        const Timestamp& /*local_write_time*/) const
    -> std::optional<MaybeDocument> {
    verify_key_matches(key_, maybe_doc);

    if (!precondition_.is_valid_for(maybe_doc)) {
        log_precondition_rejected(type, key_, precondition_);
        return maybe_doc;
    }

    const auto version = post_mutation_version(maybe_doc);
    return Document{key_, version, patch_document(maybe_doc), /*has_local_mutations=*/true};
}

auto PatchMutation::patch_document(const std::optional<MaybeDocument>& maybe_doc) const
    -> ObjectValue {
    if (const auto* doc = as_document(maybe_doc)) return patch_object(doc->data());
    return patch_object(ObjectValue::empty());
}

auto PatchMutation::patch_object(ObjectValue data) const -> ObjectValue {
    for (const auto& path : field_mask_) {
        if (path.empty()) continue;
        if (auto new_value = data_.field(path)) {
            data = data.set(path, std::move(*new_value));
        } else {
            data = data.remove(path);
        }
    }
    return data;
}

// -- TransformMutation --------------------------------------------------------

auto TransformMutation::apply_to_remote_document(const std::optional<MaybeDocument>& maybe_doc,
                                                 const MutationResult& mutation_result) const
    -> std::optional<MaybeDocument> {
    verify_key_matches(key_, maybe_doc);
    ABSL_CHECK(mutation_result.transform_results)
        << "Transform results missing for TransformMutation";
    ABSL_CHECK_EQ(mutation_result.transform_results->size(), field_transforms_.size())
        << "TransformResults length mismatch";

    // The backend already validated the precondition, but without a local
    // document there is nothing to transform.
    if (!precondition_.is_valid_for(maybe_doc)) {
        log_precondition_rejected(type, key_, precondition_);
        return maybe_doc;
    }

    const auto& doc = require_document(maybe_doc);
    auto new_data = transform_object(doc.data(), *mutation_result.transform_results,
                                     /*remote=*/true);
    ABSL_LOG_IF(INFO, mutation_logging)
        << "Acknowledged " << field_transforms_.size() << " transform(s) of "
        << key_.to_string();
    return Document{key_, doc.version(), std::move(new_data), /*has_local_mutations=*/false};
}

auto TransformMutation::apply_to_local_view(const std::optional<MaybeDocument>& maybe_doc,
                                            const std::optional<MaybeDocument>& base_doc,
                                            const Timestamp& local_write_time) const
    -> std::optional<MaybeDocument> {
    verify_key_matches(key_, maybe_doc);

    if (!precondition_.is_valid_for(maybe_doc)) {
        log_precondition_rejected(type, key_, precondition_);
        return maybe_doc;
    }

    const auto& doc = require_document(maybe_doc);
    const auto transform_results = local_transform_results(base_doc, local_write_time);
    auto new_data = transform_object(doc.data(), transform_results, /*remote=*/false);
    return Document{key_, doc.version(), std::move(new_data), /*has_local_mutations=*/true};
}

// Safe only because the precondition is always exists(true).
auto TransformMutation::require_document(const std::optional<MaybeDocument>& maybe_doc) const
    -> const Document& {
    const auto* doc = as_document(maybe_doc);
    ABSL_CHECK(doc != nullptr) << "Unknown MaybeDocument type for transform of "
                               << key_.to_string();
    ABSL_CHECK(doc->key() == key_) << "Can only transform a document with the same key";
    return *doc;
}

auto TransformMutation::local_transform_results(const std::optional<MaybeDocument>& base_doc,
                                                const Timestamp& local_write_time) const
    -> std::vector<FieldValue> {
    const auto* base = as_document(base_doc);
    auto results = std::vector<FieldValue>{};
    results.reserve(field_transforms_.size());
    for (const auto& field_transform : field_transforms_) {
        auto previous_value = base ? base->field(field_transform.field) : std::nullopt;
        results.push_back(local_transform_result(field_transform.transform,
                                                 previous_value, local_write_time));
    }
    return results;
}

auto TransformMutation::transform_object(ObjectValue data,
                                         const std::vector<FieldValue>& transform_results,
                                         bool remote) const -> ObjectValue {
    ABSL_CHECK_EQ(transform_results.size(), field_transforms_.size())
        << "TransformResults length mismatch";

    for (std::size_t i = 0; i < field_transforms_.size(); ++i) {
        const auto& field_transform = field_transforms_[i];
        auto value = remote
            ? remote_transform_result(field_transform.transform,
                                      data.field(field_transform.field),
                                      transform_results[i])
            : transform_results[i];
        data = data.set(field_transform.field, std::move(value));
    }
    return data;
}

// -- DeleteMutation -----------------------------------------------------------

auto DeleteMutation::apply_to_remote_document(const std::optional<MaybeDocument>& maybe_doc,
                                              const MutationResult& mutation_result) const
    -> std::optional<MaybeDocument> {
    verify_key_matches(key_, maybe_doc);
    ABSL_CHECK(!mutation_result.transform_results)
        << "Transform results received by DeleteMutation";

    ABSL_LOG_IF(INFO, mutation_logging) << "Acknowledged delete of " << key_.to_string();
    return NoDocument{key_, SnapshotVersion::min()};
}

auto DeleteMutation::apply_to_local_view(const std::optional<MaybeDocument>& maybe_doc,
                                         const std::optional<MaybeDocument>& /*base_doc*/,
                                         const Timestamp& /*local_write_time*/) const
    -> std::optional<MaybeDocument> {
    verify_key_matches(key_, maybe_doc);

    if (!precondition_.is_valid_for(maybe_doc)) {
        log_precondition_rejected(type, key_, precondition_);
        return maybe_doc;
    }

    return NoDocument{key_, SnapshotVersion::for_deleted_doc()};
}

// -- Mutation -----------------------------------------------------------------

auto type_of(const Mutation& mutation) -> MutationType {
    return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::type; }, mutation);
}

auto key_of(const Mutation& mutation) -> const DocumentKey& {
    return std::visit([](const auto& m) -> const DocumentKey& { return m.key(); }, mutation);
}

auto precondition_of(const Mutation& mutation) -> const Precondition& {
    return std::visit([](const auto& m) -> const Precondition& { return m.precondition(); },
                      mutation);
}

auto apply_to_remote_document(const Mutation& mutation,
                              const std::optional<MaybeDocument>& maybe_doc,
                              const MutationResult& mutation_result)
    -> std::optional<MaybeDocument> {
    return std::visit([&](const auto& m) {
        return m.apply_to_remote_document(maybe_doc, mutation_result);
    }, mutation);
}

auto apply_to_local_view(const Mutation& mutation,
                         const std::optional<MaybeDocument>& maybe_doc,
                         const std::optional<MaybeDocument>& base_doc,
                         const Timestamp& local_write_time)
    -> std::optional<MaybeDocument> {
    return std::visit([&](const auto& m) {
        return m.apply_to_local_view(maybe_doc, base_doc, local_write_time);
    }, mutation);
}

}  // namespace docsync_cpp
