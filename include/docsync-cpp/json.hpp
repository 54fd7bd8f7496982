/// @file json.hpp
/// @brief nlohmann/json interoperability for docsync-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the value types and
/// decoding functions for types that have no default state (keys,
/// documents, mutations). The representation is meant for diagnostics,
/// fixtures and tooling; it is not a wire or storage format.
///
/// Values that JSON cannot express directly are tagged with a `__type`
/// member:
///
/// @code
/// {"__type": "timestamp", "seconds": 1700000000, "nanoseconds": 0}
/// {"__type": "bytes", "value": "3q0="}
/// {"__type": "server_timestamp", "local_write_time": {...}, "previous_value": 1}
/// @endcode
///
/// Mutations are objects with a `type` member:
///
/// @code
/// {"type": "patch", "key": "rooms/eros",
///  "data": {"topic": "chat"}, "mask": ["topic", "owner.name"],
///  "precondition": {"exists": true}}
/// @endcode

#pragma once

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/field_mask.hpp>
#include <docsync-cpp/mutation.hpp>
#include <docsync-cpp/mutation_result.hpp>
#include <docsync-cpp/precondition.hpp>
#include <docsync-cpp/transform.hpp>
#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>

#include <nlohmann/json.hpp>

namespace docsync_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Identity types -----------------------------------------------------------

void to_json(nlohmann::json& j, const Timestamp& t);
void from_json(const nlohmann::json& j, Timestamp& t);

void to_json(nlohmann::json& j, const SnapshotVersion& v);
void from_json(const nlohmann::json& j, SnapshotVersion& v);

/// Written as an array of segments. Read from an array of segments or a
/// dot-separated string.
void to_json(nlohmann::json& j, const FieldPath& path);
void from_json(const nlohmann::json& j, FieldPath& path);

void to_json(nlohmann::json& j, const DocumentKey& key);

// -- Values -------------------------------------------------------------------

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const ServerTimestampValue& sv);

void to_json(nlohmann::json& j, const FieldValue& value);
void from_json(const nlohmann::json& j, FieldValue& value);

void to_json(nlohmann::json& j, const ObjectValue& object);
void from_json(const nlohmann::json& j, ObjectValue& object);

// -- Documents ----------------------------------------------------------------

void to_json(nlohmann::json& j, const Document& doc);
void to_json(nlohmann::json& j, const NoDocument& doc);
void to_json(nlohmann::json& j, const MaybeDocument& maybe_doc);

// -- Mutation vocabulary ------------------------------------------------------

void to_json(nlohmann::json& j, const Precondition& precondition);
void from_json(const nlohmann::json& j, Precondition& precondition);

void to_json(nlohmann::json& j, const FieldMask& mask);
void from_json(const nlohmann::json& j, FieldMask& mask);

void to_json(nlohmann::json& j, const TransformOperation& op);
void to_json(nlohmann::json& j, const FieldTransform& transform);

void to_json(nlohmann::json& j, const MutationResult& result);
void from_json(const nlohmann::json& j, MutationResult& result);

void to_json(nlohmann::json& j, const SetMutation& m);
void to_json(nlohmann::json& j, const PatchMutation& m);
void to_json(nlohmann::json& j, const TransformMutation& m);
void to_json(nlohmann::json& j, const DeleteMutation& m);
void to_json(nlohmann::json& j, const Mutation& m);

// =============================================================================
// Decoding
// =============================================================================
//
// Every function below throws Exception{ErrorKind::decoding_error} on
// malformed input, including the type errors nlohmann/json reports.

namespace json {

auto decode_document_key(const nlohmann::json& j) -> DocumentKey;
auto decode_field_value(const nlohmann::json& j) -> FieldValue;
auto decode_object_value(const nlohmann::json& j) -> ObjectValue;
auto decode_transform_operation(const nlohmann::json& j) -> TransformOperation;
auto decode_field_transform(const nlohmann::json& j) -> FieldTransform;
auto decode_mutation_result(const nlohmann::json& j) -> MutationResult;
auto decode_maybe_document(const nlohmann::json& j) -> MaybeDocument;
auto decode_mutation(const nlohmann::json& j) -> Mutation;

}  // namespace json

}  // namespace docsync_cpp
