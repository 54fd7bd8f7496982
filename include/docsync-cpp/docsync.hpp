/// @file docsync.hpp
/// @brief Umbrella header for the docsync-cpp library.
///
/// Include this single header for access to all public types:
/// Timestamp, SnapshotVersion, FieldPath, DocumentKey, FieldValue,
/// ObjectValue, Document, NoDocument, Precondition, FieldMask,
/// FieldTransform, MutationResult, the four mutations, and Error.

#pragma once

#include <docsync-cpp/document.hpp>
#include <docsync-cpp/error.hpp>
#include <docsync-cpp/field_mask.hpp>
#include <docsync-cpp/log.hpp>
#include <docsync-cpp/mutation.hpp>
#include <docsync-cpp/mutation_result.hpp>
#include <docsync-cpp/precondition.hpp>
#include <docsync-cpp/transform.hpp>
#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>
