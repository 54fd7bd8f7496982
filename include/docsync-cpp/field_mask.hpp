/// @file field_mask.hpp
/// @brief FieldMask: the field paths a patch mutation touches.

#pragma once

#include <docsync-cpp/types.hpp>

#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

namespace docsync_cpp {

/// An ordered list of field paths used together with an ObjectValue to
/// patch a document.
///
///  - `foo` overwrites foo entirely with the provided value. If foo is not
///    present in the companion ObjectValue, the field is deleted.
///  - `foo.bar` overwrites only the field bar of the object foo. If foo is
///    not an object, foo is replaced with an object containing bar.
///
/// Paths are neither sorted nor deduplicated; equality is order-sensitive.
class FieldMask {
public:
    FieldMask() = default;
    explicit FieldMask(std::vector<FieldPath> fields) : fields_{std::move(fields)} {}
    FieldMask(std::initializer_list<FieldPath> fields) : fields_{fields} {}

    auto fields() const -> const std::vector<FieldPath>& { return fields_; }
    auto size() const -> std::size_t { return fields_.size(); }
    auto empty() const -> bool { return fields_.empty(); }

    auto begin() const { return fields_.begin(); }
    auto end() const { return fields_.end(); }

    auto operator==(const FieldMask&) const -> bool = default;

private:
    std::vector<FieldPath> fields_;
};

}  // namespace docsync_cpp
