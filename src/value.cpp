#include <docsync-cpp/value.hpp>

#include <absl/log/absl_check.h>

#include <cmath>

namespace docsync_cpp {

// -- ObjectValue --------------------------------------------------------------

ObjectValue::ObjectValue(Map fields)
    : fields_{fields.empty() ? nullptr : std::make_shared<const Map>(std::move(fields))} {}

auto ObjectValue::empty() -> const ObjectValue& {
    static const auto instance = ObjectValue{};
    return instance;
}

auto ObjectValue::fields() const -> const Map& {
    static const auto no_fields = Map{};
    return fields_ ? *fields_ : no_fields;
}

auto ObjectValue::size() const -> std::size_t {
    return fields_ ? fields_->size() : 0;
}

auto ObjectValue::is_empty() const -> bool {
    return size() == 0;
}

auto ObjectValue::field(const FieldPath& path) const -> std::optional<FieldValue> {
    if (path.empty()) return std::nullopt;

    const auto* current = this;
    for (std::size_t i = 0; i < path.size(); ++i) {
        const auto& map = current->fields();
        auto it = map.find(path.segments()[i]);
        if (it == map.end()) return std::nullopt;
        if (i + 1 == path.size()) return it->second;

        current = it->second.get_if<ObjectValue>();
        if (!current) return std::nullopt;
    }
    return std::nullopt;
}

auto ObjectValue::with(const std::string& name, FieldValue value) const -> ObjectValue {
    auto copy = fields();
    copy.insert_or_assign(name, std::move(value));
    return ObjectValue{std::make_shared<const Map>(std::move(copy))};
}

auto ObjectValue::without(const std::string& name) const -> ObjectValue {
    if (!fields().contains(name)) return *this;
    auto copy = fields();
    copy.erase(name);
    if (copy.empty()) return ObjectValue{};
    return ObjectValue{std::make_shared<const Map>(std::move(copy))};
}

auto ObjectValue::set(const FieldPath& path, FieldValue value) const -> ObjectValue {
    ABSL_CHECK(!path.empty()) << "Cannot set field for empty path on ObjectValue";

    const auto& child_name = path.first_segment();
    if (path.size() == 1) {
        return with(child_name, std::move(value));
    }

    auto child = ObjectValue{};
    const auto& map = fields();
    if (auto it = map.find(child_name); it != map.end()) {
        if (const auto* nested = it->second.get_if<ObjectValue>()) {
            child = *nested;
        }
    }
    auto new_child = child.set(path.pop_first(), std::move(value));
    return with(child_name, FieldValue{std::move(new_child)});
}

auto ObjectValue::remove(const FieldPath& path) const -> ObjectValue {
    ABSL_CHECK(!path.empty()) << "Cannot delete field for empty path on ObjectValue";

    const auto& child_name = path.first_segment();
    if (path.size() == 1) {
        return without(child_name);
    }

    const auto& map = fields();
    auto it = map.find(child_name);
    if (it == map.end()) return *this;

    const auto* nested = it->second.get_if<ObjectValue>();
    if (!nested) return *this;

    auto new_child = nested->remove(path.pop_first());
    return with(child_name, FieldValue{std::move(new_child)});
}

auto ObjectValue::operator==(const ObjectValue& other) const -> bool {
    if (fields_ == other.fields_) return true;
    return fields() == other.fields();
}

auto make_object(std::initializer_list<std::pair<const std::string, FieldValue>> fields)
    -> ObjectValue {
    return ObjectValue{ObjectValue::Map{fields}};
}

// -- ServerTimestampValue -----------------------------------------------------

ServerTimestampValue::ServerTimestampValue(Timestamp write_time,
                                           std::optional<FieldValue> previous)
    : local_write_time{write_time},
      previous_value{previous ? std::make_shared<const FieldValue>(std::move(*previous))
                              : nullptr} {}

auto ServerTimestampValue::previous() const -> std::optional<FieldValue> {
    if (!previous_value) return std::nullopt;
    return *previous_value;
}

auto ServerTimestampValue::operator==(const ServerTimestampValue& other) const -> bool {
    if (local_write_time != other.local_write_time) return false;
    if (!previous_value || !other.previous_value) {
        return !previous_value && !other.previous_value;
    }
    return *previous_value == *other.previous_value;
}

// -- FieldValue ---------------------------------------------------------------

auto FieldValue::operator==(const FieldValue& other) const -> bool {
    if (value_.index() != other.value_.index()) return false;

    if (const auto* d = get_if<double>()) {
        const auto rhs = *other.get_if<double>();
        if (std::isnan(*d)) return std::isnan(rhs);
        return *d == rhs;
    }
    return value_ == other.value_;
}

}  // namespace docsync_cpp
