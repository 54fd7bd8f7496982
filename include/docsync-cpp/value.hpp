/// @file value.hpp
/// @brief Field values: FieldValue, ObjectValue, ServerTimestampValue.

#pragma once

#include <docsync-cpp/types.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace docsync_cpp {

class FieldValue;

/// Represents a null field value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A byte array value.
using Bytes = std::vector<std::byte>;

/// An ordered list of values.
using ArrayValue = std::vector<FieldValue>;

/// The kinds of value a field can hold.
enum class FieldValueType : std::uint8_t {
    null,
    boolean,
    integer,
    floating,
    timestamp,
    string,
    bytes,
    server_timestamp,
    array,
    object,
};

/// Convert a FieldValueType to its string representation.
constexpr auto to_string_view(FieldValueType type) noexcept -> std::string_view {
    switch (type) {
        case FieldValueType::null:             return "null";
        case FieldValueType::boolean:          return "boolean";
        case FieldValueType::integer:          return "integer";
        case FieldValueType::floating:         return "floating";
        case FieldValueType::timestamp:        return "timestamp";
        case FieldValueType::string:           return "string";
        case FieldValueType::bytes:            return "bytes";
        case FieldValueType::server_timestamp: return "server_timestamp";
        case FieldValueType::array:            return "array";
        case FieldValueType::object:           return "object";
    }
    return "unknown";
}

/// An immutable map of field names to values, addressed by FieldPath.
///
/// Every "mutator" returns a new ObjectValue and leaves the receiver
/// untouched. Subtrees that are not on the modified path are shared
/// between the old and the new value, so copies are cheap.
///
/// @code
/// auto data = ObjectValue::empty()
///     .set(FieldPath{"user", "name"}, FieldValue{"Ada"})
///     .set(FieldPath{"count"}, FieldValue{1});
/// auto name = data.field(FieldPath{"user", "name"});
/// @endcode
class ObjectValue {
public:
    using Map = std::map<std::string, FieldValue>;

    /// An object with no fields.
    ObjectValue() = default;

    /// Construct from top-level fields.
    explicit ObjectValue(Map fields);

    /// The shared empty object.
    static auto empty() -> const ObjectValue&;

    /// Get the value at a path, or nullopt if any segment is missing or
    /// traverses a non-object value.
    auto field(const FieldPath& path) const -> std::optional<FieldValue>;

    /// Return a copy with `value` stored at `path`. Missing intermediate
    /// objects are created; non-object intermediates are replaced.
    auto set(const FieldPath& path, FieldValue value) const -> ObjectValue;

    /// Return a copy with the value at `path` removed. Removing a missing
    /// path returns an equal object.
    auto remove(const FieldPath& path) const -> ObjectValue;

    /// The top-level fields.
    auto fields() const -> const Map&;

    auto size() const -> std::size_t;
    auto is_empty() const -> bool;

    auto operator==(const ObjectValue& other) const -> bool;

private:
    explicit ObjectValue(std::shared_ptr<const Map> fields)
        : fields_{std::move(fields)} {}

    auto with(const std::string& name, FieldValue value) const -> ObjectValue;
    auto without(const std::string& name) const -> ObjectValue;

    std::shared_ptr<const Map> fields_;  // null means empty
};

/// Local stand-in for a server timestamp that has not been resolved yet.
///
/// Produced when a server-timestamp transform is applied to the local view.
/// Carries the batch's local write time and the field's value before the
/// batch, if it had one.
struct ServerTimestampValue {
    Timestamp local_write_time;                       ///< When the write was issued.
    std::shared_ptr<const FieldValue> previous_value;  ///< Prior value, may be null.

    ServerTimestampValue() = default;
    ServerTimestampValue(Timestamp write_time, std::optional<FieldValue> previous);

    auto previous() const -> std::optional<FieldValue>;

    auto operator==(const ServerTimestampValue& other) const -> bool;
};

/// A value stored in a document field.
///
/// Alternatives: Null, bool, int64_t, double, Timestamp, string, Bytes,
/// ServerTimestampValue, ArrayValue, ObjectValue.
class FieldValue {
public:
    using Variant = std::variant<
        Null,
        bool,
        std::int64_t,
        double,
        Timestamp,
        std::string,
        Bytes,
        ServerTimestampValue,
        ArrayValue,
        ObjectValue
    >;

    FieldValue() : value_{Null{}} {}
    FieldValue(Null) : value_{Null{}} {}
    FieldValue(bool b) : value_{b} {}
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    FieldValue(T i) : value_{static_cast<std::int64_t>(i)} {}
    FieldValue(double d) : value_{d} {}
    FieldValue(Timestamp t) : value_{t} {}
    FieldValue(std::string s) : value_{std::move(s)} {}
    FieldValue(const char* s) : value_{std::string{s}} {}
    FieldValue(Bytes b) : value_{std::move(b)} {}
    FieldValue(ServerTimestampValue sv) : value_{std::move(sv)} {}
    FieldValue(ArrayValue a) : value_{std::move(a)} {}
    FieldValue(ObjectValue o) : value_{std::move(o)} {}

    auto type() const -> FieldValueType {
        return static_cast<FieldValueType>(value_.index());
    }

    auto variant() const -> const Variant& { return value_; }

    template <typename T>
    auto is() const -> bool { return std::holds_alternative<T>(value_); }

    template <typename T>
    auto get_if() const -> const T* { return std::get_if<T>(&value_); }

    /// Compares structurally. Doubles compare by value, except that NaN
    /// equals NaN.
    auto operator==(const FieldValue& other) const -> bool;

private:
    Variant value_;
};

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Document& doc) { ... },
///     [](const NoDocument& doc) { ... },
/// }, maybe_doc);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/// Build an ObjectValue from top-level name/value pairs.
/// @code
/// auto data = make_object({{"a", 1}, {"b", "two"}});
/// @endcode
auto make_object(std::initializer_list<std::pair<const std::string, FieldValue>> fields)
    -> ObjectValue;

}  // namespace docsync_cpp
