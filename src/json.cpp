#include <docsync-cpp/json.hpp>

#include <docsync-cpp/error.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace docsync_cpp {

namespace {

constexpr std::string_view base64_alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Each group of up to three bytes becomes four characters, padded with '='.
auto base64_encode(const Bytes& data) -> std::string {
    auto result = std::string{};
    result.reserve(((data.size() + 2) / 3) * 4);
    for (std::size_t i = 0; i < data.size(); i += 3) {
        const auto remaining = std::min<std::size_t>(3, data.size() - i);
        auto group = std::uint32_t{0};
        for (std::size_t k = 0; k < 3; ++k) {
            group <<= 8;
            if (k < remaining) group |= std::to_integer<std::uint32_t>(data[i + k]);
        }
        for (std::size_t k = 0; k < 4; ++k) {
            const auto sextet = (group >> (18 - 6 * k)) & 0x3F;
            result.push_back(k <= remaining ? base64_alphabet[sextet] : '=');
        }
    }
    return result;
}

auto base64_decode(std::string_view encoded) -> Bytes {
    static const auto decode_table = []() {
        std::array<int, 256> t{};
        t.fill(-1);
        for (std::size_t i = 0; i < base64_alphabet.size(); ++i) {
            t[static_cast<unsigned char>(base64_alphabet[i])] = static_cast<int>(i);
        }
        t[static_cast<unsigned char>('=')] = 0;
        return t;
    }();
    if (encoded.size() % 4 != 0) {
        throw Exception{ErrorKind::decoding_error, "base64 length must be a multiple of 4"};
    }
    auto result = Bytes{};
    result.reserve((encoded.size() / 4) * 3);
    for (std::size_t i = 0; i + 3 < encoded.size(); i += 4) {
        int quad[4];
        for (std::size_t k = 0; k < 4; ++k) {
            quad[k] = decode_table[static_cast<unsigned char>(encoded[i + k])];
            if (quad[k] < 0) {
                throw Exception{ErrorKind::decoding_error, "invalid base64 character"};
            }
        }
        result.push_back(std::byte(static_cast<unsigned>((quad[0] << 2) | (quad[1] >> 4))));
        if (encoded[i + 2] != '=')
            result.push_back(std::byte(static_cast<unsigned>(((quad[1] & 0x0F) << 4) | (quad[2] >> 2))));
        if (encoded[i + 3] != '=')
            result.push_back(std::byte(static_cast<unsigned>(((quad[2] & 0x03) << 6) | quad[3])));
    }
    return result;
}

// Translate nlohmann/json errors into decoding errors.
template <typename Fn>
auto decoding(Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const nlohmann::json::exception& e) {
        throw Exception{ErrorKind::decoding_error, e.what()};
    }
}

auto decode_precondition_member(const nlohmann::json& j) -> Precondition {
    if (!j.contains("precondition")) return Precondition::none();
    return j.at("precondition").get<Precondition>();
}

}  // anonymous namespace

// -- Identity types -----------------------------------------------------------

void to_json(nlohmann::json& j, const Timestamp& t) {
    j = nlohmann::json{{"seconds", t.seconds}, {"nanoseconds", t.nanoseconds}};
}

void from_json(const nlohmann::json& j, Timestamp& t) {
    const auto nanoseconds = j.at("nanoseconds").get<std::int64_t>();
    if (nanoseconds < 0 || nanoseconds > 999'999'999) {
        throw Exception{ErrorKind::decoding_error,
                        "timestamp nanoseconds out of range: " + std::to_string(nanoseconds)};
    }
    t = Timestamp{j.at("seconds").get<std::int64_t>(), static_cast<std::int32_t>(nanoseconds)};
}

void to_json(nlohmann::json& j, const SnapshotVersion& v) {
    to_json(j, v.timestamp());
}

void from_json(const nlohmann::json& j, SnapshotVersion& v) {
    v = SnapshotVersion{j.get<Timestamp>()};
}

void to_json(nlohmann::json& j, const FieldPath& path) {
    j = path.segments();
}

void from_json(const nlohmann::json& j, FieldPath& path) {
    if (j.is_string()) {
        path = FieldPath::from_dot_separated(j.get<std::string>());
        return;
    }
    auto segments = j.get<std::vector<std::string>>();
    if (segments.empty()) {
        throw Exception{ErrorKind::decoding_error, "field path must have at least one segment"};
    }
    path = FieldPath{std::move(segments)};
}

void to_json(nlohmann::json& j, const DocumentKey& key) {
    j = key.to_string();
}

// -- Values -------------------------------------------------------------------

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const ServerTimestampValue& sv) {
    j = nlohmann::json{{"__type", "server_timestamp"}};
    to_json(j["local_write_time"], sv.local_write_time);
    if (sv.previous_value) {
        to_json(j["previous_value"], *sv.previous_value);
    }
}

void to_json(nlohmann::json& j, const FieldValue& value) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const Timestamp& t) {
            to_json(j, t);
            j["__type"] = "timestamp";
        },
        [&](const std::string& s) { j = s; },
        [&](const Bytes& b) {
            j = nlohmann::json{{"__type", "bytes"}, {"value", base64_encode(b)}};
        },
        [&](const ServerTimestampValue& sv) { to_json(j, sv); },
        [&](const ArrayValue& a) {
            j = nlohmann::json::array();
            for (const auto& element : a) {
                auto element_json = nlohmann::json{};
                to_json(element_json, element);
                j.push_back(std::move(element_json));
            }
        },
        [&](const ObjectValue& o) { to_json(j, o); },
    }, value.variant());
}

void from_json(const nlohmann::json& j, FieldValue& value) {
    if (j.is_object() && j.contains("__type")) {
        const auto tag = j.at("__type").get<std::string>();
        if (tag == "timestamp") {
            value = j.get<Timestamp>();
            return;
        }
        if (tag == "bytes") {
            value = base64_decode(j.at("value").get<std::string>());
            return;
        }
        if (tag == "server_timestamp") {
            auto previous = std::optional<FieldValue>{};
            if (j.contains("previous_value")) {
                previous = j.at("previous_value").get<FieldValue>();
            }
            value = ServerTimestampValue{j.at("local_write_time").get<Timestamp>(),
                                         std::move(previous)};
            return;
        }
        throw Exception{ErrorKind::decoding_error, "unknown value tag: " + tag};
    }

    switch (j.type()) {
        case nlohmann::json::value_t::null:
            value = Null{};
            return;
        case nlohmann::json::value_t::boolean:
            value = j.get<bool>();
            return;
        case nlohmann::json::value_t::number_integer:
            value = j.get<std::int64_t>();
            return;
        case nlohmann::json::value_t::number_unsigned: {
            const auto u = j.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                throw Exception{ErrorKind::decoding_error,
                                "integer out of range: " + std::to_string(u)};
            }
            value = static_cast<std::int64_t>(u);
            return;
        }
        case nlohmann::json::value_t::number_float:
            value = j.get<double>();
            return;
        case nlohmann::json::value_t::string:
            value = j.get<std::string>();
            return;
        case nlohmann::json::value_t::array: {
            auto elements = ArrayValue{};
            elements.reserve(j.size());
            for (const auto& element : j) {
                elements.push_back(element.get<FieldValue>());
            }
            value = std::move(elements);
            return;
        }
        case nlohmann::json::value_t::object:
            value = j.get<ObjectValue>();
            return;
        default:
            break;
    }
    throw Exception{ErrorKind::decoding_error,
                    std::string{"cannot convert JSON to FieldValue: "} + j.type_name()};
}

void to_json(nlohmann::json& j, const ObjectValue& object) {
    j = nlohmann::json::object();
    for (const auto& [name, value] : object.fields()) {
        to_json(j[name], value);
    }
}

void from_json(const nlohmann::json& j, ObjectValue& object) {
    if (!j.is_object()) {
        throw Exception{ErrorKind::decoding_error,
                        std::string{"expected a JSON object, got "} + j.type_name()};
    }
    auto fields = ObjectValue::Map{};
    for (const auto& [name, value] : j.items()) {
        fields.emplace(name, value.get<FieldValue>());
    }
    object = ObjectValue{std::move(fields)};
}

// -- Documents ----------------------------------------------------------------

void to_json(nlohmann::json& j, const Document& doc) {
    j = nlohmann::json{
        {"type", "document"},
        {"key", doc.key()},
        {"version", doc.version()},
        {"data", doc.data()},
        {"has_local_mutations", doc.has_local_mutations()},
    };
}

void to_json(nlohmann::json& j, const NoDocument& doc) {
    j = nlohmann::json{
        {"type", "no_document"},
        {"key", doc.key()},
        {"version", doc.version()},
    };
}

void to_json(nlohmann::json& j, const MaybeDocument& maybe_doc) {
    std::visit([&](const auto& doc) { to_json(j, doc); }, maybe_doc);
}

// -- Mutation vocabulary ------------------------------------------------------

void to_json(nlohmann::json& j, const Precondition& precondition) {
    j = nlohmann::json::object();
    if (precondition.update_time()) {
        to_json(j["update_time"], *precondition.update_time());
    }
    if (precondition.exists()) {
        j["exists"] = *precondition.exists();
    }
}

void from_json(const nlohmann::json& j, Precondition& precondition) {
    const auto has_exists = j.contains("exists");
    const auto has_update_time = j.contains("update_time");
    if (has_exists && has_update_time) {
        throw Exception{ErrorKind::decoding_error,
                        "precondition can specify \"exists\" or \"update_time\" but not both"};
    }
    if (has_exists) {
        precondition = Precondition::exists(j.at("exists").get<bool>());
    } else if (has_update_time) {
        precondition = Precondition::update_time(j.at("update_time").get<SnapshotVersion>());
    } else {
        precondition = Precondition::none();
    }
}

void to_json(nlohmann::json& j, const FieldMask& mask) {
    j = nlohmann::json::array();
    for (const auto& path : mask) {
        auto path_json = nlohmann::json{};
        to_json(path_json, path);
        j.push_back(std::move(path_json));
    }
}

void from_json(const nlohmann::json& j, FieldMask& mask) {
    mask = FieldMask{j.get<std::vector<FieldPath>>()};
}

void to_json(nlohmann::json& j, const TransformOperation& op) {
    j = std::string{to_string_view(op.type())};
}

void to_json(nlohmann::json& j, const FieldTransform& transform) {
    j = nlohmann::json::object();
    to_json(j["field"], transform.field);
    to_json(j["transform"], transform.transform);
}

void to_json(nlohmann::json& j, const MutationResult& result) {
    j = nlohmann::json::object();
    if (result.version) {
        to_json(j["version"], *result.version);
    } else {
        j["version"] = nullptr;
    }
    if (result.transform_results) {
        auto results = nlohmann::json::array();
        for (const auto& value : *result.transform_results) {
            auto value_json = nlohmann::json{};
            to_json(value_json, value);
            results.push_back(std::move(value_json));
        }
        j["transform_results"] = std::move(results);
    } else {
        j["transform_results"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, MutationResult& result) {
    result = MutationResult{};
    if (j.contains("version") && !j.at("version").is_null()) {
        result.version = j.at("version").get<SnapshotVersion>();
    }
    if (j.contains("transform_results") && !j.at("transform_results").is_null()) {
        result.transform_results = j.at("transform_results").get<std::vector<FieldValue>>();
    }
}

void to_json(nlohmann::json& j, const SetMutation& m) {
    j = nlohmann::json{
        {"type", std::string{to_string_view(m.type)}},
        {"key", m.key()},
        {"value", m.value()},
        {"precondition", m.precondition()},
    };
}

void to_json(nlohmann::json& j, const PatchMutation& m) {
    j = nlohmann::json{
        {"type", std::string{to_string_view(m.type)}},
        {"key", m.key()},
        {"data", m.data()},
        {"mask", m.field_mask()},
        {"precondition", m.precondition()},
    };
}

void to_json(nlohmann::json& j, const TransformMutation& m) {
    j = nlohmann::json{
        {"type", std::string{to_string_view(m.type)}},
        {"key", m.key()},
        {"field_transforms", m.field_transforms()},
    };
}

void to_json(nlohmann::json& j, const DeleteMutation& m) {
    j = nlohmann::json{
        {"type", std::string{to_string_view(m.type)}},
        {"key", m.key()},
        {"precondition", m.precondition()},
    };
}

void to_json(nlohmann::json& j, const Mutation& m) {
    std::visit([&](const auto& alternative) { to_json(j, alternative); }, m);
}

// =============================================================================
// Decoding
// =============================================================================

namespace json {

auto decode_document_key(const nlohmann::json& j) -> DocumentKey {
    return decoding([&] { return DocumentKey::from_path_string(j.get<std::string>()); });
}

auto decode_field_value(const nlohmann::json& j) -> FieldValue {
    return decoding([&] { return j.get<FieldValue>(); });
}

auto decode_object_value(const nlohmann::json& j) -> ObjectValue {
    return decoding([&] { return j.get<ObjectValue>(); });
}

auto decode_transform_operation(const nlohmann::json& j) -> TransformOperation {
    return decoding([&] {
        const auto name = j.get<std::string>();
        if (name == to_string_view(TransformType::server_timestamp)) {
            return TransformOperation::server_timestamp();
        }
        throw Exception{ErrorKind::decoding_error, "unknown transform: " + name};
    });
}

auto decode_field_transform(const nlohmann::json& j) -> FieldTransform {
    return decoding([&] {
        return FieldTransform{j.at("field").get<FieldPath>(),
                              decode_transform_operation(j.at("transform"))};
    });
}

auto decode_mutation_result(const nlohmann::json& j) -> MutationResult {
    return decoding([&] { return j.get<MutationResult>(); });
}

auto decode_maybe_document(const nlohmann::json& j) -> MaybeDocument {
    return decoding([&]() -> MaybeDocument {
        const auto type = j.at("type").get<std::string>();
        auto key = decode_document_key(j.at("key"));
        auto version = j.at("version").get<SnapshotVersion>();
        if (type == "document") {
            auto has_local_mutations = j.contains("has_local_mutations")
                && j.at("has_local_mutations").get<bool>();
            return Document{std::move(key), version, j.at("data").get<ObjectValue>(),
                            has_local_mutations};
        }
        if (type == "no_document") {
            return NoDocument{std::move(key), version};
        }
        throw Exception{ErrorKind::decoding_error, "unknown document type: " + type};
    });
}

auto decode_mutation(const nlohmann::json& j) -> Mutation {
    return decoding([&]() -> Mutation {
        const auto type = j.at("type").get<std::string>();
        auto key = decode_document_key(j.at("key"));

        if (type == to_string_view(MutationType::set)) {
            return SetMutation{std::move(key), j.at("value").get<ObjectValue>(),
                               decode_precondition_member(j)};
        }
        if (type == to_string_view(MutationType::patch)) {
            return PatchMutation{std::move(key), j.at("data").get<ObjectValue>(),
                                 j.at("mask").get<FieldMask>(),
                                 decode_precondition_member(j)};
        }
        if (type == to_string_view(MutationType::transform)) {
            auto transforms = std::vector<FieldTransform>{};
            for (const auto& t : j.at("field_transforms")) {
                transforms.push_back(decode_field_transform(t));
            }
            return TransformMutation{std::move(key), std::move(transforms)};
        }
        if (type == to_string_view(MutationType::del)) {
            return DeleteMutation{std::move(key), decode_precondition_member(j)};
        }
        throw Exception{ErrorKind::decoding_error, "unknown mutation type: " + type};
    });
}

}  // namespace json

}  // namespace docsync_cpp
