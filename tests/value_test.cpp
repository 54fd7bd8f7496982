#include <docsync-cpp/value.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

using namespace docsync_cpp;

// -- FieldValue ---------------------------------------------------------------

TEST(FieldValue, default_is_null) {
    const auto v = FieldValue{};
    EXPECT_EQ(v.type(), FieldValueType::null);
    EXPECT_TRUE(v.is<Null>());
}

TEST(FieldValue, type_tracks_alternative) {
    EXPECT_EQ(FieldValue{true}.type(), FieldValueType::boolean);
    EXPECT_EQ(FieldValue{42}.type(), FieldValueType::integer);
    EXPECT_EQ(FieldValue{std::int64_t{42}}.type(), FieldValueType::integer);
    EXPECT_EQ(FieldValue{1.5}.type(), FieldValueType::floating);
    EXPECT_EQ((FieldValue{Timestamp{1, 0}}).type(), FieldValueType::timestamp);
    EXPECT_EQ(FieldValue{"text"}.type(), FieldValueType::string);
    EXPECT_EQ(FieldValue{Bytes{std::byte{1}}}.type(), FieldValueType::bytes);
    EXPECT_EQ(FieldValue{ServerTimestampValue{}}.type(), FieldValueType::server_timestamp);
    EXPECT_EQ((FieldValue{ArrayValue{1, 2}}).type(), FieldValueType::array);
    EXPECT_EQ(FieldValue{ObjectValue{}}.type(), FieldValueType::object);
}

TEST(FieldValue, integer_and_double_are_distinct) {
    EXPECT_NE(FieldValue{1}, FieldValue{1.0});
}

TEST(FieldValue, any_integer_width_is_an_integer) {
    const auto expected = FieldValue{std::int64_t{7}};
    EXPECT_EQ(FieldValue{short{7}}, expected);
    EXPECT_EQ(FieldValue{std::uint32_t{7}}, expected);
    EXPECT_EQ(FieldValue{7L}, expected);
    EXPECT_EQ(FieldValue{7LL}, expected);
    EXPECT_EQ(FieldValue{std::size_t{7}}, expected);
    EXPECT_EQ(FieldValue{std::uint32_t{7}}.type(), FieldValueType::integer);
    EXPECT_EQ(FieldValue{true}.type(), FieldValueType::boolean);
}

TEST(FieldValue, nan_equals_nan) {
    const auto nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(FieldValue{nan}, FieldValue{nan});
    EXPECT_NE(FieldValue{nan}, FieldValue{0.0});
}

TEST(FieldValue, arrays_compare_elementwise) {
    EXPECT_EQ((FieldValue{ArrayValue{1, "a"}}), (FieldValue{ArrayValue{1, "a"}}));
    EXPECT_NE((FieldValue{ArrayValue{1, "a"}}), (FieldValue{ArrayValue{"a", 1}}));
}

TEST(FieldValue, get_if) {
    const auto v = FieldValue{"hello"};
    ASSERT_NE(v.get_if<std::string>(), nullptr);
    EXPECT_EQ(*v.get_if<std::string>(), "hello");
    EXPECT_EQ(v.get_if<std::int64_t>(), nullptr);
}

TEST(FieldValueType, to_string_view) {
    EXPECT_EQ(to_string_view(FieldValueType::server_timestamp), "server_timestamp");
    EXPECT_EQ(to_string_view(FieldValueType::object), "object");
}

// -- ServerTimestampValue -----------------------------------------------------

TEST(ServerTimestampValue, keeps_previous_value) {
    const auto sv = ServerTimestampValue{Timestamp{10, 0}, FieldValue{7}};
    ASSERT_TRUE(sv.previous().has_value());
    EXPECT_EQ(*sv.previous(), FieldValue{7});
    EXPECT_EQ(sv.local_write_time, (Timestamp{10, 0}));
}

TEST(ServerTimestampValue, equality_includes_previous_value) {
    const auto t = Timestamp{10, 0};
    EXPECT_EQ((ServerTimestampValue{t, std::nullopt}), (ServerTimestampValue{t, std::nullopt}));
    EXPECT_EQ((ServerTimestampValue{t, FieldValue{1}}), (ServerTimestampValue{t, FieldValue{1}}));
    EXPECT_NE((ServerTimestampValue{t, FieldValue{1}}), (ServerTimestampValue{t, std::nullopt}));
    EXPECT_NE((ServerTimestampValue{t, FieldValue{1}}), (ServerTimestampValue{t, FieldValue{2}}));
    EXPECT_NE((ServerTimestampValue{t, std::nullopt}),
              (ServerTimestampValue{Timestamp{11, 0}, std::nullopt}));
}

// -- ObjectValue --------------------------------------------------------------

TEST(ObjectValue, empty_has_no_fields) {
    EXPECT_TRUE(ObjectValue::empty().is_empty());
    EXPECT_EQ(ObjectValue::empty().size(), 0u);
    EXPECT_EQ(ObjectValue::empty(), ObjectValue{});
    EXPECT_EQ(ObjectValue::empty(), ObjectValue{ObjectValue::Map{}});
}

TEST(ObjectValue, field_reads_nested_values) {
    const auto data = make_object({
        {"a", 1},
        {"nested", make_object({{"b", "x"}})},
    });

    EXPECT_EQ(data.field(FieldPath{"a"}), FieldValue{1});
    EXPECT_EQ(data.field(FieldPath{"nested", "b"}), FieldValue{"x"});
    EXPECT_FALSE(data.field(FieldPath{"missing"}).has_value());
    EXPECT_FALSE(data.field(FieldPath{"a", "b"}).has_value());
    EXPECT_FALSE(data.field(FieldPath{}).has_value());
}

TEST(ObjectValue, set_leaves_original_untouched) {
    const auto original = make_object({{"a", 1}});
    const auto updated = original.set(FieldPath{"b"}, FieldValue{2});

    EXPECT_EQ(original, make_object({{"a", 1}}));
    EXPECT_EQ(updated, make_object({{"a", 1}, {"b", 2}}));
}

TEST(ObjectValue, set_creates_intermediate_objects) {
    const auto data = ObjectValue::empty().set(FieldPath{"a", "b", "c"}, FieldValue{true});
    EXPECT_EQ(data.field(FieldPath{"a", "b", "c"}), FieldValue{true});
    EXPECT_EQ(data.field(FieldPath{"a", "b"}), FieldValue{make_object({{"c", true}})});
}

TEST(ObjectValue, set_replaces_non_object_intermediate) {
    const auto data = make_object({{"a", 5}}).set(FieldPath{"a", "b"}, FieldValue{1});
    EXPECT_EQ(data, make_object({{"a", make_object({{"b", 1}})}}));
}

TEST(ObjectValue, set_overwrites_existing_value) {
    const auto data = make_object({{"a", make_object({{"b", 1}, {"c", 2}})}})
        .set(FieldPath{"a", "b"}, FieldValue{"new"});
    EXPECT_EQ(data, make_object({{"a", make_object({{"b", "new"}, {"c", 2}})}}));
}

TEST(ObjectValue, remove_top_level_and_nested) {
    const auto data = make_object({
        {"a", 1},
        {"nested", make_object({{"b", 2}, {"c", 3}})},
    });

    EXPECT_EQ(data.remove(FieldPath{"a"}),
              make_object({{"nested", make_object({{"b", 2}, {"c", 3}})}}));
    EXPECT_EQ(data.remove(FieldPath{"nested", "b"}),
              make_object({{"a", 1}, {"nested", make_object({{"c", 3}})}}));
}

TEST(ObjectValue, remove_missing_path_is_noop) {
    const auto data = make_object({{"a", 1}});
    EXPECT_EQ(data.remove(FieldPath{"b"}), data);
    EXPECT_EQ(data.remove(FieldPath{"b", "c"}), data);
    EXPECT_EQ(data.remove(FieldPath{"a", "c"}), data);
}

TEST(ObjectValue, empty_path_aborts) {
    const auto data = make_object({{"a", 1}});
    EXPECT_DEATH((void)data.set(FieldPath{}, FieldValue{1}), "empty path");
    EXPECT_DEATH((void)data.remove(FieldPath{}), "empty path");
}
