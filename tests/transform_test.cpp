#include <docsync-cpp/transform.hpp>

#include <gtest/gtest.h>

#include <optional>

using namespace docsync_cpp;

TEST(TransformOperation, server_timestamps_are_equal) {
    EXPECT_EQ(TransformOperation::server_timestamp(), TransformOperation::server_timestamp());
    EXPECT_EQ(TransformOperation::server_timestamp().type(), TransformType::server_timestamp);
    EXPECT_EQ(to_string_view(TransformType::server_timestamp), "server_timestamp");
}

TEST(FieldTransform, equality) {
    const auto a = FieldTransform{FieldPath{"t"}, TransformOperation::server_timestamp()};
    const auto b = FieldTransform{FieldPath{"t"}, TransformOperation::server_timestamp()};
    const auto c = FieldTransform{FieldPath{"u"}, TransformOperation::server_timestamp()};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(TransformResult, local_server_timestamp_records_write_time_and_previous) {
    const auto write_time = Timestamp{100, 5};
    const auto result = local_transform_result(TransformOperation::server_timestamp(),
                                               FieldValue{"old"}, write_time);

    const auto* sv = result.get_if<ServerTimestampValue>();
    ASSERT_NE(sv, nullptr);
    EXPECT_EQ(sv->local_write_time, write_time);
    EXPECT_EQ(sv->previous(), FieldValue{"old"});
}

TEST(TransformResult, local_server_timestamp_without_previous) {
    const auto result = local_transform_result(TransformOperation::server_timestamp(),
                                               std::nullopt, Timestamp{100, 0});
    EXPECT_EQ(result, (FieldValue{ServerTimestampValue{Timestamp{100, 0}, std::nullopt}}));
}

TEST(TransformResult, remote_server_timestamp_uses_backend_value) {
    const auto committed = FieldValue{Timestamp{200, 0}};
    const auto result = remote_transform_result(TransformOperation::server_timestamp(),
                                                FieldValue{"old"}, committed);
    EXPECT_EQ(result, committed);
}

TEST(TransformResult, unknown_transform_aborts) {
    const auto bogus = TransformOperation{static_cast<TransformType>(7)};
    EXPECT_DEATH(local_transform_result(bogus, std::nullopt, Timestamp{}),
                 "unknown transform");
    EXPECT_DEATH(remote_transform_result(bogus, std::nullopt, FieldValue{}),
                 "unknown transform");
}
