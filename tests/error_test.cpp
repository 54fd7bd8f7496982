#include <docsync-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace docsync_cpp;

TEST(ErrorKind, to_string_view) {
    EXPECT_EQ(to_string_view(ErrorKind::invalid_timestamp), "invalid_timestamp");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_field_path), "invalid_field_path");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_key), "invalid_key");
    EXPECT_EQ(to_string_view(ErrorKind::decoding_error), "decoding_error");
}

TEST(Error, equality) {
    const auto a = Error{ErrorKind::invalid_key, "bad key"};
    const auto b = Error{ErrorKind::invalid_key, "bad key"};
    const auto c = Error{ErrorKind::decoding_error, "bad key"};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(Exception, carries_error) {
    const auto e = Exception{ErrorKind::invalid_field_path, "empty segment"};
    EXPECT_EQ(e.kind(), ErrorKind::invalid_field_path);
    EXPECT_EQ(e.error().message, "empty segment");
    EXPECT_EQ(std::string{e.what()}, "empty segment");
}

TEST(Exception, catchable_as_runtime_error) {
    try {
        throw Exception{ErrorKind::decoding_error, "truncated"};
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string{e.what()}, "truncated");
        return;
    }
    FAIL() << "expected std::runtime_error";
}
