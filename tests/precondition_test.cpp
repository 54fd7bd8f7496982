#include <docsync-cpp/precondition.hpp>

#include <gtest/gtest.h>

#include <optional>

using namespace docsync_cpp;

namespace {

auto test_key() -> DocumentKey { return DocumentKey::from_path_string("rooms/eros"); }
auto version(std::int64_t seconds) -> SnapshotVersion {
    return SnapshotVersion{Timestamp{seconds, 0}};
}
auto existing(std::int64_t seconds) -> std::optional<MaybeDocument> {
    return Document{test_key(), version(seconds), make_object({{"a", 1}})};
}
auto deleted(std::int64_t seconds) -> std::optional<MaybeDocument> {
    return NoDocument{test_key(), version(seconds)};
}

const auto unknown = std::optional<MaybeDocument>{};

}  // namespace

// -- Construction -------------------------------------------------------------

TEST(Precondition, default_is_none) {
    EXPECT_EQ(Precondition{}, Precondition::none());
    EXPECT_TRUE(Precondition{}.is_none());
    EXPECT_EQ(Precondition{}.type(), PreconditionType::none);
}

TEST(Precondition, factories_set_one_field) {
    const auto e = Precondition::exists(true);
    EXPECT_EQ(e.type(), PreconditionType::exists);
    EXPECT_EQ(e.exists(), std::optional<bool>{true});
    EXPECT_FALSE(e.update_time().has_value());

    const auto u = Precondition::update_time(version(3));
    EXPECT_EQ(u.type(), PreconditionType::update_time);
    EXPECT_EQ(u.update_time(), std::optional<SnapshotVersion>{version(3)});
    EXPECT_FALSE(u.exists().has_value());
}

TEST(Precondition, equality) {
    EXPECT_EQ(Precondition::exists(true), Precondition::exists(true));
    EXPECT_NE(Precondition::exists(true), Precondition::exists(false));
    EXPECT_NE(Precondition::exists(true), Precondition::none());
    EXPECT_EQ(Precondition::update_time(version(3)), Precondition::update_time(version(3)));
    EXPECT_NE(Precondition::update_time(version(3)), Precondition::update_time(version(4)));
    EXPECT_NE(Precondition::exists(true), Precondition::update_time(version(3)));
    EXPECT_NE(Precondition::exists(false), Precondition::update_time(SnapshotVersion::min()));
}

TEST(PreconditionType, to_string_view) {
    EXPECT_EQ(to_string_view(PreconditionType::none), "none");
    EXPECT_EQ(to_string_view(PreconditionType::exists), "exists");
    EXPECT_EQ(to_string_view(PreconditionType::update_time), "update_time");
}

// -- is_valid_for -------------------------------------------------------------

TEST(Precondition, none_always_holds) {
    const auto p = Precondition::none();
    EXPECT_TRUE(p.is_valid_for(existing(3)));
    EXPECT_TRUE(p.is_valid_for(deleted(3)));
    EXPECT_TRUE(p.is_valid_for(unknown));
}

TEST(Precondition, exists_true_requires_document) {
    const auto p = Precondition::exists(true);
    EXPECT_TRUE(p.is_valid_for(existing(3)));
    EXPECT_FALSE(p.is_valid_for(deleted(3)));
    EXPECT_FALSE(p.is_valid_for(unknown));
}

TEST(Precondition, exists_false_accepts_missing_or_deleted) {
    const auto p = Precondition::exists(false);
    EXPECT_FALSE(p.is_valid_for(existing(3)));
    EXPECT_TRUE(p.is_valid_for(deleted(3)));
    EXPECT_TRUE(p.is_valid_for(unknown));
}

TEST(Precondition, update_time_requires_document_at_exact_version) {
    const auto p = Precondition::update_time(version(3));
    EXPECT_TRUE(p.is_valid_for(existing(3)));
    EXPECT_FALSE(p.is_valid_for(existing(4)));
    EXPECT_FALSE(p.is_valid_for(deleted(3)));
    EXPECT_FALSE(p.is_valid_for(unknown));
}
