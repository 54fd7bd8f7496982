#include <docsync-cpp/types.hpp>
#include <docsync-cpp/error.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <unordered_set>
#include <vector>

using namespace docsync_cpp;

// -- Timestamp ----------------------------------------------------------------

TEST(Timestamp, default_constructed_is_epoch) {
    const auto t = Timestamp{};
    EXPECT_EQ(t.seconds, 0);
    EXPECT_EQ(t.nanoseconds, 0);
}

TEST(Timestamp, ordering_is_seconds_then_nanoseconds) {
    EXPECT_LT((Timestamp{1, 999'999'999}), (Timestamp{2, 0}));
    EXPECT_LT((Timestamp{2, 0}), (Timestamp{2, 1}));
    EXPECT_EQ((Timestamp{5, 7}), (Timestamp{5, 7}));
}

TEST(Timestamp, rejects_out_of_range_nanoseconds) {
    try {
        (void)Timestamp{1, 1'000'000'000};
        FAIL() << "expected Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_timestamp);
    }
    EXPECT_THROW((Timestamp{1, -1}), Exception);
}

TEST(Timestamp, now_is_after_epoch) {
    EXPECT_GT(Timestamp::now(), Timestamp{});
}

// -- SnapshotVersion ----------------------------------------------------------

TEST(SnapshotVersion, min_is_default) {
    EXPECT_EQ(SnapshotVersion::min(), SnapshotVersion{});
}

TEST(SnapshotVersion, deleted_doc_sentinel_differs_from_min) {
    EXPECT_NE(SnapshotVersion::for_deleted_doc(), SnapshotVersion::min());
    EXPECT_LT(SnapshotVersion::min(), SnapshotVersion::for_deleted_doc());
    EXPECT_LT(SnapshotVersion::for_deleted_doc(), (SnapshotVersion{Timestamp{1, 0}}));
}

// -- FieldPath ----------------------------------------------------------------

TEST(FieldPath, parses_dot_separated) {
    const auto path = FieldPath::from_dot_separated("a.b.c");
    EXPECT_EQ(path, (FieldPath{"a", "b", "c"}));
    EXPECT_EQ(path.size(), 3u);
    EXPECT_EQ(path.first_segment(), "a");
    EXPECT_EQ(path.last_segment(), "c");
}

TEST(FieldPath, rejects_empty_path_and_empty_segments) {
    EXPECT_THROW(FieldPath::from_dot_separated(""), Exception);
    EXPECT_THROW(FieldPath::from_dot_separated("a..b"), Exception);
    EXPECT_THROW(FieldPath::from_dot_separated(".a"), Exception);
    try {
        FieldPath::from_dot_separated("a.");
        FAIL() << "expected Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_field_path);
    }
}

TEST(FieldPath, pop_and_append) {
    const auto path = FieldPath{"a", "b", "c"};
    EXPECT_EQ(path.pop_first(), (FieldPath{"b", "c"}));
    EXPECT_EQ(path.pop_last(), (FieldPath{"a", "b"}));
    EXPECT_EQ(path.append("d"), (FieldPath{"a", "b", "c", "d"}));
    EXPECT_EQ(path.size(), 3u);
}

TEST(FieldPath, prefix) {
    const auto a = FieldPath{"a"};
    const auto ab = FieldPath{"a", "b"};
    const auto ac = FieldPath{"a", "c"};

    EXPECT_TRUE(a.is_prefix_of(ab));
    EXPECT_TRUE(ab.is_prefix_of(ab));
    EXPECT_FALSE(ab.is_prefix_of(a));
    EXPECT_FALSE(ab.is_prefix_of(ac));
    EXPECT_TRUE(FieldPath{}.is_prefix_of(a));
}

TEST(FieldPath, canonical_string_quotes_non_identifiers) {
    EXPECT_EQ((FieldPath{"a", "b_2"}).canonical_string(), "a.b_2");
    EXPECT_EQ((FieldPath{"a.b", "c"}).canonical_string(), "`a.b`.c");
    EXPECT_EQ((FieldPath{"1x"}).canonical_string(), "`1x`");
    EXPECT_EQ((FieldPath{"x`y"}).canonical_string(), "`x\\`y`");
}

TEST(FieldPath, segment_accessors_on_empty_path_abort) {
    const auto empty = FieldPath{};
    EXPECT_DEATH((void)empty.first_segment(), "empty FieldPath");
    EXPECT_DEATH((void)empty.pop_last(), "empty FieldPath");
}

TEST(FieldPath, hashable_and_sortable) {
    auto set = std::unordered_set<FieldPath>{};
    set.insert(FieldPath{"a"});
    set.insert(FieldPath{"a", "b"});
    set.insert(FieldPath{"a"});
    EXPECT_EQ(set.size(), 2u);

    auto paths = std::vector<FieldPath>{{"b"}, {"a", "b"}, {"a"}};
    std::ranges::sort(paths);
    EXPECT_EQ(paths[0], FieldPath{"a"});
    EXPECT_EQ(paths[1], (FieldPath{"a", "b"}));
    EXPECT_EQ(paths[2], FieldPath{"b"});
}

// -- ResourcePath / DocumentKey -----------------------------------------------

TEST(ResourcePath, skips_empty_segments) {
    const auto path = ResourcePath::from_string("/rooms//eros/");
    EXPECT_EQ(path.size(), 2u);
    EXPECT_EQ(path.canonical_string(), "rooms/eros");
}

TEST(DocumentKey, parses_even_length_paths) {
    const auto key = DocumentKey::from_path_string("rooms/eros/messages/1");
    EXPECT_EQ(key.path().size(), 4u);
    EXPECT_EQ(key.to_string(), "rooms/eros/messages/1");
}

TEST(DocumentKey, rejects_collection_paths) {
    EXPECT_THROW(DocumentKey::from_path_string("rooms"), Exception);
    EXPECT_THROW(DocumentKey::from_path_string(""), Exception);
    try {
        DocumentKey::from_path_string("rooms/eros/messages");
        FAIL() << "expected Exception";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_key);
    }
}

TEST(DocumentKey, equality_and_hash) {
    const auto a = DocumentKey::from_path_string("rooms/eros");
    const auto b = DocumentKey::from_path_string("rooms/eros");
    const auto c = DocumentKey::from_path_string("rooms/other");
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(std::hash<DocumentKey>{}(a), std::hash<DocumentKey>{}(b));

    auto set = std::unordered_set<DocumentKey>{a, b, c};
    EXPECT_EQ(set.size(), 2u);
}
