#include <docsync-cpp/log.hpp>
#include <docsync-cpp/mutation.hpp>

#include <gtest/gtest.h>

#include <cstdlib>

using namespace docsync_cpp;

namespace {

VerboseFlag test_flag("log_test");
VerboseFlag other_flag("log_test_other");

class VerboseLoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("DOCSYNC_VERBOSE_LOGGING");
        reset_verbose_logging();
    }
    void TearDown() override {
        unsetenv("DOCSYNC_VERBOSE_LOGGING");
        reset_verbose_logging();
    }
};

}  // namespace

TEST_F(VerboseLoggingTest, flags_are_off_by_default) {
    EXPECT_FALSE(test_flag.enabled());
    EXPECT_FALSE(static_cast<bool>(other_flag));
    EXPECT_EQ(test_flag.name(), "log_test");
}

TEST_F(VerboseLoggingTest, set_enables_single_flag) {
    set_verbose_logging("log_test", true);
    EXPECT_TRUE(test_flag.enabled());
    EXPECT_FALSE(other_flag.enabled());

    set_verbose_logging("log_test", false);
    EXPECT_FALSE(test_flag.enabled());
}

TEST_F(VerboseLoggingTest, all_enables_every_flag) {
    set_verbose_logging("all", true);
    EXPECT_TRUE(test_flag.enabled());
    EXPECT_TRUE(other_flag.enabled());

    set_verbose_logging("log_test", false);
    EXPECT_FALSE(test_flag.enabled());
    EXPECT_TRUE(other_flag.enabled());
}

TEST_F(VerboseLoggingTest, environment_lists_flags) {
    setenv("DOCSYNC_VERBOSE_LOGGING", "unrelated,log_test_other", 1);
    reset_verbose_logging();
    EXPECT_FALSE(test_flag.enabled());
    EXPECT_TRUE(other_flag.enabled());
}

TEST_F(VerboseLoggingTest, environment_all) {
    setenv("DOCSYNC_VERBOSE_LOGGING", "all", 1);
    reset_verbose_logging();
    EXPECT_TRUE(test_flag.enabled());
    EXPECT_TRUE(other_flag.enabled());
}

TEST_F(VerboseLoggingTest, reset_discards_runtime_overrides) {
    set_verbose_logging("log_test", true);
    reset_verbose_logging();
    EXPECT_FALSE(test_flag.enabled());
}

TEST_F(VerboseLoggingTest, mutation_logging_does_not_change_results) {
    set_verbose_logging("mutation", true);
    const auto key = DocumentKey::from_path_string("rooms/eros");
    const auto m = DeleteMutation{key, Precondition::exists(true)};
    const auto unknown = std::optional<MaybeDocument>{};

    EXPECT_EQ(m.apply_to_local_view(unknown, unknown, Timestamp{}), unknown);
    EXPECT_EQ(m.apply_to_remote_document(unknown, MutationResult{}),
              (std::optional<MaybeDocument>{NoDocument{key, SnapshotVersion::min()}}));
}
