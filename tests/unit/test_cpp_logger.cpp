#include <gtest/gtest.h>
#include "utils/cpp_logger.h"

using namespace dantebridge::engine::logging;

class CppLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_cpp_log_level(LogLevel::DEBUG);
        drain();
    }

    void TearDown() override {
        set_cpp_log_level(LogLevel::INFO);
    }

    std::vector<LogEntry> drain() {
        std::vector<LogEntry> all;
        while (true) {
            auto batch = retrieve_log_entries(10);
            if (batch.empty()) {
                break;
            }
            all.insert(all.end(), batch.begin(), batch.end());
        }
        return all;
    }
};

TEST_F(CppLoggerTest, FormatsAndCapturesLocation) {
    LOG_CPP_INFO("[%s] found %d device(s)", "Coordinator", 3);
    const auto entries = drain();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::INFO);
    EXPECT_EQ(entries[0].message, "[Coordinator] found 3 device(s)");
    EXPECT_EQ(entries[0].filename, "test_cpp_logger.cpp");
    EXPECT_GT(entries[0].line_number, 0);
}

TEST_F(CppLoggerTest, FiltersBelowLevel) {
    set_cpp_log_level(LogLevel::WARNING);
    EXPECT_EQ(get_cpp_log_level(), LogLevel::WARNING);
    LOG_CPP_DEBUG("hidden");
    LOG_CPP_INFO("hidden");
    LOG_CPP_WARNING("shown");
    LOG_CPP_ERROR("shown too");
    const auto entries = drain();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, LogLevel::WARNING);
    EXPECT_EQ(entries[1].level, LogLevel::ERR);
}

TEST_F(CppLoggerTest, LongMessagesAreNotTruncated) {
    const std::string long_text(3000, 'x');
    LOG_CPP_INFO("%s", long_text.c_str());
    const auto entries = drain();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message.size(), 3000u);
}

TEST_F(CppLoggerTest, BatchesAreCapped) {
    for (int i = 0; i < 150; ++i) {
        LOG_CPP_DEBUG("entry %d", i);
    }
    const auto first = retrieve_log_entries(10);
    EXPECT_EQ(first.size(), 100u);
    EXPECT_EQ(drain().size(), 50u);
}

TEST_F(CppLoggerTest, OverflowDropsOldestWithSingleMarker) {
    for (int i = 0; i < 2100; ++i) {
        LOG_CPP_DEBUG("entry %d", i);
    }
    const auto entries = drain();
    int markers = 0;
    for (const auto& entry : entries) {
        if (entry.message.find("overflow") != std::string::npos) {
            ++markers;
        }
    }
    EXPECT_EQ(markers, 1);
    EXPECT_LE(entries.size(), 2049u);
    EXPECT_EQ(entries.back().message, "entry 2099");
}

TEST(CppLoggerBaseNameTest, StripsDirectories) {
    EXPECT_STREQ(get_base_filename("/a/b/c.cpp"), "c.cpp");
    EXPECT_STREQ(get_base_filename("a\\b\\d.cpp"), "d.cpp");
    EXPECT_STREQ(get_base_filename("plain.cpp"), "plain.cpp");
    EXPECT_STREQ(get_base_filename(nullptr), "");
}

TEST_F(CppLoggerTest, StderrMirrorStillQueues) {
    set_cpp_log_stderr(true);
    LOG_CPP_WARNING("mirrored %s", "entry");
    set_cpp_log_stderr(false);
    const auto entries = drain();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "mirrored entry");
}
