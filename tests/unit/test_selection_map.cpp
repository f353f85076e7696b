#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "reconciliation/selection_map.h"

using dantebridge::engine::SelectionMap;

class SelectionMapTest : public ::testing::Test {
protected:
    SelectionMap selections;
};

TEST_F(SelectionMapTest, SetAndGet) {
    selections.set("Amp", 1, "[AES67] Studio A - Left");
    std::string label;
    ASSERT_TRUE(selections.get("Amp", 1, label));
    EXPECT_EQ(label, "[AES67] Studio A - Left");
    EXPECT_FALSE(selections.get("Amp", 2, label));
    EXPECT_FALSE(selections.get("Other", 1, label));
}

TEST_F(SelectionMapTest, SetIfAbsentKeepsExisting) {
    EXPECT_TRUE(selections.set_if_absent("Amp", 1, "first"));
    EXPECT_FALSE(selections.set_if_absent("Amp", 1, "second"));
    std::string label;
    selections.get("Amp", 1, label);
    EXPECT_EQ(label, "first");
}

TEST_F(SelectionMapTest, EraseAndClear) {
    selections.set("Amp", 1, "a");
    selections.set("Amp", 2, "b");
    EXPECT_TRUE(selections.erase("Amp", 1));
    EXPECT_FALSE(selections.erase("Amp", 1));
    EXPECT_EQ(selections.size(), 1u);
    selections.clear();
    EXPECT_EQ(selections.size(), 0u);
}

TEST_F(SelectionMapTest, ConcurrentWriters) {
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([this, t]() {
            for (int ch = 0; ch < 100; ++ch) {
                selections.set("Dev" + std::to_string(t), ch, "x");
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }
    EXPECT_EQ(selections.size(), 400u);
}
