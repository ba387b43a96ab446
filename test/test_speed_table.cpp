#include <gtest/gtest.h>
#include "SpeedTable.h"

TEST(SpeedTableTest, DefaultsStartOnNormalSpeed) {
    SpeedTable table;
    EXPECT_EQ(table.size(), 3u);
    EXPECT_EQ(table.currentIndex(), 1u);
    EXPECT_EQ(table.current(), 4u);
}

TEST(SpeedTableTest, CycleWrapsToFirstEntry) {
    SpeedTable table({13, 4, 1}, 1);
    table.cycle();
    EXPECT_EQ(table.current(), 1u);
    table.cycle();
    EXPECT_EQ(table.current(), 13u);
    EXPECT_EQ(table.currentIndex(), 0u);
}

TEST(SpeedTableTest, SelectMovesIndexToMatchingEntry) {
    SpeedTable table({13, 4, 1}, 1);
    EXPECT_TRUE(table.select(1));
    EXPECT_EQ(table.currentIndex(), 2u);
}

TEST(SpeedTableTest, SelectUnknownIntervalLeavesIndex) {
    SpeedTable table({13, 4, 1}, 1);
    EXPECT_FALSE(table.select(7));
    EXPECT_EQ(table.currentIndex(), 1u);
}

TEST(SpeedTableTest, InvalidListsFallBackToDefaults) {
    EXPECT_FALSE(SpeedTable::isValid({13, 4}));
    EXPECT_FALSE(SpeedTable::isValid({13, 0, 1}));
    EXPECT_FALSE(SpeedTable::isValid({13, 4, 4}));
    EXPECT_TRUE(SpeedTable::isValid({20, 10, 5, 2}));

    SpeedTable table({4, 4, 4}, 0);
    EXPECT_EQ(table.at(0), 13u);
    EXPECT_EQ(table.at(1), 4u);
    EXPECT_EQ(table.at(2), 1u);
}

TEST(SpeedTableTest, OutOfRangeIndexIsClamped) {
    SpeedTable table({20, 10, 5}, 9);
    EXPECT_EQ(table.currentIndex(), 0u);
    EXPECT_EQ(table.current(), 20u);
}
