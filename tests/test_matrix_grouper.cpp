#include "matrix_grouper.h"
#include "test_helpers.h"

#include <gtest/gtest.h>
#include <string>

using namespace klepcbgen;
using klepcbgen::test_support::parse_layout;
using klepcbgen::test_support::grouped_layout;

// n rows of `keys` 1u keys each
static std::string rows_of_keys(int n, int keys = 1) {
    std::string text = "[";
    for (int r = 0; r < n; r++) {
        if (r > 0) text += ",";
        text += "[";
        for (int k = 0; k < keys; k++) {
            if (k > 0) text += ",";
            text += "\"K\"";
        }
        text += "]";
    }
    return text + "]";
}

TEST(MatrixGrouper, SequentialSingleRow) {
    Keyboard keyboard = grouped_layout(R"([["Q","W","E"]])");
    ASSERT_EQ(keyboard.keys.size(), 3u);
    for (int i = 0; i < 3; i++) {
        EXPECT_EQ(keyboard.keys[i].row, 0);
        EXPECT_EQ(keyboard.keys[i].col, i);
    }
    ASSERT_EQ(keyboard.rows.size(), 1);
    EXPECT_EQ(keyboard.rows.block(0), (std::vector<int>{0, 1, 2}));
    ASSERT_EQ(keyboard.columns.size(), 3);
    EXPECT_EQ(keyboard.columns.block(1), (std::vector<int>{1}));
}

TEST(MatrixGrouper, SequentialOrdersByX) {
    // Second key is moved back to the left of the first one
    Keyboard keyboard = grouped_layout(R"([[{"x":2},"A",{"x":-3},"B"]])");
    ASSERT_EQ(keyboard.keys.size(), 2u);
    EXPECT_EQ(keyboard.keys[0].col, 1);
    EXPECT_EQ(keyboard.keys[1].col, 0);
    EXPECT_EQ(keyboard.rows.block(0), (std::vector<int>{1, 0}));
}

TEST(MatrixGrouper, SequentialIgnoresGaps) {
    Keyboard keyboard = grouped_layout(R"([["A",{"x":3},"B"]])");
    EXPECT_EQ(keyboard.keys[0].col, 0);
    EXPECT_EQ(keyboard.keys[1].col, 1);
}

TEST(MatrixGrouper, TallKeyStaysInItsRow) {
    Keyboard keyboard = grouped_layout(R"([["A",{"h":2},"Enter"],["B"]])");
    EXPECT_EQ(keyboard.keys[0].row, 0);
    EXPECT_EQ(keyboard.keys[1].row, 0);
    EXPECT_EQ(keyboard.keys[2].row, 1);
}

TEST(MatrixGrouper, RowsWithinCapacity) {
    Keyboard keyboard = grouped_layout(rows_of_keys(MAX_ROWS, 3));
    EXPECT_EQ(keyboard.rows.size(), MAX_ROWS);
    for (auto& key : keyboard.keys) {
        EXPECT_GE(key.row, 0);
        EXPECT_LT(key.row, MAX_ROWS);
    }
    for (auto& row : keyboard.rows.blocks()) {
        EXPECT_LT(static_cast<int>(row.size()), MAX_COLS);
    }
}

TEST(MatrixGrouper, TooManyRows) {
    Keyboard keyboard = parse_layout(rows_of_keys(8));
    MatrixGrouper grouper;
    EXPECT_FALSE(grouper.group(keyboard));
    EXPECT_EQ(grouper.error(), GroupingError::TOO_MANY_ROWS);
    EXPECT_NE(grouper.message().find("too many rows"), std::string::npos);
    EXPECT_TRUE(keyboard.rows.empty());
    EXPECT_TRUE(keyboard.columns.empty());
}

TEST(MatrixGrouper, KeyAboveFirstRow) {
    Keyboard keyboard = parse_layout(R"([[{"y":-1},"A"]])");
    MatrixGrouper grouper;
    EXPECT_FALSE(grouper.group(keyboard));
    EXPECT_EQ(grouper.error(), GroupingError::TOO_MANY_ROWS);
}

TEST(MatrixGrouper, SequentialTooManyColumns) {
    Keyboard keyboard = parse_layout(rows_of_keys(1, MAX_COLS));
    MatrixGrouper grouper;
    EXPECT_FALSE(grouper.group(keyboard));
    EXPECT_EQ(grouper.error(), GroupingError::TOO_MANY_COLUMNS);
    EXPECT_NE(grouper.message().find("too many columns"), std::string::npos);
}

TEST(MatrixGrouper, SequentialWidestRow) {
    Keyboard keyboard = grouped_layout(rows_of_keys(1, MAX_COLS - 1));
    EXPECT_EQ(keyboard.columns.size(), MAX_COLS - 1);
}

TEST(MatrixGrouper, PositionalKeepsGaps) {
    Keyboard keyboard = grouped_layout(R"([["A",{"x":2},"B"]])", ColumnPolicy::POSITIONAL);
    ASSERT_EQ(keyboard.keys.size(), 2u);
    EXPECT_DOUBLE_EQ(keyboard.keys[0].x_unit, 0.5);
    EXPECT_DOUBLE_EQ(keyboard.keys[1].x_unit, 3.5);
    EXPECT_EQ(keyboard.keys[0].col, 0);
    EXPECT_EQ(keyboard.keys[1].col, 3);
    ASSERT_EQ(keyboard.columns.size(), 4);
    EXPECT_TRUE(keyboard.columns.block(1).empty());
    EXPECT_TRUE(keyboard.columns.block(2).empty());
}

TEST(MatrixGrouper, PositionalColumnsFollowRows) {
    Keyboard keyboard = grouped_layout(R"([["A","B"],[{"x":1},"C"],["D"]])",
                                       ColumnPolicy::POSITIONAL);
    ASSERT_EQ(keyboard.keys.size(), 4u);
    EXPECT_EQ(keyboard.keys[2].col, 1);
    EXPECT_EQ(keyboard.columns.block(0), (std::vector<int>{0, 3}));
    EXPECT_EQ(keyboard.columns.block(1), (std::vector<int>{1, 2}));
    EXPECT_EQ(keyboard.rows.block(1), (std::vector<int>{2}));
}

TEST(MatrixGrouper, PositionalRowsKeepParseOrder) {
    Keyboard keyboard = grouped_layout(R"([[{"x":2},"A",{"x":-3},"B"]])",
                                       ColumnPolicy::POSITIONAL);
    EXPECT_EQ(keyboard.rows.block(0), (std::vector<int>{0, 1}));
    EXPECT_EQ(keyboard.keys[0].col, 2);
    EXPECT_EQ(keyboard.keys[1].col, 0);
}

TEST(MatrixGrouper, PositionalTooManyColumns) {
    Keyboard keyboard = parse_layout(R"([[{"x":18},"A"]])");
    GroupingOptions opts;
    opts.policy = ColumnPolicy::POSITIONAL;
    MatrixGrouper grouper(opts);
    EXPECT_FALSE(grouper.group(keyboard));
    EXPECT_EQ(grouper.error(), GroupingError::TOO_MANY_COLUMNS);
}

TEST(MatrixGrouper, FarOffRowIsRowOverflow) {
    Keyboard keyboard = parse_layout(R"([[{"y":1e300},"A"]])");
    MatrixGrouper grouper;
    EXPECT_FALSE(grouper.group(keyboard));
    EXPECT_EQ(grouper.error(), GroupingError::TOO_MANY_ROWS);
    EXPECT_NE(grouper.message().find("1e+300"), std::string::npos);
}

TEST(MatrixGrouper, PositionalFarOffColumnIsColumnOverflow) {
    Keyboard keyboard = parse_layout(R"([[{"x":5e9},"A"]])");
    GroupingOptions opts;
    opts.policy = ColumnPolicy::POSITIONAL;
    MatrixGrouper grouper(opts);
    EXPECT_FALSE(grouper.group(keyboard));
    EXPECT_EQ(grouper.error(), GroupingError::TOO_MANY_COLUMNS);
    EXPECT_TRUE(keyboard.columns.empty());
}

TEST(MatrixGrouper, FailedRowsLeaveKeysUntouched) {
    // Rows 0-6 fit, the eighth row does not
    Keyboard keyboard = parse_layout(rows_of_keys(8, 2));
    for (auto& key : keyboard.keys) {
        key.row = -1;
        key.col = -1;
    }
    MatrixGrouper grouper;
    EXPECT_FALSE(grouper.group(keyboard));
    for (auto& key : keyboard.keys) {
        EXPECT_EQ(key.row, -1);
        EXPECT_EQ(key.col, -1);
    }
}

TEST(MatrixGrouper, FailedColumnsLeaveKeysUntouched) {
    Keyboard keyboard = parse_layout(R"([["A","B",{"x":20},"C"]])");
    for (auto& key : keyboard.keys) {
        key.row = -1;
        key.col = -1;
    }
    GroupingOptions opts;
    opts.policy = ColumnPolicy::POSITIONAL;
    MatrixGrouper grouper(opts);
    EXPECT_FALSE(grouper.group(keyboard));
    EXPECT_EQ(grouper.error(), GroupingError::TOO_MANY_COLUMNS);
    for (auto& key : keyboard.keys) {
        EXPECT_EQ(key.row, -1);
        EXPECT_EQ(key.col, -1);
    }
    EXPECT_TRUE(keyboard.rows.empty());
}

TEST(MatrixGrouper, ErrorClearedOnSuccess) {
    MatrixGrouper grouper;
    Keyboard bad = parse_layout(rows_of_keys(8));
    EXPECT_FALSE(grouper.group(bad));

    Keyboard good = parse_layout(rows_of_keys(2));
    EXPECT_TRUE(grouper.group(good));
    EXPECT_EQ(grouper.error(), GroupingError::NONE);
    EXPECT_TRUE(grouper.message().empty());
}
