#include "keyboard_model.h"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace klepcbgen;

TEST(KeyBlockCollection, CreatesMissingBlocks) {
    KeyBlockCollection blocks;
    EXPECT_TRUE(blocks.empty());

    blocks.add_key_to_block(2, 7);
    ASSERT_EQ(blocks.size(), 3);
    EXPECT_TRUE(blocks.block(0).empty());
    EXPECT_TRUE(blocks.block(1).empty());
    ASSERT_EQ(blocks.block(2).size(), 1u);
    EXPECT_EQ(blocks.block(2)[0], 7);
}

TEST(KeyBlockCollection, KeepsInsertionOrder) {
    KeyBlockCollection blocks;
    blocks.add_key_to_block(0, 5);
    blocks.add_key_to_block(0, 1);
    blocks.add_key_to_block(0, 3);
    EXPECT_EQ(blocks.block(0), (std::vector<int>{5, 1, 3}));
}

TEST(KeyBlockCollection, RejectsBadIndices) {
    KeyBlockCollection blocks;
    EXPECT_THROW(blocks.add_key_to_block(-1, 0), std::out_of_range);
    EXPECT_THROW(blocks.block(0), std::out_of_range);
    blocks.add_key_to_block(0, 0);
    EXPECT_THROW(blocks.block(1), std::out_of_range);
}

TEST(Keyboard, Summary) {
    Keyboard keyboard;
    keyboard.name = "Macropad";
    keyboard.author = "someone";
    keyboard.keys.resize(4);
    keyboard.add_key_to_row(0, 0);
    keyboard.add_key_to_row(0, 1);
    keyboard.add_key_to_row(1, 2);
    keyboard.add_key_to_row(1, 3);
    keyboard.add_key_to_col(0, 0);
    keyboard.add_key_to_col(1, 1);
    keyboard.add_key_to_col(0, 2);
    keyboard.add_key_to_col(1, 3);

    EXPECT_EQ(keyboard.summary(),
              "Keyboard information:\n"
              "Name: Macropad\n"
              "Author: someone\n"
              "Contains: 4 keys, grouped into 2 rows and 2 columns\n");
}
