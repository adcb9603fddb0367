#include <gtest/gtest.h>

#include "errors.hpp"
#include "label_table.hpp"

TEST(LabelTableTest, DefineAndResolve) {
    LabelTable table;
    table.define("loop", 2);
    table.define("done", 5);

    EXPECT_EQ(table.resolve("loop"), 2);
    EXPECT_EQ(table.resolve("done"), 5);
    EXPECT_TRUE(table.contains("loop"));
    EXPECT_FALSE(table.contains("start"));
    EXPECT_EQ(table.size(), 2u);
}

TEST(LabelTableTest, DuplicateDefinitionThrows) {
    LabelTable table;
    table.define("x", 0);
    EXPECT_THROW(table.define("x", 3), DuplicateLabelError);
    EXPECT_EQ(table.resolve("x"), 0);
}

TEST(LabelTableTest, UnknownNameThrows) {
    LabelTable table;
    EXPECT_THROW(table.resolve("nowhere"), UndefinedLabelError);
}

TEST(LabelTableTest, NamesAreCaseSensitive) {
    LabelTable table;
    table.define("Loop", 1);
    table.define("loop", 2);
    EXPECT_EQ(table.resolve("Loop"), 1);
    EXPECT_EQ(table.resolve("loop"), 2);
}

TEST(LabelTableTest, ClearEmptiesTable) {
    LabelTable table;
    table.define("a", 1);
    table.clear();
    EXPECT_EQ(table.size(), 0u);
    EXPECT_NO_THROW(table.define("a", 4));
}
