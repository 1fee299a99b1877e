// File: src/tests/unit/EditBufferTests.cpp
// Purpose: Verify deferred overwrite, insert, remove and append edits on windows of a shared text.
// Key invariants: Edits never touch the original text; partial overlaps are rejected.
// Ownership/Lifetime: Buffers are value objects owned by each test.
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "edit/EditBuffer.hpp"

using shake::edit::EditBuffer;

TEST(EditBufferTest, OverwriteAndRemove)
{
    EditBuffer buffer("hello world");
    ASSERT_TRUE(buffer.overwrite(0, 5, "HELLO").hasValue());
    ASSERT_TRUE(buffer.remove(5, 6).hasValue());
    EXPECT_EQ(buffer.toString(), "HELLOworld");
    EXPECT_EQ(buffer.original(), "hello world");
}

TEST(EditBufferTest, InsertBeforeCharacterAndAppend)
{
    EditBuffer buffer("a + b");
    ASSERT_TRUE(buffer.insert(0, "(").hasValue());
    ASSERT_TRUE(buffer.insert(4, "c * ").hasValue());
    buffer.append(";");
    EXPECT_EQ(buffer.toString(), "(a + c * b;");
}

TEST(EditBufferTest, SnipSharesTextButNotEdits)
{
    EditBuffer buffer("var a = 1;\nvar b = 2;\n");
    ASSERT_TRUE(buffer.overwrite(4, 5, "x").hasValue());

    EditBuffer second = buffer.snip(11, 21);
    EXPECT_EQ(second.start(), 11u);
    EXPECT_EQ(second.end(), 21u);
    EXPECT_EQ(second.toString(), "var b = 2;");
    ASSERT_TRUE(second.overwrite(15, 16, "y").hasValue());
    EXPECT_EQ(second.toString(), "var y = 2;");
    EXPECT_EQ(buffer.toString(), "var x = 1;\nvar b = 2;\n");
}

TEST(EditBufferTest, EditsOutsideWindowFail)
{
    EditBuffer buffer = EditBuffer("0123456789").snip(2, 6);
    EXPECT_FALSE(buffer.overwrite(0, 3, "x").hasValue());
    EXPECT_FALSE(buffer.insert(6, "x").hasValue());
    EXPECT_TRUE(buffer.insert(5, "x").hasValue());
    EXPECT_EQ(buffer.toString(), "234x5");
}

TEST(EditBufferTest, PartialOverlapIsRejected)
{
    EditBuffer buffer("abcdefgh");
    ASSERT_TRUE(buffer.overwrite(2, 5, "X").hasValue());
    EXPECT_FALSE(buffer.overwrite(4, 7, "Y").hasValue());
    EXPECT_FALSE(buffer.overwrite(0, 3, "Y").hasValue());
    EXPECT_FALSE(buffer.insert(3, "!").hasValue());
    EXPECT_EQ(buffer.toString(), "abXfgh");
}

TEST(EditBufferTest, ContainingOverwriteSupersedesEarlierEdits)
{
    EditBuffer buffer("hello world");
    ASSERT_TRUE(buffer.overwrite(1, 3, "E").hasValue());
    ASSERT_TRUE(buffer.insert(4, "?").hasValue());
    ASSERT_TRUE(buffer.overwrite(0, 6, "Y").hasValue());
    EXPECT_EQ(buffer.toString(), "Yworld");
}

TEST(EditBufferTest, AdjacentEditsCompose)
{
    EditBuffer buffer("export var x = 1;");
    ASSERT_TRUE(buffer.overwrite(7, 12, "exports.x").hasValue());
    ASSERT_TRUE(buffer.remove(0, 7).hasValue());
    EXPECT_EQ(buffer.toString(), "exports.x = 1;");
}

TEST(EditBufferTest, CloneIsIndependent)
{
    EditBuffer buffer("abc");
    EditBuffer copy = buffer.clone();
    ASSERT_TRUE(copy.overwrite(0, 1, "z").hasValue());
    EXPECT_EQ(copy.toString(), "zbc");
    EXPECT_EQ(buffer.toString(), "abc");
}

TEST(EditBufferTest, EmptyRangeOverwriteWithTextFails)
{
    EditBuffer buffer("abc");
    EXPECT_FALSE(buffer.overwrite(1, 1, "x").hasValue());
    EXPECT_TRUE(buffer.overwrite(1, 1, "").hasValue());
    EXPECT_EQ(buffer.toString(), "abc");
}

TEST(EditBufferTest, SourcemapLocationsAreRecorded)
{
    EditBuffer buffer("abc");
    buffer.addSourcemapLocation(2);
    buffer.addSourcemapLocation(0);
    buffer.addSourcemapLocation(2);
    ASSERT_EQ(buffer.sourcemapLocations().size(), 2u);
    EXPECT_EQ(*buffer.sourcemapLocations().begin(), 0u);
}
