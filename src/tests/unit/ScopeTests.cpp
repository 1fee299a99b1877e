// File: src/tests/unit/ScopeTests.cpp
// Purpose: Verify scope lookup, depth and hoisting of function-scoped declarations.
// Key invariants: `var`-style declarations skip block scopes; lookups walk outward.
// Ownership/Lifetime: Scopes are stack objects owned by each test.
// Links: docs/codemap.md

#include <gtest/gtest.h>

#include "bundle/Scope.hpp"

using shake::bundle::Scope;

TEST(ScopeTest, DepthGrowsWithNesting)
{
    Scope root;
    Scope fn(&root);
    Scope block(&fn, true);

    EXPECT_EQ(root.depth(), 0);
    EXPECT_EQ(fn.depth(), 1);
    EXPECT_EQ(block.depth(), 2);
    EXPECT_EQ(block.parent(), &fn);
    EXPECT_TRUE(block.isBlockScope());
    EXPECT_FALSE(fn.isBlockScope());
}

TEST(ScopeTest, FunctionScopedDeclarationsLeaveBlockScopes)
{
    Scope root;
    Scope fn(&root);
    Scope block(&fn, true);

    block.addDeclaration("hoisted", nullptr, false);
    block.addDeclaration("local", nullptr, true);

    EXPECT_TRUE(fn.declaresLocally("hoisted"));
    EXPECT_FALSE(block.declaresLocally("hoisted"));
    EXPECT_TRUE(block.declaresLocally("local"));
    EXPECT_FALSE(fn.contains("local"));
    EXPECT_FALSE(root.contains("hoisted"));
}

TEST(ScopeTest, NestedBlocksForwardToNearestFunctionScope)
{
    Scope root;
    Scope outer(&root, true);
    Scope inner(&outer, true);

    inner.addDeclaration("x", nullptr, false);

    EXPECT_TRUE(root.declaresLocally("x"));
    EXPECT_EQ(inner.findDefiningScope("x"), &root);
}

TEST(ScopeTest, LookupFindsInnermostDeclaration)
{
    Scope root;
    Scope fn(&root);
    root.addDeclaration("value", nullptr, true);
    fn.addDeclaration("value", nullptr, true);

    EXPECT_EQ(fn.findDefiningScope("value"), &fn);
    EXPECT_EQ(root.findDefiningScope("value"), &root);
    EXPECT_EQ(fn.findDefiningScope("missing"), nullptr);
    EXPECT_TRUE(fn.contains("value"));
    EXPECT_FALSE(fn.contains("missing"));
}

TEST(ScopeTest, DeclaredNamesKeepInsertionOrder)
{
    Scope root;
    root.addDeclaration("b", nullptr, true);
    root.addDeclaration("a", nullptr, true);
    root.addDeclaration("b", nullptr, true);

    ASSERT_EQ(root.declaredNames().size(), 2u);
    EXPECT_EQ(root.declaredNames().names()[0], "b");
    EXPECT_EQ(root.declaredNames().names()[1], "a");
}
