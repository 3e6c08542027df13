/**
 * @file dag_format_tests.cpp
 * @brief Unit tests for cycle path rendering.
 */
#include <gtest/gtest.h>
#include "dagorder/common/dag_format.hpp"

using namespace dagorder;

TEST(DagFormatTests, Branch_JoinedAndClosed)
{
    NodeIdList branch{"A", "B", "C"};
    EXPECT_EQ(format_cycle_path(branch.cbegin(), branch.cend(), "A"), "A -> B -> C -> A");
}

TEST(DagFormatTests, SingleNode_SelfLoop)
{
    NodeIdList branch{"a"};
    EXPECT_EQ(format_cycle_path(branch.cbegin(), branch.cend(), "a"), "a -> a");
}

TEST(DagFormatTests, SubRange_StartsMidBranch)
{
    NodeIdList branch{"a", "b", "c"};
    EXPECT_EQ(format_cycle_path(branch.cbegin() + 1, branch.cend(), "b"), "b -> c -> b");
}
