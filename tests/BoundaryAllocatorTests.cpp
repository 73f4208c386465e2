/*
 * Arbor - Nested Sets Tree Storage
 * Copyright (C) 2026 Arbor Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>

#include "../src/Tree/BoundaryAllocator.hpp"

using namespace Arbor::Tree;

namespace {
    // R(1,8) A(2,5) C(3,4) B(6,7)
    constexpr Boundary R{ 1, 8 };
    constexpr Boundary A{ 2, 5 };
    constexpr Boundary C{ 3, 4 };
    constexpr Boundary B{ 6, 7 };
}

// ============================================================================
// Insertion
// ============================================================================

TEST(BoundaryAllocatorTest, InsertChildAppendsBeforeParentRight) {
    BoundaryAllocator alloc;
    auto plan = alloc.PlanInsertChild(1, 2);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->node, (Boundary{ 2, 3 }));
    ASSERT_TRUE(plan->shift.has_value());
    EXPECT_EQ(*plan->shift, (ShiftOp{ 1, 2 }));

    plan = alloc.PlanInsertChild(A.left, A.right);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->node, (Boundary{ 5, 6 }));
    EXPECT_EQ(*plan->shift, (ShiftOp{ 4, 2 }));
}

TEST(BoundaryAllocatorTest, InsertFirstChildTakesParentLeftPlusOne) {
    BoundaryAllocator alloc;
    auto plan = alloc.PlanInsertFirstChild(R.left, R.right);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->node, (Boundary{ 2, 3 }));
    EXPECT_EQ(*plan->shift, (ShiftOp{ 1, 2 }));
}

TEST(BoundaryAllocatorTest, SiblingPlansBracketTheSibling) {
    BoundaryAllocator alloc;

    auto after = alloc.PlanInsertSiblingAfter(A.left, A.right);
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(after->node, (Boundary{ 6, 7 }));
    EXPECT_EQ(*after->shift, (ShiftOp{ 5, 2 }));

    auto before = alloc.PlanInsertSiblingBefore(B.left, B.right);
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->node, (Boundary{ 6, 7 }));
    EXPECT_EQ(*before->shift, (ShiftOp{ 5, 2 }));
}

TEST(BoundaryAllocatorTest, RootFollowsRightMostBoundary) {
    BoundaryAllocator alloc;

    auto first = alloc.PlanRoot(0);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->node, (Boundary{ 1, 2 }));
    EXPECT_FALSE(first->shift.has_value());

    auto next = alloc.PlanRoot(8);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->node, (Boundary{ 9, 10 }));
}

// ============================================================================
// Deletion
// ============================================================================

TEST(BoundaryAllocatorTest, DeleteClosesGapOfSubtreeWidth) {
    BoundaryAllocator alloc;
    auto plan = alloc.PlanDelete(A.left, A.right);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->range, A);
    EXPECT_EQ(plan->shift, (ShiftOp{ 5, -4 }));

    auto leaf = alloc.PlanDelete(C.left, C.right);
    ASSERT_TRUE(leaf.has_value());
    EXPECT_EQ(leaf->shift, (ShiftOp{ 4, -2 }));
}

// ============================================================================
// Moves
// ============================================================================

TEST(BoundaryAllocatorTest, MoveLeafIntoLaterSibling) {
    BoundaryAllocator alloc;
    auto plan = alloc.PlanMove(C.left, C.right, B.left, B.right);
    ASSERT_TRUE(plan.has_value());

    EXPECT_EQ(plan->width, 2);
    EXPECT_EQ(plan->parked, C);
    EXPECT_EQ(plan->closeGap, (ShiftOp{ 4, -2 }));
    // B reads (4,5) once the gap is closed
    EXPECT_EQ(plan->destination, 5);
    EXPECT_EQ(plan->openGap, (ShiftOp{ 4, 2 }));
    EXPECT_EQ(plan->offset, 2);
    EXPECT_EQ(plan->result, (Boundary{ 5, 6 }));
}

TEST(BoundaryAllocatorTest, MoveIntoEarlierNodeKeepsTargetCoordinates) {
    BoundaryAllocator alloc;
    auto plan = alloc.PlanMove(B, A, MovePosition::LastChild);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->destination, 5);
    EXPECT_EQ(plan->offset, -1);
    EXPECT_EQ(plan->result, (Boundary{ 5, 6 }));
}

TEST(BoundaryAllocatorTest, MovePositionsSelectDestination) {
    BoundaryAllocator alloc;

    auto before = alloc.PlanMove(B, A, MovePosition::Before);
    ASSERT_TRUE(before.has_value());
    EXPECT_EQ(before->result, (Boundary{ 2, 3 }));

    auto after = alloc.PlanMove(C, A, MovePosition::After);
    ASSERT_TRUE(after.has_value());
    // A shrinks to (2,3) after C leaves, so C lands right after it
    EXPECT_EQ(after->result, (Boundary{ 4, 5 }));

    auto first = alloc.PlanMove(B, A, MovePosition::FirstChild);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->result, (Boundary{ 3, 4 }));
}

TEST(BoundaryAllocatorTest, MoveIntoOwnSubtreeIsRejected) {
    BoundaryAllocator alloc;
    TreeError err;

    EXPECT_FALSE(alloc.PlanMove(A, C, MovePosition::LastChild, &err).has_value());
    EXPECT_EQ(err.kind, TreeErrorKind::CycleRejected);

    err.Clear();
    EXPECT_FALSE(alloc.PlanMove(A, A, MovePosition::After, &err).has_value());
    EXPECT_EQ(err.kind, TreeErrorKind::CycleRejected);

    err.Clear();
    EXPECT_FALSE(alloc.PlanMove(R, B, MovePosition::Before, &err).has_value());
    EXPECT_EQ(err.kind, TreeErrorKind::CycleRejected);
}

TEST(BoundaryAllocatorTest, MoveIntoAncestorIsAllowed) {
    BoundaryAllocator alloc;
    auto plan = alloc.PlanMove(C, R, MovePosition::LastChild);
    ASSERT_TRUE(plan.has_value());
    // R reads (1,6) after the gap closes; C becomes its last child
    EXPECT_EQ(plan->result, (Boundary{ 6, 7 }));
}

// ============================================================================
// Validation / overflow
// ============================================================================

TEST(BoundaryAllocatorTest, MalformedBoundariesAreInvalidArguments) {
    BoundaryAllocator alloc;
    TreeError err;

    EXPECT_FALSE(alloc.PlanInsertChild(0, 2, &err).has_value());
    EXPECT_EQ(err.kind, TreeErrorKind::InvalidArgument);

    err.Clear();
    EXPECT_FALSE(alloc.PlanDelete(5, 5, &err).has_value());
    EXPECT_EQ(err.kind, TreeErrorKind::InvalidArgument);

    err.Clear();
    EXPECT_FALSE(alloc.PlanRoot(-1, &err).has_value());
    EXPECT_EQ(err.kind, TreeErrorKind::InvalidArgument);

    err.Clear();
    EXPECT_FALSE(alloc.PlanMove(Boundary{ 4, 3 }, A, MovePosition::Before, &err).has_value());
    EXPECT_EQ(err.kind, TreeErrorKind::InvalidArgument);
}

TEST(BoundaryAllocatorTest, OverflowIsDetectedAgainstConfiguredMaximum) {
    BoundaryAllocator alloc(6);
    TreeError err;

    EXPECT_TRUE(alloc.PlanRoot(4).has_value());
    EXPECT_FALSE(alloc.PlanRoot(5, &err).has_value());
    EXPECT_EQ(err.kind, TreeErrorKind::BoundaryOverflow);

    err.Clear();
    EXPECT_FALSE(alloc.PlanInsertChild(1, 6, &err).has_value());
    EXPECT_EQ(err.kind, TreeErrorKind::BoundaryOverflow);

    EXPECT_TRUE(alloc.CheckCapacity(4, 2));
    err.Clear();
    EXPECT_FALSE(alloc.CheckCapacity(5, 2, &err));
    EXPECT_EQ(err.kind, TreeErrorKind::BoundaryOverflow);
}

TEST(BoundaryAllocatorTest, DefaultMaximumIsTwoToTheSixtySecond) {
    BoundaryAllocator alloc;
    EXPECT_EQ(alloc.MaxBoundary(), int64_t{ 4611686018427387904 });
    EXPECT_TRUE(alloc.CheckCapacity(kMaxBoundary - 2, 2));
    EXPECT_FALSE(alloc.CheckCapacity(kMaxBoundary - 1, 2));
}

// ============================================================================
// Relationships
// ============================================================================

TEST(BoundaryAllocatorTest, AncestorRelationships) {
    EXPECT_TRUE(IsAncestorOf(R, C));
    EXPECT_TRUE(IsAncestorOf(A, C));
    EXPECT_FALSE(IsAncestorOf(B, C));
    EXPECT_FALSE(IsAncestorOf(A, A));
    EXPECT_TRUE(IsAncestorOf(A, A, true));

    EXPECT_TRUE(IsDescendantOf(C, R));
    EXPECT_FALSE(IsDescendantOf(R, C));
    EXPECT_TRUE(IsDescendantOf(B, B, true));
}

TEST(BoundaryAllocatorTest, WidthCountsBothBoundariesOfEveryNode) {
    EXPECT_EQ(Width(R), 8);
    EXPECT_EQ(Width(A), 4);
    EXPECT_EQ(Width(C), 2);
}
