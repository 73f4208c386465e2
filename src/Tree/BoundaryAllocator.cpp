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
#include "BoundaryAllocator.hpp"

#include <string>

namespace Arbor {
    namespace Tree {

        const char* MovePositionToString(MovePosition position) noexcept {
            switch (position) {
            case MovePosition::LastChild:  return "LastChild";
            case MovePosition::FirstChild: return "FirstChild";
            case MovePosition::Before:     return "Before";
            case MovePosition::After:      return "After";
            }
            return "Unknown";
        }

        bool IsAncestorOf(const Boundary& a, const Boundary& b, bool inclusive) noexcept {
            if (inclusive) {
                return a.left <= b.left && b.right <= a.right;
            }
            return a.left < b.left && b.right < a.right;
        }

        // ============================================================================
        // Validation
        // ============================================================================

        bool BoundaryAllocator::validate(int64_t left, int64_t right, const char* context, TreeError* err) const {
            if (left < 1 || left >= right) {
                SetTreeError(err, TreeErrorKind::InvalidArgument,
                    "Invalid boundary pair (" + std::to_string(left) + ", " + std::to_string(right) + ")",
                    context);
                return false;
            }
            if (right > m_maxBoundary) {
                SetTreeError(err, TreeErrorKind::BoundaryOverflow,
                    "Boundary " + std::to_string(right) + " exceeds maximum " + std::to_string(m_maxBoundary),
                    context);
                return false;
            }
            return true;
        }

        bool BoundaryAllocator::fits(int64_t value, const char* context, TreeError* err) const {
            if (value > m_maxBoundary) {
                SetTreeError(err, TreeErrorKind::BoundaryOverflow,
                    "Boundary " + std::to_string(value) + " exceeds maximum " + std::to_string(m_maxBoundary),
                    context);
                return false;
            }
            return true;
        }

        bool BoundaryAllocator::CheckCapacity(int64_t currentMaxRight, int64_t growth, TreeError* err) const {
            if (currentMaxRight < 0 || growth < 0) {
                SetTreeError(err, TreeErrorKind::InvalidArgument, "Negative capacity query", "CheckCapacity");
                return false;
            }
            // Written as a subtraction so the check itself cannot overflow
            if (currentMaxRight > m_maxBoundary - growth) {
                SetTreeError(err, TreeErrorKind::BoundaryOverflow,
                    "Growing right-most boundary " + std::to_string(currentMaxRight) + " by " +
                    std::to_string(growth) + " exceeds maximum " + std::to_string(m_maxBoundary),
                    "CheckCapacity");
                return false;
            }
            return true;
        }

        // ============================================================================
        // Insertion
        // ============================================================================

        std::optional<InsertPlan> BoundaryAllocator::PlanInsertChild(
            int64_t parentLeft, int64_t parentRight, TreeError* err) const
        {
            if (!validate(parentLeft, parentRight, "PlanInsertChild", err)) return std::nullopt;
            if (!fits(parentRight + 2, "PlanInsertChild", err)) return std::nullopt;

            InsertPlan plan;
            plan.node = { parentRight, parentRight + 1 };
            plan.shift = ShiftOp{ parentRight - 1, 2 };
            return plan;
        }

        std::optional<InsertPlan> BoundaryAllocator::PlanInsertFirstChild(
            int64_t parentLeft, int64_t parentRight, TreeError* err) const
        {
            if (!validate(parentLeft, parentRight, "PlanInsertFirstChild", err)) return std::nullopt;
            if (!fits(parentRight + 2, "PlanInsertFirstChild", err)) return std::nullopt;

            InsertPlan plan;
            plan.node = { parentLeft + 1, parentLeft + 2 };
            plan.shift = ShiftOp{ parentLeft, 2 };
            return plan;
        }

        std::optional<InsertPlan> BoundaryAllocator::PlanInsertSiblingAfter(
            int64_t siblingLeft, int64_t siblingRight, TreeError* err) const
        {
            if (!validate(siblingLeft, siblingRight, "PlanInsertSiblingAfter", err)) return std::nullopt;
            if (!fits(siblingRight + 2, "PlanInsertSiblingAfter", err)) return std::nullopt;

            InsertPlan plan;
            plan.node = { siblingRight + 1, siblingRight + 2 };
            plan.shift = ShiftOp{ siblingRight, 2 };
            return plan;
        }

        std::optional<InsertPlan> BoundaryAllocator::PlanInsertSiblingBefore(
            int64_t siblingLeft, int64_t siblingRight, TreeError* err) const
        {
            if (!validate(siblingLeft, siblingRight, "PlanInsertSiblingBefore", err)) return std::nullopt;
            if (!fits(siblingRight + 2, "PlanInsertSiblingBefore", err)) return std::nullopt;

            InsertPlan plan;
            plan.node = { siblingLeft, siblingLeft + 1 };
            plan.shift = ShiftOp{ siblingLeft - 1, 2 };
            return plan;
        }

        std::optional<InsertPlan> BoundaryAllocator::PlanRoot(int64_t currentMaxRight, TreeError* err) const {
            if (currentMaxRight < 0) {
                SetTreeError(err, TreeErrorKind::InvalidArgument,
                    "Negative right-most boundary " + std::to_string(currentMaxRight), "PlanRoot");
                return std::nullopt;
            }
            if (!CheckCapacity(currentMaxRight, 2, err)) {
                if (err) err->context = "PlanRoot";
                return std::nullopt;
            }

            InsertPlan plan;
            plan.node = { currentMaxRight + 1, currentMaxRight + 2 };
            return plan;
        }

        // ============================================================================
        // Deletion
        // ============================================================================

        std::optional<DeletePlan> BoundaryAllocator::PlanDelete(
            int64_t nodeLeft, int64_t nodeRight, TreeError* err) const
        {
            if (!validate(nodeLeft, nodeRight, "PlanDelete", err)) return std::nullopt;

            DeletePlan plan;
            plan.range = { nodeLeft, nodeRight };
            plan.shift = ShiftOp{ nodeRight, -(nodeRight - nodeLeft + 1) };
            return plan;
        }

        // ============================================================================
        // Moves
        // ============================================================================

        std::optional<MovePlan> BoundaryAllocator::PlanMove(
            int64_t subtreeLeft, int64_t subtreeRight,
            int64_t newParentLeft, int64_t newParentRight,
            TreeError* err) const
        {
            return PlanMove(Boundary{ subtreeLeft, subtreeRight },
                            Boundary{ newParentLeft, newParentRight },
                            MovePosition::LastChild, err);
        }

        std::optional<MovePlan> BoundaryAllocator::PlanMove(
            const Boundary& subtree, const Boundary& target, MovePosition position,
            TreeError* err) const
        {
            if (!validate(subtree.left, subtree.right, "PlanMove", err)) return std::nullopt;
            if (!validate(target.left, target.right, "PlanMove", err)) return std::nullopt;

            if (subtree.left <= target.left && target.left <= subtree.right) {
                SetTreeError(err, TreeErrorKind::CycleRejected,
                    std::string("Cannot move a subtree ") + MovePositionToString(position) +
                    " a node inside itself", "PlanMove");
                return std::nullopt;
            }

            MovePlan plan;
            plan.parked = subtree;
            plan.width = Width(subtree);
            plan.closeGap = ShiftOp{ subtree.right, -plan.width };

            // Target boundaries as they read after the gap is closed
            auto adjust = [&](int64_t value) {
                return value > subtree.right ? value - plan.width : value;
            };
            const int64_t targetLeft = adjust(target.left);
            const int64_t targetRight = adjust(target.right);

            switch (position) {
            case MovePosition::LastChild:
                plan.destination = targetRight;
                break;
            case MovePosition::FirstChild:
                plan.destination = targetLeft + 1;
                break;
            case MovePosition::Before:
                plan.destination = targetLeft;
                break;
            case MovePosition::After:
                plan.destination = targetRight + 1;
                break;
            }

            plan.openGap = ShiftOp{ plan.destination - 1, plan.width };
            plan.offset = plan.destination - subtree.left;
            plan.result = { plan.destination, plan.destination + plan.width - 1 };

            if (!fits(plan.result.right, "PlanMove", err)) return std::nullopt;
            return plan;
        }

    } // namespace Tree
} // namespace Arbor
