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
#pragma once

/**
 * ============================================================================
 * Arbor BoundaryAllocator - HEADER
 * ============================================================================
 *
 * @file BoundaryAllocator.hpp
 * @brief Pure planning of nested-set boundary changes.
 *
 * Every structural mutation of a nested-set tree reduces to a handful of
 * "shift" primitives: add an amount to every left and every right boundary
 * strictly greater than a threshold. The allocator computes those shifts and
 * the boundaries of the affected node; it performs no I/O.
 *
 * Boundary Layout Example:
 * ------------------------
 *
 *          R(1,8)
 *         /      \
 *      A(2,5)   B(6,7)
 *        |
 *      C(3,4)
 *
 *   Insert last child under B  ->  node (7,8), shift {6, +2}
 *   Delete A                   ->  range [2,5], shift {5, -4}
 *
 * Move Plan (four steps, applied in order inside one transaction):
 * ---------------------------------------------------------------
 *   1. Park     : negate boundaries of rows inside [subtreeLeft, subtreeRight]
 *   2. Close gap: shift {subtreeRight, -width}
 *   3. Open gap : shift {destination - 1, +width}
 *   4. Unpark   : rows with negative left get -value + (destination - subtreeLeft)
 *
 * ============================================================================
 */

#include "TreeError.hpp"

#include <cstdint>
#include <optional>

namespace Arbor {
    namespace Tree {

        /// Largest boundary value any plan may produce (2^62).
        inline constexpr int64_t kMaxBoundary = int64_t{ 1 } << 62;

        /**
         * @brief A node's interval in the nested-set numbering.
         */
        struct Boundary {
            int64_t left = 0;
            int64_t right = 0;

            bool operator==(const Boundary& other) const noexcept {
                return left == other.left && right == other.right;
            }
            bool operator!=(const Boundary& other) const noexcept { return !(*this == other); }
        };

        /**
         * @brief "Add amount to every left and right strictly greater than threshold".
         */
        struct ShiftOp {
            int64_t threshold = 0;
            int64_t amount = 0;

            bool operator==(const ShiftOp& other) const noexcept {
                return threshold == other.threshold && amount == other.amount;
            }
        };

        struct InsertPlan {
            Boundary node;                  ///< Boundaries of the new node
            std::optional<ShiftOp> shift;   ///< Absent for a new root
        };

        struct DeletePlan {
            Boundary range;                 ///< Every row with left and right inside is removed
            ShiftOp shift;                  ///< Closes the gap left behind
        };

        enum class MovePosition : uint8_t {
            LastChild,   ///< Inside the target, after its existing children
            FirstChild,  ///< Inside the target, before its existing children
            Before,      ///< Immediately left of the target, same parent
            After        ///< Immediately right of the target, same parent
        };

        [[nodiscard]] const char* MovePositionToString(MovePosition position) noexcept;

        struct MovePlan {
            Boundary parked;                ///< Original interval of the moved subtree
            int64_t width = 0;              ///< subtreeRight - subtreeLeft + 1
            ShiftOp closeGap;
            ShiftOp openGap;
            int64_t destination = 0;        ///< New left boundary of the subtree root
            int64_t offset = 0;             ///< destination - subtreeLeft
            Boundary result;                ///< New interval of the subtree root
        };

        // ============================================================================
        // Relationship helpers
        // ============================================================================

        /// @brief a.left < b.left && b.right < a.right (or <= when inclusive)
        [[nodiscard]] bool IsAncestorOf(const Boundary& a, const Boundary& b, bool inclusive = false) noexcept;

        [[nodiscard]] inline bool IsDescendantOf(const Boundary& a, const Boundary& b, bool inclusive = false) noexcept {
            return IsAncestorOf(b, a, inclusive);
        }

        /// @brief right - left + 1, always 2 * (1 + descendants) in a valid tree
        [[nodiscard]] inline int64_t Width(const Boundary& b) noexcept {
            return b.right - b.left + 1;
        }

        // ============================================================================
        // BoundaryAllocator
        // ============================================================================

        /**
         * @brief Stateless planner for inserts, deletes and moves.
         *
         * The maximum boundary is a constructor argument so tests can exercise
         * overflow without building 2^62 rows.
         */
        class BoundaryAllocator {
        public:
            explicit BoundaryAllocator(int64_t maxBoundary = kMaxBoundary) noexcept
                : m_maxBoundary(maxBoundary) {}

            int64_t MaxBoundary() const noexcept { return m_maxBoundary; }

            // === Insertion ===

            /// @brief New node becomes the last child: (parentRight, parentRight + 1).
            [[nodiscard]] std::optional<InsertPlan> PlanInsertChild(
                int64_t parentLeft, int64_t parentRight, TreeError* err = nullptr) const;

            /// @brief New node becomes the first child: (parentLeft + 1, parentLeft + 2).
            [[nodiscard]] std::optional<InsertPlan> PlanInsertFirstChild(
                int64_t parentLeft, int64_t parentRight, TreeError* err = nullptr) const;

            [[nodiscard]] std::optional<InsertPlan> PlanInsertSiblingAfter(
                int64_t siblingLeft, int64_t siblingRight, TreeError* err = nullptr) const;

            [[nodiscard]] std::optional<InsertPlan> PlanInsertSiblingBefore(
                int64_t siblingLeft, int64_t siblingRight, TreeError* err = nullptr) const;

            /// @brief New root after the right-most boundary (0 for an empty table).
            [[nodiscard]] std::optional<InsertPlan> PlanRoot(
                int64_t currentMaxRight, TreeError* err = nullptr) const;

            // === Deletion ===

            [[nodiscard]] std::optional<DeletePlan> PlanDelete(
                int64_t nodeLeft, int64_t nodeRight, TreeError* err = nullptr) const;

            // === Moves ===

            /// @brief Moves the subtree to become the last child of the new parent.
            [[nodiscard]] std::optional<MovePlan> PlanMove(
                int64_t subtreeLeft, int64_t subtreeRight,
                int64_t newParentLeft, int64_t newParentRight,
                TreeError* err = nullptr) const;

            [[nodiscard]] std::optional<MovePlan> PlanMove(
                const Boundary& subtree, const Boundary& target, MovePosition position,
                TreeError* err = nullptr) const;

            // === Capacity ===

            /**
             * @brief Verifies that growing the tree by `growth` keeps every boundary in range.
             *
             * Insert plans only know the local boundaries; the caller passes
             * the current right-most boundary of the table here.
             */
            [[nodiscard]] bool CheckCapacity(int64_t currentMaxRight, int64_t growth, TreeError* err = nullptr) const;

        private:
            bool validate(int64_t left, int64_t right, const char* context, TreeError* err) const;
            bool fits(int64_t value, const char* context, TreeError* err) const;

            int64_t m_maxBoundary;
        };

    } // namespace Tree
} // namespace Arbor
