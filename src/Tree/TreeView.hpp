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

#include "NodeTypes.hpp"
#include "TreeError.hpp"

#include <functional>
#include <string>
#include <vector>

namespace Arbor {
    namespace Tree {

        /**
         * @brief In-memory node of a materialized subtree.
         */
        struct TreeNodeView {
            NodeRow row;
            int64_t depth = 0;                  ///< Relative to the view's root
            std::vector<TreeNodeView> children; ///< Ordered by left boundary

            /// @brief Number of nodes in this view, including itself.
            size_t Size() const noexcept;
        };

        /**
         * @brief Nests pre-ordered descendants under their root.
         *
         * @param root Subtree root
         * @param descendants Every descendant of root, ordered by left boundary
         * @return false with InvalidArgument if a row falls outside root or
         *         the input is not ordered
         */
        bool BuildTreeView(const NodeRow& root, const std::vector<NodeRow>& descendants,
                           TreeNodeView& out, TreeError* err = nullptr);

        /**
         * @brief Groups rows ordered by left boundary into one view per root.
         */
        bool BuildForestView(const std::vector<NodeRow>& rows,
                             std::vector<TreeNodeView>& out, TreeError* err = nullptr);

        using NodeLabeler = std::function<std::string(const NodeRow&)>;

        /**
         * @brief Renders an indented outline, one line per node, in pre-order.
         *
         * Default labeler prints "#<id> [left, right]".
         */
        std::string RenderOutline(const std::vector<TreeNodeView>& forest,
                                  const NodeLabeler& labeler = {},
                                  const std::string& indent = "    ");

    } // namespace Tree
} // namespace Arbor
