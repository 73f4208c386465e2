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
#include "TreeView.hpp"

namespace Arbor {
    namespace Tree {

        size_t TreeNodeView::Size() const noexcept {
            size_t total = 1;
            for (const auto& child : children) {
                total += child.Size();
            }
            return total;
        }

        bool BuildTreeView(const NodeRow& root, const std::vector<NodeRow>& descendants,
                           TreeNodeView& out, TreeError* err)
        {
            out = TreeNodeView{};
            out.row = root;
            out.depth = 0;

            // Stack holds the open ancestors of the next row. A node's address is
            // stable while it is on the stack: its parent only gains children
            // after the node has been popped.
            std::vector<TreeNodeView*> stack{ &out };
            int64_t previousLeft = root.handle.boundary.left;

            for (const auto& row : descendants) {
                const Boundary& b = row.handle.boundary;

                if (!IsAncestorOf(root.handle.boundary, b) || b.left <= previousLeft) {
                    SetTreeError(err, TreeErrorKind::InvalidArgument,
                        "Row #" + std::to_string(row.handle.id) + " is not an ordered descendant of #" +
                        std::to_string(root.handle.id), "BuildTreeView");
                    return false;
                }
                previousLeft = b.left;

                while (b.left > stack.back()->row.handle.boundary.right) {
                    stack.pop_back();
                }

                TreeNodeView* parent = stack.back();
                TreeNodeView child;
                child.row = row;
                child.depth = parent->depth + 1;
                parent->children.push_back(std::move(child));
                stack.push_back(&parent->children.back());
            }

            return true;
        }

        bool BuildForestView(const std::vector<NodeRow>& rows,
                             std::vector<TreeNodeView>& out, TreeError* err)
        {
            out.clear();

            size_t i = 0;
            while (i < rows.size()) {
                const NodeRow& root = rows[i];
                std::vector<NodeRow> descendants;

                size_t j = i + 1;
                while (j < rows.size() && IsAncestorOf(root.handle.boundary, rows[j].handle.boundary)) {
                    descendants.push_back(rows[j]);
                    ++j;
                }

                TreeNodeView view;
                if (!BuildTreeView(root, descendants, view, err)) {
                    out.clear();
                    return false;
                }
                out.push_back(std::move(view));
                i = j;
            }

            return true;
        }

        namespace {
            void renderNode(const TreeNodeView& node, const NodeLabeler& labeler,
                            const std::string& indent, std::string& out)
            {
                for (int64_t d = 0; d < node.depth; ++d) {
                    out += indent;
                }
                out += labeler(node.row);
                out += '\n';

                for (const auto& child : node.children) {
                    renderNode(child, labeler, indent, out);
                }
            }
        } // anonymous namespace

        std::string RenderOutline(const std::vector<TreeNodeView>& forest,
                                  const NodeLabeler& labeler,
                                  const std::string& indent)
        {
            const NodeLabeler effective = labeler ? labeler : [](const NodeRow& row) {
                return "#" + std::to_string(row.handle.id) + " [" +
                    std::to_string(row.handle.boundary.left) + ", " +
                    std::to_string(row.handle.boundary.right) + "]";
            };

            std::string out;
            for (const auto& root : forest) {
                renderNode(root, effective, indent, out);
            }
            return out;
        }

    } // namespace Tree
} // namespace Arbor
