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
 * @file NestedSet.hpp
 * @brief Typed façade over NestedSetStore.
 *
 * A record type opts in by specializing RecordTraits:
 *
 * @code
 *   struct Category { std::string name; int64_t priority = 0; };
 *
 *   template <>
 *   struct Arbor::Tree::RecordTraits<Category> {
 *       static TableMapping Mapping();
 *       static Attributes ToAttributes(const Category& c);
 *       static Category FromAttributes(const Attributes& attrs);
 *   };
 *
 *   NestedSet<Category> categories(db);
 *   categories.Initialize(&err);
 *   auto root = categories.CreateRoot(Category{ "Electronics" }, &err);
 * @endcode
 */

#include "NestedSetStore.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace Arbor {
    namespace Tree {

        /// Specialize for every record stored in a nested-set table.
        template <typename Record>
        struct RecordTraits;

        template <typename Record>
        struct TreeNode {
            NodeHandle handle;
            Record record;
        };

        template <typename Record, typename Traits = RecordTraits<Record>>
        class NestedSet {
        public:
            using Node = TreeNode<Record>;
            using NodeList = std::vector<Node>;

            explicit NestedSet(Database::DatabaseManager& db, NestedSetOptions options = {})
                : m_store(db, Traits::Mapping(), std::move(options))
            {
            }

            bool Initialize(TreeError* err = nullptr) { return m_store.Initialize(err); }
            bool CreateSchema(TreeError* err = nullptr) { return m_store.CreateSchema(err); }

            // === Insertion ===

            std::optional<Node> CreateRoot(const Record& record, TreeError* err = nullptr) {
                return toNode(m_store.CreateRoot(Traits::ToAttributes(record), err));
            }

            std::optional<Node> AddChild(const NodeHandle& parent, const Record& record, TreeError* err = nullptr) {
                return toNode(m_store.AddChild(parent, Traits::ToAttributes(record), err));
            }

            std::optional<Node> AddFirstChild(const NodeHandle& parent, const Record& record, TreeError* err = nullptr) {
                return toNode(m_store.AddFirstChild(parent, Traits::ToAttributes(record), err));
            }

            std::optional<Node> AddSibling(const NodeHandle& sibling, const Record& record, TreeError* err = nullptr) {
                return toNode(m_store.AddSibling(sibling, Traits::ToAttributes(record), err));
            }

            std::optional<Node> AddSiblingBefore(const NodeHandle& sibling, const Record& record, TreeError* err = nullptr) {
                return toNode(m_store.AddSiblingBefore(sibling, Traits::ToAttributes(record), err));
            }

            std::optional<Node> Insert(const NodeHandle& anchor, MovePosition position, const Record& record,
                                       TreeError* err = nullptr)
            {
                return toNode(m_store.Insert(anchor, position, Traits::ToAttributes(record), err));
            }

            /// @brief Appends records as the last children of parent, all or nothing.
            std::optional<NodeList> AddChildren(const NodeHandle& parent, const std::vector<Record>& records,
                                                TreeError* err = nullptr)
            {
                std::vector<Attributes> children;
                children.reserve(records.size());
                for (const auto& record : records) {
                    children.push_back(Traits::ToAttributes(record));
                }
                return toNodes(m_store.AddChildren(parent, children, err));
            }

            // === Deletion / moves / updates ===

            bool DeleteSubtree(NodeHandle& node, TreeError* err = nullptr) {
                return m_store.DeleteSubtree(node, err);
            }

            bool Move(NodeHandle& node, const NodeHandle& target, MovePosition position, TreeError* err = nullptr) {
                return m_store.Move(node, target, position, err);
            }

            bool MoveSubtree(NodeHandle& node, const NodeHandle& newParent, TreeError* err = nullptr) {
                return m_store.MoveSubtree(node, newParent, err);
            }

            bool MoveBefore(NodeHandle& node, const NodeHandle& target, TreeError* err = nullptr) {
                return m_store.MoveBefore(node, target, err);
            }

            bool MoveAfter(NodeHandle& node, const NodeHandle& target, TreeError* err = nullptr) {
                return m_store.MoveAfter(node, target, err);
            }

            bool MoveInside(NodeHandle& node, const NodeHandle& target, TreeError* err = nullptr) {
                return m_store.MoveInside(node, target, err);
            }

            /// @brief Writes node.record back to its row.
            bool Save(const Node& node, TreeError* err = nullptr) {
                return m_store.UpdateAttributes(node.handle, Traits::ToAttributes(node.record), err);
            }

            // === Reads ===

            std::optional<Node> GetNode(int64_t id, TreeError* err = nullptr) {
                return toNode(m_store.GetNode(id, err));
            }

            bool Refresh(NodeHandle& node, TreeError* err = nullptr) {
                return m_store.Refresh(node, err);
            }

            std::optional<NodeList> AncestorsOf(const NodeHandle& node, TreeError* err = nullptr) {
                return toNodes(m_store.AncestorsOf(node, err));
            }

            std::optional<NodeList> DescendantsOf(const NodeHandle& node, TreeError* err = nullptr) {
                return toNodes(m_store.DescendantsOf(node, err));
            }

            std::optional<NodeList> ChildrenOf(const NodeHandle& node, TreeError* err = nullptr) {
                return toNodes(m_store.ChildrenOf(node, err));
            }

            bool ParentOf(const NodeHandle& node, std::optional<Node>& parent, TreeError* err = nullptr) {
                std::optional<NodeRow> row;
                if (!m_store.ParentOf(node, row, err)) {
                    parent.reset();
                    return false;
                }
                parent = toNode(std::move(row));
                return true;
            }

            std::optional<int64_t> DepthOf(const NodeHandle& node, TreeError* err = nullptr) {
                return m_store.DepthOf(node, err);
            }

            std::optional<NodeList> Roots(TreeError* err = nullptr) {
                return toNodes(m_store.Roots(err));
            }

            /// @brief Every row of the table, ordered by left boundary.
            std::optional<NodeList> AllNodes(TreeError* err = nullptr) {
                return toNodes(m_store.AllNodes(err));
            }

            std::optional<TreeNodeView> BuildTree(const NodeHandle& node, TreeError* err = nullptr) {
                return m_store.BuildTree(node, err);
            }

            std::optional<std::string> RenderForest(TreeError* err = nullptr) {
                return m_store.RenderForest(err);
            }

            bool CheckInvariants(std::vector<std::string>& issues, TreeError* err = nullptr) {
                return m_store.CheckInvariants(issues, err);
            }

            NestedSetStore& Store() noexcept { return m_store; }

            static Record ToRecord(const NodeRow& row) { return Traits::FromAttributes(row.attributes); }

        private:
            static std::optional<Node> toNode(std::optional<NodeRow>&& row) {
                if (!row) return std::nullopt;
                return Node{ std::move(row->handle), Traits::FromAttributes(row->attributes) };
            }

            static std::optional<NodeList> toNodes(std::optional<std::vector<NodeRow>>&& rows) {
                if (!rows) return std::nullopt;

                NodeList nodes;
                nodes.reserve(rows->size());
                for (auto& row : *rows) {
                    nodes.push_back(Node{ std::move(row.handle), Traits::FromAttributes(row.attributes) });
                }
                return nodes;
            }

            NestedSetStore m_store;
        };

    } // namespace Tree
} // namespace Arbor
