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
 * Arbor NestedSetStore - HEADER
 * ============================================================================
 *
 * @file NestedSetStore.hpp
 * @brief Tree operations over a nested-sets table.
 *
 * Every structural mutation runs in one BEGIN IMMEDIATE transaction:
 *
 *   1. Re-read the boundaries of the referenced node(s) by id
 *   2. Ask the BoundaryAllocator for a plan
 *   3. Apply the plan as bulk range UPDATEs plus one INSERT/DELETE
 *   4. Commit (the RAII transaction rolls back on any early return)
 *
 * Reads run in a DEFERRED transaction so multi-statement reads observe one
 * snapshot. Rows are handled untyped (Attributes); see NestedSet.hpp for the
 * typed wrapper.
 *
 * Usage Example:
 * --------------
 * @code
 *   TableMapping mapping;
 *   mapping.table = "categories";
 *   mapping.attributes = { { "name", ColumnType::Text, false } };
 *
 *   NestedSetStore store(db, mapping);
 *   TreeError err;
 *   if (!store.Initialize(&err)) { ... }
 *
 *   auto root = store.CreateRoot({ { "name", std::string("Electronics") } }, &err);
 *   auto tv   = store.AddChild(root->handle, { { "name", std::string("TV") } }, &err);
 * @endcode
 *
 * ============================================================================
 */

#include "BoundaryAllocator.hpp"
#include "NodeTypes.hpp"
#include "TableMapping.hpp"
#include "TreeError.hpp"
#include "TreeView.hpp"
#include "../Database/DatabaseManager.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Arbor {
    namespace Tree {

        /**
         * @brief Behavioural options of a NestedSetStore.
         */
        struct NestedSetOptions {
            int64_t maxBoundary = kMaxBoundary;     ///< Upper bound for any boundary value
            bool createSchemaOnInitialize = true;   ///< Run CreateSchema() from Initialize(), else require an existing table
            bool verifyAfterMutation = false;       ///< Run CheckInvariants before each commit
            std::string renderIndent = "    ";      ///< Indentation unit used by RenderForest

            [[nodiscard]] bool IsValid() const noexcept { return maxBoundary >= 2; }
        };

        class NestedSetStore {
        public:
            NestedSetStore(Database::DatabaseManager& db, TableMapping mapping, NestedSetOptions options = {});
            ~NestedSetStore() = default;

            NestedSetStore(const NestedSetStore&) = delete;
            NestedSetStore& operator=(const NestedSetStore&) = delete;

            /**
             * @brief Validates the mapping and, if configured, creates the table.
             *
             * Every other operation fails with InvalidState until this succeeds.
             */
            bool Initialize(TreeError* err = nullptr);
            bool IsInitialized() const noexcept { return m_initialized.load(); }

            /// @brief CREATE TABLE / CREATE INDEX IF NOT EXISTS for the mapping.
            bool CreateSchema(TreeError* err = nullptr);

            // ========================================================================
            // Insertion
            // ========================================================================

            std::optional<NodeRow> CreateRoot(const Attributes& attrs, TreeError* err = nullptr);

            /// @brief Appends a new node as the last child of parent.
            std::optional<NodeRow> AddChild(const NodeHandle& parent, const Attributes& attrs, TreeError* err = nullptr);
            std::optional<NodeRow> AddFirstChild(const NodeHandle& parent, const Attributes& attrs, TreeError* err = nullptr);

            /// @brief Inserts a new node immediately after sibling (a new root if sibling is a root).
            std::optional<NodeRow> AddSibling(const NodeHandle& sibling, const Attributes& attrs, TreeError* err = nullptr);
            std::optional<NodeRow> AddSiblingBefore(const NodeHandle& sibling, const Attributes& attrs, TreeError* err = nullptr);

            /// @brief General form of the four Add* operations.
            std::optional<NodeRow> Insert(const NodeHandle& anchor, MovePosition position,
                                          const Attributes& attrs, TreeError* err = nullptr);

            /**
             * @brief Appends several children under parent in one transaction.
             *
             * All rows are written or none are.
             */
            std::optional<std::vector<NodeRow>> AddChildren(const NodeHandle& parent,
                                                            const std::vector<Attributes>& children,
                                                            TreeError* err = nullptr);

            // ========================================================================
            // Deletion / moves / updates
            // ========================================================================

            /// @brief Removes node and every descendant; marks the handle Deleted.
            bool DeleteSubtree(NodeHandle& node, TreeError* err = nullptr);

            /// @brief Moves node (with its subtree) to become the last child of newParent.
            bool MoveSubtree(NodeHandle& node, const NodeHandle& newParent, TreeError* err = nullptr);
            bool MoveBefore(NodeHandle& node, const NodeHandle& target, TreeError* err = nullptr);
            bool MoveAfter(NodeHandle& node, const NodeHandle& target, TreeError* err = nullptr);
            bool MoveInside(NodeHandle& node, const NodeHandle& target, TreeError* err = nullptr);
            bool Move(NodeHandle& node, const NodeHandle& target, MovePosition position, TreeError* err = nullptr);

            /// @brief Rewrites the given attribute columns; boundaries are untouched.
            bool UpdateAttributes(const NodeHandle& node, const Attributes& attrs, TreeError* err = nullptr);

            // ========================================================================
            // Reads
            // ========================================================================

            std::optional<NodeRow> GetNode(int64_t id, TreeError* err = nullptr);

            /// @brief Re-reads the boundaries of an attached handle.
            bool Refresh(NodeHandle& node, TreeError* err = nullptr);

            /// @brief Root first, nearest ancestor last.
            std::optional<std::vector<NodeRow>> AncestorsOf(const NodeHandle& node, TreeError* err = nullptr);
            std::optional<std::vector<NodeRow>> DescendantsOf(const NodeHandle& node, TreeError* err = nullptr);
            std::optional<std::vector<NodeRow>> ChildrenOf(const NodeHandle& node, TreeError* err = nullptr);

            /**
             * @brief Nearest ancestor of node.
             * @param parent Left empty for a root
             * @return false on error only
             */
            bool ParentOf(const NodeHandle& node, std::optional<NodeRow>& parent, TreeError* err = nullptr);

            std::optional<int64_t> DepthOf(const NodeHandle& node, TreeError* err = nullptr);
            std::optional<std::vector<NodeRow>> Roots(TreeError* err = nullptr);

            /// @brief Every row ordered by left boundary.
            std::optional<std::vector<NodeRow>> AllNodes(TreeError* err = nullptr);

            /// @brief Materializes the subtree rooted at node.
            std::optional<TreeNodeView> BuildTree(const NodeHandle& node, TreeError* err = nullptr);

            /**
             * @brief Indented outline of the whole table.
             *
             * Lines read "<label> [left, right]", where the label comes from the
             * mapping's label column (or "#<id>" when there is none).
             */
            std::optional<std::string> RenderForest(TreeError* err = nullptr);

            /**
             * @brief Verifies width, nesting, uniqueness and contiguity of all rows.
             * @param issues One entry per violation; empty for a valid tree
             * @return false only if the rows could not be read
             */
            bool CheckInvariants(std::vector<std::string>& issues, TreeError* err = nullptr);

            // ========================================================================
            // Accessors
            // ========================================================================

            const TableMapping& Mapping() const noexcept { return m_mapping; }
            const NestedSetOptions& Options() const noexcept { return m_options; }
            const BoundaryAllocator& Allocator() const noexcept { return m_allocator; }

        private:
            using Transaction = Database::Transaction;
            using TransactionPtr = std::unique_ptr<Transaction>;

            bool createSchema(TreeError* err);
            bool verifySchema(TreeError* err);
            bool requireInitialized(const char* context, TreeError* err) const;
            bool checkHandle(const NodeHandle& node, const char* context, TreeError* err) const;
            bool checkAttributes(const Attributes& attrs, bool forInsert, const char* context, TreeError* err) const;

            TransactionPtr begin(Transaction::Type type, const char* context, TreeError* err);
            bool commit(Transaction& txn, const char* context, TreeError* err);
            bool storageFailure(const Database::DatabaseError& dbErr, const char* context, TreeError* err) const;

            std::optional<Boundary> loadBoundary(Transaction& txn, const NodeHandle& node, const char* context, TreeError* err);
            std::optional<NodeRow> loadRow(Transaction& txn, int64_t id, const char* context, TreeError* err);
            std::optional<int64_t> loadMaxRight(Transaction& txn, const char* context, TreeError* err);

            std::optional<std::vector<NodeRow>> queryRange(Transaction& txn, const std::string& sql,
                                                           const Boundary& b, bool bindTwice,
                                                           const char* context, TreeError* err);
            std::optional<std::vector<NodeRow>> queryAll(Transaction& txn, const std::string& sql,
                                                         const char* context, TreeError* err);
            bool readRows(Database::QueryResult& result, std::vector<NodeRow>& rows,
                          const char* context, TreeError* err) const;
            NodeRow readRow(Database::QueryResult& result) const;

            bool applyShift(Transaction& txn, const ShiftOp& shift, const char* context, TreeError* err);
            std::optional<int64_t> insertRow(Transaction& txn, const Boundary& boundary,
                                             const Attributes& attrs, const char* context, TreeError* err);

            std::optional<NodeRow> insertInTransaction(Transaction& txn, const NodeHandle& anchor,
                                                       MovePosition position, const Attributes& attrs,
                                                       const char* context, TreeError* err);

            bool verifyBeforeCommit(Transaction& txn, const char* context, TreeError* err);
            void collectIssues(const std::vector<NodeRow>& rows, std::vector<std::string>& issues) const;

            NodeHandle makeHandle(int64_t id, const Boundary& boundary) const;

            Database::DatabaseManager& m_db;
            TableMapping m_mapping;
            NestedSetOptions m_options;
            BoundaryAllocator m_allocator;
            std::atomic<bool> m_initialized{ false };

            // Pre-rendered SQL, filled by Initialize()
            struct Statements {
                std::string selectById;
                std::string selectBoundaryById;
                std::string selectAll;
                std::string maxRight;
                std::string insert;
                std::string ancestors;
                std::string descendants;
                std::string children;
                std::string parent;
                std::string depth;
                std::string roots;
                std::string shiftLeft;
                std::string shiftRight;
                std::string deleteRange;
                std::string park;
                std::string unpark;
            } m_sql;
        };

    } // namespace Tree
} // namespace Arbor
