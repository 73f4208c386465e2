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

/**
 * ============================================================================
 * Arbor NestedSetStore - IMPLEMENTATION
 * ============================================================================
 *
 * @file NestedSetStore.cpp
 *
 * Transaction Discipline:
 * -----------------------
 * - Mutations: BEGIN IMMEDIATE. The write lock is taken before any boundary
 *   is read, so two writers can never plan against the same snapshot.
 * - Reads: BEGIN DEFERRED, committed once the rows are materialized.
 * - Every statement of an operation goes through the Transaction object and
 *   therefore runs on the connection that holds the lock.
 * - Any early return destroys the Transaction, which rolls back.
 *
 * ============================================================================
 */

#include "NestedSetStore.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>
#include <type_traits>

namespace Arbor {
    namespace Tree {

        using Database::DatabaseError;
        using Database::QueryResult;

        namespace {

            /// Integers widen into REAL columns; everything else must match exactly.
            bool valueMatchesColumn(const AttributeValue& value, ColumnType type) noexcept {
                switch (type) {
                case ColumnType::Integer: return std::holds_alternative<int64_t>(value);
                case ColumnType::Real:    return std::holds_alternative<double>(value) ||
                                                 std::holds_alternative<int64_t>(value);
                case ColumnType::Text:    return std::holds_alternative<std::string>(value);
                }
                return false;
            }

            void bindValue(SQLite::Statement& stmt, int index, const AttributeValue& value) {
                std::visit([&](const auto& v) {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, std::monostate>) {
                        stmt.bind(index);
                    }
                    else {
                        Database::DatabaseManager::bindParameter(stmt, index, v);
                    }
                }, value);
            }

            std::string describe(const NodeHandle& node) {
                return "#" + std::to_string(node.id) + " [" + std::to_string(node.boundary.left) +
                    ", " + std::to_string(node.boundary.right) + "]";
            }

        } // anonymous namespace

        NestedSetStore::NestedSetStore(Database::DatabaseManager& db, TableMapping mapping, NestedSetOptions options)
            : m_db(db)
            , m_mapping(std::move(mapping))
            , m_options(std::move(options))
            , m_allocator(m_options.maxBoundary)
        {
        }

        // ============================================================================
        // Initialization
        // ============================================================================

        bool NestedSetStore::Initialize(TreeError* err) {
            if (m_initialized.load(std::memory_order_acquire)) {
                return true;
            }

            if (!m_options.IsValid()) {
                SetTreeError(err, TreeErrorKind::InvalidArgument, "Invalid tree options", "Initialize");
                return false;
            }

            if (!m_mapping.Validate(err)) {
                AR_LOG_ERROR("Tree", "Rejected table mapping: %s", err ? err->message.c_str() : "invalid");
                return false;
            }

            m_sql.selectById = m_mapping.SelectByIdSql();
            m_sql.selectBoundaryById = m_mapping.SelectBoundaryByIdSql();
            m_sql.selectAll = m_mapping.SelectAllSql();
            m_sql.maxRight = m_mapping.MaxRightSql();
            m_sql.insert = m_mapping.InsertSql();
            m_sql.ancestors = m_mapping.AncestorsSql();
            m_sql.descendants = m_mapping.DescendantsSql();
            m_sql.children = m_mapping.ChildrenSql();
            m_sql.parent = m_mapping.ParentSql();
            m_sql.depth = m_mapping.DepthSql();
            m_sql.roots = m_mapping.RootsSql();
            m_sql.shiftLeft = m_mapping.ShiftLeftSql();
            m_sql.shiftRight = m_mapping.ShiftRightSql();
            m_sql.deleteRange = m_mapping.DeleteRangeSql();
            m_sql.park = m_mapping.ParkSql();
            m_sql.unpark = m_mapping.UnparkSql();

            const bool schemaReady = m_options.createSchemaOnInitialize ? createSchema(err) : verifySchema(err);
            if (!schemaReady) {
                return false;
            }

            m_initialized.store(true, std::memory_order_release);

            AR_LOG_INFO("Tree", "Nested set store ready on table '%s'", m_mapping.table.c_str());
            return true;
        }

        bool NestedSetStore::CreateSchema(TreeError* err) {
            if (!requireInitialized("CreateSchema", err)) return false;
            return createSchema(err);
        }

        bool NestedSetStore::createSchema(TreeError* err) {
            std::vector<std::string> statements{ m_mapping.CreateTableSql() };
            for (auto& sql : m_mapping.CreateIndexSql()) {
                statements.push_back(std::move(sql));
            }

            DatabaseError dbErr;
            if (!m_db.ExecuteMany(statements, &dbErr)) {
                return storageFailure(dbErr, "CreateSchema", err);
            }

            AR_LOG_DEBUG("Tree", "Schema ensured for table '%s'", m_mapping.table.c_str());
            return true;
        }

        bool NestedSetStore::verifySchema(TreeError* err) {
            DatabaseError dbErr;
            const bool exists = m_db.TableExists(m_mapping.table, &dbErr);
            if (dbErr.HasError()) return storageFailure(dbErr, "Initialize", err);
            if (!exists) {
                SetTreeError(err, TreeErrorKind::InvalidState,
                    "Table '" + m_mapping.table + "' does not exist", "Initialize");
                return false;
            }

            const auto present = m_db.GetColumnNames(m_mapping.table, &dbErr);
            if (dbErr.HasError()) return storageFailure(dbErr, "Initialize", err);

            std::vector<std::string> required{ m_mapping.primaryKey, m_mapping.leftColumn, m_mapping.rightColumn };
            for (const auto& column : m_mapping.attributes) {
                required.push_back(column.name);
            }
            for (const auto& name : required) {
                if (std::find(present.begin(), present.end(), name) == present.end()) {
                    SetTreeError(err, TreeErrorKind::InvalidState,
                        "Table '" + m_mapping.table + "' has no column '" + name + "'", "Initialize");
                    return false;
                }
            }
            return true;
        }

        // ============================================================================
        // Guards
        // ============================================================================

        bool NestedSetStore::requireInitialized(const char* context, TreeError* err) const {
            if (m_initialized.load(std::memory_order_acquire)) return true;
            SetTreeError(err, TreeErrorKind::InvalidState, "Store not initialized", context);
            return false;
        }

        bool NestedSetStore::checkHandle(const NodeHandle& node, const char* context, TreeError* err) const {
            if (!requireInitialized(context, err)) return false;

            if (node.state != NodeState::Attached) {
                SetTreeError(err, TreeErrorKind::InvalidState,
                    std::string("Handle #") + std::to_string(node.id) + " is " + NodeStateToString(node.state),
                    context);
                return false;
            }
            if (node.table != m_mapping.table) {
                SetTreeError(err, TreeErrorKind::InvalidState,
                    "Handle #" + std::to_string(node.id) + " belongs to table '" + node.table + "'",
                    context);
                return false;
            }
            return true;
        }

        bool NestedSetStore::checkAttributes(const Attributes& attrs, bool forInsert,
                                             const char* context, TreeError* err) const
        {
            for (const auto& [name, value] : attrs) {
                const int index = m_mapping.AttributeIndex(name);
                if (index < 0) {
                    SetTreeError(err, TreeErrorKind::InvalidArgument,
                        "Unknown attribute '" + name + "'", context);
                    return false;
                }
                const ColumnSpec& column = m_mapping.attributes[static_cast<size_t>(index)];
                if (IsNull(value)) {
                    if (!column.nullable) {
                        SetTreeError(err, TreeErrorKind::InvalidArgument,
                            "Attribute '" + name + "' may not be NULL", context);
                        return false;
                    }
                    continue;
                }
                if (!valueMatchesColumn(value, column.type)) {
                    SetTreeError(err, TreeErrorKind::InvalidArgument,
                        "Attribute '" + name + "' does not match its " +
                        std::string(ColumnTypeToSql(column.type)) + " column", context);
                    return false;
                }
            }

            if (forInsert) {
                for (const auto& column : m_mapping.attributes) {
                    if (!column.nullable && !FindAttribute(attrs, column.name)) {
                        SetTreeError(err, TreeErrorKind::InvalidArgument,
                            "Missing required attribute '" + column.name + "'", context);
                        return false;
                    }
                }
            }
            return true;
        }

        // ============================================================================
        // Transaction helpers
        // ============================================================================

        NestedSetStore::TransactionPtr NestedSetStore::begin(Transaction::Type type, const char* context, TreeError* err) {
            DatabaseError dbErr;
            auto txn = m_db.BeginTransaction(type, &dbErr);
            if (!txn || !txn->IsActive()) {
                storageFailure(dbErr, context, err);
                return nullptr;
            }
            return txn;
        }

        bool NestedSetStore::commit(Transaction& txn, const char* context, TreeError* err) {
            DatabaseError dbErr;
            if (!txn.Commit(&dbErr)) {
                return storageFailure(dbErr, context, err);
            }
            return true;
        }

        bool NestedSetStore::storageFailure(const DatabaseError& dbErr, const char* context, TreeError* err) const {
            if (dbErr.IsBusy()) {
                AR_LOG_WARN("Tree", "%s on '%s' hit lock contention: %s",
                    context, m_mapping.table.c_str(), dbErr.message.c_str());
            }
            else {
                AR_LOG_ERROR("Tree", "%s on '%s' failed (sqlite %d): %s",
                    context, m_mapping.table.c_str(), dbErr.sqliteCode, dbErr.message.c_str());
            }
            SetTreeError(err, dbErr, context);
            return false;
        }

        NodeHandle NestedSetStore::makeHandle(int64_t id, const Boundary& boundary) const {
            NodeHandle handle;
            handle.id = id;
            handle.boundary = boundary;
            handle.state = NodeState::Attached;
            handle.table = m_mapping.table;
            return handle;
        }

        // ============================================================================
        // Row access
        // ============================================================================

        NodeRow NestedSetStore::readRow(QueryResult& result) const {
            NodeRow row;
            row.handle = makeHandle(result.GetInt64(0), Boundary{ result.GetInt64(1), result.GetInt64(2) });

            row.attributes.reserve(m_mapping.attributes.size());
            for (size_t i = 0; i < m_mapping.attributes.size(); ++i) {
                const ColumnSpec& column = m_mapping.attributes[i];
                const int index = static_cast<int>(i) + 3;

                AttributeValue value;
                if (!result.IsNull(index)) {
                    switch (column.type) {
                    case ColumnType::Integer: value = result.GetInt64(index); break;
                    case ColumnType::Real:    value = result.GetDouble(index); break;
                    case ColumnType::Text:    value = result.GetString(index); break;
                    }
                }
                row.attributes.emplace_back(column.name, std::move(value));
            }
            return row;
        }

        bool NestedSetStore::readRows(QueryResult& result, std::vector<NodeRow>& rows,
                                      const char* context, TreeError* err) const
        {
            DatabaseError dbErr;
            try {
                while (result.Next(&dbErr)) {
                    rows.push_back(readRow(result));
                }
            }
            catch (const SQLite::Exception& ex) {
                Database::DatabaseManager::setError(&dbErr, ex, context);
            }

            if (dbErr.HasError()) {
                return storageFailure(dbErr, context, err);
            }
            return true;
        }

        std::optional<Boundary> NestedSetStore::loadBoundary(Transaction& txn, const NodeHandle& node,
                                                             const char* context, TreeError* err)
        {
            DatabaseError dbErr;
            auto result = txn.QueryWithParams(m_sql.selectBoundaryById, &dbErr, node.id);
            if (!result.IsValid()) {
                storageFailure(dbErr, context, err);
                return std::nullopt;
            }

            if (!result.Next(&dbErr)) {
                if (dbErr.HasError()) {
                    storageFailure(dbErr, context, err);
                }
                else {
                    SetTreeError(err, TreeErrorKind::NotFound,
                        "Node #" + std::to_string(node.id) + " no longer exists", context);
                }
                return std::nullopt;
            }

            Boundary boundary{ result.GetInt64(0), result.GetInt64(1) };
            if (boundary.left < 1 || boundary.left >= boundary.right) {
                SetTreeError(err, TreeErrorKind::StorageFailure,
                    "Node #" + std::to_string(node.id) + " has corrupt boundaries (" +
                    std::to_string(boundary.left) + ", " + std::to_string(boundary.right) + ")", context);
                AR_LOG_ERROR("Tree", "%s", err ? err->message.c_str() : "corrupt boundaries");
                return std::nullopt;
            }
            return boundary;
        }

        std::optional<NodeRow> NestedSetStore::loadRow(Transaction& txn, int64_t id,
                                                       const char* context, TreeError* err)
        {
            DatabaseError dbErr;
            auto result = txn.QueryWithParams(m_sql.selectById, &dbErr, id);
            if (!result.IsValid()) {
                storageFailure(dbErr, context, err);
                return std::nullopt;
            }

            std::vector<NodeRow> rows;
            if (!readRows(result, rows, context, err)) {
                return std::nullopt;
            }
            if (rows.empty()) {
                SetTreeError(err, TreeErrorKind::NotFound, "Node #" + std::to_string(id) + " does not exist", context);
                return std::nullopt;
            }
            return std::move(rows.front());
        }

        std::optional<int64_t> NestedSetStore::loadMaxRight(Transaction& txn, const char* context, TreeError* err) {
            DatabaseError dbErr;
            auto result = txn.QueryWithParams(m_sql.maxRight, &dbErr);
            if (!result.IsValid() || !result.Next(&dbErr)) {
                storageFailure(dbErr, context, err);
                return std::nullopt;
            }
            return result.GetInt64(0);
        }

        std::optional<std::vector<NodeRow>> NestedSetStore::queryRange(
            Transaction& txn, const std::string& sql, const Boundary& b, bool bindTwice,
            const char* context, TreeError* err)
        {
            DatabaseError dbErr;
            auto result = bindTwice
                ? txn.QueryWithParams(sql, &dbErr, b.left, b.right, b.left, b.right)
                : txn.QueryWithParams(sql, &dbErr, b.left, b.right);
            if (!result.IsValid()) {
                storageFailure(dbErr, context, err);
                return std::nullopt;
            }

            std::vector<NodeRow> rows;
            if (!readRows(result, rows, context, err)) {
                return std::nullopt;
            }
            return rows;
        }

        std::optional<std::vector<NodeRow>> NestedSetStore::queryAll(
            Transaction& txn, const std::string& sql, const char* context, TreeError* err)
        {
            DatabaseError dbErr;
            auto result = txn.QueryWithParams(sql, &dbErr);
            if (!result.IsValid()) {
                storageFailure(dbErr, context, err);
                return std::nullopt;
            }

            std::vector<NodeRow> rows;
            if (!readRows(result, rows, context, err)) {
                return std::nullopt;
            }
            return rows;
        }

        // ============================================================================
        // Boundary rewrites
        // ============================================================================

        bool NestedSetStore::applyShift(Transaction& txn, const ShiftOp& shift, const char* context, TreeError* err) {
            DatabaseError dbErr;
            if (!txn.ExecuteWithParams(m_sql.shiftLeft, &dbErr, shift.amount, shift.threshold) ||
                !txn.ExecuteWithParams(m_sql.shiftRight, &dbErr, shift.amount, shift.threshold)) {
                return storageFailure(dbErr, context, err);
            }

            AR_LOG_TRACE("Tree", "Shifted boundaries > %lld by %lld",
                static_cast<long long>(shift.threshold), static_cast<long long>(shift.amount));
            return true;
        }

        std::optional<int64_t> NestedSetStore::insertRow(Transaction& txn, const Boundary& boundary,
                                                         const Attributes& attrs, const char* context,
                                                         TreeError* err)
        {
            DatabaseError dbErr;
            auto stmt = txn.Prepare(m_sql.insert, &dbErr);
            if (!stmt) {
                storageFailure(dbErr, context, err);
                return std::nullopt;
            }

            try {
                stmt->bind(1, boundary.left);
                stmt->bind(2, boundary.right);

                int index = 3;
                for (const auto& column : m_mapping.attributes) {
                    const AttributeValue* value = FindAttribute(attrs, column.name);
                    if (value) {
                        bindValue(*stmt, index, *value);
                    }
                    else {
                        stmt->bind(index);
                    }
                    ++index;
                }

                stmt->exec();
            }
            catch (const SQLite::Exception& ex) {
                Database::DatabaseManager::setError(&dbErr, ex, context);
                storageFailure(dbErr, context, err);
                return std::nullopt;
            }

            return txn.LastInsertRowId();
        }

        bool NestedSetStore::verifyBeforeCommit(Transaction& txn, const char* context, TreeError* err) {
            if (!m_options.verifyAfterMutation) return true;

            auto rows = queryAll(txn, m_sql.selectAll, context, err);
            if (!rows) return false;

            std::vector<std::string> issues;
            collectIssues(*rows, issues);
            if (!issues.empty()) {
                SetTreeError(err, TreeErrorKind::InvalidState,
                    "Invariant violated: " + issues.front(), context);
                AR_LOG_ERROR("Tree", "%s left %zu invariant violation(s), rolling back; first: %s",
                    context, issues.size(), issues.front().c_str());
                return false;
            }
            return true;
        }

        // ============================================================================
        // Insertion
        // ============================================================================

        std::optional<NodeRow> NestedSetStore::CreateRoot(const Attributes& attrs, TreeError* err) {
            static constexpr const char* kContext = "CreateRoot";
            if (!requireInitialized(kContext, err)) return std::nullopt;
            if (!checkAttributes(attrs, true, kContext, err)) return std::nullopt;

            auto txn = begin(Transaction::Type::Immediate, kContext, err);
            if (!txn) return std::nullopt;

            auto maxRight = loadMaxRight(*txn, kContext, err);
            if (!maxRight) return std::nullopt;

            auto plan = m_allocator.PlanRoot(*maxRight, err);
            if (!plan) {
                AR_LOG_WARN("Tree", "CreateRoot rejected: %s", err ? err->message.c_str() : "plan failed");
                return std::nullopt;
            }

            auto id = insertRow(*txn, plan->node, attrs, kContext, err);
            if (!id) return std::nullopt;

            auto row = loadRow(*txn, *id, kContext, err);
            if (!row) return std::nullopt;

            if (!verifyBeforeCommit(*txn, kContext, err) || !commit(*txn, kContext, err)) {
                return std::nullopt;
            }

            AR_LOG_DEBUG("Tree", "Created root %s", describe(row->handle).c_str());
            return row;
        }

        std::optional<NodeRow> NestedSetStore::insertInTransaction(Transaction& txn, const NodeHandle& anchor,
                                                                   MovePosition position, const Attributes& attrs,
                                                                   const char* context, TreeError* err)
        {
            auto anchorBoundary = loadBoundary(txn, anchor, context, err);
            if (!anchorBoundary) return std::nullopt;

            auto maxRight = loadMaxRight(txn, context, err);
            if (!maxRight) return std::nullopt;
            if (!m_allocator.CheckCapacity(*maxRight, 2, err)) {
                if (err) err->context = context;
                AR_LOG_WARN("Tree", "%s rejected: %s", context, err ? err->message.c_str() : "overflow");
                return std::nullopt;
            }

            std::optional<InsertPlan> plan;
            switch (position) {
            case MovePosition::LastChild:
                plan = m_allocator.PlanInsertChild(anchorBoundary->left, anchorBoundary->right, err);
                break;
            case MovePosition::FirstChild:
                plan = m_allocator.PlanInsertFirstChild(anchorBoundary->left, anchorBoundary->right, err);
                break;
            case MovePosition::Before:
                plan = m_allocator.PlanInsertSiblingBefore(anchorBoundary->left, anchorBoundary->right, err);
                break;
            case MovePosition::After:
                plan = m_allocator.PlanInsertSiblingAfter(anchorBoundary->left, anchorBoundary->right, err);
                break;
            }
            if (!plan) {
                AR_LOG_WARN("Tree", "%s rejected: %s", context, err ? err->message.c_str() : "plan failed");
                return std::nullopt;
            }

            if (plan->shift && !applyShift(txn, *plan->shift, context, err)) {
                return std::nullopt;
            }

            auto id = insertRow(txn, plan->node, attrs, context, err);
            if (!id) return std::nullopt;

            return loadRow(txn, *id, context, err);
        }

        std::optional<NodeRow> NestedSetStore::Insert(const NodeHandle& anchor, MovePosition position,
                                                      const Attributes& attrs, TreeError* err)
        {
            static constexpr const char* kContext = "Insert";
            if (!checkHandle(anchor, kContext, err)) return std::nullopt;
            if (!checkAttributes(attrs, true, kContext, err)) return std::nullopt;

            auto txn = begin(Transaction::Type::Immediate, kContext, err);
            if (!txn) return std::nullopt;

            auto row = insertInTransaction(*txn, anchor, position, attrs, kContext, err);
            if (!row) return std::nullopt;

            if (!verifyBeforeCommit(*txn, kContext, err) || !commit(*txn, kContext, err)) {
                return std::nullopt;
            }

            AR_LOG_DEBUG("Tree", "Inserted %s (%s #%lld)", describe(row->handle).c_str(),
                MovePositionToString(position), static_cast<long long>(anchor.id));
            return row;
        }

        std::optional<NodeRow> NestedSetStore::AddChild(const NodeHandle& parent, const Attributes& attrs, TreeError* err) {
            return Insert(parent, MovePosition::LastChild, attrs, err);
        }

        std::optional<NodeRow> NestedSetStore::AddFirstChild(const NodeHandle& parent, const Attributes& attrs, TreeError* err) {
            return Insert(parent, MovePosition::FirstChild, attrs, err);
        }

        std::optional<NodeRow> NestedSetStore::AddSibling(const NodeHandle& sibling, const Attributes& attrs, TreeError* err) {
            return Insert(sibling, MovePosition::After, attrs, err);
        }

        std::optional<NodeRow> NestedSetStore::AddSiblingBefore(const NodeHandle& sibling, const Attributes& attrs, TreeError* err) {
            return Insert(sibling, MovePosition::Before, attrs, err);
        }

        std::optional<std::vector<NodeRow>> NestedSetStore::AddChildren(const NodeHandle& parent,
                                                                        const std::vector<Attributes>& children,
                                                                        TreeError* err)
        {
            static constexpr const char* kContext = "AddChildren";
            if (!checkHandle(parent, kContext, err)) return std::nullopt;
            for (const auto& attrs : children) {
                if (!checkAttributes(attrs, true, kContext, err)) return std::nullopt;
            }

            auto txn = begin(Transaction::Type::Immediate, kContext, err);
            if (!txn) return std::nullopt;

            std::vector<NodeRow> created;
            created.reserve(children.size());
            for (const auto& attrs : children) {
                auto row = insertInTransaction(*txn, parent, MovePosition::LastChild, attrs, kContext, err);
                if (!row) return std::nullopt;
                created.push_back(std::move(*row));
            }

            // Earlier rows were shifted by later inserts
            for (auto& row : created) {
                auto boundary = loadBoundary(*txn, row.handle, kContext, err);
                if (!boundary) return std::nullopt;
                row.handle.boundary = *boundary;
            }

            if (!verifyBeforeCommit(*txn, kContext, err) || !commit(*txn, kContext, err)) {
                return std::nullopt;
            }

            AR_LOG_DEBUG("Tree", "Appended %zu children under #%lld", created.size(), static_cast<long long>(parent.id));
            return created;
        }

        // ============================================================================
        // Deletion / moves / updates
        // ============================================================================

        bool NestedSetStore::DeleteSubtree(NodeHandle& node, TreeError* err) {
            static constexpr const char* kContext = "DeleteSubtree";
            if (!checkHandle(node, kContext, err)) return false;

            auto txn = begin(Transaction::Type::Immediate, kContext, err);
            if (!txn) return false;

            auto boundary = loadBoundary(*txn, node, kContext, err);
            if (!boundary) return false;

            auto plan = m_allocator.PlanDelete(boundary->left, boundary->right, err);
            if (!plan) return false;

            DatabaseError dbErr;
            if (!txn->ExecuteWithParams(m_sql.deleteRange, &dbErr, plan->range.left, plan->range.right)) {
                return storageFailure(dbErr, kContext, err);
            }
            const int removed = txn->ChangedRowCount();

            if (!applyShift(*txn, plan->shift, kContext, err)) return false;
            if (!verifyBeforeCommit(*txn, kContext, err) || !commit(*txn, kContext, err)) return false;

            node.boundary = *boundary;
            node.state = NodeState::Deleted;

            AR_LOG_DEBUG("Tree", "Deleted subtree %s (%d rows)", describe(node).c_str(), removed);
            return true;
        }

        bool NestedSetStore::Move(NodeHandle& node, const NodeHandle& target, MovePosition position, TreeError* err) {
            static constexpr const char* kContext = "Move";
            if (!checkHandle(node, kContext, err)) return false;
            if (!checkHandle(target, kContext, err)) return false;

            auto txn = begin(Transaction::Type::Immediate, kContext, err);
            if (!txn) return false;

            auto subtree = loadBoundary(*txn, node, kContext, err);
            if (!subtree) return false;
            auto targetBoundary = loadBoundary(*txn, target, kContext, err);
            if (!targetBoundary) return false;

            auto plan = m_allocator.PlanMove(*subtree, *targetBoundary, position, err);
            if (!plan) {
                if (err) err->context = kContext;
                AR_LOG_WARN("Tree", "Move of #%lld %s #%lld rejected: %s",
                    static_cast<long long>(node.id), MovePositionToString(position),
                    static_cast<long long>(target.id), err ? err->message.c_str() : "plan failed");
                return false;
            }

            DatabaseError dbErr;
            if (!txn->ExecuteWithParams(m_sql.park, &dbErr, plan->parked.left, plan->parked.right)) {
                return storageFailure(dbErr, kContext, err);
            }
            if (!applyShift(*txn, plan->closeGap, kContext, err)) return false;
            if (!applyShift(*txn, plan->openGap, kContext, err)) return false;
            if (!txn->ExecuteWithParams(m_sql.unpark, &dbErr, plan->offset, plan->offset)) {
                return storageFailure(dbErr, kContext, err);
            }

            if (!verifyBeforeCommit(*txn, kContext, err) || !commit(*txn, kContext, err)) return false;

            node.boundary = plan->result;

            AR_LOG_DEBUG("Tree", "Moved #%lld %s #%lld, now %s", static_cast<long long>(node.id),
                MovePositionToString(position), static_cast<long long>(target.id), describe(node).c_str());
            return true;
        }

        bool NestedSetStore::MoveSubtree(NodeHandle& node, const NodeHandle& newParent, TreeError* err) {
            return Move(node, newParent, MovePosition::LastChild, err);
        }

        bool NestedSetStore::MoveBefore(NodeHandle& node, const NodeHandle& target, TreeError* err) {
            return Move(node, target, MovePosition::Before, err);
        }

        bool NestedSetStore::MoveAfter(NodeHandle& node, const NodeHandle& target, TreeError* err) {
            return Move(node, target, MovePosition::After, err);
        }

        bool NestedSetStore::MoveInside(NodeHandle& node, const NodeHandle& target, TreeError* err) {
            return Move(node, target, MovePosition::LastChild, err);
        }

        bool NestedSetStore::UpdateAttributes(const NodeHandle& node, const Attributes& attrs, TreeError* err) {
            static constexpr const char* kContext = "UpdateAttributes";
            if (!checkHandle(node, kContext, err)) return false;
            if (!checkAttributes(attrs, false, kContext, err)) return false;
            if (attrs.empty()) return true;

            std::vector<std::string> columns;
            columns.reserve(attrs.size());
            for (const auto& entry : attrs) {
                columns.push_back(entry.first);
            }

            auto txn = begin(Transaction::Type::Immediate, kContext, err);
            if (!txn) return false;

            DatabaseError dbErr;
            auto stmt = txn->Prepare(m_mapping.UpdateAttributesSql(columns), &dbErr);
            if (!stmt) return storageFailure(dbErr, kContext, err);

            try {
                int index = 1;
                for (const auto& entry : attrs) {
                    bindValue(*stmt, index++, entry.second);
                }
                stmt->bind(index, node.id);
                stmt->exec();
            }
            catch (const SQLite::Exception& ex) {
                Database::DatabaseManager::setError(&dbErr, ex, kContext);
                return storageFailure(dbErr, kContext, err);
            }

            if (txn->ChangedRowCount() == 0) {
                SetTreeError(err, TreeErrorKind::NotFound,
                    "Node #" + std::to_string(node.id) + " no longer exists", kContext);
                return false;
            }

            return commit(*txn, kContext, err);
        }

        // ============================================================================
        // Reads
        // ============================================================================

        std::optional<NodeRow> NestedSetStore::GetNode(int64_t id, TreeError* err) {
            static constexpr const char* kContext = "GetNode";
            if (!requireInitialized(kContext, err)) return std::nullopt;

            auto txn = begin(Transaction::Type::Deferred, kContext, err);
            if (!txn) return std::nullopt;

            auto row = loadRow(*txn, id, kContext, err);
            if (!row || !commit(*txn, kContext, err)) return std::nullopt;
            return row;
        }

        bool NestedSetStore::Refresh(NodeHandle& node, TreeError* err) {
            static constexpr const char* kContext = "Refresh";
            if (!checkHandle(node, kContext, err)) return false;

            auto txn = begin(Transaction::Type::Deferred, kContext, err);
            if (!txn) return false;

            auto boundary = loadBoundary(*txn, node, kContext, err);
            if (!boundary || !commit(*txn, kContext, err)) return false;

            node.boundary = *boundary;
            return true;
        }

        std::optional<std::vector<NodeRow>> NestedSetStore::AncestorsOf(const NodeHandle& node, TreeError* err) {
            static constexpr const char* kContext = "AncestorsOf";
            if (!checkHandle(node, kContext, err)) return std::nullopt;

            auto txn = begin(Transaction::Type::Deferred, kContext, err);
            if (!txn) return std::nullopt;

            auto boundary = loadBoundary(*txn, node, kContext, err);
            if (!boundary) return std::nullopt;

            auto rows = queryRange(*txn, m_sql.ancestors, *boundary, false, kContext, err);
            if (!rows || !commit(*txn, kContext, err)) return std::nullopt;
            return rows;
        }

        std::optional<std::vector<NodeRow>> NestedSetStore::DescendantsOf(const NodeHandle& node, TreeError* err) {
            static constexpr const char* kContext = "DescendantsOf";
            if (!checkHandle(node, kContext, err)) return std::nullopt;

            auto txn = begin(Transaction::Type::Deferred, kContext, err);
            if (!txn) return std::nullopt;

            auto boundary = loadBoundary(*txn, node, kContext, err);
            if (!boundary) return std::nullopt;

            auto rows = queryRange(*txn, m_sql.descendants, *boundary, false, kContext, err);
            if (!rows || !commit(*txn, kContext, err)) return std::nullopt;
            return rows;
        }

        std::optional<std::vector<NodeRow>> NestedSetStore::ChildrenOf(const NodeHandle& node, TreeError* err) {
            static constexpr const char* kContext = "ChildrenOf";
            if (!checkHandle(node, kContext, err)) return std::nullopt;

            auto txn = begin(Transaction::Type::Deferred, kContext, err);
            if (!txn) return std::nullopt;

            auto boundary = loadBoundary(*txn, node, kContext, err);
            if (!boundary) return std::nullopt;

            auto rows = queryRange(*txn, m_sql.children, *boundary, true, kContext, err);
            if (!rows || !commit(*txn, kContext, err)) return std::nullopt;
            return rows;
        }

        bool NestedSetStore::ParentOf(const NodeHandle& node, std::optional<NodeRow>& parent, TreeError* err) {
            static constexpr const char* kContext = "ParentOf";
            parent.reset();
            if (!checkHandle(node, kContext, err)) return false;

            auto txn = begin(Transaction::Type::Deferred, kContext, err);
            if (!txn) return false;

            auto boundary = loadBoundary(*txn, node, kContext, err);
            if (!boundary) return false;

            auto rows = queryRange(*txn, m_sql.parent, *boundary, false, kContext, err);
            if (!rows || !commit(*txn, kContext, err)) return false;

            if (!rows->empty()) {
                parent = std::move(rows->front());
            }
            return true;
        }

        std::optional<int64_t> NestedSetStore::DepthOf(const NodeHandle& node, TreeError* err) {
            static constexpr const char* kContext = "DepthOf";
            if (!checkHandle(node, kContext, err)) return std::nullopt;

            auto txn = begin(Transaction::Type::Deferred, kContext, err);
            if (!txn) return std::nullopt;

            auto boundary = loadBoundary(*txn, node, kContext, err);
            if (!boundary) return std::nullopt;

            DatabaseError dbErr;
            auto result = txn->QueryWithParams(m_sql.depth, &dbErr, boundary->left, boundary->right);
            if (!result.IsValid() || !result.Next(&dbErr)) {
                storageFailure(dbErr, kContext, err);
                return std::nullopt;
            }
            const int64_t depth = result.GetInt64(0);

            if (!commit(*txn, kContext, err)) return std::nullopt;
            return depth;
        }

        std::optional<std::vector<NodeRow>> NestedSetStore::Roots(TreeError* err) {
            static constexpr const char* kContext = "Roots";
            if (!requireInitialized(kContext, err)) return std::nullopt;

            auto txn = begin(Transaction::Type::Deferred, kContext, err);
            if (!txn) return std::nullopt;

            auto rows = queryAll(*txn, m_sql.roots, kContext, err);
            if (!rows || !commit(*txn, kContext, err)) return std::nullopt;
            return rows;
        }

        std::optional<std::vector<NodeRow>> NestedSetStore::AllNodes(TreeError* err) {
            static constexpr const char* kContext = "AllNodes";
            if (!requireInitialized(kContext, err)) return std::nullopt;

            auto txn = begin(Transaction::Type::Deferred, kContext, err);
            if (!txn) return std::nullopt;

            auto rows = queryAll(*txn, m_sql.selectAll, kContext, err);
            if (!rows || !commit(*txn, kContext, err)) return std::nullopt;
            return rows;
        }

        std::optional<TreeNodeView> NestedSetStore::BuildTree(const NodeHandle& node, TreeError* err) {
            static constexpr const char* kContext = "BuildTree";
            if (!checkHandle(node, kContext, err)) return std::nullopt;

            auto txn = begin(Transaction::Type::Deferred, kContext, err);
            if (!txn) return std::nullopt;

            auto root = loadRow(*txn, node.id, kContext, err);
            if (!root) return std::nullopt;

            auto descendants = queryRange(*txn, m_sql.descendants, root->handle.boundary, false, kContext, err);
            if (!descendants || !commit(*txn, kContext, err)) return std::nullopt;

            TreeNodeView view;
            if (!BuildTreeView(*root, *descendants, view, err)) {
                if (err) err->kind = TreeErrorKind::StorageFailure;
                return std::nullopt;
            }
            return view;
        }

        std::optional<std::string> NestedSetStore::RenderForest(TreeError* err) {
            auto rows = AllNodes(err);
            if (!rows) return std::nullopt;

            std::vector<TreeNodeView> forest;
            if (!BuildForestView(*rows, forest, err)) {
                if (err) err->kind = TreeErrorKind::StorageFailure;
                return std::nullopt;
            }

            const std::string labelColumn = m_mapping.EffectiveLabelColumn();
            NodeLabeler labeler = [&labelColumn](const NodeRow& row) {
                std::string label;
                const AttributeValue* value = labelColumn.empty() ? nullptr : row.Find(labelColumn);
                if (value && !IsNull(*value)) {
                    label = AttributeToString(*value);
                }
                else {
                    label = "#" + std::to_string(row.handle.id);
                }
                return label + " [" + std::to_string(row.handle.boundary.left) + ", " +
                    std::to_string(row.handle.boundary.right) + "]";
            };

            return RenderOutline(forest, labeler, m_options.renderIndent);
        }

        // ============================================================================
        // Invariants
        // ============================================================================

        bool NestedSetStore::CheckInvariants(std::vector<std::string>& issues, TreeError* err) {
            issues.clear();

            auto rows = AllNodes(err);
            if (!rows) return false;

            collectIssues(*rows, issues);
            if (!issues.empty()) {
                AR_LOG_WARN("Tree", "Table '%s' has %zu invariant violation(s)", m_mapping.table.c_str(), issues.size());
            }
            return true;
        }

        void NestedSetStore::collectIssues(const std::vector<NodeRow>& rows, std::vector<std::string>& issues) const {
            // Uniqueness and contiguity: the sorted boundaries must read 1..2N
            std::vector<int64_t> values;
            values.reserve(rows.size() * 2);
            for (const auto& row : rows) {
                values.push_back(row.handle.boundary.left);
                values.push_back(row.handle.boundary.right);
            }
            std::sort(values.begin(), values.end());
            for (size_t i = 0; i < values.size(); ++i) {
                if (i > 0 && values[i] == values[i - 1]) {
                    issues.push_back("Boundary " + std::to_string(values[i]) + " is used more than once");
                }
                else if (values[i] != static_cast<int64_t>(i) + 1) {
                    issues.push_back("Boundaries are not contiguous at position " + std::to_string(i + 1) +
                        " (found " + std::to_string(values[i]) + ")");
                    break;
                }
            }

            // Nesting and width, walking rows in left order with a stack of open intervals
            struct Open {
                const NodeRow* row;
                int64_t descendants;
            };
            std::vector<Open> stack;

            auto close = [&issues](const Open& open) {
                const Boundary& b = open.row->handle.boundary;
                const int64_t expected = 2 * (1 + open.descendants);
                if (Width(b) != expected) {
                    issues.push_back(describe(open.row->handle) + " has width " + std::to_string(Width(b)) +
                        " but " + std::to_string(open.descendants) + " descendants");
                }
            };

            for (const auto& row : rows) {
                const Boundary& b = row.handle.boundary;
                if (b.left < 1 || b.left >= b.right) {
                    issues.push_back(describe(row.handle) + " has an invalid boundary pair");
                    continue;
                }

                while (!stack.empty() && stack.back().row->handle.boundary.right < b.left) {
                    close(stack.back());
                    stack.pop_back();
                }

                if (!stack.empty() && b.right > stack.back().row->handle.boundary.right) {
                    issues.push_back(describe(row.handle) + " overlaps " + describe(stack.back().row->handle));
                    continue;
                }

                for (auto& open : stack) {
                    ++open.descendants;
                }
                stack.push_back(Open{ &row, 0 });
            }

            while (!stack.empty()) {
                close(stack.back());
                stack.pop_back();
            }
        }

    } // namespace Tree
} // namespace Arbor
