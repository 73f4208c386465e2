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
 * Arbor DatabaseManager - HEADER
 * ============================================================================
 *
 * @file DatabaseManager.hpp
 * @brief SQLite database access with connection pooling and RAII transactions.
 *
 * This header defines the storage layer the nested-set tree operates on.
 * It exposes a narrow set of primitives: execute a statement, run a query,
 * bind parameters, and scope several statements inside one transaction.
 *
 * Architecture Overview:
 * ----------------------
 *
 *   NestedSetStore / NestedSet<Record>
 *         │
 *         ▼
 *   ┌──────────────────────────────────────────────────────────────────┐
 *   │                         DatabaseManager                          │
 *   │  ┌─────────────────────────────────────────────────────────┐    │
 *   │  │ Execute(), Query(), BeginTransaction(), QueryWithParams()│    │
 *   │  └─────────────────────────────────────────────────────────┘    │
 *   │                  │                         │                     │
 *   │                  ▼                         ▼                     │
 *   │          ┌────────────┐            ┌──────────────┐             │
 *   │          │ Connection │            │ Transaction  │             │
 *   │          │   Pool     │            │   (RAII)     │             │
 *   │          └────────────┘            └──────────────┘             │
 *   │                  │                                               │
 *   │                  ▼                                               │
 *   │  ┌──────────────────────────────────────────────────────────┐   │
 *   │  │              SQLite3 Connections (via SQLiteCpp)          │   │
 *   │  └──────────────────────────────────────────────────────────┘   │
 *   └──────────────────────────────────────────────────────────────────┘
 *
 * Thread Safety:
 * --------------
 * - DatabaseManager: thread-safe after Initialize()
 * - ConnectionPool: thread-safe acquire/release
 * - QueryResult: NOT thread-safe (single-thread use)
 * - Transaction: NOT thread-safe (single-thread use)
 *
 * Usage Example:
 * --------------
 * @code
 *   DatabaseConfig config;
 *   config.databasePath = "/var/lib/arbor/tree.db";
 *
 *   DatabaseManager db;
 *   DatabaseError err;
 *   if (!db.Initialize(config, &err)) {
 *       // Handle error
 *   }
 *
 *   auto txn = db.BeginTransaction(Transaction::Type::Immediate, &err);
 *   if (txn && txn->IsActive()) {
 *       txn->ExecuteWithParams("UPDATE nodes SET rgt = rgt + ? WHERE rgt > ?", &err, 2, 7);
 *       txn->Commit(&err);
 *   }
 * @endcode
 *
 * ============================================================================
 */

#include <SQLiteCpp/SQLiteCpp.h>
#include <sqlite3.h>

#include "../Utils/Logger.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <optional>
#include <chrono>
#include <unordered_map>
#include <condition_variable>
#include <atomic>
#include <limits>
#include <type_traits>
#include <cstdint>

namespace Arbor {
    namespace Database {

        class DatabaseManager;

        // ============================================================================
        // ERROR HANDLING
        // ============================================================================

        /**
         * @brief Structured error information for database operations.
         *
         * Contains SQLite error codes, extended codes, and contextual
         * information for debugging and logging.
         */
        struct DatabaseError {
            int sqliteCode = SQLITE_OK;     ///< Primary SQLite result code
            int extendedCode = 0;           ///< Extended error code for details
            std::string message;            ///< Human-readable error message
            std::string query;              ///< SQL query that caused the error
            std::string context;            ///< Operation context (function name)

            /** @brief Returns true if an error is present */
            bool HasError() const noexcept { return sqliteCode != SQLITE_OK; }

            /**
             * @brief Returns true if the failure came from lock contention.
             *
             * SQLITE_BUSY (lock wait timed out) and SQLITE_LOCKED (conflict
             * within a shared cache) both leave the database unchanged, so the
             * operation can be re-issued.
             */
            bool IsBusy() const noexcept {
                const int primary = sqliteCode & 0xFF;
                return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
            }

            /** @brief Resets all error fields to default state */
            void Clear() noexcept {
                sqliteCode = SQLITE_OK;
                extendedCode = 0;
                message.clear();
                query.clear();
                context.clear();
            }
        };

        // ============================================================================
        // SQL SECURITY UTILITIES
        // ============================================================================

        /**
         * @brief Validates that a string is a safe SQL identifier (table/column name).
         *
         * SQL identifiers must:
         * - Not be empty
         * - Not exceed 128 characters
         * - Start with a letter or underscore
         * - Contain only alphanumeric characters and underscores
         *
         * Table and column names cannot be bound as parameters, so every
         * identifier spliced into SQL text goes through this whitelist.
         *
         * @code
         * IsValidSqlIdentifier("nodes")           // true
         * IsValidSqlIdentifier("lft")             // true
         * IsValidSqlIdentifier("nodes;DROP")      // false
         * IsValidSqlIdentifier("123table")        // false
         * @endcode
         */
        [[nodiscard]] inline bool IsValidSqlIdentifier(std::string_view identifier) noexcept {
            if (identifier.empty()) {
                return false;
            }

            constexpr size_t MAX_IDENTIFIER_LENGTH = 128;
            if (identifier.size() > MAX_IDENTIFIER_LENGTH) {
                return false;
            }

            const char first = identifier.front();
            if (!((first >= 'a' && first <= 'z') ||
                  (first >= 'A' && first <= 'Z') ||
                  first == '_')) {
                return false;
            }

            for (const char c : identifier) {
                const bool isValid = (c >= 'a' && c <= 'z') ||
                                     (c >= 'A' && c <= 'Z') ||
                                     (c >= '0' && c <= '9') ||
                                     c == '_';
                if (!isValid) {
                    return false;
                }
            }

            return true;
        }

        // ============================================================================
        // CONFIGURATION
        // ============================================================================

        /**
         * @brief Configuration options for DatabaseManager initialization.
         *
         * @note Changes only take effect on next Initialize() call
         */
        struct DatabaseConfig {
            // === Core Settings ===
            std::string databasePath;                  ///< Full path to database file
            bool enableWAL = true;                     ///< Enable Write-Ahead Logging
            bool enableForeignKeys = true;             ///< Enable FK constraint checking
            bool enableSecureDelete = false;           ///< Overwrite deleted data
            bool enableMemoryMappedIO = true;          ///< Use memory-mapped I/O

            // === Performance Tuning ===
            size_t pageSizeBytes = 4096;               ///< Database page size (power of 2)
            size_t cacheSizeKB = 10240;                ///< Page cache size (10MB default)
            size_t mmapSizeMB = 64;                    ///< Memory-mapped I/O size
            int busyTimeoutMs = 5000;                  ///< Wait time for locked database
            std::string tempStore = "MEMORY";          ///< Temp storage: MEMORY/FILE/DEFAULT

            // === Connection Pooling ===
            size_t maxConnections = 8;                 ///< Maximum pool size
            size_t minConnections = 1;                 ///< Pre-warmed connections
            std::chrono::milliseconds connectionTimeout = std::chrono::seconds(10);

            // === Access ===
            bool readOnly = false;                     ///< Open database read-only

            // === Advanced SQLite PRAGMAs ===
            std::string synchronousMode = "NORMAL";    ///< OFF/NORMAL/FULL/EXTRA

            /** @brief Returns true if the configuration can be used to open a database */
            [[nodiscard]] bool IsValid() const noexcept {
                // Both modes are spliced into PRAGMA text
                const bool syncOk = synchronousMode == "OFF" || synchronousMode == "NORMAL" ||
                                    synchronousMode == "FULL" || synchronousMode == "EXTRA";
                const bool tempOk = tempStore == "MEMORY" || tempStore == "FILE" || tempStore == "DEFAULT";

                return !databasePath.empty() &&
                       maxConnections > 0 &&
                       minConnections <= maxConnections &&
                       busyTimeoutMs >= 0 &&
                       syncOk && tempOk;
            }
        };

        // ============================================================================
        // QUERY RESULT
        // ============================================================================

        /**
         * @brief Move-only wrapper around a prepared SELECT statement.
         *
         * A QueryResult created by DatabaseManager owns a pooled connection and
         * returns it on destruction. A QueryResult created by a Transaction
         * borrows the transaction's connection and releases nothing.
         */
        class QueryResult {
        public:
            QueryResult() = default;

            explicit QueryResult(std::unique_ptr<SQLite::Statement>&& stmt) noexcept
                : m_statement(std::move(stmt))
            {
            }

            explicit QueryResult(
                std::unique_ptr<SQLite::Statement>&& stmt,
                std::shared_ptr<SQLite::Database> conn,
                DatabaseManager* manager
            ) noexcept;

            ~QueryResult();

            QueryResult(const QueryResult&) = delete;
            QueryResult& operator=(const QueryResult&) = delete;

            QueryResult(QueryResult&& other) noexcept;
            QueryResult& operator=(QueryResult&& other) noexcept;

            // === Navigation ===

            /**
             * @brief Steps to the next row.
             * @param err Receives the SQLite error if stepping failed
             * @return true if a row is available; false at end or on error
             */
            bool Next(DatabaseError* err = nullptr);
            bool IsValid() const noexcept { return m_statement != nullptr; }
            int ColumnCount() const noexcept;
            std::string ColumnName(int index) const;

            // === Type-safe Value Retrieval (by index) ===
            int GetInt(int columnIndex) const;
            int64_t GetInt64(int columnIndex) const;
            double GetDouble(int columnIndex) const;
            std::string GetString(int columnIndex) const;

            // === Type-safe Value Retrieval (by name) ===
            int GetInt(std::string_view columnName) const;
            int64_t GetInt64(std::string_view columnName) const;
            double GetDouble(std::string_view columnName) const;
            std::string GetString(std::string_view columnName) const;

            // === NULL Checking ===
            bool IsNull(int columnIndex) const;
            bool IsNull(std::string_view columnName) const;

        private:
            int getColumnIndex(std::string_view columnName) const;

            std::unique_ptr<SQLite::Statement> m_statement;
            std::shared_ptr<SQLite::Database> m_connection;
            DatabaseManager* m_manager = nullptr;
            mutable std::unordered_map<std::string, int> m_columnIndexCache;
        };

        // ============================================================================
        // CONNECTION POOL
        // ============================================================================

        /**
         * @brief Fixed-ceiling pool of configured SQLite connections.
         *
         * Pre-warms minConnections, grows up to maxConnections on demand and
         * makes callers wait (bounded by the timeout) once the ceiling is hit.
         */
        class ConnectionPool {
        public:
            explicit ConnectionPool(const DatabaseConfig& config) noexcept;
            ~ConnectionPool();

            ConnectionPool(const ConnectionPool&) = delete;
            ConnectionPool& operator=(const ConnectionPool&) = delete;

            bool Initialize(DatabaseError* err = nullptr);
            void Shutdown();

            std::shared_ptr<SQLite::Database> Acquire(
                std::chrono::milliseconds timeout = std::chrono::seconds(10),
                DatabaseError* err = nullptr
            );

            void Release(std::shared_ptr<SQLite::Database> conn);

            size_t TotalConnections() const noexcept;

        private:
            struct PooledConnection {
                std::shared_ptr<SQLite::Database> connection;
                std::chrono::steady_clock::time_point lastUsed;
                bool inUse = false;
            };

            bool createConnection(DatabaseError* err);
            bool configureConnection(SQLite::Database& db, DatabaseError* err);

            DatabaseConfig m_config;
            mutable std::mutex m_mutex;
            std::condition_variable m_cv;
            std::vector<PooledConnection> m_connections;
            std::atomic<bool> m_shutdown{ false };
            std::atomic<size_t> m_activeCount{ 0 };
        };

        // ============================================================================
        // TRANSACTION (RAII)
        // ============================================================================

        /**
         * @brief Scoped unit of work on one pooled connection.
         *
         * Rolls back in the destructor unless Commit() succeeded, and returns
         * its connection to the pool. Every statement issued through the
         * transaction runs on that same connection.
         */
        class Transaction {
        public:
            enum class Type {
                Deferred,   ///< Lock acquired on first read/write
                Immediate   ///< RESERVED lock acquired immediately
            };

            explicit Transaction(
                SQLite::Database& db,
                std::shared_ptr<SQLite::Database> conn,
                DatabaseManager* manager,
                Type type = Type::Deferred,
                DatabaseError* err = nullptr
            );

            ~Transaction();

            Transaction(const Transaction&) = delete;
            Transaction& operator=(const Transaction&) = delete;
            Transaction(Transaction&&) noexcept;
            Transaction& operator=(Transaction&&) noexcept;

            bool Commit(DatabaseError* err = nullptr);
            bool Rollback(DatabaseError* err = nullptr);
            bool IsActive() const noexcept { return m_active; }

            bool Execute(std::string_view sql, DatabaseError* err = nullptr);

            template<typename... Args>
            bool ExecuteWithParams(std::string_view sql, DatabaseError* err, Args&&... args);

            /**
             * @brief Runs a SELECT on the transaction's connection.
             *
             * The returned result borrows the connection; it must not outlive
             * the transaction.
             */
            template<typename... Args>
            QueryResult QueryWithParams(std::string_view sql, DatabaseError* err, Args&&... args);

            /** @brief Prepares a statement on the transaction's connection for manual binding. */
            std::unique_ptr<SQLite::Statement> Prepare(std::string_view sql, DatabaseError* err = nullptr);

            /** @brief Rowid of the last INSERT on this transaction's connection. */
            int64_t LastInsertRowId() const noexcept;

            /** @brief Rows changed by the last statement on this transaction's connection. */
            int ChangedRowCount() const noexcept;

        private:
            bool requireActive(DatabaseError* err, const char* context) const;

            SQLite::Database* m_db = nullptr;
            std::shared_ptr<SQLite::Database> m_connection;
            DatabaseManager* m_manager = nullptr;
            bool m_active = false;
            bool m_committed = false;
        };

        // ============================================================================
        // DATABASE MANAGER (MAIN INTERFACE)
        // ============================================================================

        /**
         * @brief Entry point for all database operations.
         *
         * Owned by the application and handed to the tree façade by reference;
         * there is no process-wide instance.
         */
        class DatabaseManager {
        public:
            DatabaseManager();
            ~DatabaseManager();

            DatabaseManager(const DatabaseManager&) = delete;
            DatabaseManager& operator=(const DatabaseManager&) = delete;

            // === Initialization ===
            bool Initialize(const DatabaseConfig& config, DatabaseError* err = nullptr);
            void Shutdown();
            bool IsInitialized() const noexcept { return m_initialized.load(); }

            // === Query Execution ===
            bool Execute(std::string_view sql, DatabaseError* err = nullptr);
            bool ExecuteMany(const std::vector<std::string>& statements, DatabaseError* err = nullptr);
            QueryResult Query(std::string_view sql, DatabaseError* err = nullptr);

            // === Parameterized Queries ===
            template<typename... Args>
            bool ExecuteWithParams(std::string_view sql, DatabaseError* err, Args&&... args);

            template<typename... Args>
            QueryResult QueryWithParams(std::string_view sql, DatabaseError* err, Args&&... args);

            // === Transactions ===
            std::unique_ptr<Transaction> BeginTransaction(
                Transaction::Type type = Transaction::Type::Deferred,
                DatabaseError* err = nullptr
            );

            // === Schema Introspection ===
            bool TableExists(std::string_view tableName, DatabaseError* err = nullptr);
            std::vector<std::string> GetColumnNames(std::string_view tableName, DatabaseError* err = nullptr);

            const DatabaseConfig& GetConfig() const noexcept { return m_config; }

            // === Connection Access (Advanced) ===
            std::shared_ptr<SQLite::Database> AcquireConnection(DatabaseError* err = nullptr);
            void ReleaseConnection(std::shared_ptr<SQLite::Database> conn);

            // === Parameter Binding Helpers ===
            template<typename T>
            static void bindParameter(SQLite::Statement& stmt, int index, T&& value);

            template<typename T, typename... Args>
            static void bindParameters(SQLite::Statement& stmt, int index, T&& first, Args&&... rest);

            static void bindParameters(SQLite::Statement&, int) {}

            // === Error Handling ===
            static void setError(DatabaseError* err, int code, std::string_view msg, std::string_view ctx = "");
            static void setError(DatabaseError* err, const SQLite::Exception& ex, std::string_view ctx = "");

        private:
            bool prepareDatabaseFile(DatabaseError* err);

            std::atomic<bool> m_initialized{ false };
            DatabaseConfig m_config;
            std::unique_ptr<ConnectionPool> m_connectionPool;
            mutable std::shared_mutex m_configMutex;
        };

        // ============================================================================
        // TEMPLATE IMPLEMENTATIONS
        // ============================================================================

        template<typename... Args>
        bool Transaction::ExecuteWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            if (!requireActive(err, "Transaction::ExecuteWithParams")) {
                return false;
            }

            try {
                SQLite::Statement stmt(*m_db, std::string(sql));
                DatabaseManager::bindParameters(stmt, 1, std::forward<Args>(args)...);
                stmt.exec();
                return true;
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, "Transaction::ExecuteWithParams");
                if (err) err->query.assign(sql);
                return false;
            }
        }

        template<typename... Args>
        QueryResult Transaction::QueryWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            if (!requireActive(err, "Transaction::QueryWithParams")) {
                return QueryResult{};
            }

            try {
                auto stmt = std::make_unique<SQLite::Statement>(*m_db, std::string(sql));
                DatabaseManager::bindParameters(*stmt, 1, std::forward<Args>(args)...);
                return QueryResult{ std::move(stmt) };
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, "Transaction::QueryWithParams");
                if (err) err->query.assign(sql);
                return QueryResult{};
            }
        }

        /**
         * @brief Executes parameterized statement on a pooled connection.
         */
        template<typename... Args>
        bool DatabaseManager::ExecuteWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            auto conn = this->AcquireConnection(err);
            if (!conn) return false;

            // RAII guard ensures connection release even on exception
            struct ConnectionGuard {
                DatabaseManager* mgr;
                std::shared_ptr<SQLite::Database> conn;

                ~ConnectionGuard() {
                    if (conn && mgr) {
                        mgr->ReleaseConnection(conn);
                    }
                }
            } guard{ this, conn };

            try {
                SQLite::Statement stmt(*conn, std::string(sql));
                bindParameters(stmt, 1, std::forward<Args>(args)...);
                stmt.exec();
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, "ExecuteWithParams");
                return false;
            }
        }

        /**
         * @brief Executes parameterized SELECT query.
         *
         * Returns QueryResult that takes ownership of the connection.
         */
        template<typename... Args>
        QueryResult DatabaseManager::QueryWithParams(std::string_view sql, DatabaseError* err, Args&&... args) {
            auto conn = this->AcquireConnection(err);
            if (!conn) return QueryResult{};

            struct ConnectionGuard {
                DatabaseManager* mgr;
                std::shared_ptr<SQLite::Database> conn;
                bool released = false;

                ~ConnectionGuard() {
                    if (conn && mgr && !released) {
                        mgr->ReleaseConnection(conn);
                    }
                }
            } guard{ this, conn };

            try {
                auto stmt = std::make_unique<SQLite::Statement>(*conn, std::string(sql));
                bindParameters(*stmt, 1, std::forward<Args>(args)...);

                // QueryResult will handle release
                guard.released = true;
                return QueryResult{ std::move(stmt), conn, this };
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, "QueryWithParams");
                return QueryResult{};
            }
        }

        template<typename T>
        void DatabaseManager::bindParameter(SQLite::Statement& stmt, int index, T&& value) {
            using DecayT = std::decay_t<T>;

            if constexpr (std::is_same_v<DecayT, bool>) {
                stmt.bind(index, static_cast<int>(value));
            }
            else if constexpr (std::is_same_v<DecayT, int>) {
                stmt.bind(index, value);
            }
            else if constexpr (std::is_integral_v<DecayT> && sizeof(DecayT) == sizeof(int64_t)) {
                stmt.bind(index, static_cast<int64_t>(value));
            }
            else if constexpr (std::is_same_v<DecayT, double> || std::is_same_v<DecayT, float>) {
                stmt.bind(index, static_cast<double>(value));
            }
            else if constexpr (std::is_same_v<DecayT, const char*> || std::is_same_v<DecayT, char*> ||
                               std::is_same_v<DecayT, std::string>) {
                stmt.bind(index, std::string(value));
            }
            else if constexpr (std::is_same_v<DecayT, std::string_view>) {
                stmt.bind(index, std::string(value));
            }
            else if constexpr (std::is_same_v<DecayT, std::nullptr_t>) {
                stmt.bind(index);  // NULL
            }
            else {
                static_assert(sizeof(T) == 0, "Unsupported parameter type");
            }
        }

        template<typename T, typename... Args>
        void DatabaseManager::bindParameters(SQLite::Statement& stmt, int index, T&& first, Args&&... rest) {
            bindParameter(stmt, index, std::forward<T>(first));
            bindParameters(stmt, index + 1, std::forward<Args>(rest)...);
        }

    } // namespace Database
} // namespace Arbor
