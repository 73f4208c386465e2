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
 * Arbor DatabaseManager - IMPLEMENTATION
 * ============================================================================
 *
 * @file DatabaseManager.cpp
 * @brief SQLite database access with connection pooling and RAII transactions.
 *
 * Key Components:
 * ---------------
 * 1. CONNECTION POOL (ConnectionPool class)
 *    - Pre-warmed connection pool for low-latency acquisition
 *    - Configurable min/max connections
 *    - Thread-safe acquire/release with condition variables
 *
 * 2. TRANSACTION MANAGER (Transaction class)
 *    - RAII-based transaction management
 *    - DEFERRED for reads, IMMEDIATE for writes
 *    - Automatic rollback on scope exit if not committed
 *
 * SQLite Configuration:
 * ---------------------
 * - Journal mode: WAL (readers never block the single writer)
 * - Synchronous: NORMAL
 * - busy_timeout bounds every lock wait; SQLITE_BUSY is reported, never retried here
 *
 * ============================================================================
 */

#include "DatabaseManager.hpp"

#include <filesystem>
#include <algorithm>

namespace Arbor {
    namespace Database {

        // ============================================================================
        // QUERY RESULT IMPLEMENTATION
        // ============================================================================

        QueryResult::QueryResult(
            std::unique_ptr<SQLite::Statement>&& stmt,
            std::shared_ptr<SQLite::Database> conn,
            DatabaseManager* manager
        ) noexcept
            : m_statement(std::move(stmt))
            , m_connection(std::move(conn))
            , m_manager(manager)
        {
        }

        /**
         * @brief Destructor - releases statement and returns connection to pool.
         *
         * Statement must be reset before the connection is released.
         */
        QueryResult::~QueryResult() {
            m_statement.reset();

            if (m_connection && m_manager) {
                m_manager->ReleaseConnection(m_connection);
            }
        }

        QueryResult::QueryResult(QueryResult&& other) noexcept
            : m_statement(std::move(other.m_statement))
            , m_connection(std::move(other.m_connection))
            , m_manager(other.m_manager)
            , m_columnIndexCache(std::move(other.m_columnIndexCache))
        {
            other.m_manager = nullptr;
        }

        QueryResult& QueryResult::operator=(QueryResult&& other) noexcept {
            if (this != &other) {
                m_statement.reset();

                if (m_connection && m_manager) {
                    m_manager->ReleaseConnection(m_connection);
                }

                m_statement = std::move(other.m_statement);
                m_connection = std::move(other.m_connection);
                m_manager = other.m_manager;
                m_columnIndexCache = std::move(other.m_columnIndexCache);

                other.m_manager = nullptr;
            }
            return *this;
        }

        bool QueryResult::Next(DatabaseError* err) {
            if (!m_statement) return false;

            try {
                return m_statement->executeStep();
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, "QueryResult::Next");
                AR_LOG_ERROR("Database", "QueryResult::Next failed: %s", ex.what());
                return false;
            }
        }

        int QueryResult::ColumnCount() const noexcept {
            return m_statement ? m_statement->getColumnCount() : 0;
        }

        std::string QueryResult::ColumnName(int index) const {
            if (!m_statement) return std::string();
            return m_statement->getColumnName(index);
        }

        int QueryResult::GetInt(int columnIndex) const {
            return m_statement->getColumn(columnIndex).getInt();
        }

        int64_t QueryResult::GetInt64(int columnIndex) const {
            return m_statement->getColumn(columnIndex).getInt64();
        }

        double QueryResult::GetDouble(int columnIndex) const {
            return m_statement->getColumn(columnIndex).getDouble();
        }

        std::string QueryResult::GetString(int columnIndex) const {
            return m_statement->getColumn(columnIndex).getString();
        }

        int QueryResult::GetInt(std::string_view columnName) const {
            return GetInt(getColumnIndex(columnName));
        }

        int64_t QueryResult::GetInt64(std::string_view columnName) const {
            return GetInt64(getColumnIndex(columnName));
        }

        double QueryResult::GetDouble(std::string_view columnName) const {
            return GetDouble(getColumnIndex(columnName));
        }

        std::string QueryResult::GetString(std::string_view columnName) const {
            return GetString(getColumnIndex(columnName));
        }

        bool QueryResult::IsNull(int columnIndex) const {
            return m_statement->getColumn(columnIndex).isNull();
        }

        bool QueryResult::IsNull(std::string_view columnName) const {
            return IsNull(getColumnIndex(columnName));
        }

        int QueryResult::getColumnIndex(std::string_view columnName) const {
            const std::string key(columnName);
            auto it = m_columnIndexCache.find(key);
            if (it != m_columnIndexCache.end()) {
                return it->second;
            }

            // Throws SQLite::Exception for unknown columns
            const int index = m_statement->getColumnIndex(key.c_str());
            m_columnIndexCache.emplace(key, index);
            return index;
        }

        // ============================================================================
        // CONNECTION POOL IMPLEMENTATION
        // ============================================================================
        //
        // Acquisition Flow:
        // 1. Try to get an available connection from pool
        // 2. If none available and under max, create new connection
        // 3. If at max, wait with timeout for release
        // 4. Return nullptr (SQLITE_BUSY) if timeout expires
        // ============================================================================

        ConnectionPool::ConnectionPool(const DatabaseConfig& config) noexcept
            : m_config(config)
        {
        }

        ConnectionPool::~ConnectionPool() {
            Shutdown();
        }

        bool ConnectionPool::Initialize(DatabaseError* err) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);

                for (size_t i = 0; i < m_config.minConnections; ++i) {
                    if (!createConnection(err)) {
                        m_connections.clear();
                        return false;
                    }
                }
            }

            AR_LOG_INFO("Database", "Connection pool initialized with %zu connections", TotalConnections());
            return true;
        }

        void ConnectionPool::Shutdown() {
            bool wasShutdown = m_shutdown.exchange(true, std::memory_order_acq_rel);
            if (wasShutdown) {
                return;
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            m_cv.notify_all();

            if (m_activeCount.load(std::memory_order_acquire) > 0) {
                AR_LOG_WARN("Database", "Connection pool shut down with %zu connections in use",
                    m_activeCount.load(std::memory_order_acquire));
            }

            // Borrowed connections stay alive through their shared_ptr until released
            m_connections.clear();
            m_activeCount.store(0, std::memory_order_release);

            AR_LOG_INFO("Database", "Connection pool shut down");
        }

        std::shared_ptr<SQLite::Database> ConnectionPool::Acquire(
            std::chrono::milliseconds timeout,
            DatabaseError* err
        ) {
            std::unique_lock<std::mutex> lock(m_mutex);

            auto deadline = std::chrono::steady_clock::now() + timeout;

            while (true) {
                if (m_shutdown.load(std::memory_order_acquire)) {
                    DatabaseManager::setError(err, SQLITE_MISUSE, "Connection pool is shut down", "ConnectionPool::Acquire");
                    return nullptr;
                }

                for (auto& pooled : m_connections) {
                    if (!pooled.inUse) {
                        pooled.inUse = true;
                        pooled.lastUsed = std::chrono::steady_clock::now();
                        m_activeCount.fetch_add(1, std::memory_order_relaxed);
                        return pooled.connection;
                    }
                }

                if (m_connections.size() < m_config.maxConnections) {
                    if (!createConnection(err)) {
                        return nullptr;
                    }
                    auto& pooled = m_connections.back();
                    pooled.inUse = true;
                    m_activeCount.fetch_add(1, std::memory_order_relaxed);
                    return pooled.connection;
                }

                if (m_cv.wait_until(lock, deadline) == std::cv_status::timeout) {
                    DatabaseManager::setError(err, SQLITE_BUSY, "Connection acquisition timeout", "ConnectionPool::Acquire");
                    AR_LOG_WARN("Database", "Connection acquisition timeout after %lld ms",
                        static_cast<long long>(timeout.count()));
                    return nullptr;
                }
            }
        }

        void ConnectionPool::Release(std::shared_ptr<SQLite::Database> conn) {
            if (!conn) return;

            std::lock_guard<std::mutex> lock(m_mutex);

            for (auto& pooled : m_connections) {
                if (pooled.connection == conn) {
                    pooled.inUse = false;
                    pooled.lastUsed = std::chrono::steady_clock::now();
                    m_activeCount.fetch_sub(1, std::memory_order_relaxed);
                    m_cv.notify_one();
                    return;
                }
            }

            if (!m_shutdown.load(std::memory_order_acquire)) {
                AR_LOG_WARN("Database", "Released connection not found in pool");
            }
        }

        size_t ConnectionPool::TotalConnections() const noexcept {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_connections.size();
        }

        /**
         * @brief Opens a new connection and appends it to the pool.
         * @note Caller must hold m_mutex lock
         */
        bool ConnectionPool::createConnection(DatabaseError* err) {
            try {
                const int flags = m_config.readOnly
                    ? SQLite::OPEN_READONLY
                    : (SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);

                auto connection = std::make_shared<SQLite::Database>(
                    m_config.databasePath,
                    flags,
                    m_config.busyTimeoutMs
                );

                if (!configureConnection(*connection, err)) {
                    return false;
                }

                PooledConnection pooled;
                pooled.connection = connection;
                pooled.lastUsed = std::chrono::steady_clock::now();
                pooled.inUse = false;

                m_connections.push_back(std::move(pooled));

                AR_LOG_DEBUG("Database", "Created new database connection (%zu total)", m_connections.size());
                return true;
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, "createConnection");
                AR_LOG_ERROR("Database", "Failed to create connection: %s", ex.what());
                return false;
            }
        }

        bool ConnectionPool::configureConnection(SQLite::Database& db, DatabaseError* err) {
            try {
                if (m_config.enableForeignKeys) {
                    db.exec("PRAGMA foreign_keys = ON");
                }

                if (!m_config.readOnly) {
                    // page_size only takes effect before the first write
                    db.exec("PRAGMA page_size = " + std::to_string(m_config.pageSizeBytes));
                    db.exec(m_config.enableWAL ? "PRAGMA journal_mode = WAL" : "PRAGMA journal_mode = DELETE");
                }

                db.exec("PRAGMA synchronous = " + m_config.synchronousMode);
                db.exec("PRAGMA cache_size = -" + std::to_string(m_config.cacheSizeKB));
                db.exec("PRAGMA temp_store = " + m_config.tempStore);

                if (m_config.enableMemoryMappedIO) {
                    db.exec("PRAGMA mmap_size = " + std::to_string(m_config.mmapSizeMB * 1024 * 1024));
                }

                if (m_config.enableSecureDelete) {
                    db.exec("PRAGMA secure_delete = ON");
                }

                return true;
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, "configureConnection");
                AR_LOG_ERROR("Database", "Failed to configure connection: %s", ex.what());
                return false;
            }
        }

        // ============================================================================
        // TRANSACTION IMPLEMENTATION
        // ============================================================================
        //
        // Transaction Types:
        // ------------------
        // - DEFERRED: Lock acquired on first database access (default)
        // - IMMEDIATE: Write lock acquired immediately, reads still allowed
        // - EXCLUSIVE: Full database lock, no concurrent access
        //
        // Usage Pattern:
        // --------------
        //   auto txn = manager.BeginTransaction(Transaction::Type::Immediate);
        //   if (!txn || !txn->IsActive()) { handle error }
        //
        //   txn->ExecuteWithParams("UPDATE ...", &err, ...);
        //   txn->Commit();
        //   // If Commit() not called, destructor performs automatic rollback
        // ============================================================================

        Transaction::Transaction(
            SQLite::Database& db,
            std::shared_ptr<SQLite::Database> conn,
            DatabaseManager* manager,
            Type type,
            DatabaseError* err
        ) : m_db(&db)
            , m_connection(std::move(conn))
            , m_manager(manager)
        {
            try {
                const char* sql = nullptr;
                switch (type) {
                case Type::Deferred:
                    sql = "BEGIN DEFERRED TRANSACTION";
                    break;
                case Type::Immediate:
                    sql = "BEGIN IMMEDIATE TRANSACTION";
                    break;
                }

                m_db->exec(sql);
                m_active = true;

                AR_LOG_TRACE("Database", "Transaction started");
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, "Transaction::Begin");
                AR_LOG_WARN("Database", "Failed to begin transaction: %s", ex.what());
                m_active = false;
            }
        }

        Transaction::~Transaction() {
            if (m_active && !m_committed && m_db) {
                try {
                    m_db->exec("ROLLBACK");
                    AR_LOG_DEBUG("Database", "Transaction rolled back (destructor)");
                }
                catch (const SQLite::Exception& ex) {
                    AR_LOG_ERROR("Database", "Failed to rollback transaction: %s", ex.what());
                }
            }

            if (m_connection && m_manager) {
                m_manager->ReleaseConnection(m_connection);
            }
        }

        Transaction::Transaction(Transaction&& other) noexcept
            : m_db(other.m_db)
            , m_connection(std::move(other.m_connection))
            , m_manager(other.m_manager)
            , m_active(other.m_active)
            , m_committed(other.m_committed)
        {
            other.m_db = nullptr;
            other.m_manager = nullptr;
            other.m_active = false;
            other.m_committed = false;
        }

        Transaction& Transaction::operator=(Transaction&& other) noexcept {
            if (this != &other) {
                if (m_active && !m_committed && m_db) {
                    try {
                        m_db->exec("ROLLBACK");
                    }
                    catch (const SQLite::Exception& ex) {
                        AR_LOG_ERROR("Database", "Failed to rollback transaction: %s", ex.what());
                    }
                }

                if (m_connection && m_manager) {
                    m_manager->ReleaseConnection(m_connection);
                }

                m_db = other.m_db;
                m_connection = std::move(other.m_connection);
                m_manager = other.m_manager;
                m_active = other.m_active;
                m_committed = other.m_committed;

                other.m_db = nullptr;
                other.m_manager = nullptr;
                other.m_active = false;
                other.m_committed = false;
            }
            return *this;
        }

        bool Transaction::requireActive(DatabaseError* err, const char* context) const {
            if (m_active && m_db) {
                return true;
            }
            DatabaseManager::setError(err, SQLITE_MISUSE, "Transaction not active", context);
            return false;
        }

        bool Transaction::Execute(std::string_view sql, DatabaseError* err) {
            if (!requireActive(err, "Transaction::Execute")) {
                return false;
            }

            try {
                m_db->exec(std::string(sql));
                return true;
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, "Transaction::Execute");
                if (err) err->query.assign(sql);
                return false;
            }
        }

        std::unique_ptr<SQLite::Statement> Transaction::Prepare(std::string_view sql, DatabaseError* err) {
            if (!requireActive(err, "Transaction::Prepare")) {
                return nullptr;
            }

            try {
                return std::make_unique<SQLite::Statement>(*m_db, std::string(sql));
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, "Transaction::Prepare");
                if (err) err->query.assign(sql);
                return nullptr;
            }
        }

        int64_t Transaction::LastInsertRowId() const noexcept {
            return m_db ? static_cast<int64_t>(m_db->getLastInsertRowid()) : 0;
        }

        int Transaction::ChangedRowCount() const noexcept {
            return m_db ? sqlite3_changes(m_db->getHandle()) : 0;
        }

        bool Transaction::Commit(DatabaseError* err) {
            if (!requireActive(err, "Transaction::Commit")) {
                return false;
            }

            try {
                m_db->exec("COMMIT");
                m_committed = true;
                m_active = false;

                AR_LOG_TRACE("Database", "Transaction committed");
                return true;
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, "Transaction::Commit");
                AR_LOG_ERROR("Database", "Failed to commit transaction: %s", ex.what());
                return false;
            }
        }

        bool Transaction::Rollback(DatabaseError* err) {
            if (!requireActive(err, "Transaction::Rollback")) {
                return false;
            }

            try {
                m_db->exec("ROLLBACK");
                m_active = false;

                AR_LOG_DEBUG("Database", "Transaction rolled back");
                return true;
            }
            catch (const SQLite::Exception& ex) {
                DatabaseManager::setError(err, ex, "Transaction::Rollback");
                AR_LOG_ERROR("Database", "Failed to rollback transaction: %s", ex.what());
                return false;
            }
        }

        // ============================================================================
        // DATABASE MANAGER IMPLEMENTATION
        // ============================================================================

        DatabaseManager::DatabaseManager() = default;

        DatabaseManager::~DatabaseManager() {
            Shutdown();
        }

        bool DatabaseManager::Initialize(const DatabaseConfig& config, DatabaseError* err) {
            if (m_initialized.load(std::memory_order_acquire)) {
                AR_LOG_WARN("Database", "DatabaseManager already initialized");
                return true;
            }

            AR_LOG_SCOPE("Database");

            if (!config.IsValid()) {
                setError(err, SQLITE_MISUSE, "Invalid database configuration", "Initialize");
                return false;
            }

            std::unique_lock<std::shared_mutex> lock(m_configMutex);
            m_config = config;

            if (m_connectionPool) {
                m_connectionPool->Shutdown();
                m_connectionPool.reset();
            }

            if (!prepareDatabaseFile(err)) {
                return false;
            }

            m_connectionPool = std::make_unique<ConnectionPool>(m_config);
            if (!m_connectionPool->Initialize(err)) {
                AR_LOG_ERROR("Database", "Failed to initialize connection pool");
                m_connectionPool.reset();
                return false;
            }

            m_initialized.store(true, std::memory_order_release);

            AR_LOG_INFO("Database", "DatabaseManager initialized (%s)", m_config.databasePath.c_str());
            return true;
        }

        void DatabaseManager::Shutdown() {
            const bool wasInitialized = m_initialized.exchange(false, std::memory_order_acq_rel);
            if (!wasInitialized) {
                return;
            }

            std::unique_lock<std::shared_mutex> lock(m_configMutex);
            if (m_connectionPool) {
                m_connectionPool->Shutdown();
            }

            AR_LOG_INFO("Database", "DatabaseManager shut down");
        }

        /**
         * @brief Creates the parent directory of an on-disk database.
         *
         * In-memory and URI databases are left alone.
         */
        bool DatabaseManager::prepareDatabaseFile(DatabaseError* err) {
            const std::string& path = m_config.databasePath;
            if (path == ":memory:" || path.rfind("file:", 0) == 0) {
                return true;
            }

            std::error_code ec;
            const std::filesystem::path p(path);
            if (p.has_parent_path() && !std::filesystem::exists(p.parent_path(), ec)) {
                std::filesystem::create_directories(p.parent_path(), ec);
                if (ec) {
                    setError(err, SQLITE_CANTOPEN, "Cannot create database directory: " + ec.message(), "Initialize");
                    return false;
                }
            }
            return true;
        }

        bool DatabaseManager::Execute(std::string_view sql, DatabaseError* err) {
            auto conn = AcquireConnection(err);
            if (!conn) return false;

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
                conn->exec(std::string(sql));
                return true;
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, "Execute");
                if (err) err->query.assign(sql);
                return false;
            }
        }

        /**
         * @brief Executes multiple SQL statements in a single IMMEDIATE transaction.
         *
         * All statements run atomically - either all succeed or all are
         * rolled back.
         */
        bool DatabaseManager::ExecuteMany(const std::vector<std::string>& statements, DatabaseError* err) {
            auto txn = BeginTransaction(Transaction::Type::Immediate, err);
            if (!txn || !txn->IsActive()) {
                return false;
            }

            for (const auto& sql : statements) {
                if (!txn->Execute(sql, err)) {
                    if (err) err->context = "ExecuteMany";
                    return false;  // destructor rolls back
                }
            }

            return txn->Commit(err);
        }

        QueryResult DatabaseManager::Query(std::string_view sql, DatabaseError* err) {
            auto conn = AcquireConnection(err);
            if (!conn) return QueryResult{};

            try {
                auto stmt = std::make_unique<SQLite::Statement>(*conn, std::string(sql));
                return QueryResult{ std::move(stmt), conn, this };
            }
            catch (const SQLite::Exception& ex) {
                setError(err, ex, "Query");
                ReleaseConnection(conn);
                return QueryResult{};
            }
        }

        std::unique_ptr<Transaction> DatabaseManager::BeginTransaction(
            Transaction::Type type,
            DatabaseError* err
        ) {
            auto conn = AcquireConnection(err);
            if (!conn) return nullptr;

            return std::make_unique<Transaction>(*conn, conn, this, type, err);
        }

        bool DatabaseManager::TableExists(std::string_view tableName, DatabaseError* err) {
            auto result = QueryWithParams(
                "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?",
                err,
                std::string(tableName)
            );

            if (result.Next(err)) {
                return result.GetInt(0) > 0;
            }
            return false;
        }

        std::vector<std::string> DatabaseManager::GetColumnNames(std::string_view tableName, DatabaseError* err) {
            std::vector<std::string> columns;

            if (!IsValidSqlIdentifier(tableName)) {
                setError(err, SQLITE_MISUSE, "Invalid table name", "GetColumnNames");
                return columns;
            }

            auto result = Query("PRAGMA table_info(" + std::string(tableName) + ")", err);
            while (result.Next(err)) {
                columns.push_back(result.GetString(1));  // Column name is at index 1
            }

            return columns;
        }

        std::shared_ptr<SQLite::Database> DatabaseManager::AcquireConnection(DatabaseError* err) {
            if (!m_initialized.load(std::memory_order_acquire)) {
                setError(err, SQLITE_MISUSE, "DatabaseManager not initialized", "AcquireConnection");
                return nullptr;
            }

            std::shared_lock<std::shared_mutex> lock(m_configMutex);
            if (!m_connectionPool) {
                setError(err, SQLITE_MISUSE, "Connection pool not available", "AcquireConnection");
                return nullptr;
            }

            return m_connectionPool->Acquire(m_config.connectionTimeout, err);
        }

        void DatabaseManager::ReleaseConnection(std::shared_ptr<SQLite::Database> conn) {
            std::shared_lock<std::shared_mutex> lock(m_configMutex);
            if (m_connectionPool) {
                m_connectionPool->Release(std::move(conn));
            }
        }

        void DatabaseManager::setError(DatabaseError* err, int code, std::string_view msg, std::string_view ctx) {
            if (!err) return;
            err->sqliteCode = code;
            err->extendedCode = code;
            err->message.assign(msg);
            err->context.assign(ctx);
        }

        void DatabaseManager::setError(DatabaseError* err, const SQLite::Exception& ex, std::string_view ctx) {
            if (!err) return;
            err->sqliteCode = ex.getErrorCode();
            err->extendedCode = ex.getExtendedErrorCode();
            err->message = ex.what();
            err->context.assign(ctx);
        }

    } // namespace Database
} // namespace Arbor
