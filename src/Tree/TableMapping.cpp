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
#include "TableMapping.hpp"
#include "../Database/DatabaseManager.hpp"

#include <unordered_set>

namespace Arbor {
    namespace Tree {

        const char* ColumnTypeToSql(ColumnType type) noexcept {
            switch (type) {
            case ColumnType::Integer: return "INTEGER";
            case ColumnType::Real:    return "REAL";
            case ColumnType::Text:    return "TEXT";
            }
            return "BLOB";
        }

        // ============================================================================
        // Validation
        // ============================================================================

        bool TableMapping::Validate(TreeError* err) const {
            using Database::IsValidSqlIdentifier;

            const std::pair<const char*, const std::string*> fixed[] = {
                { "table", &table },
                { "primary key", &primaryKey },
                { "left column", &leftColumn },
                { "right column", &rightColumn },
            };

            for (const auto& [what, name] : fixed) {
                if (!IsValidSqlIdentifier(*name)) {
                    SetTreeError(err, TreeErrorKind::InvalidArgument,
                        std::string("Invalid ") + what + " identifier '" + *name + "'", "TableMapping::Validate");
                    return false;
                }
            }

            std::unordered_set<std::string> seen{ primaryKey, leftColumn, rightColumn };
            if (seen.size() != 3) {
                SetTreeError(err, TreeErrorKind::InvalidArgument,
                    "Primary key, left and right columns must be distinct", "TableMapping::Validate");
                return false;
            }

            for (const auto& column : attributes) {
                if (!IsValidSqlIdentifier(column.name)) {
                    SetTreeError(err, TreeErrorKind::InvalidArgument,
                        "Invalid attribute identifier '" + column.name + "'", "TableMapping::Validate");
                    return false;
                }
                if (!seen.insert(column.name).second) {
                    SetTreeError(err, TreeErrorKind::InvalidArgument,
                        "Duplicate column '" + column.name + "'", "TableMapping::Validate");
                    return false;
                }
            }

            if (!labelColumn.empty() && AttributeIndex(labelColumn) < 0) {
                SetTreeError(err, TreeErrorKind::InvalidArgument,
                    "Label column '" + labelColumn + "' is not an attribute", "TableMapping::Validate");
                return false;
            }

            return true;
        }

        int TableMapping::AttributeIndex(std::string_view name) const noexcept {
            for (size_t i = 0; i < attributes.size(); ++i) {
                if (attributes[i].name == name) return static_cast<int>(i);
            }
            return -1;
        }

        std::string TableMapping::EffectiveLabelColumn() const {
            if (!labelColumn.empty()) return labelColumn;
            for (const auto& column : attributes) {
                if (column.type == ColumnType::Text) return column.name;
            }
            return std::string();
        }

        // ============================================================================
        // DDL
        // ============================================================================

        std::string TableMapping::CreateTableSql() const {
            std::string sql = "CREATE TABLE IF NOT EXISTS " + table + " (" +
                primaryKey + " INTEGER PRIMARY KEY AUTOINCREMENT, " +
                leftColumn + " INTEGER NOT NULL, " +
                rightColumn + " INTEGER NOT NULL";

            for (const auto& column : attributes) {
                sql += ", " + column.name + " " + ColumnTypeToSql(column.type);
                if (!column.nullable) sql += " NOT NULL";
            }

            // No UNIQUE or CHECK on the boundaries: shifts and parking pass
            // through intermediate states that CheckInvariants would reject.
            sql += ")";
            return sql;
        }

        std::vector<std::string> TableMapping::CreateIndexSql() const {
            return {
                "CREATE INDEX IF NOT EXISTS idx_" + table + "_" + leftColumn +
                    " ON " + table + "(" + leftColumn + ")",
                "CREATE INDEX IF NOT EXISTS idx_" + table + "_" + rightColumn +
                    " ON " + table + "(" + rightColumn + ")",
            };
        }

        // ============================================================================
        // Row access
        // ============================================================================

        std::string TableMapping::SelectList(std::string_view alias) const {
            const std::string prefix = alias.empty() ? std::string() : std::string(alias) + ".";

            std::string list = prefix + primaryKey + ", " + prefix + leftColumn + ", " + prefix + rightColumn;
            for (const auto& column : attributes) {
                list += ", " + prefix + column.name;
            }
            return list;
        }

        std::string TableMapping::SelectByIdSql() const {
            return "SELECT " + SelectList() + " FROM " + table + " WHERE " + primaryKey + " = ?";
        }

        std::string TableMapping::SelectBoundaryByIdSql() const {
            return "SELECT " + leftColumn + ", " + rightColumn + " FROM " + table + " WHERE " + primaryKey + " = ?";
        }

        std::string TableMapping::SelectAllSql() const {
            return "SELECT " + SelectList() + " FROM " + table + " ORDER BY " + leftColumn;
        }

        std::string TableMapping::MaxRightSql() const {
            return "SELECT COALESCE(MAX(" + rightColumn + "), 0) FROM " + table;
        }

        std::string TableMapping::InsertSql() const {
            std::string columns = leftColumn + ", " + rightColumn;
            std::string placeholders = "?, ?";
            for (const auto& column : attributes) {
                columns += ", " + column.name;
                placeholders += ", ?";
            }
            return "INSERT INTO " + table + " (" + columns + ") VALUES (" + placeholders + ")";
        }

        std::string TableMapping::UpdateAttributesSql(const std::vector<std::string>& columns) const {
            std::string sql = "UPDATE " + table + " SET ";
            for (size_t i = 0; i < columns.size(); ++i) {
                if (i > 0) sql += ", ";
                sql += columns[i] + " = ?";
            }
            sql += " WHERE " + primaryKey + " = ?";
            return sql;
        }

        // ============================================================================
        // Range queries
        // ============================================================================

        std::string TableMapping::AncestorsSql() const {
            return "SELECT " + SelectList() + " FROM " + table +
                " WHERE " + leftColumn + " < ? AND " + rightColumn + " > ?" +
                " ORDER BY " + leftColumn;
        }

        std::string TableMapping::DescendantsSql() const {
            return "SELECT " + SelectList() + " FROM " + table +
                " WHERE " + leftColumn + " > ? AND " + rightColumn + " < ?" +
                " ORDER BY " + leftColumn;
        }

        std::string TableMapping::ChildrenSql() const {
            const std::string& l = leftColumn;
            const std::string& r = rightColumn;
            return "SELECT " + SelectList("c") + " FROM " + table + " c" +
                " WHERE c." + l + " > ? AND c." + r + " < ?" +
                " AND NOT EXISTS (SELECT 1 FROM " + table + " m" +
                " WHERE m." + l + " > ? AND m." + r + " < ?" +
                " AND m." + l + " < c." + l + " AND m." + r + " > c." + r + ")" +
                " ORDER BY c." + l;
        }

        std::string TableMapping::ParentSql() const {
            return "SELECT " + SelectList() + " FROM " + table +
                " WHERE " + leftColumn + " < ? AND " + rightColumn + " > ?" +
                " ORDER BY " + leftColumn + " DESC LIMIT 1";
        }

        std::string TableMapping::DepthSql() const {
            return "SELECT COUNT(*) FROM " + table +
                " WHERE " + leftColumn + " < ? AND " + rightColumn + " > ?";
        }

        std::string TableMapping::RootsSql() const {
            const std::string& l = leftColumn;
            const std::string& r = rightColumn;
            return "SELECT " + SelectList("n") + " FROM " + table + " n" +
                " WHERE NOT EXISTS (SELECT 1 FROM " + table + " a" +
                " WHERE a." + l + " < n." + l + " AND a." + r + " > n." + r + ")" +
                " ORDER BY n." + l;
        }

        // ============================================================================
        // Boundary rewrites
        // ============================================================================

        std::string TableMapping::ShiftLeftSql() const {
            return "UPDATE " + table + " SET " + leftColumn + " = " + leftColumn + " + ?" +
                " WHERE " + leftColumn + " > ?";
        }

        std::string TableMapping::ShiftRightSql() const {
            return "UPDATE " + table + " SET " + rightColumn + " = " + rightColumn + " + ?" +
                " WHERE " + rightColumn + " > ?";
        }

        std::string TableMapping::DeleteRangeSql() const {
            return "DELETE FROM " + table +
                " WHERE " + leftColumn + " >= ? AND " + rightColumn + " <= ?";
        }

        std::string TableMapping::ParkSql() const {
            return "UPDATE " + table + " SET " + leftColumn + " = -" + leftColumn + ", " +
                rightColumn + " = -" + rightColumn +
                " WHERE " + leftColumn + " >= ? AND " + rightColumn + " <= ?";
        }

        std::string TableMapping::UnparkSql() const {
            return "UPDATE " + table + " SET " + leftColumn + " = -" + leftColumn + " + ?, " +
                rightColumn + " = -" + rightColumn + " + ?" +
                " WHERE " + leftColumn + " < 0";
        }

    } // namespace Tree
} // namespace Arbor
