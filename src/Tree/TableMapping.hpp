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
 * @file TableMapping.hpp
 * @brief Describes the table a nested-set tree lives in and renders its SQL.
 *
 * Identifiers are spliced into SQL text, so Validate() must succeed before any
 * of the SQL accessors are used. Values are always bound as parameters.
 */

#include "NodeTypes.hpp"
#include "TreeError.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace Arbor {
    namespace Tree {

        enum class ColumnType : uint8_t {
            Integer,
            Real,
            Text
        };

        [[nodiscard]] const char* ColumnTypeToSql(ColumnType type) noexcept;

        struct ColumnSpec {
            std::string name;
            ColumnType type = ColumnType::Text;
            bool nullable = true;
        };

        struct TableMapping {
            std::string table;
            std::string primaryKey = "id";
            std::string leftColumn = "lft";
            std::string rightColumn = "rgt";
            std::vector<ColumnSpec> attributes;

            /// Attribute shown by RenderForest; empty selects the first text column.
            std::string labelColumn;

            /**
             * @brief Checks identifiers, duplicates and the label column.
             * @return false with InvalidArgument on the first problem found
             */
            bool Validate(TreeError* err = nullptr) const;

            /// @brief Index of the named attribute in `attributes`, or -1.
            int AttributeIndex(std::string_view name) const noexcept;

            /// @brief Label attribute name after defaulting; empty when none qualifies.
            std::string EffectiveLabelColumn() const;

            // === DDL ===
            std::string CreateTableSql() const;
            std::vector<std::string> CreateIndexSql() const;

            // === Row access ===

            /// @brief "id, lft, rgt, a1, ..." optionally qualified by a table alias.
            std::string SelectList(std::string_view alias = {}) const;

            std::string SelectByIdSql() const;
            std::string SelectBoundaryByIdSql() const;
            std::string SelectAllSql() const;
            std::string MaxRightSql() const;
            std::string InsertSql() const;
            std::string UpdateAttributesSql(const std::vector<std::string>& columns) const;

            // === Range queries (parameters: left, right of the reference node) ===
            std::string AncestorsSql() const;
            std::string DescendantsSql() const;
            std::string ChildrenSql() const;     ///< binds left, right, left, right
            std::string ParentSql() const;
            std::string DepthSql() const;
            std::string RootsSql() const;

            // === Boundary rewrites ===
            std::string ShiftLeftSql() const;    ///< binds amount, threshold
            std::string ShiftRightSql() const;   ///< binds amount, threshold
            std::string DeleteRangeSql() const;  ///< binds left, right
            std::string ParkSql() const;         ///< binds left, right
            std::string UnparkSql() const;       ///< binds offset, offset
        };

    } // namespace Tree
} // namespace Arbor
