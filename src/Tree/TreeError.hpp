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

#include "../Database/DatabaseManager.hpp"

#include <string>
#include <string_view>

namespace Arbor {
    namespace Tree {

        /**
         * @brief Failure categories reported by tree operations.
         */
        enum class TreeErrorKind : uint8_t {
            None = 0,
            NotFound,             ///< Referenced node row does not exist
            CycleRejected,        ///< Move target lies inside the moved subtree
            BoundaryOverflow,     ///< Plan would exceed the maximum boundary value
            ConcurrencyConflict,  ///< Lock contention; the operation may be retried
            InvalidState,         ///< Handle is unpersisted, deleted or from another table
            InvalidArgument,      ///< Malformed boundaries or table mapping
            StorageFailure        ///< Any other storage error
        };

        [[nodiscard]] const char* TreeErrorKindToString(TreeErrorKind kind) noexcept;

        /**
         * @brief Structured error for tree operations.
         *
         * Carries the SQLite codes through unchanged when the failure came from
         * the storage layer.
         */
        struct TreeError {
            TreeErrorKind kind = TreeErrorKind::None;
            std::string message;
            std::string context;        ///< Operation name
            int sqliteCode = 0;
            int extendedCode = 0;

            bool HasError() const noexcept { return kind != TreeErrorKind::None; }

            /// @brief True when re-issuing the same operation may succeed.
            bool IsRetryable() const noexcept { return kind == TreeErrorKind::ConcurrencyConflict; }

            void Clear() noexcept {
                kind = TreeErrorKind::None;
                message.clear();
                context.clear();
                sqliteCode = 0;
                extendedCode = 0;
            }

            /// @brief "Kind: message [context]" for logs and test output.
            std::string ToString() const;
        };

        /// @brief Fills err (if non-null) with a tree-level failure.
        void SetTreeError(TreeError* err, TreeErrorKind kind, std::string_view message, std::string_view context);

        /**
         * @brief Converts a storage failure into a tree failure.
         *
         * SQLITE_BUSY / SQLITE_LOCKED (primary or extended) become
         * ConcurrencyConflict, everything else StorageFailure.
         */
        void SetTreeError(TreeError* err, const Database::DatabaseError& dbErr, std::string_view context);

    } // namespace Tree
} // namespace Arbor
