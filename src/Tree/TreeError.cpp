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
#include "TreeError.hpp"

namespace Arbor {
    namespace Tree {

        const char* TreeErrorKindToString(TreeErrorKind kind) noexcept {
            switch (kind) {
            case TreeErrorKind::None:                return "None";
            case TreeErrorKind::NotFound:            return "NotFound";
            case TreeErrorKind::CycleRejected:       return "CycleRejected";
            case TreeErrorKind::BoundaryOverflow:    return "BoundaryOverflow";
            case TreeErrorKind::ConcurrencyConflict: return "ConcurrencyConflict";
            case TreeErrorKind::InvalidState:        return "InvalidState";
            case TreeErrorKind::InvalidArgument:     return "InvalidArgument";
            case TreeErrorKind::StorageFailure:      return "StorageFailure";
            }
            return "Unknown";
        }

        std::string TreeError::ToString() const {
            std::string out = TreeErrorKindToString(kind);
            if (!message.empty()) {
                out += ": ";
                out += message;
            }
            if (!context.empty()) {
                out += " [";
                out += context;
                out += "]";
            }
            return out;
        }

        void SetTreeError(TreeError* err, TreeErrorKind kind, std::string_view message, std::string_view context) {
            if (!err) return;
            err->kind = kind;
            err->message.assign(message);
            err->context.assign(context);
            err->sqliteCode = 0;
            err->extendedCode = 0;
        }

        void SetTreeError(TreeError* err, const Database::DatabaseError& dbErr, std::string_view context) {
            if (!err) return;
            err->kind = dbErr.IsBusy() ? TreeErrorKind::ConcurrencyConflict : TreeErrorKind::StorageFailure;
            err->message = dbErr.message;
            err->context.assign(context);
            err->sqliteCode = dbErr.sqliteCode;
            err->extendedCode = dbErr.extendedCode;
        }

    } // namespace Tree
} // namespace Arbor
