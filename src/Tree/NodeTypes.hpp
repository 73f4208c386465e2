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

#include "BoundaryAllocator.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <utility>
#include <cstdint>

namespace Arbor {
    namespace Tree {

        // ============================================================================
        // Attribute values
        // ============================================================================

        /// Null, INTEGER, REAL or TEXT column value.
        using AttributeValue = std::variant<std::monostate, int64_t, double, std::string>;

        /// Caller-owned columns of a node row, in insertion order.
        using Attributes = std::vector<std::pair<std::string, AttributeValue>>;

        [[nodiscard]] inline bool IsNull(const AttributeValue& value) noexcept {
            return std::holds_alternative<std::monostate>(value);
        }

        /// @brief Returns the value stored under name, or nullptr.
        [[nodiscard]] inline const AttributeValue* FindAttribute(const Attributes& attrs, std::string_view name) noexcept {
            for (const auto& [key, value] : attrs) {
                if (key == name) return &value;
            }
            return nullptr;
        }

        /// @brief Display form: "NULL", integer digits, %g real or the text itself.
        [[nodiscard]] std::string AttributeToString(const AttributeValue& value);

        // ============================================================================
        // Node handle / row
        // ============================================================================

        enum class NodeState : uint8_t {
            Unpersisted,  ///< Never written; default-constructed handles
            Attached,     ///< Backed by a stored row
            Deleted       ///< Removed by DeleteSubtree
        };

        [[nodiscard]] const char* NodeStateToString(NodeState state) noexcept;

        /**
         * @brief Reference to a stored node together with its last-read boundaries.
         *
         * The boundaries are a snapshot; tree operations always re-read them
         * by id before planning.
         */
        struct NodeHandle {
            int64_t id = 0;
            Boundary boundary;
            NodeState state = NodeState::Unpersisted;
            std::string table;

            bool IsAttached() const noexcept { return state == NodeState::Attached; }
        };

        struct NodeRow {
            NodeHandle handle;
            Attributes attributes;

            const AttributeValue* Find(std::string_view name) const noexcept {
                return FindAttribute(attributes, name);
            }
        };

    } // namespace Tree
} // namespace Arbor
