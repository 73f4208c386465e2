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
#include "NodeTypes.hpp"

#include <cstdio>
#include <type_traits>

namespace Arbor {
    namespace Tree {

        std::string AttributeToString(const AttributeValue& value) {
            return std::visit([](const auto& v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return "NULL";
                }
                else if constexpr (std::is_same_v<T, int64_t>) {
                    return std::to_string(v);
                }
                else if constexpr (std::is_same_v<T, double>) {
                    char buf[64];
                    std::snprintf(buf, sizeof(buf), "%g", v);
                    return buf;
                }
                else {
                    return v;
                }
            }, value);
        }

        const char* NodeStateToString(NodeState state) noexcept {
            switch (state) {
            case NodeState::Unpersisted: return "Unpersisted";
            case NodeState::Attached:    return "Attached";
            case NodeState::Deleted:     return "Deleted";
            }
            return "Unknown";
        }

    } // namespace Tree
} // namespace Arbor
