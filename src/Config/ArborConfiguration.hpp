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
 * Arbor - CONFIGURATION
 * ============================================================================
 *
 * @file ArborConfiguration.hpp
 * @brief Application configuration loaded from JSON.
 *
 * File layout (every key optional; missing keys keep their defaults,
 * unknown keys are ignored):
 *
 * @code
 *   {
 *     "database": { "path": "tree.db", "enableWAL": true, "busyTimeoutMs": 5000,
 *                   "maxConnections": 8, "synchronousMode": "NORMAL" },
 *     "logging":  { "minimalLevel": "Info", "toFile": true, "logDirectory": "logs" },
 *     "tree":     { "maxBoundary": 4611686018427387904, "verifyAfterMutation": false }
 *   }
 * @endcode
 *
 * A key present with the wrong JSON type is an error, not a silent default.
 *
 * ============================================================================
 */

#include "../Database/DatabaseManager.hpp"
#include "../Tree/NestedSetStore.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace Arbor {
    namespace Config {

        struct ArborConfiguration {
            Database::DatabaseConfig database;
            Utils::LoggerConfig logging;
            Tree::NestedSetOptions tree;

            [[nodiscard]] bool IsValid() const noexcept;

            /// @brief First validation problem, empty when IsValid().
            [[nodiscard]] std::string ValidationMessage() const;

            [[nodiscard]] Utils::JSON::Json ToJsonObject() const;
            [[nodiscard]] std::string ToJson(bool pretty = true) const;
        };

        /**
         * @brief Loads and validates configuration from JSON text.
         *
         * @param out Receives the configuration; untouched on failure
         */
        [[nodiscard]] bool LoadConfigurationFromJson(std::string_view jsonText, ArborConfiguration& out,
                                                     Utils::JSON::Error* err = nullptr);

        [[nodiscard]] bool LoadConfigurationFromFile(const std::filesystem::path& path, ArborConfiguration& out,
                                                     Utils::JSON::Error* err = nullptr);

        [[nodiscard]] bool SaveConfigurationToFile(const std::filesystem::path& path, const ArborConfiguration& config,
                                                   Utils::JSON::Error* err = nullptr);

    } // namespace Config
} // namespace Arbor
