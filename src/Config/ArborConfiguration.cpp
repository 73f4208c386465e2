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
#include "ArborConfiguration.hpp"

#include <type_traits>

namespace Arbor {
    namespace Config {

        using Utils::JSON::Json;

        namespace {

            const char* backPressureToString(Utils::LoggerConfig::BackPressurePolicy policy) noexcept {
                switch (policy) {
                case Utils::LoggerConfig::BackPressurePolicy::Block:      return "Block";
                case Utils::LoggerConfig::BackPressurePolicy::DropOldest: return "DropOldest";
                case Utils::LoggerConfig::BackPressurePolicy::DropNewest: return "DropNewest";
                }
                return "DropOldest";
            }

            bool backPressureFromString(const std::string& name, Utils::LoggerConfig::BackPressurePolicy& out) noexcept {
                if (name == "Block")      { out = Utils::LoggerConfig::BackPressurePolicy::Block; return true; }
                if (name == "DropOldest") { out = Utils::LoggerConfig::BackPressurePolicy::DropOldest; return true; }
                if (name == "DropNewest") { out = Utils::LoggerConfig::BackPressurePolicy::DropNewest; return true; }
                return false;
            }

            /**
             * @brief Reads section.key into out when present.
             *
             * Records the first type mismatch in problem; later calls are no-ops
             * once a problem has been recorded. Unsigned fields reject negative numbers.
             */
            template <typename T>
            void readField(const Json& root, const std::string& path, T& out, std::string& problem) {
                if (!problem.empty() || !Utils::JSON::Contains(root, path)) return;

                if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
                    const Json& node = root.at(Json::json_pointer(Utils::JSON::ToJsonPointer(path)));
                    if (!node.is_number_unsigned()) {
                        problem = "Key '" + path + "' must be a non-negative integer";
                        return;
                    }
                }

                T value{};
                if (!Utils::JSON::Get<T>(root, path, value)) {
                    problem = "Key '" + path + "' has the wrong type";
                    return;
                }
                out = std::move(value);
            }

            void readLevel(const Json& root, const std::string& path, Utils::LogLevel& out, std::string& problem) {
                std::string name;
                const bool present = Utils::JSON::Contains(root, path);
                readField(root, path, name, problem);
                if (!problem.empty() || !present) return;

                if (!Utils::LogLevelFromString(name, out)) {
                    problem = "Key '" + path + "' has unknown log level '" + name + "'";
                }
            }

        } // anonymous namespace

        // ============================================================================
        // ArborConfiguration
        // ============================================================================

        std::string ArborConfiguration::ValidationMessage() const {
            if (!database.IsValid()) {
                return "database: path must be set, 0 < maxConnections >= minConnections, "
                       "busyTimeoutMs >= 0, synchronousMode and tempStore must be known modes";
            }
            if (logging.maxQueueSize == 0) {
                return "logging: maxQueueSize must be positive";
            }
            if (logging.toFile && (logging.logDirectory.empty() || logging.baseFileName.empty())) {
                return "logging: file output needs logDirectory and baseFileName";
            }
            if (!tree.IsValid()) {
                return "tree: maxBoundary must be at least 2";
            }
            return std::string();
        }

        bool ArborConfiguration::IsValid() const noexcept {
            try {
                return ValidationMessage().empty();
            }
            catch (const std::bad_alloc&) {
                return false;
            }
        }

        Json ArborConfiguration::ToJsonObject() const {
            Json j;

            j["database"] = {
                { "path", database.databasePath },
                { "enableWAL", database.enableWAL },
                { "enableForeignKeys", database.enableForeignKeys },
                { "enableSecureDelete", database.enableSecureDelete },
                { "enableMemoryMappedIO", database.enableMemoryMappedIO },
                { "pageSizeBytes", database.pageSizeBytes },
                { "cacheSizeKB", database.cacheSizeKB },
                { "mmapSizeMB", database.mmapSizeMB },
                { "busyTimeoutMs", database.busyTimeoutMs },
                { "tempStore", database.tempStore },
                { "maxConnections", database.maxConnections },
                { "minConnections", database.minConnections },
                { "connectionTimeoutMs", static_cast<int64_t>(database.connectionTimeout.count()) },
                { "readOnly", database.readOnly },
                { "synchronousMode", database.synchronousMode },
            };

            j["logging"] = {
                { "minimalLevel", Utils::LogLevelToString(logging.minimalLevel) },
                { "flushLevel", Utils::LogLevelToString(logging.flushLevel) },
                { "async", logging.async },
                { "maxQueueSize", logging.maxQueueSize },
                { "backPressure", backPressureToString(logging.bpPolicy) },
                { "toConsole", logging.toConsole },
                { "toFile", logging.toFile },
                { "jsonLines", logging.jsonLines },
                { "useUtcTime", logging.useUtcTime },
                { "includeSrcLocation", logging.includeSrcLocation },
                { "includeProcThreadId", logging.includeProcThreadId },
                { "logDirectory", logging.logDirectory },
                { "baseFileName", logging.baseFileName },
                { "maxFileSizeBytes", logging.maxFileSizeBytes },
                { "maxFileCount", logging.maxFileCount },
            };

            j["tree"] = {
                { "maxBoundary", tree.maxBoundary },
                { "createSchemaOnInitialize", tree.createSchemaOnInitialize },
                { "verifyAfterMutation", tree.verifyAfterMutation },
                { "renderIndent", tree.renderIndent },
            };

            return j;
        }

        std::string ArborConfiguration::ToJson(bool pretty) const {
            std::string out;
            Utils::JSON::StringifyOptions opt;
            opt.pretty = pretty;
            if (!Utils::JSON::Stringify(ToJsonObject(), out, opt)) {
                return "{}";
            }
            return out;
        }

        // ============================================================================
        // Loading / saving
        // ============================================================================

        namespace {

            bool fromJsonObject(const Json& root, ArborConfiguration& out, Utils::JSON::Error* err) {
                if (!root.is_object()) {
                    if (err) err->message = "Configuration root must be a JSON object";
                    return false;
                }

                ArborConfiguration cfg;
                std::string problem;

                // database
                readField(root, "database.path", cfg.database.databasePath, problem);
                readField(root, "database.enableWAL", cfg.database.enableWAL, problem);
                readField(root, "database.enableForeignKeys", cfg.database.enableForeignKeys, problem);
                readField(root, "database.enableSecureDelete", cfg.database.enableSecureDelete, problem);
                readField(root, "database.enableMemoryMappedIO", cfg.database.enableMemoryMappedIO, problem);
                readField(root, "database.pageSizeBytes", cfg.database.pageSizeBytes, problem);
                readField(root, "database.cacheSizeKB", cfg.database.cacheSizeKB, problem);
                readField(root, "database.mmapSizeMB", cfg.database.mmapSizeMB, problem);
                readField(root, "database.busyTimeoutMs", cfg.database.busyTimeoutMs, problem);
                readField(root, "database.tempStore", cfg.database.tempStore, problem);
                readField(root, "database.maxConnections", cfg.database.maxConnections, problem);
                readField(root, "database.minConnections", cfg.database.minConnections, problem);
                readField(root, "database.readOnly", cfg.database.readOnly, problem);
                readField(root, "database.synchronousMode", cfg.database.synchronousMode, problem);

                int64_t connectionTimeoutMs = cfg.database.connectionTimeout.count();
                readField(root, "database.connectionTimeoutMs", connectionTimeoutMs, problem);
                cfg.database.connectionTimeout = std::chrono::milliseconds(connectionTimeoutMs);

                // logging
                readLevel(root, "logging.minimalLevel", cfg.logging.minimalLevel, problem);
                readLevel(root, "logging.flushLevel", cfg.logging.flushLevel, problem);
                readField(root, "logging.async", cfg.logging.async, problem);
                readField(root, "logging.maxQueueSize", cfg.logging.maxQueueSize, problem);
                readField(root, "logging.toConsole", cfg.logging.toConsole, problem);
                readField(root, "logging.toFile", cfg.logging.toFile, problem);
                readField(root, "logging.jsonLines", cfg.logging.jsonLines, problem);
                readField(root, "logging.useUtcTime", cfg.logging.useUtcTime, problem);
                readField(root, "logging.includeSrcLocation", cfg.logging.includeSrcLocation, problem);
                readField(root, "logging.includeProcThreadId", cfg.logging.includeProcThreadId, problem);
                readField(root, "logging.logDirectory", cfg.logging.logDirectory, problem);
                readField(root, "logging.baseFileName", cfg.logging.baseFileName, problem);
                readField(root, "logging.maxFileSizeBytes", cfg.logging.maxFileSizeBytes, problem);
                readField(root, "logging.maxFileCount", cfg.logging.maxFileCount, problem);

                std::string policy;
                const bool hasPolicy = Utils::JSON::Contains(root, "logging.backPressure");
                readField(root, "logging.backPressure", policy, problem);
                if (problem.empty() && hasPolicy && !backPressureFromString(policy, cfg.logging.bpPolicy)) {
                    problem = "Key 'logging.backPressure' has unknown policy '" + policy + "'";
                }

                // tree
                readField(root, "tree.maxBoundary", cfg.tree.maxBoundary, problem);
                readField(root, "tree.createSchemaOnInitialize", cfg.tree.createSchemaOnInitialize, problem);
                readField(root, "tree.verifyAfterMutation", cfg.tree.verifyAfterMutation, problem);
                readField(root, "tree.renderIndent", cfg.tree.renderIndent, problem);

                if (problem.empty()) {
                    problem = cfg.ValidationMessage();
                }
                if (!problem.empty()) {
                    if (err) err->message = problem;
                    return false;
                }

                out = std::move(cfg);
                return true;
            }

        } // anonymous namespace

        bool LoadConfigurationFromJson(std::string_view jsonText, ArborConfiguration& out, Utils::JSON::Error* err) {
            Json root;
            if (!Utils::JSON::Parse(jsonText, root, err)) {
                return false;
            }
            return fromJsonObject(root, out, err);
        }

        bool LoadConfigurationFromFile(const std::filesystem::path& path, ArborConfiguration& out, Utils::JSON::Error* err) {
            Json root;
            if (!Utils::JSON::LoadFromFile(path, root, err)) {
                return false;
            }
            if (!fromJsonObject(root, out, err)) {
                if (err) err->path = path;
                return false;
            }
            return true;
        }

        bool SaveConfigurationToFile(const std::filesystem::path& path, const ArborConfiguration& config,
                                     Utils::JSON::Error* err)
        {
            Utils::JSON::StringifyOptions opt;
            opt.pretty = true;
            return Utils::JSON::SaveToFile(path, config.ToJsonObject(), err, opt);
        }

    } // namespace Config
} // namespace Arbor
