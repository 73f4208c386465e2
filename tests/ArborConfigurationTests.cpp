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
#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "../src/Config/ArborConfiguration.hpp"

#include <filesystem>
#include <fstream>

using namespace Arbor;
using namespace Arbor::Config;
namespace JSON = Arbor::Utils::JSON;

// ============================================================================
// ArborConfiguration
// ============================================================================

TEST(ArborConfigurationTest, DefaultsNeedOnlyADatabasePath) {
    ArborConfiguration cfg;
    EXPECT_FALSE(cfg.IsValid());
    EXPECT_NE(cfg.ValidationMessage().find("database"), std::string::npos);

    cfg.database.databasePath = "arbor.db";
    EXPECT_TRUE(cfg.IsValid());
    EXPECT_EQ(cfg.tree.maxBoundary, Tree::kMaxBoundary);
}

TEST(ArborConfigurationTest, LoadsEverySection) {
    const char* text = R"({
        // comments are accepted
        "database": { "path": "/tmp/arbor.db", "busyTimeoutMs": 250, "maxConnections": 3,
                      "connectionTimeoutMs": 1500, "synchronousMode": "FULL" },
        "logging":  { "minimalLevel": "debug", "backPressure": "Block", "toFile": false },
        "tree":     { "maxBoundary": 1000, "verifyAfterMutation": true, "renderIndent": "  " }
    })";

    ArborConfiguration cfg;
    JSON::Error err;
    ASSERT_TRUE(LoadConfigurationFromJson(text, cfg, &err)) << err.message;

    EXPECT_EQ(cfg.database.databasePath, "/tmp/arbor.db");
    EXPECT_EQ(cfg.database.busyTimeoutMs, 250);
    EXPECT_EQ(cfg.database.maxConnections, 3u);
    EXPECT_EQ(cfg.database.connectionTimeout.count(), 1500);
    EXPECT_EQ(cfg.database.synchronousMode, "FULL");
    EXPECT_TRUE(cfg.database.enableWAL);

    EXPECT_EQ(cfg.logging.minimalLevel, Utils::LogLevel::Debug);
    EXPECT_EQ(cfg.logging.bpPolicy, Utils::LoggerConfig::BackPressurePolicy::Block);
    EXPECT_FALSE(cfg.logging.toFile);

    EXPECT_EQ(cfg.tree.maxBoundary, 1000);
    EXPECT_TRUE(cfg.tree.verifyAfterMutation);
    EXPECT_TRUE(cfg.tree.createSchemaOnInitialize);
    EXPECT_EQ(cfg.tree.renderIndent, "  ");
}

TEST(ArborConfigurationTest, RejectsBadValuesAndLeavesOutputUntouched) {
    ArborConfiguration cfg;
    cfg.database.databasePath = "keep.db";
    JSON::Error err;

    EXPECT_FALSE(LoadConfigurationFromJson(R"({"database": {"path": 7}})", cfg, &err));
    EXPECT_NE(err.message.find("database.path"), std::string::npos);

    err.clear();
    EXPECT_FALSE(LoadConfigurationFromJson(R"({"database": {"path": "a.db"}, "logging": {"minimalLevel": "loud"}})", cfg, &err));
    EXPECT_NE(err.message.find("log level"), std::string::npos);

    err.clear();
    EXPECT_FALSE(LoadConfigurationFromJson(R"({"database": {"path": "a.db"}, "logging": {"backPressure": "Spill"}})", cfg, &err));

    err.clear();
    EXPECT_FALSE(LoadConfigurationFromJson(R"({"database": {"path": "a.db"}, "tree": {"maxBoundary": 1}})", cfg, &err));
    EXPECT_NE(err.message.find("tree"), std::string::npos);

    err.clear();
    EXPECT_FALSE(LoadConfigurationFromJson("[1, 2]", cfg, &err));

    err.clear();
    EXPECT_FALSE(LoadConfigurationFromJson("{ not json", cfg, &err));
    EXPECT_FALSE(err.message.empty());

    EXPECT_EQ(cfg.database.databasePath, "keep.db");
}

TEST(ArborConfigurationTest, RejectsNegativeCounts) {
    ArborConfiguration cfg;
    cfg.database.databasePath = "keep.db";
    JSON::Error err;

    EXPECT_FALSE(LoadConfigurationFromJson(R"({"database": {"path": "a.db", "maxConnections": -1}})", cfg, &err));
    EXPECT_NE(err.message.find("database.maxConnections"), std::string::npos);

    err.clear();
    EXPECT_FALSE(LoadConfigurationFromJson(R"({"database": {"path": "a.db"}, "logging": {"maxQueueSize": -5}})", cfg, &err));
    EXPECT_NE(err.message.find("logging.maxQueueSize"), std::string::npos);

    err.clear();
    EXPECT_FALSE(LoadConfigurationFromJson(R"({"database": {"path": "a.db"}, "logging": {"maxFileCount": 2.5}})", cfg, &err));
    EXPECT_NE(err.message.find("logging.maxFileCount"), std::string::npos);

    EXPECT_EQ(cfg.database.databasePath, "keep.db");
    EXPECT_EQ(cfg.database.maxConnections, Database::DatabaseConfig{}.maxConnections);
}

TEST(ArborConfigurationTest, FileRoundTrip) {
    Testing::TempDatabasePath scratch;
    const std::filesystem::path file = scratch.Path() + ".json";

    ArborConfiguration cfg;
    cfg.database.databasePath = "forest.db";
    cfg.database.readOnly = true;
    cfg.logging.maxFileCount = 3;
    cfg.tree.maxBoundary = 4096;

    JSON::Error err;
    ASSERT_TRUE(SaveConfigurationToFile(file, cfg, &err)) << err.message;

    ArborConfiguration loaded;
    ASSERT_TRUE(LoadConfigurationFromFile(file, loaded, &err)) << err.message;
    EXPECT_EQ(loaded.database.databasePath, "forest.db");
    EXPECT_TRUE(loaded.database.readOnly);
    EXPECT_EQ(loaded.logging.maxFileCount, 3u);
    EXPECT_EQ(loaded.tree.maxBoundary, 4096);
    EXPECT_EQ(loaded.ToJson(false), cfg.ToJson(false));

    std::error_code ec;
    std::filesystem::remove(file, ec);
}

TEST(ArborConfigurationTest, MissingFileReportsPath) {
    ArborConfiguration cfg;
    JSON::Error err;
    EXPECT_FALSE(LoadConfigurationFromFile("/nonexistent/arbor/config.json", cfg, &err));
    EXPECT_FALSE(err.message.empty());
}

// ============================================================================
// JSON helpers
// ============================================================================

TEST(JsonUtilsTest, PathHelpers) {
    EXPECT_EQ(JSON::ToJsonPointer("a.b[0].c"), "/a/b/0/c");
    EXPECT_EQ(JSON::ToJsonPointer("/already/pointer"), "/already/pointer");

    JSON::Json j;
    ASSERT_TRUE(JSON::Parse(R"({"a": {"b": [ {"c": 5} ]}})", j));
    EXPECT_TRUE(JSON::Contains(j, "a.b[0].c"));
    EXPECT_FALSE(JSON::Contains(j, "a.x"));

    int c = 0;
    EXPECT_TRUE(JSON::Get<int>(j, "a.b[0].c", c));
    EXPECT_EQ(c, 5);

    std::string wrong;
    EXPECT_FALSE(JSON::Get<std::string>(j, "a.b[0].c", wrong));
    EXPECT_EQ(JSON::GetOr<int>(j, "a.missing", 9), 9);
}

TEST(JsonUtilsTest, ParseErrorsCarryOffset) {
    JSON::Json j;
    JSON::Error err;
    EXPECT_FALSE(JSON::Parse("{\"a\": }", j, &err));
    EXPECT_FALSE(err.message.empty());
    EXPECT_GT(err.byteOffset, 0u);
}

// ============================================================================
// Log levels
// ============================================================================

TEST(LogLevelTest, NamesRoundTrip) {
    for (auto level : { Utils::LogLevel::Trace, Utils::LogLevel::Debug, Utils::LogLevel::Info,
                        Utils::LogLevel::Warn, Utils::LogLevel::Error, Utils::LogLevel::Fatal }) {
        Utils::LogLevel parsed = Utils::LogLevel::Trace;
        ASSERT_TRUE(Utils::LogLevelFromString(Utils::LogLevelToString(level), parsed));
        EXPECT_EQ(parsed, level);
    }

    Utils::LogLevel parsed;
    EXPECT_TRUE(Utils::LogLevelFromString("warning", parsed));
    EXPECT_EQ(parsed, Utils::LogLevel::Warn);
    EXPECT_FALSE(Utils::LogLevelFromString("chatty", parsed));
}
