#include "utils/Config.hpp"
#include "TestSupport.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace ZenFeed;

namespace {

void writeFile(const std::string& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

}

TEST(ConfigTest, MissingFileIsCreatedWithDefaults) {
    Testing::TempDir dir;
    std::string path = dir.file("nested/config.json");
    Config config(path);
    config.load();

    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(config.syncOptions().maxConcurrentFeeds, 8u);
    EXPECT_EQ(config.syncOptions().fetch.timeoutSeconds, 10);
    EXPECT_EQ(config.logLevel(), "warn");
    ASSERT_EQ(config.defaultFeeds().size(), 3u);
    EXPECT_EQ(config.defaultFeeds()[2].categoryName, "Linux");
}

TEST(ConfigTest, ReadsCustomValues) {
    Testing::TempDir dir;
    std::string path = dir.file("config.json");
    writeFile(path, R"({
        "database": "/tmp/feeds.db",
        "maxConcurrentFeeds": 3,
        "fetchTimeoutSeconds": 25,
        "fetchRetries": 0,
        "userAgent": "Tester/2",
        "logLevel": "debug",
        "defaultFeeds": [
            {"url": "https://one.example/rss", "title": "One", "category": "Misc"},
            {"title": "no url, ignored"}
        ]
    })");

    Config config(path);
    config.load();
    EXPECT_EQ(config.databasePath(), "/tmp/feeds.db");
    EXPECT_EQ(config.syncOptions().maxConcurrentFeeds, 3u);
    EXPECT_EQ(config.syncOptions().fetch.timeoutSeconds, 25);
    EXPECT_EQ(config.syncOptions().fetch.retries, 0);
    EXPECT_EQ(config.syncOptions().fetch.userAgent, "Tester/2");
    EXPECT_EQ(config.logLevel(), "debug");
    ASSERT_EQ(config.defaultFeeds().size(), 1u);
    EXPECT_EQ(config.defaultFeeds()[0].url, "https://one.example/rss");
    EXPECT_EQ(config.defaultFeeds()[0].categoryName, "Misc");
}

TEST(ConfigTest, EmptyFeedListStaysEmpty) {
    Testing::TempDir dir;
    std::string path = dir.file("config.json");
    writeFile(path, R"({"defaultFeeds": []})");
    Config config(path);
    config.load();
    EXPECT_TRUE(config.defaultFeeds().empty());
}

TEST(ConfigTest, OutOfRangeValuesFallBack) {
    Testing::TempDir dir;
    std::string path = dir.file("config.json");
    writeFile(path, R"({"maxConcurrentFeeds": 0, "fetchTimeoutSeconds": 0, "fetchRetries": -2, "userAgent": ""})");

    Config config(path);
    config.load();
    EXPECT_EQ(config.syncOptions().maxConcurrentFeeds, 8u);
    EXPECT_EQ(config.syncOptions().fetch.timeoutSeconds, 10);
    EXPECT_EQ(config.syncOptions().fetch.retries, 1);
    EXPECT_EQ(config.syncOptions().fetch.userAgent, "ZenFeed/1.0");
}

TEST(ConfigTest, NonObjectRootUsesDefaults) {
    Testing::TempDir dir;
    std::string path = dir.file("config.json");
    writeFile(path, "[1, 2, 3]");
    Config config(path);
    config.load();
    EXPECT_EQ(config.syncOptions().maxConcurrentFeeds, 8u);
    EXPECT_EQ(config.defaultFeeds().size(), 3u);
}

TEST(ConfigTest, SaveThenLoad) {
    Testing::TempDir dir;
    std::string path = dir.file("config.json");
    {
        Config config(path);
        SyncOptions options;
        options.maxConcurrentFeeds = 4;
        options.fetch.retries = 2;
        config.setSyncOptions(options);
        config.setLogLevel("info");
        config.setDatabasePath(dir.file("other.db"));
        config.save();
    }
    Config reloaded(path);
    reloaded.load();
    EXPECT_EQ(reloaded.syncOptions().maxConcurrentFeeds, 4u);
    EXPECT_EQ(reloaded.syncOptions().fetch.retries, 2);
    EXPECT_EQ(reloaded.logLevel(), "info");
    EXPECT_EQ(reloaded.databasePath(), dir.file("other.db"));
}
