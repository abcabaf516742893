#include "utils/Config.hpp"
#include "utils/Logger.hpp"
#include <json-glib/json-glib.h>
#include <cstdlib>
#include <filesystem>

namespace ZenFeed {

namespace {

std::string configDir() {
    const char* home = getenv("HOME");
    return std::string(home ? home : ".") + "/.config/zenfeed";
}

std::string stringMember(JsonObject* obj, const char* name, const std::string& fallback) {
    if (!json_object_has_member(obj, name)) return fallback;
    const char* value = json_object_get_string_member(obj, name);
    return value ? value : fallback;
}

}

Config::Config(std::string path) : path_(std::move(path)) {
    ensureDefaults();
}

std::string Config::defaultPath() {
    return configDir() + "/config.json";
}

std::string Config::defaultDatabasePath() {
    return configDir() + "/zenfeed.db";
}

void Config::ensureDefaults() {
    if (databasePath_.empty()) databasePath_ = defaultDatabasePath();

    if (!feedsLoaded_ && defaultFeeds_.empty()) {
        defaultFeeds_ = {
            {"https://www.svt.se/nyheter/rss.xml", "News", "SVT Nyheter"},
            {"https://feeds.feedburner.com/TheHackersNews", "Tech", "The Hacker News"},
            {"https://9to5linux.com/feed", "Linux", "9to5Linux"}
        };
    }
}

void Config::validate() {
    const SyncOptions defaults;
    if (sync_.maxConcurrentFeeds < 1) {
        LOG_W("Config", "maxConcurrentFeeds must be at least 1, using {}", defaults.maxConcurrentFeeds);
        sync_.maxConcurrentFeeds = defaults.maxConcurrentFeeds;
    }
    if (sync_.fetch.timeoutSeconds < 1) {
        LOG_W("Config", "fetchTimeoutSeconds must be at least 1, using {}", defaults.fetch.timeoutSeconds);
        sync_.fetch.timeoutSeconds = defaults.fetch.timeoutSeconds;
    }
    if (sync_.fetch.retries < 0) sync_.fetch.retries = defaults.fetch.retries;
    if (sync_.fetch.retryDelayMs < 0) sync_.fetch.retryDelayMs = defaults.fetch.retryDelayMs;
    if (sync_.fetch.userAgent.empty()) sync_.fetch.userAgent = defaults.fetch.userAgent;
}

void Config::load() {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::path(path_).parent_path();
    if (!dir.empty()) std::filesystem::create_directories(dir, ec);

    JsonParser* parser = json_parser_new();
    GError* error = nullptr;

    if (!json_parser_load_from_file(parser, path_.c_str(), &error)) {
        bool missing = error && g_error_matches(error, G_FILE_ERROR, G_FILE_ERROR_NOENT);
        if (error) {
            if (!missing) LOG_W("Config", "Cannot read {}: {}", path_, error->message);
            g_error_free(error);
        }
        g_object_unref(parser);
        ensureDefaults();
        if (missing) save();
        return;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        LOG_W("Config", "{} does not hold a JSON object, using defaults", path_);
        g_object_unref(parser);
        ensureDefaults();
        return;
    }

    JsonObject* obj = json_node_get_object(root);

    databasePath_ = stringMember(obj, "database", databasePath_);
    if (json_object_has_member(obj, "maxConcurrentFeeds")) {
        gint64 v = json_object_get_int_member(obj, "maxConcurrentFeeds");
        sync_.maxConcurrentFeeds = v > 0 ? static_cast<size_t>(v) : 0;
    }
    if (json_object_has_member(obj, "fetchTimeoutSeconds"))
        sync_.fetch.timeoutSeconds = static_cast<long>(json_object_get_int_member(obj, "fetchTimeoutSeconds"));
    if (json_object_has_member(obj, "fetchRetries"))
        sync_.fetch.retries = static_cast<int>(json_object_get_int_member(obj, "fetchRetries"));
    if (json_object_has_member(obj, "retryDelayMs"))
        sync_.fetch.retryDelayMs = static_cast<long>(json_object_get_int_member(obj, "retryDelayMs"));
    sync_.fetch.userAgent = stringMember(obj, "userAgent", sync_.fetch.userAgent);
    logLevel_ = stringMember(obj, "logLevel", logLevel_);
    logFile_ = stringMember(obj, "logFile", logFile_);

    // Load default feeds
    if (json_object_has_member(obj, "defaultFeeds")) {
        defaultFeeds_.clear();
        feedsLoaded_ = true;
        JsonArray* feedsArr = json_object_get_array_member(obj, "defaultFeeds");
        guint len = feedsArr ? json_array_get_length(feedsArr) : 0;
        for (guint i = 0; i < len; i++) {
            JsonObject* feed = json_array_get_object_element(feedsArr, i);
            if (!feed || !json_object_has_member(feed, "url")) continue;
            FeedSpec spec;
            spec.url = stringMember(feed, "url", "");
            spec.title = stringMember(feed, "title", "");
            spec.categoryName = stringMember(feed, "category", "");
            defaultFeeds_.push_back(spec);
        }
    }

    g_object_unref(parser);
    ensureDefaults();
    validate();
}

void Config::save() const {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "database");
    json_builder_add_string_value(builder, databasePath_.c_str());
    json_builder_set_member_name(builder, "maxConcurrentFeeds");
    json_builder_add_int_value(builder, static_cast<gint64>(sync_.maxConcurrentFeeds));
    json_builder_set_member_name(builder, "fetchTimeoutSeconds");
    json_builder_add_int_value(builder, sync_.fetch.timeoutSeconds);
    json_builder_set_member_name(builder, "fetchRetries");
    json_builder_add_int_value(builder, sync_.fetch.retries);
    json_builder_set_member_name(builder, "retryDelayMs");
    json_builder_add_int_value(builder, sync_.fetch.retryDelayMs);
    json_builder_set_member_name(builder, "userAgent");
    json_builder_add_string_value(builder, sync_.fetch.userAgent.c_str());
    json_builder_set_member_name(builder, "logLevel");
    json_builder_add_string_value(builder, logLevel_.c_str());
    json_builder_set_member_name(builder, "logFile");
    json_builder_add_string_value(builder, logFile_.c_str());

    // Save default feeds
    json_builder_set_member_name(builder, "defaultFeeds");
    json_builder_begin_array(builder);
    for (const auto& feed : defaultFeeds_) {
        json_builder_begin_object(builder);
        json_builder_set_member_name(builder, "url");
        json_builder_add_string_value(builder, feed.url.c_str());
        json_builder_set_member_name(builder, "title");
        json_builder_add_string_value(builder, feed.title.c_str());
        json_builder_set_member_name(builder, "category");
        json_builder_add_string_value(builder, feed.categoryName.c_str());
        json_builder_end_object(builder);
    }
    json_builder_end_array(builder);

    json_builder_end_object(builder);

    JsonGenerator* gen = json_generator_new();
    json_generator_set_pretty(gen, TRUE);
    JsonNode* rootNode = json_builder_get_root(builder);
    json_generator_set_root(gen, rootNode);

    GError* error = nullptr;
    if (!json_generator_to_file(gen, path_.c_str(), &error)) {
        LOG_W("Config", "Cannot write {}: {}", path_, error ? error->message : "unknown error");
    }
    if (error) g_error_free(error);

    json_node_unref(rootNode);
    g_object_unref(gen);
    g_object_unref(builder);
}

}
