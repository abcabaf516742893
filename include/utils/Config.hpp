#pragma once
#include "core/Types.hpp"
#include <string>
#include <vector>

namespace ZenFeed {

struct FetchOptions {
    long timeoutSeconds = 10;
    int retries = 1;       // extra attempts after a transient failure
    long retryDelayMs = 500;
    std::string userAgent = "ZenFeed/1.0";
};

struct SyncOptions {
    size_t maxConcurrentFeeds = 8;
    FetchOptions fetch;
};

// JSON settings file. Passed around explicitly; there is no global instance.
class Config {
public:
    explicit Config(std::string path = defaultPath());

    static std::string defaultPath();
    static std::string defaultDatabasePath();

    // Missing file: defaults are written out. Invalid values fall back to defaults.
    void load();
    void save() const;

    const std::string& path() const { return path_; }

    const std::string& databasePath() const { return databasePath_; }
    void setDatabasePath(const std::string& path) { databasePath_ = path; }

    const SyncOptions& syncOptions() const { return sync_; }
    void setSyncOptions(const SyncOptions& options) { sync_ = options; }

    const std::string& logLevel() const { return logLevel_; }
    void setLogLevel(const std::string& level) { logLevel_ = level; }

    const std::string& logFile() const { return logFile_; }

    const std::vector<FeedSpec>& defaultFeeds() const { return defaultFeeds_; }

private:
    void ensureDefaults();
    void validate();

    std::string path_;
    std::string databasePath_;
    SyncOptions sync_;
    std::string logLevel_ = "warn";
    std::string logFile_;
    std::vector<FeedSpec> defaultFeeds_;
    bool feedsLoaded_ = false;
};

}
