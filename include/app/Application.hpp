#pragma once

#include "core/FeedLibrary.hpp"
#include "services/SyncOrchestrator.hpp"
#include <memory>
#include <optional>
#include <string>

namespace ZenFeed {

// Command line front end: zenfeed [--config F] [--db F] [--log-level L] <command>
class Application {
public:
    Application();
    ~Application();

    int run(int argc, char* argv[]);

    static Application* getInstance();

    // Aborts a running sync pass; pipelines not started yet are skipped.
    void interrupt() { cancel_.cancel(); }

private:
    enum class Command {
        None,
        ImportOpml,
        Add,
        Remove,
        Sync,
        SyncFeed,
        ListFeeds,
        Search,
        MarkRead,
        ToggleSaved,
        Briefing,
        SetSetting
    };

    struct Options {
        std::string configPath;
        std::string databasePath;
        std::string logLevel;
        Command command = Command::None;
        std::string argument;
        std::string category;
        bool unreadOnly = false;
        bool savedOnly = false;
        std::size_t limit = 20;
    };

    static void onInterrupt(int signal);
    static void printUsage();
    static bool parseArgs(int argc, char* argv[], Options& options);

    void seedDefaultFeeds(FeedLibrary& library, const Config& config);
    int runCommand(FeedLibrary& library, const Options& options);

    int importOpml(FeedLibrary& library, const std::string& path);
    int addFeed(FeedLibrary& library, const Options& options);
    int removeFeed(FeedLibrary& library, const std::string& id);
    int sync(FeedLibrary& library, std::optional<std::int64_t> feedId);
    int listFeeds(FeedLibrary& library);
    int search(FeedLibrary& library, const Options& options);
    int markRead(FeedLibrary& library, const std::string& target);
    int toggleSaved(FeedLibrary& library, const std::string& id);
    int briefing(FeedLibrary& library, const std::string& hours);
    int setSetting(FeedLibrary& library, const std::string& assignment);

    CancellationToken cancel_;

    static Application* instance_;
};

} // namespace ZenFeed
