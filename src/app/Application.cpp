#include "app/Application.hpp"
#include "services/OpmlImporter.hpp"
#include "utils/Config.hpp"
#include "utils/DateParser.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include <csignal>
#include <cstdlib>
#include <iostream>

namespace ZenFeed {

namespace {

const char* kSeededKey = "default_feeds_seeded";

std::optional<std::int64_t> parseId(const std::string& text) {
    if (text.empty() || text.size() > 18) return std::nullopt;
    std::int64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + (c - '0');
    }
    return value;
}

std::string categoryLabel(const std::optional<std::int64_t>& categoryId, const std::vector<Category>& categories) {
    if (!categoryId) return "Uncategorized";
    for (const auto& c : categories) {
        if (c.id == *categoryId) return c.name;
    }
    return "?";
}

void printResult(const SyncResult& result, const std::string& url) {
    if (result.ok()) {
        std::cout << "  [ok]   " << url << ": " << result.articlesAdded << " new, " << result.articlesUpdated
                  << " updated";
        if (result.entriesSkipped > 0) std::cout << ", " << result.entriesSkipped << " skipped";
        std::cout << "\n";
    } else if (result.error) {
        std::cout << "  [fail] " << url << ": " << describeFailure(*result.error) << "\n";
    }
}

}

Application* Application::instance_ = nullptr;

Application::Application() {
    instance_ = this;
}

Application::~Application() {
    std::signal(SIGINT, SIG_DFL);
    instance_ = nullptr;
}

Application* Application::getInstance() {
    return instance_;
}

void Application::onInterrupt(int /*signal*/) {
    if (instance_) instance_->interrupt();
}

void Application::printUsage() {
    std::cout <<
        "Usage: zenfeed [--config FILE] [--db FILE] [--log-level LEVEL] <command>\n"
        "\n"
        "Commands:\n"
        "  --import-opml FILE              import subscriptions from an OPML file\n"
        "  --add URL [--category NAME]     subscribe to a feed\n"
        "  --remove ID                     unsubscribe and drop the feed's articles\n"
        "  --sync                          sync every feed (Ctrl-C stops the pass)\n"
        "  --sync-feed ID                  sync one feed\n"
        "  --feeds                         list feeds with unread counts\n"
        "  --search TEXT [--category NAME] [--unread] [--saved] [--limit N]\n"
        "  --mark-read all|uncategorized|feed:ID|category:ID|article:ID\n"
        "  --toggle-saved ID\n"
        "  --briefing HOURS                print summarizer input for recent articles\n"
        "  --set KEY=VALUE                 store a setting (" << kBriefingSetting << "=true enables --briefing)\n";
}

bool Application::parseArgs(int argc, char* argv[], Options& options) {
    auto setCommand = [&](Command command, int& i, bool takesValue) {
        if (options.command != Command::None) return false;
        options.command = command;
        if (takesValue) {
            if (i + 1 >= argc) return false;
            options.argument = argv[++i];
        }
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool ok = true;
        if (arg == "--config" && i + 1 < argc) {
            options.configPath = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            options.databasePath = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            options.logLevel = argv[++i];
        } else if (arg == "--category" && i + 1 < argc) {
            options.category = argv[++i];
        } else if (arg == "--unread") {
            options.unreadOnly = true;
        } else if (arg == "--saved") {
            options.savedOnly = true;
        } else if (arg == "--limit" && i + 1 < argc) {
            auto limit = parseId(argv[++i]);
            if (!limit) return false;
            options.limit = static_cast<std::size_t>(*limit);
        } else if (arg == "--import-opml") {
            ok = setCommand(Command::ImportOpml, i, true);
        } else if (arg == "--add") {
            ok = setCommand(Command::Add, i, true);
        } else if (arg == "--remove") {
            ok = setCommand(Command::Remove, i, true);
        } else if (arg == "--sync") {
            ok = setCommand(Command::Sync, i, false);
        } else if (arg == "--sync-feed") {
            ok = setCommand(Command::SyncFeed, i, true);
        } else if (arg == "--feeds") {
            ok = setCommand(Command::ListFeeds, i, false);
        } else if (arg == "--search") {
            ok = setCommand(Command::Search, i, true);
        } else if (arg == "--mark-read") {
            ok = setCommand(Command::MarkRead, i, true);
        } else if (arg == "--toggle-saved") {
            ok = setCommand(Command::ToggleSaved, i, true);
        } else if (arg == "--briefing") {
            ok = setCommand(Command::Briefing, i, true);
        } else if (arg == "--set") {
            ok = setCommand(Command::SetSetting, i, true);
        } else {
            ok = false;
        }
        if (!ok) {
            std::cerr << "zenfeed: unexpected argument '" << arg << "'\n";
            return false;
        }
    }
    return options.command != Command::None;
}

int Application::run(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return EXIT_SUCCESS;
        }
    }
    if (!parseArgs(argc, argv, options)) {
        printUsage();
        return 2;
    }

    Config config(options.configPath.empty() ? Config::defaultPath() : options.configPath);
    config.load();
    if (!options.databasePath.empty()) config.setDatabasePath(options.databasePath);
    if (!options.logLevel.empty()) config.setLogLevel(options.logLevel);

    Log::init(config.logFile());
    Log::setLevel(Log::parseLevel(config.logLevel()));
    LOG_I("Main", "Using config {} and database {}", config.path(), config.databasePath());

    auto fetcher = std::make_shared<HttpFetcher>(config.syncOptions().fetch);
    FeedLibrary library(config.databasePath(), fetcher, config.syncOptions());

    if (options.command != Command::ImportOpml) seedDefaultFeeds(library, config);

    int rc = runCommand(library, options);
    Log::shutdown();
    return rc;
}

void Application::seedDefaultFeeds(FeedLibrary& library, const Config& config) {
    if (library.boolSetting(kSeededKey) || !library.feeds().empty()) return;

    ImportBatch batch;
    batch.feeds = config.defaultFeeds();
    auto report = library.importFeeds(batch);
    library.setSetting(kSeededKey, "true");
    LOG_I("Main", "Seeded {} default feeds", report.count(ImportStatus::Added));
}

int Application::runCommand(FeedLibrary& library, const Options& options) {
    try {
        switch (options.command) {
            case Command::ImportOpml: return importOpml(library, options.argument);
            case Command::Add: return addFeed(library, options);
            case Command::Remove: return removeFeed(library, options.argument);
            case Command::Sync: return sync(library, std::nullopt);
            case Command::SyncFeed: {
                auto id = parseId(options.argument);
                if (!id) {
                    std::cerr << "zenfeed: '" << options.argument << "' is not a feed id\n";
                    return 2;
                }
                return sync(library, id);
            }
            case Command::ListFeeds: return listFeeds(library);
            case Command::Search: return search(library, options);
            case Command::MarkRead: return markRead(library, options.argument);
            case Command::ToggleSaved: return toggleSaved(library, options.argument);
            case Command::Briefing: return briefing(library, options.argument);
            case Command::SetSetting: return setSetting(library, options.argument);
            case Command::None: break;
        }
    } catch (const ValidationError& e) {
        std::cerr << "zenfeed: " << e.what() << " [" << errorCodeName(e.code()) << "]\n";
        return 1;
    } catch (const ParseError& e) {
        std::cerr << "zenfeed: " << e.what() << " [" << errorCodeName(e.code()) << "]\n";
        return 1;
    }
    printUsage();
    return 2;
}

int Application::importOpml(FeedLibrary& library, const std::string& path) {
    ImportBatch batch = OpmlImporter::fromFile(path);
    auto report = library.importFeeds(batch);
    for (const auto& item : report.items) {
        std::cout << "  [" << importStatusName(item.status) << "] " << item.spec.url;
        if (!item.spec.categoryName.empty()) std::cout << " (" << item.spec.categoryName << ")";
        if (item.status == ImportStatus::Rejected) std::cout << ": " << item.message;
        std::cout << "\n";
    }
    std::cout << "Import complete: " << report.count(ImportStatus::Added) << " added, "
              << report.count(ImportStatus::SkippedExisting) + report.count(ImportStatus::SkippedDuplicate)
              << " skipped, " << report.count(ImportStatus::Rejected) << " rejected\n";
    return EXIT_SUCCESS;
}

int Application::addFeed(FeedLibrary& library, const Options& options) {
    Feed feed = library.addFeed(options.argument, options.category);
    std::cout << "Added feed " << feed.id << ": " << feed.url << "\n";
    return EXIT_SUCCESS;
}

int Application::removeFeed(FeedLibrary& library, const std::string& id) {
    auto feedId = parseId(id);
    if (!feedId) {
        std::cerr << "zenfeed: '" << id << "' is not a feed id\n";
        return 2;
    }
    library.removeFeed(*feedId);
    std::cout << "Removed feed " << *feedId << "\n";
    return EXIT_SUCCESS;
}

int Application::sync(FeedLibrary& library, std::optional<std::int64_t> feedId) {
    std::map<std::int64_t, std::string> urls;
    for (const auto& feed : library.feeds()) urls[feed.id] = feed.url;

    std::vector<SyncResult> results;
    if (feedId) {
        results.push_back(library.syncOne(*feedId));
    } else {
        cancel_.reset();
        auto previous = std::signal(SIGINT, onInterrupt);
        results = library.syncAll(&cancel_);
        std::signal(SIGINT, previous);
    }

    int added = 0, updated = 0, failed = 0;
    for (const auto& result : results) {
        printResult(result, urls[result.feedId]);
        added += result.articlesAdded;
        updated += result.articlesUpdated;
        if (!result.ok()) failed++;
    }
    std::cout << "Synced " << results.size() << " feeds: " << added << " new, " << updated << " updated, "
              << failed << " failed" << (cancel_.cancelled() ? " (interrupted)" : "") << "\n";
    return EXIT_SUCCESS;
}

int Application::listFeeds(FeedLibrary& library) {
    auto categories = library.categories();
    auto unread = library.unreadCounts();
    for (const auto& feed : library.feeds()) {
        std::cout << feed.id << "\t" << (feed.title.empty() ? feed.url : feed.title) << "\t"
                  << categoryLabel(feed.categoryId, categories) << "\t" << unread[feed.id] << " unread";
        if (feed.lastError) std::cout << "\t! " << *feed.lastError;
        std::cout << "\n";
    }
    return EXIT_SUCCESS;
}

int Application::search(FeedLibrary& library, const Options& options) {
    ArticleQuery query;
    query.text = options.argument;
    query.unreadOnly = options.unreadOnly;
    query.savedOnly = options.savedOnly;
    query.limit = options.limit;
    if (!options.category.empty()) {
        for (const auto& category : library.categories()) {
            if (StringUtils::toLower(category.name) == StringUtils::toLower(StringUtils::trim(options.category))) {
                query.categoryId = category.id;
            }
        }
        if (!query.categoryId) {
            std::cerr << "zenfeed: no category named '" << options.category << "'\n";
            return EXIT_FAILURE;
        }
    }

    auto cursor = library.search(query);
    while (auto article = cursor.next()) {
        std::cout << article->id << "\t" << (article->isRead ? " " : "*") << (article->isSaved ? "S" : " ")
                  << "\t" << DateParser::formatMinute(article->publishedAt) << "\t" << article->feedTitle
                  << ": " << article->title << "\n";
    }
    return EXIT_SUCCESS;
}

int Application::markRead(FeedLibrary& library, const std::string& target) {
    int changed = 0;
    if (target == "all") {
        changed = library.markRead(ReadScope::All);
    } else if (target == "uncategorized") {
        changed = library.markRead(ReadScope::Uncategorized);
    } else {
        size_t colon = target.find(':');
        std::string kind = target.substr(0, colon);
        std::optional<std::int64_t> id;
        if (colon != std::string::npos) id = parseId(target.substr(colon + 1));
        if (!id) {
            std::cerr << "zenfeed: cannot mark '" << target << "' as read\n";
            return 2;
        }
        if (kind == "feed") {
            changed = library.markRead(ReadScope::Feed, *id);
        } else if (kind == "category") {
            changed = library.markRead(ReadScope::Category, *id);
        } else if (kind == "article") {
            changed = library.markRead(ReadScope::Article, *id);
        } else {
            std::cerr << "zenfeed: cannot mark '" << target << "' as read\n";
            return 2;
        }
    }
    std::cout << "Marked " << changed << " articles as read\n";
    return EXIT_SUCCESS;
}

int Application::toggleSaved(FeedLibrary& library, const std::string& id) {
    auto articleId = parseId(id);
    if (!articleId) {
        std::cerr << "zenfeed: '" << id << "' is not an article id\n";
        return 2;
    }
    bool saved = library.toggleSaved(*articleId);
    std::cout << (saved ? "Saved for later" : "Removed from saved") << "\n";
    return EXIT_SUCCESS;
}

int Application::setSetting(FeedLibrary& library, const std::string& assignment) {
    size_t eq = assignment.find('=');
    std::string key = eq == std::string::npos ? "" : StringUtils::trim(assignment.substr(0, eq));
    if (key.empty()) {
        std::cerr << "zenfeed: expected KEY=VALUE, got '" << assignment << "'\n";
        return 2;
    }
    std::string value = StringUtils::trim(assignment.substr(eq + 1));
    library.setSetting(key, value);
    std::cout << key << " = " << value << "\n";
    return EXIT_SUCCESS;
}

int Application::briefing(FeedLibrary& library, const std::string& hours) {
    auto h = parseId(hours);
    if (!h || *h == 0) {
        std::cerr << "zenfeed: '" << hours << "' is not a number of hours\n";
        return 2;
    }
    if (*h > kMaxBriefingHours) {
        std::cerr << "zenfeed: at most " << kMaxBriefingHours << " hours can be summarized\n";
        return 2;
    }
    auto input = library.briefingInput(*h);
    if (!input) {
        std::cerr << "Briefing is disabled; enable it with --set " << kBriefingSetting << "=true\n";
        return EXIT_FAILURE;
    }
    if (input->empty()) {
        std::cerr << "No articles in the last " << *h << " hours\n";
        return EXIT_FAILURE;
    }
    std::cout << *input;
    return EXIT_SUCCESS;
}

} // namespace ZenFeed
