#pragma once
#include "core/Types.hpp"
#include "services/FeedFetcher.hpp"
#include "services/OpmlImporter.hpp"
#include "services/SyncOrchestrator.hpp"
#include "storage/ArticleCursor.hpp"
#include "storage/FeedStore.hpp"
#include "utils/Config.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ZenFeed {

enum class ImportStatus {
    Added,
    SkippedDuplicate,  // repeated within the batch
    SkippedExisting,   // url already stored
    Rejected
};

const char* importStatusName(ImportStatus status);

// Setting that switches briefing input on; off unless set.
constexpr const char* kBriefingSetting = "enable_ai_briefing";
// Longest briefing window; larger requests are clamped.
constexpr std::int64_t kMaxBriefingHours = 24 * 365 * 100;

struct ImportItem {
    FeedSpec spec;
    ImportStatus status = ImportStatus::Added;
    std::optional<std::int64_t> feedId;
    std::string message;
};

struct ImportReport {
    std::vector<ImportItem> items;

    int count(ImportStatus status) const;
};

// Everything a front end needs: feed and category bookkeeping, sync passes,
// read/saved state and search. Calls are thread-safe; sync passes run their
// pipelines on separate connections and may overlap with other calls.
class FeedLibrary {
public:
    FeedLibrary(const std::string& databasePath, std::shared_ptr<Fetcher> fetcher, SyncOptions options);

    // Sync
    std::vector<SyncResult> syncAll(const CancellationToken* cancel = nullptr,
                                    const ProgressCallback& progress = nullptr);
    SyncResult syncOne(std::int64_t feedId);

    // Feeds. An empty category name or "Uncategorized" means no category;
    // other names are created on demand.
    Feed addFeed(const std::string& url, const std::string& categoryName = "",
                 const std::string& title = "");
    void removeFeed(std::int64_t feedId);
    void moveFeed(std::int64_t feedId, const std::string& categoryName);
    std::vector<Feed> feeds();
    std::optional<Feed> feed(std::int64_t feedId);

    // Categories
    std::vector<Category> categories();
    Category createCategory(const std::string& name);
    void renameCategory(std::int64_t categoryId, const std::string& name);
    void removeCategory(std::int64_t categoryId);

    // Read/saved state. markRead returns the number of articles changed;
    // `id` is ignored for Uncategorized and All.
    int markRead(ReadScope scope, std::int64_t id = 0);
    void markUnread(std::int64_t articleId);
    bool toggleSaved(std::int64_t articleId);

    // Articles
    ArticleCursor search(const ArticleQuery& query);
    ArticleCursor search(const std::string& text);
    std::vector<Article> articlesSince(Timestamp since);
    std::optional<Article> article(std::int64_t articleId);
    void storeFullContent(std::int64_t articleId, const std::string& text);
    std::map<std::int64_t, int> unreadCounts();

    // Summarizer input for articles published in the last `hours` hours
    // (clamped to 1..kMaxBriefingHours). Empty optional while the briefing
    // setting is off; an empty string when nothing is recent.
    std::optional<std::string> briefingInput(std::int64_t hours, Timestamp now = Clock::now());

    // Adds the batch feed by feed; one report item per entry, never throws
    // for an individual feed.
    ImportReport importFeeds(const ImportBatch& batch);

    // Settings
    void setSetting(const std::string& key, const std::string& value);
    std::optional<std::string> setting(const std::string& key);
    bool boolSetting(const std::string& key, bool fallback = false);

    const std::string& databasePath() const { return databasePath_; }

private:
    std::optional<std::int64_t> resolveCategory(const std::string& name);

    std::string databasePath_;
    std::shared_ptr<FeedStore> store_;
    std::shared_ptr<std::mutex> storeMutex_;
    SyncOrchestrator orchestrator_;
};

}
