#include "core/FeedLibrary.hpp"
#include "services/Briefing.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>

namespace ZenFeed {

namespace {

constexpr std::size_t kMaxCategoryName = 100;

bool meansUncategorized(const std::string& trimmed) {
    return trimmed.empty() || StringUtils::toLower(trimmed) == "uncategorized";
}

// Trimmed name of a real category. Throws InvalidCategoryName.
std::string checkCategoryName(const std::string& name) {
    std::string trimmed = StringUtils::trim(name);
    if (meansUncategorized(trimmed)) {
        throw ValidationError(ErrorCode::InvalidCategoryName, "'" + name + "' is reserved for feeds without a category");
    }
    if (trimmed.size() > kMaxCategoryName) {
        throw ValidationError(ErrorCode::InvalidCategoryName, "category name is longer than 100 bytes");
    }
    for (unsigned char c : trimmed) {
        if (c < 0x20 || c == 0x7F) {
            throw ValidationError(ErrorCode::InvalidCategoryName, "category name contains control characters");
        }
    }
    return trimmed;
}

std::string checkFeedUrl(const std::string& url) {
    std::string normalized = StringUtils::normalizeFeedUrl(url);
    if (normalized.empty()) {
        throw ValidationError(ErrorCode::InvalidFeedUrl, "'" + url + "' is not an http(s) URL");
    }
    return normalized;
}

}

const char* importStatusName(ImportStatus status) {
    switch (status) {
        case ImportStatus::Added: return "added";
        case ImportStatus::SkippedDuplicate: return "skipped, repeated in import";
        case ImportStatus::SkippedExisting: return "skipped, already exists";
        case ImportStatus::Rejected: return "rejected";
    }
    return "unknown";
}

int ImportReport::count(ImportStatus status) const {
    int n = 0;
    for (const auto& item : items) {
        if (item.status == status) n++;
    }
    return n;
}

FeedLibrary::FeedLibrary(const std::string& databasePath, std::shared_ptr<Fetcher> fetcher, SyncOptions options)
    : databasePath_(databasePath),
      store_(std::make_shared<FeedStore>(databasePath)),
      storeMutex_(std::make_shared<std::mutex>()),
      orchestrator_([databasePath]() { return std::make_unique<FeedStore>(databasePath); },
                    std::move(fetcher), std::move(options)) {
    store_->migrate();
    LOG_I("Library", "Opened {}", databasePath_);
}

// Sync

std::vector<SyncResult> FeedLibrary::syncAll(const CancellationToken* cancel, const ProgressCallback& progress) {
    return orchestrator_.syncAll(cancel, progress);
}

SyncResult FeedLibrary::syncOne(std::int64_t feedId) {
    return orchestrator_.syncOne(feedId);
}

// Feeds

std::optional<std::int64_t> FeedLibrary::resolveCategory(const std::string& name) {
    if (meansUncategorized(StringUtils::trim(name))) return std::nullopt;
    return store_->ensureCategory(checkCategoryName(name));
}

Feed FeedLibrary::addFeed(const std::string& url, const std::string& categoryName, const std::string& title) {
    std::string normalized = checkFeedUrl(url);
    std::lock_guard<std::mutex> lock(*storeMutex_);

    if (store_->findFeedByUrl(normalized)) {
        throw ValidationError(ErrorCode::DuplicateFeedUrl, normalized + " is already subscribed");
    }

    Transaction tx(store_->database());
    auto categoryId = resolveCategory(categoryName);
    Feed feed = store_->insertFeed(normalized, StringUtils::collapseWhitespace(title), categoryId, Clock::now());
    tx.commit();

    LOG_I("Library", "Added feed {} ({})", feed.id, feed.url);
    return feed;
}

void FeedLibrary::removeFeed(std::int64_t feedId) {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    if (!store_->deleteFeed(feedId)) {
        throw ValidationError(ErrorCode::UnknownFeed, "no feed with id " + std::to_string(feedId));
    }
    LOG_I("Library", "Removed feed {}", feedId);
}

void FeedLibrary::moveFeed(std::int64_t feedId, const std::string& categoryName) {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    if (!store_->findFeed(feedId)) {
        throw ValidationError(ErrorCode::UnknownFeed, "no feed with id " + std::to_string(feedId));
    }
    Transaction tx(store_->database());
    store_->setFeedCategory(feedId, resolveCategory(categoryName));
    tx.commit();
}

std::vector<Feed> FeedLibrary::feeds() {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    return store_->listFeeds();
}

std::optional<Feed> FeedLibrary::feed(std::int64_t feedId) {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    return store_->findFeed(feedId);
}

// Categories

std::vector<Category> FeedLibrary::categories() {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    return store_->listCategories();
}

Category FeedLibrary::createCategory(const std::string& name) {
    std::string checked = checkCategoryName(name);
    std::lock_guard<std::mutex> lock(*storeMutex_);
    if (auto existing = store_->findCategoryByName(checked)) return *existing;
    return store_->insertCategory(checked);
}

void FeedLibrary::renameCategory(std::int64_t categoryId, const std::string& name) {
    std::string checked = checkCategoryName(name);
    std::lock_guard<std::mutex> lock(*storeMutex_);
    auto other = store_->findCategoryByName(checked);
    if (other && other->id != categoryId) {
        throw ValidationError(ErrorCode::InvalidCategoryName, "category '" + checked + "' already exists");
    }
    if (!store_->renameCategory(categoryId, checked)) {
        throw ValidationError(ErrorCode::UnknownCategory, "no category with id " + std::to_string(categoryId));
    }
}

void FeedLibrary::removeCategory(std::int64_t categoryId) {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    if (!store_->deleteCategory(categoryId)) {
        throw ValidationError(ErrorCode::UnknownCategory, "no category with id " + std::to_string(categoryId));
    }
}

// Read/saved state

int FeedLibrary::markRead(ReadScope scope, std::int64_t id) {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    switch (scope) {
        case ReadScope::Article: {
            int changed = store_->setArticleRead(id, true);
            if (changed == 0) {
                throw ValidationError(ErrorCode::UnknownArticle, "no article with id " + std::to_string(id));
            }
            return changed;
        }
        case ReadScope::Feed:
            if (!store_->findFeed(id)) {
                throw ValidationError(ErrorCode::UnknownFeed, "no feed with id " + std::to_string(id));
            }
            return store_->markFeedRead(id);
        case ReadScope::Category:
            if (!store_->findCategory(id)) {
                throw ValidationError(ErrorCode::UnknownCategory, "no category with id " + std::to_string(id));
            }
            return store_->markCategoryRead(id);
        case ReadScope::Uncategorized:
            return store_->markCategoryRead(std::nullopt);
        case ReadScope::All:
            return store_->markAllRead();
    }
    return 0;
}

void FeedLibrary::markUnread(std::int64_t articleId) {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    if (store_->setArticleRead(articleId, false) == 0) {
        throw ValidationError(ErrorCode::UnknownArticle, "no article with id " + std::to_string(articleId));
    }
}

bool FeedLibrary::toggleSaved(std::int64_t articleId) {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    auto saved = store_->toggleSaved(articleId);
    if (!saved) {
        throw ValidationError(ErrorCode::UnknownArticle, "no article with id " + std::to_string(articleId));
    }
    return *saved;
}

// Articles

ArticleCursor FeedLibrary::search(const ArticleQuery& query) {
    return ArticleCursor(store_, storeMutex_, query);
}

ArticleCursor FeedLibrary::search(const std::string& text) {
    ArticleQuery query;
    query.text = StringUtils::trim(text);
    return search(query);
}

std::vector<Article> FeedLibrary::articlesSince(Timestamp since) {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    return store_->articlesSince(since);
}

std::optional<Article> FeedLibrary::article(std::int64_t articleId) {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    return store_->findArticle(articleId);
}

void FeedLibrary::storeFullContent(std::int64_t articleId, const std::string& text) {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    if (!store_->findArticle(articleId)) {
        throw ValidationError(ErrorCode::UnknownArticle, "no article with id " + std::to_string(articleId));
    }
    store_->setFullContent(articleId, text);
}

std::map<std::int64_t, int> FeedLibrary::unreadCounts() {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    return store_->unreadCounts();
}

std::optional<std::string> FeedLibrary::briefingInput(std::int64_t hours, Timestamp now) {
    if (!boolSetting(kBriefingSetting)) return std::nullopt;
    std::int64_t window = std::clamp<std::int64_t>(hours, 1, kMaxBriefingHours);
    return composeBriefingInput(articlesSince(now - std::chrono::hours(window)));
}

// Import

ImportReport FeedLibrary::importFeeds(const ImportBatch& batch) {
    ImportReport report;
    for (const auto& spec : batch.feeds) {
        ImportItem item;
        item.spec = spec;
        try {
            Feed added = addFeed(spec.url, spec.categoryName, spec.title);
            item.status = ImportStatus::Added;
            item.feedId = added.id;
        } catch (const ValidationError& e) {
            item.status = e.code() == ErrorCode::DuplicateFeedUrl ? ImportStatus::SkippedExisting
                                                                 : ImportStatus::Rejected;
            item.message = e.what();
        } catch (const StorageError& e) {
            LOG_E("Import", "Storing {} failed: {}", spec.url, e.what());
            item.status = ImportStatus::Rejected;
            item.message = e.what();
        }
        report.items.push_back(item);
    }
    for (const auto& spec : batch.duplicates) {
        ImportItem item;
        item.spec = spec;
        item.status = ImportStatus::SkippedDuplicate;
        item.message = "listed more than once";
        report.items.push_back(item);
    }

    LOG_I("Import", "{} added, {} already present, {} repeated, {} rejected",
          report.count(ImportStatus::Added), report.count(ImportStatus::SkippedExisting),
          report.count(ImportStatus::SkippedDuplicate), report.count(ImportStatus::Rejected));
    return report;
}

// Settings

void FeedLibrary::setSetting(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    store_->setSetting(key, value);
}

std::optional<std::string> FeedLibrary::setting(const std::string& key) {
    std::lock_guard<std::mutex> lock(*storeMutex_);
    return store_->setting(key);
}

bool FeedLibrary::boolSetting(const std::string& key, bool fallback) {
    auto value = setting(key);
    if (!value) return fallback;
    std::string v = StringUtils::toLower(StringUtils::trim(*value));
    return v == "true" || v == "1" || v == "yes" || v == "on";
}

}
