#pragma once
#include "core/Types.hpp"
#include "storage/Database.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ZenFeed {

// Position after the last row of a page, for keyset paging (newest first).
struct PageAnchor {
    std::int64_t publishedAt;
    std::int64_t id;
};

// Typed access to the zenfeed schema over one connection. Every method is a
// single statement unless it says otherwise, so callers decide transaction
// scope (see Transaction).
class FeedStore {
public:
    explicit FeedStore(const std::string& path);

    // Creates tables and indexes if missing.
    void migrate();

    Database& database() { return db_; }

    // Categories
    std::vector<Category> listCategories();
    std::optional<Category> findCategory(std::int64_t id);
    std::optional<Category> findCategoryByName(const std::string& name);
    Category insertCategory(const std::string& name);
    // Existing id for the name, or a new row.
    std::int64_t ensureCategory(const std::string& name);
    bool renameCategory(std::int64_t id, const std::string& name);
    // Feeds of the category become uncategorized.
    bool deleteCategory(std::int64_t id);

    // Feeds
    Feed insertFeed(const std::string& url, const std::string& title,
                    std::optional<std::int64_t> categoryId, Timestamp now);
    std::optional<Feed> findFeed(std::int64_t id);
    std::optional<Feed> findFeedByUrl(const std::string& url);
    std::vector<Feed> listFeeds();
    // Cascades to the feed's articles.
    bool deleteFeed(std::int64_t id);
    bool setFeedCategory(std::int64_t feedId, std::optional<std::int64_t> categoryId);
    // Clears last_error; fills the title only while it is still empty.
    void recordSyncSuccess(std::int64_t feedId, Timestamp now, const std::string& documentTitle);
    void recordSyncFailure(std::int64_t feedId, Timestamp now, const std::string& error);

    // Articles
    std::optional<Article> findArticleByKey(std::int64_t feedId, const std::string& canonicalKey);
    std::optional<Article> findArticle(std::int64_t id);
    std::int64_t insertArticle(const Article& article);
    // Feed-owned columns only; read/saved/first_seen_at/full_content are untouched.
    void updateArticleFromFeed(std::int64_t id, const std::string& title, const std::string& link,
                               const std::string& content, Timestamp publishedAt);
    void setFullContent(std::int64_t id, const std::string& text);
    std::size_t countArticles(std::int64_t feedId);

    // Read/saved state. Return the number of rows touched.
    int setArticleRead(std::int64_t id, bool read);
    int markFeedRead(std::int64_t feedId);
    int markCategoryRead(std::optional<std::int64_t> categoryId);
    int markAllRead();
    // New saved state, or nullopt if the article does not exist.
    std::optional<bool> toggleSaved(std::int64_t id);

    std::map<std::int64_t, int> unreadCounts();
    std::vector<Article> articlesSince(Timestamp since);
    std::vector<Article> queryArticles(const ArticleQuery& query,
                                       const std::optional<PageAnchor>& after,
                                       std::size_t pageSize);

    // Settings
    void setSetting(const std::string& key, const std::string& value);
    std::optional<std::string> setting(const std::string& key);

private:
    Database db_;
};

}
