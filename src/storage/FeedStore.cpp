#include "storage/FeedStore.hpp"
#include "utils/Logger.hpp"

namespace ZenFeed {

namespace {

const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS categories (
    id   INTEGER PRIMARY KEY AUTOINCREMENT,
    name TEXT NOT NULL UNIQUE COLLATE NOCASE
);

CREATE TABLE IF NOT EXISTS feeds (
    id             INTEGER PRIMARY KEY AUTOINCREMENT,
    url            TEXT NOT NULL UNIQUE,
    title          TEXT NOT NULL DEFAULT '',
    category_id    INTEGER REFERENCES categories(id) ON DELETE SET NULL,
    added_at       INTEGER NOT NULL,
    last_synced_at INTEGER,
    last_error     TEXT
);

CREATE TABLE IF NOT EXISTS articles (
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    feed_id       INTEGER NOT NULL REFERENCES feeds(id) ON DELETE CASCADE,
    canonical_key TEXT NOT NULL,
    title         TEXT NOT NULL,
    link          TEXT NOT NULL DEFAULT '',
    published_at  INTEGER NOT NULL,
    content       TEXT NOT NULL DEFAULT '',
    full_content  TEXT,
    is_read       INTEGER NOT NULL DEFAULT 0,
    is_saved      INTEGER NOT NULL DEFAULT 0,
    first_seen_at INTEGER NOT NULL,
    UNIQUE (feed_id, canonical_key)
);

CREATE TABLE IF NOT EXISTS settings (
    key   TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_articles_published ON articles(published_at DESC, id DESC);
CREATE INDEX IF NOT EXISTS idx_articles_feed_read ON articles(feed_id, is_read);
CREATE INDEX IF NOT EXISTS idx_feeds_category ON feeds(category_id);
)SQL";

const char* kArticleColumns =
    "a.id, a.feed_id, a.canonical_key, a.title, a.link, a.published_at, a.content, "
    "a.full_content, a.is_read, a.is_saved, a.first_seen_at, f.title";

const char* kFeedColumns =
    "id, url, title, category_id, added_at, last_synced_at, last_error";

Article readArticle(const Statement& stmt) {
    Article a;
    a.id = stmt.columnInt64(0);
    a.feedId = stmt.columnInt64(1);
    a.canonicalKey = stmt.columnText(2);
    a.title = stmt.columnText(3);
    a.link = stmt.columnText(4);
    a.publishedAt = fromUnixSeconds(stmt.columnInt64(5));
    a.content = stmt.columnText(6);
    a.fullContent = stmt.columnOptionalText(7);
    a.isRead = stmt.columnBool(8);
    a.isSaved = stmt.columnBool(9);
    a.firstSeenAt = fromUnixSeconds(stmt.columnInt64(10));
    a.feedTitle = stmt.columnText(11);
    return a;
}

Feed readFeed(const Statement& stmt) {
    Feed f;
    f.id = stmt.columnInt64(0);
    f.url = stmt.columnText(1);
    f.title = stmt.columnText(2);
    f.categoryId = stmt.columnOptionalInt64(3);
    f.addedAt = fromUnixSeconds(stmt.columnInt64(4));
    if (auto synced = stmt.columnOptionalInt64(5)) f.lastSyncedAt = fromUnixSeconds(*synced);
    f.lastError = stmt.columnOptionalText(6);
    return f;
}

// LIKE pattern matching `text` anywhere, with '\' as the escape character.
std::string containsPattern(const std::string& text) {
    std::string out = "%";
    for (char c : text) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    out += '%';
    return out;
}

}

FeedStore::FeedStore(const std::string& path) : db_(path) {}

void FeedStore::migrate() {
    db_.exec(kSchema);
    LOG_D("Store", "Schema ready in {}", db_.path());
}

// Categories

std::vector<Category> FeedStore::listCategories() {
    std::vector<Category> out;
    auto stmt = db_.prepare("SELECT id, name FROM categories ORDER BY name COLLATE NOCASE");
    while (stmt.step()) {
        out.push_back({stmt.columnInt64(0), stmt.columnText(1)});
    }
    return out;
}

std::optional<Category> FeedStore::findCategory(std::int64_t id) {
    auto stmt = db_.prepare("SELECT id, name FROM categories WHERE id = ?");
    stmt.bind(1, id);
    if (!stmt.step()) return std::nullopt;
    return Category{stmt.columnInt64(0), stmt.columnText(1)};
}

std::optional<Category> FeedStore::findCategoryByName(const std::string& name) {
    auto stmt = db_.prepare("SELECT id, name FROM categories WHERE name = ?");
    stmt.bind(1, name);
    if (!stmt.step()) return std::nullopt;
    return Category{stmt.columnInt64(0), stmt.columnText(1)};
}

Category FeedStore::insertCategory(const std::string& name) {
    auto stmt = db_.prepare("INSERT INTO categories (name) VALUES (?)");
    stmt.bind(1, name).run();
    return Category{db_.lastInsertId(), name};
}

std::int64_t FeedStore::ensureCategory(const std::string& name) {
    if (auto existing = findCategoryByName(name)) return existing->id;
    return insertCategory(name).id;
}

bool FeedStore::renameCategory(std::int64_t id, const std::string& name) {
    auto stmt = db_.prepare("UPDATE categories SET name = ? WHERE id = ?");
    stmt.bind(1, name).bind(2, id).run();
    return db_.changes() > 0;
}

bool FeedStore::deleteCategory(std::int64_t id) {
    auto stmt = db_.prepare("DELETE FROM categories WHERE id = ?");
    stmt.bind(1, id).run();
    return db_.changes() > 0;
}

// Feeds

Feed FeedStore::insertFeed(const std::string& url, const std::string& title,
                           std::optional<std::int64_t> categoryId, Timestamp now) {
    auto stmt = db_.prepare("INSERT INTO feeds (url, title, category_id, added_at) VALUES (?, ?, ?, ?)");
    stmt.bind(1, url).bind(2, title).bind(3, categoryId).bind(4, toUnixSeconds(now)).run();

    Feed feed;
    feed.id = db_.lastInsertId();
    feed.url = url;
    feed.title = title;
    feed.categoryId = categoryId;
    feed.addedAt = fromUnixSeconds(toUnixSeconds(now));
    return feed;
}

std::optional<Feed> FeedStore::findFeed(std::int64_t id) {
    auto stmt = db_.prepare(std::string("SELECT ") + kFeedColumns + " FROM feeds WHERE id = ?");
    stmt.bind(1, id);
    if (!stmt.step()) return std::nullopt;
    return readFeed(stmt);
}

std::optional<Feed> FeedStore::findFeedByUrl(const std::string& url) {
    auto stmt = db_.prepare(std::string("SELECT ") + kFeedColumns + " FROM feeds WHERE url = ?");
    stmt.bind(1, url);
    if (!stmt.step()) return std::nullopt;
    return readFeed(stmt);
}

std::vector<Feed> FeedStore::listFeeds() {
    std::vector<Feed> out;
    auto stmt = db_.prepare(std::string("SELECT ") + kFeedColumns + " FROM feeds ORDER BY id");
    while (stmt.step()) out.push_back(readFeed(stmt));
    return out;
}

bool FeedStore::deleteFeed(std::int64_t id) {
    auto stmt = db_.prepare("DELETE FROM feeds WHERE id = ?");
    stmt.bind(1, id).run();
    return db_.changes() > 0;
}

bool FeedStore::setFeedCategory(std::int64_t feedId, std::optional<std::int64_t> categoryId) {
    auto stmt = db_.prepare("UPDATE feeds SET category_id = ? WHERE id = ?");
    stmt.bind(1, categoryId).bind(2, feedId).run();
    return db_.changes() > 0;
}

void FeedStore::recordSyncSuccess(std::int64_t feedId, Timestamp now, const std::string& documentTitle) {
    auto stmt = db_.prepare(
        "UPDATE feeds SET last_synced_at = ?1, last_error = NULL, "
        "title = CASE WHEN title = '' AND ?2 <> '' THEN ?2 ELSE title END "
        "WHERE id = ?3");
    stmt.bind(1, toUnixSeconds(now)).bind(2, documentTitle).bind(3, feedId).run();
}

void FeedStore::recordSyncFailure(std::int64_t feedId, Timestamp now, const std::string& error) {
    auto stmt = db_.prepare("UPDATE feeds SET last_synced_at = ?, last_error = ? WHERE id = ?");
    stmt.bind(1, toUnixSeconds(now)).bind(2, error).bind(3, feedId).run();
}

// Articles

std::optional<Article> FeedStore::findArticleByKey(std::int64_t feedId, const std::string& canonicalKey) {
    auto stmt = db_.prepare(std::string("SELECT ") + kArticleColumns +
                            " FROM articles a JOIN feeds f ON f.id = a.feed_id"
                            " WHERE a.feed_id = ? AND a.canonical_key = ?");
    stmt.bind(1, feedId).bind(2, canonicalKey);
    if (!stmt.step()) return std::nullopt;
    return readArticle(stmt);
}

std::optional<Article> FeedStore::findArticle(std::int64_t id) {
    auto stmt = db_.prepare(std::string("SELECT ") + kArticleColumns +
                            " FROM articles a JOIN feeds f ON f.id = a.feed_id WHERE a.id = ?");
    stmt.bind(1, id);
    if (!stmt.step()) return std::nullopt;
    return readArticle(stmt);
}

std::int64_t FeedStore::insertArticle(const Article& article) {
    auto stmt = db_.prepare(
        "INSERT INTO articles (feed_id, canonical_key, title, link, published_at, content, "
        "is_read, is_saved, first_seen_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
    stmt.bind(1, article.feedId)
        .bind(2, article.canonicalKey)
        .bind(3, article.title)
        .bind(4, article.link)
        .bind(5, toUnixSeconds(article.publishedAt))
        .bind(6, article.content)
        .bind(7, article.isRead)
        .bind(8, article.isSaved)
        .bind(9, toUnixSeconds(article.firstSeenAt))
        .run();
    return db_.lastInsertId();
}

void FeedStore::updateArticleFromFeed(std::int64_t id, const std::string& title, const std::string& link,
                                      const std::string& content, Timestamp publishedAt) {
    auto stmt = db_.prepare(
        "UPDATE articles SET title = ?, link = ?, content = ?, published_at = ? WHERE id = ?");
    stmt.bind(1, title).bind(2, link).bind(3, content).bind(4, toUnixSeconds(publishedAt)).bind(5, id).run();
}

void FeedStore::setFullContent(std::int64_t id, const std::string& text) {
    auto stmt = db_.prepare("UPDATE articles SET full_content = ? WHERE id = ?");
    stmt.bind(1, text).bind(2, id).run();
}

std::size_t FeedStore::countArticles(std::int64_t feedId) {
    auto stmt = db_.prepare("SELECT COUNT(*) FROM articles WHERE feed_id = ?");
    stmt.bind(1, feedId);
    stmt.step();
    return static_cast<std::size_t>(stmt.columnInt64(0));
}

int FeedStore::setArticleRead(std::int64_t id, bool read) {
    auto stmt = db_.prepare("UPDATE articles SET is_read = ? WHERE id = ?");
    stmt.bind(1, read).bind(2, id).run();
    return db_.changes();
}

int FeedStore::markFeedRead(std::int64_t feedId) {
    auto stmt = db_.prepare("UPDATE articles SET is_read = 1 WHERE feed_id = ? AND is_read = 0");
    stmt.bind(1, feedId).run();
    return db_.changes();
}

int FeedStore::markCategoryRead(std::optional<std::int64_t> categoryId) {
    // "IS" so that a NULL parameter selects uncategorized feeds.
    auto stmt = db_.prepare(
        "UPDATE articles SET is_read = 1 WHERE is_read = 0 AND feed_id IN "
        "(SELECT id FROM feeds WHERE category_id IS ?)");
    stmt.bind(1, categoryId).run();
    return db_.changes();
}

int FeedStore::markAllRead() {
    db_.exec("UPDATE articles SET is_read = 1 WHERE is_read = 0");
    return db_.changes();
}

std::optional<bool> FeedStore::toggleSaved(std::int64_t id) {
    auto update = db_.prepare("UPDATE articles SET is_saved = 1 - is_saved WHERE id = ?");
    update.bind(1, id).run();
    if (db_.changes() == 0) return std::nullopt;

    auto stmt = db_.prepare("SELECT is_saved FROM articles WHERE id = ?");
    stmt.bind(1, id);
    if (!stmt.step()) return std::nullopt;
    return stmt.columnBool(0);
}

std::map<std::int64_t, int> FeedStore::unreadCounts() {
    std::map<std::int64_t, int> out;
    auto stmt = db_.prepare("SELECT feed_id, COUNT(*) FROM articles WHERE is_read = 0 GROUP BY feed_id");
    while (stmt.step()) {
        out[stmt.columnInt64(0)] = static_cast<int>(stmt.columnInt64(1));
    }
    return out;
}

std::vector<Article> FeedStore::articlesSince(Timestamp since) {
    std::vector<Article> out;
    auto stmt = db_.prepare(std::string("SELECT ") + kArticleColumns +
                            " FROM articles a JOIN feeds f ON f.id = a.feed_id"
                            " WHERE a.published_at >= ? ORDER BY a.published_at DESC, a.id DESC");
    stmt.bind(1, toUnixSeconds(since));
    while (stmt.step()) out.push_back(readArticle(stmt));
    return out;
}

std::vector<Article> FeedStore::queryArticles(const ArticleQuery& query,
                                              const std::optional<PageAnchor>& after,
                                              std::size_t pageSize) {
    std::string sql = std::string("SELECT ") + kArticleColumns +
                      " FROM articles a JOIN feeds f ON f.id = a.feed_id WHERE 1 = 1";
    if (query.feedId) sql += " AND a.feed_id = ?";
    if (query.categoryId) sql += " AND f.category_id = ?";
    if (query.unreadOnly) sql += " AND a.is_read = 0";
    if (query.savedOnly) sql += " AND a.is_saved = 1";
    if (!query.text.empty()) sql += " AND (a.title LIKE ? ESCAPE '\\' OR a.content LIKE ? ESCAPE '\\')";
    if (after) sql += " AND (a.published_at < ? OR (a.published_at = ? AND a.id < ?))";
    sql += " ORDER BY a.published_at DESC, a.id DESC LIMIT ?";

    auto stmt = db_.prepare(sql);
    int index = 1;
    if (query.feedId) stmt.bind(index++, *query.feedId);
    if (query.categoryId) stmt.bind(index++, *query.categoryId);
    if (!query.text.empty()) {
        std::string pattern = containsPattern(query.text);
        stmt.bind(index++, pattern);
        stmt.bind(index++, pattern);
    }
    if (after) {
        stmt.bind(index++, after->publishedAt);
        stmt.bind(index++, after->publishedAt);
        stmt.bind(index++, after->id);
    }
    stmt.bind(index, static_cast<std::int64_t>(pageSize));

    std::vector<Article> out;
    while (stmt.step()) out.push_back(readArticle(stmt));
    return out;
}

// Settings

void FeedStore::setSetting(const std::string& key, const std::string& value) {
    auto stmt = db_.prepare(
        "INSERT INTO settings (key, value) VALUES (?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
    stmt.bind(1, key).bind(2, value).run();
}

std::optional<std::string> FeedStore::setting(const std::string& key) {
    auto stmt = db_.prepare("SELECT value FROM settings WHERE key = ?");
    stmt.bind(1, key);
    if (!stmt.step()) return std::nullopt;
    return stmt.columnText(0);
}

}
