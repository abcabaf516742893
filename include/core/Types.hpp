#pragma once
#include "core/Errors.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ZenFeed {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline std::int64_t toUnixSeconds(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

inline Timestamp fromUnixSeconds(std::int64_t s) {
    return Timestamp(std::chrono::seconds(s));
}

struct Category {
    std::int64_t id = 0;
    std::string name;
};

struct Feed {
    std::int64_t id = 0;
    std::string url;
    std::string title;
    std::optional<std::int64_t> categoryId;  // empty = uncategorized
    Timestamp addedAt{};
    std::optional<Timestamp> lastSyncedAt;
    std::optional<std::string> lastError;
};

struct Article {
    std::int64_t id = 0;
    std::int64_t feedId = 0;
    std::string canonicalKey;
    std::string title;
    std::string link;
    Timestamp publishedAt{};
    std::string content;
    std::optional<std::string> fullContent;
    bool isRead = false;
    bool isSaved = false;
    Timestamp firstSeenAt{};
    std::string feedTitle;  // joined from feeds, read-only
};

// One entry as delivered by a feed document, before identity is assigned.
struct RawArticle {
    std::string guid;
    std::string link;
    std::string title;
    Timestamp publishedAt{};
    bool publishedKnown = false;  // false when publishedAt is the fetch time
    std::string content;
};

struct FeedSpec {
    std::string url;
    std::string categoryName;
    std::string title;
};

enum class SyncState {
    Pending,
    Fetching,
    Parsing,
    Merging,
    Done,
    Failed
};

const char* syncStateName(SyncState state);

struct SyncFailure {
    ErrorCode code = ErrorCode::NetworkFailure;
    SyncState stage = SyncState::Pending;
    std::string message;
    int httpStatus = 0;
};

struct SyncResult {
    std::int64_t feedId = 0;
    int articlesAdded = 0;
    int articlesUpdated = 0;
    int articlesUnchanged = 0;
    int entriesSkipped = 0;
    SyncState state = SyncState::Pending;
    std::optional<SyncFailure> error;

    bool ok() const { return state == SyncState::Done && !error; }
};

// "<CodeName>: <message>", the form stored in feeds.last_error.
std::string describeFailure(const SyncFailure& failure);

enum class ReadScope {
    Article,
    Feed,
    Category,
    Uncategorized,
    All
};

struct ArticleQuery {
    std::optional<std::int64_t> feedId;
    std::optional<std::int64_t> categoryId;
    bool unreadOnly = false;
    bool savedOnly = false;
    std::string text;      // substring of title or content
    std::size_t limit = 0; // 0 = no limit
};

}
