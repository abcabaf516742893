#pragma once
#include "core/Types.hpp"
#include "storage/FeedStore.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace ZenFeed {

// Lazy search result. Rows are fetched a page at a time, newest first, so
// a cursor can be abandoned early without materializing the whole result.
// restart() begins again from the newest matching row.
class ArticleCursor {
public:
    static constexpr std::size_t kDefaultPageSize = 50;

    ArticleCursor(std::shared_ptr<FeedStore> store, std::shared_ptr<std::mutex> storeMutex,
                  ArticleQuery query, std::size_t pageSize = kDefaultPageSize);

    // Next article, or nullopt once the result (or the query limit) is exhausted.
    std::optional<Article> next();
    void restart();

    // Remaining rows, for callers that want them all.
    std::vector<Article> collect();

    const ArticleQuery& query() const { return query_; }

private:
    void fetchPage();

    std::shared_ptr<FeedStore> store_;
    std::shared_ptr<std::mutex> storeMutex_;
    ArticleQuery query_;
    std::size_t pageSize_;

    std::deque<Article> buffer_;
    std::optional<PageAnchor> anchor_;
    std::size_t delivered_ = 0;
    bool exhausted_ = false;
};

}
