#include "storage/ArticleCursor.hpp"
#include <algorithm>

namespace ZenFeed {

ArticleCursor::ArticleCursor(std::shared_ptr<FeedStore> store, std::shared_ptr<std::mutex> storeMutex,
                             ArticleQuery query, std::size_t pageSize)
    : store_(std::move(store)),
      storeMutex_(std::move(storeMutex)),
      query_(std::move(query)),
      pageSize_(pageSize > 0 ? pageSize : kDefaultPageSize) {}

std::optional<Article> ArticleCursor::next() {
    if (query_.limit > 0 && delivered_ >= query_.limit) return std::nullopt;
    if (buffer_.empty() && !exhausted_) fetchPage();
    if (buffer_.empty()) return std::nullopt;

    Article article = std::move(buffer_.front());
    buffer_.pop_front();
    delivered_++;
    return article;
}

void ArticleCursor::restart() {
    buffer_.clear();
    anchor_.reset();
    delivered_ = 0;
    exhausted_ = false;
}

std::vector<Article> ArticleCursor::collect() {
    std::vector<Article> out;
    while (auto article = next()) out.push_back(std::move(*article));
    return out;
}

void ArticleCursor::fetchPage() {
    std::size_t want = pageSize_;
    if (query_.limit > 0) want = std::min(want, query_.limit - delivered_);

    std::vector<Article> page;
    {
        std::lock_guard<std::mutex> lock(*storeMutex_);
        page = store_->queryArticles(query_, anchor_, want);
    }

    if (page.size() < want) exhausted_ = true;
    if (!page.empty()) {
        const Article& last = page.back();
        anchor_ = PageAnchor{toUnixSeconds(last.publishedAt), last.id};
    }
    for (auto& article : page) buffer_.push_back(std::move(article));
}

}
