#include "services/MergeEngine.hpp"
#include "utils/DateParser.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"
#include <unordered_set>

namespace ZenFeed {

std::string MergeEngine::canonicalKey(const RawArticle& article) {
    std::string guid = StringUtils::trim(article.guid);
    if (!guid.empty()) return "guid:" + guid;

    std::string link = StringUtils::normalizeLink(article.link);
    if (!link.empty()) return "link:" + StringUtils::toHex(StringUtils::fnv1a64(link));

    std::string basis = StringUtils::toLower(StringUtils::collapseWhitespace(article.title)) + "|";
    if (article.publishedKnown) basis += DateParser::formatDay(article.publishedAt);
    return "title:" + StringUtils::toHex(StringUtils::fnv1a64(basis));
}

MergeStats MergeEngine::merge(FeedStore& store, std::int64_t feedId,
                              const std::vector<RawArticle>& articles, Timestamp now) {
    Transaction tx(store.database());
    MergeStats stats = apply(store, feedId, articles, now);
    tx.commit();
    return stats;
}

MergeStats MergeEngine::apply(FeedStore& store, std::int64_t feedId,
                              const std::vector<RawArticle>& articles, Timestamp now) {
    MergeStats stats;
    std::unordered_set<std::string> seen;

    for (const auto& raw : articles) {
        std::string key = canonicalKey(raw);
        if (!seen.insert(key).second) {
            stats.duplicates++;
            continue;
        }

        auto existing = store.findArticleByKey(feedId, key);
        if (!existing) {
            Article article;
            article.feedId = feedId;
            article.canonicalKey = key;
            article.title = raw.title;
            article.link = raw.link;
            article.publishedAt = raw.publishedAt;
            article.content = raw.content;
            article.firstSeenAt = now;
            store.insertArticle(article);
            stats.added++;
            continue;
        }

        // A fallback date is the fetch time; it says nothing about the article.
        Timestamp published = raw.publishedKnown ? raw.publishedAt : existing->publishedAt;
        bool same = existing->title == raw.title && existing->link == raw.link &&
                    existing->content == raw.content &&
                    toUnixSeconds(existing->publishedAt) == toUnixSeconds(published);
        if (same) {
            stats.unchanged++;
            continue;
        }

        store.updateArticleFromFeed(existing->id, raw.title, raw.link, raw.content, published);
        stats.updated++;
    }

    if (stats.duplicates > 0) {
        LOG_D("Merge", "Feed {}: {} repeated entries in one fetch ignored", feedId, stats.duplicates);
    }
    return stats;
}

}
