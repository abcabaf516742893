#pragma once
#include "core/Types.hpp"
#include "storage/FeedStore.hpp"
#include <string>
#include <vector>

namespace ZenFeed {

struct MergeStats {
    int added = 0;
    int updated = 0;
    int unchanged = 0;
    int duplicates = 0;  // repeated canonical keys within the batch
};

class MergeEngine {
public:
    // "guid:<guid>", else "link:<hash of normalized link>", else
    // "title:<hash of normalized title and publication day>". Best-effort
    // identity: a guid-less, link-less entry whose title changes becomes a
    // new article.
    static std::string canonicalKey(const RawArticle& article);

    // Reconciles one feed's fetched batch with storage in a single
    // transaction. Read/saved flags, first_seen_at and full_content of
    // existing rows are never written; stored articles missing from the
    // batch are kept. Throws StorageError, after rolling back.
    static MergeStats merge(FeedStore& store, std::int64_t feedId,
                            const std::vector<RawArticle>& articles, Timestamp now);

    // merge() without the transaction; the caller must hold one on the
    // store's connection and decides whether it commits.
    static MergeStats apply(FeedStore& store, std::int64_t feedId,
                            const std::vector<RawArticle>& articles, Timestamp now);
};

}
