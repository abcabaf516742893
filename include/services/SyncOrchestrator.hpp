#pragma once
#include "core/Types.hpp"
#include "services/FeedFetcher.hpp"
#include "storage/FeedStore.hpp"
#include "utils/Config.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace ZenFeed {

// Cooperative abort for a sync pass. Feeds whose pipeline has not started
// when cancel() is called are reported as cancelled; running ones finish.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    void reset() noexcept { cancelled_.store(false); }
    bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Called on worker threads for every state change of every feed.
using ProgressCallback = std::function<void(std::int64_t feedId, SyncState state)>;

// Opens a fresh connection; each pipeline gets its own.
using StoreFactory = std::function<std::unique_ptr<FeedStore>()>;

class SyncOrchestrator {
public:
    SyncOrchestrator(StoreFactory stores, std::shared_ptr<Fetcher> fetcher, SyncOptions options);

    // Every stored feed, in id order.
    std::vector<SyncResult> syncAll(const CancellationToken* cancel = nullptr,
                                    const ProgressCallback& progress = nullptr);

    // Throws ValidationError(UnknownFeed) when the id is not stored.
    SyncResult syncOne(std::int64_t feedId, const ProgressCallback& progress = nullptr);

    // One result per feed, in input order. Per-feed failures are reported in
    // the results and never abort the pass.
    std::vector<SyncResult> syncFeeds(const std::vector<Feed>& feeds,
                                      const CancellationToken* cancel = nullptr,
                                      const ProgressCallback& progress = nullptr);

    const SyncOptions& options() const { return options_; }

    // Feeds with a pipeline running or waiting; each holds one lock entry.
    size_t activeFeedLocks();

private:
    SyncResult runPipeline(const Feed& feed, const CancellationToken* cancel,
                           const ProgressCallback& progress);
    // Fetch, parse and merge; the caller holds the feed's lock.
    SyncResult runStages(const Feed& feed, const ProgressCallback& progress);

    std::shared_ptr<std::mutex> feedLock(std::int64_t feedId);
    // Drops the caller's handle and forgets the mutex once nobody else holds it.
    void releaseFeedLock(std::int64_t feedId, std::shared_ptr<std::mutex>& handle);

    StoreFactory stores_;
    std::shared_ptr<Fetcher> fetcher_;
    SyncOptions options_;

    std::mutex locksMutex_;
    std::map<std::int64_t, std::shared_ptr<std::mutex>> feedLocks_;
};

}
