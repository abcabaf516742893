#include "services/SyncOrchestrator.hpp"
#include "services/FeedParser.hpp"
#include "services/MergeEngine.hpp"
#include "utils/Logger.hpp"
#include "utils/WorkerPool.hpp"
#include <algorithm>
#include <future>

namespace ZenFeed {

namespace {

void notify(const ProgressCallback& progress, std::int64_t feedId, SyncState state) {
    if (!progress) return;
    try {
        progress(feedId, state);
    } catch (const std::exception& e) {
        LOG_W("Sync", "Progress callback threw for feed {}: {}", feedId, e.what());
    }
}

}

SyncOrchestrator::SyncOrchestrator(StoreFactory stores, std::shared_ptr<Fetcher> fetcher, SyncOptions options)
    : stores_(std::move(stores)), fetcher_(std::move(fetcher)), options_(std::move(options)) {
    if (options_.maxConcurrentFeeds < 1) options_.maxConcurrentFeeds = 1;
    FeedParser::globalInit();
}

std::vector<SyncResult> SyncOrchestrator::syncAll(const CancellationToken* cancel,
                                                  const ProgressCallback& progress) {
    std::vector<Feed> feeds;
    {
        auto store = stores_();
        feeds = store->listFeeds();
    }
    return syncFeeds(feeds, cancel, progress);
}

SyncResult SyncOrchestrator::syncOne(std::int64_t feedId, const ProgressCallback& progress) {
    std::optional<Feed> feed;
    {
        auto store = stores_();
        feed = store->findFeed(feedId);
    }
    if (!feed) throw ValidationError(ErrorCode::UnknownFeed, "no feed with id " + std::to_string(feedId));

    auto results = syncFeeds({*feed}, nullptr, progress);
    return results.front();
}

std::vector<SyncResult> SyncOrchestrator::syncFeeds(const std::vector<Feed>& feeds,
                                                    const CancellationToken* cancel,
                                                    const ProgressCallback& progress) {
    std::vector<SyncResult> results;
    if (feeds.empty()) return results;

    size_t threads = std::min(options_.maxConcurrentFeeds, feeds.size());
    LOG_I("Sync", "Syncing {} feeds on {} workers", feeds.size(), threads);

    std::vector<std::future<SyncResult>> pending;
    pending.reserve(feeds.size());
    {
        WorkerPool pool(threads);
        for (const auto& feed : feeds) {
            pending.push_back(pool.submit([this, &feed, cancel, &progress]() {
                return runPipeline(feed, cancel, progress);
            }));
        }
        pool.stop();
    }

    results.reserve(feeds.size());
    for (auto& future : pending) results.push_back(future.get());

    int failed = static_cast<int>(std::count_if(results.begin(), results.end(),
                                                [](const SyncResult& r) { return !r.ok(); }));
    LOG_I("Sync", "Pass finished: {} ok, {} failed", results.size() - failed, failed);
    return results;
}

std::shared_ptr<std::mutex> SyncOrchestrator::feedLock(std::int64_t feedId) {
    std::lock_guard<std::mutex> lock(locksMutex_);
    auto& slot = feedLocks_[feedId];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

size_t SyncOrchestrator::activeFeedLocks() {
    std::lock_guard<std::mutex> lock(locksMutex_);
    return feedLocks_.size();
}

void SyncOrchestrator::releaseFeedLock(std::int64_t feedId, std::shared_ptr<std::mutex>& handle) {
    std::lock_guard<std::mutex> lock(locksMutex_);
    handle.reset();
    auto it = feedLocks_.find(feedId);
    if (it != feedLocks_.end() && it->second.use_count() == 1) feedLocks_.erase(it);
}

SyncResult SyncOrchestrator::runPipeline(const Feed& feed, const CancellationToken* cancel,
                                         const ProgressCallback& progress) {
    if (cancel && cancel->cancelled()) {
        SyncResult result;
        result.feedId = feed.id;
        result.state = SyncState::Failed;
        result.error = SyncFailure{ErrorCode::Cancelled, SyncState::Pending, "sync cancelled", 0};
        notify(progress, feed.id, result.state);
        return result;
    }

    auto lockHandle = feedLock(feed.id);
    SyncResult result;
    {
        std::lock_guard<std::mutex> feedGuard(*lockHandle);
        result = runStages(feed, progress);
    }
    releaseFeedLock(feed.id, lockHandle);
    return result;
}

SyncResult SyncOrchestrator::runStages(const Feed& feed, const ProgressCallback& progress) {
    SyncResult result;
    result.feedId = feed.id;
    result.state = SyncState::Pending;

    std::unique_ptr<FeedStore> store;
    auto fail = [&](ErrorCode code, const std::string& message, int httpStatus) {
        SyncFailure failure{code, result.state, message, httpStatus};
        result.state = SyncState::Failed;
        result.error = failure;
        LOG_W("Sync", "Feed {} ({}) failed while {}: {}", feed.id, feed.url,
              syncStateName(failure.stage), describeFailure(failure));
        try {
            if (!store) store = stores_();
            store->recordSyncFailure(feed.id, Clock::now(), describeFailure(failure));
        } catch (const StorageError& e) {
            LOG_E("Sync", "Cannot record failure of feed {}: {}", feed.id, e.what());
        }
        notify(progress, feed.id, result.state);
        return result;
    };

    auto enter = [&](SyncState state) {
        result.state = state;
        notify(progress, feed.id, state);
    };

    enter(SyncState::Fetching);
    std::string body;
    try {
        body = fetcher_->fetch(feed.url, std::chrono::seconds(options_.fetch.timeoutSeconds));
    } catch (const FetchError& e) {
        return fail(e.code(), e.what(), e.httpStatus());
    } catch (const std::exception& e) {
        return fail(ErrorCode::NetworkFailure, e.what(), 0);
    }

    enter(SyncState::Parsing);
    ParsedFeed parsed;
    try {
        parsed = FeedParser::parse(body, Clock::now());
    } catch (const ParseError& e) {
        return fail(e.code(), e.what(), 0);
    }
    result.entriesSkipped = parsed.skippedEntries;

    enter(SyncState::Merging);
    try {
        store = stores_();
        Timestamp now = Clock::now();
        // Articles and the feed row commit together or not at all.
        Transaction tx(store->database());
        MergeStats stats = MergeEngine::apply(*store, feed.id, parsed.articles, now);
        store->recordSyncSuccess(feed.id, now, parsed.title);
        tx.commit();
        result.articlesAdded = stats.added;
        result.articlesUpdated = stats.updated;
        result.articlesUnchanged = stats.unchanged;
        result.entriesSkipped += stats.duplicates;
    } catch (const StorageError& e) {
        return fail(e.code(), e.what(), 0);
    }

    enter(SyncState::Done);
    LOG_I("Sync", "Feed {} ({}): {} added, {} updated, {} unchanged, {} skipped", feed.id, feed.url,
          result.articlesAdded, result.articlesUpdated, result.articlesUnchanged, result.entriesSkipped);
    return result;
}

}
