#include "utils/WorkerPool.hpp"
#include "utils/Logger.hpp"

namespace ZenFeed {

WorkerPool::WorkerPool(size_t threadCount) {
    if (threadCount == 0) threadCount = 1;
    workers_.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i) {
        workers_.emplace_back([this] { workerLoop(); });
    }
    LOG_D("WorkerPool", "Started {} worker threads", threadCount);
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] { return shouldStop_ || !tasks_.empty(); });
            if (shouldStop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        try {
            task();
        } catch (const std::exception& e) {
            LOG_E("WorkerPool", "Exception in background task: {}", e.what());
        }
    }
}

bool WorkerPool::submitTask(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (shouldStop_) return false;
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
    return true;
}

void WorkerPool::stop() {
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        if (shouldStop_) return;
        shouldStop_ = true;
    }
    condition_.notify_all();
    for (std::thread& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

}
