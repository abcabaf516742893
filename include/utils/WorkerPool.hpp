#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace ZenFeed {

// Fixed-size pool; tasks run in submission order on whichever thread frees up.
class WorkerPool {
public:
    explicit WorkerPool(size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once stop() has been called.
    bool submitTask(std::function<void()> task);

    // Exceptions thrown by the callable surface through the future.
    template <typename F>
    auto submit(F&& fn) -> std::future<decltype(fn())> {
        using R = decltype(fn());
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        if (!submitTask([task]() { (*task)(); })) {
            throw std::runtime_error("worker pool is stopped");
        }
        return result;
    }

    // Drains queued tasks, then joins all threads.
    void stop();

    size_t size() const { return workers_.size(); }

private:
    void workerLoop();

    bool shouldStop_ = false;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condition_;
};

}
