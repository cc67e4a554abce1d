#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace rtsae::domain {

class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // false once shutdown has begun.
    bool post(std::function<void()> task);

    // Runs what is already queued, then joins the workers.
    void shutdown();

    std::size_t size() const { return workers_.size(); }

private:
    void run();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace rtsae::domain
