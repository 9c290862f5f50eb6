#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace apktool_mcp {

// ---------------------------------------------------------------------------
// WorkerPool: fixed number of threads draining a FIFO of tasks.
//
// Shutdown() stops accepting work, lets queued tasks finish and joins the
// threads. Tasks must not throw.
// ---------------------------------------------------------------------------
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Returns false if the pool is shutting down; the task is dropped.
    bool Post(std::function<void()> task);

    void Shutdown();

    [[nodiscard]] std::size_t Size() const noexcept { return threads_.size(); }

private:
    void WorkerLoop();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    std::vector<std::thread> threads_;
};

} // namespace apktool_mcp
