#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace listui::util {

// Fixed-size pool of worker threads. Waiting jobs are served newest first,
// so the most recent request jumps ahead of older ones still queued.
// The destructor runs every job that is still queued before joining.
class WorkerPool {
public:
    using Job = std::function<void()>;

    WorkerPool(std::string name, size_t num_threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once shutdown has started.
    [[nodiscard]] bool submit(Job job);

    [[nodiscard]] size_t queued() const;
    [[nodiscard]] size_t busy() const { return busy_.load(); }
    [[nodiscard]] size_t size() const { return workers_.size(); }

private:
    void worker_thread();

    std::string name_;
    std::vector<std::thread> workers_;

    std::deque<Job> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;

    std::atomic<bool> stop_{false};
    std::atomic<size_t> busy_{0};
};

}  // namespace listui::util
