#include "util/WorkerPool.hpp"
#include "util/Logger.hpp"

namespace listui::util {

WorkerPool::WorkerPool(std::string name, size_t num_threads) : name_(std::move(name)) {
    if (num_threads == 0) num_threads = 1;

    Logger::info(name_ + ": Initializing with " + std::to_string(num_threads) + " worker threads");

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() {
            worker_thread();
        });
    }
}

WorkerPool::~WorkerPool() {
    Logger::info(name_ + ": Shutting down");

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    Logger::info(name_ + ": Shutdown complete");
}

bool WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            Logger::warn(name_ + ": Rejecting job, pool is shutting down");
            return false;
        }
        job_queue_.push_front(std::move(job));
    }

    cv_.notify_one();
    return true;
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return job_queue_.size();
}

void WorkerPool::worker_thread() {
    while (true) {
        Job job;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);

            cv_.wait(lock, [this]() {
                return stop_ || !job_queue_.empty();
            });

            // Drain what is left before exiting so every job gets to report back
            if (stop_ && job_queue_.empty()) {
                break;
            }

            job = std::move(job_queue_.front());
            job_queue_.pop_front();
            ++busy_;
        }

        if (job) {
            job();
        }
        --busy_;
    }
}

}  // namespace listui::util
