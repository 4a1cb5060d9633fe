#pragma once
// Fixed-size worker pool fed by a bounded FIFO queue.
// submit() blocks while the queue is full (backpressure on the watcher loop).
// shutdown() stops accepting work, drops anything still queued and joins.
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "logger.hpp"

namespace credingest {

class WorkerPool {
public:
    using Task = std::function<void()>;

    WorkerPool(size_t num_threads, size_t queue_capacity)
        : capacity_(queue_capacity == 0 ? 1 : queue_capacity) {
        if (num_threads == 0) num_threads = 1;
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back(&WorkerPool::worker_loop, this);
        }
        LOG_DBG("[workers] Started %zu threads (queue capacity %zu)", num_threads, capacity_);
    }

    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false if the pool is shutting down
    bool submit(Task task) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return stopping_ || queue_.size() < capacity_; });
        if (stopping_) return false;
        queue_.push_back(std::move(task));
        not_empty_.notify_one();
        return true;
    }

    // Blocks until the queue is empty and no task is running
    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this] { return queue_.empty() && active_ == 0; });
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ && workers_.empty()) return;
            stopping_ = true;
            if (!queue_.empty()) {
                LOG_WRN("[workers] Dropping %zu queued tasks on shutdown", queue_.size());
                queue_.clear();
            }
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
        workers_.clear();
        idle_.notify_all();
    }

    [[nodiscard]] size_t queued() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    void worker_loop() {
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                not_empty_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (stopping_ && queue_.empty()) return;
                task = std::move(queue_.front());
                queue_.pop_front();
                ++active_;
            }
            not_full_.notify_one();

            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERR("[workers] Task failed: %s", e.what());
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                --active_;
                if (queue_.empty() && active_ == 0) idle_.notify_all();
            }
        }
    }

    const size_t capacity_;
    std::vector<std::thread> workers_;
    std::deque<Task> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::condition_variable idle_;
    size_t active_ = 0;
    bool stopping_ = false;
};

} // namespace credingest
