#include "worker_pool.hpp"
#include <algorithm>
#include <utility>

WorkerPool::WorkerPool(size_t num_threads, size_t max_queued)
    : max_queued_(std::max<size_t>(1, max_queued)) {
    const size_t count = std::max<size_t>(1, num_threads);
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this]() { ThreadMain(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

void WorkerPool::Enqueue(std::function<void()> job) {
    {
        std::unique_lock<std::mutex> lk(mtx_);
        not_full_.wait(lk, [this]() { return stopping_ || queue_.size() < max_queued_; });
        if (stopping_) {
            throw std::runtime_error("WorkerPool is shutting down");
        }
        queue_.push_back(std::move(job));
    }
    not_empty_.notify_one();
}

void WorkerPool::ThreadMain() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            not_empty_.wait(lk, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) break;  // stopping and drained

            job = std::move(queue_.front());
            queue_.pop_front();
        }
        not_full_.notify_one();

        // packaged_task stores any exception in its future.
        job();
    }
}
