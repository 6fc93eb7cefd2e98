#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @class WorkerPool
 * @brief Fixed set of threads draining a bounded task queue.
 *
 * Submit blocks while the queue is full. Destruction finishes queued tasks
 * before joining.
 */
class WorkerPool {
public:
    WorkerPool(size_t num_threads, size_t max_queued);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn>
    auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> future = task->get_future();
        Enqueue([task]() { (*task)(); });
        return future;
    }

    size_t ThreadCount() const { return workers_.size(); }

private:
    void Enqueue(std::function<void()> job);
    void ThreadMain();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    size_t max_queued_;
    bool stopping_ = false;

    std::mutex mtx_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};
