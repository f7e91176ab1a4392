#pragma once
// WorkerPool.hpp – Fixed-size FIFO thread pool returning futures.
//
// Usage example:
//   WorkerPool pool{4};
//   auto f = pool.submit([&] { return arbiter.arbitrate(region, a, b); });
//   ArbitrationResult r = f.get();
//
// Exceptions thrown by a task are delivered through its future. Tasks still
// queued at destruction run before the workers are joined.

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace simforge {

class WorkerPool {
public:
    // 0 selects std::thread::hardware_concurrency().
    explicit WorkerPool(size_t num_threads = 0) {
        if (num_threads == 0) num_threads = std::thread::hardware_concurrency();
        num_threads_ = std::max<size_t>(1, num_threads);
        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i)
            workers_.emplace_back(&WorkerPool::workerLoop, this);
    }

    ~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_)
            if (w.joinable()) w.join();
    }

    WorkerPool(const WorkerPool&)            = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&)                 = delete;
    WorkerPool& operator=(WorkerPool&&)      = delete;

    template <typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using ReturnType = std::invoke_result_t<std::decay_t<F>>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    [[nodiscard]] size_t size() const noexcept { return num_threads_; }

private:
    void workerLoop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (tasks_.empty()) return; // stop_ and nothing left
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    size_t                            num_threads_{1};
    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        mutex_;
    std::condition_variable           cv_;
    bool                              stop_{false};
};

} // namespace simforge
