#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace formcheck {

// Fixed-size thread pool that keeps blocking decode and inference work off
// the HTTP request threads. Queued tasks are drained before destruction.
class WorkerPool {
public:
    explicit WorkerPool(size_t num_threads) : stop_(false) {
        if (num_threads == 0) {
            num_threads = 1;
        }
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;

                    {
                        std::unique_lock<std::mutex> lock(queue_mutex_);
                        condition_.wait(lock, [this] {
                            return stop_ || !tasks_.empty();
                        });

                        if (stop_ && tasks_.empty()) return;

                        task = std::move(tasks_.front());
                        tasks_.pop();
                    }

                    task();
                    tasks_completed_++;
                }
            });
        }
    }

    ~WorkerPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        condition_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) worker.join();
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Exceptions thrown by f are delivered through the returned future
    template<class F>
    auto submit(F&& f) -> std::future<typename std::invoke_result<F>::type> {
        using return_type = typename std::invoke_result<F>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) throw std::runtime_error("submit on stopped WorkerPool");
            tasks_.emplace([task]() { (*task)(); });
            tasks_submitted_++;
        }

        condition_.notify_one();
        return result;
    }

    size_t pendingTasks() const {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return tasks_.size();
    }

    size_t threadCount() const { return workers_.size(); }
    uint64_t completedCount() const { return tasks_completed_; }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_;

    std::atomic<uint64_t> tasks_submitted_{0};
    std::atomic<uint64_t> tasks_completed_{0};
};

} // namespace formcheck

#endif // WORKER_POOL_HPP
