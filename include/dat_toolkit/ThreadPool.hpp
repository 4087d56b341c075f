#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace dat_toolkit {

// Fixed-size worker pool. Tasks already queued when the pool is stopped
// still run; Enqueue after stop() yields a future holding an exception.
class ThreadPool final {
public:
    explicit ThreadPool(std::size_t threads) : stop_(false) {
        if (threads == 0) threads = 1;
        size_ = threads;
        for (std::size_t i = 0; i < threads; ++i)
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(queue_mutex_);
                        condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                        if (stop_ && tasks_.empty()) return;
                        task = std::move(tasks_.front());
                        tasks_.pop();
                    }
                    task();
                }
            });
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool() { stop(); }

    template<class F, class... Args>
    auto Enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using return_type = std::invoke_result_t<F, Args...>;
        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<return_type> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                std::promise<return_type> p;
                p.set_exception(std::make_exception_ptr(std::runtime_error("enqueue on stopped ThreadPool")));
                return p.get_future();
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        condition_.notify_one();
        return res;
    }

    // drains the queue and joins the workers; idempotent
    void stop() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_ && workers_.empty()) return;
            stop_ = true;
        }
        condition_.notify_all();
        for (std::thread& worker : workers_)
            if (worker.joinable()) worker.join();
        workers_.clear();
    }

    std::size_t size() const noexcept { return size_; }

private:
    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        queue_mutex_;
    std::condition_variable           condition_;
    bool                              stop_;
    std::size_t                       size_ = 0;
};

} // namespace dat_toolkit
