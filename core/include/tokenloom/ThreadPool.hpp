/**
 * @file ThreadPool.hpp
 * @brief Fixed worker pool behind InferenceEngine::generate_async
 *
 * INTERNAL TO CORE. FIFO queue, one condition variable. Jobs still queued
 * at destruction are run before the workers exit, so every returned future
 * becomes ready.
 */

#ifndef TL_THREAD_POOL_HPP
#define TL_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace tl {

class ThreadPool {
public:
    explicit ThreadPool(size_t n_threads) {
        if (n_threads == 0) n_threads = 1;
        workers_.reserve(n_threads);
        for (size_t i = 0; i < n_threads; ++i)
            workers_.emplace_back([this] { run(); });
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) w.join();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <typename F>
    std::future<std::invoke_result_t<F>> submit(F&& fn) {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> fut = task->get_future();
        {
            std::lock_guard<std::mutex> lk(mu_);
            jobs_.emplace_back([task]() { (*task)(); });
        }
        cv_.notify_one();
        return fut;
    }

private:
    void run() {
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lk(mu_);
                cv_.wait(lk, [this] { return stopping_ || !jobs_.empty(); });
                if (jobs_.empty()) return;
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            job();
        }
    }

    std::vector<std::thread>          workers_;
    std::deque<std::function<void()>> jobs_;
    std::mutex                        mu_;
    std::condition_variable           cv_;
    bool                              stopping_ = false;
};

} // namespace tl

#endif // TL_THREAD_POOL_HPP
