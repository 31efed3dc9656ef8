/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool for per-artifact classification and repair.
 */

#ifndef MENDER_THREAD_POOL_HPP
#define MENDER_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

namespace mender {

    /**
     * @brief A fixed set of std::jthread workers draining a FIFO queue.
     *
     * @details Tasks are callables taking a std::stop_token. request_stop()
     * discards queued tasks and signals the token of running ones; the
     * destructor joins every worker.
     */
    class ThreadPool {
    public:
        /**
         * @param threads Worker count; 0 selects the hardware concurrency.
         */
        explicit ThreadPool(unsigned threads = 0);

        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Queue a task.
         * @return Future for the task's result. A discarded task's future
         * reports std::future_errc::broken_promise.
         * @throws std::runtime_error if the pool was stopped.
         */
        template <class F>
        auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
            using R = std::invoke_result_t<F, std::stop_token>;
            auto task = std::make_shared<std::packaged_task<R(std::stop_token)>>(std::forward<F>(f));
            auto future = task->get_future();
            {
                std::lock_guard lock(mutex_);
                if (stopping_) {
                    throw std::runtime_error("enqueue on stopped ThreadPool");
                }
                queue_.emplace_back([task](const std::stop_token st) { (*task)(st); });
                ++pending_;
            }
            work_cv_.notify_one();
            return future;
        }

        /// Block until every queued and running task has finished.
        void wait_idle();

        /// Discard queued tasks and signal running ones to stop.
        void request_stop();

        [[nodiscard]] bool stop_requested() const;

        [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

    private:
        void worker_loop(const std::stop_token& st);

        mutable std::mutex mutex_;                       ///< Guards queue_, stopping_, pending_
        std::condition_variable_any work_cv_;            ///< New task or stop
        std::condition_variable idle_cv_;                ///< pending_ reached zero
        std::deque<std::function<void(std::stop_token)>> queue_;
        bool stopping_ = false;
        std::size_t pending_ = 0;                        ///< Queued plus running
        std::vector<std::jthread> workers_;
    };

} // namespace mender

#endif // MENDER_THREAD_POOL_HPP
