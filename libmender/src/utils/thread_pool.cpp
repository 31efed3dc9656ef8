#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"

namespace mender {

    ThreadPool::ThreadPool(unsigned threads) {
        if (threads == 0) threads = std::thread::hardware_concurrency();
        if (threads == 0) threads = 1;
        workers_.reserve(threads);
        for (unsigned i = 0; i < threads; ++i) {
            workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
        }
    }

    ThreadPool::~ThreadPool() {
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
        }
        work_cv_.notify_all();
        // jthread destructors request stop and join
    }

    void ThreadPool::worker_loop(const std::stop_token& st) {
        for (;;) {
            std::function<void(std::stop_token)> task;
            {
                std::unique_lock lock(mutex_);
                work_cv_.wait(lock, st, [this] { return stopping_ || !queue_.empty(); });
                if (st.stop_requested() || queue_.empty()) {
                    return;
                }
                task = std::move(queue_.front());
                queue_.pop_front();
            }

            try {
                task(st);
            } catch (const std::exception& e) {
                Logger::log(LogLevel::Error, std::string("Unhandled exception in worker: ") + e.what(), "thread_pool");
            }

            {
                std::lock_guard lock(mutex_);
                --pending_;
            }
            idle_cv_.notify_all();
        }
    }

    void ThreadPool::wait_idle() {
        std::unique_lock lock(mutex_);
        idle_cv_.wait(lock, [this] { return pending_ == 0; });
    }

    void ThreadPool::request_stop() {
        std::size_t discarded = 0;
        {
            std::lock_guard lock(mutex_);
            stopping_ = true;
            discarded = queue_.size();
            pending_ -= discarded;
            queue_.clear();
        }
        if (discarded > 0) {
            Logger::log(LogLevel::Debug, "Discarded " + std::to_string(discarded) + " queued tasks", "thread_pool");
        }
        work_cv_.notify_all();
        idle_cv_.notify_all();
        for (auto& w : workers_) {
            w.request_stop();
        }
    }

    bool ThreadPool::stop_requested() const {
        std::lock_guard lock(mutex_);
        return stopping_;
    }

} // namespace mender
