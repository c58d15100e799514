#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: thread_pool_job_system.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Тогтмол тооны worker thread бүхий job system.
*/


#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "gpurt/job/job_system.hpp"

namespace gpurt
{
    // 0 өгвөл hardware_concurrency-г ашиглана.
    inline size_t resolve_worker_count(size_t requested)
    {
        if (requested > 0) return requested;
        return std::max<size_t>(1u, (size_t)std::thread::hardware_concurrency());
    }

    // Jobs run in FIFO order; wait_idle returns once the queue is drained and
    // no worker is still running a job.
    class ThreadPoolJobSystem final : public IJobSystem
    {
    public:
        explicit ThreadPoolJobSystem(size_t worker_count)
        {
            const size_t count = resolve_worker_count(worker_count);
            threads_.reserve(count);
            while (threads_.size() < count) threads_.emplace_back(&ThreadPoolJobSystem::run_worker, this);
        }

        ~ThreadPoolJobSystem() override
        {
            {
                std::lock_guard<std::mutex> guard(lock_);
                shutting_down_ = true;
            }
            work_ready_.notify_all();
            for (std::thread& t : threads_) t.join();
        }

        ThreadPoolJobSystem(const ThreadPoolJobSystem&) = delete;
        ThreadPoolJobSystem& operator=(const ThreadPoolJobSystem&) = delete;

        void enqueue(std::function<void()> job) override
        {
            if (!job) return;
            std::unique_lock<std::mutex> guard(lock_);
            pending_.push_back(std::move(job));
            guard.unlock();
            work_ready_.notify_one();
        }

        void wait_idle() override
        {
            std::unique_lock<std::mutex> guard(lock_);
            drained_.wait(guard, [this]() { return pending_.empty() && running_ == 0; });
        }

        size_t worker_count() const override { return threads_.size(); }

        uint64_t jobs_completed() const { return finished_.load(std::memory_order_relaxed); }

    private:
        void run_worker()
        {
            std::unique_lock<std::mutex> guard(lock_);
            for (;;)
            {
                work_ready_.wait(guard, [this]() { return shutting_down_ || !pending_.empty(); });
                if (pending_.empty()) return;

                std::function<void()> job = std::move(pending_.front());
                pending_.pop_front();
                ++running_;
                guard.unlock();

                job();
                finished_.fetch_add(1, std::memory_order_relaxed);

                guard.lock();
                --running_;
                if (pending_.empty() && running_ == 0) drained_.notify_all();
            }
        }

        std::vector<std::thread> threads_{};
        std::deque<std::function<void()>> pending_{};
        std::mutex lock_{};
        std::condition_variable work_ready_{};
        std::condition_variable drained_{};
        bool shutting_down_ = false;
        size_t running_ = 0;
        std::atomic<uint64_t> finished_{0};
    };
}
