#pragma once

/*
    ASH ШЭЙДИНГ САН

    ФАЙЛ: job_system.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Мөрийн мужуудаар rasterize/resolve хийх ажлыг worker thread-үүдэд
            тараах интерфэйс, thread pool болон хүлээх бүлэг.
*/


#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace ash
{
    class IJobSystem
    {
    public:
        virtual ~IJobSystem() = default;
        virtual void enqueue(std::function<void()> job) = 0;
        virtual void wait_idle() = 0;
        virtual size_t worker_count() const = 0;
    };

    // Нэг удаагийн parallel_for дуудлагын дуусгавар хүлээх тоолуур.
    class WaitGroup
    {
    public:
        void add(int n = 1)
        {
            std::lock_guard<std::mutex> lock(mtx_);
            pending_ += n;
        }

        void done()
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (--pending_ <= 0) cv_.notify_all();
        }

        void wait()
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this]() { return pending_ <= 0; });
        }

    private:
        int pending_ = 0;
        std::mutex mtx_{};
        std::condition_variable cv_{};
    };

    class ThreadPoolJobSystem final : public IJobSystem
    {
    public:
        explicit ThreadPoolJobSystem(size_t worker_count)
        {
            const size_t n = std::max<size_t>(1, worker_count);
            workers_.reserve(n);
            for (size_t i = 0; i < n; ++i)
            {
                workers_.emplace_back([this]() { run_worker(); });
            }
        }

        ThreadPoolJobSystem(const ThreadPoolJobSystem&) = delete;
        ThreadPoolJobSystem& operator=(const ThreadPoolJobSystem&) = delete;

        ~ThreadPoolJobSystem() override
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                stopping_ = true;
            }
            work_cv_.notify_all();
            for (std::thread& t : workers_)
            {
                if (t.joinable()) t.join();
            }
        }

        void enqueue(std::function<void()> job) override
        {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                queue_.push_back(std::move(job));
            }
            work_cv_.notify_one();
        }

        void wait_idle() override
        {
            std::unique_lock<std::mutex> lock(mtx_);
            idle_cv_.wait(lock, [this]() { return queue_.empty() && in_flight_ == 0; });
        }

        size_t worker_count() const override
        {
            return workers_.size();
        }

        static size_t default_worker_count()
        {
            const unsigned hw = std::thread::hardware_concurrency();
            return (hw > 1u) ? (size_t)(hw - 1u) : 1u;
        }

    private:
        void run_worker()
        {
            for (;;)
            {
                std::function<void()> job{};
                {
                    std::unique_lock<std::mutex> lock(mtx_);
                    work_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                    if (queue_.empty()) return; // stopping_ бөгөөд дараалал хоосон
                    job = std::move(queue_.front());
                    queue_.pop_front();
                    ++in_flight_;
                }

                job();

                std::lock_guard<std::mutex> lock(mtx_);
                --in_flight_;
                if (queue_.empty() && in_flight_ == 0) idle_cv_.notify_all();
            }
        }

        std::vector<std::thread> workers_{};
        std::deque<std::function<void()>> queue_{};
        std::mutex mtx_{};
        std::condition_variable work_cv_{};
        std::condition_variable idle_cv_{};
        size_t in_flight_ = 0;
        bool stopping_ = false;
    };
}
