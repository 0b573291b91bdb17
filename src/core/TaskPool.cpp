//
// Created by Malik T on 26/09/2025.
//

#include "TaskPool.hpp"

#include <algorithm>

namespace bomb::core
{
    namespace
    {
        thread_local TaskPool const* tls_owner = nullptr;
    }

    TaskPool::TaskPool(size_t n_threads)
    {
        if (n_threads == 0)
            n_threads = std::max(1U, std::thread::hardware_concurrency());
        workers_.reserve(n_threads);
        for (size_t i{}; i < n_threads; ++i)
            workers_.emplace_back([this]() { WorkerLoop(); });
    }

    TaskPool::~TaskPool()
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            stop_ = true;
        }
        cv_.notify_all();
        for (std::thread& t : workers_)
        {
            if (t.joinable()) t.join();
        }
    }

    auto TaskPool::InWorker() const -> bool
    {
        return tls_owner == this;
    }

    auto TaskPool::WorkerLoop() -> void
    {
        tls_owner = this;
        for (;;)
        {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(m_);
                cv_.wait(lock, [this]() { return stop_ || !q_.empty(); });
                // drain what is queued before honouring stop
                if (q_.empty()) return;
                job = std::move(q_.front());
                q_.pop_front();
            }
            // packaged_task stores any exception in its future
            job();
        }
    }
}
