//
// Created by Malik T on 26/09/2025.
//

#ifndef BOMBBUSTER_TASKPOOL_HPP
#define BOMBBUSTER_TASKPOOL_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace bomb::core
{
    // Fixed set of worker threads draining a FIFO of packaged tasks.
    // Owned explicitly by whoever needs it; joined on destruction.
    class TaskPool
    {
    public:
        // 0 = std::thread::hardware_concurrency()
        explicit TaskPool(size_t n_threads = 0);
        ~TaskPool();

        TaskPool(TaskPool const&) = delete;
        auto operator=(TaskPool const&) -> TaskPool& = delete;

        template <typename F>
        auto Submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>>
        {
            using R = std::invoke_result_t<std::decay_t<F>>;
            auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
            std::future<R> fut = task->get_future();
            {
                std::lock_guard<std::mutex> lock(m_);
                q_.emplace_back([task]() { (*task)(); });
            }
            cv_.notify_one();
            return fut;
        }

        auto Size() const noexcept -> size_t { return workers_.size(); }
        // true when called from one of this pool's threads
        auto InWorker() const -> bool;

    private:
        auto WorkerLoop() -> void;

        std::mutex m_;
        std::condition_variable cv_;
        std::deque<std::function<void()>> q_;
        bool stop_{false};
        std::vector<std::thread> workers_;
    };
}

#endif //BOMBBUSTER_TASKPOOL_HPP
