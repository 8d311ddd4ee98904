// SPDX-License-Identifier: Apache-2.0
#include "WorkerPool.hpp"

#include <core/Log.hpp>

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace toolgate
{

struct WorkerPool::Impl
{
    std::vector<std::jthread> workers;
    mutable std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<Task> queue;
    std::size_t idle = 0;
    bool shutdownRequested = false;

    /// Starts one more worker. Must be called with @c mutex held.
    void spawnWorker()
    {
        workers.emplace_back([this](const std::stop_token& token) { run(token); });
    }

    void run(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto task = Task {};
            {
                auto lock = std::unique_lock(mutex);
                ++idle;
                cv.wait(lock, stopToken, [this] { return !queue.empty() || shutdownRequested; });
                --idle;

                if (stopToken.stop_requested() || shutdownRequested)
                    return;

                task = std::move(queue.front());
                queue.pop_front();
            }

            try
            {
                task();
            }
            catch (const std::exception& e)
            {
                log::error("Background task failed: {}", e.what());
            }
        }
    }
};

WorkerPool::WorkerPool(std::size_t threadCount): _impl(std::make_unique<Impl>())
{
    auto const count = threadCount == 0 ? std::size_t { 1 } : threadCount;
    auto lock = std::lock_guard(_impl->mutex);
    _impl->workers.reserve(count);
    for (auto i = std::size_t { 0 }; i < count; ++i)
        _impl->spawnWorker();

    log::debug("Worker pool started with {} thread(s)", count);
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

auto WorkerPool::post(Task task) -> bool
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
            return false;
        _impl->queue.push_back(std::move(task));

        // Every idle worker is already spoken for by an earlier queued task.
        if (_impl->idle < _impl->queue.size())
        {
            _impl->spawnWorker();
            log::debug("All workers busy, worker pool grown to {} thread(s)", _impl->workers.size());
        }
    }
    _impl->cv.notify_one();
    return true;
}

auto WorkerPool::threadCount() const -> std::size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->workers.size();
}

void WorkerPool::shutdown()
{
    auto workers = std::vector<std::jthread> {};
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->shutdownRequested)
            return;
        _impl->shutdownRequested = true;
        if (!_impl->queue.empty())
            log::debug("Discarding {} queued background task(s)", _impl->queue.size());
        _impl->queue.clear();
        workers.swap(_impl->workers);
    }
    _impl->cv.notify_all();

    for (auto& worker: workers)
    {
        worker.request_stop();
        if (worker.joinable())
            worker.join();
    }
}

} // namespace toolgate
