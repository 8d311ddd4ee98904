// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <functional>
#include <memory>

namespace toolgate
{

/// @brief Pool of background threads running fire-and-forget tasks.
///
/// A task never waits behind a long-running one: when every worker is busy, post() starts
/// another worker. Idle workers stay around for later tasks. Shutdown drops tasks that have not
/// started yet and joins the workers after their current task returns.
class WorkerPool
{
  public:
    using Task = std::function<void()>;

    /// @brief Starts the initial workers.
    /// @param threadCount Number of workers started up front (at least one).
    explicit WorkerPool(std::size_t threadCount);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// @brief Enqueues a task (non-blocking), starting a worker if none is idle.
    /// @return false if the pool is shutting down and the task was not accepted.
    auto post(Task task) -> bool;

    /// @brief Returns the number of worker threads started so far.
    [[nodiscard]] auto threadCount() const -> std::size_t;

    /// @brief Stops accepting tasks, discards queued ones and joins all workers.
    void shutdown();

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace toolgate
