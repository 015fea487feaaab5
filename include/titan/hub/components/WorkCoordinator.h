// Copyright 2025 The Titan Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <titan/hub/hub_executor.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

namespace titan::hub {

/**
 * @brief io_context plus worker thread pool hosting an IntelligenceHub.
 *
 * The hub takes an executor and builds its strand on top of it; capability
 * handlers run on the same pool.
 *
 * ## Usage Pattern
 *
 * ```cpp
 * WorkCoordinator coordinator;
 * coordinator.start(4);
 *
 * IntelligenceHub hub({coordinator.getExecutor(), settings});
 * hub.start();
 * ...
 * hub.stop();          // from a non-worker thread
 * coordinator.stop();
 * coordinator.join();
 * ```
 *
 * ## Shutdown Behavior
 *
 * - `stop()`: Resets the work guard and stops the io_context
 * - `join()`: Blocks until all workers complete (safe for destruction)
 * - `joinWithTimeout()`: Like join(), but gives up after a deadline
 */
class WorkCoordinator {
public:
    /**
     * @brief Construct WorkCoordinator (does not start threads).
     */
    WorkCoordinator();

    /**
     * @brief Destructor ensures clean shutdown.
     *
     * Automatically calls stop() and join() if not already done.
     */
    ~WorkCoordinator();

    WorkCoordinator(const WorkCoordinator&) = delete;
    WorkCoordinator& operator=(const WorkCoordinator&) = delete;
    WorkCoordinator(WorkCoordinator&&) = delete;
    WorkCoordinator& operator=(WorkCoordinator&&) = delete;

    /**
     * @brief Start the worker thread pool.
     *
     * @param numThreads Optional thread count override (default: hardware_concurrency,
     *                   minimum 1)
     * @throws std::runtime_error if already started or thread creation fails
     */
    void start(std::optional<std::size_t> numThreads = std::nullopt);

    /**
     * @brief Reset the work guard and stop the io_context. Does not block.
     *
     * Safe to call multiple times (idempotent).
     */
    void stop();

    /**
     * @brief Wait for all worker threads to finish.
     *
     * Must call stop() first, or this will hang indefinitely.
     */
    void join();

    /**
     * @brief Wait for workers with timeout, detaching any that don't finish.
     *
     * @return true if all workers joined within timeout
     */
    bool joinWithTimeout(std::chrono::milliseconds timeout);

    [[nodiscard]] std::shared_ptr<boost::asio::io_context> getIOContext() const noexcept;

    [[nodiscard]] boost::asio::any_io_executor getExecutor() const noexcept;

    /**
     * @brief Create a new strand for logical work isolation.
     *
     * Strands guarantee that posted work executes serially (FIFO order),
     * while still allowing work stealing across thread pool.
     */
    [[nodiscard]] HubStrand makeStrand() const;

    [[nodiscard]] bool isRunning() const noexcept;

    [[nodiscard]] std::size_t getWorkerCount() const noexcept;

    [[nodiscard]] std::size_t getActiveWorkerCount() const noexcept {
        return activeWorkers_.load(std::memory_order_relaxed);
    }

    /// True when called from one of this coordinator's worker threads.
    [[nodiscard]] bool isWorkerThread() const;

private:
    /// Shared io_context for all async operations
    std::shared_ptr<boost::asio::io_context> ioContext_;

    /// Work guard to keep io_context alive until stop() called
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        workGuard_;

    std::vector<std::thread> workers_;

    bool started_ = false;

    /// Count of workers currently inside io_context::run()
    std::atomic<std::size_t> activeWorkers_{0};

    std::mutex joinMutex_;
    std::condition_variable joinCV_;

    mutable std::mutex workerStateMutex_;
    std::vector<std::thread::id> workerThreadIds_;
};

} // namespace titan::hub
