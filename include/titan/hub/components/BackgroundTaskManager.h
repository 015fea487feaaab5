// Copyright 2025 The Titan Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <titan/hub/hub_executor.h>

#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace titan::hub {

class HubStatistics;
class InsightGenerator;
class StuckTaskReaper;

/**
 * @brief Owns the hub's periodic loops.
 *
 * ## Loops
 * - **Reaper**: overrun sweep and retention purge (default every 10 s)
 * - **InsightTrends**: usage-trend and success-rate rules over the statistics
 *   snapshot (default every 2 min)
 * - **AutoOptimization**: queues a Low-priority performance pass per tab
 *   (default every 5 min)
 *
 * Every loop runs on the hub strand, so a sweep never interleaves with a
 * dispatch or a terminal transition. An interval of zero disables that loop.
 *
 * ## Lifecycle
 * 1. Construct with dependencies via DI
 * 2. Call `start()` to launch the loops
 * 3. Call `stop()` to cancel their timers and wait for them to exit
 */
class BackgroundTaskManager {
public:
    struct Dependencies {
        HubStrand strand;
        StuckTaskReaper& reaper;
        InsightGenerator& insights;
        HubStatistics& statistics;
        /// Queues the auto-optimization pass; may be empty.
        std::function<void()> autoOptimize;
    };

    struct Intervals {
        std::chrono::milliseconds reaper{std::chrono::seconds(10)};
        std::chrono::milliseconds insights{std::chrono::minutes(2)};
        std::chrono::milliseconds autoOptimization{std::chrono::minutes(5)};
    };

    BackgroundTaskManager(Dependencies deps, Intervals intervals);
    ~BackgroundTaskManager();

    BackgroundTaskManager(const BackgroundTaskManager&) = delete;
    BackgroundTaskManager& operator=(const BackgroundTaskManager&) = delete;
    BackgroundTaskManager(BackgroundTaskManager&&) = delete;
    BackgroundTaskManager& operator=(BackgroundTaskManager&&) = delete;

    /// Idempotent.
    void start();

    /**
     * @brief Cancel the loop timers and wait for the loops to exit.
     *
     * Idempotent. Must not be called from an executor thread.
     */
    void stop();

    bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }

    // Loop bodies, also callable directly (e.g. from tests).
    void runReaperSweep();
    void runInsightSweep();
    void runAutoOptimization();

    const Intervals& intervals() const noexcept { return intervals_; }

private:
    void launchPeriodic(const char* name, std::chrono::milliseconds interval,
                        void (BackgroundTaskManager::*body)());

    Dependencies deps_;
    Intervals intervals_;
    std::atomic<bool> running_{false};

    // Shared stop flag that loops capture; must outlive them.
    std::shared_ptr<std::atomic<bool>> stopRequested_;

    std::mutex mutex_;
    std::vector<std::shared_ptr<boost::asio::steady_timer>> timers_;
    std::vector<std::future<void>> loops_;
};

} // namespace titan::hub
