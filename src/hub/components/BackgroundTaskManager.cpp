// Copyright 2025 The Titan Authors
// SPDX-License-Identifier: Apache-2.0

#include <titan/hub/components/BackgroundTaskManager.h>
#include <titan/hub/components/HubStatistics.h>
#include <titan/hub/components/InsightGenerator.h>
#include <titan/hub/components/StuckTaskReaper.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace titan::hub {

using namespace std::chrono_literals;

BackgroundTaskManager::BackgroundTaskManager(Dependencies deps, Intervals intervals)
    : deps_(std::move(deps)), intervals_(intervals),
      stopRequested_(std::make_shared<std::atomic<bool>>(false)) {}

BackgroundTaskManager::~BackgroundTaskManager() {
    if (running_.load(std::memory_order_acquire)) {
        stop();
    }
}

void BackgroundTaskManager::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::debug("[BackgroundTaskManager] Already running, skipping start");
        return;
    }

    stopRequested_ = std::make_shared<std::atomic<bool>>(false);
    launchPeriodic("Reaper", intervals_.reaper, &BackgroundTaskManager::runReaperSweep);
    launchPeriodic("InsightTrends", intervals_.insights, &BackgroundTaskManager::runInsightSweep);
    if (deps_.autoOptimize) {
        launchPeriodic("AutoOptimization", intervals_.autoOptimization,
                       &BackgroundTaskManager::runAutoOptimization);
    }
    spdlog::info("[BackgroundTaskManager] Background loops launched (reaper={}ms, insights={}ms, "
                 "autoOptimization={}ms)",
                 intervals_.reaper.count(), intervals_.insights.count(),
                 intervals_.autoOptimization.count());
}

void BackgroundTaskManager::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        spdlog::debug("[BackgroundTaskManager] Stop called but not running");
        return;
    }

    spdlog::info("[BackgroundTaskManager] Stopping background loops");
    stopRequested_->store(true, std::memory_order_release);

    std::vector<std::shared_ptr<boost::asio::steady_timer>> timers;
    std::vector<std::future<void>> loops;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timers.swap(timers_);
        loops.swap(loops_);
    }

    // Timers belong to the strand; cancel them there.
    boost::asio::post(deps_.strand, [timers]() {
        for (const auto& timer : timers) {
            timer->cancel();
        }
    });

    for (auto& loop : loops) {
        if (loop.wait_for(5s) != std::future_status::ready) {
            spdlog::warn("[BackgroundTaskManager] Loop did not exit within 5s");
            continue;
        }
        try {
            loop.get();
        } catch (const std::exception& e) {
            spdlog::warn("[BackgroundTaskManager] Loop exited with exception: {}", e.what());
        }
    }
}

void BackgroundTaskManager::launchPeriodic(const char* name, std::chrono::milliseconds interval,
                                           void (BackgroundTaskManager::*body)()) {
    if (interval <= 0ms) {
        spdlog::debug("[BackgroundTaskManager] {} loop disabled", name);
        return;
    }

    auto timer = std::make_shared<boost::asio::steady_timer>(deps_.strand);
    auto stopFlag = stopRequested_;

    spdlog::debug("[BackgroundTaskManager] Launching {} loop", name);
    auto loop = boost::asio::co_spawn(
        deps_.strand,
        [this, timer, stopFlag, name, interval, body]() -> boost::asio::awaitable<void> {
            spdlog::debug("[{}] Loop started", name);
            while (!stopFlag->load(std::memory_order_acquire)) {
                timer->expires_after(interval);
                try {
                    co_await timer->async_wait(boost::asio::use_awaitable);
                } catch (const boost::system::system_error& e) {
                    if (e.code() == boost::asio::error::operation_aborted) {
                        break;
                    }
                    throw;
                }
                if (stopFlag->load(std::memory_order_acquire)) {
                    break;
                }
                try {
                    (this->*body)();
                } catch (const std::exception& e) {
                    spdlog::warn("[{}] Sweep failed: {}", name, e.what());
                }
            }
            spdlog::debug("[{}] Loop stopped", name);
        },
        boost::asio::use_future);

    std::lock_guard<std::mutex> lock(mutex_);
    timers_.push_back(std::move(timer));
    loops_.push_back(std::move(loop));
}

void BackgroundTaskManager::runReaperSweep() {
    auto result = deps_.reaper.sweep(Clock::now());
    if (!result.reaped.empty()) {
        spdlog::info("[Reaper] Reaped {} stuck task(s)", result.reaped.size());
    }
}

void BackgroundTaskManager::runInsightSweep() {
    auto emitted = deps_.insights.generateFromStatistics(deps_.statistics.snapshot());
    if (!emitted.empty()) {
        spdlog::debug("[InsightTrends] Generated {} trend insight(s)", emitted.size());
    }
}

void BackgroundTaskManager::runAutoOptimization() {
    if (deps_.autoOptimize) {
        deps_.autoOptimize();
    }
}

} // namespace titan::hub
