// Copyright 2025 The Titan Authors
// SPDX-License-Identifier: Apache-2.0

#include <titan/hub/components/TaskScheduler.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace titan::hub {

using namespace std::chrono_literals;

std::chrono::milliseconds TaskScheduler::startDelay(TaskPriority priority) noexcept {
    switch (priority) {
        case TaskPriority::Critical: return 0ms;
        case TaskPriority::High: return 100ms;
        case TaskPriority::Medium: return 500ms;
        case TaskPriority::Low: return 2000ms;
        case TaskPriority::Idle: return 10000ms;
    }
    return 500ms;
}

TaskScheduler::TaskScheduler(HubStrand strand, Config config)
    : strand_(std::move(strand)), config_(std::move(config)),
      stopFlag_(std::make_shared<std::atomic<bool>>(false)),
      wake_(std::make_shared<WakeState>(strand_)) {
    config_.maxConcurrentTasks =
        std::clamp(config_.maxConcurrentTasks, kMinConcurrentTasks, kMaxConcurrentTasks);
    spdlog::debug("[TaskScheduler] Created with maxConcurrent={}, stagger={}",
                  config_.maxConcurrentTasks, config_.staggerByPriority);
}

TaskScheduler::~TaskScheduler() {
    if (running_.load(std::memory_order_acquire)) {
        stop();
    }
}

void TaskScheduler::setLauncher(Launcher launcher) {
    std::lock_guard<std::mutex> lock(mutex_);
    launcher_ = std::move(launcher);
}

void TaskScheduler::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::debug("[TaskScheduler] Already running, skipping start");
        return;
    }

    stopFlag_->store(false, std::memory_order_release);
    loopFuture_ = boost::asio::co_spawn(
        strand_, [this]() -> boost::asio::awaitable<void> { co_await dispatchLoop(); },
        boost::asio::use_future);
    spdlog::info("[TaskScheduler] Dispatcher started (maxConcurrent={})", maxConcurrent());
}

void TaskScheduler::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        spdlog::debug("[TaskScheduler] Stop called but not running");
        return;
    }

    spdlog::info("[TaskScheduler] Stopping dispatcher");
    stopFlag_->store(true, std::memory_order_release);
    notify();

    if (loopFuture_.valid()) {
        if (loopFuture_.wait_for(5s) != std::future_status::ready) {
            spdlog::warn("[TaskScheduler] Dispatcher did not exit within 5s (executor stopped?)");
        } else {
            try {
                loopFuture_.get();
            } catch (const std::exception& e) {
                spdlog::warn("[TaskScheduler] Dispatcher exited with exception: {}", e.what());
            }
        }
        loopFuture_ = std::future<void>();
    }
}

Result<void> TaskScheduler::enqueue(const std::string& taskId, TaskPriority priority) {
    if (taskId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Task id must not be empty"};
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queued_.count(taskId) > 0 || slots_.count(taskId) > 0) {
            return Error{ErrorCode::InvalidState, "Task already scheduled: " + taskId};
        }

        QueueEntry entry;
        entry.taskId = taskId;
        entry.priority = priority;
        entry.sequence = nextSequence_++;
        auto now = std::chrono::steady_clock::now();
        auto delay = config_.staggerByPriority ? startDelay(priority) : 0ms;
        entry.readyAt = now + delay;

        queued_[taskId] = entry.sequence;
        if (delay == 0ms) {
            ready_.push(std::move(entry));
        } else {
            delayed_.push(std::move(entry));
        }
    }
    metrics_.enqueued.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("[TaskScheduler] Enqueued {} ({})", taskId, priorityName(priority));
    notify();
    return {};
}

bool TaskScheduler::withdraw(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Heap entries are dropped lazily when popped.
    if (queued_.erase(taskId) == 0) {
        return false;
    }
    metrics_.withdrawn.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void TaskScheduler::releaseSlot(const std::string& taskId) {
    bool released = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released = slots_.erase(taskId) > 0;
    }
    if (released) {
        spdlog::trace("[TaskScheduler] Slot released by {}", taskId);
        notify();
    }
}

std::size_t TaskScheduler::setMaxConcurrent(std::size_t maxConcurrent) {
    auto clamped = std::clamp(maxConcurrent, kMinConcurrentTasks, kMaxConcurrentTasks);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.maxConcurrentTasks = clamped;
    }
    spdlog::info("[TaskScheduler] Concurrency cap set to {}", clamped);
    notify();
    return clamped;
}

std::size_t TaskScheduler::maxConcurrent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.maxConcurrentTasks;
}

std::size_t TaskScheduler::runningCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

std::size_t TaskScheduler::queuedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_.size();
}

bool TaskScheduler::isQueued(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_.count(taskId) > 0;
}

void TaskScheduler::notify() {
    auto wake = wake_;
    boost::asio::post(strand_, [wake]() {
        wake->pending = true;
        wake->timer.cancel();
    });
}

void TaskScheduler::promoteDueLocked(std::chrono::steady_clock::time_point now) {
    while (!delayed_.empty() && delayed_.top().readyAt <= now) {
        ready_.push(delayed_.top());
        delayed_.pop();
    }
}

boost::asio::awaitable<void> TaskScheduler::dispatchLoop() {
    spdlog::debug("[TaskScheduler] Dispatch loop started");
    auto wake = wake_;

    while (!stopFlag_->load(std::memory_order_acquire)) {
        std::vector<std::string> batch;
        std::optional<std::chrono::steady_clock::time_point> nextDue;
        Launcher launcher;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            promoteDueLocked(std::chrono::steady_clock::now());
            while (slots_.size() < config_.maxConcurrentTasks && !ready_.empty()) {
                auto entry = ready_.top();
                ready_.pop();
                auto it = queued_.find(entry.taskId);
                if (it == queued_.end() || it->second != entry.sequence) {
                    continue; // withdrawn or superseded
                }
                queued_.erase(it);
                slots_.insert(entry.taskId);
                batch.push_back(std::move(entry.taskId));
            }
            // Drop stale delayed heads so the timer is not armed for withdrawn entries.
            while (!delayed_.empty()) {
                const auto& head = delayed_.top();
                auto it = queued_.find(head.taskId);
                if (it != queued_.end() && it->second == head.sequence) {
                    nextDue = head.readyAt;
                    break;
                }
                delayed_.pop();
            }
            auto held = static_cast<uint64_t>(slots_.size());
            if (held > metrics_.maxRunningSeen.load(std::memory_order_relaxed)) {
                metrics_.maxRunningSeen.store(held, std::memory_order_relaxed);
            }
            launcher = launcher_;
        }

        bool slotReturned = false;
        for (const auto& taskId : batch) {
            bool launched = false;
            try {
                launched = launcher && launcher(taskId);
            } catch (const std::exception& e) {
                spdlog::error("[TaskScheduler] Launch of {} threw: {}", taskId, e.what());
            }
            if (launched) {
                metrics_.dispatched.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            metrics_.launchRejected.fetch_add(1, std::memory_order_relaxed);
            spdlog::debug("[TaskScheduler] Launch of {} declined, returning slot", taskId);
            std::lock_guard<std::mutex> lock(mutex_);
            slots_.erase(taskId);
            slotReturned = true;
        }
        if (slotReturned) {
            continue;
        }

        if (wake->pending) {
            wake->pending = false;
            continue;
        }

        wake->timer.expires_at(nextDue ? *nextDue : std::chrono::steady_clock::time_point::max());
        boost::system::error_code ec;
        co_await wake->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        wake->pending = false;
    }

    spdlog::debug("[TaskScheduler] Dispatch loop stopped");
}

} // namespace titan::hub
