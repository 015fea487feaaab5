// Copyright 2025 The Titan Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <titan/core/types.h>
#include <titan/hub/hub_executor.h>
#include <titan/hub/intelligence_types.h>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace titan::hub {

inline constexpr std::size_t kMinConcurrentTasks = 1;
inline constexpr std::size_t kMaxConcurrentTasks = 20;

struct SchedulerConfig {
    std::size_t maxConcurrentTasks = 5; ///< Concurrency cap, clamped to [1, 20]
    bool staggerByPriority = true;      ///< Delay readiness by the per-priority start delay
};

/**
 * @brief Priority dispatcher enforcing the concurrency cap.
 *
 * Admitted tasks wait in two heaps:
 * - delayed: keyed by ready time (admission + per-priority start delay)
 * - ready:   keyed by (priority, admission sequence)
 *
 * A dispatch coroutine on the hub strand pops the highest-priority ready task
 * whenever a slot is free and hands it to the launcher. Within one priority,
 * tasks run in admission order, including tasks whose start delays expire in the
 * same tick. The coroutine sleeps on a timer until the next ready time and is
 * woken early by enqueue(), releaseSlot() and setMaxConcurrent().
 *
 * A slot is held from a successful launch until releaseSlot(); the number of held
 * slots never exceeds the cap. Lowering the cap never preempts running work.
 *
 * ## Usage
 * ```cpp
 * TaskScheduler scheduler(strand, SchedulerConfig{});
 * scheduler.setLauncher([&](const std::string& id) { return supervisor.launch(id); });
 * scheduler.start();
 * scheduler.enqueue(task.id, task.priority);
 * ```
 */
class TaskScheduler {
public:
    using Config = SchedulerConfig;

    /// Invoked on the strand with a slot held. Returning false returns the slot.
    using Launcher = std::function<bool(const std::string& taskId)>;

    struct Metrics {
        std::atomic<uint64_t> enqueued{0};
        std::atomic<uint64_t> dispatched{0};
        std::atomic<uint64_t> withdrawn{0};
        std::atomic<uint64_t> launchRejected{0};
        std::atomic<uint64_t> maxRunningSeen{0};
    };

    /// Staggering table: Critical 0, High 100 ms, Medium 500 ms, Low 2 s, Idle 10 s.
    static std::chrono::milliseconds startDelay(TaskPriority priority) noexcept;

    TaskScheduler(HubStrand strand, Config config);
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;
    TaskScheduler(TaskScheduler&&) = delete;
    TaskScheduler& operator=(TaskScheduler&&) = delete;

    void setLauncher(Launcher launcher);

    /// Launch the dispatch coroutine. Tasks enqueued before start() wait.
    void start();

    /**
     * @brief Stop the dispatch coroutine and wait for it to exit.
     *
     * Queued entries are kept. Must not be called from an executor thread.
     */
    void stop();

    bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }

    /// Queue a Pending task. Fails with InvalidState if the id is already queued.
    Result<void> enqueue(const std::string& taskId, TaskPriority priority);

    /// Remove a queued task so it is never dispatched.
    /// @return true if the task was waiting in the queue
    bool withdraw(const std::string& taskId);

    /// Return the slot held by a launched task. Idempotent.
    void releaseSlot(const std::string& taskId);

    /// Change the cap (clamped to [1, 20]) and wake the dispatcher.
    std::size_t setMaxConcurrent(std::size_t maxConcurrent);

    std::size_t maxConcurrent() const;
    std::size_t runningCount() const;
    std::size_t queuedCount() const;
    bool isQueued(const std::string& taskId) const;

    const Metrics& metrics() const noexcept { return metrics_; }

private:
    struct QueueEntry {
        std::string taskId;
        TaskPriority priority{TaskPriority::Medium};
        uint64_t sequence{0};
        std::chrono::steady_clock::time_point readyAt{};
    };

    // std::priority_queue is a max-heap; these invert the order to pop the smallest.
    struct ReadyOrder {
        bool operator()(const QueueEntry& a, const QueueEntry& b) const {
            if (a.priority != b.priority) {
                return a.priority > b.priority;
            }
            return a.sequence > b.sequence;
        }
    };
    struct DelayOrder {
        bool operator()(const QueueEntry& a, const QueueEntry& b) const {
            if (a.readyAt != b.readyAt) {
                return a.readyAt > b.readyAt;
            }
            return a.sequence > b.sequence;
        }
    };

    // Timer and flag touched only on the strand; shared so posted wakeups
    // never outlive them.
    struct WakeState {
        explicit WakeState(const HubStrand& strand) : timer(strand) {}
        boost::asio::steady_timer timer;
        bool pending = false;
    };

    boost::asio::awaitable<void> dispatchLoop();
    void promoteDueLocked(std::chrono::steady_clock::time_point now);
    void notify();

    HubStrand strand_;
    Config config_;
    Launcher launcher_;

    mutable std::mutex mutex_;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, ReadyOrder> ready_;
    std::priority_queue<QueueEntry, std::vector<QueueEntry>, DelayOrder> delayed_;
    std::unordered_map<std::string, uint64_t> queued_; ///< taskId -> live entry sequence
    std::unordered_set<std::string> slots_;             ///< tasks holding a slot
    uint64_t nextSequence_{0};

    std::atomic<bool> running_{false};
    std::shared_ptr<std::atomic<bool>> stopFlag_;
    std::shared_ptr<WakeState> wake_;
    std::future<void> loopFuture_;

    Metrics metrics_;
};

} // namespace titan::hub
