#pragma once

#include <titan/core/types.h>
#include <titan/hub/CancellationToken.h>
#include <titan/hub/IRenderTarget.h>
#include <titan/hub/components/CapabilityRegistry.h>
#include <titan/hub/hub_executor.h>
#include <titan/hub/intelligence_types.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace titan::hub {

class HubStatistics;
class InsightGenerator;
class NotificationHub;
class TaskStore;

/**
 * @brief Drives launched tasks from Running to a terminal state.
 *
 * For each launch the supervisor spawns a coroutine on the hub strand that
 * invokes the capability handler on the handler executor and then waits for
 * whichever comes first: the handler's completion or the task's cancellation
 * token. Terminal transitions, statistics, publishes and insight generation all
 * happen on the strand.
 *
 * A cancelled invocation releases its slot at once; the handler keeps running
 * until it observes the token, and whatever it returns afterwards is discarded.
 */
class ExecutionSupervisor {
public:
    using RenderTargetLookup = std::function<std::shared_ptr<IRenderTarget>(const std::string&)>;
    using SlotReleaser = std::function<void(const std::string& taskId)>;

    struct Dependencies {
        HubStrand strand;
        /// Executor handlers run on; usually the executor under the strand.
        boost::asio::any_io_executor handlerExecutor;
        std::shared_ptr<TaskStore> store;
        CapabilityRegistry& registry;
        std::shared_ptr<NotificationHub> notifications;
        HubStatistics& statistics;
        InsightGenerator& insights;
        RenderTargetLookup renderTargets;
    };

    /// @throws std::invalid_argument if the store or notification hub is null
    explicit ExecutionSupervisor(Dependencies deps);
    ~ExecutionSupervisor();

    ExecutionSupervisor(const ExecutionSupervisor&) = delete;
    ExecutionSupervisor& operator=(const ExecutionSupervisor&) = delete;

    /// Called once for every invocation that ends, whatever the outcome.
    void setSlotReleaser(SlotReleaser releaser);

    /**
     * @brief Pending -> Running and start supervising the handler.
     *
     * Must run on the hub strand (it is the scheduler's launcher).
     * @return false if the task is missing, no longer Pending, or the supervisor
     *         is shutting down; the caller keeps the slot in that case
     */
    bool launch(const std::string& taskId);

    /**
     * @brief Force a Running task to Cancelled and fire its token.
     *
     * Safe from any thread. The Cancelled update is published on the strand. The
     * invocation's token fires whenever one is registered, even if the store no
     * longer holds the task as Running; the returned error still reports that.
     */
    Result<IntelligenceTask> cancelRunning(const std::string& taskId, std::string reason);

    /**
     * @brief Stop accepting launches, cancel every in-flight task and wait for the
     * supervising coroutines to let go of their slots.
     *
     * Must not be called from an executor thread.
     * @return true if everything drained within the timeout
     */
    bool shutdown(const std::string& reason, std::chrono::milliseconds timeout);

    /// Re-open after shutdown().
    void resume() noexcept { accepting_.store(true, std::memory_order_release); }

    std::size_t inFlightCount() const;
    std::vector<std::string> inFlightIds() const;

private:
    boost::asio::awaitable<void> supervise(IntelligenceTask task,
                                           std::shared_ptr<CancellationToken> token);
    TaskContext makeContext(const IntelligenceTask& task,
                            const std::shared_ptr<CancellationToken>& token) const;
    void publishOnStrand(IntelligenceTask task);
    void finish(const std::string& taskId);
    void forget(const std::string& taskId);

    HubStrand strand_;
    boost::asio::any_io_executor handlerExecutor_;
    std::shared_ptr<TaskStore> store_;
    CapabilityRegistry& registry_;
    std::shared_ptr<NotificationHub> notifications_;
    HubStatistics& statistics_;
    InsightGenerator& insights_;
    RenderTargetLookup renderTargets_;
    SlotReleaser releaseSlot_;

    std::atomic<bool> accepting_{true};
    mutable std::mutex mutex_;
    std::condition_variable drained_;
    std::unordered_map<std::string, std::shared_ptr<CancellationToken>> inFlight_;
};

} // namespace titan::hub
