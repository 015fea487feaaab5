#pragma once

#include <titan/core/types.h>
#include <titan/hub/IRenderTarget.h>
#include <titan/hub/IntelligenceConfig.h>
#include <titan/hub/SettingsStore.h>
#include <titan/hub/components/CapabilityRegistry.h>
#include <titan/hub/components/CommandInterpreter.h>
#include <titan/hub/components/HubStatistics.h>
#include <titan/hub/components/NotificationHub.h>
#include <titan/hub/components/StuckTaskReaper.h>
#include <titan/hub/hub_executor.h>
#include <titan/hub/intelligence_types.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace titan::hub {

class BackgroundTaskManager;
class ExecutionSupervisor;
class InsightGenerator;
class TaskScheduler;
class TaskStore;

/**
 * @brief Facade coordinating intelligence tasks across tabs.
 *
 * Owns every collection of the hub (tasks, insights, subscriptions, tabs) and
 * wires the components together:
 *
 *   queueTask -> TaskStore (Pending) -> TaskScheduler -> ExecutionSupervisor
 *     -> capability handler -> TaskStore (terminal) -> InsightGenerator
 *     -> NotificationHub -> subscribers
 *
 * All scheduling work runs on one strand over the supplied executor; handlers run
 * on the executor itself. Queries are synchronous and safe from any thread.
 *
 * ## Lifecycle
 * 1. Construct with an executor (e.g. WorkCoordinator::getExecutor()) and a settings store
 * 2. Register capability handlers through capabilities()
 * 3. start(); queue tasks, register tabs, subscribe
 * 4. stop() from a thread that is not running the executor
 */
class IntelligenceHub {
public:
    struct Dependencies {
        boost::asio::any_io_executor executor;
        /// Null means an in-memory store.
        std::shared_ptr<ISettingsStore> settings;
    };

    struct Options {
        std::chrono::milliseconds reaperInterval{std::chrono::seconds(10)};
        std::chrono::milliseconds insightInterval{std::chrono::minutes(2)};
        std::chrono::milliseconds autoOptimizationInterval{std::chrono::minutes(5)};
        std::chrono::milliseconds retention{std::chrono::minutes(5)};
        std::chrono::milliseconds defaultEstimate{std::chrono::minutes(5)};
        double overrunFactor = 2.0;
        bool staggerByPriority = true;
        std::size_t insightCapacity = 50;
        std::chrono::milliseconds shutdownTimeout{std::chrono::seconds(5)};
        std::string settingsKey = kDefaultSettingsKey;
    };

    /// @throws std::invalid_argument if the executor is empty
    explicit IntelligenceHub(Dependencies deps);
    IntelligenceHub(Dependencies deps, Options options);
    ~IntelligenceHub();

    IntelligenceHub(const IntelligenceHub&) = delete;
    IntelligenceHub& operator=(const IntelligenceHub&) = delete;
    IntelligenceHub(IntelligenceHub&&) = delete;
    IntelligenceHub& operator=(IntelligenceHub&&) = delete;

    /// Start dispatching and the periodic loops. Idempotent.
    void start();

    /**
     * @brief Stop the loops and the dispatcher, and cancel in-flight tasks with
     * "Hub shutting down". Pending tasks stay queued. Idempotent.
     */
    void stop();

    bool isRunning() const noexcept { return running_.load(std::memory_order_acquire); }

    CapabilityRegistry& capabilities() noexcept { return registry_; }

    // Tabs

    /**
     * @brief Register a tab and queue its initial analysis, security scan and
     * performance analysis (disabled capabilities are skipped).
     *
     * @return ids of the tasks that were queued
     */
    Result<std::vector<std::string>> registerTab(const std::string& tabId,
                                                 std::shared_ptr<IRenderTarget> renderTarget);

    /**
     * @brief Forget a tab: cancel its Pending tasks, cancel its Running tasks with
     * "Tab closed", and drop its task subscriptions once those updates are delivered.
     *
     * @return number of tasks cancelled
     */
    Result<std::size_t> unregisterTab(const std::string& tabId);

    std::vector<std::string> registeredTabs() const;

    // Tasks

    /**
     * @brief Admit a task and return its id without waiting for it to run.
     *
     * Errors: InvalidArgument (empty id), CapabilityDisabled (never stored),
     * InvalidState (an unfinished task already uses the id).
     */
    Result<std::string> queueTask(IntelligenceTask task);

    /// Cancel a Pending task. @return false if it was not Pending
    bool cancelTask(const std::string& taskId);

    /// Tracked tasks (terminal ones until purged), in admission order.
    std::vector<IntelligenceTask>
    getActiveTasks(const std::optional<std::string>& tabId = std::nullopt) const;

    std::optional<IntelligenceTask> getTask(const std::string& taskId) const;

    std::vector<IntelligenceInsight>
    getInsights(std::optional<Capability> category = std::nullopt) const;

    // Subscriptions

    SubscriptionId subscribeTaskUpdates(const std::string& tabId, TaskListener listener);
    SubscriptionId subscribeInsights(InsightListener listener);
    bool unsubscribe(SubscriptionId id);

    // Configuration

    IntelligenceConfig configuration() const;

    /// Apply and persist. The new cap and threshold take effect immediately.
    Result<void> configure(const IntelligenceConfigUpdate& update);

    Result<void> setCapabilityEnabled(Capability capability, bool enabled);

    // Commands

    /// Queue a command as a High-priority task. @return the task id
    Result<std::string> processCommand(const std::string& tabId, const std::string& command);

    /// Queue a command and wait for its task to finish; always yields a message.
    boost::asio::awaitable<std::string> executeCommand(std::string tabId, std::string command);

    // Maintenance

    /// Queue one Low-priority performance pass per tab if auto-optimization is on.
    /// @return number of tasks queued
    std::size_t runAutoOptimization();

    /// Run a reaper sweep now instead of waiting for the next tick.
    StuckTaskReaper::SweepResult sweepNow();

    /// Run the statistics insight rules now.
    std::vector<IntelligenceInsight> generateTrendInsights();

    nlohmann::json getIntelligenceStats() const;
    StatisticsSnapshot statistics() const { return statistics_.snapshot(); }

    const Options& options() const noexcept { return options_; }

private:
    Result<void> persistConfig(const IntelligenceConfig& config);
    void applyRuntimeConfig(const IntelligenceConfig& config);
    void publishOnStrand(IntelligenceTask task);
    /// Runs on the strand; resumes when the task's terminal update is published.
    boost::asio::awaitable<std::optional<IntelligenceTask>> awaitTerminal(std::string taskId);
    std::shared_ptr<IRenderTarget> renderTargetFor(const std::string& tabId) const;

    Options options_;
    HubStrand strand_;
    std::shared_ptr<ISettingsStore> settings_;

    mutable std::mutex configMutex_;
    IntelligenceConfig config_;

    std::shared_ptr<TaskStore> store_;
    std::shared_ptr<NotificationHub> notifications_;
    CapabilityRegistry registry_;
    HubStatistics statistics_;
    CommandInterpreter interpreter_;

    std::unique_ptr<InsightGenerator> insights_;
    std::unique_ptr<ExecutionSupervisor> supervisor_;
    std::unique_ptr<TaskScheduler> scheduler_;
    std::unique_ptr<StuckTaskReaper> reaper_;
    std::unique_ptr<BackgroundTaskManager> background_;

    mutable std::mutex tabsMutex_;
    std::map<std::string, std::shared_ptr<IRenderTarget>> tabs_;

    std::atomic<bool> running_{false};
};

} // namespace titan::hub
