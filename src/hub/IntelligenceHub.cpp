#include <titan/core/uuid.h>
#include <titan/hub/IntelligenceHub.h>
#include <titan/hub/components/BackgroundTaskManager.h>
#include <titan/hub/components/ExecutionSupervisor.h>
#include <titan/hub/components/InsightGenerator.h>
#include <titan/hub/components/TaskScheduler.h>
#include <titan/hub/components/TaskStore.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace titan::hub {

using namespace std::chrono_literals;

namespace {

struct InitialTask {
    const char* suffix;
    const char* name;
    const char* description;
    Capability capability;
    TaskPriority priority;
    std::chrono::milliseconds estimate;
};

constexpr InitialTask kInitialTasks[] = {
    {"initial_analysis", "Initial Page Analysis",
     "Analyze page structure, content, and capabilities", Capability::WebAnalysis,
     TaskPriority::High, 5000ms},
    {"security_scan", "Security Scan", "Scan page for security threats and vulnerabilities",
     Capability::Security, TaskPriority::High, 3000ms},
    {"performance_analysis", "Performance Analysis",
     "Analyze page performance and optimization opportunities", Capability::Performance,
     TaskPriority::Medium, 2000ms},
};

HubStrand makeHubStrand(const boost::asio::any_io_executor& executor) {
    if (!executor) {
        throw std::invalid_argument("IntelligenceHub: executor cannot be null");
    }
    return boost::asio::make_strand(executor);
}

Result<void> validateTabId(const std::string& tabId) {
    if (tabId.empty()) {
        return Error{ErrorCode::InvalidArgument, "Tab id must not be empty"};
    }
    if (tabId.find('_') != std::string::npos) {
        return Error{ErrorCode::InvalidArgument, "Tab id must not contain '_': " + tabId};
    }
    return {};
}

} // namespace

IntelligenceHub::IntelligenceHub(Dependencies deps) : IntelligenceHub(std::move(deps), Options{}) {}

IntelligenceHub::IntelligenceHub(Dependencies deps, Options options)
    : options_(std::move(options)), strand_(makeHubStrand(deps.executor)),
      settings_(std::move(deps.settings)), store_(std::make_shared<TaskStore>()),
      notifications_(std::make_shared<NotificationHub>()) {
    if (!settings_) {
        settings_ = std::make_shared<InMemorySettingsStore>();
    }
    if (auto loaded = loadIntelligenceConfig(*settings_, options_.settingsKey)) {
        config_ = loaded.value();
    } else {
        spdlog::warn("[IntelligenceHub] Failed to load settings, using defaults: {}",
                     loaded.error().message);
    }

    InsightGeneratorConfig insightConfig;
    insightConfig.capacity = options_.insightCapacity;
    insightConfig.confidenceThreshold = config_.confidenceThreshold;
    insights_ = std::make_unique<InsightGenerator>(*notifications_, insightConfig);

    supervisor_ = std::make_unique<ExecutionSupervisor>(ExecutionSupervisor::Dependencies{
        strand_, deps.executor, store_, registry_, notifications_, statistics_, *insights_,
        [this](const std::string& tabId) { return renderTargetFor(tabId); }});

    SchedulerConfig schedulerConfig;
    schedulerConfig.maxConcurrentTasks = config_.maxConcurrentTasks;
    schedulerConfig.staggerByPriority = options_.staggerByPriority;
    scheduler_ = std::make_unique<TaskScheduler>(strand_, schedulerConfig);

    scheduler_->setLauncher(
        [supervisor = supervisor_.get()](const std::string& id) { return supervisor->launch(id); });
    supervisor_->setSlotReleaser(
        [scheduler = scheduler_.get()](const std::string& id) { scheduler->releaseSlot(id); });

    ReaperConfig reaperConfig;
    reaperConfig.defaultEstimate = options_.defaultEstimate;
    reaperConfig.overrunFactor = options_.overrunFactor;
    reaperConfig.retention = options_.retention;
    reaper_ = std::make_unique<StuckTaskReaper>(store_, *supervisor_, statistics_, reaperConfig);

    BackgroundTaskManager::Intervals intervals;
    intervals.reaper = options_.reaperInterval;
    intervals.insights = options_.insightInterval;
    intervals.autoOptimization = options_.autoOptimizationInterval;
    background_ = std::make_unique<BackgroundTaskManager>(
        BackgroundTaskManager::Dependencies{strand_, *reaper_, *insights_, statistics_,
                                            [this]() { runAutoOptimization(); }},
        intervals);

    spdlog::debug("[IntelligenceHub] Constructed ({} capabilities enabled, maxConcurrent={})",
                  config_.enabledCapabilities.size(), config_.maxConcurrentTasks);
}

IntelligenceHub::~IntelligenceHub() {
    if (running_.load(std::memory_order_acquire)) {
        stop();
    }
    // Invocations that outlived the shutdown timeout must not touch the scheduler.
    supervisor_->setSlotReleaser(nullptr);
}

void IntelligenceHub::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::debug("[IntelligenceHub] Already running");
        return;
    }
    supervisor_->resume();
    scheduler_->start();
    background_->start();
    spdlog::info("[IntelligenceHub] Started with {} registered handler(s)",
                 registry_.registeredCapabilities().size());
}

void IntelligenceHub::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        spdlog::debug("[IntelligenceHub] Stop called but not running");
        return;
    }
    spdlog::info("[IntelligenceHub] Stopping");
    background_->stop();
    scheduler_->stop();
    if (!supervisor_->shutdown("Hub shutting down", options_.shutdownTimeout)) {
        spdlog::warn("[IntelligenceHub] Some task invocations did not drain before shutdown");
    }
    spdlog::info("[IntelligenceHub] Stopped ({} task(s) left pending)",
                 store_->countByStatus(TaskStatus::Pending));
}

Result<std::vector<std::string>>
IntelligenceHub::registerTab(const std::string& tabId,
                             std::shared_ptr<IRenderTarget> renderTarget) {
    if (auto valid = validateTabId(tabId); !valid) {
        return valid.error();
    }
    {
        std::lock_guard<std::mutex> lock(tabsMutex_);
        auto [it, inserted] = tabs_.insert_or_assign(tabId, std::move(renderTarget));
        (void)it;
        spdlog::info("[IntelligenceHub] Tab {} {}", tabId,
                     inserted ? "registered" : "re-registered");
    }

    std::vector<std::string> queued;
    for (const auto& initial : kInitialTasks) {
        if (!configuration().isEnabled(initial.capability)) {
            spdlog::debug("[IntelligenceHub] Skipping {} for tab {}: {} disabled", initial.suffix,
                          tabId, capabilityName(initial.capability));
            continue;
        }
        IntelligenceTask task;
        task.id = tabId + "_" + initial.suffix;
        task.name = initial.name;
        task.description = initial.description;
        task.capability = initial.capability;
        task.priority = initial.priority;
        task.estimatedDuration = initial.estimate;

        auto res = queueTask(std::move(task));
        if (res) {
            queued.push_back(res.value());
        } else {
            spdlog::debug("[IntelligenceHub] Initial task {} for tab {} not queued: {}",
                          initial.suffix, tabId, res.error().message);
        }
    }
    return queued;
}

Result<std::size_t> IntelligenceHub::unregisterTab(const std::string& tabId) {
    if (auto valid = validateTabId(tabId); !valid) {
        return valid.error();
    }
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(tabsMutex_);
        known = tabs_.erase(tabId) > 0;
    }

    std::size_t cancelled = 0;
    for (const auto& task : store_->list(tabId)) {
        if (task.status == TaskStatus::Pending && cancelTask(task.id)) {
            ++cancelled;
            continue;
        }
        // Running, or launched after the snapshot was taken.
        if (task.status == TaskStatus::Pending || task.status == TaskStatus::Running) {
            if (supervisor_->cancelRunning(task.id, "Tab closed")) {
                statistics_.recordCancellation();
                ++cancelled;
            }
        }
    }

    // Queued after the Cancelled updates so subscribers still receive them.
    boost::asio::post(strand_, [notifications = notifications_, tabId]() {
        notifications->closeTab(tabId);
    });

    if (!known && cancelled == 0) {
        return Error{ErrorCode::NotFound, "Tab not registered: " + tabId};
    }
    spdlog::info("[IntelligenceHub] Tab {} unregistered ({} task(s) cancelled)", tabId,
                 cancelled);
    return cancelled;
}

std::vector<std::string> IntelligenceHub::registeredTabs() const {
    std::lock_guard<std::mutex> lock(tabsMutex_);
    std::vector<std::string> out;
    out.reserve(tabs_.size());
    for (const auto& [id, target] : tabs_) {
        out.push_back(id);
    }
    return out;
}

std::shared_ptr<IRenderTarget> IntelligenceHub::renderTargetFor(const std::string& tabId) const {
    std::lock_guard<std::mutex> lock(tabsMutex_);
    auto it = tabs_.find(tabId);
    return it == tabs_.end() ? nullptr : it->second;
}

Result<std::string> IntelligenceHub::queueTask(IntelligenceTask task) {
    if (task.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Task id must not be empty"};
    }
    if (!configuration().isEnabled(task.capability)) {
        spdlog::debug("[IntelligenceHub] Rejecting {}: {} disabled", task.id,
                      capabilityName(task.capability));
        return Error{ErrorCode::CapabilityDisabled,
                     std::string("Capability ") + capabilityName(task.capability) +
                         " is not enabled"};
    }

    task.status = TaskStatus::Pending;
    task.startedAt.reset();
    task.completedAt.reset();
    task.error.reset();
    task.progress = 0.0;
    task.result = nlohmann::json::object();
    if (!task.parameters.is_object()) {
        task.parameters = nlohmann::json::object();
    }
    if (task.createdAt == TimePoint{}) {
        task.createdAt = Clock::now();
    }

    const auto id = task.id;
    const auto priority = task.priority;
    const auto capability = task.capability;
    auto snapshot = task;
    if (auto inserted = store_->insert(std::move(task)); !inserted) {
        return inserted.error();
    }
    // Posted before the scheduler sees the task so Pending precedes Running.
    publishOnStrand(std::move(snapshot));

    if (auto enqueued = scheduler_->enqueue(id, priority); !enqueued) {
        // Still draining a previous task with this id; do not leave it stranded Pending.
        if (auto dropped = store_->cancelPending(id, Clock::now())) {
            publishOnStrand(dropped.value());
        }
        return enqueued.error();
    }

    spdlog::debug("[IntelligenceHub] Queued {} ({}, {})", id, capabilityName(capability),
                  priorityName(priority));
    return id;
}

bool IntelligenceHub::cancelTask(const std::string& taskId) {
    auto task = store_->get(taskId);
    if (!task || task->status != TaskStatus::Pending) {
        return false;
    }

    scheduler_->withdraw(taskId);
    auto cancelled = store_->cancelPending(taskId, Clock::now());
    if (!cancelled) {
        // Dispatched between the lookup and the withdrawal.
        spdlog::debug("[IntelligenceHub] Cannot cancel {}: {}", taskId,
                      cancelled.error().message);
        return false;
    }
    statistics_.recordCancellation();
    spdlog::debug("[IntelligenceHub] Cancelled pending task {}", taskId);
    publishOnStrand(cancelled.value());
    return true;
}

std::vector<IntelligenceTask>
IntelligenceHub::getActiveTasks(const std::optional<std::string>& tabId) const {
    return store_->list(tabId);
}

std::optional<IntelligenceTask> IntelligenceHub::getTask(const std::string& taskId) const {
    return store_->get(taskId);
}

std::vector<IntelligenceInsight>
IntelligenceHub::getInsights(std::optional<Capability> category) const {
    return insights_->insights(category);
}

SubscriptionId IntelligenceHub::subscribeTaskUpdates(const std::string& tabId,
                                                     TaskListener listener) {
    return notifications_->subscribeTab(tabId, std::move(listener));
}

SubscriptionId IntelligenceHub::subscribeInsights(InsightListener listener) {
    return notifications_->subscribeInsights(std::move(listener));
}

bool IntelligenceHub::unsubscribe(SubscriptionId id) {
    return notifications_->unsubscribe(id);
}

IntelligenceConfig IntelligenceHub::configuration() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

Result<void> IntelligenceHub::configure(const IntelligenceConfigUpdate& update) {
    IntelligenceConfig next;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        next = applyUpdate(config_, update);
        config_ = next;
    }
    applyRuntimeConfig(next);
    return persistConfig(next);
}

Result<void> IntelligenceHub::setCapabilityEnabled(Capability capability, bool enabled) {
    IntelligenceConfig next;
    {
        std::lock_guard<std::mutex> lock(configMutex_);
        if (enabled) {
            config_.enabledCapabilities.insert(capability);
        } else {
            config_.enabledCapabilities.erase(capability);
        }
        next = config_;
    }
    spdlog::info("[IntelligenceHub] Capability {} {}", capabilityName(capability),
                 enabled ? "enabled" : "disabled");
    return persistConfig(next);
}

void IntelligenceHub::applyRuntimeConfig(const IntelligenceConfig& config) {
    scheduler_->setMaxConcurrent(config.maxConcurrentTasks);
    insights_->setConfidenceThreshold(config.confidenceThreshold);
}

Result<void> IntelligenceHub::persistConfig(const IntelligenceConfig& config) {
    auto saved = saveIntelligenceConfig(*settings_, config, options_.settingsKey);
    if (!saved) {
        spdlog::warn("[IntelligenceHub] Failed to persist settings: {}", saved.error().message);
    }
    return saved;
}

Result<std::string> IntelligenceHub::processCommand(const std::string& tabId,
                                                    const std::string& command) {
    if (auto valid = validateTabId(tabId); !valid) {
        return valid.error();
    }
    if (command.empty()) {
        return Error{ErrorCode::InvalidArgument, "Command must not be empty"};
    }
    auto task = interpreter_.makeTask(tabId, command);
    spdlog::debug("[IntelligenceHub] Command '{}' on tab {} -> {}", command, tabId,
                  capabilityName(task.capability));
    return queueTask(std::move(task));
}

boost::asio::awaitable<std::string> IntelligenceHub::executeCommand(std::string tabId,
                                                                    std::string command) {
    auto queued = processCommand(tabId, command);
    if (!queued) {
        co_return "Error processing command: " + queued.error().message;
    }
    const auto taskId = queued.value();

    auto task = co_await boost::asio::co_spawn(strand_, awaitTerminal(taskId),
                                               boost::asio::use_awaitable);
    if (!task) {
        co_return "Command failed: task " + taskId + " is no longer tracked";
    }
    if (task->status == TaskStatus::Completed) {
        std::string message = "Done";
        if (auto it = task->result.find("message"); it != task->result.end() && it->is_string()) {
            message = it->get<std::string>();
        }
        co_return "Command executed successfully: " + message;
    }
    co_return "Command failed: " + task->error.value_or(statusName(task->status));
}

boost::asio::awaitable<std::optional<IntelligenceTask>>
IntelligenceHub::awaitTerminal(std::string taskId) {
    struct Waiter {
        explicit Waiter(const HubStrand& strand) : signal(strand) {}
        boost::asio::steady_timer signal;
        std::optional<IntelligenceTask> done;
    };
    auto waiter = std::make_shared<Waiter>(strand_);

    // Publishes happen on the strand, so the listener and this coroutine never overlap.
    auto subscription = notifications_->subscribeTab(
        tabIdOf(taskId), [waiter, taskId](const IntelligenceTask& update) {
            if (update.id == taskId && isTerminal(update.status) && !waiter->done) {
                waiter->done = update;
                waiter->signal.cancel();
            }
        });

    // A terminal update published before the subscription is read back from the store.
    std::optional<IntelligenceTask> result;
    for (;;) {
        if (waiter->done) {
            result = std::move(waiter->done);
            break;
        }
        auto current = store_->get(taskId);
        if (!current || isTerminal(current->status)) {
            result = std::move(current);
            break;
        }
        waiter->signal.expires_at(std::chrono::steady_clock::time_point::max());
        boost::system::error_code ec;
        co_await waiter->signal.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    notifications_->unsubscribe(subscription);
    co_return result;
}

std::size_t IntelligenceHub::runAutoOptimization() {
    if (!configuration().autoOptimization) {
        return 0;
    }

    std::size_t queued = 0;
    for (const auto& tabId : registeredTabs()) {
        IntelligenceTask task;
        task.id = core::makeScopedId(tabId, "auto_optimization");
        task.name = "Auto Optimization";
        task.description = "Automatic performance and security optimization";
        task.capability = Capability::Performance;
        task.priority = TaskPriority::Low;
        task.estimatedDuration = 3000ms;

        auto res = queueTask(std::move(task));
        if (res) {
            ++queued;
        } else {
            spdlog::debug("[IntelligenceHub] Auto optimization for tab {} skipped: {}", tabId,
                          res.error().message);
        }
    }
    if (queued > 0) {
        spdlog::debug("[IntelligenceHub] Queued {} auto optimization task(s)", queued);
    }
    return queued;
}

StuckTaskReaper::SweepResult IntelligenceHub::sweepNow() {
    return reaper_->sweep(Clock::now());
}

std::vector<IntelligenceInsight> IntelligenceHub::generateTrendInsights() {
    return insights_->generateFromStatistics(statistics_.snapshot());
}

nlohmann::json IntelligenceHub::getIntelligenceStats() const {
    auto stats = statistics_.snapshot();
    auto config = configuration();

    nlohmann::json usage = nlohmann::json::object();
    for (auto cap : kAllCapabilities) {
        usage[capabilityName(cap)] = stats.usage(cap);
    }
    nlohmann::json enabled = nlohmann::json::array();
    for (auto cap : config.enabledCapabilities) {
        enabled.push_back(capabilityName(cap));
    }

    std::size_t tabCount = 0;
    {
        std::lock_guard<std::mutex> lock(tabsMutex_);
        tabCount = tabs_.size();
    }

    return nlohmann::json{{"registeredTabs", tabCount},
                          {"activeTasks", store_->size()},
                          {"completedTasks", stats.completed},
                          {"failedTasks", stats.failed},
                          {"timedOutTasks", stats.timedOut},
                          {"cancelledTasks", stats.cancelled},
                          {"totalExecutionTime", stats.totalExecutionTime.count()},
                          {"averageExecutionTime", stats.averageExecutionMs()},
                          {"successRate", stats.successRate()},
                          {"capabilityUsage", std::move(usage)},
                          {"enabledCapabilities", std::move(enabled)},
                          {"insights", insights_->size()},
                          {"runningTasks", scheduler_->runningCount()},
                          {"queuedTasks", scheduler_->queuedCount()},
                          {"configuration", toJson(config)}};
}

void IntelligenceHub::publishOnStrand(IntelligenceTask task) {
    boost::asio::post(strand_, [notifications = notifications_, task = std::move(task)]() {
        notifications->publishTask(task);
    });
}

} // namespace titan::hub
