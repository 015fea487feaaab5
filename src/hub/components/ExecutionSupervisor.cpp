#include <titan/hub/components/ExecutionSupervisor.h>
#include <titan/hub/components/HubStatistics.h>
#include <titan/hub/components/InsightGenerator.h>
#include <titan/hub/components/NotificationHub.h>
#include <titan/hub/components/TaskStore.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <stdexcept>

namespace titan::hub {

namespace {

// Completion state shared between the handler coroutine and its supervisor.
// Touched only on the strand.
struct Outcome {
    explicit Outcome(const HubStrand& strand) : signal(strand) {}

    boost::asio::steady_timer signal;
    bool finished = false;
    std::exception_ptr error;
    nlohmann::json value;
};

std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "Unknown handler error";
    }
}

} // namespace

ExecutionSupervisor::ExecutionSupervisor(Dependencies deps)
    : strand_(std::move(deps.strand)), handlerExecutor_(std::move(deps.handlerExecutor)),
      store_(std::move(deps.store)), registry_(deps.registry),
      notifications_(std::move(deps.notifications)), statistics_(deps.statistics),
      insights_(deps.insights), renderTargets_(std::move(deps.renderTargets)) {
    if (!store_) {
        throw std::invalid_argument("ExecutionSupervisor: task store cannot be null");
    }
    if (!notifications_) {
        throw std::invalid_argument("ExecutionSupervisor: notification hub cannot be null");
    }
    if (!handlerExecutor_) {
        handlerExecutor_ = strand_.get_inner_executor();
    }
}

ExecutionSupervisor::~ExecutionSupervisor() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!inFlight_.empty()) {
        spdlog::warn("[ExecutionSupervisor] Destroyed with {} task(s) in flight",
                     inFlight_.size());
    }
}

void ExecutionSupervisor::setSlotReleaser(SlotReleaser releaser) {
    std::lock_guard<std::mutex> lock(mutex_);
    releaseSlot_ = std::move(releaser);
}

bool ExecutionSupervisor::launch(const std::string& taskId) {
    // The token is registered before the Running transition so a concurrent
    // cancelRunning() can always reach it.
    auto token = std::make_shared<CancellationToken>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_.load(std::memory_order_acquire)) {
            spdlog::debug("[ExecutionSupervisor] Not accepting launches, deferring {}", taskId);
            return false;
        }
        inFlight_[taskId] = token;
    }

    auto running = store_->markRunning(taskId, Clock::now());
    if (!running) {
        // Cancelled while queued, or purged.
        spdlog::debug("[ExecutionSupervisor] Skipping {}: {}", taskId, running.error().message);
        forget(taskId);
        return false;
    }

    const auto& task = running.value();
    spdlog::debug("[ExecutionSupervisor] Starting {} ({}, {})", task.id,
                  capabilityName(task.capability), priorityName(task.priority));
    // Queued behind the Pending update posted at admission.
    publishOnStrand(task);

    if (token->isCancelled()) {
        // Cancel arrived between registration and the Running transition.
        auto reason = token->reason();
        if (auto cancelled = store_->cancelRunning(taskId, reason, Clock::now())) {
            statistics_.recordCancellation();
            publishOnStrand(cancelled.value());
        }
        spdlog::debug("[ExecutionSupervisor] {} cancelled during launch ({})", taskId, reason);
        finish(taskId);
        return true;
    }

    boost::asio::co_spawn(strand_, supervise(task, std::move(token)), boost::asio::detached);
    return true;
}

TaskContext ExecutionSupervisor::makeContext(const IntelligenceTask& task,
                                             const std::shared_ptr<CancellationToken>& token) const {
    TaskContext ctx;
    ctx.tabId = tabIdOf(task.id);
    ctx.taskId = task.id;
    ctx.parameters = task.parameters;
    ctx.cancellation = token;
    if (renderTargets_) {
        ctx.renderTarget = renderTargets_(ctx.tabId);
    }

    ctx.reportProgress = [store = store_, notifications = notifications_, strand = strand_,
                          id = task.id](double progress) {
        auto updated = store->updateProgress(id, progress);
        if (!updated) {
            return;
        }
        boost::asio::post(strand, [notifications, task = std::move(updated).value()]() {
            notifications->publishTask(task);
        });
    };
    return ctx;
}

boost::asio::awaitable<void>
ExecutionSupervisor::supervise(IntelligenceTask task, std::shared_ptr<CancellationToken> token) {
    const auto taskId = task.id;
    auto handler = registry_.find(task.capability);
    if (!handler) {
        auto message =
            std::string("No handler registered for capability ") + capabilityName(task.capability);
        spdlog::warn("[ExecutionSupervisor] {} failed: {}", taskId, message);
        if (auto failed = store_->markFailed(taskId, message, Clock::now())) {
            statistics_.recordFailure();
            notifications_->publishTask(failed.value());
        }
        finish(taskId);
        co_return;
    }

    auto outcome = std::make_shared<Outcome>(strand_);
    token->onCancel([strand = strand_, outcome]() {
        boost::asio::post(strand, [outcome]() { outcome->signal.cancel(); });
    });

    auto fn = std::make_shared<CapabilityHandler>(std::move(handler));
    boost::asio::co_spawn(
        handlerExecutor_,
        [fn, ctx = makeContext(task, token)]() -> boost::asio::awaitable<nlohmann::json> {
            co_return co_await (*fn)(ctx);
        },
        [strand = strand_, outcome](std::exception_ptr error, nlohmann::json value) {
            boost::asio::post(strand, [outcome, error, value = std::move(value)]() mutable {
                outcome->finished = true;
                outcome->error = error;
                outcome->value = std::move(value);
                outcome->signal.cancel();
            });
        });

    while (!outcome->finished && !token->isCancelled()) {
        outcome->signal.expires_at(std::chrono::steady_clock::time_point::max());
        boost::system::error_code ec;
        co_await outcome->signal.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (token->isCancelled()) {
        spdlog::debug("[ExecutionSupervisor] {} cancelled ({}), releasing slot", taskId,
                      token->reason());
        finish(taskId);
        co_return;
    }

    auto now = Clock::now();
    if (outcome->error) {
        auto message = describe(outcome->error);
        auto failed = store_->markFailed(taskId, message, now);
        if (failed) {
            spdlog::warn("[ExecutionSupervisor] {} failed: {}", taskId, message);
            statistics_.recordFailure();
            notifications_->publishTask(failed.value());
        } else {
            spdlog::debug("[ExecutionSupervisor] Dropping failure of {}: {}", taskId,
                          failed.error().message);
        }
        finish(taskId);
        co_return;
    }

    auto completed = store_->markCompleted(taskId, outcome->value, now);
    if (!completed) {
        // Cancelled from another thread after the handler returned.
        spdlog::debug("[ExecutionSupervisor] Discarding result of {}: {}", taskId,
                      completed.error().message);
        finish(taskId);
        co_return;
    }

    const auto& done = completed.value();
    auto elapsed = std::chrono::milliseconds{0};
    if (done.startedAt && done.completedAt) {
        elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(*done.completedAt -
                                                                        *done.startedAt);
    }
    statistics_.recordCompletion(done.capability, elapsed);
    spdlog::debug("[ExecutionSupervisor] {} completed in {}ms", taskId, elapsed.count());
    notifications_->publishTask(done);

    try {
        insights_.generateFromTask(done);
    } catch (const std::exception& e) {
        spdlog::warn("[ExecutionSupervisor] Insight generation for {} failed: {}", taskId,
                     e.what());
    }

    finish(taskId);
}

Result<IntelligenceTask> ExecutionSupervisor::cancelRunning(const std::string& taskId,
                                                            std::string reason) {
    auto cancelled = store_->cancelRunning(taskId, reason, Clock::now());
    if (cancelled) {
        publishOnStrand(cancelled.value());
    }

    // Looked up after the transition: a task seen Running already has its token
    // registered. The token fires even when the store refused, so an invocation
    // still mid-launch or already cancelled elsewhere lets go of its slot.
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = inFlight_.find(taskId); it != inFlight_.end()) {
            token = it->second;
        }
    }
    if (token) {
        token->cancel(std::move(reason));
    }
    return cancelled;
}

bool ExecutionSupervisor::shutdown(const std::string& reason, std::chrono::milliseconds timeout) {
    std::vector<std::string> ids;
    {
        // Under the lock so a launch either sees the flag or is in the snapshot.
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_.store(false, std::memory_order_release);
        ids.reserve(inFlight_.size());
        for (const auto& [id, token] : inFlight_) {
            ids.push_back(id);
        }
    }
    if (!ids.empty()) {
        spdlog::info("[ExecutionSupervisor] Cancelling {} in-flight task(s)", ids.size());
    }
    for (const auto& id : ids) {
        auto res = cancelRunning(id, reason);
        if (!res) {
            spdlog::debug("[ExecutionSupervisor] {} already settled: {}", id,
                          res.error().message);
        }
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (!drained_.wait_for(lock, timeout, [this] { return inFlight_.empty(); })) {
        spdlog::warn("[ExecutionSupervisor] {} task(s) still in flight after {}ms",
                     inFlight_.size(), timeout.count());
        return false;
    }
    return true;
}

std::size_t ExecutionSupervisor::inFlightCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inFlight_.size();
}

std::vector<std::string> ExecutionSupervisor::inFlightIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(inFlight_.size());
    for (const auto& [id, token] : inFlight_) {
        ids.push_back(id);
    }
    return ids;
}

void ExecutionSupervisor::publishOnStrand(IntelligenceTask task) {
    boost::asio::post(strand_, [notifications = notifications_, task = std::move(task)]() {
        notifications->publishTask(task);
    });
}

void ExecutionSupervisor::finish(const std::string& taskId) {
    SlotReleaser releaser;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        releaser = releaseSlot_;
    }
    if (releaser) {
        releaser(taskId);
    }

    forget(taskId);
}

void ExecutionSupervisor::forget(const std::string& taskId) {
    std::lock_guard<std::mutex> lock(mutex_);
    inFlight_.erase(taskId);
    drained_.notify_all();
}

} // namespace titan::hub
