#include <titan/hub/components/ExecutionSupervisor.h>
#include <titan/hub/components/HubStatistics.h>
#include <titan/hub/components/StuckTaskReaper.h>
#include <titan/hub/components/TaskStore.h>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace titan::hub {

StuckTaskReaper::StuckTaskReaper(std::shared_ptr<TaskStore> store,
                                 ExecutionSupervisor& supervisor, HubStatistics& statistics,
                                 Config config)
    : store_(std::move(store)), supervisor_(supervisor), statistics_(statistics),
      config_(std::move(config)) {
    if (!store_) {
        throw std::invalid_argument("StuckTaskReaper: task store cannot be null");
    }
    if (config_.overrunFactor <= 0.0) {
        config_.overrunFactor = 2.0;
    }
}

std::chrono::milliseconds StuckTaskReaper::limitFor(const IntelligenceTask& task) const {
    auto estimate = task.estimatedDuration.value_or(config_.defaultEstimate);
    return std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(estimate.count() * config_.overrunFactor));
}

bool StuckTaskReaper::isOverdue(const IntelligenceTask& task, TimePoint now) const {
    if (task.status != TaskStatus::Running || !task.startedAt) {
        return false;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - *task.startedAt);
    return elapsed > limitFor(task);
}

StuckTaskReaper::SweepResult StuckTaskReaper::sweep(TimePoint now) {
    SweepResult out;

    for (const auto& task : store_->listByStatus(TaskStatus::Running)) {
        if (!isOverdue(task, now)) {
            continue;
        }
        auto cancelled = supervisor_.cancelRunning(task.id, "Task timeout");
        if (!cancelled) {
            // Finished between the snapshot and the transition.
            spdlog::debug("[StuckTaskReaper] {} not reaped: {}", task.id,
                          cancelled.error().message);
            continue;
        }
        statistics_.recordTimeout();
        spdlog::warn("[StuckTaskReaper] Task {} timed out after {}ms (limit {}ms)", task.id,
                     std::chrono::duration_cast<std::chrono::milliseconds>(now - *task.startedAt)
                         .count(),
                     limitFor(task).count());
        out.reaped.push_back(task.id);
    }

    out.purged = store_->purgeTerminal(now - config_.retention);
    if (out.purged > 0) {
        spdlog::debug("[StuckTaskReaper] Purged {} terminal task(s)", out.purged);
    }
    return out;
}

} // namespace titan::hub
