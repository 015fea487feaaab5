#pragma once

#include <titan/core/types.h>
#include <titan/hub/intelligence_types.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace titan::hub {

class ExecutionSupervisor;
class HubStatistics;
class TaskStore;

struct ReaperConfig {
    std::chrono::milliseconds defaultEstimate{std::chrono::minutes(5)};
    double overrunFactor = 2.0;
    /// How long terminal tasks stay queryable before being purged.
    std::chrono::milliseconds retention{std::chrono::minutes(5)};
};

/**
 * @brief Forces overrunning tasks to Cancelled and purges old terminal tasks.
 *
 * A Running task is overdue once now - startedAt exceeds
 * overrunFactor x (estimatedDuration or defaultEstimate). Reaped tasks get the
 * error "Task timeout", count as timed out, and have their cancellation token
 * fired so their slot is freed.
 */
class StuckTaskReaper {
public:
    using Config = ReaperConfig;

    struct SweepResult {
        std::vector<std::string> reaped;
        std::size_t purged{0};
    };

    StuckTaskReaper(std::shared_ptr<TaskStore> store, ExecutionSupervisor& supervisor,
                    HubStatistics& statistics, Config config = {});

    StuckTaskReaper(const StuckTaskReaper&) = delete;
    StuckTaskReaper& operator=(const StuckTaskReaper&) = delete;

    SweepResult sweep(TimePoint now);

    std::chrono::milliseconds limitFor(const IntelligenceTask& task) const;
    bool isOverdue(const IntelligenceTask& task, TimePoint now) const;

    const Config& config() const noexcept { return config_; }

private:
    std::shared_ptr<TaskStore> store_;
    ExecutionSupervisor& supervisor_;
    HubStatistics& statistics_;
    Config config_;
};

} // namespace titan::hub
