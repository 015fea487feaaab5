#pragma once

#include <titan/core/types.h>
#include <titan/hub/intelligence_types.h>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace titan::hub {

/**
 * @brief The single authoritative in-memory table of tasks, keyed by id.
 *
 * Tasks are mutated only through the transition methods below; each one checks
 * the source status and stamps the timestamps that keep the invariants:
 *
 * - startedAt is set iff status != Pending
 * - completedAt is set iff status is Completed, Failed or Cancelled
 * - progress never decreases while Running
 *
 * Every successful transition returns a snapshot of the updated task so callers
 * can publish it without a second lookup. All methods are thread-safe; queries
 * return copies ordered by admission sequence.
 */
class TaskStore {
public:
    TaskStore() = default;

    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    /**
     * @brief Insert a Pending task.
     *
     * Fails with InvalidArgument for an empty id or a non-Pending task, and with
     * InvalidState if a non-terminal task with the same id exists. A terminal task
     * with the same id is replaced.
     */
    Result<void> insert(IntelligenceTask task);

    std::optional<IntelligenceTask> get(const std::string& id) const;
    bool contains(const std::string& id) const;

    /// Pending -> Running, stamps startedAt.
    Result<IntelligenceTask> markRunning(const std::string& id, TimePoint now);

    /// Running -> Completed; merges result, progress = 1.0, stamps completedAt.
    Result<IntelligenceTask> markCompleted(const std::string& id, const nlohmann::json& result,
                                           TimePoint now);

    /// Running -> Failed; records the error, stamps completedAt.
    Result<IntelligenceTask> markFailed(const std::string& id, std::string error, TimePoint now);

    /// Pending -> Cancelled; stamps startedAt and completedAt with the same instant.
    Result<IntelligenceTask> cancelPending(const std::string& id, TimePoint now);

    /// Running -> Cancelled with an error marker (timeout, tab closed, shutdown).
    Result<IntelligenceTask> cancelRunning(const std::string& id, std::string reason,
                                           TimePoint now);

    /// Raise progress of a Running task. Values are clamped to [0, 1].
    /// @return the updated task, or an error if not Running or not an increase
    Result<IntelligenceTask> updateProgress(const std::string& id, double progress);

    /// Snapshot of all tasks, or of one tab's tasks.
    std::vector<IntelligenceTask> list(const std::optional<std::string>& tabId = std::nullopt) const;

    std::vector<IntelligenceTask> listByStatus(TaskStatus status) const;
    std::size_t countByStatus(TaskStatus status) const;

    /// Remove terminal tasks whose completedAt is at or before cutoff.
    /// @return number of tasks purged
    std::size_t purgeTerminal(TimePoint cutoff);

    std::size_t size() const;
    void clear();

private:
    struct Entry {
        IntelligenceTask task;
        uint64_t sequence{0};
    };

    Entry* findLocked(const std::string& id);
    std::vector<IntelligenceTask>
    collectLocked(const std::function<bool(const IntelligenceTask&)>& filter) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> tasks_;
    uint64_t nextSequence_{0};
};

} // namespace titan::hub
