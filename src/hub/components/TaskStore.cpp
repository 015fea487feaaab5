#include <titan/hub/components/TaskStore.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace titan::hub {

namespace {
Error wrongStatus(const IntelligenceTask& task, const char* expected) {
    return Error{ErrorCode::InvalidState, "Task " + task.id + " is " + statusName(task.status) +
                                              ", expected " + expected};
}

Error missing(const std::string& id) {
    return Error{ErrorCode::NotFound, "Task not found: " + id};
}
} // namespace

Result<void> TaskStore::insert(IntelligenceTask task) {
    if (task.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Task id must not be empty"};
    }
    if (task.status != TaskStatus::Pending || task.startedAt || task.completedAt) {
        return Error{ErrorCode::InvalidArgument, "Only fresh Pending tasks can be inserted"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(task.id);
    if (it != tasks_.end()) {
        if (!isTerminal(it->second.task.status)) {
            return Error{ErrorCode::InvalidState, "Task already active: " + task.id};
        }
        spdlog::debug("[TaskStore] Replacing terminal task {}", task.id);
        tasks_.erase(it);
    }
    auto id = task.id;
    tasks_.emplace(std::move(id), Entry{std::move(task), nextSequence_++});
    return {};
}

std::optional<IntelligenceTask> TaskStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) {
        return std::nullopt;
    }
    return it->second.task;
}

bool TaskStore::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.count(id) > 0;
}

TaskStore::Entry* TaskStore::findLocked(const std::string& id) {
    auto it = tasks_.find(id);
    return it == tasks_.end() ? nullptr : &it->second;
}

Result<IntelligenceTask> TaskStore::markRunning(const std::string& id, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = findLocked(id);
    if (!entry) {
        return missing(id);
    }
    auto& task = entry->task;
    if (task.status != TaskStatus::Pending) {
        return wrongStatus(task, "pending");
    }
    task.status = TaskStatus::Running;
    task.startedAt = now;
    return task;
}

Result<IntelligenceTask> TaskStore::markCompleted(const std::string& id,
                                                  const nlohmann::json& result, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = findLocked(id);
    if (!entry) {
        return missing(id);
    }
    auto& task = entry->task;
    if (task.status != TaskStatus::Running) {
        return wrongStatus(task, "running");
    }
    if (result.is_object()) {
        task.result.update(result);
    } else if (!result.is_null()) {
        task.result["value"] = result;
    }
    task.status = TaskStatus::Completed;
    task.progress = 1.0;
    task.completedAt = std::max(now, *task.startedAt);
    return task;
}

Result<IntelligenceTask> TaskStore::markFailed(const std::string& id, std::string error,
                                               TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = findLocked(id);
    if (!entry) {
        return missing(id);
    }
    auto& task = entry->task;
    if (task.status != TaskStatus::Running) {
        return wrongStatus(task, "running");
    }
    task.status = TaskStatus::Failed;
    task.error = std::move(error);
    task.completedAt = std::max(now, *task.startedAt);
    return task;
}

Result<IntelligenceTask> TaskStore::cancelPending(const std::string& id, TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = findLocked(id);
    if (!entry) {
        return missing(id);
    }
    auto& task = entry->task;
    if (task.status != TaskStatus::Pending) {
        return wrongStatus(task, "pending");
    }
    task.status = TaskStatus::Cancelled;
    task.startedAt = now;
    task.completedAt = now;
    return task;
}

Result<IntelligenceTask> TaskStore::cancelRunning(const std::string& id, std::string reason,
                                                  TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = findLocked(id);
    if (!entry) {
        return missing(id);
    }
    auto& task = entry->task;
    if (task.status != TaskStatus::Running) {
        return wrongStatus(task, "running");
    }
    task.status = TaskStatus::Cancelled;
    task.error = std::move(reason);
    task.completedAt = std::max(now, *task.startedAt);
    return task;
}

Result<IntelligenceTask> TaskStore::updateProgress(const std::string& id, double progress) {
    progress = std::clamp(progress, 0.0, 1.0);
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = findLocked(id);
    if (!entry) {
        return missing(id);
    }
    auto& task = entry->task;
    if (task.status != TaskStatus::Running) {
        return wrongStatus(task, "running");
    }
    if (progress <= task.progress) {
        return Error{ErrorCode::InvalidArgument, "Progress must increase"};
    }
    task.progress = progress;
    return task;
}

std::vector<IntelligenceTask>
TaskStore::collectLocked(const std::function<bool(const IntelligenceTask&)>& filter) const {
    std::vector<const Entry*> matched;
    matched.reserve(tasks_.size());
    for (const auto& [id, entry] : tasks_) {
        if (!filter || filter(entry.task)) {
            matched.push_back(&entry);
        }
    }
    std::sort(matched.begin(), matched.end(),
              [](const Entry* a, const Entry* b) { return a->sequence < b->sequence; });

    std::vector<IntelligenceTask> out;
    out.reserve(matched.size());
    for (const auto* entry : matched) {
        out.push_back(entry->task);
    }
    return out;
}

std::vector<IntelligenceTask> TaskStore::list(const std::optional<std::string>& tabId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!tabId) {
        return collectLocked(nullptr);
    }
    return collectLocked(
        [&tabId](const IntelligenceTask& task) { return tabIdOf(task.id) == *tabId; });
}

std::vector<IntelligenceTask> TaskStore::listByStatus(TaskStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collectLocked([status](const IntelligenceTask& task) { return task.status == status; });
}

std::size_t TaskStore::countByStatus(TaskStatus status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(
        std::count_if(tasks_.begin(), tasks_.end(),
                      [status](const auto& kv) { return kv.second.task.status == status; }));
}

std::size_t TaskStore::purgeTerminal(TimePoint cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t purged = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        const auto& task = it->second.task;
        if (isTerminal(task.status) && task.completedAt && *task.completedAt <= cutoff) {
            it = tasks_.erase(it);
            ++purged;
        } else {
            ++it;
        }
    }
    if (purged > 0) {
        spdlog::debug("[TaskStore] Purged {} expired tasks ({} remain)", purged, tasks_.size());
    }
    return purged;
}

std::size_t TaskStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TaskStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.clear();
}

} // namespace titan::hub
