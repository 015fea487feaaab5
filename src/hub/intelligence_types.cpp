#include <titan/hub/intelligence_types.h>

#include <cstdio>
#include <ctime>

namespace titan::hub {

const char* capabilityName(Capability capability) noexcept {
    switch (capability) {
        case Capability::WebAnalysis: return "webAnalysis";
        case Capability::Automation: return "automation";
        case Capability::AiInteraction: return "aiInteraction";
        case Capability::Performance: return "performance";
        case Capability::Security: return "security";
        case Capability::Accessibility: return "accessibility";
        case Capability::Learning: return "learning";
        case Capability::Prediction: return "prediction";
        case Capability::Personalization: return "personalization";
        case Capability::Collaboration: return "collaboration";
    }
    return "unknown";
}

std::optional<Capability> parseCapability(std::string_view name) noexcept {
    for (auto cap : kAllCapabilities) {
        if (name == capabilityName(cap)) {
            return cap;
        }
    }
    return std::nullopt;
}

const char* priorityName(TaskPriority priority) noexcept {
    switch (priority) {
        case TaskPriority::Critical: return "critical";
        case TaskPriority::High: return "high";
        case TaskPriority::Medium: return "medium";
        case TaskPriority::Low: return "low";
        case TaskPriority::Idle: return "idle";
    }
    return "unknown";
}

std::optional<TaskPriority> parsePriority(std::string_view name) noexcept {
    for (auto p : {TaskPriority::Critical, TaskPriority::High, TaskPriority::Medium,
                   TaskPriority::Low, TaskPriority::Idle}) {
        if (name == priorityName(p)) {
            return p;
        }
    }
    return std::nullopt;
}

const char* statusName(TaskStatus status) noexcept {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
        case TaskStatus::Paused: return "paused";
    }
    return "unknown";
}

std::string tabIdOf(std::string_view taskId) {
    auto pos = taskId.find('_');
    if (pos == std::string_view::npos) {
        return std::string(taskId);
    }
    return std::string(taskId.substr(0, pos));
}

std::string formatTimestamp(TimePoint tp) {
    auto secs = Clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) %
              std::chrono::seconds(1);
    std::tm tm{};
    gmtime_r(&secs, &tm);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%s.%03dZ", date, static_cast<int>(ms.count()));
    return std::string(buf);
}

namespace {
nlohmann::json optionalTimestamp(const std::optional<TimePoint>& tp) {
    return tp ? nlohmann::json(formatTimestamp(*tp)) : nlohmann::json(nullptr);
}
} // namespace

void to_json(nlohmann::json& j, const IntelligenceTask& task) {
    j = nlohmann::json{
        {"id", task.id},
        {"name", task.name},
        {"description", task.description},
        {"capability", capabilityName(task.capability)},
        {"priority", priorityName(task.priority)},
        {"status", statusName(task.status)},
        {"parameters", task.parameters},
        {"createdAt", formatTimestamp(task.createdAt)},
        {"startedAt", optionalTimestamp(task.startedAt)},
        {"completedAt", optionalTimestamp(task.completedAt)},
        {"estimatedDuration", task.estimatedDuration
                                  ? nlohmann::json(task.estimatedDuration->count())
                                  : nlohmann::json(nullptr)},
        {"progress", task.progress},
        {"error", task.error ? nlohmann::json(*task.error) : nlohmann::json(nullptr)},
        {"result", task.result},
    };
}

void to_json(nlohmann::json& j, const IntelligenceInsight& insight) {
    j = nlohmann::json{
        {"id", insight.id},
        {"title", insight.title},
        {"description", insight.description},
        {"category", capabilityName(insight.category)},
        {"confidence", insight.confidence},
        {"data", insight.data},
        {"recommendations", insight.recommendations},
        {"generatedAt", formatTimestamp(insight.generatedAt)},
        {"isActionable", insight.actionable},
    };
}

} // namespace titan::hub
