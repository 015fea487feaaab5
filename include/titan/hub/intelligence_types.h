#pragma once

#include <titan/core/types.h>

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace titan::hub {

/// Named categories of schedulable work; each is bound to one handler.
enum class Capability : uint8_t {
    WebAnalysis = 0,
    Automation,
    AiInteraction,
    Performance,
    Security,
    Accessibility,
    Learning,
    Prediction,
    Personalization,
    Collaboration,
};

inline constexpr std::size_t kCapabilityCount = 10;

inline constexpr std::array<Capability, kCapabilityCount> kAllCapabilities = {
    Capability::WebAnalysis,  Capability::Automation,    Capability::AiInteraction,
    Capability::Performance,  Capability::Security,      Capability::Accessibility,
    Capability::Learning,     Capability::Prediction,    Capability::Personalization,
    Capability::Collaboration};

/// Lower value runs first.
enum class TaskPriority : uint8_t {
    Critical = 0, ///< Security, performance critical
    High = 1,     ///< User-requested tasks
    Medium = 2,   ///< Background optimization
    Low = 3,      ///< Learning, analytics
    Idle = 4,     ///< Cleanup, maintenance
};

enum class TaskStatus : uint8_t {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled,
    Paused,
};

const char* capabilityName(Capability capability) noexcept;
std::optional<Capability> parseCapability(std::string_view name) noexcept;

const char* priorityName(TaskPriority priority) noexcept;
std::optional<TaskPriority> parsePriority(std::string_view name) noexcept;

const char* statusName(TaskStatus status) noexcept;

constexpr bool isTerminal(TaskStatus status) noexcept {
    return status == TaskStatus::Completed || status == TaskStatus::Failed ||
           status == TaskStatus::Cancelled;
}

/**
 * @brief One unit of requested work.
 *
 * The id is tab-scoped: everything before the first '_' names the tab the task
 * operates on. Instances handed out by the hub are snapshots; the TaskStore owns
 * the authoritative copy.
 */
struct IntelligenceTask {
    std::string id;
    std::string name;
    std::string description;
    Capability capability{Capability::WebAnalysis};
    TaskPriority priority{TaskPriority::Medium};
    TaskStatus status{TaskStatus::Pending};
    nlohmann::json parameters = nlohmann::json::object();
    TimePoint createdAt{};
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> completedAt;
    std::optional<std::chrono::milliseconds> estimatedDuration;
    double progress{0.0};
    std::optional<std::string> error;
    nlohmann::json result = nlohmann::json::object();
};

/**
 * @brief Derived, human-readable observation generated from task results or
 * aggregate statistics. Never mutated after creation.
 */
struct IntelligenceInsight {
    std::string id;
    std::string title;
    std::string description;
    Capability category{Capability::WebAnalysis};
    double confidence{0.0};
    nlohmann::json data = nlohmann::json::object();
    std::vector<std::string> recommendations;
    TimePoint generatedAt{};
    bool actionable{true};
};

/// Tab id encoded in a task id: the prefix before the first '_', or the whole id.
std::string tabIdOf(std::string_view taskId);

/// ISO-8601 UTC timestamp with millisecond precision, e.g. 2025-01-31T10:15:00.123Z
std::string formatTimestamp(TimePoint tp);

void to_json(nlohmann::json& j, const IntelligenceTask& task);
void to_json(nlohmann::json& j, const IntelligenceInsight& insight);

} // namespace titan::hub
