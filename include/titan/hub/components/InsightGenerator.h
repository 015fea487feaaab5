#pragma once

#include <titan/hub/components/HubStatistics.h>
#include <titan/hub/intelligence_types.h>

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace titan::hub {

class NotificationHub;

struct InsightGeneratorConfig {
    std::size_t capacity = 50;             ///< Retained insights; oldest evicted first
    double confidenceThreshold = 0.7;      ///< Reported with the settings; never filters
    uint64_t usageTrendThreshold = 10;     ///< Usage count that triggers a usage insight
    uint64_t successRateMinCompleted = 20; ///< Completed tasks before success rate is judged
    double successRateFloor = 0.8;         ///< Success rate below this triggers an insight
};

/**
 * @brief Turns completed task results and aggregate statistics into insights.
 *
 * Two triggers:
 * - generateFromTask(): per-capability rules run right after a task completes
 * - generateFromStatistics(): usage-trend and success-rate rules, run periodically
 *
 * Emitted insights are appended to a bounded list (oldest by generatedAt evicted on
 * overflow) and pushed to the global insight subscription.
 */
class InsightGenerator {
public:
    using Config = InsightGeneratorConfig;
    using TaskRule = std::function<std::optional<IntelligenceInsight>(const IntelligenceTask&)>;

    explicit InsightGenerator(NotificationHub& notifications);
    InsightGenerator(NotificationHub& notifications, Config config);

    InsightGenerator(const InsightGenerator&) = delete;
    InsightGenerator& operator=(const InsightGenerator&) = delete;

    /// Add a rule evaluated for Completed tasks of the given capability.
    void addTaskRule(Capability capability, TaskRule rule);

    /// Apply the task's capability rules. Non-Completed tasks yield nothing.
    /// @return insights that were retained
    std::vector<IntelligenceInsight> generateFromTask(const IntelligenceTask& task);

    /// Apply the aggregate rules to a statistics snapshot.
    std::vector<IntelligenceInsight> generateFromStatistics(const StatisticsSnapshot& stats);

    /// Append one insight and publish it, evicting the oldest past capacity.
    void addInsight(IntelligenceInsight insight);

    /// Retained insights in insertion order, optionally filtered by category.
    std::vector<IntelligenceInsight>
    insights(std::optional<Capability> category = std::nullopt) const;

    std::size_t size() const;
    std::size_t capacity() const noexcept { return config_.capacity; }

    void setConfidenceThreshold(double threshold);
    double confidenceThreshold() const;

    void clear();

private:
    void registerBuiltinRules();

    NotificationHub& notifications_;
    Config config_;

    mutable std::mutex mutex_;
    std::deque<IntelligenceInsight> insights_;
    std::unordered_map<Capability, std::vector<TaskRule>> rules_;
};

} // namespace titan::hub
