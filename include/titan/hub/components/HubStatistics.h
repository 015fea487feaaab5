#pragma once

#include <titan/hub/intelligence_types.h>

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace titan::hub {

/**
 * @brief Point-in-time copy of the aggregate task statistics.
 */
struct StatisticsSnapshot {
    uint64_t completed{0};
    uint64_t failed{0};
    uint64_t timedOut{0};
    uint64_t cancelled{0};
    std::chrono::milliseconds totalExecutionTime{0};
    std::array<uint64_t, kCapabilityCount> capabilityUsage{};

    uint64_t usage(Capability capability) const {
        return capabilityUsage[static_cast<std::size_t>(capability)];
    }

    /// completed / (completed + failed); 1.0 before anything has finished.
    double successRate() const {
        auto finished = completed + failed;
        return finished == 0 ? 1.0
                             : static_cast<double>(completed) / static_cast<double>(finished);
    }

    double averageExecutionMs() const {
        return completed == 0 ? 0.0
                              : static_cast<double>(totalExecutionTime.count()) /
                                    static_cast<double>(completed);
    }
};

/**
 * @brief Aggregate counters updated by the supervisor and the reaper, read by the
 * insight generator's trend rules.
 */
class HubStatistics {
public:
    void recordCompletion(Capability capability, std::chrono::milliseconds executionTime) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.completed++;
        stats_.capabilityUsage[static_cast<std::size_t>(capability)]++;
        stats_.totalExecutionTime += executionTime;
    }

    void recordFailure() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.failed++;
    }

    void recordTimeout() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.timedOut++;
    }

    void recordCancellation() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.cancelled++;
    }

    StatisticsSnapshot snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_ = StatisticsSnapshot{};
    }

private:
    mutable std::mutex mutex_;
    StatisticsSnapshot stats_;
};

} // namespace titan::hub
