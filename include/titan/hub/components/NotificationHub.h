#pragma once

#include <titan/hub/intelligence_types.h>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace titan::hub {

using TaskListener = std::function<void(const IntelligenceTask&)>;
using InsightListener = std::function<void(const IntelligenceInsight&)>;
using SubscriptionId = uint64_t;

/**
 * @brief Fan-out of task updates (per tab) and insights (global).
 *
 * Multiple subscribers are allowed on every channel. Listeners are invoked
 * synchronously on the publishing thread, outside the internal lock, in
 * subscription order. A throwing listener is logged and skipped.
 */
class NotificationHub {
public:
    NotificationHub() = default;

    NotificationHub(const NotificationHub&) = delete;
    NotificationHub& operator=(const NotificationHub&) = delete;

    SubscriptionId subscribeTab(const std::string& tabId, TaskListener listener);
    SubscriptionId subscribeInsights(InsightListener listener);

    /// @return true if a subscription with this id existed
    bool unsubscribe(SubscriptionId id);

    /// Drop every task subscription of a tab.
    std::size_t closeTab(const std::string& tabId);

    /// Deliver to the subscribers of the task's tab.
    void publishTask(const IntelligenceTask& task);
    void publishInsight(const IntelligenceInsight& insight);

    std::size_t tabSubscriberCount(const std::string& tabId) const;
    std::size_t insightSubscriberCount() const;

    void clear();

private:
    mutable std::mutex mutex_;
    SubscriptionId nextId_{1};
    // Ordered maps keep delivery in subscription order.
    std::unordered_map<std::string, std::map<SubscriptionId, TaskListener>> tabListeners_;
    std::map<SubscriptionId, InsightListener> insightListeners_;
};

} // namespace titan::hub
