#include <titan/hub/components/NotificationHub.h>

#include <spdlog/spdlog.h>

#include <exception>
#include <vector>

namespace titan::hub {

SubscriptionId NotificationHub::subscribeTab(const std::string& tabId, TaskListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = nextId_++;
    tabListeners_[tabId].emplace(id, std::move(listener));
    return id;
}

SubscriptionId NotificationHub::subscribeInsights(InsightListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = nextId_++;
    insightListeners_.emplace(id, std::move(listener));
    return id;
}

bool NotificationHub::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (insightListeners_.erase(id) > 0) {
        return true;
    }
    for (auto it = tabListeners_.begin(); it != tabListeners_.end(); ++it) {
        if (it->second.erase(id) > 0) {
            if (it->second.empty()) {
                tabListeners_.erase(it);
            }
            return true;
        }
    }
    return false;
}

std::size_t NotificationHub::closeTab(const std::string& tabId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tabListeners_.find(tabId);
    if (it == tabListeners_.end()) {
        return 0;
    }
    auto n = it->second.size();
    tabListeners_.erase(it);
    return n;
}

void NotificationHub::publishTask(const IntelligenceTask& task) {
    std::vector<TaskListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tabListeners_.find(tabIdOf(task.id));
        if (it == tabListeners_.end()) {
            return;
        }
        listeners.reserve(it->second.size());
        for (const auto& [id, listener] : it->second) {
            listeners.push_back(listener);
        }
    }
    for (auto& listener : listeners) {
        try {
            listener(task);
        } catch (const std::exception& e) {
            spdlog::warn("[NotificationHub] Task listener threw for {}: {}", task.id, e.what());
        }
    }
}

void NotificationHub::publishInsight(const IntelligenceInsight& insight) {
    std::vector<InsightListener> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners.reserve(insightListeners_.size());
        for (const auto& [id, listener] : insightListeners_) {
            listeners.push_back(listener);
        }
    }
    for (auto& listener : listeners) {
        try {
            listener(insight);
        } catch (const std::exception& e) {
            spdlog::warn("[NotificationHub] Insight listener threw for {}: {}", insight.id,
                         e.what());
        }
    }
}

std::size_t NotificationHub::tabSubscriberCount(const std::string& tabId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tabListeners_.find(tabId);
    return it == tabListeners_.end() ? 0 : it->second.size();
}

std::size_t NotificationHub::insightSubscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return insightListeners_.size();
}

void NotificationHub::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    tabListeners_.clear();
    insightListeners_.clear();
}

} // namespace titan::hub
