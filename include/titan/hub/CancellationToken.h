#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace titan::hub {

/**
 * @brief Cooperative cancellation signal shared between the hub and a handler.
 *
 * Handlers poll isCancelled() or register an onCancel() callback to abort their
 * underlying asynchronous work. cancel() is idempotent; callbacks run exactly once,
 * on the thread that calls cancel() (or immediately if already cancelled).
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;

    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    /// Reason recorded by the first cancel() call; empty until cancelled.
    std::string reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

    void cancel(std::string reason = "cancelled") {
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_.load(std::memory_order_relaxed)) {
                return;
            }
            reason_ = std::move(reason);
            cancelled_.store(true, std::memory_order_release);
            callbacks.swap(callbacks_);
        }
        for (auto& cb : callbacks) {
            cb();
        }
    }

    void onCancel(Callback cb) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_.load(std::memory_order_relaxed)) {
                callbacks_.push_back(std::move(cb));
                return;
            }
        }
        cb();
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    std::string reason_;
    std::vector<Callback> callbacks_;
};

} // namespace titan::hub
