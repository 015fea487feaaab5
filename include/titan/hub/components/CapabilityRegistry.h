// Copyright 2025 The Titan Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <titan/core/types.h>
#include <titan/hub/CancellationToken.h>
#include <titan/hub/IRenderTarget.h>
#include <titan/hub/intelligence_types.h>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace titan::hub {

/**
 * @brief Everything a capability handler receives for one invocation.
 */
struct TaskContext {
    std::string tabId;
    std::string taskId;
    nlohmann::json parameters = nlohmann::json::object();

    /// Render target registered for tabId; null if the tab is unknown.
    std::shared_ptr<IRenderTarget> renderTarget;

    /// Fired by the reaper, tab cleanup or hub shutdown. Handlers should stop
    /// their work when it fires; anything they return afterwards is discarded.
    std::shared_ptr<CancellationToken> cancellation;

    /// Report progress in [0, 1]. Decreases are ignored. May be empty in tests.
    std::function<void(double)> reportProgress;
};

/**
 * @brief Asynchronous handler for one capability.
 *
 * Returns the result map on success and reports failure by throwing.
 */
using CapabilityHandler = std::function<boost::asio::awaitable<nlohmann::json>(TaskContext)>;

/**
 * @brief Table mapping a capability tag to its externally supplied handler.
 *
 * Purely a registration/lookup facility. Adding a capability requires no change
 * to the dispatcher. Thread-safe.
 */
class CapabilityRegistry {
public:
    CapabilityRegistry() = default;

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    /// Registers or replaces the handler for a capability.
    Result<void> registerHandler(Capability capability, CapabilityHandler handler);

    /// @return true if a handler was removed
    bool unregisterHandler(Capability capability);

    bool hasHandler(Capability capability) const;

    /// Copy of the handler, or an empty function if none is registered.
    CapabilityHandler find(Capability capability) const;

    std::vector<Capability> registeredCapabilities() const;

private:
    mutable std::shared_mutex mutex_;
    std::array<CapabilityHandler, kCapabilityCount> handlers_;
};

} // namespace titan::hub
