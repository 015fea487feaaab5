// Copyright 2025 The Titan Authors
// SPDX-License-Identifier: Apache-2.0

#include <titan/hub/components/CapabilityRegistry.h>

#include <spdlog/spdlog.h>

#include <mutex>

namespace titan::hub {

namespace {
std::size_t slotOf(Capability capability) {
    return static_cast<std::size_t>(capability);
}
} // namespace

Result<void> CapabilityRegistry::registerHandler(Capability capability,
                                                 CapabilityHandler handler) {
    if (!handler) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Empty handler for capability ") + capabilityName(capability)};
    }
    if (slotOf(capability) >= kCapabilityCount) {
        return Error{ErrorCode::InvalidArgument, "Unknown capability"};
    }

    bool replaced = false;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        replaced = static_cast<bool>(handlers_[slotOf(capability)]);
        handlers_[slotOf(capability)] = std::move(handler);
    }
    spdlog::debug("[CapabilityRegistry] {} handler for {}", replaced ? "Replaced" : "Registered",
                  capabilityName(capability));
    return {};
}

bool CapabilityRegistry::unregisterHandler(Capability capability) {
    if (slotOf(capability) >= kCapabilityCount) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& slot = handlers_[slotOf(capability)];
    if (!slot) {
        return false;
    }
    slot = nullptr;
    return true;
}

bool CapabilityRegistry::hasHandler(Capability capability) const {
    if (slotOf(capability) >= kCapabilityCount) {
        return false;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<bool>(handlers_[slotOf(capability)]);
}

CapabilityHandler CapabilityRegistry::find(Capability capability) const {
    if (slotOf(capability) >= kCapabilityCount) {
        return {};
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return handlers_[slotOf(capability)];
}

std::vector<Capability> CapabilityRegistry::registeredCapabilities() const {
    std::vector<Capability> out;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (auto cap : kAllCapabilities) {
        if (handlers_[slotOf(cap)]) {
            out.push_back(cap);
        }
    }
    return out;
}

} // namespace titan::hub
