#pragma once

#include <titan/hub/IRenderTarget.h>
#include <titan/hub/components/CapabilityRegistry.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace titan::tools {

/// Render target standing in for a browser tab.
class SimulatedRenderTarget final : public hub::IRenderTarget {
public:
    SimulatedRenderTarget(std::string url, std::string title)
        : url_(std::move(url)), title_(std::move(title)) {}

    std::optional<std::string> currentUrl() const override { return url_; }
    std::string title() const override { return title_; }

private:
    std::string url_;
    std::string title_;
};

struct SimulationOptions {
    /// Base handler latency; each capability scales it.
    std::chrono::milliseconds latency{200};
    /// Fraction of invocations that throw, in [0, 1].
    double failureRate = 0.0;
};

/// Register a simulated handler for every capability.
/// @return number of handlers registered
std::size_t registerSimulatedHandlers(hub::CapabilityRegistry& registry,
                                      const SimulationOptions& options);

} // namespace titan::tools
