#include "SimulatedHandlers.h"

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>
#include <random>
#include <stdexcept>

namespace titan::tools {

using hub::Capability;
using hub::TaskContext;
using json = nlohmann::json;

namespace {

double uniform(double lo, double hi) {
    static std::mutex mutex;
    static std::mt19937 rng{std::random_device{}()};
    std::lock_guard<std::mutex> lock(mutex);
    return std::uniform_real_distribution<double>(lo, hi)(rng);
}

json simulatedResult(Capability capability, const TaskContext& ctx) {
    switch (capability) {
        case Capability::WebAnalysis: {
            json forms = json::array();
            auto formCount = static_cast<int>(uniform(0.0, 3.0));
            for (int i = 0; i < formCount; ++i) {
                forms.push_back({{"id", "form" + std::to_string(i)}, {"fields", 3 + i}});
            }
            return {{"pageIntelligence",
                     {{"url", ctx.renderTarget ? ctx.renderTarget->currentUrl().value_or("")
                                               : std::string()},
                      {"forms", std::move(forms)},
                      {"accessibility", {{"score", uniform(0.5, 1.0)}}}}}};
        }
        case Capability::Performance:
            return {{"coreWebVitalsScore", uniform(0.3, 1.0)},
                    {"performanceMetrics",
                     {{"lcpMs", uniform(800.0, 4000.0)}, {"cls", uniform(0.0, 0.3)}}}};
        case Capability::Security: {
            auto score = uniform(0.0, 100.0);
            return {{"threatScore", score}, {"threatLevel", score > 50.0 ? "high" : "low"}};
        }
        default:
            break;
    }
    return {{"message", std::string("Handled ") + hub::capabilityName(capability)}};
}

hub::CapabilityHandler makeHandler(Capability capability, SimulationOptions options) {
    return [capability, options](TaskContext ctx) -> boost::asio::awaitable<json> {
        auto executor = co_await boost::asio::this_coro::executor;
        boost::asio::steady_timer timer(executor);

        // Work in steps so progress and cancellation are observed.
        constexpr int kSteps = 4;
        auto step = options.latency / kSteps;
        for (int i = 1; i <= kSteps; ++i) {
            if (ctx.cancellation && ctx.cancellation->isCancelled()) {
                spdlog::debug("[Simulated] {} stopping: {}", ctx.taskId,
                              ctx.cancellation->reason());
                co_return json::object();
            }
            timer.expires_after(step);
            co_await timer.async_wait(boost::asio::use_awaitable);
            if (ctx.reportProgress) {
                ctx.reportProgress(static_cast<double>(i) / kSteps);
            }
        }

        if (options.failureRate > 0.0 && uniform(0.0, 1.0) < options.failureRate) {
            throw std::runtime_error(std::string("Simulated ") + hub::capabilityName(capability) +
                                     " failure");
        }
        co_return simulatedResult(capability, ctx);
    };
}

} // namespace

std::size_t registerSimulatedHandlers(hub::CapabilityRegistry& registry,
                                      const SimulationOptions& options) {
    SimulationOptions normalized = options;
    normalized.failureRate = std::clamp(normalized.failureRate, 0.0, 1.0);
    if (normalized.latency.count() < 4) {
        normalized.latency = std::chrono::milliseconds(4);
    }

    std::size_t registered = 0;
    for (auto cap : hub::kAllCapabilities) {
        if (auto res = registry.registerHandler(cap, makeHandler(cap, normalized)); !res) {
            spdlog::warn("[Simulated] Could not register {}: {}", hub::capabilityName(cap),
                         res.error().message);
            continue;
        }
        ++registered;
    }
    return registered;
}

} // namespace titan::tools
