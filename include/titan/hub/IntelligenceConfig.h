#pragma once

#include <titan/core/types.h>
#include <titan/hub/intelligence_types.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <set>
#include <string>

namespace titan::hub {

class ISettingsStore;

inline constexpr const char* kDefaultSettingsKey = "intelligence_config";

/**
 * @brief User-facing settings block of the hub.
 */
struct IntelligenceConfig {
    std::set<Capability> enabledCapabilities = {
        Capability::WebAnalysis, Capability::Automation,    Capability::AiInteraction,
        Capability::Performance, Capability::Security,      Capability::Accessibility};
    bool autoOptimization = true;
    bool predictiveBrowsing = true;
    bool learningMode = true;
    double confidenceThreshold = 0.7; ///< [0, 1]
    std::size_t maxConcurrentTasks = 5; ///< [1, 20]

    bool isEnabled(Capability capability) const {
        return enabledCapabilities.count(capability) > 0;
    }
};

/// Partial update; unset fields are left alone.
struct IntelligenceConfigUpdate {
    std::optional<std::set<Capability>> enabledCapabilities;
    std::optional<bool> autoOptimization;
    std::optional<bool> predictiveBrowsing;
    std::optional<bool> learningMode;
    std::optional<double> confidenceThreshold;
    std::optional<std::size_t> maxConcurrentTasks;
};

/// Clamp numeric fields into range.
void normalize(IntelligenceConfig& config);

/// Apply a partial update and normalize the result.
IntelligenceConfig applyUpdate(IntelligenceConfig config, const IntelligenceConfigUpdate& update);

nlohmann::json toJson(const IntelligenceConfig& config);

/**
 * @brief Parse a settings block over the defaults.
 *
 * Unknown keys, unknown capability names and mistyped fields are ignored with a
 * warning. Fails with CorruptedData only if the input is not a JSON object.
 */
Result<IntelligenceConfig> configFromJson(const nlohmann::json& j);

/// Load from the store; absent key yields defaults.
Result<IntelligenceConfig> loadIntelligenceConfig(ISettingsStore& store,
                                                  const std::string& key = kDefaultSettingsKey);

Result<void> saveIntelligenceConfig(ISettingsStore& store, const IntelligenceConfig& config,
                                    const std::string& key = kDefaultSettingsKey);

} // namespace titan::hub
