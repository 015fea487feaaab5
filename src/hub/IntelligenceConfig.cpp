#include <titan/hub/IntelligenceConfig.h>
#include <titan/hub/SettingsStore.h>
#include <titan/hub/components/TaskScheduler.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace titan::hub {

using json = nlohmann::json;

namespace {

template <typename T, typename Check>
void readField(const json& j, const char* key, T& out, Check isType) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (!isType(*it)) {
        spdlog::warn("[IntelligenceConfig] Ignoring '{}': unexpected type {}", key,
                     it->type_name());
        return;
    }
    out = it->template get<T>();
}

} // namespace

void normalize(IntelligenceConfig& config) {
    config.confidenceThreshold = std::clamp(config.confidenceThreshold, 0.0, 1.0);
    config.maxConcurrentTasks =
        std::clamp(config.maxConcurrentTasks, kMinConcurrentTasks, kMaxConcurrentTasks);
}

IntelligenceConfig applyUpdate(IntelligenceConfig config, const IntelligenceConfigUpdate& update) {
    if (update.enabledCapabilities) {
        config.enabledCapabilities = *update.enabledCapabilities;
    }
    if (update.autoOptimization) {
        config.autoOptimization = *update.autoOptimization;
    }
    if (update.predictiveBrowsing) {
        config.predictiveBrowsing = *update.predictiveBrowsing;
    }
    if (update.learningMode) {
        config.learningMode = *update.learningMode;
    }
    if (update.confidenceThreshold) {
        config.confidenceThreshold = *update.confidenceThreshold;
    }
    if (update.maxConcurrentTasks) {
        config.maxConcurrentTasks = *update.maxConcurrentTasks;
    }
    normalize(config);
    return config;
}

json toJson(const IntelligenceConfig& config) {
    json caps = json::array();
    for (auto cap : config.enabledCapabilities) {
        caps.push_back(capabilityName(cap));
    }
    return json{{"enabledCapabilities", std::move(caps)},
                {"autoOptimization", config.autoOptimization},
                {"predictiveBrowsing", config.predictiveBrowsing},
                {"learningMode", config.learningMode},
                {"confidenceThreshold", config.confidenceThreshold},
                {"maxConcurrentTasks", config.maxConcurrentTasks}};
}

Result<IntelligenceConfig> configFromJson(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::CorruptedData, "Intelligence config must be a JSON object"};
    }

    IntelligenceConfig config;
    auto isBool = [](const json& v) { return v.is_boolean(); };
    auto isNumber = [](const json& v) { return v.is_number(); };
    auto isCount = [](const json& v) {
        return v.is_number_unsigned() || (v.is_number_integer() && v.get<long long>() >= 0);
    };

    readField(j, "autoOptimization", config.autoOptimization, isBool);
    readField(j, "predictiveBrowsing", config.predictiveBrowsing, isBool);
    readField(j, "learningMode", config.learningMode, isBool);
    readField(j, "confidenceThreshold", config.confidenceThreshold, isNumber);
    readField(j, "maxConcurrentTasks", config.maxConcurrentTasks, isCount);

    if (auto it = j.find("enabledCapabilities"); it != j.end()) {
        if (!it->is_array()) {
            spdlog::warn("[IntelligenceConfig] Ignoring 'enabledCapabilities': not an array");
        } else {
            std::set<Capability> caps;
            for (const auto& entry : *it) {
                if (!entry.is_string()) {
                    spdlog::warn("[IntelligenceConfig] Ignoring non-string capability entry");
                    continue;
                }
                auto name = entry.get<std::string>();
                if (auto cap = parseCapability(name)) {
                    caps.insert(*cap);
                } else {
                    spdlog::warn("[IntelligenceConfig] Ignoring unknown capability '{}'", name);
                }
            }
            config.enabledCapabilities = std::move(caps);
        }
    }

    for (const auto& item : j.items()) {
        static const std::set<std::string> known = {
            "enabledCapabilities", "autoOptimization",    "predictiveBrowsing",
            "learningMode",        "confidenceThreshold", "maxConcurrentTasks"};
        if (known.count(item.key()) == 0) {
            spdlog::warn("[IntelligenceConfig] Ignoring unknown key '{}'", item.key());
        }
    }

    normalize(config);
    return config;
}

Result<IntelligenceConfig> loadIntelligenceConfig(ISettingsStore& store, const std::string& key) {
    auto raw = store.get(key);
    if (!raw) {
        return raw.error();
    }
    if (!raw.value()) {
        spdlog::debug("[IntelligenceConfig] No stored settings under '{}', using defaults", key);
        return IntelligenceConfig{};
    }
    auto j = json::parse(*raw.value(), nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorCode::CorruptedData, "Stored intelligence config is not valid JSON"};
    }
    return configFromJson(j);
}

Result<void> saveIntelligenceConfig(ISettingsStore& store, const IntelligenceConfig& config,
                                    const std::string& key) {
    return store.set(key, toJson(config).dump());
}

} // namespace titan::hub
