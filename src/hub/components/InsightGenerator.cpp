#include <titan/core/uuid.h>
#include <titan/hub/components/InsightGenerator.h>
#include <titan/hub/components/NotificationHub.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace titan::hub {

namespace {

IntelligenceInsight makeInsight(const char* idPrefix, std::string title, std::string description,
                                Capability category, double confidence, nlohmann::json data,
                                std::vector<std::string> recommendations) {
    IntelligenceInsight insight;
    insight.id = core::generateId(idPrefix);
    insight.title = std::move(title);
    insight.description = std::move(description);
    insight.category = category;
    insight.confidence = confidence;
    insight.data = std::move(data);
    insight.recommendations = std::move(recommendations);
    insight.generatedAt = Clock::now();
    return insight;
}

std::optional<double> numberAt(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) {
        return std::nullopt;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) {
        return std::nullopt;
    }
    return it->get<double>();
}

int percent(double ratio) {
    return static_cast<int>(ratio * 100.0);
}

// Page analysis results arrive either wrapped in "pageIntelligence" or flat.
const nlohmann::json& pageIntelligence(const nlohmann::json& result) {
    auto it = result.find("pageIntelligence");
    if (it != result.end() && it->is_object()) {
        return *it;
    }
    return result;
}

std::optional<IntelligenceInsight> performanceRule(const IntelligenceTask& task) {
    auto score = numberAt(task.result, "coreWebVitalsScore");
    if (!score || *score >= 0.7) {
        return std::nullopt;
    }
    nlohmann::json data{{"score", *score}};
    if (auto it = task.result.find("performanceMetrics"); it != task.result.end()) {
        data["metrics"] = *it;
    }
    return makeInsight("perf", "Performance Optimization Needed",
                       fmt::format("Page performance is below optimal levels ({}%)",
                                   percent(*score)),
                       Capability::Performance, 0.9, std::move(data),
                       {"Enable performance mode", "Optimize images and resources",
                        "Reduce JavaScript execution time", "Improve server response time"});
}

std::optional<IntelligenceInsight> securityRule(const IntelligenceTask& task) {
    auto score = numberAt(task.result, "threatScore");
    if (!score || *score <= 50.0) {
        return std::nullopt;
    }
    nlohmann::json data{{"threatScore", *score},
                        {"threatLevel", task.result.value("threatLevel", nlohmann::json())}};
    return makeInsight("sec", "Security Threats Detected",
                       fmt::format("Multiple security threats detected (threat score: {})",
                                   static_cast<long long>(*score)),
                       Capability::Security, 0.95, std::move(data),
                       {"Enable strict security mode", "Block suspicious scripts",
                        "Use HTTPS-only mode", "Enable tracking protection"});
}

std::optional<IntelligenceInsight> formsRule(const IntelligenceTask& task) {
    const auto& page = pageIntelligence(task.result);
    auto it = page.find("forms");
    if (it == page.end() || !it->is_array() || it->empty()) {
        return std::nullopt;
    }
    return makeInsight("form", "Forms Detected",
                       fmt::format("Found {} form(s) that can be automated", it->size()),
                       Capability::Automation, 0.8, nlohmann::json{{"forms", *it}},
                       {"Enable smart autofill", "Create automation shortcuts",
                        "Save form templates"});
}

std::optional<IntelligenceInsight> accessibilityRule(const IntelligenceTask& task) {
    const auto& page = pageIntelligence(task.result);
    auto it = page.find("accessibility");
    if (it == page.end() || !it->is_object()) {
        return std::nullopt;
    }
    auto score = numberAt(*it, "score").value_or(1.0);
    if (score >= 0.8) {
        return std::nullopt;
    }
    return makeInsight("a11y", "Accessibility Issues Found",
                       fmt::format("Page has accessibility issues (score: {}%)", percent(score)),
                       Capability::Accessibility, 0.85, nlohmann::json{{"accessibility", *it}},
                       {"Enable accessibility mode", "Add missing alt text",
                        "Improve keyboard navigation", "Increase color contrast"});
}

} // namespace

InsightGenerator::InsightGenerator(NotificationHub& notifications)
    : InsightGenerator(notifications, Config{}) {}

InsightGenerator::InsightGenerator(NotificationHub& notifications, Config config)
    : notifications_(notifications), config_(std::move(config)) {
    if (config_.capacity == 0) {
        config_.capacity = 1;
    }
    config_.confidenceThreshold = std::clamp(config_.confidenceThreshold, 0.0, 1.0);
    registerBuiltinRules();
}

void InsightGenerator::registerBuiltinRules() {
    rules_[Capability::Performance].push_back(performanceRule);
    rules_[Capability::Security].push_back(securityRule);
    rules_[Capability::WebAnalysis].push_back(formsRule);
    rules_[Capability::WebAnalysis].push_back(accessibilityRule);
}

void InsightGenerator::addTaskRule(Capability capability, TaskRule rule) {
    if (!rule) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    rules_[capability].push_back(std::move(rule));
}

std::vector<IntelligenceInsight> InsightGenerator::generateFromTask(const IntelligenceTask& task) {
    std::vector<IntelligenceInsight> emitted;
    if (task.status != TaskStatus::Completed || task.result.empty()) {
        return emitted;
    }

    std::vector<TaskRule> rules;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = rules_.find(task.capability);
        if (it == rules_.end()) {
            return emitted;
        }
        rules = it->second;
    }

    for (const auto& rule : rules) {
        std::optional<IntelligenceInsight> insight;
        try {
            insight = rule(task);
        } catch (const std::exception& e) {
            spdlog::warn("[InsightGenerator] Rule for {} threw on task {}: {}",
                         capabilityName(task.capability), task.id, e.what());
            continue;
        }
        if (insight) {
            emitted.push_back(*insight);
            addInsight(std::move(*insight));
        }
    }
    return emitted;
}

std::vector<IntelligenceInsight>
InsightGenerator::generateFromStatistics(const StatisticsSnapshot& stats) {
    std::vector<IntelligenceInsight> emitted;

    // Usage trend: the most used capability, lowest tag on ties.
    std::optional<Capability> mostUsed;
    uint64_t mostUsedCount = 0;
    nlohmann::json usage = nlohmann::json::object();
    for (auto cap : kAllCapabilities) {
        auto count = stats.usage(cap);
        if (count == 0) {
            continue;
        }
        usage[capabilityName(cap)] = count;
        if (!mostUsed || count > mostUsedCount) {
            mostUsed = cap;
            mostUsedCount = count;
        }
    }
    if (mostUsed && mostUsedCount > config_.usageTrendThreshold) {
        auto insight = makeInsight(
            "usage", "High Usage Pattern Detected",
            fmt::format("You frequently use {} features ({} times)", capabilityName(*mostUsed),
                        mostUsedCount),
            *mostUsed, 0.8, nlohmann::json{{"usage", usage}},
            {"Create shortcuts for common tasks", "Enable auto-optimization for this feature",
             "Consider upgrading to premium features"});
        emitted.push_back(insight);
        addInsight(std::move(insight));
    }

    // Success rate
    auto rate = stats.successRate();
    if (stats.completed > config_.successRateMinCompleted && rate < config_.successRateFloor) {
        auto insight = makeInsight(
            "trend", "Task Success Rate Below Optimal",
            fmt::format("Task success rate is {}% ({} failures)", percent(rate), stats.failed),
            Capability::Learning, 0.7,
            nlohmann::json{
                {"successRate", rate}, {"completed", stats.completed}, {"failed", stats.failed}},
            {"Check network connectivity", "Update browser engine", "Reset AI models",
             "Contact support if issues persist"});
        emitted.push_back(insight);
        addInsight(std::move(insight));
    }

    return emitted;
}

void InsightGenerator::addInsight(IntelligenceInsight insight) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        insights_.push_back(insight);
        while (insights_.size() > config_.capacity) {
            // Oldest by generatedAt; min_element keeps the earliest inserted on ties.
            auto oldest = std::min_element(insights_.begin(), insights_.end(),
                                           [](const auto& a, const auto& b) {
                                               return a.generatedAt < b.generatedAt;
                                           });
            insights_.erase(oldest);
        }
    }
    spdlog::info("[InsightGenerator] {} ({}, confidence {:.2f})", insight.title,
                 capabilityName(insight.category), insight.confidence);
    notifications_.publishInsight(insight);
}

std::vector<IntelligenceInsight>
InsightGenerator::insights(std::optional<Capability> category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<IntelligenceInsight> out;
    out.reserve(insights_.size());
    for (const auto& insight : insights_) {
        if (!category || insight.category == *category) {
            out.push_back(insight);
        }
    }
    return out;
}

std::size_t InsightGenerator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return insights_.size();
}

void InsightGenerator::setConfidenceThreshold(double threshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.confidenceThreshold = std::clamp(threshold, 0.0, 1.0);
}

double InsightGenerator::confidenceThreshold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.confidenceThreshold;
}

void InsightGenerator::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    insights_.clear();
}

} // namespace titan::hub
