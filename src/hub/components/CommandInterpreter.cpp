#include <titan/core/uuid.h>
#include <titan/hub/components/CommandInterpreter.h>

#include <algorithm>
#include <cctype>

namespace titan::hub {

namespace {

std::string toLower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

CommandInterpreter::CommandInterpreter() {
    addKeywords(Capability::Automation, {"click", "fill", "automate"});
    addKeywords(Capability::WebAnalysis, {"analyze", "understand"});
    addKeywords(Capability::Performance, {"optimize", "speed"});
    addKeywords(Capability::Security, {"secure", "safe"});
    addKeywords(Capability::Accessibility, {"accessible", "a11y"});
}

void CommandInterpreter::addKeywords(Capability capability, std::vector<std::string> keywords) {
    for (auto& keyword : keywords) {
        keyword = toLower(keyword);
    }
    keywords.erase(std::remove(keywords.begin(), keywords.end(), std::string{}), keywords.end());
    if (!keywords.empty()) {
        rules_.emplace_back(capability, std::move(keywords));
    }
}

Capability CommandInterpreter::interpret(std::string_view command) const {
    auto text = toLower(command);
    for (const auto& [capability, keywords] : rules_) {
        for (const auto& keyword : keywords) {
            if (text.find(keyword) != std::string::npos) {
                return capability;
            }
        }
    }
    return fallback_;
}

IntelligenceTask CommandInterpreter::makeTask(const std::string& tabId,
                                              const std::string& command) const {
    IntelligenceTask task;
    task.id = core::makeScopedId(tabId, "command");
    task.name = "User Command";
    task.description = command;
    task.capability = interpret(command);
    task.priority = TaskPriority::High;
    task.parameters = nlohmann::json{{"instruction", command}};
    task.createdAt = Clock::now();
    task.estimatedDuration = std::chrono::seconds(10);
    return task;
}

} // namespace titan::hub
