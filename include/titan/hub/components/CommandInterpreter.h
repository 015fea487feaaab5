#pragma once

#include <titan/hub/intelligence_types.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace titan::hub {

/**
 * @brief Maps free-text commands to a capability by keyword.
 *
 * Rules are checked in order against the lower-cased command; the first rule
 * with a keyword contained in the text wins. Commands matching nothing go to the
 * fallback capability (AiInteraction).
 */
class CommandInterpreter {
public:
    CommandInterpreter();

    Capability interpret(std::string_view command) const;

    /// Build the High-priority "User Command" task for a tab.
    IntelligenceTask makeTask(const std::string& tabId, const std::string& command) const;

    /// Append a rule; earlier rules take precedence.
    void addKeywords(Capability capability, std::vector<std::string> keywords);
    void setFallback(Capability capability) noexcept { fallback_ = capability; }
    Capability fallback() const noexcept { return fallback_; }

private:
    std::vector<std::pair<Capability, std::vector<std::string>>> rules_;
    Capability fallback_{Capability::AiInteraction};
};

} // namespace titan::hub
