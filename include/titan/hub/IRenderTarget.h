#pragma once

#include <optional>
#include <string>

namespace titan::hub {

/**
 * @brief Browsing context supplied by the hosting shell when a tab registers.
 *
 * The hub never calls into it; it is forwarded to capability handlers through
 * TaskContext so they can reach the page they operate on.
 */
class IRenderTarget {
public:
    virtual ~IRenderTarget() = default;

    virtual std::optional<std::string> currentUrl() const = 0;
    virtual std::string title() const = 0;
};

} // namespace titan::hub
