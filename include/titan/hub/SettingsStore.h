// Copyright 2025 The Titan Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <titan/core/types.h>

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace titan::hub {

/**
 * @brief Key/value persistence for hub settings, supplied by the hosting shell.
 *
 * Values are opaque strings (the hub writes serialized JSON).
 */
class ISettingsStore {
public:
    virtual ~ISettingsStore() = default;

    /// @return the stored value, nullopt if absent, or an error if the backing
    ///         storage could not be read
    virtual Result<std::optional<std::string>> get(const std::string& key) = 0;
    virtual Result<void> set(const std::string& key, const std::string& value) = 0;
};

class InMemorySettingsStore final : public ISettingsStore {
public:
    Result<std::optional<std::string>> get(const std::string& key) override;
    Result<void> set(const std::string& key, const std::string& value) override;

private:
    std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

/**
 * @brief Settings persisted in one JSON object on disk.
 *
 * Values that parse as JSON are stored inline so the file stays readable; others
 * are stored as strings. Writes go to a temporary sibling first and are renamed
 * into place. A missing file reads as empty.
 */
class JsonFileSettingsStore final : public ISettingsStore {
public:
    explicit JsonFileSettingsStore(std::filesystem::path path);

    Result<std::optional<std::string>> get(const std::string& key) override;
    Result<void> set(const std::string& key, const std::string& value) override;

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

/// TITAN_SETTINGS_PATH, else $XDG_CONFIG_HOME/titan/settings.json, else
/// $HOME/.config/titan/settings.json.
std::filesystem::path resolveDefaultSettingsPath();

} // namespace titan::hub
