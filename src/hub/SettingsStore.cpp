// Copyright 2025 The Titan Authors
// SPDX-License-Identifier: Apache-2.0

#include <titan/hub/SettingsStore.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace titan::hub {

using json = nlohmann::json;

namespace {

Result<json> loadJson(const std::filesystem::path& p) {
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) {
        return json::object();
    }
    std::ifstream in(p);
    if (!in.good()) {
        return Error{ErrorCode::IOError, "Cannot open settings file: " + p.string()};
    }
    auto j = json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error{ErrorCode::CorruptedData, "Settings file is not a JSON object: " + p.string()};
    }
    return j;
}

Result<void> saveJson(const std::filesystem::path& p, const json& j) {
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         "Cannot create settings directory: " + ec.message()};
        }
    }

    auto tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.good()) {
            return Error{ErrorCode::IOError, "Cannot write settings file: " + tmp.string()};
        }
        out << j.dump(2) << std::endl;
        if (!out.good()) {
            return Error{ErrorCode::IOError, "Short write to settings file: " + tmp.string()};
        }
    }
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return Error{ErrorCode::IOError, "Cannot replace settings file: " + p.string()};
    }
    return {};
}

} // namespace

Result<std::optional<std::string>> InMemorySettingsStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second};
}

Result<void> InMemorySettingsStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
    return {};
}

JsonFileSettingsStore::JsonFileSettingsStore(std::filesystem::path path) : path_(std::move(path)) {}

Result<std::optional<std::string>> JsonFileSettingsStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto doc = loadJson(path_);
    if (!doc) {
        return doc.error();
    }
    const auto& j = doc.value();
    auto it = j.find(key);
    if (it == j.end()) {
        return std::optional<std::string>{};
    }
    if (it->is_string()) {
        return std::optional<std::string>{it->get<std::string>()};
    }
    return std::optional<std::string>{it->dump()};
}

Result<void> JsonFileSettingsStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto doc = loadJson(path_);
    json j;
    if (doc) {
        j = doc.value();
    } else if (doc.error().code == ErrorCode::CorruptedData) {
        spdlog::warn("[SettingsStore] {}; starting from an empty document", doc.error().message);
        j = json::object();
    } else {
        return doc.error();
    }

    auto parsed = json::parse(value, nullptr, false);
    if (parsed.is_discarded()) {
        j[key] = value;
    } else {
        j[key] = std::move(parsed);
    }
    return saveJson(path_, j);
}

std::filesystem::path resolveDefaultSettingsPath() {
    if (const char* env = std::getenv("TITAN_SETTINGS_PATH"); env && *env) {
        return std::filesystem::path(env);
    }

    std::filesystem::path configHome;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        configHome = std::filesystem::path(xdg);
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        configHome = std::filesystem::path(home) / ".config";
    } else {
        configHome = std::filesystem::path(".config");
    }
    return configHome / "titan" / "settings.json";
}

} // namespace titan::hub
