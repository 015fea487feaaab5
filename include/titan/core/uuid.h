#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

namespace titan::core {

/**
 * Milliseconds since the Unix epoch for the given wall-clock time.
 */
inline long long epochMillis(std::chrono::system_clock::time_point tp) {
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

/**
 * Generate a prefixed ID: prefix_timestamp_ms_random6chars.
 *
 * The underscore separator keeps IDs compatible with tab-scoped task ids, where
 * everything before the first '_' names the tab.
 */
inline std::string generateId(const std::string& prefix) {
    auto ms = epochMillis(std::chrono::system_clock::now());

    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFF);
    uint32_t r = dist(rng);

    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s_%lld_%06x", prefix.c_str(), ms, r);
    return std::string(buf);
}

/**
 * Generate a tab-scoped, process-unique task id: <tabId>_<slug>_<ms>[_<n>].
 * The counter suffix disambiguates ids minted within the same millisecond.
 */
inline std::string makeScopedId(const std::string& tabId, const std::string& slug) {
    static std::atomic<uint64_t> counter{0};
    auto ms = epochMillis(std::chrono::system_clock::now());
    auto n = counter.fetch_add(1, std::memory_order_relaxed);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "_%lld_%llu", ms, static_cast<unsigned long long>(n));
    return tabId + "_" + slug + buf;
}

} // namespace titan::core
