/**
 * @file settings_map.h
 * @brief Key/value settings used by topology declarations and runtime config patches.
 */
#ifndef AIRLIFT_SETTINGS_MAP_H
#define AIRLIFT_SETTINGS_MAP_H

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace airlift {
namespace audio {

/** @brief String-keyed settings as supplied by the configuration collaborator. */
using SettingsMap = std::map<std::string, std::string>;

namespace utils {

inline std::optional<std::string> find_setting(const SettingsMap& settings, const std::string& key) {
    auto it = settings.find(key);
    if (it == settings.end()) {
        return std::nullopt;
    }
    return it->second;
}

inline std::string get_string(const SettingsMap& settings, const std::string& key, const std::string& fallback) {
    auto value = find_setting(settings, key);
    return value ? *value : fallback;
}

/**
 * @brief Parses an integer setting.
 * @return The parsed value, or nullopt when missing or malformed.
 */
inline std::optional<long> parse_int(const SettingsMap& settings, const std::string& key) {
    auto value = find_setting(settings, key);
    if (!value) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        long parsed = std::stol(*value, &consumed);
        if (consumed != value->size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

inline std::optional<float> parse_float(const SettingsMap& settings, const std::string& key) {
    auto value = find_setting(settings, key);
    if (!value) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        float parsed = std::stof(*value, &consumed);
        if (consumed != value->size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

inline std::optional<bool> parse_bool(const SettingsMap& settings, const std::string& key) {
    auto value = find_setting(settings, key);
    if (!value) {
        return std::nullopt;
    }
    if (*value == "true" || *value == "1" || *value == "yes" || *value == "on") {
        return true;
    }
    if (*value == "false" || *value == "0" || *value == "no" || *value == "off") {
        return false;
    }
    return std::nullopt;
}

inline long get_int(const SettingsMap& settings, const std::string& key, long fallback) {
    auto value = parse_int(settings, key);
    return value ? *value : fallback;
}

/**
 * @brief Reads an integer setting that must lie in [min_value, max_value].
 * @return The parsed value, or `fallback` when missing, malformed or out of range.
 */
inline long get_int_in_range(const SettingsMap& settings, const std::string& key, long fallback,
                             long min_value, long max_value) {
    auto value = parse_int(settings, key);
    if (!value || *value < min_value || *value > max_value) {
        return fallback;
    }
    return *value;
}

inline float get_float(const SettingsMap& settings, const std::string& key, float fallback) {
    auto value = parse_float(settings, key);
    return value ? *value : fallback;
}

inline bool get_bool(const SettingsMap& settings, const std::string& key, bool fallback) {
    auto value = parse_bool(settings, key);
    return value ? *value : fallback;
}

} // namespace utils
} // namespace audio
} // namespace airlift

#endif // AIRLIFT_SETTINGS_MAP_H
