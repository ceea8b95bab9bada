/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace ShoalEngine {

class JsonValue;

/**
 * @brief Thread-safe settings store organized by category
 *
 * Settings come from a JSON document whose top-level members are categories
 * ("simulation", "threading", "logging"), each an object of scalar values.
 * Readers always pass a default, so a missing file or key is never an error.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   int agents = settings.get<int>("simulation", "num_agents", 20);
 *   settings.set("simulation", "mode", std::string("torus"));
 *   settings.saveToFile("res/settings.json");
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Merge settings from a JSON file into the current ones
     * @return false if the file is unreadable or not a JSON object
     */
    bool loadFromFile(const std::string& filepath);

    // Same as loadFromFile() for an in-memory document
    bool loadFromString(std::string_view json);

    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Typed read with a fallback
     *
     * A float read accepts a stored int. Any other type mismatch returns
     * defaultValue. Safe for concurrent readers.
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    bool clearCategory(const std::string& category);
    void clearAll();

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;

    bool mergeDocument(const JsonValue& root, const std::string& source);

    std::unordered_map<std::string, CategorySettings> m_settings;

    // Multiple concurrent reads or a single write
    mutable std::shared_mutex m_settingsMutex;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

// Template implementations must be in header for linking

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& stored = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        if (const int* asInt = std::get_if<int>(&stored)) {
            return static_cast<float>(*asInt);
        }
    }
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* value = std::get_if<T>(&stored)) {
            return *value;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(settingValue);
    return true;
}

} // namespace ShoalEngine

#endif // SETTINGS_MANAGER_HPP
