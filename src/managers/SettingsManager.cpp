/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <cmath>
#include <fstream>
#include <limits>

namespace ShoalEngine {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return mergeDocument(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromString(std::string_view json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings: " + reader.getLastError());
        return false;
    }
    return mergeDocument(reader.getRoot(), "<string>");
}

bool SettingsManager::mergeDocument(const JsonValue& root, const std::string& source) {
    const JsonObject* rootObj = root.tryAsObject();
    if (!rootObj) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + source);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    for (const auto& [categoryName, categoryValue] : *rootObj) {
        const JsonObject* categoryObj = categoryValue.tryAsObject();
        if (!categoryObj) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *categoryObj) {
            SettingValue settingValue;

            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                const double numValue = value.asNumber();
                // Whole numbers in int range are stored as int
                if (std::trunc(numValue) == numValue &&
                    std::abs(numValue) <= std::numeric_limits<int>::max()) {
                    settingValue = static_cast<int>(numValue);
                } else {
                    settingValue = static_cast<float>(numValue);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }

            m_settings[categoryName][key] = std::move(settingValue);
        }
    }

    SETTINGS_INFO("Loaded settings from " + source);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonValue root(JsonObject{});
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [categoryName, categorySettings] : m_settings) {
            JsonValue& category = root[categoryName];
            category = JsonValue(JsonObject{});
            for (const auto& [key, value] : categorySettings) {
                category[key] = std::visit([](const auto& arg) { return JsonValue(arg); }, value);
            }
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }
    file << root.toString(2) << '\n';
    if (!file) {
        SETTINGS_ERROR("Failed to write settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    return categoryIt != m_settings.end() && categoryIt->second.count(key) > 0;
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
        return false;
    }

    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    return m_settings.erase(category) > 0;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    return keys;
}

} // namespace ShoalEngine
