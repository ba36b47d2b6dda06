/**
 * @file SettingsService.cpp
 * @brief Implementation of SettingsService.
 */

#include "application/SettingsService.hpp"
#include <iostream>

namespace orion::application {

SettingsService::SettingsService(std::string projectRoot) : m_projectRoot(std::move(projectRoot)) {}

domain::GraphSettings SettingsService::GetSettings(const std::string& graphId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cache.find(graphId);
    if (it != m_cache.end()) return it->second;

    auto settings = infrastructure::ConfigLoader::LoadGraphSettings(m_projectRoot, graphId);
    m_cache[graphId] = settings;
    return settings;
}

domain::SettingsChangeType SettingsService::SaveSettings(const std::string& graphId,
                                                         const domain::GraphSettings& settings) {
    domain::GraphSettings previous = GetSettings(graphId);
    ChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cache[graphId] = settings;
        infrastructure::ConfigLoader::SaveGraphSettings(m_projectRoot, graphId, settings);
        listener = m_listener;
    }

    auto change = domain::DetectChanges(previous, settings);
    if (change != domain::SettingsChangeType::None) {
        std::cout << "[SettingsService] Settings of graph " << graphId << " changed" << std::endl;
        if (listener) listener(graphId, change);
    }
    return change;
}

domain::SettingsChangeType SettingsService::ResetSettings(const std::string& graphId) {
    return SaveSettings(graphId, domain::GraphSettings{});
}

void SettingsService::RemoveSettings(const std::string& graphId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.erase(graphId);
    infrastructure::ConfigLoader::RemoveGraphSettings(m_projectRoot, graphId);
}

infrastructure::AppSettings SettingsService::GetAppSettings() {
    return infrastructure::ConfigLoader::LoadAppSettings(m_projectRoot);
}

void SettingsService::SetChangeListener(ChangeListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

} // namespace orion::application
