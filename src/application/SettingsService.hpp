/**
 * @file SettingsService.hpp
 * @brief Cached access to per-graph settings with change notification.
 */

#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include "domain/GraphSettings.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace orion::application {

class SettingsService {
public:
    using ChangeListener = std::function<void(const std::string& graphId, domain::SettingsChangeType change)>;

    /** @param projectRoot Directory of settings.json; empty keeps settings in memory only. */
    explicit SettingsService(std::string projectRoot = "");

    domain::GraphSettings GetSettings(const std::string& graphId);

    /**
     * @brief Stores new settings and reports what they invalidate.
     *
     * The listener is invoked after the new values are visible.
     */
    domain::SettingsChangeType SaveSettings(const std::string& graphId, const domain::GraphSettings& settings);

    /** @brief Restores the defaults of one graph. */
    domain::SettingsChangeType ResetSettings(const std::string& graphId);

    /** @brief Forgets a deleted graph. */
    void RemoveSettings(const std::string& graphId);

    infrastructure::AppSettings GetAppSettings();

    void SetChangeListener(ChangeListener listener);

private:
    std::string m_projectRoot;
    std::mutex m_mutex;
    std::map<std::string, domain::GraphSettings> m_cache;
    ChangeListener m_listener;
};

} // namespace orion::application
