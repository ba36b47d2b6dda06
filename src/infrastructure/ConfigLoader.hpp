/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving configuration (settings.json).
 *
 * Per-graph tuning lives under "graphs.<graphId>", application-wide options
 * (classifier backend, Ollama endpoint) at the top level. Missing keys fall
 * back to defaults.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/GraphSettings.hpp"

namespace orion::infrastructure {

/**
 * @struct AppSettings
 * @brief Options shared by every graph.
 */
struct AppSettings {
    std::string classifier = "ollama";       ///< "ollama" or "similarity"
    std::string ollamaHost = "localhost";
    int ollamaPort = 11434;
    std::string ollamaModel = "llama3.2";
    std::string embeddingModel = "nomic-embed-text";
};

class ConfigLoader {
public:
    /**
     * @brief Reads the settings of one graph.
     * @param projectRoot Directory holding settings.json. Empty means defaults.
     */
    static domain::GraphSettings LoadGraphSettings(const std::string& projectRoot, const std::string& graphId);

    /** @brief Writes the settings of one graph, preserving other keys. */
    static void SaveGraphSettings(const std::string& projectRoot, const std::string& graphId,
                                  const domain::GraphSettings& settings);

    /** @brief Drops the section of a graph. */
    static void RemoveGraphSettings(const std::string& projectRoot, const std::string& graphId);

    /** @brief {"graph": {...}, "search": {...}} with every field. */
    static nlohmann::json GraphSettingsToJson(const domain::GraphSettings& settings);

    /** @brief Reads a possibly partial settings object; absent keys keep their defaults. */
    static domain::GraphSettings GraphSettingsFromJson(const nlohmann::json& j);

    static AppSettings LoadAppSettings(const std::string& projectRoot);
};

} // namespace orion::infrastructure
