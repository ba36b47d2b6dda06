/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace orion::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

fs::path settingsPath(const std::string& projectRoot) {
    return fs::path(projectRoot) / "settings.json";
}

/// Reads settings.json. A missing or unreadable file yields an empty object.
json readSettingsFile(const std::string& projectRoot) {
    if (projectRoot.empty()) return json::object();
    fs::path configPath = settingsPath(projectRoot);
    if (!fs::exists(configPath)) return json::object();

    try {
        std::ifstream f(configPath);
        json j;
        f >> j;
        if (j.is_object()) return j;
        std::cerr << "[ConfigLoader] settings.json is not an object, using defaults" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
    }
    return json::object();
}

void writeSettingsFile(const std::string& projectRoot, const json& j) {
    if (projectRoot.empty()) return;
    fs::path configPath = settingsPath(projectRoot);
    try {
        fs::create_directories(configPath.parent_path());
        std::ofstream f(configPath);
        f << j.dump(4);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing settings.json: " << e.what() << std::endl;
    }
}

} // namespace

json ConfigLoader::GraphSettingsToJson(const domain::GraphSettings& s) {
    const auto& g = s.graph;
    const auto& q = s.search;
    return {
        {"graph", {
            {"topicMergeThreshold", g.topicMergeThreshold},
            {"edgeMinSimilarity", g.edgeMinSimilarity},
            {"candidateCount", g.candidateCount},
            {"classifierCandidateCount", g.classifierCandidateCount},
            {"maxParentsPerNewTopic", g.maxParentsPerNewTopic},
            {"maxChildrenPerNewTopic", g.maxChildrenPerNewTopic},
            {"maxSiblingsPerNewTopic", g.maxSiblingsPerNewTopic},
            {"maxParentsPerNode", g.maxParentsPerNode},
            {"maxChildrenPerNode", g.maxChildrenPerNode},
            {"maxRelatedPerNode", g.maxRelatedPerNode},
            {"clusterResolution", g.clusterResolution},
            {"minClusterSize", g.minClusterSize},
            {"umapMinDist", g.umapMinDist},
            {"umapSpread", g.umapSpread},
            {"umapEpochs", g.umapEpochs},
            {"pcaComponents", g.pcaComponents},
            {"positionHalfRange", g.positionHalfRange}
        }},
        {"search", {
            {"topicResultCount", q.topicResultCount},
            {"itemResultCount", q.itemResultCount},
            {"similarityThreshold", q.similarityThreshold},
            {"maxEdgesInResults", q.maxEdgesInResults}
        }}
    };
}

domain::GraphSettings ConfigLoader::GraphSettingsFromJson(const json& j) {
    domain::GraphSettings s;
    if (j.contains("graph") && j["graph"].is_object()) {
        const json& g = j["graph"];
        auto& t = s.graph;
        t.topicMergeThreshold = g.value("topicMergeThreshold", t.topicMergeThreshold);
        t.edgeMinSimilarity = g.value("edgeMinSimilarity", t.edgeMinSimilarity);
        t.candidateCount = g.value("candidateCount", t.candidateCount);
        t.classifierCandidateCount = g.value("classifierCandidateCount", t.classifierCandidateCount);
        t.maxParentsPerNewTopic = g.value("maxParentsPerNewTopic", t.maxParentsPerNewTopic);
        t.maxChildrenPerNewTopic = g.value("maxChildrenPerNewTopic", t.maxChildrenPerNewTopic);
        t.maxSiblingsPerNewTopic = g.value("maxSiblingsPerNewTopic", t.maxSiblingsPerNewTopic);
        t.maxParentsPerNode = g.value("maxParentsPerNode", t.maxParentsPerNode);
        t.maxChildrenPerNode = g.value("maxChildrenPerNode", t.maxChildrenPerNode);
        t.maxRelatedPerNode = g.value("maxRelatedPerNode", t.maxRelatedPerNode);
        t.clusterResolution = g.value("clusterResolution", t.clusterResolution);
        t.minClusterSize = g.value("minClusterSize", t.minClusterSize);
        t.umapMinDist = g.value("umapMinDist", t.umapMinDist);
        t.umapSpread = g.value("umapSpread", t.umapSpread);
        t.umapEpochs = g.value("umapEpochs", t.umapEpochs);
        t.pcaComponents = g.value("pcaComponents", t.pcaComponents);
        t.positionHalfRange = g.value("positionHalfRange", t.positionHalfRange);
    }
    if (j.contains("search") && j["search"].is_object()) {
        const json& q = j["search"];
        auto& t = s.search;
        t.topicResultCount = q.value("topicResultCount", t.topicResultCount);
        t.itemResultCount = q.value("itemResultCount", t.itemResultCount);
        t.similarityThreshold = q.value("similarityThreshold", t.similarityThreshold);
        t.maxEdgesInResults = q.value("maxEdgesInResults", t.maxEdgesInResults);
    }
    return s;
}

domain::GraphSettings ConfigLoader::LoadGraphSettings(const std::string& projectRoot, const std::string& graphId) {
    json j = readSettingsFile(projectRoot);
    try {
        if (j.contains("graphs") && j["graphs"].contains(graphId)) {
            return GraphSettingsFromJson(j["graphs"][graphId]);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Invalid settings for graph " << graphId << ": " << e.what() << std::endl;
    }
    return domain::GraphSettings{};
}

void ConfigLoader::SaveGraphSettings(const std::string& projectRoot, const std::string& graphId,
                                     const domain::GraphSettings& settings) {
    json j = readSettingsFile(projectRoot);
    if (!j.contains("graphs") || !j["graphs"].is_object()) j["graphs"] = json::object();
    j["graphs"][graphId] = GraphSettingsToJson(settings);
    writeSettingsFile(projectRoot, j);
}

void ConfigLoader::RemoveGraphSettings(const std::string& projectRoot, const std::string& graphId) {
    json j = readSettingsFile(projectRoot);
    if (!j.contains("graphs") || !j["graphs"].is_object() || !j["graphs"].contains(graphId)) return;
    j["graphs"].erase(graphId);
    writeSettingsFile(projectRoot, j);
}

AppSettings ConfigLoader::LoadAppSettings(const std::string& projectRoot) {
    json j = readSettingsFile(projectRoot);
    AppSettings s;
    try {
        s.classifier = j.value("classifier", s.classifier);
        if (j.contains("ollama") && j["ollama"].is_object()) {
            const json& o = j["ollama"];
            s.ollamaHost = o.value("host", s.ollamaHost);
            s.ollamaPort = o.value("port", s.ollamaPort);
            s.ollamaModel = o.value("model", s.ollamaModel);
            s.embeddingModel = o.value("embeddingModel", s.embeddingModel);
        }
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Invalid application settings: " << e.what() << std::endl;
        return AppSettings{};
    }
    return s;
}

} // namespace orion::infrastructure
