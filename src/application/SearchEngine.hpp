/**
 * @file SearchEngine.hpp
 * @brief Exhaustive vector search over topics and items, with neighbour expansion.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/SettingsService.hpp"
#include "domain/GraphModel.hpp"
#include "domain/GraphStore.hpp"

namespace orion::application {

struct TopicSearchResult {
    domain::TopicWithPosition topic;
    float similarity = 0.0f; ///< 0 for context-only neighbours.
};

struct ItemSearchResult {
    domain::Item item;
    float similarity = 0.0f;
};

/**
 * @struct SearchItem
 * @brief An item in a combined result. Items reached only through a matched topic carry no score.
 */
struct SearchItem {
    domain::Item item;
    std::optional<float> similarity;
};

/**
 * @struct SearchOptions
 * @brief Unset values come from the graph's search settings.
 */
struct SearchOptions {
    std::optional<int> topicCount;
    std::optional<int> itemCount;
    std::optional<float> topicThreshold;
    std::optional<float> itemThreshold;
    std::optional<int> maxEdges;
    bool expandNeighbors = true;
};

struct SearchResult {
    std::vector<TopicSearchResult> matchedTopics;
    std::vector<TopicSearchResult> highlightedTopics; ///< Matches plus neighbours of the best one.
    std::vector<domain::TopicEdge> edges;
    std::vector<SearchItem> items;
};

class SearchEngine {
public:
    SearchEngine(std::shared_ptr<domain::GraphStore> store, std::shared_ptr<SettingsService> settings);

    /**
     * @brief Topics at or above the threshold, best first. Topics without a position are skipped.
     * @throws domain::ValidationError if the query is empty or its dimension differs from the stored vectors.
     */
    std::vector<TopicSearchResult> FindSimilarTopics(const std::string& graphId,
                                                     const std::vector<float>& query,
                                                     std::optional<int> topK = std::nullopt,
                                                     std::optional<float> threshold = std::nullopt) const;

    std::vector<ItemSearchResult> FindSimilarItems(const std::string& graphId,
                                                   const std::vector<float>& query,
                                                   std::optional<int> topK = std::nullopt,
                                                   std::optional<float> threshold = std::nullopt) const;

    /** @brief Similar topics, neighbour expansion, relevant edges and the union of matching items. */
    SearchResult Search(const std::string& graphId, const std::vector<float>& query,
                        const SearchOptions& options = {}) const;

    /**
     * @brief Appends the direct neighbours of the first result that are not already present, with similarity 0.
     */
    static std::vector<TopicSearchResult> ExpandWithNeighbors(const std::vector<TopicSearchResult>& results,
                                                              const domain::GraphTables& tables);

    /** @brief Edges whose endpoints are both highlighted, strongest first, at most maxEdges. */
    static std::vector<domain::TopicEdge> FilterRelevantEdges(const std::vector<TopicSearchResult>& highlighted,
                                                              const domain::GraphTables& tables,
                                                              int maxEdges);

private:
    static std::vector<TopicSearchResult> rankTopics(const domain::GraphTables& tables,
                                                     const std::vector<float>& query, int topK, float threshold);
    static std::vector<ItemSearchResult> rankItems(const domain::GraphTables& tables,
                                                   const std::vector<float>& query, int topK, float threshold);

    std::shared_ptr<domain::GraphStore> m_store;
    std::shared_ptr<SettingsService> m_settings;
};

} // namespace orion::application
