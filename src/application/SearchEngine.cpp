/**
 * @file SearchEngine.cpp
 * @brief Implementation of SearchEngine.
 */

#include "application/SearchEngine.hpp"
#include "application/VectorMath.hpp"
#include "domain/GraphErrors.hpp"
#include <algorithm>
#include <set>

namespace orion::application {

namespace {

void checkQuery(const std::vector<float>& query, const std::vector<float>& stored) {
    if (query.size() != stored.size()) {
        throw domain::ValidationError::invalid(
            "query", "dimension " + std::to_string(query.size()) + " does not match stored dimension " +
                     std::to_string(stored.size()));
    }
}

} // namespace

SearchEngine::SearchEngine(std::shared_ptr<domain::GraphStore> store, std::shared_ptr<SettingsService> settings)
    : m_store(std::move(store)), m_settings(std::move(settings)) {}

std::vector<TopicSearchResult> SearchEngine::rankTopics(const domain::GraphTables& tables,
                                                        const std::vector<float>& query, int topK, float threshold) {
    std::vector<TopicSearchResult> results;
    for (const auto& [id, topic] : tables.topics()) {
        if (!topic.position) continue;
        auto embedding = tables.loadVector(domain::OwnerType::Topic, id);
        if (!embedding) continue;
        checkQuery(query, *embedding);

        float similarity = vectormath::cosineSimilarity(query, *embedding);
        if (similarity >= threshold) {
            results.push_back({domain::ToTopicWithPosition(topic), similarity});
        }
    }

    std::stable_sort(results.begin(), results.end(), [](const auto& a, const auto& b) {
        return a.similarity > b.similarity;
    });
    if (results.size() > static_cast<std::size_t>(std::max(0, topK))) results.resize(static_cast<std::size_t>(std::max(0, topK)));
    return results;
}

std::vector<ItemSearchResult> SearchEngine::rankItems(const domain::GraphTables& tables,
                                                      const std::vector<float>& query, int topK, float threshold) {
    std::vector<ItemSearchResult> results;
    for (const auto& [id, item] : tables.items()) {
        auto embedding = tables.loadVector(domain::OwnerType::Item, id);
        if (!embedding) continue;
        checkQuery(query, *embedding);

        float similarity = vectormath::cosineSimilarity(query, *embedding);
        if (similarity >= threshold) {
            results.push_back({item, similarity});
        }
    }

    std::stable_sort(results.begin(), results.end(), [](const auto& a, const auto& b) {
        return a.similarity > b.similarity;
    });
    if (results.size() > static_cast<std::size_t>(std::max(0, topK))) results.resize(static_cast<std::size_t>(std::max(0, topK)));
    return results;
}

std::vector<TopicSearchResult> SearchEngine::FindSimilarTopics(const std::string& graphId,
                                                               const std::vector<float>& query,
                                                               std::optional<int> topK,
                                                               std::optional<float> threshold) const {
    if (query.empty()) throw domain::ValidationError::required("query");
    auto settings = m_settings->GetSettings(graphId).search;
    auto tables = m_store->snapshot(graphId);
    return rankTopics(tables, query, topK.value_or(settings.topicResultCount),
                      threshold.value_or(settings.similarityThreshold));
}

std::vector<ItemSearchResult> SearchEngine::FindSimilarItems(const std::string& graphId,
                                                             const std::vector<float>& query,
                                                             std::optional<int> topK,
                                                             std::optional<float> threshold) const {
    if (query.empty()) throw domain::ValidationError::required("query");
    auto settings = m_settings->GetSettings(graphId).search;
    auto tables = m_store->snapshot(graphId);
    return rankItems(tables, query, topK.value_or(settings.itemResultCount),
                     threshold.value_or(settings.similarityThreshold));
}

std::vector<TopicSearchResult> SearchEngine::ExpandWithNeighbors(const std::vector<TopicSearchResult>& results,
                                                                 const domain::GraphTables& tables) {
    if (results.empty()) return {};

    std::vector<TopicSearchResult> expanded = results;
    const std::string& best = results.front().topic.id;

    std::set<std::string> present;
    for (const auto& r : results) present.insert(r.topic.id);

    for (const auto& edge : tables.edgesTouching(best)) {
        const std::string& neighbour = edge.src == best ? edge.dst : edge.src;
        if (present.count(neighbour)) continue;
        const domain::Topic* topic = tables.findTopic(neighbour);
        if (!topic) continue;
        expanded.push_back({domain::ToTopicWithPosition(*topic), 0.0f});
        present.insert(neighbour);
    }
    return expanded;
}

std::vector<domain::TopicEdge> SearchEngine::FilterRelevantEdges(const std::vector<TopicSearchResult>& highlighted,
                                                                 const domain::GraphTables& tables,
                                                                 int maxEdges) {
    std::set<std::string> ids;
    for (const auto& r : highlighted) ids.insert(r.topic.id);

    std::vector<domain::TopicEdge> edges;
    for (const auto& [id, edge] : tables.edges()) {
        if (ids.count(edge.src) && ids.count(edge.dst)) edges.push_back(edge);
    }
    std::stable_sort(edges.begin(), edges.end(), [](const auto& a, const auto& b) {
        return a.similarity > b.similarity;
    });
    if (edges.size() > static_cast<std::size_t>(std::max(0, maxEdges))) edges.resize(static_cast<std::size_t>(std::max(0, maxEdges)));
    return edges;
}

SearchResult SearchEngine::Search(const std::string& graphId, const std::vector<float>& query,
                                  const SearchOptions& options) const {
    if (query.empty()) throw domain::ValidationError::required("query");
    auto settings = m_settings->GetSettings(graphId).search;
    auto tables = m_store->snapshot(graphId);

    SearchResult result;
    result.matchedTopics = rankTopics(tables, query,
                                      options.topicCount.value_or(settings.topicResultCount),
                                      options.topicThreshold.value_or(settings.similarityThreshold));
    auto items = rankItems(tables, query,
                           options.itemCount.value_or(settings.itemResultCount),
                           options.itemThreshold.value_or(settings.similarityThreshold));

    result.highlightedTopics = options.expandNeighbors ? ExpandWithNeighbors(result.matchedTopics, tables)
                                                       : result.matchedTopics;
    if (!result.highlightedTopics.empty()) {
        result.edges = FilterRelevantEdges(result.highlightedTopics, tables,
                                           options.maxEdges.value_or(settings.maxEdgesInResults));
    }

    std::set<std::string> seen;
    for (const auto& r : items) {
        result.items.push_back({r.item, r.similarity});
        seen.insert(r.item.id);
    }
    for (const auto& topic : result.matchedTopics) {
        for (const auto& itemId : tables.itemsForTopic(topic.topic.id)) {
            if (!seen.insert(itemId).second) continue;
            if (const domain::Item* item = tables.findItem(itemId)) {
                result.items.push_back({*item, std::nullopt});
            }
        }
    }
    return result;
}

} // namespace orion::application
