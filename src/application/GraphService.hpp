/**
 * @file GraphService.hpp
 * @brief Service to manage graph lifecycle, deletions, projection and clusters.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "application/AsyncTaskManager.hpp"
#include "application/ClusterEngine.hpp"
#include "application/IdGenerator.hpp"
#include "application/SettingsService.hpp"
#include "domain/GraphModel.hpp"
#include "domain/GraphStore.hpp"

namespace orion::application {

/**
 * @struct GraphData
 * @brief Everything the visualization needs for one graph.
 */
struct GraphData {
    std::vector<domain::TopicWithPosition> topics;
    std::vector<domain::Item> items;
    std::vector<domain::TopicEdge> edges;
    std::map<std::string, std::vector<std::string>> itemsByTopic; ///< topic id -> item ids
};

class GraphService {
public:
    GraphService(std::shared_ptr<domain::GraphStore> store,
                 std::shared_ptr<SettingsService> settings,
                 std::shared_ptr<AsyncTaskManager> taskManager,
                 IdFactory ids = DefaultIdFactory(),
                 Clock clock = DefaultClock());

    /** @brief Waits for scheduled recomputes, which reference this service. */
    ~GraphService();

    /** @brief Ensures the default graph exists. */
    void InitializeGraphs();

    /** @brief Creates an empty graph and returns its id. */
    std::string CreateGraph(const std::string& name);

    /** @brief All graphs, oldest first. */
    std::vector<domain::Graph> ListGraphs() const;

    /** @brief Removes every row of a graph but keeps the graph. */
    void ResetGraph(const std::string& graphId);

    /**
     * @brief Removes a graph with all its rows and settings.
     * @throws domain::GraphError for the default graph.
     */
    void DeleteGraph(const std::string& graphId);

    /** @brief Deletes topics with their links, edges and vectors, then schedules a recompute. */
    void DeleteTopic(const std::string& graphId, const std::string& topicId);
    void DeleteTopics(const std::string& graphId, const std::vector<std::string>& topicIds);

    /** @brief Deletes items with their links and vectors, decrementing topic uses. */
    void DeleteItem(const std::string& graphId, const std::string& itemId);
    void DeleteItems(const std::string& graphId, const std::vector<std::string>& itemIds);

    GraphData GetGraphData(const std::string& graphId) const;

    /** @brief Items linked to a topic, newest first. */
    std::vector<domain::Item> GetItemsForTopic(const std::string& graphId, const std::string& topicId) const;

    /** @brief Distinct items linked to any of the topics. */
    std::vector<domain::Item> GetItemsForTopics(const std::string& graphId, const std::vector<std::string>& topicIds) const;

    /** @brief Recomputes every topic position synchronously. */
    void RecomputeTopicPositions(const std::string& graphId);

    /** @brief True if some topic has never been projected. */
    bool ShouldRecomputePositions(const std::string& graphId) const;

    /**
     * @brief Recomputes positions, then clusters, in the background.
     *
     * Requests for a graph whose recompute is already running are coalesced
     * into a single follow-up pass.
     */
    void ScheduleRecompute(const std::string& graphId);

    std::vector<ClusterInfo> GetClusters(const std::string& graphId) const;

    /** @brief Computes clusters with their edges and caches the result. */
    std::vector<ClusterWithEdges> GetClustersWithEdges(const std::string& graphId);

    /** @brief Clusters stored by the last background refresh, if any. */
    std::optional<std::vector<ClusterWithEdges>> GetCachedClusters(const std::string& graphId) const;

private:
    struct RecomputeState {
        bool running = false;
        bool dirty = false;
    };

    void invalidateClusters(const std::string& graphId);
    void runRecompute(const std::string& graphId, TaskStatus& status);

    std::shared_ptr<domain::GraphStore> m_store;
    std::shared_ptr<SettingsService> m_settings;
    std::shared_ptr<AsyncTaskManager> m_taskManager;
    IdFactory m_ids;
    Clock m_clock;

    mutable std::mutex m_cacheMutex;
    std::map<std::string, std::vector<ClusterWithEdges>> m_clusterCache;

    std::mutex m_projectionMutex;
    std::mutex m_recomputeMutex;
    std::map<std::string, RecomputeState> m_recomputes;
};

} // namespace orion::application
