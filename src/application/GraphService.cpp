#include "application/GraphService.hpp"
#include "application/PositionProjector.hpp"
#include "domain/GraphErrors.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace orion::application {

GraphService::GraphService(std::shared_ptr<domain::GraphStore> store,
                           std::shared_ptr<SettingsService> settings,
                           std::shared_ptr<AsyncTaskManager> taskManager,
                           IdFactory ids,
                           Clock clock)
    : m_store(std::move(store)),
      m_settings(std::move(settings)),
      m_taskManager(std::move(taskManager)),
      m_ids(std::move(ids)),
      m_clock(std::move(clock)) {}

GraphService::~GraphService() {
    if (m_taskManager) m_taskManager->WaitForIdle();
}

void GraphService::InitializeGraphs() {
    if (m_store->findGraph(domain::kDefaultGraphId)) return;

    domain::Graph graph;
    graph.id = domain::kDefaultGraphId;
    graph.name = "Orion";
    graph.createdAt = m_clock();
    graph.isDefault = true;
    m_store->createGraph(graph);
    std::cout << "[GraphService] Created default graph" << std::endl;
}

std::string GraphService::CreateGraph(const std::string& name) {
    if (name.empty()) throw domain::ValidationError::required("name");

    domain::Graph graph;
    graph.id = m_ids();
    graph.name = name;
    graph.createdAt = m_clock();
    graph.isDefault = false;
    m_store->createGraph(graph);
    std::cout << "[GraphService] Created graph: " << graph.id << " (" << name << ")" << std::endl;
    return graph.id;
}

std::vector<domain::Graph> GraphService::ListGraphs() const {
    return m_store->listGraphs();
}

void GraphService::ResetGraph(const std::string& graphId) {
    m_store->transact(graphId, [](domain::GraphTables& tables) { tables.clear(); });
    invalidateClusters(graphId);
    std::cout << "[GraphService] Reset graph: " << graphId << std::endl;
}

void GraphService::DeleteGraph(const std::string& graphId) {
    if (graphId == domain::kDefaultGraphId) {
        throw domain::GraphError::invalidOperation("cannot delete the default graph");
    }
    m_store->dropGraph(graphId);
    m_settings->RemoveSettings(graphId);
    invalidateClusters(graphId);
    std::cout << "[GraphService] Deleted graph: " << graphId << std::endl;
}

void GraphService::DeleteTopic(const std::string& graphId, const std::string& topicId) {
    DeleteTopics(graphId, {topicId});
}

void GraphService::DeleteTopics(const std::string& graphId, const std::vector<std::string>& topicIds) {
    if (topicIds.empty()) return;
    m_store->transact(graphId, [&](domain::GraphTables& tables) {
        for (const auto& id : topicIds) tables.removeTopic(id);
    });
    invalidateClusters(graphId);
    ScheduleRecompute(graphId);
}

void GraphService::DeleteItem(const std::string& graphId, const std::string& itemId) {
    DeleteItems(graphId, {itemId});
}

void GraphService::DeleteItems(const std::string& graphId, const std::vector<std::string>& itemIds) {
    if (itemIds.empty()) return;
    m_store->transact(graphId, [&](domain::GraphTables& tables) {
        for (const auto& id : itemIds) tables.removeItem(id);
    });
}

GraphData GraphService::GetGraphData(const std::string& graphId) const {
    auto tables = m_store->snapshot(graphId);
    GraphData data;
    for (const auto& [id, topic] : tables.topics()) {
        data.topics.push_back(domain::ToTopicWithPosition(topic));
    }
    for (const auto& [id, item] : tables.items()) {
        data.items.push_back(item);
    }
    for (const auto& [id, edge] : tables.edges()) {
        data.edges.push_back(edge);
    }
    for (const auto& [itemId, topicId] : tables.itemTopics()) {
        data.itemsByTopic[topicId].push_back(itemId);
    }
    return data;
}

std::vector<domain::Item> GraphService::GetItemsForTopic(const std::string& graphId, const std::string& topicId) const {
    auto tables = m_store->snapshot(graphId);
    std::vector<domain::Item> items;
    for (const auto& itemId : tables.itemsForTopic(topicId)) {
        if (const auto* item = tables.findItem(itemId)) items.push_back(*item);
    }
    std::stable_sort(items.begin(), items.end(), [](const auto& a, const auto& b) {
        return a.createdAt > b.createdAt;
    });
    return items;
}

std::vector<domain::Item> GraphService::GetItemsForTopics(const std::string& graphId,
                                                          const std::vector<std::string>& topicIds) const {
    auto tables = m_store->snapshot(graphId);
    std::set<std::string> seen;
    std::vector<domain::Item> items;
    for (const auto& topicId : topicIds) {
        for (const auto& itemId : tables.itemsForTopic(topicId)) {
            if (!seen.insert(itemId).second) continue;
            if (const auto* item = tables.findItem(itemId)) items.push_back(*item);
        }
    }
    return items;
}

void GraphService::RecomputeTopicPositions(const std::string& graphId) {
    // One projection at a time, so a run never commits over a layout built from a newer snapshot.
    std::lock_guard<std::mutex> projectionLock(m_projectionMutex);
    auto tables = m_store->snapshot(graphId);
    if (tables.topics().empty()) return;

    std::vector<std::string> topicIds;
    std::vector<std::vector<float>> embeddings;
    for (const auto& [id, topic] : tables.topics()) {
        auto vec = tables.loadVector(domain::OwnerType::Topic, id);
        if (!vec) continue;
        topicIds.push_back(id);
        embeddings.push_back(std::move(*vec));
    }

    PositionProjector projector(m_settings->GetSettings(graphId).graph);
    auto positions = projector.computePositions(embeddings);

    // Topics deleted while the projection ran are skipped.
    m_store->transact(graphId, [&](domain::GraphTables& current) {
        for (std::size_t i = 0; i < topicIds.size(); ++i) {
            if (!current.findTopic(topicIds[i])) continue;
            current.setTopicPosition(topicIds[i], {positions[i][0], positions[i][1], positions[i][2]});
        }
    });
    std::cout << "[GraphService] Recomputed " << topicIds.size() << " topic positions for " << graphId << std::endl;
}

bool GraphService::ShouldRecomputePositions(const std::string& graphId) const {
    auto tables = m_store->snapshot(graphId);
    for (const auto& [id, topic] : tables.topics()) {
        if (!topic.position) return true;
    }
    return false;
}

void GraphService::ScheduleRecompute(const std::string& graphId) {
    if (!m_taskManager) {
        RecomputeTopicPositions(graphId);
        GetClustersWithEdges(graphId);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_recomputeMutex);
        RecomputeState& state = m_recomputes[graphId];
        if (state.running) {
            state.dirty = true;
            return;
        }
        state.running = true;
        state.dirty = false;
    }
    m_taskManager->SubmitTask(TaskType::Projection, "Recompute positions of " + graphId,
        [this, graphId](std::shared_ptr<TaskStatus> status) {
            runRecompute(graphId, *status);
        });
}

void GraphService::runRecompute(const std::string& graphId, TaskStatus& status) {
    while (true) {
        try {
            RecomputeTopicPositions(graphId);
            status.progress = 0.8f;
            GetClustersWithEdges(graphId);
        } catch (const std::exception&) {
            std::lock_guard<std::mutex> lock(m_recomputeMutex);
            m_recomputes.erase(graphId);
            throw;
        }

        // Requests that arrived during the run are served by one more pass.
        std::lock_guard<std::mutex> lock(m_recomputeMutex);
        RecomputeState& state = m_recomputes[graphId];
        if (!state.dirty) {
            state.running = false;
            return;
        }
        state.dirty = false;
        status.progress = 0.0f;
    }
}

std::vector<ClusterInfo> GraphService::GetClusters(const std::string& graphId) const {
    auto tuning = m_settings->GetSettings(graphId).graph;
    ClusterEngine engine(tuning.clusterResolution, tuning.minClusterSize);
    return engine.identifyClusters(m_store->snapshot(graphId));
}

std::vector<ClusterWithEdges> GraphService::GetClustersWithEdges(const std::string& graphId) {
    auto tuning = m_settings->GetSettings(graphId).graph;
    auto tables = m_store->snapshot(graphId);
    ClusterEngine engine(tuning.clusterResolution, tuning.minClusterSize);

    std::vector<domain::TopicEdge> edges;
    for (const auto& [id, edge] : tables.edges()) edges.push_back(edge);
    auto clusters = ClusterEngine::computeClustersWithEdges(engine.identifyClusters(tables), edges);

    std::lock_guard<std::mutex> lock(m_cacheMutex);
    m_clusterCache[graphId] = clusters;
    return clusters;
}

std::optional<std::vector<ClusterWithEdges>> GraphService::GetCachedClusters(const std::string& graphId) const {
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    auto it = m_clusterCache.find(graphId);
    if (it == m_clusterCache.end()) return std::nullopt;
    return it->second;
}

void GraphService::invalidateClusters(const std::string& graphId) {
    std::lock_guard<std::mutex> lock(m_cacheMutex);
    m_clusterCache.erase(graphId);
}

} // namespace orion::application
