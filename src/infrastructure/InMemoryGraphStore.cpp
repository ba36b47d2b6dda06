/**
 * @file InMemoryGraphStore.cpp
 * @brief Implementation of InMemoryGraphStore.
 */

#include "infrastructure/InMemoryGraphStore.hpp"
#include "domain/GraphErrors.hpp"
#include <algorithm>

namespace orion::infrastructure {

std::vector<domain::Graph> InMemoryGraphStore::sortedGraphs(const std::map<std::string, GraphState>& states) const {
    std::vector<domain::Graph> graphs;
    graphs.reserve(states.size());
    for (const auto& [id, state] : states) graphs.push_back(state.graph);
    std::stable_sort(graphs.begin(), graphs.end(), [](const domain::Graph& a, const domain::Graph& b) {
        return a.createdAt < b.createdAt;
    });
    return graphs;
}

std::vector<domain::Graph> InMemoryGraphStore::listGraphs() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return sortedGraphs(m_states);
}

std::optional<domain::Graph> InMemoryGraphStore::findGraph(const std::string& graphId) const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    auto it = m_states.find(graphId);
    if (it == m_states.end()) return std::nullopt;
    return it->second.graph;
}

void InMemoryGraphStore::createGraph(const domain::Graph& graph) {
    if (graph.id.empty()) throw domain::ValidationError::required("graph.id");

    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    std::map<std::string, GraphState> next;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_states.count(graph.id)) throw domain::StorageError::duplicate("Graph", graph.id);
        next = m_states;
    }

    GraphState state{graph, domain::GraphTables(graph.id)};
    persistTables(graph, state.tables);
    next.emplace(graph.id, state);
    persistRegistry(sortedGraphs(next));

    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_states.emplace(graph.id, std::move(state));
}

void InMemoryGraphStore::dropGraph(const std::string& graphId) {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    std::vector<domain::Graph> remaining;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (!m_states.count(graphId)) throw domain::StorageError::notFound("Graph", graphId);
        for (const auto& graph : sortedGraphs(m_states)) {
            if (graph.id != graphId) remaining.push_back(graph);
        }
    }

    persistRegistry(remaining);
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_states.erase(graphId);
    }
    discardTables(graphId);
}

domain::GraphTables InMemoryGraphStore::snapshot(const std::string& graphId) const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    auto it = m_states.find(graphId);
    if (it == m_states.end()) throw domain::StorageError::notFound("Graph", graphId);
    return it->second.tables;
}

void InMemoryGraphStore::transact(const std::string& graphId, const std::function<void(domain::GraphTables&)>& work) {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);

    domain::Graph graph;
    domain::GraphTables working;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        auto it = m_states.find(graphId);
        if (it == m_states.end()) throw domain::StorageError::notFound("Graph", graphId);
        graph = it->second.graph;
        working = it->second.tables;
    }

    // Any exception from here on leaves the published tables untouched.
    work(working);
    persistTables(graph, working);

    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_states[graphId].tables = std::move(working);
}

void InMemoryGraphStore::persistTables(const domain::Graph& graph, const domain::GraphTables& tables) {
    (void)graph;
    (void)tables;
}

void InMemoryGraphStore::persistRegistry(const std::vector<domain::Graph>& graphs) {
    (void)graphs;
}

void InMemoryGraphStore::discardTables(const std::string& graphId) {
    (void)graphId;
}

void InMemoryGraphStore::restore(std::map<std::string, GraphState> states) {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_states = std::move(states);
}

} // namespace orion::infrastructure
