/**
 * @file TopicGraphIndex.cpp
 * @brief Implementation of TopicGraphIndex.
 */

#include "application/TopicGraphIndex.hpp"
#include <deque>

namespace orion::application {

TopicGraphIndex TopicGraphIndex::FromTables(const domain::GraphTables& tables) {
    TopicGraphIndex index;
    for (const auto& [id, topic] : tables.topics()) {
        index.addNode(id);
    }
    for (const auto& [id, edge] : tables.edges()) {
        index.addEdge(edge, false);
    }
    return index;
}

std::size_t TopicGraphIndex::addNode(const std::string& topicId) {
    auto it = m_nodeIndex.find(topicId);
    if (it != m_nodeIndex.end()) return it->second;

    std::size_t index = m_nodes.size();
    m_nodes.push_back(topicId);
    m_incidence.emplace_back();
    m_nodeIndex.emplace(topicId, index);
    return index;
}

bool TopicGraphIndex::hasNode(const std::string& topicId) const {
    return m_nodeIndex.count(topicId) > 0;
}

std::size_t TopicGraphIndex::addEdge(const domain::TopicEdge& edge, bool isNew) {
    EdgeSlot slot;
    slot.edge = edge;
    slot.src = addNode(edge.src);
    slot.dst = addNode(edge.dst);
    slot.isNew = isNew;

    std::size_t index = m_edges.size();
    m_edges.push_back(slot);
    m_incidence[slot.src].push_back(index);
    m_incidence[slot.dst].push_back(index);
    return index;
}

void TopicGraphIndex::removeEdge(std::size_t slot) {
    m_edges.at(slot).alive = false;
}

bool TopicGraphIndex::isReachable(const std::string& from, const std::string& to) const {
    auto start = m_nodeIndex.find(from);
    auto target = m_nodeIndex.find(to);
    if (start == m_nodeIndex.end() || target == m_nodeIndex.end()) return false;
    if (start->second == target->second) return true;

    std::vector<bool> visited(m_nodes.size(), false);
    std::deque<std::size_t> queue;
    visited[start->second] = true;
    queue.push_back(start->second);

    while (!queue.empty()) {
        std::size_t node = queue.front();
        queue.pop_front();
        for (std::size_t e : m_incidence[node]) {
            const EdgeSlot& slot = m_edges[e];
            if (!slot.alive || slot.edge.type != domain::EdgeType::BroaderThan || slot.src != node) continue;
            if (slot.dst == target->second) return true;
            if (!visited[slot.dst]) {
                visited[slot.dst] = true;
                queue.push_back(slot.dst);
            }
        }
    }
    return false;
}

bool TopicGraphIndex::areConnected(const std::string& a, const std::string& b) const {
    auto ia = m_nodeIndex.find(a);
    auto ib = m_nodeIndex.find(b);
    if (ia == m_nodeIndex.end() || ib == m_nodeIndex.end()) return false;

    for (std::size_t e : m_incidence[ia->second]) {
        const EdgeSlot& slot = m_edges[e];
        if (!slot.alive) continue;
        if ((slot.src == ia->second && slot.dst == ib->second) ||
            (slot.src == ib->second && slot.dst == ia->second)) {
            return true;
        }
    }
    return false;
}

std::vector<std::size_t> TopicGraphIndex::edgesOf(const std::string& topicId) const {
    std::vector<std::size_t> slots;
    auto it = m_nodeIndex.find(topicId);
    if (it == m_nodeIndex.end()) return slots;
    for (std::size_t e : m_incidence[it->second]) {
        if (m_edges[e].alive) slots.push_back(e);
    }
    return slots;
}

std::vector<domain::TopicEdge> TopicGraphIndex::pendingAdditions() const {
    std::vector<domain::TopicEdge> added;
    for (const auto& slot : m_edges) {
        if (slot.alive && slot.isNew) added.push_back(slot.edge);
    }
    return added;
}

std::vector<std::string> TopicGraphIndex::pendingRemovals() const {
    std::vector<std::string> removed;
    for (const auto& slot : m_edges) {
        if (!slot.alive && !slot.isNew) removed.push_back(slot.edge.id);
    }
    return removed;
}

} // namespace orion::application
