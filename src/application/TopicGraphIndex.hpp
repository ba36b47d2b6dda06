/**
 * @file TopicGraphIndex.hpp
 * @brief In-memory adjacency over topic ids used while edges are being built.
 */

#pragma once
#include <map>
#include <string>
#include <vector>
#include "domain/GraphModel.hpp"
#include "domain/GraphTables.hpp"

namespace orion::application {

/**
 * @class TopicGraphIndex
 * @brief Arena of topic nodes plus an index-based edge list.
 *
 * Edges are never erased from the arena, only marked dead, so indices stay
 * stable during a build. Edges loaded from the store are "persisted"; edges
 * added afterwards are "pending" until the ingestion transaction writes them.
 */
class TopicGraphIndex {
public:
    struct EdgeSlot {
        domain::TopicEdge edge;
        std::size_t src = 0;
        std::size_t dst = 0;
        bool alive = true;
        bool isNew = false;
    };

    TopicGraphIndex() = default;

    /** @brief Seeds the index with every topic and edge of a graph. */
    static TopicGraphIndex FromTables(const domain::GraphTables& tables);

    /** @brief Returns the node index of a topic, adding it if unknown. */
    std::size_t addNode(const std::string& topicId);
    bool hasNode(const std::string& topicId) const;

    /** @brief Appends an edge, adding endpoints as needed. Returns its slot index. */
    std::size_t addEdge(const domain::TopicEdge& edge, bool isNew);

    /** @brief Marks an edge dead. */
    void removeEdge(std::size_t slot);

    /** @brief True if `to` can be reached from `from` along alive broader_than edges. */
    bool isReachable(const std::string& from, const std::string& to) const;

    /** @brief True if any alive edge joins the two topics, in either direction. */
    bool areConnected(const std::string& a, const std::string& b) const;

    /** @brief Alive edge slots touching a topic. */
    std::vector<std::size_t> edgesOf(const std::string& topicId) const;

    const EdgeSlot& slot(std::size_t index) const { return m_edges[index]; }
    std::size_t edgeCount() const { return m_edges.size(); }

    /** @brief Edges added after seeding that are still alive. */
    std::vector<domain::TopicEdge> pendingAdditions() const;

    /** @brief Ids of seeded edges that were removed. */
    std::vector<std::string> pendingRemovals() const;

private:
    std::vector<std::string> m_nodes;
    std::map<std::string, std::size_t> m_nodeIndex;
    std::vector<EdgeSlot> m_edges;
    std::vector<std::vector<std::size_t>> m_incidence; ///< node -> edge slots
};

} // namespace orion::application
