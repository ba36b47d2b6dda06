/**
 * @file GraphTables.hpp
 * @brief The five collections of one graph, with their uniqueness and cascade rules.
 */

#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include "domain/GraphModel.hpp"

namespace orion::domain {

/**
 * @class GraphTables
 * @brief Rows of a single graph: topics, items, item-topic links, edges and vectors.
 *
 * Mutators enforce the store constraints and throw StorageError or ValidationError
 * on violation. Instances are plain values; GraphStore copies them to provide
 * snapshots and transactional work areas.
 */
class GraphTables {
public:
    using LinkKey = std::pair<std::string, std::string>; ///< (itemId, topicId)

    explicit GraphTables(std::string graphId = "") : m_graphId(std::move(graphId)) {}

    const std::string& graphId() const { return m_graphId; }

    // Topics
    const std::map<std::string, Topic>& topics() const { return m_topics; }
    const Topic* findTopic(const std::string& topicId) const;
    const Topic* findTopicByLabel(const std::string& label) const;
    void addTopic(const Topic& topic);
    /** @brief Adds delta to uses, never going below zero. */
    void adjustTopicUses(const std::string& topicId, int delta);
    void setTopicPosition(const std::string& topicId, const Position3& position);
    /** @brief Deletes a topic with its links, incident edges and vector. */
    void removeTopic(const std::string& topicId);

    // Items
    const std::map<std::string, Item>& items() const { return m_items; }
    const Item* findItem(const std::string& itemId) const;
    const Item* findItemByLink(const std::string& link) const;
    void addItem(const Item& item);
    /** @brief Deletes an item with its links and vector; decrements uses of its topics. */
    void removeItem(const std::string& itemId);

    // Item-topic links
    const std::set<LinkKey>& itemTopics() const { return m_itemTopics; }
    /** @brief Links an item to a topic. Returns false if the pair already existed. */
    bool linkItemTopic(const std::string& itemId, const std::string& topicId);
    std::vector<std::string> topicsForItem(const std::string& itemId) const;
    std::vector<std::string> itemsForTopic(const std::string& topicId) const;

    // Edges
    const std::map<std::string, TopicEdge>& edges() const { return m_edges; }
    const TopicEdge* findEdge(const std::string& src, const std::string& dst, EdgeType type) const;
    void addEdge(const TopicEdge& edge);
    bool removeEdge(const std::string& edgeId);
    std::vector<TopicEdge> edgesTouching(const std::string& topicId) const;

    // Vectors
    const std::map<std::pair<OwnerType, std::string>, VectorRow>& vectors() const { return m_vectors; }
    /** @brief Stores or replaces the vector of an owner. */
    void putVector(const VectorRow& row);
    std::optional<std::vector<float>> loadVector(OwnerType ownerType, const std::string& ownerId) const;
    bool removeVector(OwnerType ownerType, const std::string& ownerId);

    void clear();

private:
    using EdgeKey = std::tuple<std::string, std::string, EdgeType>;

    std::string m_graphId;
    std::map<std::string, Topic> m_topics;
    std::map<std::string, std::string> m_topicByLabel;
    std::map<std::string, Item> m_items;
    std::map<std::string, std::string> m_itemByLink;
    std::set<LinkKey> m_itemTopics;
    std::map<std::string, TopicEdge> m_edges;
    std::map<EdgeKey, std::string> m_edgeByKey;
    std::map<std::pair<OwnerType, std::string>, VectorRow> m_vectors;
};

} // namespace orion::domain
