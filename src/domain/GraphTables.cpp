/**
 * @file GraphTables.cpp
 * @brief Implementation of GraphTables.
 */

#include "domain/GraphTables.hpp"
#include "domain/GraphErrors.hpp"
#include "domain/VectorCodec.hpp"
#include <algorithm>

namespace orion::domain {

const Topic* GraphTables::findTopic(const std::string& topicId) const {
    auto it = m_topics.find(topicId);
    return it != m_topics.end() ? &it->second : nullptr;
}

const Topic* GraphTables::findTopicByLabel(const std::string& label) const {
    auto it = m_topicByLabel.find(label);
    return it != m_topicByLabel.end() ? findTopic(it->second) : nullptr;
}

void GraphTables::addTopic(const Topic& topic) {
    if (topic.id.empty()) throw ValidationError::required("topic.id");
    if (m_topics.count(topic.id)) throw StorageError::duplicate("Topic", topic.id);
    if (m_topicByLabel.count(topic.label)) throw StorageError::duplicate("Topic label", topic.label);

    Topic row = topic;
    row.graphId = m_graphId;
    m_topics.emplace(row.id, row);
    m_topicByLabel.emplace(row.label, row.id);
}

void GraphTables::adjustTopicUses(const std::string& topicId, int delta) {
    auto it = m_topics.find(topicId);
    if (it == m_topics.end()) throw StorageError::notFound("Topic", topicId);
    it->second.uses = std::max(0, it->second.uses + delta);
}

void GraphTables::setTopicPosition(const std::string& topicId, const Position3& position) {
    auto it = m_topics.find(topicId);
    if (it == m_topics.end()) throw StorageError::notFound("Topic", topicId);
    it->second.position = position;
}

void GraphTables::removeTopic(const std::string& topicId) {
    auto it = m_topics.find(topicId);
    if (it == m_topics.end()) return;

    for (auto link = m_itemTopics.begin(); link != m_itemTopics.end();) {
        if (link->second == topicId) {
            link = m_itemTopics.erase(link);
        } else {
            ++link;
        }
    }

    for (const auto& edge : edgesTouching(topicId)) {
        removeEdge(edge.id);
    }

    removeVector(OwnerType::Topic, topicId);
    m_topicByLabel.erase(it->second.label);
    m_topics.erase(it);
}

const Item* GraphTables::findItem(const std::string& itemId) const {
    auto it = m_items.find(itemId);
    return it != m_items.end() ? &it->second : nullptr;
}

const Item* GraphTables::findItemByLink(const std::string& link) const {
    auto it = m_itemByLink.find(link);
    return it != m_itemByLink.end() ? findItem(it->second) : nullptr;
}

void GraphTables::addItem(const Item& item) {
    if (item.id.empty()) throw ValidationError::required("item.id");
    if (m_items.count(item.id)) throw StorageError::duplicate("Item", item.id);
    if (m_itemByLink.count(item.link)) throw StorageError::duplicate("Item link", item.link);

    Item row = item;
    row.graphId = m_graphId;
    m_items.emplace(row.id, row);
    m_itemByLink.emplace(row.link, row.id);
}

void GraphTables::removeItem(const std::string& itemId) {
    auto it = m_items.find(itemId);
    if (it == m_items.end()) return;

    for (const auto& topicId : topicsForItem(itemId)) {
        m_itemTopics.erase({itemId, topicId});
        auto topic = m_topics.find(topicId);
        if (topic != m_topics.end() && topic->second.uses > 0) {
            topic->second.uses -= 1;
        }
    }

    removeVector(OwnerType::Item, itemId);
    m_itemByLink.erase(it->second.link);
    m_items.erase(it);
}

bool GraphTables::linkItemTopic(const std::string& itemId, const std::string& topicId) {
    if (!m_items.count(itemId)) throw StorageError::notFound("Item", itemId);
    if (!m_topics.count(topicId)) throw StorageError::notFound("Topic", topicId);
    return m_itemTopics.insert({itemId, topicId}).second;
}

std::vector<std::string> GraphTables::topicsForItem(const std::string& itemId) const {
    std::vector<std::string> topicIds;
    for (auto it = m_itemTopics.lower_bound({itemId, std::string()});
         it != m_itemTopics.end() && it->first == itemId; ++it) {
        topicIds.push_back(it->second);
    }
    return topicIds;
}

std::vector<std::string> GraphTables::itemsForTopic(const std::string& topicId) const {
    std::vector<std::string> itemIds;
    for (const auto& [itemId, linkedTopic] : m_itemTopics) {
        if (linkedTopic == topicId) itemIds.push_back(itemId);
    }
    return itemIds;
}

const TopicEdge* GraphTables::findEdge(const std::string& src, const std::string& dst, EdgeType type) const {
    auto it = m_edgeByKey.find({src, dst, type});
    if (it == m_edgeByKey.end()) return nullptr;
    auto edge = m_edges.find(it->second);
    return edge != m_edges.end() ? &edge->second : nullptr;
}

void GraphTables::addEdge(const TopicEdge& edge) {
    if (edge.id.empty()) throw ValidationError::required("edge.id");
    if (edge.src == edge.dst) throw ValidationError::invalid("edge", "self loop on " + edge.src);
    if (edge.type == EdgeType::RelatedTo && edge.dst < edge.src) {
        throw ValidationError::invalid("edge", "related_to must be stored in canonical order");
    }
    if (!m_topics.count(edge.src)) throw StorageError::notFound("Topic", edge.src);
    if (!m_topics.count(edge.dst)) throw StorageError::notFound("Topic", edge.dst);
    if (m_edges.count(edge.id)) throw StorageError::duplicate("Edge", edge.id);

    EdgeKey key{edge.src, edge.dst, edge.type};
    if (m_edgeByKey.count(key)) {
        throw StorageError::duplicate("Edge", edge.src + "->" + edge.dst + " (" + EdgeTypeToString(edge.type) + ")");
    }

    TopicEdge row = edge;
    row.graphId = m_graphId;
    m_edges.emplace(row.id, row);
    m_edgeByKey.emplace(key, row.id);
}

bool GraphTables::removeEdge(const std::string& edgeId) {
    auto it = m_edges.find(edgeId);
    if (it == m_edges.end()) return false;
    m_edgeByKey.erase({it->second.src, it->second.dst, it->second.type});
    m_edges.erase(it);
    return true;
}

std::vector<TopicEdge> GraphTables::edgesTouching(const std::string& topicId) const {
    std::vector<TopicEdge> touching;
    for (const auto& [id, edge] : m_edges) {
        if (edge.src == topicId || edge.dst == topicId) touching.push_back(edge);
    }
    return touching;
}

void GraphTables::putVector(const VectorRow& row) {
    if (row.ownerId.empty()) throw ValidationError::required("vector.ownerId");
    VectorRow stored = row;
    stored.graphId = m_graphId;
    m_vectors[{row.ownerType, row.ownerId}] = std::move(stored);
}

std::optional<std::vector<float>> GraphTables::loadVector(OwnerType ownerType, const std::string& ownerId) const {
    auto it = m_vectors.find({ownerType, ownerId});
    if (it == m_vectors.end()) return std::nullopt;
    return DecodeVector(it->second.buf);
}

bool GraphTables::removeVector(OwnerType ownerType, const std::string& ownerId) {
    return m_vectors.erase({ownerType, ownerId}) > 0;
}

void GraphTables::clear() {
    m_topics.clear();
    m_topicByLabel.clear();
    m_items.clear();
    m_itemByLink.clear();
    m_itemTopics.clear();
    m_edges.clear();
    m_edgeByKey.clear();
    m_vectors.clear();
}

} // namespace orion::domain
