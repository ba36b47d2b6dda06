/**
 * @file GraphModel.hpp
 * @brief Domain entities of the topic knowledge graph.
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace orion::domain {

/// Identifier of the graph created on first start.
inline const std::string kDefaultGraphId = "orion";

/**
 * @struct Graph
 * @brief A partition boundary. Every other entity is scoped by its graphId.
 */
struct Graph {
    std::string id;
    std::string name;
    std::int64_t createdAt = 0; ///< Milliseconds since epoch.
    bool isDefault = false;
};

/**
 * @struct Position3
 * @brief A projected 3D coordinate.
 */
struct Position3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

/**
 * @struct Topic
 * @brief A deduplicated concept node. Its embedding lives in the vector table.
 */
struct Topic {
    std::string id;
    std::string graphId;
    std::string label;          ///< Unique within a graph.
    int uses = 0;               ///< Number of items referencing the topic.
    std::int64_t createdAt = 0;
    std::optional<Position3> position; ///< Absent until the first projection.
};

/**
 * @struct Item
 * @brief An ingested content unit (a summarized page).
 */
struct Item {
    std::string id;
    std::string graphId;
    std::string title;
    std::string summary;
    std::string link;           ///< Unique within a graph, the ingestion dedup key.
    std::int64_t createdAt = 0;
};

/**
 * @struct ItemTopic
 * @brief Many-to-many association between items and topics.
 */
struct ItemTopic {
    std::string graphId;
    std::string itemId;
    std::string topicId;
};

/**
 * @enum EdgeType
 * @brief Relationship kinds between two topics.
 */
enum class EdgeType {
    BroaderThan, ///< src is the broader (parent) topic, dst the narrower one.
    RelatedTo    ///< Undirected, stored with src < dst.
};

inline std::string EdgeTypeToString(EdgeType type) {
    switch (type) {
        case EdgeType::BroaderThan: return "broader_than";
        case EdgeType::RelatedTo: return "related_to";
    }
    return "related_to";
}

inline std::optional<EdgeType> EdgeTypeFromString(const std::string& value) {
    if (value == "broader_than") return EdgeType::BroaderThan;
    if (value == "related_to") return EdgeType::RelatedTo;
    return std::nullopt;
}

/**
 * @struct TopicEdge
 * @brief A typed relationship justified by an embedding similarity.
 */
struct TopicEdge {
    std::string id;
    std::string graphId;
    std::string src;
    std::string dst;
    EdgeType type = EdgeType::RelatedTo;
    float similarity = 0.0f;    ///< Cosine score in [0, 1].
    std::int64_t createdAt = 0;
};

/**
 * @enum OwnerType
 * @brief Kind of entity a stored vector belongs to.
 */
enum class OwnerType {
    Item,
    Topic
};

inline std::string OwnerTypeToString(OwnerType type) {
    return type == OwnerType::Item ? "item" : "topic";
}

inline std::optional<OwnerType> OwnerTypeFromString(const std::string& value) {
    if (value == "item") return OwnerType::Item;
    if (value == "topic") return OwnerType::Topic;
    return std::nullopt;
}

/**
 * @struct VectorRow
 * @brief One embedding per owner, stored as little-endian float32 bytes.
 */
struct VectorRow {
    std::string graphId;
    OwnerType ownerType = OwnerType::Topic;
    std::string ownerId;
    std::vector<std::uint8_t> buf;
    std::int64_t createdAt = 0;
};

/**
 * @struct PageResult
 * @brief Ingestion input produced by the extraction collaborator.
 *
 * topics and topicEmbeddings are parallel arrays.
 */
struct PageResult {
    std::string title;
    std::string summary;
    std::vector<std::string> topics;
    std::string link;
    std::vector<std::vector<float>> topicEmbeddings;
    std::vector<float> contentEmbedding;
};

/**
 * @struct TopicWithPosition
 * @brief Topic view consumed by the visualization layer.
 */
struct TopicWithPosition {
    std::string id;
    std::string label;
    int uses = 0;
    std::int64_t createdAt = 0;
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

inline TopicWithPosition ToTopicWithPosition(const Topic& topic) {
    TopicWithPosition view;
    view.id = topic.id;
    view.label = topic.label;
    view.uses = topic.uses;
    view.createdAt = topic.createdAt;
    if (topic.position) {
        view.x = topic.position->x;
        view.y = topic.position->y;
        view.z = topic.position->z;
    }
    return view;
}

} // namespace orion::domain
