/**
 * @file GraphJsonCodec.hpp
 * @brief JSON mapping of graph entities, store snapshots and ingestion input.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/GraphModel.hpp"
#include "domain/GraphTables.hpp"

namespace orion::infrastructure {

/**
 * @class GraphJsonCodec
 * @brief Manual field mapping between domain types and nlohmann::json.
 *
 * Readers throw domain::ValidationError on missing required fields.
 */
class GraphJsonCodec {
public:
    static nlohmann::json GraphToJson(const domain::Graph& graph);
    static domain::Graph GraphFromJson(const nlohmann::json& j);

    /** @brief Topic with an optional "position" object. */
    static nlohmann::json TopicToJson(const domain::Topic& topic);
    static domain::Topic TopicFromJson(const nlohmann::json& j);

    static nlohmann::json TopicViewToJson(const domain::TopicWithPosition& topic);

    static nlohmann::json ItemToJson(const domain::Item& item);
    static domain::Item ItemFromJson(const nlohmann::json& j);

    static nlohmann::json EdgeToJson(const domain::TopicEdge& edge);
    static domain::TopicEdge EdgeFromJson(const nlohmann::json& j);

    /**
     * @brief Serializes all five collections of a graph. Vectors are written as float arrays.
     */
    static nlohmann::json TablesToJson(const domain::GraphTables& tables);

    /**
     * @brief Rebuilds tables through the regular mutators so every constraint is re-checked.
     */
    static domain::GraphTables TablesFromJson(const std::string& graphId, const nlohmann::json& j);

    /**
     * @brief Reads extraction output: title, summary, topics, link, topicEmbeddings, contentEmbedding.
     */
    static domain::PageResult PageResultFromJson(const nlohmann::json& j);
};

} // namespace orion::infrastructure
