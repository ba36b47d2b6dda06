/**
 * @file GraphJsonCodec.cpp
 * @brief Implementation of GraphJsonCodec.
 */

#include "infrastructure/GraphJsonCodec.hpp"
#include "domain/GraphErrors.hpp"
#include "domain/VectorCodec.hpp"

namespace orion::infrastructure {

using json = nlohmann::json;

namespace {

const json& Require(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key)) throw domain::ValidationError::required(key);
    return j.at(key);
}

std::string RequireString(const json& j, const char* key) {
    const json& value = Require(j, key);
    if (!value.is_string()) throw domain::ValidationError::invalid(key, "expected a string");
    return value.get<std::string>();
}

std::vector<float> ReadFloats(const json& value, const std::string& field) {
    if (!value.is_array()) throw domain::ValidationError::invalid(field, "expected an array of numbers");
    std::vector<float> out;
    out.reserve(value.size());
    for (const auto& entry : value) {
        if (!entry.is_number()) throw domain::ValidationError::invalid(field, "expected an array of numbers");
        out.push_back(entry.get<float>());
    }
    return out;
}

} // namespace

json GraphJsonCodec::GraphToJson(const domain::Graph& graph) {
    return {
        {"id", graph.id},
        {"name", graph.name},
        {"createdAt", graph.createdAt},
        {"isDefault", graph.isDefault}
    };
}

domain::Graph GraphJsonCodec::GraphFromJson(const json& j) {
    domain::Graph graph;
    graph.id = RequireString(j, "id");
    graph.name = j.value("name", graph.id);
    graph.createdAt = j.value("createdAt", static_cast<std::int64_t>(0));
    graph.isDefault = j.value("isDefault", false);
    return graph;
}

json GraphJsonCodec::TopicToJson(const domain::Topic& topic) {
    json j = {
        {"id", topic.id},
        {"label", topic.label},
        {"uses", topic.uses},
        {"createdAt", topic.createdAt}
    };
    if (topic.position) {
        j["position"] = {{"x", topic.position->x}, {"y", topic.position->y}, {"z", topic.position->z}};
    }
    return j;
}

domain::Topic GraphJsonCodec::TopicFromJson(const json& j) {
    domain::Topic topic;
    topic.id = RequireString(j, "id");
    topic.label = RequireString(j, "label");
    topic.uses = j.value("uses", 0);
    topic.createdAt = j.value("createdAt", static_cast<std::int64_t>(0));
    if (j.contains("position") && j["position"].is_object()) {
        const auto& p = j["position"];
        topic.position = domain::Position3{p.value("x", 0.0f), p.value("y", 0.0f), p.value("z", 0.0f)};
    }
    return topic;
}

json GraphJsonCodec::TopicViewToJson(const domain::TopicWithPosition& topic) {
    return {
        {"id", topic.id},
        {"label", topic.label},
        {"uses", topic.uses},
        {"createdAt", topic.createdAt},
        {"x", topic.x},
        {"y", topic.y},
        {"z", topic.z}
    };
}

json GraphJsonCodec::ItemToJson(const domain::Item& item) {
    return {
        {"id", item.id},
        {"title", item.title},
        {"summary", item.summary},
        {"link", item.link},
        {"createdAt", item.createdAt}
    };
}

domain::Item GraphJsonCodec::ItemFromJson(const json& j) {
    domain::Item item;
    item.id = RequireString(j, "id");
    item.link = RequireString(j, "link");
    item.title = j.value("title", "");
    item.summary = j.value("summary", "");
    item.createdAt = j.value("createdAt", static_cast<std::int64_t>(0));
    return item;
}

json GraphJsonCodec::EdgeToJson(const domain::TopicEdge& edge) {
    return {
        {"id", edge.id},
        {"src", edge.src},
        {"dst", edge.dst},
        {"type", domain::EdgeTypeToString(edge.type)},
        {"similarity", edge.similarity},
        {"createdAt", edge.createdAt}
    };
}

domain::TopicEdge GraphJsonCodec::EdgeFromJson(const json& j) {
    domain::TopicEdge edge;
    edge.id = RequireString(j, "id");
    edge.src = RequireString(j, "src");
    edge.dst = RequireString(j, "dst");
    const std::string type = j.value("type", "related_to");
    auto parsed = domain::EdgeTypeFromString(type);
    if (!parsed) throw domain::ValidationError::invalid("type", "unknown edge type '" + type + "'");
    edge.type = *parsed;
    edge.similarity = j.value("similarity", 0.0f);
    edge.createdAt = j.value("createdAt", static_cast<std::int64_t>(0));
    return edge;
}

json GraphJsonCodec::TablesToJson(const domain::GraphTables& tables) {
    json j;
    j["topics"] = json::array();
    for (const auto& [id, topic] : tables.topics()) j["topics"].push_back(TopicToJson(topic));

    j["items"] = json::array();
    for (const auto& [id, item] : tables.items()) j["items"].push_back(ItemToJson(item));

    j["itemTopics"] = json::array();
    for (const auto& [itemId, topicId] : tables.itemTopics()) {
        j["itemTopics"].push_back({{"itemId", itemId}, {"topicId", topicId}});
    }

    j["edges"] = json::array();
    for (const auto& [id, edge] : tables.edges()) j["edges"].push_back(EdgeToJson(edge));

    j["vectors"] = json::array();
    for (const auto& [key, row] : tables.vectors()) {
        j["vectors"].push_back({
            {"ownerType", domain::OwnerTypeToString(row.ownerType)},
            {"ownerId", row.ownerId},
            {"vector", domain::DecodeVector(row.buf)},
            {"createdAt", row.createdAt}
        });
    }
    return j;
}

domain::GraphTables GraphJsonCodec::TablesFromJson(const std::string& graphId, const json& j) {
    domain::GraphTables tables(graphId);

    for (const auto& topic : j.value("topics", json::array())) tables.addTopic(TopicFromJson(topic));
    for (const auto& item : j.value("items", json::array())) tables.addItem(ItemFromJson(item));
    for (const auto& link : j.value("itemTopics", json::array())) {
        tables.linkItemTopic(RequireString(link, "itemId"), RequireString(link, "topicId"));
    }
    for (const auto& edge : j.value("edges", json::array())) tables.addEdge(EdgeFromJson(edge));

    for (const auto& entry : j.value("vectors", json::array())) {
        const std::string ownerType = RequireString(entry, "ownerType");
        auto parsed = domain::OwnerTypeFromString(ownerType);
        if (!parsed) throw domain::ValidationError::invalid("ownerType", "unknown owner type '" + ownerType + "'");

        domain::VectorRow row;
        row.ownerType = *parsed;
        row.ownerId = RequireString(entry, "ownerId");
        row.buf = domain::EncodeVector(ReadFloats(Require(entry, "vector"), "vector"));
        row.createdAt = entry.value("createdAt", static_cast<std::int64_t>(0));
        tables.putVector(row);
    }
    return tables;
}

domain::PageResult GraphJsonCodec::PageResultFromJson(const json& j) {
    domain::PageResult page;
    page.link = RequireString(j, "link");
    page.title = j.value("title", "");
    page.summary = j.value("summary", "");

    if (j.contains("topics")) {
        if (!j["topics"].is_array()) throw domain::ValidationError::invalid("topics", "expected an array of strings");
        for (const auto& label : j["topics"]) {
            if (!label.is_string()) throw domain::ValidationError::invalid("topics", "expected an array of strings");
            page.topics.push_back(label.get<std::string>());
        }
    }

    if (j.contains("topicEmbeddings")) {
        if (!j["topicEmbeddings"].is_array()) {
            throw domain::ValidationError::invalid("topicEmbeddings", "expected an array of arrays");
        }
        for (const auto& embedding : j["topicEmbeddings"]) {
            page.topicEmbeddings.push_back(ReadFloats(embedding, "topicEmbeddings"));
        }
    }

    if (j.contains("contentEmbedding") && !j["contentEmbedding"].is_null()) {
        page.contentEmbedding = ReadFloats(j["contentEmbedding"], "contentEmbedding");
    }
    return page;
}

} // namespace orion::infrastructure
