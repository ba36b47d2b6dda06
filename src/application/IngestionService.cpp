/**
 * @file IngestionService.cpp
 * @brief Implementation of IngestionService.
 */

#include "application/IngestionService.hpp"
#include "application/EdgeBuilder.hpp"
#include "application/TopicGraphIndex.hpp"
#include "application/TopicResolver.hpp"
#include "application/VectorMath.hpp"
#include "domain/GraphErrors.hpp"
#include "domain/VectorCodec.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace orion::application {

namespace {

/// Dimensionality of the embeddings already stored in the graph, 0 when it holds none.
std::size_t storedDimension(const domain::GraphTables& tables) {
    for (const auto& [key, row] : tables.vectors()) {
        if (!row.buf.empty()) return row.buf.size() / sizeof(float);
    }
    return 0;
}

void checkDimension(const domain::GraphTables& tables, std::size_t dim, const char* field) {
    const std::size_t stored = storedDimension(tables);
    if (dim != 0 && stored != 0 && dim != stored) {
        throw domain::ValidationError::invalid(
            field, "dimensionality " + std::to_string(dim) + " does not match graph dimensionality " +
                   std::to_string(stored));
    }
}

} // namespace

IngestionService::IngestionService(std::shared_ptr<domain::GraphStore> store,
                                   std::shared_ptr<SettingsService> settings,
                                   std::shared_ptr<domain::RelationshipClassifier> classifier,
                                   RecomputeScheduler scheduler,
                                   IdFactory ids,
                                   Clock clock)
    : m_store(std::move(store)),
      m_settings(std::move(settings)),
      m_classifier(std::move(classifier)),
      m_scheduler(std::move(scheduler)),
      m_ids(std::move(ids)),
      m_clock(std::move(clock)) {}

void IngestionService::validate(const domain::PageResult& page) const {
    if (page.link.empty()) throw domain::ValidationError::required("link");
    if (page.topics.size() != page.topicEmbeddings.size()) {
        throw domain::ValidationError::invalid(
            "topicEmbeddings", std::to_string(page.topicEmbeddings.size()) + " embeddings for " +
                               std::to_string(page.topics.size()) + " topics");
    }

    std::size_t dim = 0;
    for (std::size_t i = 0; i < page.topics.size(); ++i) {
        if (page.topics[i].empty()) throw domain::ValidationError::invalid("topics", "empty label");
        const auto& embedding = page.topicEmbeddings[i];
        if (embedding.empty()) {
            throw domain::ValidationError::invalid("topicEmbeddings", "empty embedding for '" + page.topics[i] + "'");
        }
        if (dim == 0) dim = embedding.size();
        if (embedding.size() != dim) {
            throw domain::ValidationError::invalid(
                "topicEmbeddings", "inconsistent dimensionality " + std::to_string(embedding.size()) +
                                   " (expected " + std::to_string(dim) + ")");
        }
    }

    if (dim != 0 && !page.contentEmbedding.empty() && page.contentEmbedding.size() != dim) {
        throw domain::ValidationError::invalid(
            "contentEmbedding", "dimensionality " + std::to_string(page.contentEmbedding.size()) +
                                " does not match topic dimensionality " + std::to_string(dim));
    }
}

std::size_t IngestionService::pageDimension(const domain::PageResult& page) {
    if (!page.topicEmbeddings.empty()) return page.topicEmbeddings.front().size();
    return page.contentEmbedding.size();
}

IngestionResult IngestionService::Ingest(const std::string& graphId, const domain::PageResult& page) {
    validate(page);

    IngestionResult result;
    domain::GraphTables snapshot = m_store->snapshot(graphId);
    if (snapshot.findItemByLink(page.link)) {
        std::cout << "[IngestionService] Already ingested, skipping: " << page.link << std::endl;
        result.skippedDuplicate = true;
        return result;
    }

    const domain::GraphSettings settings = m_settings->GetSettings(graphId);

    // Existing topics in creation order, so resolution ties favour older topics.
    std::vector<KnownTopic> existing;
    for (const auto& [id, topic] : snapshot.topics()) {
        existing.push_back({topic, snapshot.loadVector(domain::OwnerType::Topic, id)});
    }
    std::stable_sort(existing.begin(), existing.end(), [](const KnownTopic& a, const KnownTopic& b) {
        if (a.topic.createdAt != b.topic.createdAt) return a.topic.createdAt < b.topic.createdAt;
        return a.topic.id < b.topic.id;
    });

    checkDimension(snapshot, pageDimension(page),
                   page.topicEmbeddings.empty() ? "contentEmbedding" : "topicEmbeddings");

    std::vector<TopicInput> batch;
    for (std::size_t i = 0; i < page.topics.size(); ++i) {
        batch.push_back({page.topics[i], page.topicEmbeddings[i]});
    }

    TopicResolver resolver(settings.graph.topicMergeThreshold, m_ids, m_clock);
    TopicResolution resolution = resolver.resolve(batch, existing);

    TopicGraphIndex index = TopicGraphIndex::FromTables(snapshot);
    EdgeBuilder builder(settings.graph, m_classifier, m_ids, m_clock);

    for (std::size_t n = 0; n < resolution.newIndices.size(); ++n) {
        const std::size_t batchIndex = resolution.newIndices[n];
        const domain::Topic& topic = resolution.resolved[batchIndex].topic;
        const std::vector<float>& embedding = batch[batchIndex].embedding;

        std::vector<EdgeCandidate> candidates;
        for (std::size_t m = 0; m < n; ++m) {
            const std::size_t earlier = resolution.newIndices[m];
            const domain::Topic& other = resolution.resolved[earlier].topic;
            candidates.push_back({other.id, other.label,
                                  vectormath::cosineSimilarity(embedding, batch[earlier].embedding)});
        }
        for (const auto& known : existing) {
            if (!known.embedding) continue;
            candidates.push_back({known.topic.id, known.topic.label,
                                  vectormath::cosineSimilarity(embedding, *known.embedding)});
        }

        EdgeBuildReport report = builder.build(index, topic, std::move(candidates));
        result.cycleRejections += report.cycleRejections;
        if (!report.warning.empty()) result.warnings.push_back(report.warning);
    }

    const std::vector<domain::TopicEdge> addedEdges = index.pendingAdditions();
    const std::vector<std::string> removedEdges = index.pendingRemovals();

    domain::Item item;
    item.id = m_ids();
    item.title = page.title;
    item.summary = page.summary;
    item.link = page.link;
    item.createdAt = m_clock();

    bool raced = false;
    std::vector<std::string> droppedTopics;
    int addedCount = 0;
    int removedCount = 0;
    int lateRejections = 0;
    m_store->transact(graphId, [&](domain::GraphTables& tables) {
        if (tables.findItemByLink(page.link)) {
            raced = true;
            return;
        }
        // A concurrent writer may have seeded an empty graph with another dimensionality.
        checkDimension(tables, pageDimension(page),
                       page.topicEmbeddings.empty() ? "contentEmbedding" : "topicEmbeddings");

        tables.addItem(item);
        if (!page.contentEmbedding.empty()) {
            tables.putVector({graphId, domain::OwnerType::Item, item.id,
                              domain::EncodeVector(page.contentEmbedding), item.createdAt});
        }

        for (std::size_t batchIndex : resolution.newIndices) {
            const domain::Topic& topic = resolution.resolved[batchIndex].topic;
            tables.addTopic(topic);
            tables.putVector({graphId, domain::OwnerType::Topic, topic.id,
                              domain::EncodeVector(batch[batchIndex].embedding), topic.createdAt});
        }

        // Reused topics deleted since the snapshot lose this page's link instead of failing it.
        droppedTopics.clear();
        for (const auto& topicId : resolution.reusedTopicIds) {
            if (!tables.findTopic(topicId)) {
                droppedTopics.push_back(topicId);
                continue;
            }
            tables.adjustTopicUses(topicId, 1);
        }

        std::set<std::string> linked(droppedTopics.begin(), droppedTopics.end());
        for (const auto& resolved : resolution.resolved) {
            if (linked.insert(resolved.topic.id).second) {
                tables.linkItemTopic(item.id, resolved.topic.id);
            }
        }

        removedCount = 0;
        for (const auto& edgeId : removedEdges) {
            if (tables.removeEdge(edgeId)) removedCount++;
        }

        // Edges were planned against the snapshot; other writers may have committed since.
        addedCount = 0;
        lateRejections = 0;
        TopicGraphIndex committed = TopicGraphIndex::FromTables(tables);
        for (const auto& edge : addedEdges) {
            if (!tables.findTopic(edge.src) || !tables.findTopic(edge.dst) ||
                tables.findEdge(edge.src, edge.dst, edge.type)) {
                continue;
            }
            if (edge.type == domain::EdgeType::BroaderThan && committed.isReachable(edge.dst, edge.src)) {
                lateRejections++;
                continue;
            }
            tables.addEdge(edge);
            committed.addEdge(edge, true);
            addedCount++;
        }
    });

    if (raced) {
        std::cout << "[IngestionService] Already ingested, skipping: " << page.link << std::endl;
        result.skippedDuplicate = true;
        return result;
    }

    item.graphId = graphId;
    result.item = item;
    for (std::size_t batchIndex : resolution.newIndices) {
        domain::Topic topic = resolution.resolved[batchIndex].topic;
        topic.graphId = graphId;
        result.newTopics.push_back(topic);
    }
    result.topicsReused = static_cast<int>(resolution.reusedTopicIds.size() - droppedTopics.size());
    for (const auto& topicId : droppedTopics) {
        result.warnings.push_back("topic " + topicId + " was deleted during ingestion and is not linked");
        std::cerr << "[IngestionService] Topic deleted during ingestion, link dropped: " << topicId << std::endl;
    }
    result.edgesAdded = addedCount;
    result.edgesRemoved = removedCount;
    result.cycleRejections += lateRejections;

    std::cout << "[IngestionService] Ingested '" << page.title << "': " << result.newTopics.size()
              << " new topics, " << result.topicsReused << " reused, " << result.edgesAdded << " edges" << std::endl;

    if (!result.newTopics.empty() && m_scheduler) {
        m_scheduler(graphId);
    }
    return result;
}

} // namespace orion::application
