/**
 * @file TopicResolver.hpp
 * @brief Merges incoming topic labels into existing topics or mints new ones.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "application/IdGenerator.hpp"
#include "domain/GraphModel.hpp"

namespace orion::application {

/**
 * @struct TopicInput
 * @brief One label of an ingested item with its embedding.
 */
struct TopicInput {
    std::string label;
    std::vector<float> embedding;
};

/**
 * @struct KnownTopic
 * @brief A persisted topic offered for resolution. Topics without a vector only match by label.
 */
struct KnownTopic {
    domain::Topic topic;
    std::optional<std::vector<float>> embedding;
};

/**
 * @struct ResolvedTopic
 * @brief Outcome for one input label.
 */
struct ResolvedTopic {
    domain::Topic topic;        ///< Topic the label resolved to, with its updated uses.
    bool isNew = false;         ///< True if the topic was minted for this label.
    bool exactMatch = false;
    float similarity = 1.0f;    ///< Score of the merge, 1 for exact matches and new topics.
};

struct TopicResolution {
    std::vector<ResolvedTopic> resolved;   ///< Parallel to the input batch.
    std::vector<std::size_t> newIndices;   ///< Batch positions that minted a topic.
    std::vector<std::string> reusedTopicIds; ///< Distinct pre-existing topics referenced by the batch.
};

/**
 * @class TopicResolver
 * @brief Deterministic, order-sensitive label resolution.
 *
 * Per label: exact label match, else best cosine match against earlier labels of
 * the batch and existing topics, merged if strictly above the merge threshold,
 * else a new topic. Ties keep the first candidate seen. A pre-existing topic's
 * uses is incremented once per batch, however many labels resolve to it.
 */
class TopicResolver {
public:
    TopicResolver(float mergeThreshold, IdFactory ids = DefaultIdFactory(), Clock clock = DefaultClock());

    TopicResolution resolve(const std::vector<TopicInput>& batch, const std::vector<KnownTopic>& existing) const;

private:
    float m_mergeThreshold;
    IdFactory m_ids;
    Clock m_clock;
};

} // namespace orion::application
