/**
 * @file TopicResolver.cpp
 * @brief Implementation of TopicResolver.
 */

#include "application/TopicResolver.hpp"
#include "application/VectorMath.hpp"
#include <limits>
#include <map>

namespace orion::application {

TopicResolver::TopicResolver(float mergeThreshold, IdFactory ids, Clock clock)
    : m_mergeThreshold(mergeThreshold), m_ids(std::move(ids)), m_clock(std::move(clock)) {}

TopicResolution TopicResolver::resolve(const std::vector<TopicInput>& batch,
                                       const std::vector<KnownTopic>& existing) const {
    TopicResolution result;
    result.resolved.reserve(batch.size());

    std::map<std::string, std::size_t> existingByLabel;
    for (std::size_t i = 0; i < existing.size(); ++i) {
        existingByLabel.emplace(existing[i].topic.label, i);
    }

    // Pre-existing topics already counted for this batch.
    std::map<std::string, domain::Topic> touched;
    std::map<std::string, domain::Topic> mintedByLabel;

    auto reuse = [&](const domain::Topic& topic) -> domain::Topic {
        auto it = touched.find(topic.id);
        if (it != touched.end()) return it->second;
        domain::Topic updated = topic;
        updated.uses += 1;
        touched.emplace(updated.id, updated);
        result.reusedTopicIds.push_back(updated.id);
        return updated;
    };

    for (std::size_t i = 0; i < batch.size(); ++i) {
        const TopicInput& input = batch[i];
        ResolvedTopic out;

        auto exact = existingByLabel.find(input.label);
        if (exact != existingByLabel.end()) {
            out.topic = reuse(existing[exact->second].topic);
            out.exactMatch = true;
            result.resolved.push_back(out);
            continue;
        }
        auto minted = mintedByLabel.find(input.label);
        if (minted != mintedByLabel.end()) {
            out.topic = minted->second;
            out.exactMatch = true;
            result.resolved.push_back(out);
            continue;
        }

        float best = -std::numeric_limits<float>::infinity();
        std::optional<domain::Topic> bestTopic;

        for (std::size_t j = 0; j < i; ++j) {
            float sim = vectormath::cosineSimilarity(input.embedding, batch[j].embedding);
            if (sim > best) {
                best = sim;
                bestTopic = result.resolved[j].topic;
            }
        }
        for (const auto& known : existing) {
            if (!known.embedding) continue;
            float sim = vectormath::cosineSimilarity(input.embedding, *known.embedding);
            if (sim > best) {
                best = sim;
                bestTopic = known.topic;
            }
        }

        if (bestTopic && best > m_mergeThreshold) {
            bool fromBatch = mintedByLabel.count(bestTopic->label) > 0;
            out.topic = fromBatch ? mintedByLabel[bestTopic->label] : reuse(*bestTopic);
            out.similarity = best;
            result.resolved.push_back(out);
            continue;
        }

        domain::Topic topic;
        topic.id = m_ids();
        topic.label = input.label;
        topic.uses = 1;
        topic.createdAt = m_clock();
        mintedByLabel.emplace(topic.label, topic);

        out.topic = topic;
        out.isNew = true;
        result.newIndices.push_back(i);
        result.resolved.push_back(out);
    }
    return result;
}

} // namespace orion::application
