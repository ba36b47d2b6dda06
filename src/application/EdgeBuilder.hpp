/**
 * @file EdgeBuilder.hpp
 * @brief Typed, cycle-free edge construction for newly minted topics.
 */

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "application/IdGenerator.hpp"
#include "application/TopicGraphIndex.hpp"
#include "domain/GraphSettings.hpp"
#include "domain/RelationshipClassifier.hpp"

namespace orion::application {

/**
 * @struct EdgeCandidate
 * @brief Another topic and its similarity to the new topic.
 */
struct EdgeCandidate {
    std::string topicId;
    std::string label;
    float similarity = 0.0f;
};

/**
 * @struct EdgeBuildReport
 * @brief Outcome of one EdgeBuilder run.
 */
struct EdgeBuildReport {
    int parentsAccepted = 0;
    int childrenAccepted = 0;
    int siblingsAccepted = 0;
    int cycleRejections = 0;
    int belowFloor = 0;
    int pruned = 0;              ///< Edges removed by the degree caps.
    bool classifierDegraded = false;
    std::string warning;         ///< Set when the classifier could not be used.
};

/**
 * @class EdgeBuilder
 * @brief Links one new topic to its nearest neighbours through the relationship classifier.
 *
 * Accepted edges and pruned edges are recorded in the TopicGraphIndex; the
 * caller persists its pending additions and removals.
 */
class EdgeBuilder {
public:
    EdgeBuilder(const domain::GraphTuning& tuning,
                std::shared_ptr<domain::RelationshipClassifier> classifier,
                IdFactory ids = DefaultIdFactory(),
                Clock clock = DefaultClock());

    /**
     * @brief Classifies and links the new topic.
     * @param index Edge index, already containing the new topic's node.
     * @param topic The newly minted topic.
     * @param candidates Every other topic with its similarity, in any order.
     */
    EdgeBuildReport build(TopicGraphIndex& index,
                          const domain::Topic& topic,
                          std::vector<EdgeCandidate> candidates) const;

    /** @brief Stable descending sort by similarity, truncated to limit. */
    static std::vector<EdgeCandidate> rankCandidates(std::vector<EdgeCandidate> candidates, std::size_t limit);

private:
    std::size_t insertEdge(TopicGraphIndex& index, const std::string& src, const std::string& dst,
                           domain::EdgeType type, float similarity) const;
    int enforceDegreeCaps(TopicGraphIndex& index, const std::string& topicId) const;

    domain::GraphTuning m_tuning;
    std::shared_ptr<domain::RelationshipClassifier> m_classifier;
    IdFactory m_ids;
    Clock m_clock;
};

} // namespace orion::application
