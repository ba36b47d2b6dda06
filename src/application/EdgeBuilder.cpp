/**
 * @file EdgeBuilder.cpp
 * @brief Implementation of EdgeBuilder.
 */

#include "application/EdgeBuilder.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace orion::application {

using domain::EdgeType;
using domain::Relation;

EdgeBuilder::EdgeBuilder(const domain::GraphTuning& tuning,
                         std::shared_ptr<domain::RelationshipClassifier> classifier,
                         IdFactory ids,
                         Clock clock)
    : m_tuning(tuning), m_classifier(std::move(classifier)), m_ids(std::move(ids)), m_clock(std::move(clock)) {}

std::vector<EdgeCandidate> EdgeBuilder::rankCandidates(std::vector<EdgeCandidate> candidates, std::size_t limit) {
    std::stable_sort(candidates.begin(), candidates.end(), [](const EdgeCandidate& a, const EdgeCandidate& b) {
        return a.similarity > b.similarity;
    });
    if (candidates.size() > limit) candidates.resize(limit);
    return candidates;
}

EdgeBuildReport EdgeBuilder::build(TopicGraphIndex& index,
                                   const domain::Topic& topic,
                                   std::vector<EdgeCandidate> candidates) const {
    EdgeBuildReport report;
    index.addNode(topic.id);

    auto ranked = rankCandidates(std::move(candidates), static_cast<std::size_t>(std::max(0, m_tuning.candidateCount)));
    if (ranked.size() > static_cast<std::size_t>(std::max(0, m_tuning.classifierCandidateCount))) {
        ranked.resize(static_cast<std::size_t>(std::max(0, m_tuning.classifierCandidateCount)));
    }
    if (ranked.empty() || !m_classifier) return report;

    std::vector<domain::RelationshipCandidate> offered;
    offered.reserve(ranked.size());
    for (const auto& c : ranked) offered.push_back({c.label, c.similarity});

    std::vector<Relation> relations;
    try {
        relations = m_classifier->classify(topic.label, offered);
    } catch (const std::exception& e) {
        report.classifierDegraded = true;
        report.warning = "Relationship classification failed for '" + topic.label + "': " + e.what();
        std::cerr << "[EdgeBuilder] " << report.warning << std::endl;
        return report;
    }

    if (relations.size() != ranked.size()) {
        report.classifierDegraded = true;
        report.warning = "Relationship classification unusable for '" + topic.label + "' (" +
                         std::to_string(relations.size()) + " labels for " +
                         std::to_string(ranked.size()) + " candidates)";
        std::cerr << "[EdgeBuilder] " << report.warning << std::endl;
        return report;
    }

    std::set<std::string> touched;
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        const EdgeCandidate& candidate = ranked[i];
        Relation relation = relations[i];
        if (relation == Relation::Unrelated || candidate.topicId == topic.id) continue;

        if (candidate.similarity < m_tuning.edgeMinSimilarity) {
            report.belowFloor++;
            continue;
        }
        if (index.areConnected(topic.id, candidate.topicId)) continue;

        switch (relation) {
            case Relation::Parent:
                if (report.parentsAccepted >= m_tuning.maxParentsPerNewTopic) break;
                if (index.isReachable(topic.id, candidate.topicId)) {
                    report.cycleRejections++;
                    break;
                }
                insertEdge(index, candidate.topicId, topic.id, EdgeType::BroaderThan, candidate.similarity);
                report.parentsAccepted++;
                touched.insert(candidate.topicId);
                break;
            case Relation::Child:
                if (report.childrenAccepted >= m_tuning.maxChildrenPerNewTopic) break;
                if (index.isReachable(candidate.topicId, topic.id)) {
                    report.cycleRejections++;
                    break;
                }
                insertEdge(index, topic.id, candidate.topicId, EdgeType::BroaderThan, candidate.similarity);
                report.childrenAccepted++;
                touched.insert(candidate.topicId);
                break;
            case Relation::Sibling: {
                if (report.siblingsAccepted >= m_tuning.maxSiblingsPerNewTopic) break;
                const std::string& a = std::min(topic.id, candidate.topicId);
                const std::string& b = std::max(topic.id, candidate.topicId);
                insertEdge(index, a, b, EdgeType::RelatedTo, candidate.similarity);
                report.siblingsAccepted++;
                touched.insert(candidate.topicId);
                break;
            }
            case Relation::Unrelated:
                break;
        }
    }

    report.pruned += enforceDegreeCaps(index, topic.id);
    for (const auto& neighbour : touched) {
        report.pruned += enforceDegreeCaps(index, neighbour);
    }
    return report;
}

std::size_t EdgeBuilder::insertEdge(TopicGraphIndex& index, const std::string& src, const std::string& dst,
                                    EdgeType type, float similarity) const {
    domain::TopicEdge edge;
    edge.id = m_ids();
    edge.src = src;
    edge.dst = dst;
    edge.type = type;
    edge.similarity = similarity;
    edge.createdAt = m_clock();
    return index.addEdge(edge, true);
}

int EdgeBuilder::enforceDegreeCaps(TopicGraphIndex& index, const std::string& topicId) const {
    std::vector<std::size_t> parents, children, related;
    for (std::size_t slot : index.edgesOf(topicId)) {
        const auto& edge = index.slot(slot).edge;
        if (edge.type == EdgeType::RelatedTo) {
            related.push_back(slot);
        } else if (edge.dst == topicId) {
            parents.push_back(slot);
        } else {
            children.push_back(slot);
        }
    }

    // Weakest first; among equal scores the most recently added goes first.
    auto trim = [&index](std::vector<std::size_t>& slots, int cap) {
        if (cap < 0 || slots.size() <= static_cast<std::size_t>(cap)) return 0;
        std::sort(slots.begin(), slots.end(), [&index](std::size_t a, std::size_t b) {
            float sa = index.slot(a).edge.similarity;
            float sb = index.slot(b).edge.similarity;
            if (sa != sb) return sa < sb;
            return a > b;
        });
        int excess = static_cast<int>(slots.size()) - cap;
        for (int i = 0; i < excess; ++i) index.removeEdge(slots[static_cast<std::size_t>(i)]);
        return excess;
    };

    return trim(parents, m_tuning.maxParentsPerNode) +
           trim(children, m_tuning.maxChildrenPerNode) +
           trim(related, m_tuning.maxRelatedPerNode);
}

} // namespace orion::application
