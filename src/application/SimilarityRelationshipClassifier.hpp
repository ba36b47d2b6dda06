/**
 * @file SimilarityRelationshipClassifier.hpp
 * @brief Deterministic classifier used when no language model is configured.
 */

#pragma once
#include "domain/RelationshipClassifier.hpp"

namespace orion::application {

/**
 * @class SimilarityRelationshipClassifier
 * @brief Marks every candidate at or above the threshold as a sibling, the rest as unrelated.
 *
 * Produces only undirected related_to edges, so the hierarchy stays flat.
 */
class SimilarityRelationshipClassifier : public domain::RelationshipClassifier {
public:
    explicit SimilarityRelationshipClassifier(float threshold) : m_threshold(threshold) {}

    std::vector<domain::Relation> classify(const std::string& subjectLabel,
                                           const std::vector<domain::RelationshipCandidate>& candidates) override {
        (void)subjectLabel;
        std::vector<domain::Relation> relations;
        relations.reserve(candidates.size());
        for (const auto& candidate : candidates) {
            relations.push_back(candidate.similarity >= m_threshold ? domain::Relation::Sibling
                                                                    : domain::Relation::Unrelated);
        }
        return relations;
    }

private:
    float m_threshold;
};

} // namespace orion::application
