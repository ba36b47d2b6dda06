/**
 * @file RelationshipClassifier.hpp
 * @brief Interface for the oracle that types relationships between topics.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace orion::domain {

/**
 * @enum Relation
 * @brief How a candidate topic relates to the subject topic.
 */
enum class Relation {
    Parent,   ///< The candidate is broader than the subject.
    Child,    ///< The candidate is narrower than the subject.
    Sibling,  ///< Related at the same level.
    Unrelated
};

inline std::string RelationToString(Relation relation) {
    switch (relation) {
        case Relation::Parent: return "PARENT";
        case Relation::Child: return "CHILD";
        case Relation::Sibling: return "SIBLING";
        case Relation::Unrelated: return "UNRELATED";
    }
    return "UNRELATED";
}

inline std::optional<Relation> RelationFromString(const std::string& value) {
    if (value == "PARENT") return Relation::Parent;
    if (value == "CHILD") return Relation::Child;
    if (value == "SIBLING") return Relation::Sibling;
    if (value == "UNRELATED") return Relation::Unrelated;
    return std::nullopt;
}

/**
 * @struct RelationshipCandidate
 * @brief A neighbour offered to the classifier, in ranking order.
 */
struct RelationshipCandidate {
    std::string label;
    float similarity = 0.0f;
};

/**
 * @class RelationshipClassifier
 * @brief Abstract capability that classifies candidates relative to a subject label.
 */
class RelationshipClassifier {
public:
    virtual ~RelationshipClassifier() = default;

    /**
     * @brief Classifies each candidate relative to the subject.
     * @param subjectLabel Label of the newly created topic.
     * @param candidates Candidates in ranking order.
     * @return One relation per candidate in the same order, or an empty vector when
     *         the classifier could not produce a usable answer. May throw on transport failure.
     */
    virtual std::vector<Relation> classify(const std::string& subjectLabel,
                                           const std::vector<RelationshipCandidate>& candidates) = 0;
};

} // namespace orion::domain
