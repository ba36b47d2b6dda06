/**
 * @file OllamaRelationshipClassifier.hpp
 * @brief Relationship classifier backed by an Ollama chat model.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>
#include "domain/RelationshipClassifier.hpp"
#include "infrastructure/OllamaClient.hpp"

namespace orion::infrastructure {

/**
 * @class OllamaRelationshipClassifier
 * @brief Asks a language model whether each candidate is a parent, child or sibling of a topic.
 *
 * The model must answer {"relations": ["PARENT", ...]} with one token per
 * candidate. Anything else is treated as no answer.
 */
class OllamaRelationshipClassifier : public domain::RelationshipClassifier {
public:
    OllamaRelationshipClassifier(std::shared_ptr<OllamaClient> client, std::string model);

    std::vector<domain::Relation> classify(const std::string& subjectLabel,
                                           const std::vector<domain::RelationshipCandidate>& candidates) override;

    /** @brief Builds the user message listing the candidates. */
    static std::string BuildPrompt(const std::string& subjectLabel,
                                   const std::vector<domain::RelationshipCandidate>& candidates);

    /**
     * @brief Parses a model answer.
     * @return One relation per candidate, or empty when the answer is malformed,
     *         contains an unknown token, or has the wrong length.
     */
    static std::vector<domain::Relation> ParseRelations(const std::string& response, std::size_t expected);

private:
    std::shared_ptr<OllamaClient> m_client;
    std::string m_model;
};

} // namespace orion::infrastructure
