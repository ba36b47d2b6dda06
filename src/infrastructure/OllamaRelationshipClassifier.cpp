/**
 * @file OllamaRelationshipClassifier.cpp
 * @brief Implementation of OllamaRelationshipClassifier.
 */

#include "infrastructure/OllamaRelationshipClassifier.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace orion::infrastructure {

using json = nlohmann::json;

namespace {

const char* kSystemPrompt =
    "You organize topics of a personal knowledge graph into a hierarchy.\n"
    "For each candidate topic decide how it relates to the subject topic:\n"
    "- PARENT: the candidate is a broader concept that contains the subject.\n"
    "- CHILD: the candidate is a narrower concept contained in the subject.\n"
    "- SIBLING: both are at the same level and closely related.\n"
    "- UNRELATED: none of the above.\n"
    "Answer ONLY with JSON of the form {\"relations\": [\"PARENT\", \"SIBLING\", ...]} "
    "with exactly one entry per candidate, in the given order.";

std::string ToUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // namespace

OllamaRelationshipClassifier::OllamaRelationshipClassifier(std::shared_ptr<OllamaClient> client, std::string model)
    : m_client(std::move(client)), m_model(std::move(model)) {}

std::string OllamaRelationshipClassifier::BuildPrompt(const std::string& subjectLabel,
                                                      const std::vector<domain::RelationshipCandidate>& candidates) {
    std::ostringstream prompt;
    prompt << "Subject topic: \"" << subjectLabel << "\"\n";
    prompt << "Candidates (" << candidates.size() << "):\n";
    for (std::size_t i = 0; i < candidates.size(); ++i) {
        prompt << (i + 1) << ". " << candidates[i].label << "\n";
    }
    return prompt.str();
}

std::vector<domain::Relation> OllamaRelationshipClassifier::ParseRelations(const std::string& response,
                                                                           std::size_t expected) {
    json body = json::parse(response, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("relations") || !body["relations"].is_array()) {
        std::cerr << "[OllamaRelationshipClassifier] Malformed response: " << response << std::endl;
        return {};
    }

    const auto& entries = body["relations"];
    if (entries.size() != expected) {
        std::cerr << "[OllamaRelationshipClassifier] Expected " << expected << " relations, got "
                  << entries.size() << std::endl;
        return {};
    }

    std::vector<domain::Relation> relations;
    relations.reserve(expected);
    for (const auto& entry : entries) {
        if (!entry.is_string()) {
            std::cerr << "[OllamaRelationshipClassifier] Non-string relation: " << entry.dump() << std::endl;
            return {};
        }
        auto relation = domain::RelationFromString(ToUpper(entry.get<std::string>()));
        if (!relation) {
            std::cerr << "[OllamaRelationshipClassifier] Unknown relation: " << entry.get<std::string>() << std::endl;
            return {};
        }
        relations.push_back(*relation);
    }
    return relations;
}

std::vector<domain::Relation> OllamaRelationshipClassifier::classify(
    const std::string& subjectLabel,
    const std::vector<domain::RelationshipCandidate>& candidates) {
    if (candidates.empty()) return {};

    json messages = json::array({
        {{"role", "system"}, {"content", kSystemPrompt}},
        {{"role", "user"}, {"content", BuildPrompt(subjectLabel, candidates)}}
    });

    auto response = m_client->chat(m_model, messages, true);
    if (!response) {
        std::cerr << "[OllamaRelationshipClassifier] No response for '" << subjectLabel << "'" << std::endl;
        return {};
    }
    return ParseRelations(*response, candidates.size());
}

} // namespace orion::infrastructure
