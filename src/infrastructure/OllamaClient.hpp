/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace orion::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /**
     * @brief Sends a POST request to /api/chat.
     * @param forceJson Asks the model to answer with a JSON document.
     * @return The assistant message content, or nullopt on transport or parse failure.
     */
    std::optional<std::string> chat(const std::string& model,
                                    const nlohmann::json& messages,
                                    bool forceJson = false);

    /** @brief Sends a POST request to /api/embeddings. Empty on failure. */
    std::vector<float> getEmbedding(const std::string& model, const std::string& text);

private:
    std::string m_host;
    int m_port;
};

} // namespace orion::infrastructure
