#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>

namespace orion::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;
constexpr double kDeterministicTopP = 1.0;
constexpr int kDeterministicSeed = 42;

void LogTransportFailure(const char* endpoint, const httplib::Result& res) {
    if (res) {
        std::cerr << "[OllamaClient] " << endpoint << " HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[OllamaClient] " << endpoint << " connection failed: " << httplib::to_string(res.error()) << std::endl;
    }
}
}

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::optional<std::string> OllamaClient::chat(const std::string& model,
                                              const nlohmann::json& messages,
                                              bool forceJson) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(600);

    json requestData = {
        {"model", model},
        {"messages", messages},
        {"stream", false},
        {"options", {
            {"temperature", kDeterministicTemperature},
            {"top_p", kDeterministicTopP},
            {"seed", kDeterministicSeed}
        }}
    };
    if (forceJson) {
        requestData["format"] = "json";
    }

    auto res = cli.Post("/api/chat", requestData.dump(), "application/json");
    if (!res || res->status != 200) {
        LogTransportFailure("/api/chat", res);
        return std::nullopt;
    }
    try {
        auto body = json::parse(res->body);
        if (body.contains("message") && body["message"].contains("content")) {
            return body["message"]["content"].get<std::string>();
        }
        std::cerr << "[OllamaClient] Chat response without message content" << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Chat JSON Parse Error: " << e.what() << std::endl;
    }
    return std::nullopt;
}

std::vector<float> OllamaClient::getEmbedding(const std::string& model, const std::string& text) {
    httplib::Client cli(m_host, m_port);
    cli.set_read_timeout(180);

    json requestData = {
        {"model", model},
        {"prompt", text}
    };

    auto res = cli.Post("/api/embeddings", requestData.dump(), "application/json");
    if (!res || res->status != 200) {
        LogTransportFailure("/api/embeddings", res);
        return {};
    }
    try {
        auto body = json::parse(res->body);
        if (body.contains("embedding") && body["embedding"].is_array()) {
            return body["embedding"].get<std::vector<float>>();
        }
        std::cerr << "[OllamaClient] Embedding response without embedding array" << std::endl;
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Embedding JSON Parse Error: " << e.what() << std::endl;
    }
    return {};
}

} // namespace orion::infrastructure
