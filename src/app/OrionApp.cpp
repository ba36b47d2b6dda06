/**
 * @file OrionApp.cpp
 * @brief Implementation of OrionApp: composition root and command handlers.
 */

#include "app/OrionApp.hpp"
#include "application/SimilarityRelationshipClassifier.hpp"
#include "domain/GraphErrors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FileGraphStore.hpp"
#include "infrastructure/GraphJsonCodec.hpp"
#include "infrastructure/OllamaRelationshipClassifier.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace orion::app {

using json = nlohmann::json;
using infrastructure::GraphJsonCodec;

namespace {

const char* kUsage =
    "usage: orion [--root DIR] <command> [args]\n"
    "  graphs\n"
    "  create-graph NAME\n"
    "  delete-graph ID\n"
    "  reset-graph ID\n"
    "  ingest [--graph ID] FILE.json...\n"
    "  show [--graph ID]\n"
    "  items --topic ID [--graph ID]\n"
    "  project [--graph ID]\n"
    "  clusters [--graph ID]\n"
    "  search [--graph ID] (--vector FILE.json | --text TEXT) [--top N]\n"
    "  delete-topic ID [--graph ID]\n"
    "  delete-item ID [--graph ID]\n"
    "  settings [--graph ID] [--apply FILE.json | --reset]\n";

const std::vector<std::string> kValueFlags = {"root", "graph", "vector", "text", "top", "topic", "apply"};

/// Sends std::cout to std::cerr for as long as it lives.
class StdoutToStderr {
public:
    StdoutToStderr() : m_saved(std::cout.rdbuf(std::cerr.rdbuf())) {}
    ~StdoutToStderr() { std::cout.rdbuf(m_saved); }

    StdoutToStderr(const StdoutToStderr&) = delete;
    StdoutToStderr& operator=(const StdoutToStderr&) = delete;

    std::streambuf* original() const { return m_saved; }

private:
    std::streambuf* m_saved;
};

json ReadJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) throw domain::ValidationError::invalid(path, "cannot open file");
    try {
        json j;
        file >> j;
        return j;
    } catch (const json::exception& e) {
        throw domain::ValidationError::invalid(path, e.what());
    }
}

const std::string& RequirePositional(const CommandLine& cmd, const std::string& name) {
    if (cmd.positionals.empty()) throw domain::ValidationError::required(name);
    return cmd.positionals.front();
}

std::string ChangeTypeToString(domain::SettingsChangeType change) {
    switch (change) {
        case domain::SettingsChangeType::None: return "none";
        case domain::SettingsChangeType::Search: return "search";
        case domain::SettingsChangeType::Umap: return "umap";
        case domain::SettingsChangeType::Graph: return "graph";
    }
    return "none";
}

json ItemsToJson(const std::vector<domain::Item>& items) {
    json out = json::array();
    for (const auto& item : items) out.push_back(GraphJsonCodec::ItemToJson(item));
    return out;
}

json EdgesToJson(const std::vector<domain::TopicEdge>& edges) {
    json out = json::array();
    for (const auto& edge : edges) out.push_back(GraphJsonCodec::EdgeToJson(edge));
    return out;
}

json IngestionResultToJson(const application::IngestionResult& result) {
    json out = {
        {"skippedDuplicate", result.skippedDuplicate},
        {"item", result.item ? GraphJsonCodec::ItemToJson(*result.item) : json(nullptr)},
        {"newTopics", json::array()},
        {"topicsReused", result.topicsReused},
        {"edgesAdded", result.edgesAdded},
        {"edgesRemoved", result.edgesRemoved},
        {"cycleRejections", result.cycleRejections},
        {"warnings", result.warnings}
    };
    for (const auto& topic : result.newTopics) out["newTopics"].push_back(GraphJsonCodec::TopicToJson(topic));
    return out;
}

json ClusterToJson(const application::ClusterWithEdges& entry) {
    const auto& cluster = entry.cluster;
    json out = {
        {"id", cluster.id},
        {"centroidId", cluster.centroidId},
        {"memberIds", cluster.memberIds},
        {"centroidPosition", {
            {"x", cluster.centroidPosition.x},
            {"y", cluster.centroidPosition.y},
            {"z", cluster.centroidPosition.z}
        }},
        {"color", entry.color},
        {"edges", EdgesToJson(entry.edges)},
        {"edgeDepths", json::object()},
        {"edgeDirections", json::object()}
    };
    for (const auto& [edgeId, depth] : entry.edgeDepths) out["edgeDepths"][edgeId] = depth;
    for (const auto& [edgeId, direction] : entry.edgeDirections) {
        out["edgeDirections"][edgeId] = {{"from", direction.from}, {"to", direction.to}};
    }
    return out;
}

json TopicResultsToJson(const std::vector<application::TopicSearchResult>& results) {
    json out = json::array();
    for (const auto& result : results) {
        json topic = GraphJsonCodec::TopicViewToJson(result.topic);
        topic["similarity"] = result.similarity;
        out.push_back(topic);
    }
    return out;
}

json SearchResultToJson(const application::SearchResult& result) {
    json out = {
        {"matchedTopics", TopicResultsToJson(result.matchedTopics)},
        {"highlightedTopics", TopicResultsToJson(result.highlightedTopics)},
        {"edges", EdgesToJson(result.edges)},
        {"items", json::array()}
    };
    for (const auto& entry : result.items) {
        json item = GraphJsonCodec::ItemToJson(entry.item);
        item["similarity"] = entry.similarity ? json(*entry.similarity) : json(nullptr);
        out["items"].push_back(item);
    }
    return out;
}

json ErrorToJson(const std::string& code, const std::string& message) {
    return {{"error", {{"code", code}, {"message", message}}}};
}

} // namespace

bool CommandLine::hasFlag(const std::string& name) const {
    return std::find(flags.begin(), flags.end(), name) != flags.end();
}

std::string CommandLine::option(const std::string& name, const std::string& fallback) const {
    auto it = options.find(name);
    return it != options.end() ? it->second : fallback;
}

CommandLine CommandLine::Parse(int argc, char** argv) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0 && arg.size() > 2) {
            std::string name = arg.substr(2);
            if (std::find(kValueFlags.begin(), kValueFlags.end(), name) != kValueFlags.end()) {
                if (i + 1 >= argc) throw domain::ValidationError::invalid(arg, "missing value");
                cmd.options[name] = argv[++i];
            } else {
                cmd.flags.push_back(name);
            }
        } else if (cmd.command.empty()) {
            cmd.command = arg;
        } else {
            cmd.positionals.push_back(arg);
        }
    }
    return cmd;
}

int OrionApp::Run(int argc, char** argv) {
    StdoutToStderr redirect;
    std::ostream out(redirect.original());

    int exitCode = 0;
    json result;
    try {
        CommandLine cmd = CommandLine::Parse(argc, argv);
        if (cmd.command.empty() || cmd.hasFlag("help")) {
            std::cerr << kUsage;
            return cmd.hasFlag("help") ? 0 : 2;
        }

        Init(cmd.option("root", std::filesystem::current_path().string()));
        result = Dispatch(cmd);
    } catch (const domain::ValidationError& e) {
        std::cerr << ErrorToJson(e.code(), e.what()).dump() << std::endl;
        exitCode = 2;
    } catch (const domain::GraphError& e) {
        std::cerr << ErrorToJson(e.code(), e.what()).dump() << std::endl;
        exitCode = 1;
    } catch (const std::exception& e) {
        std::cerr << ErrorToJson("INTERNAL_ERROR", e.what()).dump() << std::endl;
        exitCode = 1;
    }

    // Background recomputes must land before the process exits.
    Shutdown();
    if (exitCode == 0) out << result.dump(2) << std::endl;
    return exitCode;
}

void OrionApp::Init(const std::string& root) {
    m_root = root;
    std::filesystem::create_directories(root);

    // Dependency Injection / Composition Root
    auto appSettings = infrastructure::ConfigLoader::LoadAppSettings(root);

    m_services.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    m_services.store = std::make_shared<infrastructure::FileGraphStore>(root, m_services.persistenceService);
    m_services.settingsService = std::make_shared<application::SettingsService>(root);
    m_services.ollamaClient = std::make_shared<infrastructure::OllamaClient>(appSettings.ollamaHost, appSettings.ollamaPort);

    if (appSettings.classifier == "ollama") {
        m_services.classifier = std::make_shared<infrastructure::OllamaRelationshipClassifier>(
            m_services.ollamaClient, appSettings.ollamaModel);
    } else {
        if (appSettings.classifier != "similarity") {
            std::cerr << "[OrionApp] Unknown classifier '" << appSettings.classifier
                      << "', falling back to similarity" << std::endl;
        }
        m_services.classifier = std::make_shared<application::SimilarityRelationshipClassifier>(
            domain::GraphTuning{}.edgeMinSimilarity);
    }

    m_services.taskManager = std::make_shared<application::AsyncTaskManager>();
    m_services.graphService = std::make_shared<application::GraphService>(
        m_services.store, m_services.settingsService, m_services.taskManager);
    m_services.graphService->InitializeGraphs();

    std::weak_ptr<application::GraphService> graphs = m_services.graphService;
    m_services.ingestionService = std::make_shared<application::IngestionService>(
        m_services.store, m_services.settingsService, m_services.classifier,
        [graphs](const std::string& graphId) {
            if (auto service = graphs.lock()) service->ScheduleRecompute(graphId);
        });
    m_services.searchEngine = std::make_shared<application::SearchEngine>(m_services.store, m_services.settingsService);

    m_services.settingsService->SetChangeListener(
        [graphs](const std::string& graphId, domain::SettingsChangeType change) {
            if (change != domain::SettingsChangeType::Graph && change != domain::SettingsChangeType::Umap) return;
            if (auto service = graphs.lock()) service->ScheduleRecompute(graphId);
        });

    std::cout << "[OrionApp] Project root: " << root << " (classifier: " << appSettings.classifier << ")" << std::endl;
}

void OrionApp::Shutdown() {
    if (!m_services.taskManager) return;
    m_services.taskManager->WaitForIdle();
    for (const auto& task : m_services.taskManager->GetActiveTasks()) {
        if (task->failed) {
            std::cerr << "[OrionApp] Background task failed: " << task->description << ": "
                      << task->errorMessage << std::endl;
        }
    }
    m_services.taskManager->CleanupCompletedTasks();
}

std::string OrionApp::graphOf(const CommandLine& cmd) const {
    return cmd.option("graph", domain::kDefaultGraphId);
}

json OrionApp::Dispatch(const CommandLine& cmd) {
    const std::string& c = cmd.command;
    if (c == "graphs") return CmdGraphs();
    if (c == "create-graph") return CmdCreateGraph(cmd);
    if (c == "delete-graph") return CmdDeleteGraph(cmd);
    if (c == "reset-graph") return CmdResetGraph(cmd);
    if (c == "ingest") return CmdIngest(cmd);
    if (c == "show") return CmdShow(cmd);
    if (c == "items") return CmdItems(cmd);
    if (c == "project") return CmdProject(cmd);
    if (c == "clusters") return CmdClusters(cmd);
    if (c == "search") return CmdSearch(cmd);
    if (c == "delete-topic") return CmdDeleteTopic(cmd);
    if (c == "delete-item") return CmdDeleteItem(cmd);
    if (c == "settings") return CmdSettings(cmd);
    std::cerr << kUsage;
    throw domain::ValidationError::invalid("command", "unknown command '" + c + "'");
}

json OrionApp::CmdGraphs() {
    json out = json::array();
    for (const auto& graph : m_services.graphService->ListGraphs()) {
        out.push_back(GraphJsonCodec::GraphToJson(graph));
    }
    return out;
}

json OrionApp::CmdCreateGraph(const CommandLine& cmd) {
    const std::string& name = RequirePositional(cmd, "name");
    return {{"id", m_services.graphService->CreateGraph(name)}, {"name", name}};
}

json OrionApp::CmdDeleteGraph(const CommandLine& cmd) {
    const std::string& graphId = RequirePositional(cmd, "graph id");
    m_services.graphService->DeleteGraph(graphId);
    return {{"deleted", graphId}};
}

json OrionApp::CmdResetGraph(const CommandLine& cmd) {
    const std::string& graphId = RequirePositional(cmd, "graph id");
    m_services.graphService->ResetGraph(graphId);
    return {{"reset", graphId}};
}

json OrionApp::CmdIngest(const CommandLine& cmd) {
    if (cmd.positionals.empty()) throw domain::ValidationError::required("file");
    const std::string graphId = graphOf(cmd);

    json out = json::array();
    for (const auto& path : cmd.positionals) {
        json doc = ReadJsonFile(path);
        std::vector<json> pages = doc.is_array() ? doc.get<std::vector<json>>() : std::vector<json>{doc};
        for (const auto& page : pages) {
            auto result = m_services.ingestionService->Ingest(graphId, GraphJsonCodec::PageResultFromJson(page));
            out.push_back(IngestionResultToJson(result));
        }
    }
    return out;
}

json OrionApp::CmdShow(const CommandLine& cmd) {
    auto data = m_services.graphService->GetGraphData(graphOf(cmd));
    json out = {
        {"topics", json::array()},
        {"items", ItemsToJson(data.items)},
        {"edges", EdgesToJson(data.edges)},
        {"itemsByTopic", data.itemsByTopic}
    };
    for (const auto& topic : data.topics) out["topics"].push_back(GraphJsonCodec::TopicViewToJson(topic));
    return out;
}

json OrionApp::CmdItems(const CommandLine& cmd) {
    const std::string topicId = cmd.option("topic");
    if (topicId.empty()) throw domain::ValidationError::required("--topic");
    return ItemsToJson(m_services.graphService->GetItemsForTopic(graphOf(cmd), topicId));
}

json OrionApp::CmdProject(const CommandLine& cmd) {
    const std::string graphId = graphOf(cmd);
    m_services.graphService->RecomputeTopicPositions(graphId);

    json out = json::array();
    for (const auto& topic : m_services.graphService->GetGraphData(graphId).topics) {
        out.push_back(GraphJsonCodec::TopicViewToJson(topic));
    }
    return out;
}

json OrionApp::CmdClusters(const CommandLine& cmd) {
    const std::string graphId = graphOf(cmd);
    if (m_services.graphService->ShouldRecomputePositions(graphId)) {
        m_services.graphService->RecomputeTopicPositions(graphId);
    }

    json out = json::array();
    for (const auto& cluster : m_services.graphService->GetClustersWithEdges(graphId)) {
        out.push_back(ClusterToJson(cluster));
    }
    return out;
}

json OrionApp::CmdSearch(const CommandLine& cmd) {
    const std::string graphId = graphOf(cmd);

    std::vector<float> query;
    if (!cmd.option("vector").empty()) {
        json vec = ReadJsonFile(cmd.option("vector"));
        if (!vec.is_array()) throw domain::ValidationError::invalid("--vector", "expected an array of numbers");
        try {
            query = vec.get<std::vector<float>>();
        } catch (const json::exception& e) {
            throw domain::ValidationError::invalid("--vector", e.what());
        }
    } else if (!cmd.option("text").empty()) {
        auto appSettings = infrastructure::ConfigLoader::LoadAppSettings(m_root);
        query = m_services.ollamaClient->getEmbedding(appSettings.embeddingModel, cmd.option("text"));
        if (query.empty()) {
            throw domain::GraphError("Could not embed query text with " + appSettings.embeddingModel);
        }
    } else {
        throw domain::ValidationError::required("--vector or --text");
    }

    application::SearchOptions options;
    if (!cmd.option("top").empty()) {
        try {
            options.topicCount = std::stoi(cmd.option("top"));
        } catch (const std::exception&) {
            throw domain::ValidationError::invalid("--top", "not a number: " + cmd.option("top"));
        }
    }
    return SearchResultToJson(m_services.searchEngine->Search(graphId, query, options));
}

json OrionApp::CmdDeleteTopic(const CommandLine& cmd) {
    const std::string& topicId = RequirePositional(cmd, "topic id");
    m_services.graphService->DeleteTopic(graphOf(cmd), topicId);
    return {{"deleted", topicId}};
}

json OrionApp::CmdDeleteItem(const CommandLine& cmd) {
    const std::string& itemId = RequirePositional(cmd, "item id");
    m_services.graphService->DeleteItem(graphOf(cmd), itemId);
    return {{"deleted", itemId}};
}

json OrionApp::CmdSettings(const CommandLine& cmd) {
    const std::string graphId = graphOf(cmd);
    if (!m_services.store->findGraph(graphId)) throw domain::StorageError::notFound("Graph", graphId);

    auto change = domain::SettingsChangeType::None;
    if (cmd.hasFlag("reset")) {
        change = m_services.settingsService->ResetSettings(graphId);
    } else if (!cmd.option("apply").empty()) {
        auto settings = infrastructure::ConfigLoader::GraphSettingsFromJson(ReadJsonFile(cmd.option("apply")));
        change = m_services.settingsService->SaveSettings(graphId, settings);
    }

    json out = infrastructure::ConfigLoader::GraphSettingsToJson(m_services.settingsService->GetSettings(graphId));
    out["graphId"] = graphId;
    out["change"] = ChangeTypeToString(change);
    return out;
}

} // namespace orion::app
