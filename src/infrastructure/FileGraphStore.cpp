/**
 * @file FileGraphStore.cpp
 * @brief Implementation of FileGraphStore.
 */

#include "infrastructure/FileGraphStore.hpp"
#include "infrastructure/GraphJsonCodec.hpp"
#include "domain/GraphErrors.hpp"
#include <cctype>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace orion::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json ReadJsonFile(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw domain::StorageError::transactionFailed("load " + path.string(), "cannot open file");
    }
    try {
        json j;
        file >> j;
        return j;
    } catch (const json::exception& e) {
        throw domain::StorageError::transactionFailed("load " + path.string(), e.what());
    }
}

bool IsSafeGraphId(const std::string& graphId) {
    if (graphId.empty()) return false;
    for (char ch : graphId) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (!std::isalnum(c) && ch != '-' && ch != '_') return false;
    }
    return true;
}

} // namespace

FileGraphStore::FileGraphStore(std::string root, std::shared_ptr<PersistenceService> persistence)
    : m_root(std::move(root)), m_persistence(std::move(persistence)) {
    load();
}

fs::path FileGraphStore::registryPath() const {
    return fs::path(m_root) / "graphs.json";
}

fs::path FileGraphStore::tablesPath(const std::string& graphId) const {
    return fs::path(m_root) / "graphs" / (graphId + ".json");
}

void FileGraphStore::load() {
    if (!fs::exists(registryPath())) {
        std::cout << "[FileGraphStore] No snapshot under " << m_root << ", starting empty" << std::endl;
        return;
    }

    json registry = ReadJsonFile(registryPath());
    std::map<std::string, GraphState> states;
    for (const auto& entry : registry.value("graphs", json::array())) {
        domain::Graph graph = GraphJsonCodec::GraphFromJson(entry);
        GraphState state{graph, domain::GraphTables(graph.id)};
        if (fs::exists(tablesPath(graph.id))) {
            try {
                state.tables = GraphJsonCodec::TablesFromJson(graph.id, ReadJsonFile(tablesPath(graph.id)));
            } catch (const domain::StorageError&) {
                throw;
            } catch (const domain::GraphError& e) {
                throw domain::StorageError::transactionFailed("load graph " + graph.id, e.what());
            }
        }
        states.emplace(graph.id, std::move(state));
    }

    std::cout << "[FileGraphStore] Loaded " << states.size() << " graphs from " << m_root << std::endl;
    restore(std::move(states));
}

void FileGraphStore::persistTables(const domain::Graph& graph, const domain::GraphTables& tables) {
    if (!IsSafeGraphId(graph.id)) {
        throw domain::ValidationError::invalid("graph.id", "'" + graph.id + "' is not a valid file name");
    }
    m_persistence->saveTextSync(tablesPath(graph.id).string(), GraphJsonCodec::TablesToJson(tables).dump());
}

void FileGraphStore::persistRegistry(const std::vector<domain::Graph>& graphs) {
    json registry;
    registry["graphs"] = json::array();
    for (const auto& graph : graphs) registry["graphs"].push_back(GraphJsonCodec::GraphToJson(graph));
    m_persistence->saveTextSync(registryPath().string(), registry.dump(2));
}

void FileGraphStore::discardTables(const std::string& graphId) {
    std::error_code ec;
    fs::remove(tablesPath(graphId), ec);
    if (ec) {
        std::cerr << "[FileGraphStore] Could not remove tables of " << graphId << ": " << ec.message() << std::endl;
    }
}

} // namespace orion::infrastructure
