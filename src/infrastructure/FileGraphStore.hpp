/**
 * @file FileGraphStore.hpp
 * @brief GraphStore persisted as JSON snapshots under a root directory.
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "infrastructure/InMemoryGraphStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace orion::infrastructure {

/**
 * @class FileGraphStore
 * @brief Durable variant of InMemoryGraphStore.
 *
 * Layout:
 *   <root>/graphs.json           registry of graphs
 *   <root>/graphs/<graphId>.json the five collections of one graph
 *
 * Every commit is written atomically before it becomes visible to readers.
 */
class FileGraphStore : public InMemoryGraphStore {
public:
    /**
     * @brief Loads any existing snapshot under root.
     * @throws domain::StorageError if a snapshot cannot be read.
     */
    FileGraphStore(std::string root, std::shared_ptr<PersistenceService> persistence);

    const std::string& root() const { return m_root; }

protected:
    void persistTables(const domain::Graph& graph, const domain::GraphTables& tables) override;
    void persistRegistry(const std::vector<domain::Graph>& graphs) override;
    void discardTables(const std::string& graphId) override;

private:
    void load();
    std::filesystem::path registryPath() const;
    std::filesystem::path tablesPath(const std::string& graphId) const;

    std::string m_root;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace orion::infrastructure
