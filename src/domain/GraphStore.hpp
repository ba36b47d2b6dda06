/**
 * @file GraphStore.hpp
 * @brief Interface for the persistent, transactional graph store.
 */

#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "domain/GraphModel.hpp"
#include "domain/GraphTables.hpp"

namespace orion::domain {

/**
 * @class GraphStore
 * @brief Abstract store holding every graph and its five collections.
 *
 * Readers work on snapshots and never observe a partially applied transaction.
 */
class GraphStore {
public:
    virtual ~GraphStore() = default;

    /** @brief All registered graphs ordered by creation time. */
    virtual std::vector<Graph> listGraphs() const = 0;

    virtual std::optional<Graph> findGraph(const std::string& graphId) const = 0;

    /** @brief Registers a new, empty graph. Throws StorageError on duplicate id. */
    virtual void createGraph(const Graph& graph) = 0;

    /** @brief Removes a graph and all of its rows. */
    virtual void dropGraph(const std::string& graphId) = 0;

    /**
     * @brief Returns a consistent copy of a graph's tables.
     * @throws StorageError if the graph does not exist.
     */
    virtual GraphTables snapshot(const std::string& graphId) const = 0;

    /**
     * @brief Runs work against a private copy of the graph's tables and publishes it atomically.
     *
     * If work throws, nothing is published and the exception propagates.
     * @throws StorageError if the graph does not exist or the commit cannot be made durable.
     */
    virtual void transact(const std::string& graphId, const std::function<void(GraphTables&)>& work) = 0;
};

} // namespace orion::domain
