/**
 * @file InMemoryGraphStore.hpp
 * @brief Process-local GraphStore with snapshot isolation.
 */

#pragma once

#include <map>
#include <mutex>
#include <vector>
#include "domain/GraphStore.hpp"

namespace orion::infrastructure {

/**
 * @class InMemoryGraphStore
 * @brief Keeps every graph in memory and publishes transactions by swapping table copies.
 *
 * Writers are serialized by one mutex held for the whole transaction. The
 * state mutex is only held while copying or swapping, so readers never wait
 * on transaction work. Subclasses make commits durable by overriding the
 * persist hooks, which run before anything is published.
 */
class InMemoryGraphStore : public domain::GraphStore {
public:
    InMemoryGraphStore() = default;
    ~InMemoryGraphStore() override = default;

    InMemoryGraphStore(const InMemoryGraphStore&) = delete;
    InMemoryGraphStore& operator=(const InMemoryGraphStore&) = delete;

    std::vector<domain::Graph> listGraphs() const override;
    std::optional<domain::Graph> findGraph(const std::string& graphId) const override;
    void createGraph(const domain::Graph& graph) override;
    void dropGraph(const std::string& graphId) override;
    domain::GraphTables snapshot(const std::string& graphId) const override;
    void transact(const std::string& graphId, const std::function<void(domain::GraphTables&)>& work) override;

protected:
    struct GraphState {
        domain::Graph graph;
        domain::GraphTables tables;
    };

    /** @brief Called before the tables of a graph are published. Throw to abort the commit. */
    virtual void persistTables(const domain::Graph& graph, const domain::GraphTables& tables);

    /** @brief Called before the set of graphs changes. Throw to abort. */
    virtual void persistRegistry(const std::vector<domain::Graph>& graphs);

    /** @brief Called after a graph was dropped. */
    virtual void discardTables(const std::string& graphId);

    /** @brief Replaces the whole contents. Used by subclasses while loading. */
    void restore(std::map<std::string, GraphState> states);

private:
    std::vector<domain::Graph> sortedGraphs(const std::map<std::string, GraphState>& states) const;

    mutable std::mutex m_stateMutex;
    std::mutex m_writeMutex;
    std::map<std::string, GraphState> m_states;
};

} // namespace orion::infrastructure
