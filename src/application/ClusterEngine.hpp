/**
 * @file ClusterEngine.hpp
 * @brief Community detection, cluster centroids and the per-cluster spanning structure.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "domain/GraphModel.hpp"
#include "domain/GraphTables.hpp"

namespace orion::application {

/**
 * @struct ClusterInfo
 * @brief One detected community with its medoid topic.
 */
struct ClusterInfo {
    int id = 0;
    std::string centroidId;
    std::vector<std::string> memberIds;
    domain::Position3 centroidPosition;
};

struct EdgeDirection {
    std::string from;
    std::string to;
};

/**
 * @struct ClusterWithEdges
 * @brief A cluster decorated for rendering: color and a tree of edges rooted at the centroid.
 */
struct ClusterWithEdges {
    ClusterInfo cluster;
    std::string color;
    std::vector<domain::TopicEdge> edges;
    std::map<std::string, int> edgeDepths;              ///< edge id -> BFS depth (1 for centroid edges)
    std::map<std::string, EdgeDirection> edgeDirections; ///< edge id -> traversal direction
};

/**
 * @class ClusterEngine
 * @brief Deterministic Louvain partition over the undirected, similarity-weighted topic graph.
 */
class ClusterEngine {
public:
    ClusterEngine(double resolution, int minClusterSize)
        : m_resolution(resolution), m_minClusterSize(minClusterSize) {}

    /**
     * @brief Partitions the given topics.
     * @param topics Topics to cluster. Edges with an endpoint outside this set are ignored.
     * @param edges Candidate edges, any type.
     * @param embeddings Topic id -> embedding. Members without one are left out of their cluster.
     */
    std::vector<ClusterInfo> identifyClusters(const std::vector<domain::Topic>& topics,
                                              const std::vector<domain::TopicEdge>& edges,
                                              const std::map<std::string, std::vector<float>>& embeddings) const;

    /** @brief Convenience overload over a whole graph. */
    std::vector<ClusterInfo> identifyClusters(const domain::GraphTables& tables) const;

    /** @brief Adds colors and spanning edges to each cluster, in cluster order. */
    static std::vector<ClusterWithEdges> computeClustersWithEdges(const std::vector<ClusterInfo>& clusters,
                                                                  const std::vector<domain::TopicEdge>& edges);

    /**
     * @brief Multi-level Louvain on sorted node ids.
     * @return node id -> community number, numbered by first appearance in id order.
     */
    static std::map<std::string, int> detectCommunities(const std::vector<std::string>& nodeIds,
                                                        const std::vector<domain::TopicEdge>& edges,
                                                        double resolution);

    /** @brief Fixed palette for the first clusters, golden-angle hues after it. */
    static std::string clusterColor(std::size_t index);

private:
    double m_resolution;
    int m_minClusterSize;
};

} // namespace orion::application
