/**
 * @file ClusterEngine.cpp
 * @brief Implementation of ClusterEngine.
 */

#include "application/ClusterEngine.hpp"
#include "application/VectorMath.hpp"
#include <algorithm>
#include <cmath>
#include <deque>
#include <numeric>
#include <set>
#include <sstream>

namespace orion::application {

namespace {

constexpr int kMaxPasses = 100;
constexpr int kMaxLevels = 32;
constexpr double kMinGain = 1e-12;

using Adjacency = std::vector<std::vector<std::pair<int, double>>>;

/// Undirected pairs in (src, dst) order; the first edge of a pair wins.
std::vector<domain::TopicEdge> sortedUniqueEdges(const std::set<std::string>& nodes,
                                                 const std::vector<domain::TopicEdge>& edges) {
    std::vector<domain::TopicEdge> sorted;
    for (const auto& e : edges) {
        if (nodes.count(e.src) && nodes.count(e.dst) && e.src != e.dst) sorted.push_back(e);
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        if (a.src != b.src) return a.src < b.src;
        return a.dst < b.dst;
    });

    std::set<std::pair<std::string, std::string>> seen;
    std::vector<domain::TopicEdge> unique;
    for (const auto& e : sorted) {
        auto key = std::minmax(e.src, e.dst);
        if (seen.insert({key.first, key.second}).second) unique.push_back(e);
    }
    return unique;
}

/**
 * @brief Local moving phase. Nodes are visited in index order; a node moves only
 * for a strictly positive improvement, ties resolving to the lowest community.
 * @return true if any node changed community.
 */
bool moveNodes(const Adjacency& adj, double resolution, std::vector<int>& community) {
    const std::size_t n = adj.size();
    std::vector<double> k(n, 0.0);
    double m2 = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        for (const auto& [j, w] : adj[i]) k[i] += w;
        m2 += k[i];
    }
    if (m2 == 0.0) return false;

    std::vector<double> tot(n, 0.0);
    for (std::size_t i = 0; i < n; ++i) tot[community[i]] += k[i];

    auto gain = [&](std::size_t i, double kiIn, double totC) {
        return kiIn / m2 - resolution * (k[i] * totC) / (m2 * m2);
    };

    bool movedAny = false;
    bool improved = true;
    int passes = 0;
    while (improved && passes < kMaxPasses) {
        improved = false;
        passes++;

        for (std::size_t i = 0; i < n; ++i) {
            int ci = community[i];
            std::map<int, double> neighbourWeights;
            for (const auto& [j, w] : adj[i]) {
                if (static_cast<std::size_t>(j) == i) continue;
                neighbourWeights[community[j]] += w;
            }

            tot[ci] -= k[i];
            int bestC = ci;
            double bestGain = gain(i, neighbourWeights.count(ci) ? neighbourWeights[ci] : 0.0, tot[ci]);
            for (const auto& [c, kiIn] : neighbourWeights) {
                if (c == ci) continue;
                double g = gain(i, kiIn, tot[c]);
                if (g > bestGain + kMinGain) {
                    bestGain = g;
                    bestC = c;
                }
            }

            if (bestC != ci) {
                community[i] = bestC;
                improved = true;
                movedAny = true;
            }
            tot[community[i]] += k[i];
        }
    }
    return movedAny;
}

/// Renumbers communities 0..c-1 in order of first appearance. Returns c.
int renumber(std::vector<int>& community) {
    std::map<int, int> remap;
    for (int& c : community) {
        auto it = remap.find(c);
        if (it == remap.end()) it = remap.emplace(c, static_cast<int>(remap.size())).first;
        c = it->second;
    }
    return static_cast<int>(remap.size());
}

Adjacency aggregate(const Adjacency& adj, const std::vector<int>& community, int count) {
    std::vector<std::map<int, double>> weights(static_cast<std::size_t>(count));
    for (std::size_t i = 0; i < adj.size(); ++i) {
        for (const auto& [j, w] : adj[i]) {
            weights[community[i]][community[j]] += w;
        }
    }
    Adjacency next(static_cast<std::size_t>(count));
    for (int c = 0; c < count; ++c) {
        for (const auto& [d, w] : weights[c]) next[c].push_back({d, w});
    }
    return next;
}

} // namespace

std::map<std::string, int> ClusterEngine::detectCommunities(const std::vector<std::string>& nodeIds,
                                                            const std::vector<domain::TopicEdge>& edges,
                                                            double resolution) {
    std::vector<std::string> nodes = nodeIds;
    std::sort(nodes.begin(), nodes.end());
    nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());

    std::map<std::string, int> indexOf;
    for (std::size_t i = 0; i < nodes.size(); ++i) indexOf[nodes[i]] = static_cast<int>(i);

    Adjacency adj(nodes.size());
    std::set<std::string> nodeSet(nodes.begin(), nodes.end());
    for (const auto& e : sortedUniqueEdges(nodeSet, edges)) {
        double w = std::max(0.0, static_cast<double>(e.similarity));
        int a = indexOf[e.src];
        int b = indexOf[e.dst];
        adj[a].push_back({b, w});
        adj[b].push_back({a, w});
    }

    // membership[i] is the community of original node i at the current level.
    std::vector<int> membership(nodes.size());
    std::iota(membership.begin(), membership.end(), 0);

    Adjacency level = adj;
    for (int depth = 0; depth < kMaxLevels; ++depth) {
        std::vector<int> community(level.size());
        std::iota(community.begin(), community.end(), 0);
        if (!moveNodes(level, resolution, community)) break;

        int count = renumber(community);
        for (int& m : membership) m = community[m];
        if (count == static_cast<int>(level.size())) break;
        level = aggregate(level, community, count);
    }

    renumber(membership);
    std::map<std::string, int> result;
    for (std::size_t i = 0; i < nodes.size(); ++i) result[nodes[i]] = membership[i];
    return result;
}

std::vector<ClusterInfo> ClusterEngine::identifyClusters(const std::vector<domain::Topic>& topics,
                                                         const std::vector<domain::TopicEdge>& edges,
                                                         const std::map<std::string, std::vector<float>>& embeddings) const {
    std::vector<ClusterInfo> clusters;
    if (topics.size() < 2) return clusters;

    std::map<std::string, const domain::Topic*> byId;
    std::vector<std::string> ids;
    for (const auto& t : topics) {
        byId[t.id] = &t;
        ids.push_back(t.id);
    }

    auto communities = detectCommunities(ids, edges, m_resolution);

    std::map<int, std::vector<std::string>> members;
    for (const auto& [topicId, communityId] : communities) {
        members[communityId].push_back(topicId);
    }

    for (const auto& [communityId, memberIds] : members) {
        if (static_cast<int>(memberIds.size()) < m_minClusterSize) continue;

        std::vector<std::string> validMembers;
        std::vector<std::vector<float>> validEmbeddings;
        for (const auto& id : memberIds) {
            auto it = embeddings.find(id);
            if (it == embeddings.end()) continue;
            validMembers.push_back(id);
            validEmbeddings.push_back(it->second);
        }
        if (validEmbeddings.empty()) continue;

        ClusterInfo info;
        info.id = communityId;
        info.centroidId = vectormath::findSemanticMedoid(validEmbeddings, validMembers);
        info.memberIds = validMembers;
        const domain::Topic* centroid = byId[info.centroidId];
        if (centroid->position) info.centroidPosition = *centroid->position;
        clusters.push_back(info);
    }
    return clusters;
}

std::vector<ClusterInfo> ClusterEngine::identifyClusters(const domain::GraphTables& tables) const {
    std::vector<domain::Topic> topics;
    std::map<std::string, std::vector<float>> embeddings;
    for (const auto& [id, topic] : tables.topics()) {
        topics.push_back(topic);
        auto vec = tables.loadVector(domain::OwnerType::Topic, id);
        if (vec) embeddings.emplace(id, std::move(*vec));
    }
    std::vector<domain::TopicEdge> edges;
    for (const auto& [id, edge] : tables.edges()) edges.push_back(edge);
    return identifyClusters(topics, edges, embeddings);
}

std::string ClusterEngine::clusterColor(std::size_t index) {
    static const char* palette[] = {
        "#ef4444", "#3b82f6", "#10b981", "#f59e0b",
        "#8b5cf6", "#ec4899", "#06b6d4", "#f97316",
    };
    constexpr std::size_t paletteSize = sizeof(palette) / sizeof(palette[0]);
    if (index < paletteSize) return palette[index];

    double hue = std::fmod(static_cast<double>(index) * 137.5, 360.0);
    std::ostringstream out;
    out << "hsl(" << hue << ", 70%, 60%)";
    return out.str();
}

std::vector<ClusterWithEdges> ClusterEngine::computeClustersWithEdges(const std::vector<ClusterInfo>& clusters,
                                                                      const std::vector<domain::TopicEdge>& edges) {
    std::vector<domain::TopicEdge> ordered = edges;
    std::stable_sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
        if (a.src != b.src) return a.src < b.src;
        return a.dst < b.dst;
    });

    std::vector<ClusterWithEdges> result;
    result.reserve(clusters.size());

    for (std::size_t index = 0; index < clusters.size(); ++index) {
        const ClusterInfo& cluster = clusters[index];
        ClusterWithEdges decorated;
        decorated.cluster = cluster;
        decorated.color = clusterColor(index);

        std::set<std::string> memberSet(cluster.memberIds.begin(), cluster.memberIds.end());
        std::map<std::string, std::vector<std::pair<std::string, const domain::TopicEdge*>>> adjacency;
        for (const auto& edge : ordered) {
            if (!memberSet.count(edge.src) || !memberSet.count(edge.dst)) continue;
            adjacency[edge.src].push_back({edge.dst, &edge});
            adjacency[edge.dst].push_back({edge.src, &edge});
        }

        std::set<std::string> visited{cluster.centroidId};
        std::deque<std::pair<std::string, int>> queue{{cluster.centroidId, 0}};

        while (!queue.empty() && visited.size() < cluster.memberIds.size()) {
            auto [nodeId, depth] = queue.front();
            queue.pop_front();

            auto neighbours = adjacency[nodeId];
            std::stable_sort(neighbours.begin(), neighbours.end(), [](const auto& a, const auto& b) {
                return a.second->similarity > b.second->similarity;
            });

            for (const auto& [node, edge] : neighbours) {
                if (visited.count(node)) continue;
                visited.insert(node);
                decorated.edges.push_back(*edge);
                decorated.edgeDepths[edge->id] = depth + 1;
                decorated.edgeDirections[edge->id] = EdgeDirection{nodeId, node};
                queue.push_back({node, depth + 1});
            }
        }
        result.push_back(std::move(decorated));
    }
    return result;
}

} // namespace orion::application
