#include <cassert>
#include <iostream>
#include "application/ClusterEngine.hpp"

using namespace orion::application;
using orion::domain::EdgeType;
using orion::domain::Position3;
using orion::domain::Topic;
using orion::domain::TopicEdge;

namespace {

Topic MakeTopic(const std::string& id) {
    Topic topic;
    topic.id = id;
    topic.label = id;
    topic.uses = 1;
    return topic;
}

TopicEdge Related(const std::string& src, const std::string& dst, float similarity) {
    TopicEdge edge;
    edge.id = "e-" + src + dst;
    edge.src = src;
    edge.dst = dst;
    edge.type = EdgeType::RelatedTo;
    edge.similarity = similarity;
    return edge;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ClusterEngine Test..." << std::endl;

    // Two dense triangles joined by one weak bridge.
    std::vector<Topic> topics;
    for (const char* id : {"a", "b", "c", "d", "e", "f"}) topics.push_back(MakeTopic(id));
    topics[1].position = Position3{1.0f, 2.0f, 3.0f};

    std::vector<TopicEdge> edges{
        Related("a", "b", 0.9f), Related("a", "c", 0.9f), Related("b", "c", 0.9f),
        Related("d", "e", 0.9f), Related("d", "f", 0.9f), Related("e", "f", 0.9f),
        Related("c", "d", 0.1f),
    };

    std::map<std::string, std::vector<float>> embeddings{
        {"a", {1.0f, 0.2f, 0.0f}}, {"b", {1.0f, 0.0f, 0.0f}}, {"c", {1.0f, -0.2f, 0.0f}},
        {"d", {0.0f, 1.0f, 0.2f}}, {"e", {0.0f, 1.0f, 0.0f}}, {"f", {0.0f, 1.0f, -0.2f}},
    };

    ClusterEngine engine(1.0, 2);
    auto clusters = engine.identifyClusters(topics, edges, embeddings);
    assert(clusters.size() == 2);
    assert(clusters[0].id == 0 && clusters[1].id == 1);
    assert(clusters[0].memberIds == (std::vector<std::string>{"a", "b", "c"}));
    assert(clusters[1].memberIds == (std::vector<std::string>{"d", "e", "f"}));
    assert(clusters[0].centroidId == "b" && clusters[1].centroidId == "e");
    assert(clusters[0].centroidPosition.x == 1.0f && clusters[0].centroidPosition.z == 3.0f);
    assert(clusters[1].centroidPosition.x == 0.0f && "Centroid without position defaults to origin.");
    std::cout << "[PASS] Communities and medoids." << std::endl;

    // Deterministic across runs and edge order.
    std::vector<TopicEdge> shuffled(edges.rbegin(), edges.rend());
    auto again = engine.identifyClusters(topics, shuffled, embeddings);
    assert(again.size() == clusters.size());
    for (std::size_t i = 0; i < again.size(); ++i) {
        assert(again[i].memberIds == clusters[i].memberIds);
        assert(again[i].centroidId == clusters[i].centroidId);
    }
    std::cout << "[PASS] Deterministic clustering." << std::endl;

    // Size filter and trivial inputs.
    assert(ClusterEngine(1.0, 4).identifyClusters(topics, edges, embeddings).empty());
    assert(engine.identifyClusters({topics[0]}, {}, embeddings).empty());
    auto singletons = ClusterEngine::detectCommunities({"x", "y"}, {}, 1.0);
    assert(singletons.at("x") != singletons.at("y") && "Isolated nodes stay apart.");
    std::cout << "[PASS] Size filter." << std::endl;

    // Colors.
    assert(ClusterEngine::clusterColor(0) == "#ef4444");
    assert(ClusterEngine::clusterColor(7) == "#f97316");
    assert(ClusterEngine::clusterColor(8) == "hsl(20, 70%, 60%)");
    std::cout << "[PASS] Cluster colors." << std::endl;

    // Spanning structure from the centroid.
    auto decorated = ClusterEngine::computeClustersWithEdges(clusters, edges);
    assert(decorated.size() == 2);
    const auto& first = decorated[0];
    assert(first.color == "#ef4444");
    assert(first.edges.size() == first.cluster.memberIds.size() - 1);
    for (const auto& edge : first.edges) {
        assert(edge.id != "e-cd" && "Bridge edges do not belong to a cluster.");
        assert(first.edgeDepths.at(edge.id) == 1);
        assert(first.edgeDirections.at(edge.id).from == "b");
    }
    assert(first.edgeDirections.at("e-ab").to == "a");
    assert(first.edgeDirections.at("e-bc").to == "c");
    std::cout << "[PASS] Cluster spanning edges." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
