#include <cassert>
#include <iostream>
#include <stdexcept>
#include "application/EdgeBuilder.hpp"
#include "application/TopicGraphIndex.hpp"

using namespace orion::application;
using orion::domain::EdgeType;
using orion::domain::GraphTuning;
using orion::domain::Relation;
using orion::domain::RelationshipCandidate;
using orion::domain::Topic;
using orion::domain::TopicEdge;

namespace {

class ScriptedClassifier : public orion::domain::RelationshipClassifier {
public:
    std::vector<Relation> answer;
    bool fail = false;
    std::vector<std::vector<RelationshipCandidate>> calls;

    std::vector<Relation> classify(const std::string&, const std::vector<RelationshipCandidate>& candidates) override {
        calls.push_back(candidates);
        if (fail) throw std::runtime_error("classifier offline");
        return answer;
    }
};

Topic MakeTopic(const std::string& id) {
    Topic topic;
    topic.id = id;
    topic.label = id;
    topic.uses = 1;
    return topic;
}

TopicEdge Broader(const std::string& id, const std::string& src, const std::string& dst, float similarity) {
    TopicEdge edge;
    edge.id = id;
    edge.src = src;
    edge.dst = dst;
    edge.type = EdgeType::BroaderThan;
    edge.similarity = similarity;
    return edge;
}

TopicEdge Related(const std::string& id, const std::string& a, const std::string& b, float similarity) {
    TopicEdge edge = Broader(id, a, b, similarity);
    edge.type = EdgeType::RelatedTo;
    return edge;
}

EdgeBuilder MakeBuilder(const GraphTuning& tuning, std::shared_ptr<ScriptedClassifier> classifier) {
    return EdgeBuilder(tuning, std::move(classifier), SequentialIdFactory("e"), [] { return std::int64_t{42}; });
}

} // namespace

int main() {
    std::cout << "[Test] Starting EdgeBuilder Test..." << std::endl;
    GraphTuning tuning;

    // PARENT: the candidate becomes the broader end.
    {
        auto classifier = std::make_shared<ScriptedClassifier>();
        classifier->answer = {Relation::Parent};
        TopicGraphIndex index;
        index.addNode("p");

        auto report = MakeBuilder(tuning, classifier).build(index, MakeTopic("n"), {{"p", "p", 0.9f}});
        auto added = index.pendingAdditions();
        assert(report.parentsAccepted == 1);
        assert(added.size() == 1);
        assert(added[0].src == "p" && added[0].dst == "n" && added[0].type == EdgeType::BroaderThan);
        assert(added[0].createdAt == 42);
    }
    std::cout << "[PASS] Parent edge direction." << std::endl;

    // A parent that is already reachable from the new topic would close a cycle.
    {
        auto classifier = std::make_shared<ScriptedClassifier>();
        classifier->answer = {Relation::Child, Relation::Parent};
        TopicGraphIndex index;
        index.addNode("x");
        index.addNode("y");
        index.addEdge(Broader("e-xy", "x", "y", 0.9f), false);

        auto report = MakeBuilder(tuning, classifier).build(index, MakeTopic("n"), {{"x", "x", 0.9f}, {"y", "y", 0.8f}});
        auto added = index.pendingAdditions();
        assert(report.childrenAccepted == 1);
        assert(report.cycleRejections == 1);
        assert(added.size() == 1 && added[0].src == "n" && added[0].dst == "x");
        assert(!index.isReachable("y", "n") && !index.isReachable("x", "n") && "Graph must stay acyclic.");
    }
    std::cout << "[PASS] Cycle rejected." << std::endl;

    // A child that already reaches the new topic through its fresh parent would close a cycle.
    {
        auto classifier = std::make_shared<ScriptedClassifier>();
        classifier->answer = {Relation::Parent, Relation::Child};
        TopicGraphIndex index;
        index.addNode("p");
        index.addNode("q");
        index.addEdge(Broader("e-qp", "q", "p", 0.9f), false);

        auto report = MakeBuilder(tuning, classifier).build(index, MakeTopic("n"), {{"p", "p", 0.9f}, {"q", "q", 0.8f}});
        auto added = index.pendingAdditions();
        assert(report.parentsAccepted == 1 && report.childrenAccepted == 0);
        assert(report.cycleRejections == 1);
        assert(added.size() == 1 && added[0].src == "p" && added[0].dst == "n");
        assert(!index.isReachable("n", "q"));
    }
    std::cout << "[PASS] Child cycle rejected." << std::endl;

    // Siblings are stored in canonical order; weak candidates are ignored.
    {
        auto classifier = std::make_shared<ScriptedClassifier>();
        classifier->answer = {Relation::Sibling, Relation::Sibling};
        TopicGraphIndex index;
        index.addNode("z");
        index.addNode("a");

        auto report = MakeBuilder(tuning, classifier).build(index, MakeTopic("m"), {{"z", "z", 0.8f}, {"a", "a", 0.7f}});
        auto added = index.pendingAdditions();
        assert(report.siblingsAccepted == 1 && report.belowFloor == 1);
        assert(added.size() == 1 && added[0].type == EdgeType::RelatedTo);
        assert(added[0].src == "m" && added[0].dst == "z");

        classifier->answer = {Relation::Sibling};
        TopicGraphIndex other;
        other.addNode("a");
        MakeBuilder(tuning, classifier).build(other, MakeTopic("b"), {{"a", "a", 0.9f}});
        auto reversed = other.pendingAdditions();
        assert(reversed.size() == 1 && reversed[0].src == "a" && reversed[0].dst == "b");
    }
    std::cout << "[PASS] Sibling canonical order and floor." << std::endl;

    // Per new topic sub-caps.
    {
        auto classifier = std::make_shared<ScriptedClassifier>();
        classifier->answer = {Relation::Parent, Relation::Parent, Relation::Parent, Relation::Parent};
        TopicGraphIndex index;
        for (const char* id : {"p1", "p2", "p3", "p4"}) index.addNode(id);

        auto report = MakeBuilder(tuning, classifier).build(
            index, MakeTopic("n"), {{"p3", "p3", 0.85f}, {"p1", "p1", 0.95f}, {"p4", "p4", 0.8f}, {"p2", "p2", 0.9f}});
        auto added = index.pendingAdditions();
        assert(report.parentsAccepted == 2);
        assert(added.size() == 2);
        for (const auto& edge : added) assert(edge.src == "p1" || edge.src == "p2");
    }
    std::cout << "[PASS] Parent sub-cap." << std::endl;

    // Degree caps prune the weakest edge of a neighbour, including existing ones.
    {
        GraphTuning tight = tuning;
        tight.maxParentsPerNode = 1;
        auto classifier = std::make_shared<ScriptedClassifier>();
        classifier->answer = {Relation::Child};
        TopicGraphIndex index;
        index.addNode("p1");
        index.addNode("c");
        index.addEdge(Broader("old", "p1", "c", 0.8f), false);

        auto report = MakeBuilder(tight, classifier).build(index, MakeTopic("n"), {{"c", "c", 0.9f}});
        assert(report.pruned == 1);
        assert(index.pendingRemovals() == (std::vector<std::string>{"old"}));
        auto added = index.pendingAdditions();
        assert(added.size() == 1 && added[0].src == "n" && added[0].dst == "c");
    }

    // Children cap: a parent's weakest child goes, seeded or new.
    {
        GraphTuning tight = tuning;
        tight.maxChildrenPerNode = 1;
        auto classifier = std::make_shared<ScriptedClassifier>();
        classifier->answer = {Relation::Parent};
        TopicGraphIndex index;
        index.addNode("p");
        index.addNode("c1");
        index.addEdge(Broader("old", "p", "c1", 0.8f), false);

        auto report = MakeBuilder(tight, classifier).build(index, MakeTopic("n"), {{"p", "p", 0.9f}});
        assert(report.pruned == 1);
        assert(index.pendingRemovals() == (std::vector<std::string>{"old"}));
        auto added = index.pendingAdditions();
        assert(added.size() == 1 && added[0].src == "p" && added[0].dst == "n");

        classifier->answer = {Relation::Child, Relation::Child};
        TopicGraphIndex fresh;
        fresh.addNode("c1");
        fresh.addNode("c2");
        auto own = MakeBuilder(tight, classifier).build(fresh, MakeTopic("n"), {{"c2", "c2", 0.8f}, {"c1", "c1", 0.9f}});
        assert(own.childrenAccepted == 2 && own.pruned == 1);
        auto kept = fresh.pendingAdditions();
        assert(kept.size() == 1 && kept[0].src == "n" && kept[0].dst == "c1");
        assert(fresh.pendingRemovals().empty());
    }

    // Related cap: applies to the neighbour and to the new topic.
    {
        GraphTuning tight = tuning;
        tight.maxRelatedPerNode = 1;
        auto classifier = std::make_shared<ScriptedClassifier>();
        classifier->answer = {Relation::Sibling};
        TopicGraphIndex index;
        index.addNode("a");
        index.addNode("z");
        index.addEdge(Related("old", "a", "z", 0.76f), false);

        auto report = MakeBuilder(tight, classifier).build(index, MakeTopic("m"), {{"z", "z", 0.9f}});
        assert(report.siblingsAccepted == 1 && report.pruned == 1);
        assert(index.pendingRemovals() == (std::vector<std::string>{"old"}));
        auto added = index.pendingAdditions();
        assert(added.size() == 1 && added[0].type == EdgeType::RelatedTo);
        assert(added[0].src == "m" && added[0].dst == "z");

        classifier->answer = {Relation::Sibling, Relation::Sibling};
        TopicGraphIndex fresh;
        fresh.addNode("y");
        fresh.addNode("z");
        auto own = MakeBuilder(tight, classifier).build(fresh, MakeTopic("m"), {{"y", "y", 0.8f}, {"z", "z", 0.9f}});
        assert(own.siblingsAccepted == 2 && own.pruned == 1);
        auto kept = fresh.pendingAdditions();
        assert(kept.size() == 1 && kept[0].dst == "z");
    }
    std::cout << "[PASS] Degree cap pruning." << std::endl;

    // Classifier failures degrade to no typed edges.
    {
        auto classifier = std::make_shared<ScriptedClassifier>();
        classifier->fail = true;
        TopicGraphIndex index;
        index.addNode("p");
        auto report = MakeBuilder(tuning, classifier).build(index, MakeTopic("n"), {{"p", "p", 0.9f}});
        assert(report.classifierDegraded && !report.warning.empty());
        assert(index.pendingAdditions().empty());

        classifier->fail = false;
        classifier->answer = {Relation::Parent};
        TopicGraphIndex other;
        other.addNode("p");
        other.addNode("q");
        auto mismatch = MakeBuilder(tuning, classifier).build(other, MakeTopic("n"), {{"p", "p", 0.9f}, {"q", "q", 0.9f}});
        assert(mismatch.classifierDegraded);
        assert(other.pendingAdditions().empty());

        TopicGraphIndex plain;
        plain.addNode("p");
        auto none = EdgeBuilder(tuning, nullptr).build(plain, MakeTopic("n"), {{"p", "p", 0.9f}});
        assert(!none.classifierDegraded && plain.pendingAdditions().empty());
    }
    std::cout << "[PASS] Degraded classifier." << std::endl;

    // Only the best candidates reach the classifier, best first.
    {
        auto classifier = std::make_shared<ScriptedClassifier>();
        classifier->answer.assign(static_cast<std::size_t>(tuning.classifierCandidateCount), Relation::Unrelated);
        TopicGraphIndex index;
        std::vector<EdgeCandidate> candidates;
        for (int i = 0; i < 10; ++i) {
            std::string id = "c" + std::to_string(i);
            index.addNode(id);
            candidates.push_back({id, id, 0.5f + 0.04f * static_cast<float>(i)});
        }
        auto report = MakeBuilder(tuning, classifier).build(index, MakeTopic("n"), candidates);
        assert(!report.classifierDegraded);
        assert(classifier->calls.size() == 1);
        assert(classifier->calls[0].size() == static_cast<std::size_t>(tuning.classifierCandidateCount));
        assert(classifier->calls[0][0].label == "c9");
        assert(index.pendingAdditions().empty());

        auto ranked = EdgeBuilder::rankCandidates(candidates, 3);
        assert(ranked.size() == 3 && ranked[0].topicId == "c9" && ranked[2].topicId == "c7");
    }
    std::cout << "[PASS] Candidate ranking." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
