#include <cassert>
#include <cmath>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include "application/IngestionService.hpp"
#include "application/SimilarityRelationshipClassifier.hpp"
#include "domain/GraphErrors.hpp"
#include "infrastructure/InMemoryGraphStore.hpp"

using namespace orion;
using application::IngestionService;

namespace {

/// Answers PARENT for every candidate.
class AlwaysParent : public domain::RelationshipClassifier {
public:
    std::vector<domain::Relation> classify(const std::string&,
                                           const std::vector<domain::RelationshipCandidate>& candidates) override {
        return std::vector<domain::Relation>(candidates.size(), domain::Relation::Parent);
    }
};

domain::PageResult MakePage(const std::string& link,
                            std::vector<std::string> topics,
                            std::vector<std::vector<float>> embeddings) {
    domain::PageResult page;
    page.title = "Page " + link;
    page.summary = "About " + link;
    page.link = "https://example.org/" + link;
    page.topics = std::move(topics);
    page.topicEmbeddings = std::move(embeddings);
    page.contentEmbedding = {1.0f, 1.0f, 0.0f};
    return page;
}

std::shared_ptr<infrastructure::InMemoryGraphStore> MakeStore() {
    auto store = std::make_shared<infrastructure::InMemoryGraphStore>();
    domain::Graph graph;
    graph.id = "g";
    graph.name = "ingestion";
    store->createGraph(graph);
    return store;
}

application::Clock TickingClock() {
    auto now = std::make_shared<std::int64_t>(1000);
    return [now] { return (*now)++; };
}

/// Every topic's uses equals the number of items linked to it.
void CheckUses(const domain::GraphTables& tables) {
    for (const auto& [id, topic] : tables.topics()) {
        assert(topic.uses == static_cast<int>(tables.itemsForTopic(id).size()));
    }
}

/// The broader_than edges form a DAG.
void CheckAcyclic(const domain::GraphTables& tables) {
    std::map<std::string, std::vector<std::string>> children;
    for (const auto& [id, edge] : tables.edges()) {
        if (edge.type == domain::EdgeType::BroaderThan) children[edge.src].push_back(edge.dst);
    }
    std::map<std::string, int> state; // 1 = on stack, 2 = done
    std::function<void(const std::string&)> visit = [&](const std::string& node) {
        state[node] = 1;
        for (const auto& next : children[node]) {
            assert(state[next] != 1 && "broader_than cycle");
            if (state[next] == 0) visit(next);
        }
        state[node] = 2;
    };
    for (const auto& [id, topic] : tables.topics()) {
        if (state[id] == 0) visit(id);
    }
}

template <typename Fn>
bool ThrowsValidation(Fn&& fn) {
    try {
        fn();
    } catch (const domain::ValidationError& e) {
        assert(std::string(e.code()) == "VALIDATION_ERROR");
        return true;
    }
    return false;
}

/// Deletes a topic from the store the first time it is asked, then answers SIBLING.
class DeletingClassifier : public domain::RelationshipClassifier {
public:
    DeletingClassifier(std::shared_ptr<domain::GraphStore> store, std::string label)
        : m_store(std::move(store)), m_label(std::move(label)) {}

    std::vector<domain::Relation> classify(const std::string&,
                                           const std::vector<domain::RelationshipCandidate>& candidates) override {
        if (!m_done) {
            m_done = true;
            m_store->transact("g", [this](domain::GraphTables& tables) {
                tables.removeTopic(tables.findTopicByLabel(m_label)->id);
            });
        }
        return std::vector<domain::Relation>(candidates.size(), domain::Relation::Sibling);
    }

private:
    std::shared_ptr<domain::GraphStore> m_store;
    std::string m_label;
    bool m_done = false;
};

} // namespace

int main() {
    std::cout << "[Test] Starting IngestionService Test..." << std::endl;

    auto store = MakeStore();
    auto settings = std::make_shared<application::SettingsService>("");
    auto classifier = std::make_shared<application::SimilarityRelationshipClassifier>(0.75f);
    int scheduled = 0;
    IngestionService service(store, settings, classifier,
                             [&scheduled](const std::string& graphId) {
                                 assert(graphId == "g");
                                 scheduled++;
                             },
                             application::SequentialIdFactory("id"), TickingClock());

    // First page mints both of its topics.
    auto a = service.Ingest("g", MakePage("a", {"transformer", "attention"},
                                          {{1.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f}}));
    assert(a.item.has_value() && !a.skippedDuplicate);
    assert(a.newTopics.size() == 2 && a.topicsReused == 0);
    assert(a.edgesAdded == 0 && "Orthogonal topics stay unconnected.");
    assert(scheduled == 1);
    std::cout << "[PASS] First page." << std::endl;

    // A near-identical label merges; an unrelated one is minted.
    auto b = service.Ingest("g", MakePage("b", {"transformer architecture", "tokenizer"},
                                          {{0.97f, 0.2431f, 0.0f}, {0.0f, 0.0f, 1.0f}}));
    assert(b.newTopics.size() == 1 && b.newTopics[0].label == "tokenizer");
    assert(b.topicsReused == 1);
    {
        auto tables = store->snapshot("g");
        assert(tables.topics().size() == 3);
        assert(tables.findTopicByLabel("transformer")->uses == 2);
        assert(tables.findTopicByLabel("attention")->uses == 1);
        assert(tables.findTopicByLabel("tokenizer")->uses == 1);
        assert(!tables.findTopicByLabel("transformer architecture"));
        assert(tables.loadVector(domain::OwnerType::Item, b.item->id).has_value());
        CheckUses(tables);
    }
    assert(scheduled == 2);
    std::cout << "[PASS] Semantic merge." << std::endl;

    // A related topic gets a sibling edge to its close neighbour only.
    auto c = service.Ingest("g", MakePage("c", {"deep learning"}, {{0.8f, 0.6f, 0.0f}}));
    assert(c.newTopics.size() == 1 && c.edgesAdded == 1);
    {
        auto tables = store->snapshot("g");
        assert(tables.edges().size() == 1);
        const auto& edge = tables.edges().begin()->second;
        assert(edge.type == domain::EdgeType::RelatedTo);
        assert(edge.src < edge.dst);
        const std::string transformerId = tables.findTopicByLabel("transformer")->id;
        assert(edge.src == transformerId || edge.dst == transformerId);
        assert(std::fabs(edge.similarity - 0.8f) < 1e-5f);
    }
    std::cout << "[PASS] Edge construction." << std::endl;

    // Re-ingesting a link is a no-op.
    const auto before = store->snapshot("g");
    auto again = service.Ingest("g", MakePage("a", {"something else"}, {{0.0f, 0.0f, 1.0f}}));
    assert(again.skippedDuplicate && !again.item.has_value());
    assert(again.newTopics.empty());
    const auto after = store->snapshot("g");
    assert(after.items().size() == before.items().size());
    assert(after.topics().size() == before.topics().size());
    assert(after.itemTopics() == before.itemTopics());
    assert(scheduled == 3);
    std::cout << "[PASS] Duplicate link." << std::endl;

    // Repeated labels within one page link once.
    auto d = service.Ingest("g", MakePage("d", {"attention", "attention"},
                                          {{0.0f, 1.0f, 0.0f}, {0.0f, 1.0f, 0.0f}}));
    assert(d.newTopics.empty() && d.topicsReused == 1);
    {
        auto tables = store->snapshot("g");
        assert(tables.topicsForItem(d.item->id).size() == 1);
        assert(tables.findTopicByLabel("attention")->uses == 2);
        CheckUses(tables);
    }
    assert(scheduled == 3 && "Nothing minted, nothing scheduled.");

    auto bare = service.Ingest("g", MakePage("bare", {}, {}));
    assert(bare.item.has_value() && bare.newTopics.empty());
    std::cout << "[PASS] Reuse without minting." << std::endl;

    // Validation happens before any write.
    const std::size_t itemCount = store->snapshot("g").items().size();
    auto unlinked = MakePage("v0", {"x"}, {{1.0f, 0.0f, 0.0f}});
    unlinked.link.clear();
    assert(ThrowsValidation([&] { service.Ingest("g", unlinked); }));
    assert(ThrowsValidation([&] { service.Ingest("g", MakePage("v1", {"x", "y"}, {{1.0f, 0.0f, 0.0f}})); }));
    assert(ThrowsValidation([&] { service.Ingest("g", MakePage("v2", {"x"}, {std::vector<float>{}})); }));
    assert(ThrowsValidation([&] {
        service.Ingest("g", MakePage("v3", {"x", "y"}, {{1.0f, 0.0f, 0.0f}, {1.0f, 0.0f}}));
    }));
    assert(ThrowsValidation([&] { service.Ingest("g", MakePage("v4", {"x"}, {{1.0f, 0.0f}})); }));
    assert(ThrowsValidation([&] { service.Ingest("g", MakePage("v5", {""}, {{1.0f, 0.0f, 0.0f}})); }));
    assert(store->snapshot("g").items().size() == itemCount);
    std::cout << "[PASS] Input validation." << std::endl;

    // Content vectors must share the graph's dimensionality.
    auto shortContent = MakePage("v6", {}, {});
    shortContent.contentEmbedding = {1.0f, 0.0f};
    assert(ThrowsValidation([&] { service.Ingest("g", shortContent); }));
    auto mixedPage = MakePage("v7", {"x"}, {{1.0f, 0.0f, 0.0f}});
    mixedPage.contentEmbedding = {1.0f, 0.0f};
    assert(ThrowsValidation([&] { service.Ingest("g", mixedPage); }));
    assert(store->snapshot("g").items().size() == itemCount);
    for (const auto& [key, row] : store->snapshot("g").vectors()) {
        assert(row.buf.size() == 3 * sizeof(float));
    }

    auto freshStore = MakeStore();
    IngestionService fresh(freshStore, settings, classifier, nullptr,
                           application::SequentialIdFactory("fresh"), TickingClock());
    auto contentOnly = MakePage("c0", {}, {});
    contentOnly.contentEmbedding = {0.5f, 0.5f};
    assert(fresh.Ingest("g", contentOnly).item.has_value());
    assert(ThrowsValidation([&] { fresh.Ingest("g", MakePage("c1", {"x"}, {{1.0f, 0.0f, 0.0f}})); }));
    std::cout << "[PASS] Graph dimensionality." << std::endl;

    // Unknown graph.
    bool missing = false;
    try {
        service.Ingest("nope", MakePage("z", {"x"}, {{1.0f, 0.0f, 0.0f}}));
    } catch (const domain::StorageError& e) {
        missing = std::string(e.code()) == "STORAGE_ERROR";
    }
    assert(missing);
    std::cout << "[PASS] Unknown graph." << std::endl;

    // A reused topic deleted while the page is being planned loses the link; the page still lands.
    auto raceStore = MakeStore();
    IngestionService racing(raceStore, settings, std::make_shared<DeletingClassifier>(raceStore, "alpha"), nullptr,
                            application::SequentialIdFactory("race"), TickingClock());
    racing.Ingest("g", MakePage("r0", {"beta"}, {{0.0f, 0.0f, 1.0f}}));
    auto seeded = MakePage("r1", {"alpha"}, {{1.0f, 0.0f, 0.0f}});
    {
        IngestionService seeder(raceStore, settings, nullptr, nullptr,
                                application::SequentialIdFactory("seed"), TickingClock());
        seeder.Ingest("g", seeded);
    }
    auto raced = racing.Ingest("g", MakePage("r2", {"alpha", "gamma"}, {{1.0f, 0.0f, 0.0f}, {0.8f, 0.6f, 0.0f}}));
    assert(raced.item.has_value());
    assert(raced.newTopics.size() == 1 && raced.newTopics[0].label == "gamma");
    assert(raced.topicsReused == 0);
    assert(raced.warnings.size() == 1);
    {
        auto tables = raceStore->snapshot("g");
        assert(!tables.findTopicByLabel("alpha"));
        const auto linked = tables.topicsForItem(raced.item->id);
        assert(linked.size() == 1);
        assert(tables.findTopicByLabel("gamma")->uses == 1);
        assert(tables.edgesTouching(tables.findTopicByLabel("gamma")->id).empty());
        CheckUses(tables);
    }
    std::cout << "[PASS] Topic deleted mid-ingestion." << std::endl;

    // Hierarchy stays acyclic and within the parent cap.
    auto treeStore = MakeStore();
    IngestionService tree(treeStore, settings, std::make_shared<AlwaysParent>(), nullptr,
                          application::SequentialIdFactory("tree"), TickingClock());
    // Consecutive levels are 35 degrees apart: related, but below the merge threshold.
    const std::vector<std::vector<float>> chain{
        {1.0f, 0.0f, 0.0f}, {0.8192f, 0.5736f, 0.0f}, {0.3420f, 0.9397f, 0.0f},
        {-0.2588f, 0.9659f, 0.0f}, {-0.7660f, 0.6428f, 0.0f}};
    for (std::size_t i = 0; i < chain.size(); ++i) {
        tree.Ingest("g", MakePage("tree" + std::to_string(i), {"level " + std::to_string(i)}, {chain[i]}));
    }
    {
        auto tables = treeStore->snapshot("g");
        assert(tables.topics().size() == chain.size());
        assert(tables.edges().size() == chain.size() - 1);
        CheckAcyclic(tables);
        std::map<std::string, int> parents;
        for (const auto& [id, edge] : tables.edges()) {
            assert(edge.type == domain::EdgeType::BroaderThan);
            assert(edge.similarity >= 0.75f);
            parents[edge.dst]++;
        }
        for (const auto& [id, count] : parents) assert(count <= 2);
        CheckUses(tables);
    }
    std::cout << "[PASS] Acyclic hierarchy." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
