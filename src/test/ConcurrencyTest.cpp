#include <atomic>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <random>
#include <set>
#include <thread>
#include <vector>
#include "application/AsyncTaskManager.hpp"
#include "application/GraphService.hpp"
#include "application/IngestionService.hpp"
#include "domain/GraphErrors.hpp"
#include "infrastructure/FileGraphStore.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace orion;
namespace fs = std::filesystem;

namespace {

// Alternates PARENT and CHILD so concurrent writers build competing hierarchies.
class AlternatingClassifier : public domain::RelationshipClassifier {
public:
    std::vector<domain::Relation> classify(const std::string&,
                                           const std::vector<domain::RelationshipCandidate>& candidates) override {
        std::vector<domain::Relation> relations;
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            relations.push_back(i % 2 == 0 ? domain::Relation::Parent : domain::Relation::Child);
        }
        return relations;
    }
};

std::vector<float> RandomEmbedding(std::mt19937& rng) {
    std::uniform_real_distribution<float> dist(0.2f, 1.0f);
    return {dist(rng), dist(rng), dist(rng), dist(rng)};
}

/// Referential integrity, the uses counter and acyclicity of one snapshot.
bool IsConsistent(const domain::GraphTables& tables) {
    for (const auto& [itemId, topicId] : tables.itemTopics()) {
        if (!tables.findItem(itemId) || !tables.findTopic(topicId)) return false;
    }
    for (const auto& [id, topic] : tables.topics()) {
        if (topic.uses != static_cast<int>(tables.itemsForTopic(id).size())) return false;
        if (!tables.loadVector(domain::OwnerType::Topic, id)) return false;
    }

    std::map<std::string, std::vector<std::string>> children;
    for (const auto& [id, edge] : tables.edges()) {
        if (!tables.findTopic(edge.src) || !tables.findTopic(edge.dst)) return false;
        if (edge.type == domain::EdgeType::BroaderThan) children[edge.src].push_back(edge.dst);
    }
    std::map<std::string, int> state;
    bool cyclic = false;
    std::function<void(const std::string&)> visit = [&](const std::string& node) {
        state[node] = 1;
        for (const auto& next : children[node]) {
            if (state[next] == 1) cyclic = true;
            if (state[next] == 0) visit(next);
        }
        state[node] = 2;
    };
    for (const auto& [id, topic] : tables.topics()) {
        if (state[id] == 0) visit(id);
    }
    return !cyclic;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    const fs::path root = fs::temp_directory_path() / "orion-concurrency-test";
    fs::remove_all(root);

    const int NUM_WRITERS = 4;
    const int PAGES_PER_WRITER = 6;
    const int TOPICS_PER_PAGE = 3;

    std::size_t topicCount = 0;
    {
        auto persistence = std::make_shared<infrastructure::PersistenceService>();
        auto store = std::make_shared<infrastructure::FileGraphStore>(root.string(), persistence);
        auto settings = std::make_shared<application::SettingsService>(root.string());
        auto tasks = std::make_shared<application::AsyncTaskManager>();
        auto graphs = std::make_shared<application::GraphService>(store, settings, tasks);
        graphs->InitializeGraphs();

        std::weak_ptr<application::GraphService> weakGraphs = graphs;
        application::IngestionService ingestion(store, settings, std::make_shared<AlternatingClassifier>(),
            [weakGraphs](const std::string& graphId) {
                if (auto service = weakGraphs.lock()) service->ScheduleRecompute(graphId);
            });

        std::atomic<bool> writing{true};
        std::atomic<int> failures{0};
        std::atomic<int> inconsistentSnapshots{0};
        std::atomic<int> snapshotsTaken{0};
        std::atomic<int> maxRunningProjections{0};

        std::vector<std::thread> readers;
        for (int r = 0; r < 2; ++r) {
            readers.emplace_back([&] {
                while (writing) {
                    if (!IsConsistent(store->snapshot(domain::kDefaultGraphId))) inconsistentSnapshots++;
                    snapshotsTaken++;
                    int running = 0;
                    for (const auto& task : tasks->GetActiveTasks()) {
                        if (task->type == application::TaskType::Projection && !task->isCompleted) running++;
                    }
                    int seen = maxRunningProjections.load();
                    while (running > seen && !maxRunningProjections.compare_exchange_weak(seen, running)) {
                    }
                }
            });
        }

        std::vector<std::thread> writers;
        for (int w = 0; w < NUM_WRITERS; ++w) {
            writers.emplace_back([&, w] {
                std::mt19937 rng(static_cast<unsigned>(w + 1));
                for (int p = 0; p < PAGES_PER_WRITER; ++p) {
                    domain::PageResult page;
                    page.title = "Writer " + std::to_string(w) + " page " + std::to_string(p);
                    page.link = "https://example.org/" + std::to_string(w) + "/" + std::to_string(p);
                    for (int t = 0; t < TOPICS_PER_PAGE; ++t) {
                        page.topics.push_back("w" + std::to_string(w) + "-p" + std::to_string(p) + "-t" + std::to_string(t));
                        page.topicEmbeddings.push_back(RandomEmbedding(rng));
                    }
                    page.contentEmbedding = RandomEmbedding(rng);
                    try {
                        ingestion.Ingest(domain::kDefaultGraphId, page);
                        // A second attempt at the same link must be a no-op.
                        if (!ingestion.Ingest(domain::kDefaultGraphId, page).skippedDuplicate) failures++;
                    } catch (const domain::GraphError& e) {
                        std::cerr << "[Test] Ingest failed: " << e.what() << std::endl;
                        failures++;
                    }
                }
            });
        }

        for (auto& t : writers) t.join();
        writing = false;
        for (auto& t : readers) t.join();

        std::cout << "[Test] Readers took " << snapshotsTaken.load() << " snapshots" << std::endl;
        assert(failures == 0);
        assert(inconsistentSnapshots == 0);
        std::cout << "[PASS] Concurrent ingestion kept every snapshot consistent." << std::endl;

        tasks->WaitForIdle();
        std::size_t projectionRuns = 0;
        for (const auto& task : tasks->GetActiveTasks()) {
            assert(!task->failed && "Background recompute failed.");
            if (task->type == application::TaskType::Projection) projectionRuns++;
        }
        assert(projectionRuns >= 1);
        assert(maxRunningProjections <= 1 && "Recomputes of one graph never overlap.");
        std::cout << "[Test] " << projectionRuns << " background projections, at most "
                  << maxRunningProjections.load() << " at a time" << std::endl;
        tasks->CleanupCompletedTasks();
        assert(tasks->GetActiveTasks().empty());

        auto tables = store->snapshot(domain::kDefaultGraphId);
        assert(tables.items().size() == static_cast<std::size_t>(NUM_WRITERS * PAGES_PER_WRITER));
        std::set<std::string> links;
        for (const auto& [id, item] : tables.items()) {
            assert(links.insert(item.link).second);
            assert(!tables.topicsForItem(id).empty());
        }
        for (const auto& [id, topic] : tables.topics()) {
            assert(topic.position.has_value() && "Every topic is placed once background work settles.");
        }
        assert(IsConsistent(tables));
        assert(!graphs->ShouldRecomputePositions(domain::kDefaultGraphId));
        topicCount = tables.topics().size();

        // The settled layout is one projection of the final topic set, not a blend of older runs.
        std::map<std::string, domain::Position3> settled;
        for (const auto& [id, topic] : tables.topics()) settled[id] = *topic.position;
        graphs->RecomputeTopicPositions(domain::kDefaultGraphId);
        for (const auto& [id, topic] : store->snapshot(domain::kDefaultGraphId).topics()) {
            const domain::Position3& p = *topic.position;
            const domain::Position3& q = settled.at(id);
            assert(std::fabs(p.x - q.x) < 1e-4f && std::fabs(p.y - q.y) < 1e-4f && std::fabs(p.z - q.z) < 1e-4f);
        }
        std::cout << "[PASS] Coalesced recomputes left a single consistent layout." << std::endl;
        std::cout << "[PASS] " << tables.items().size() << " items, " << topicCount << " topics, "
                  << tables.edges().size() << " edges committed." << std::endl;
    }

    // Everything committed is on disk.
    {
        auto persistence = std::make_shared<infrastructure::PersistenceService>();
        infrastructure::FileGraphStore reloaded(root.string(), persistence);
        auto tables = reloaded.snapshot(domain::kDefaultGraphId);
        assert(tables.items().size() == static_cast<std::size_t>(NUM_WRITERS * PAGES_PER_WRITER));
        assert(tables.topics().size() == topicCount);
        assert(IsConsistent(tables));
    }
    std::cout << "[PASS] Reloaded snapshot matches." << std::endl;

    fs::remove_all(root);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
