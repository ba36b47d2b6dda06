/**
 * @file IngestionService.hpp
 * @brief Turns an extracted page into graph rows in a single transaction.
 */

#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/IdGenerator.hpp"
#include "application/SettingsService.hpp"
#include "domain/GraphModel.hpp"
#include "domain/GraphStore.hpp"
#include "domain/RelationshipClassifier.hpp"

namespace orion::application {

/**
 * @struct IngestionResult
 * @brief Summary of one ingestion. Non-fault outcomes are reported here, not thrown.
 */
struct IngestionResult {
    std::optional<domain::Item> item;   ///< Absent when the page was skipped.
    bool skippedDuplicate = false;
    std::vector<domain::Topic> newTopics;
    int topicsReused = 0;               ///< Distinct existing topics referenced by the page.
    int edgesAdded = 0;
    int edgesRemoved = 0;               ///< Pre-existing edges pruned by the degree caps.
    int cycleRejections = 0;
    std::vector<std::string> warnings;
};

class IngestionService {
public:
    /// Called after a commit that minted topics; expected to return immediately.
    using RecomputeScheduler = std::function<void(const std::string& graphId)>;

    IngestionService(std::shared_ptr<domain::GraphStore> store,
                     std::shared_ptr<SettingsService> settings,
                     std::shared_ptr<domain::RelationshipClassifier> classifier,
                     RecomputeScheduler scheduler = nullptr,
                     IdFactory ids = DefaultIdFactory(),
                     Clock clock = DefaultClock());

    /**
     * @brief Ingests one page into a graph.
     *
     * Re-ingesting a link already present is a no-op.
     * @throws domain::ValidationError on malformed input, before anything is written.
     * @throws domain::StorageError if the transaction fails; nothing is committed.
     */
    IngestionResult Ingest(const std::string& graphId, const domain::PageResult& page);

private:
    void validate(const domain::PageResult& page) const;
    /// Embedding width of the page, taken from its topics or else its content vector.
    static std::size_t pageDimension(const domain::PageResult& page);

    std::shared_ptr<domain::GraphStore> m_store;
    std::shared_ptr<SettingsService> m_settings;
    std::shared_ptr<domain::RelationshipClassifier> m_classifier;
    RecomputeScheduler m_scheduler;
    IdFactory m_ids;
    Clock m_clock;
};

} // namespace orion::application
