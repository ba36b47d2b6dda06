/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/AsyncTaskManager.hpp"
#include "application/GraphService.hpp"
#include "application/IngestionService.hpp"
#include "application/SearchEngine.hpp"
#include "application/SettingsService.hpp"
#include "domain/GraphStore.hpp"
#include "domain/RelationshipClassifier.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace orion::application {

/**
 * @struct AppServices
 * @brief Everything the composition root wires together.
 *
 * Members are destroyed in reverse order, so the services that run
 * background work go away before the store and settings they use.
 */
struct AppServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<domain::GraphStore> store;
    std::shared_ptr<SettingsService> settingsService;
    std::shared_ptr<infrastructure::OllamaClient> ollamaClient;
    std::shared_ptr<domain::RelationshipClassifier> classifier;
    std::shared_ptr<AsyncTaskManager> taskManager;
    std::shared_ptr<GraphService> graphService;
    std::shared_ptr<IngestionService> ingestionService;
    std::shared_ptr<SearchEngine> searchEngine;
};

} // namespace orion::application
