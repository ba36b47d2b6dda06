/**
 * @file GraphSettings.hpp
 * @brief Per-graph tuning parameters and change detection.
 */

#pragma once

namespace orion::domain {

/**
 * @struct GraphTuning
 * @brief Parameters of topic resolution, edge construction, clustering and layout.
 */
struct GraphTuning {
    float topicMergeThreshold = 0.85f;   ///< Similarity above which a label merges into a topic.
    float edgeMinSimilarity = 0.75f;     ///< Classification floor for typed edges.
    int candidateCount = 20;             ///< Nearest neighbours considered per new topic.
    int classifierCandidateCount = 6;    ///< Subset handed to the relationship classifier.
    int maxParentsPerNewTopic = 2;
    int maxChildrenPerNewTopic = 2;
    int maxSiblingsPerNewTopic = 3;
    int maxParentsPerNode = 2;           ///< Incoming broader_than edges per topic.
    int maxChildrenPerNode = 30;         ///< Outgoing broader_than edges per topic.
    int maxRelatedPerNode = 40;          ///< related_to edges touching a topic.
    double clusterResolution = 1.0;
    int minClusterSize = 2;
    double umapMinDist = 0.4;
    double umapSpread = 2.0;
    int umapEpochs = 200;
    int pcaComponents = 100;
    float positionHalfRange = 10.0f;     ///< Projected coordinates land in [-h, h].
};

/**
 * @struct SearchTuning
 * @brief Defaults applied when a search call leaves a parameter unset.
 */
struct SearchTuning {
    int topicResultCount = 5;
    int itemResultCount = 10;
    float similarityThreshold = 0.4f;
    int maxEdgesInResults = 20;
};

struct GraphSettings {
    GraphTuning graph;
    SearchTuning search;
};

/**
 * @enum SettingsChangeType
 * @brief Which derived data a settings change invalidates.
 */
enum class SettingsChangeType {
    None,
    Search, ///< Only query-time defaults changed.
    Umap,   ///< Projection parameters changed, positions must be recomputed.
    Graph   ///< Structural parameters changed.
};

inline SettingsChangeType DetectChanges(const GraphSettings& oldSettings, const GraphSettings& newSettings) {
    const auto& o = oldSettings.graph;
    const auto& n = newSettings.graph;
    bool graphChanged = o.topicMergeThreshold != n.topicMergeThreshold ||
                        o.edgeMinSimilarity != n.edgeMinSimilarity ||
                        o.candidateCount != n.candidateCount ||
                        o.classifierCandidateCount != n.classifierCandidateCount ||
                        o.maxParentsPerNewTopic != n.maxParentsPerNewTopic ||
                        o.maxChildrenPerNewTopic != n.maxChildrenPerNewTopic ||
                        o.maxSiblingsPerNewTopic != n.maxSiblingsPerNewTopic ||
                        o.maxParentsPerNode != n.maxParentsPerNode ||
                        o.maxChildrenPerNode != n.maxChildrenPerNode ||
                        o.maxRelatedPerNode != n.maxRelatedPerNode ||
                        o.clusterResolution != n.clusterResolution ||
                        o.minClusterSize != n.minClusterSize;

    bool umapChanged = o.umapMinDist != n.umapMinDist ||
                       o.umapSpread != n.umapSpread ||
                       o.umapEpochs != n.umapEpochs ||
                       o.pcaComponents != n.pcaComponents ||
                       o.positionHalfRange != n.positionHalfRange;

    const auto& os = oldSettings.search;
    const auto& ns = newSettings.search;
    bool searchChanged = os.topicResultCount != ns.topicResultCount ||
                         os.itemResultCount != ns.itemResultCount ||
                         os.similarityThreshold != ns.similarityThreshold ||
                         os.maxEdgesInResults != ns.maxEdgesInResults;

    if (graphChanged) return SettingsChangeType::Graph;
    if (umapChanged) return SettingsChangeType::Umap;
    if (searchChanged) return SettingsChangeType::Search;
    return SettingsChangeType::None;
}

} // namespace orion::domain
