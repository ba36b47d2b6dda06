/**
 * @file PositionProjector.hpp
 * @brief Projects topic embeddings into normalized 3D coordinates.
 */

#pragma once
#include <array>
#include <vector>
#include "domain/GraphSettings.hpp"

namespace orion::application {

using Point3 = std::array<float, 3>;

/**
 * @struct PcaModel
 * @brief Principal axes (unit rows) and the mean they were computed around.
 */
struct PcaModel {
    std::vector<std::vector<double>> components;
    std::vector<double> mean;
};

/**
 * @class PositionProjector
 * @brief PCA down to an intermediate dimension, UMAP to 3D, then one shared scale.
 *
 * A full recompute on every call. Results are deterministic for a fixed input order.
 */
class PositionProjector {
public:
    explicit PositionProjector(const domain::GraphTuning& tuning) : m_tuning(tuning) {}

    /**
     * @brief Computes one coordinate per embedding, in input order.
     *
     * Fewer than 4 embeddings get the layout [i*5, 0, 0].
     * @throws domain::VectorError on inconsistent dimensionality.
     */
    std::vector<Point3> computePositions(const std::vector<std::vector<float>>& embeddings) const;

    /**
     * @brief Sequential dominant-component extraction by power iteration with deflation.
     *
     * A start axis whose deflated image vanishes yields no component, so fewer than
     * numComponents rows may be returned.
     * @throws domain::VectorError::emptyDataset on empty input.
     */
    static PcaModel pca(const std::vector<std::vector<float>>& vectors, int numComponents);

    static std::vector<double> projectPca(const std::vector<float>& vector, const PcaModel& model);

    /** @brief UMAP to 3 dimensions with nNeighbors = min(15, n/2). */
    std::vector<Point3> umap(const std::vector<std::vector<double>>& reduced) const;

    /**
     * @brief Maps coordinates into [-halfRange, halfRange] using the largest axis range for every axis.
     *
     * Input is returned unchanged if all points coincide.
     */
    static std::vector<Point3> normalize3D(const std::vector<Point3>& positions, float halfRange);

private:
    domain::GraphTuning m_tuning;
};

} // namespace orion::application
