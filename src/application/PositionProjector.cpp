/**
 * @file PositionProjector.cpp
 * @brief Implementation of PositionProjector.
 */

#include "application/PositionProjector.hpp"
#include "domain/GraphErrors.hpp"
#include <Eigen/Dense>
#include <knncolle/knncolle.hpp>
#include <umappp/umappp.hpp>
#include <algorithm>
#include <iostream>
#include <limits>

namespace orion::application {

namespace {
constexpr int kPowerIterations = 100;
constexpr double kConvergenceTolerance = 1e-6;
constexpr double kDegenerateNorm = 1e-10;
constexpr std::size_t kTrivialLayoutLimit = 4;
constexpr int kMaxNeighbors = 15;

std::vector<Point3> trivialLayout(std::size_t count) {
    std::vector<Point3> points;
    points.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        points.push_back({static_cast<float>(i) * 5.0f, 0.0f, 0.0f});
    }
    return points;
}
}

PcaModel PositionProjector::pca(const std::vector<std::vector<float>>& vectors, int numComponents) {
    if (vectors.empty()) throw domain::VectorError::emptyDataset();

    const Eigen::Index n = static_cast<Eigen::Index>(vectors.size());
    const Eigen::Index d = static_cast<Eigen::Index>(vectors.front().size());
    if (d == 0) throw domain::VectorError::emptyDataset();

    Eigen::MatrixXd data(n, d);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& row = vectors[static_cast<std::size_t>(i)];
        if (static_cast<Eigen::Index>(row.size()) != d) {
            throw domain::VectorError::dimensionMismatch(static_cast<std::size_t>(d), row.size());
        }
        for (Eigen::Index j = 0; j < d; ++j) data(i, j) = row[static_cast<std::size_t>(j)];
    }

    Eigen::RowVectorXd mean = data.colwise().mean();
    Eigen::MatrixXd centered = data.rowwise() - mean;
    Eigen::MatrixXd cov = (centered.transpose() * centered) / static_cast<double>(std::max<Eigen::Index>(n - 1, 1));

    PcaModel model;
    model.mean.assign(mean.data(), mean.data() + d);

    const Eigen::Index count = std::min<Eigen::Index>(std::max(numComponents, 0), d);
    std::vector<Eigen::VectorXd> extracted;
    for (Eigen::Index comp = 0; comp < count; ++comp) {
        Eigen::VectorXd vec = Eigen::VectorXd::Zero(d);
        vec(comp % d) = 1.0;
        bool degenerate = false;

        for (int iter = 0; iter < kPowerIterations; ++iter) {
            Eigen::VectorXd next = cov * vec;
            for (const auto& prev : extracted) {
                next -= next.dot(prev) * prev;
            }
            double norm = next.norm();
            if (norm < kDegenerateNorm) {
                degenerate = true;
                break;
            }
            next /= norm;
            double diff = (vec - next).norm();
            vec = next;
            if (diff < kConvergenceTolerance) break;
        }

        if (degenerate) continue;
        extracted.push_back(vec);
    }

    for (const auto& comp : extracted) {
        model.components.emplace_back(comp.data(), comp.data() + d);
    }
    return model;
}

std::vector<double> PositionProjector::projectPca(const std::vector<float>& vector, const PcaModel& model) {
    std::vector<double> projected;
    projected.reserve(model.components.size());
    for (const auto& comp : model.components) {
        double sum = 0.0;
        for (std::size_t i = 0; i < comp.size() && i < vector.size(); ++i) {
            sum += comp[i] * (static_cast<double>(vector[i]) - model.mean[i]);
        }
        projected.push_back(sum);
    }
    return projected;
}

std::vector<Point3> PositionProjector::umap(const std::vector<std::vector<double>>& reduced) const {
    if (reduced.empty() || reduced.front().empty()) return {};

    const std::size_t nobs = reduced.size();
    const std::size_t ndim = reduced.front().size();

    // umappp expects column-major observations: dimension j of observation i at j + i*ndim.
    std::vector<double> data(ndim * nobs);
    for (std::size_t i = 0; i < nobs; ++i) {
        for (std::size_t j = 0; j < ndim; ++j) {
            data[j + i * ndim] = reduced[i][j];
        }
    }

    knncolle::VptreeBuilder<knncolle::EuclideanDistance, int, double, double> vpBuilder;

    const std::size_t outDim = 3;
    std::vector<double> coords(nobs * outDim);

    umappp::Options opt;
    opt.num_neighbors = std::max(1, std::min(kMaxNeighbors, static_cast<int>(nobs / 2)));
    opt.num_epochs = m_tuning.umapEpochs;
    opt.min_dist = m_tuning.umapMinDist;
    opt.spread = m_tuning.umapSpread;

    auto status = umappp::initialize(ndim, nobs, data.data(), vpBuilder, outDim, coords.data(), opt);
    status.run();

    std::vector<Point3> points(nobs);
    for (std::size_t i = 0; i < nobs; ++i) {
        points[i] = {static_cast<float>(coords[i * outDim]),
                     static_cast<float>(coords[i * outDim + 1]),
                     static_cast<float>(coords[i * outDim + 2])};
    }
    return points;
}

std::vector<Point3> PositionProjector::normalize3D(const std::vector<Point3>& positions, float halfRange) {
    if (positions.empty()) return {};

    Point3 mins{std::numeric_limits<float>::infinity(), std::numeric_limits<float>::infinity(),
                std::numeric_limits<float>::infinity()};
    Point3 maxs{-std::numeric_limits<float>::infinity(), -std::numeric_limits<float>::infinity(),
                -std::numeric_limits<float>::infinity()};
    for (const auto& p : positions) {
        for (int i = 0; i < 3; ++i) {
            mins[i] = std::min(mins[i], p[i]);
            maxs[i] = std::max(maxs[i], p[i]);
        }
    }

    float maxRange = 0.0f;
    for (int i = 0; i < 3; ++i) maxRange = std::max(maxRange, maxs[i] - mins[i]);
    if (maxRange == 0.0f) return positions;

    std::vector<Point3> normalized;
    normalized.reserve(positions.size());
    for (const auto& p : positions) {
        Point3 q;
        for (int i = 0; i < 3; ++i) {
            q[i] = ((p[i] - mins[i]) / maxRange - 0.5f) * 2.0f * halfRange;
        }
        normalized.push_back(q);
    }
    return normalized;
}

std::vector<Point3> PositionProjector::computePositions(const std::vector<std::vector<float>>& embeddings) const {
    if (embeddings.empty()) return {};

    if (embeddings.size() < kTrivialLayoutLimit) return trivialLayout(embeddings.size());

    PcaModel model = pca(embeddings, m_tuning.pcaComponents);
    if (model.components.empty()) {
        std::cerr << "[PositionProjector] Embeddings have no variance, using trivial layout" << std::endl;
        return trivialLayout(embeddings.size());
    }

    std::vector<std::vector<double>> reduced;
    reduced.reserve(embeddings.size());
    for (const auto& e : embeddings) reduced.push_back(projectPca(e, model));

    return normalize3D(umap(reduced), m_tuning.positionHalfRange);
}

} // namespace orion::application
