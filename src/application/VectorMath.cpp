/**
 * @file VectorMath.cpp
 * @brief Implementation of the vector helpers.
 */

#include "application/VectorMath.hpp"
#include "domain/GraphErrors.hpp"
#include <cmath>
#include <limits>

namespace orion::application::vectormath {

float cosineSimilarity(const Vector& a, const Vector& b) {
    if (a.size() != b.size()) {
        throw domain::VectorError::dimensionMismatch(a.size(), b.size());
    }
    double dot = 0.0, n1 = 0.0, n2 = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        n1 += static_cast<double>(a[i]) * a[i];
        n2 += static_cast<double>(b[i]) * b[i];
    }
    double norm = std::sqrt(n1) * std::sqrt(n2);
    if (norm == 0.0) return 0.0f;
    return static_cast<float>(dot / norm);
}

float cosineDistance(const Vector& a, const Vector& b) {
    return 1.0f - cosineSimilarity(a, b);
}

Vector normalize(const Vector& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * x;
    double norm = std::sqrt(sum);
    if (norm == 0.0) return v;

    Vector out(v.size());
    for (std::size_t i = 0; i < v.size(); ++i) {
        out[i] = static_cast<float>(v[i] / norm);
    }
    return out;
}

Vector mean(const std::vector<Vector>& vectors) {
    if (vectors.empty()) throw domain::VectorError::emptyDataset();

    const std::size_t dim = vectors.front().size();
    std::vector<double> acc(dim, 0.0);
    for (const auto& vec : vectors) {
        if (vec.size() != dim) throw domain::VectorError::dimensionMismatch(dim, vec.size());
        for (std::size_t i = 0; i < dim; ++i) acc[i] += vec[i];
    }

    Vector result(dim);
    for (std::size_t i = 0; i < dim; ++i) {
        result[i] = static_cast<float>(acc[i] / static_cast<double>(vectors.size()));
    }
    return result;
}

std::vector<std::vector<float>> similarityMatrix(const std::vector<Vector>& vectors) {
    const std::size_t n = vectors.size();
    std::vector<Vector> normalized;
    normalized.reserve(n);
    for (const auto& v : vectors) normalized.push_back(normalize(v));

    std::vector<std::vector<float>> matrix(n, std::vector<float>(n, 0.0f));
    for (std::size_t i = 0; i < n; ++i) {
        matrix[i][i] = cosineSimilarity(vectors[i], vectors[i]);
        for (std::size_t j = i + 1; j < n; ++j) {
            if (normalized[i].size() != normalized[j].size()) {
                throw domain::VectorError::dimensionMismatch(normalized[i].size(), normalized[j].size());
            }
            double dot = 0.0;
            for (std::size_t d = 0; d < normalized[i].size(); ++d) {
                dot += static_cast<double>(normalized[i][d]) * normalized[j][d];
            }
            matrix[i][j] = matrix[j][i] = static_cast<float>(dot);
        }
    }
    return matrix;
}

std::vector<float> similarityBatch(const Vector& vector, const std::vector<Vector>& others) {
    std::vector<float> scores;
    scores.reserve(others.size());
    for (const auto& other : others) {
        scores.push_back(cosineSimilarity(vector, other));
    }
    return scores;
}

std::size_t findMedoidIndex(const std::vector<Vector>& embeddings) {
    if (embeddings.empty()) throw domain::VectorError::emptyDataset();
    if (embeddings.size() == 1) return 0;

    std::vector<Vector> normalized;
    normalized.reserve(embeddings.size());
    for (const auto& e : embeddings) normalized.push_back(normalize(e));
    Vector center = mean(normalized);

    float best = -std::numeric_limits<float>::infinity();
    std::size_t medoid = 0;
    for (std::size_t i = 0; i < normalized.size(); ++i) {
        float sim = cosineSimilarity(normalized[i], center);
        if (sim > best) {
            best = sim;
            medoid = i;
        }
    }
    return medoid;
}

std::string findSemanticMedoid(const std::vector<Vector>& embeddings, const std::vector<std::string>& ids) {
    if (ids.size() != embeddings.size()) {
        throw domain::VectorError::dimensionMismatch(embeddings.size(), ids.size());
    }
    return ids[findMedoidIndex(embeddings)];
}

} // namespace orion::application::vectormath
