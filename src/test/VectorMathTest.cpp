#include <cassert>
#include <cmath>
#include <iostream>
#include "application/VectorMath.hpp"
#include "domain/GraphErrors.hpp"

using namespace orion::application;
using orion::domain::VectorError;

namespace {
bool Near(float a, float b, float eps = 1e-5f) {
    return std::fabs(a - b) < eps;
}
}

int main() {
    std::cout << "[Test] Starting VectorMath Test..." << std::endl;

    vectormath::Vector a{0.3f, -1.2f, 2.5f, 0.0f};
    vectormath::Vector b{1.0f, 0.4f, -0.7f, 3.0f};

    // Symmetry and identity
    assert(Near(vectormath::cosineSimilarity(a, b), vectormath::cosineSimilarity(b, a)) && "Cosine must be symmetric.");
    assert(Near(vectormath::cosineSimilarity(a, a), 1.0f) && "Cosine of a vector with itself must be 1.");
    assert(Near(vectormath::cosineSimilarity({1, 0}, {0, 1}), 0.0f) && "Orthogonal vectors have cosine 0.");
    assert(Near(vectormath::cosineSimilarity({0, 0}, {1, 1}), 0.0f) && "Zero vectors have cosine 0.");
    assert(Near(vectormath::cosineDistance(a, a), 0.0f));
    std::cout << "[PASS] Cosine similarity." << std::endl;

    bool threw = false;
    try {
        vectormath::cosineSimilarity({1, 2, 3}, {1, 2});
    } catch (const VectorError& e) {
        threw = true;
        assert(e.code() == "VECTOR_ERROR");
    }
    assert(threw && "Mismatched dimensions must throw.");
    std::cout << "[PASS] Dimension mismatch rejected." << std::endl;

    auto unit = vectormath::normalize({3.0f, 4.0f});
    assert(Near(unit[0], 0.6f) && Near(unit[1], 0.8f));

    auto avg = vectormath::mean({{1.0f, 2.0f}, {3.0f, 4.0f}});
    assert(avg.size() == 2 && Near(avg[0], 2.0f) && Near(avg[1], 3.0f));

    threw = false;
    try {
        vectormath::mean({});
    } catch (const VectorError&) {
        threw = true;
    }
    assert(threw && "Mean of nothing must throw.");
    std::cout << "[PASS] Normalize and mean." << std::endl;

    auto matrix = vectormath::similarityMatrix({a, b, {1.0f, 1.0f, 1.0f, 1.0f}});
    assert(matrix.size() == 3);
    for (std::size_t i = 0; i < 3; ++i) {
        assert(Near(matrix[i][i], 1.0f));
        for (std::size_t j = 0; j < 3; ++j) assert(Near(matrix[i][j], matrix[j][i]));
    }
    auto batch = vectormath::similarityBatch(a, {a, b});
    assert(batch.size() == 2 && Near(batch[0], 1.0f) && Near(batch[1], vectormath::cosineSimilarity(a, b)));
    std::cout << "[PASS] Similarity matrix and batch." << std::endl;

    std::vector<vectormath::Vector> embeddings{{1.0f, 0.0f}, {1.0f, 1.0f}, {0.0f, 1.0f}};
    assert(vectormath::findMedoidIndex(embeddings) == 1 && "The diagonal vector is closest to the mean direction.");
    assert(vectormath::findSemanticMedoid(embeddings, {"x", "diag", "y"}) == "diag");
    std::vector<vectormath::Vector> single{vectormath::Vector{5.0f, 5.0f}};
    assert(vectormath::findMedoidIndex(single) == 0);

    threw = false;
    try {
        vectormath::findMedoidIndex({});
    } catch (const VectorError&) {
        threw = true;
    }
    assert(threw && "Medoid of nothing must throw.");
    std::cout << "[PASS] Medoid." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
