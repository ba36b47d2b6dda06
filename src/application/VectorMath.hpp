/**
 * @file VectorMath.hpp
 * @brief Pure vector helpers shared by every graph component.
 */

#pragma once
#include <string>
#include <vector>

namespace orion::application::vectormath {

using Vector = std::vector<float>;

/**
 * @brief dot(a,b) / (|a|*|b|). Returns 0 when either norm is 0.
 * @throws domain::VectorError on unequal lengths.
 */
float cosineSimilarity(const Vector& a, const Vector& b);

/** @brief 1 - cosineSimilarity(a, b). */
float cosineDistance(const Vector& a, const Vector& b);

/** @brief Unit-length copy; the input is returned unchanged if it is the zero vector. */
Vector normalize(const Vector& v);

/**
 * @brief Element-wise average.
 * @throws domain::VectorError::emptyDataset on empty input.
 */
Vector mean(const std::vector<Vector>& vectors);

/** @brief Pairwise cosine similarities, result[i][j] for rows i and j. */
std::vector<std::vector<float>> similarityMatrix(const std::vector<Vector>& vectors);

/** @brief Similarities of one vector against each of the others. */
std::vector<float> similarityBatch(const Vector& vector, const std::vector<Vector>& others);

/**
 * @brief Index of the member whose normalized embedding is closest to the mean direction.
 * @throws domain::VectorError::emptyDataset on empty input.
 */
std::size_t findMedoidIndex(const std::vector<Vector>& embeddings);

/** @brief Id of the semantic medoid, ids parallel to embeddings. */
std::string findSemanticMedoid(const std::vector<Vector>& embeddings, const std::vector<std::string>& ids);

} // namespace orion::application::vectormath
