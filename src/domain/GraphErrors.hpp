/**
 * @file GraphErrors.hpp
 * @brief Exception taxonomy for the graph core.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace orion::domain {

/**
 * @class GraphError
 * @brief Base class for all errors raised by the graph core.
 */
class GraphError : public std::runtime_error {
public:
    GraphError(const std::string& message, std::string code = "GRAPH_ERROR")
        : std::runtime_error(message), m_code(std::move(code)) {}

    /** @brief Stable machine-readable error code. */
    const std::string& code() const { return m_code; }

    static GraphError invalidOperation(const std::string& reason) {
        return GraphError("Invalid graph operation: " + reason);
    }

private:
    std::string m_code;
};

/**
 * @class ValidationError
 * @brief Malformed input, rejected before anything is written.
 */
class ValidationError : public GraphError {
public:
    ValidationError(const std::string& message, std::string field = "")
        : GraphError(message, "VALIDATION_ERROR"), m_field(std::move(field)) {}

    const std::string& field() const { return m_field; }

    static ValidationError required(const std::string& field) {
        return ValidationError(field + " is required", field);
    }

    static ValidationError invalid(const std::string& field, const std::string& reason) {
        return ValidationError(field + " is invalid: " + reason, field);
    }

private:
    std::string m_field;
};

/**
 * @class VectorError
 * @brief Numeric failures on embeddings.
 */
class VectorError : public GraphError {
public:
    explicit VectorError(const std::string& message) : GraphError(message, "VECTOR_ERROR") {}

    static VectorError emptyDataset() {
        return VectorError("Cannot perform operation on empty dataset");
    }

    static VectorError dimensionMismatch(std::size_t expected, std::size_t actual) {
        return VectorError("Vector dimension mismatch: expected " + std::to_string(expected) +
                           ", got " + std::to_string(actual));
    }
};

/**
 * @class StorageError
 * @brief Failures of the persistent store. A failed transaction commits nothing.
 */
class StorageError : public GraphError {
public:
    explicit StorageError(const std::string& message) : GraphError(message, "STORAGE_ERROR") {}

    static StorageError notFound(const std::string& entity, const std::string& id) {
        return StorageError(entity + " not found: " + id);
    }

    static StorageError duplicate(const std::string& entity, const std::string& key) {
        return StorageError(entity + " already exists: " + key);
    }

    static StorageError transactionFailed(const std::string& operation, const std::string& detail) {
        return StorageError("Transaction failed: " + operation + " (" + detail + ")");
    }
};

} // namespace orion::domain
