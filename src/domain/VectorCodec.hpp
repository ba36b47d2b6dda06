/**
 * @file VectorCodec.hpp
 * @brief Conversion between embeddings and their stored float32 byte form.
 */

#pragma once
#include <cstdint>
#include <cstring>
#include <vector>

namespace orion::domain {

/** @brief Encodes an embedding as little-endian float32 bytes. */
inline std::vector<std::uint8_t> EncodeVector(const std::vector<float>& vector) {
    std::vector<std::uint8_t> buf(vector.size() * sizeof(float));
    for (std::size_t i = 0; i < vector.size(); ++i) {
        std::uint32_t bits;
        std::memcpy(&bits, &vector[i], sizeof(bits));
        buf[i * 4 + 0] = static_cast<std::uint8_t>(bits & 0xFF);
        buf[i * 4 + 1] = static_cast<std::uint8_t>((bits >> 8) & 0xFF);
        buf[i * 4 + 2] = static_cast<std::uint8_t>((bits >> 16) & 0xFF);
        buf[i * 4 + 3] = static_cast<std::uint8_t>((bits >> 24) & 0xFF);
    }
    return buf;
}

/** @brief Decodes float32 bytes. Trailing bytes that do not form a float are ignored. */
inline std::vector<float> DecodeVector(const std::vector<std::uint8_t>& buf) {
    std::vector<float> vector(buf.size() / 4);
    for (std::size_t i = 0; i < vector.size(); ++i) {
        std::uint32_t bits = static_cast<std::uint32_t>(buf[i * 4 + 0]) |
                             (static_cast<std::uint32_t>(buf[i * 4 + 1]) << 8) |
                             (static_cast<std::uint32_t>(buf[i * 4 + 2]) << 16) |
                             (static_cast<std::uint32_t>(buf[i * 4 + 3]) << 24);
        std::memcpy(&vector[i], &bits, sizeof(bits));
    }
    return vector;
}

} // namespace orion::domain
