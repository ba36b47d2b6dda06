/**
 * @file IdGenerator.hpp
 * @brief Injectable id and clock sources for rows created by the services.
 */

#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace orion::application {

using IdFactory = std::function<std::string()>;
using Clock = std::function<std::int64_t()>;

/** @brief Random 16 character alphanumeric identifier. */
std::string GenerateId();

/** @brief Wall clock in milliseconds since epoch. */
std::int64_t NowMillis();

/** @brief Default factory backed by GenerateId(). */
IdFactory DefaultIdFactory();

/** @brief Default clock backed by NowMillis(). */
Clock DefaultClock();

/** @brief Deterministic factory producing prefix-1, prefix-2, ... (thread safe). */
IdFactory SequentialIdFactory(const std::string& prefix);

} // namespace orion::application
