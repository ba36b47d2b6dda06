/**
 * @file IdGenerator.cpp
 * @brief Implementation of the id and clock sources.
 */

#include "application/IdGenerator.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <random>

namespace orion::application {

std::string GenerateId() {
    static const char alphanum[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    static std::mutex mutex;
    static std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(alphanum) - 2);

    std::lock_guard<std::mutex> lock(mutex);
    std::string s;
    s.reserve(16);
    for (int i = 0; i < 16; ++i) {
        s += alphanum[pick(engine)];
    }
    return s;
}

std::int64_t NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

IdFactory DefaultIdFactory() {
    return [] { return GenerateId(); };
}

Clock DefaultClock() {
    return [] { return NowMillis(); };
}

IdFactory SequentialIdFactory(const std::string& prefix) {
    auto counter = std::make_shared<std::atomic<int>>(0);
    return [prefix, counter] { return prefix + "-" + std::to_string(++(*counter)); };
}

} // namespace orion::application
