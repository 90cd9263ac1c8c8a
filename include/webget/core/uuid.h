#pragma once

#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

namespace webget::core {

/**
 * Generate a UUID v4 string (xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx).
 * Uses std::random_device + mt19937_64. No external dependencies.
 */
inline std::string generateUUID() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng);
    uint64_t b = dist(rng);

    // Set version 4 (bits 12-15 of time_hi_and_version)
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    // Set variant 1 (bits 6-7 of clock_seq_hi_and_reserved)
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<uint32_t>(a >> 32),
                  static_cast<uint16_t>((a >> 16) & 0xFFFF), static_cast<uint16_t>(a & 0xFFFF),
                  static_cast<uint16_t>(b >> 48),
                  static_cast<unsigned long long>(b & 0x0000FFFFFFFFFFFFull));
    return std::string(buf);
}

} // namespace webget::core
