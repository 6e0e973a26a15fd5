// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace sortie::core {

/**
 * Generate a UUID v4 string (xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx).
 * Uses std::random_device + mt19937_64. No external dependencies.
 */
inline std::string generateUUID() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng);
    uint64_t b = dist(rng);

    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<uint32_t>(a >> 32),
                  static_cast<uint16_t>((a >> 16) & 0xFFFF), static_cast<uint16_t>(a & 0xFFFF),
                  static_cast<uint16_t>(b >> 48),
                  static_cast<unsigned long long>(b & 0x0000FFFFFFFFFFFFull));
    return std::string(buf);
}

/**
 * Generate a prefixed ID: prefix-timestamp_ms-random6chars.
 * Used for operation and link identifiers so they sort roughly by creation.
 */
inline std::string generateId(const std::string& prefix) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();

    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFF);
    uint32_t r = dist(rng);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s-%lld-%06x", prefix.c_str(), static_cast<long long>(ms), r);
    return std::string(buf);
}

/**
 * Format a time point as ISO 8601 UTC with millisecond precision.
 * Format: 2025-10-01T14:30:00.123Z
 */
inline std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_tp = std::chrono::system_clock::to_time_t(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() %
        1000;
    if (millis < 0)
        millis += 1000;

    std::tm tm_utc;
#ifdef _WIN32
    gmtime_s(&tm_utc, &time_t_tp);
#else
    gmtime_r(&time_t_tp, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << 'Z';
    return oss.str();
}

// Milliseconds since the unix epoch; the persisted representation of TimePoint.
inline int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(int64_t ms) {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{ms}};
}

} // namespace sortie::core
