// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Timing.h
 * @brief Wraparound-safe millisecond interval helpers
 *
 * millis() wraps after ~49.7 days. All duration checks go through these
 * helpers so the unsigned subtraction handles the wrap.
 */

#pragma once

#include <cstdint>

namespace ledlink {
namespace utils {

/**
 * @brief Milliseconds elapsed between two counter readings
 */
inline uint32_t elapsedMs(uint32_t nowMs, uint32_t sinceMs) {
    return static_cast<uint32_t>(nowMs - sinceMs);
}

/**
 * @brief True once at least intervalMs has passed since sinceMs
 */
inline bool hasElapsed(uint32_t nowMs, uint32_t sinceMs, uint32_t intervalMs) {
    return elapsedMs(nowMs, sinceMs) >= intervalMs;
}

} // namespace utils
} // namespace ledlink
