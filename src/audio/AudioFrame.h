// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AudioFrame.h
 * @brief Band-energy frame streamed by the companion app, and the smoothed
 *        features renderers read
 */

#pragma once

#include <cstdint>

namespace ledlink {
namespace audio {

/// Bands per frame (fixed by the wire format)
static constexpr uint8_t NUM_BANDS = 16;

/// Frames older than this are treated as silence
static constexpr uint32_t STALE_TIMEOUT_MS = 500;

/// Smoothing / peak constants
static constexpr uint8_t PEAK_HOLD_TICKS = 8;
static constexpr uint8_t PEAK_DECAY_STEP = 4;

/**
 * @brief One raw frame plus its arrival time
 */
struct AudioFrame {
    uint8_t bands[NUM_BANDS] = {};
    uint32_t arrivalMs = 0;
};

/**
 * @brief Per-tick output of the feature processor (read-only for renderers)
 */
struct AudioFeatures {
    uint8_t bands[NUM_BANDS] = {};  // Smoothed band energies
    uint8_t peaks[NUM_BANDS] = {};  // Held peaks
    uint8_t energy = 0;             // Mean of smoothed bands
    bool beat = false;              // Beat flagged this tick
    bool stale = true;              // No fresh frame within STALE_TIMEOUT_MS
};

} // namespace audio
} // namespace ledlink
