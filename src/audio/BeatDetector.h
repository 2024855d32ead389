// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file BeatDetector.h
 * @brief Integer energy-onset beat detector over an 8-tick history
 *
 * A tick is a beat when its mean energy is
 *   - at least MARGIN_OVER_AVERAGE above the average of the other filled slots,
 *   - at least ABSOLUTE_FLOOR, and
 *   - at least MARGIN_OVER_PREVIOUS above the previous tick.
 */

#pragma once

#include <cstdint>

namespace ledlink {
namespace audio {

class BeatDetector {
public:
    static constexpr uint8_t HISTORY_SIZE = 8;
    static constexpr uint8_t MARGIN_OVER_AVERAGE = 20;
    static constexpr uint8_t ABSOLUTE_FLOOR = 45;
    static constexpr uint8_t MARGIN_OVER_PREVIOUS = 10;

    BeatDetector() { reset(); }

    /**
     * @brief Push this tick's mean energy
     * @return true if the tick is a beat
     */
    bool push(uint8_t meanEnergy);

    void reset();

    uint8_t getLastEnergy() const { return m_lastEnergy; }
    uint8_t getFilled() const { return m_filled; }

private:
    uint8_t m_history[HISTORY_SIZE];
    uint8_t m_writeIndex;
    uint8_t m_filled;
    uint8_t m_lastEnergy;
};

} // namespace audio
} // namespace ledlink
