// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "BeatDetector.h"

#include <cstring>

namespace ledlink {
namespace audio {

void BeatDetector::reset() {
    memset(m_history, 0, sizeof(m_history));
    m_writeIndex = 0;
    m_filled = 0;
    m_lastEnergy = 0;
}

bool BeatDetector::push(uint8_t meanEnergy) {
    uint8_t slot = m_writeIndex;
    m_history[slot] = meanEnergy;
    m_writeIndex = static_cast<uint8_t>((m_writeIndex + 1) % HISTORY_SIZE);
    if (m_filled < HISTORY_SIZE) {
        m_filled++;
    }

    // Average of every filled slot except the one just written
    uint8_t others = static_cast<uint8_t>(m_filled - 1);
    uint16_t sum = 0;
    for (uint8_t back = 1; back <= others; ++back) {
        sum += m_history[(slot + HISTORY_SIZE - back) % HISTORY_SIZE];
    }

    uint16_t previous = m_lastEnergy;
    m_lastEnergy = meanEnergy;

    if (others == 0) {
        return false;
    }

    uint16_t average = sum / others;
    return meanEnergy >= average + MARGIN_OVER_AVERAGE &&
           meanEnergy >= ABSOLUTE_FLOOR &&
           meanEnergy >= previous + MARGIN_OVER_PREVIOUS;
}

} // namespace audio
} // namespace ledlink
