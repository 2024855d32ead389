// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AudioFeatureProcessor.cpp
 * @brief Integer-only smoothing, peak hold and beat pipeline
 */

#include "AudioFeatureProcessor.h"

#include <cstring>

#include "utils/Timing.h"

#define LL_LOG_TAG "AudioFeat"
#include "utils/Log.h"

namespace ledlink {
namespace audio {

AudioFeatureProcessor::AudioFeatureProcessor() {
    clearState();
}

bool AudioFeatureProcessor::submitFrame(const uint8_t* bands, uint32_t nowMs) {
    bool expected = false;
    if (!m_busy.compare_exchange_strong(expected, true, std::memory_order_acquire)) {
        m_framesDropped.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    memcpy(m_latest.bands, bands, NUM_BANDS);
    m_latest.arrivalMs = nowMs;
    m_hasFrame = true;

    m_busy.store(false, std::memory_order_release);
    m_framesAccepted.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool AudioFeatureProcessor::tryBeginRender() {
    bool expected = false;
    return m_busy.compare_exchange_strong(expected, true, std::memory_order_acquire);
}

void AudioFeatureProcessor::endRender() {
    m_busy.store(false, std::memory_order_release);
}

void AudioFeatureProcessor::reset() {
    bool expected = false;
    if (m_busy.compare_exchange_strong(expected, true, std::memory_order_acquire)) {
        clearState();
        m_resetPending.store(false, std::memory_order_relaxed);
        m_busy.store(false, std::memory_order_release);
        LL_AUDIO_LOGD("Feature state reset");
    } else {
        m_resetPending.store(true, std::memory_order_release);
        LL_AUDIO_LOGD("Feature state reset deferred (slot busy)");
    }
}

void AudioFeatureProcessor::clearState() {
    m_latest = AudioFrame();
    m_hasFrame = false;
    m_features = AudioFeatures();
    memset(m_holdCountdown, 0, sizeof(m_holdCountdown));
    m_beat.reset();
}

void AudioFeatureProcessor::process(uint32_t nowMs) {
    if (m_resetPending.exchange(false, std::memory_order_acq_rel)) {
        clearState();
    }

    bool stale = !m_hasFrame || utils::hasElapsed(nowMs, m_latest.arrivalMs, STALE_TIMEOUT_MS);
    if (stale && !m_features.stale) {
        LL_AUDIO_LOGI("No audio frame for %lu ms, fading out",
                      static_cast<unsigned long>(STALE_TIMEOUT_MS));
    }
    m_features.stale = stale;

    uint16_t sum = 0;
    for (uint8_t i = 0; i < NUM_BANDS; ++i) {
        uint8_t target = stale ? 0 : m_latest.bands[i];

        // Smoothing: instant attack, lose half the remaining distance on release
        uint8_t& smoothed = m_features.bands[i];
        if (target >= smoothed) {
            smoothed = target;
        } else {
            uint8_t distance = static_cast<uint8_t>(smoothed - target);
            smoothed = static_cast<uint8_t>(smoothed - ((distance + 1) / 2));
        }

        // Peak hold
        uint8_t& peak = m_features.peaks[i];
        if (target > peak) {
            peak = target;
            m_holdCountdown[i] = PEAK_HOLD_TICKS;
        } else if (m_holdCountdown[i] > 0) {
            m_holdCountdown[i]--;
        } else {
            peak = (peak > PEAK_DECAY_STEP) ? static_cast<uint8_t>(peak - PEAK_DECAY_STEP) : 0;
        }

        sum += smoothed;
    }

    m_features.energy = static_cast<uint8_t>(sum / NUM_BANDS);
    m_features.beat = m_beat.push(m_features.energy);

    if (m_features.beat) {
        LL_AUDIO_LOGT("Beat (energy=%u)", m_features.energy);
    }
}

} // namespace audio
} // namespace ledlink
