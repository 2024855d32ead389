// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AudioFeatureProcessor.h
 * @brief Latest-frame slot, per-band smoothing, peak hold and beat detection
 *
 * Threading model:
 * - submitFrame() runs on the transport callback thread
 * - tryBeginRender() / process() / endRender() / reset() run on the loop thread
 * - A single atomic busy flag guards the latest-frame slot. Whoever holds it
 *   owns the slot; the other side drops (transport) or yields (loop).
 *
 * Frames are never queued: a newer frame replaces an unprocessed one.
 */

#pragma once

#include <atomic>
#include <cstdint>

#include "AudioFrame.h"
#include "BeatDetector.h"

namespace ledlink {
namespace audio {

class AudioFeatureProcessor {
public:
    AudioFeatureProcessor();

    AudioFeatureProcessor(const AudioFeatureProcessor&) = delete;
    AudioFeatureProcessor& operator=(const AudioFeatureProcessor&) = delete;

    /**
     * @brief Store a frame in the latest-frame slot
     * @param bands NUM_BANDS energies
     * @param nowMs Arrival time
     * @return false if a render tick holds the slot (frame dropped)
     */
    bool submitFrame(const uint8_t* bands, uint32_t nowMs);

    /**
     * @brief Claim the busy flag for a render tick
     * @return false if the transport is writing the slot right now
     */
    bool tryBeginRender();

    /**
     * @brief Release the busy flag
     */
    void endRender();

    /**
     * @brief One smoothing / peak / beat pass (call between begin and end)
     */
    void process(uint32_t nowMs);

    /**
     * @brief Zero bands, peaks, countdowns, beat history and the pending frame
     *
     * If the transport holds the slot at this instant the reset is deferred to
     * the start of the next process() pass.
     */
    void reset();

    const AudioFeatures& getFeatures() const { return m_features; }
    uint8_t getPeakHoldCountdown(uint8_t band) const {
        return band < NUM_BANDS ? m_holdCountdown[band] : 0;
    }

    uint32_t getFramesAccepted() const { return m_framesAccepted.load(std::memory_order_relaxed); }
    uint32_t getFramesDropped() const { return m_framesDropped.load(std::memory_order_relaxed); }

private:
    void clearState();

    std::atomic<bool> m_busy{false};
    std::atomic<bool> m_resetPending{false};

    // Latest-frame slot (guarded by m_busy)
    AudioFrame m_latest;
    bool m_hasFrame = false;

    // Loop-thread state
    AudioFeatures m_features;
    uint8_t m_holdCountdown[NUM_BANDS] = {};
    BeatDetector m_beat;

    std::atomic<uint32_t> m_framesAccepted{0};
    std::atomic<uint32_t> m_framesDropped{0};
};

} // namespace audio
} // namespace ledlink
