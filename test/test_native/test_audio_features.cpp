// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * LedLink - Audio Feature Unit Tests
 *
 * - Instant attack / halving release smoothing
 * - Peak hold countdown and linear decay
 * - Beat detector thresholds
 * - Staleness fade-out
 * - Busy-flag arbitration between transport and render
 */

#include <unity.h>

#include <cstring>

#include "audio/AudioFeatureProcessor.h"
#include "audio/BeatDetector.h"

using namespace ledlink::audio;

namespace {

void fill(uint8_t* bands, uint8_t level) {
    memset(bands, level, NUM_BANDS);
}

/// submitFrame + process, as one render tick would see it
void tick(AudioFeatureProcessor& proc, const uint8_t* bands, uint32_t nowMs) {
    proc.submitFrame(bands, nowMs);
    TEST_ASSERT_TRUE(proc.tryBeginRender());
    proc.process(nowMs);
    proc.endRender();
}

} // namespace

//==============================================================================
// Smoothing
//==============================================================================

void test_audio_attack_is_instant() {
    AudioFeatureProcessor proc;
    uint8_t bands[NUM_BANDS];
    fill(bands, 180);

    tick(proc, bands, 0);

    TEST_ASSERT_EQUAL_UINT8(180, proc.getFeatures().bands[0]);
    TEST_ASSERT_EQUAL_UINT8(180, proc.getFeatures().bands[15]);
    TEST_ASSERT_EQUAL_UINT8(180, proc.getFeatures().energy);
    TEST_ASSERT_FALSE(proc.getFeatures().stale);
}

void test_audio_release_halves_distance() {
    AudioFeatureProcessor proc;
    uint8_t bands[NUM_BANDS];
    fill(bands, 200);
    tick(proc, bands, 0);

    fill(bands, 0);
    const uint8_t expected[] = {100, 50, 25, 12, 6, 3, 1, 0};
    uint32_t now = 0;
    for (uint8_t step : expected) {
        now += 20;
        tick(proc, bands, now);
        TEST_ASSERT_EQUAL_UINT8(step, proc.getFeatures().bands[3]);
    }
}

void test_audio_bands_are_independent() {
    AudioFeatureProcessor proc;
    uint8_t bands[NUM_BANDS];
    fill(bands, 0);
    bands[0] = 255;
    bands[15] = 64;

    tick(proc, bands, 0);

    const AudioFeatures& features = proc.getFeatures();
    TEST_ASSERT_EQUAL_UINT8(255, features.bands[0]);
    TEST_ASSERT_EQUAL_UINT8(0, features.bands[7]);
    TEST_ASSERT_EQUAL_UINT8(64, features.bands[15]);
    TEST_ASSERT_EQUAL_UINT8((255 + 64) / 16, features.energy);
}

//==============================================================================
// Peak hold
//==============================================================================

void test_audio_peak_holds_then_decays() {
    AudioFeatureProcessor proc;
    uint8_t bands[NUM_BANDS];
    fill(bands, 120);
    tick(proc, bands, 0);
    TEST_ASSERT_EQUAL_UINT8(120, proc.getFeatures().peaks[0]);
    TEST_ASSERT_EQUAL_UINT8(PEAK_HOLD_TICKS, proc.getPeakHoldCountdown(0));

    fill(bands, 0);
    uint32_t now = 0;
    for (uint8_t i = 0; i < PEAK_HOLD_TICKS; ++i) {
        now += 20;
        tick(proc, bands, now);
        TEST_ASSERT_EQUAL_UINT8(120, proc.getFeatures().peaks[0]);
    }
    TEST_ASSERT_EQUAL_UINT8(0, proc.getPeakHoldCountdown(0));

    now += 20;
    tick(proc, bands, now);
    TEST_ASSERT_EQUAL_UINT8(120 - PEAK_DECAY_STEP, proc.getFeatures().peaks[0]);
    now += 20;
    tick(proc, bands, now);
    TEST_ASSERT_EQUAL_UINT8(120 - 2 * PEAK_DECAY_STEP, proc.getFeatures().peaks[0]);
}

void test_audio_new_peak_restarts_hold() {
    AudioFeatureProcessor proc;
    uint8_t bands[NUM_BANDS];
    fill(bands, 100);
    tick(proc, bands, 0);

    fill(bands, 0);
    tick(proc, bands, 20);
    tick(proc, bands, 40);
    TEST_ASSERT_EQUAL_UINT8(PEAK_HOLD_TICKS - 2, proc.getPeakHoldCountdown(0));

    fill(bands, 150);
    tick(proc, bands, 60);
    TEST_ASSERT_EQUAL_UINT8(150, proc.getFeatures().peaks[0]);
    TEST_ASSERT_EQUAL_UINT8(PEAK_HOLD_TICKS, proc.getPeakHoldCountdown(0));
}

void test_audio_peak_decay_floors_at_zero() {
    AudioFeatureProcessor proc;
    uint8_t bands[NUM_BANDS];
    fill(bands, 6);
    tick(proc, bands, 0);

    fill(bands, 0);
    uint32_t now = 0;
    for (uint8_t i = 0; i < PEAK_HOLD_TICKS + 3; ++i) {
        now += 20;
        tick(proc, bands, now);
    }
    TEST_ASSERT_EQUAL_UINT8(0, proc.getFeatures().peaks[0]);
}

//==============================================================================
// Beat detection
//==============================================================================

void test_beat_needs_history() {
    BeatDetector beat;
    // A loud first tick has nothing to compare against
    TEST_ASSERT_FALSE(beat.push(255));
    TEST_ASSERT_EQUAL_UINT8(1, beat.getFilled());
}

void test_beat_onset_over_quiet_history() {
    BeatDetector beat;
    for (int i = 0; i < 7; ++i) {
        TEST_ASSERT_FALSE(beat.push(10));
    }
    TEST_ASSERT_TRUE(beat.push(60));
    TEST_ASSERT_EQUAL_UINT8(60, beat.getLastEnergy());
    // Sustained level is not a new onset
    TEST_ASSERT_FALSE(beat.push(60));

    beat.reset();
    TEST_ASSERT_EQUAL_UINT8(0, beat.getLastEnergy());
    TEST_ASSERT_EQUAL_UINT8(0, beat.getFilled());
}

void test_beat_reference_sequences() {
    const uint8_t loud[] = {10, 10, 10, 10, 10, 10, 10, 80};
    const uint8_t soft[] = {40, 40, 40, 40, 40, 40, 40, 45};

    BeatDetector first;
    for (uint8_t i = 0; i < 7; ++i) {
        TEST_ASSERT_FALSE(first.push(loud[i]));
    }
    TEST_ASSERT_TRUE(first.push(loud[7]));

    BeatDetector second;
    for (uint8_t energy : soft) {
        TEST_ASSERT_FALSE(second.push(energy));
    }
}

void test_beat_requires_absolute_floor() {
    BeatDetector beat;
    for (int i = 0; i < 7; ++i) {
        beat.push(0);
    }
    // 40 clears both margins but not the floor of 45
    TEST_ASSERT_FALSE(beat.push(40));
}

void test_beat_requires_margin_over_average() {
    BeatDetector beat;
    for (int i = 0; i < 7; ++i) {
        beat.push(50);
    }
    beat.push(45);
    // 65 is 20 over the previous tick but under average + 20
    TEST_ASSERT_FALSE(beat.push(65));
}

void test_beat_history_is_bounded() {
    BeatDetector beat;
    for (int i = 0; i < 20; ++i) {
        beat.push(10);
    }
    TEST_ASSERT_EQUAL_UINT8(BeatDetector::HISTORY_SIZE, beat.getFilled());
    TEST_ASSERT_TRUE(beat.push(80));
}

void test_audio_processor_flags_beat() {
    AudioFeatureProcessor proc;
    uint8_t bands[NUM_BANDS];
    fill(bands, 10);
    uint32_t now = 0;
    for (int i = 0; i < 7; ++i) {
        tick(proc, bands, now);
        now += 20;
        TEST_ASSERT_FALSE(proc.getFeatures().beat);
    }

    fill(bands, 90);
    tick(proc, bands, now);
    TEST_ASSERT_TRUE(proc.getFeatures().beat);
}

//==============================================================================
// Staleness
//==============================================================================

void test_audio_stale_without_frames() {
    AudioFeatureProcessor proc;
    proc.process(0);
    TEST_ASSERT_TRUE(proc.getFeatures().stale);
    TEST_ASSERT_EQUAL_UINT8(0, proc.getFeatures().energy);
}

void test_audio_goes_stale_and_fades() {
    AudioFeatureProcessor proc;
    uint8_t bands[NUM_BANDS];
    fill(bands, 160);
    tick(proc, bands, 1000);

    proc.process(1000 + STALE_TIMEOUT_MS - 1);
    TEST_ASSERT_FALSE(proc.getFeatures().stale);
    TEST_ASSERT_EQUAL_UINT8(160, proc.getFeatures().bands[0]);

    proc.process(1000 + STALE_TIMEOUT_MS);
    TEST_ASSERT_TRUE(proc.getFeatures().stale);
    TEST_ASSERT_EQUAL_UINT8(80, proc.getFeatures().bands[0]);

    for (int i = 0; i < 10; ++i) {
        proc.process(2000 + i * 20);
    }
    TEST_ASSERT_EQUAL_UINT8(0, proc.getFeatures().bands[0]);
}

//==============================================================================
// Busy flag
//==============================================================================

void test_audio_frame_dropped_while_rendering() {
    AudioFeatureProcessor proc;
    uint8_t bands[NUM_BANDS];
    fill(bands, 90);

    TEST_ASSERT_TRUE(proc.tryBeginRender());
    TEST_ASSERT_FALSE(proc.submitFrame(bands, 0));
    proc.process(0);
    proc.endRender();

    TEST_ASSERT_EQUAL_UINT32(1, proc.getFramesDropped());
    TEST_ASSERT_EQUAL_UINT32(0, proc.getFramesAccepted());
    TEST_ASSERT_TRUE(proc.getFeatures().stale);

    // Slot free again once the render tick ends
    TEST_ASSERT_TRUE(proc.submitFrame(bands, 10));
    TEST_ASSERT_EQUAL_UINT32(1, proc.getFramesAccepted());
}

void test_audio_render_cannot_claim_twice() {
    AudioFeatureProcessor proc;
    TEST_ASSERT_TRUE(proc.tryBeginRender());
    TEST_ASSERT_FALSE(proc.tryBeginRender());
    proc.endRender();
    TEST_ASSERT_TRUE(proc.tryBeginRender());
    proc.endRender();
}

void test_audio_newer_frame_replaces_unprocessed() {
    AudioFeatureProcessor proc;
    uint8_t first[NUM_BANDS];
    uint8_t second[NUM_BANDS];
    fill(first, 200);
    fill(second, 40);

    proc.submitFrame(first, 0);
    proc.submitFrame(second, 5);
    proc.process(10);

    TEST_ASSERT_EQUAL_UINT8(40, proc.getFeatures().bands[0]);
}

void test_audio_reset_clears_everything() {
    AudioFeatureProcessor proc;
    uint8_t bands[NUM_BANDS];
    fill(bands, 150);
    tick(proc, bands, 0);

    proc.reset();

    TEST_ASSERT_EQUAL_UINT8(0, proc.getFeatures().bands[0]);
    TEST_ASSERT_EQUAL_UINT8(0, proc.getFeatures().peaks[0]);
    TEST_ASSERT_EQUAL_UINT8(0, proc.getPeakHoldCountdown(0));
    // The pending frame went too: nothing fresh to process
    proc.process(10);
    TEST_ASSERT_TRUE(proc.getFeatures().stale);
}

void test_audio_reset_deferred_while_busy() {
    AudioFeatureProcessor proc;
    uint8_t bands[NUM_BANDS];
    fill(bands, 150);
    tick(proc, bands, 0);

    TEST_ASSERT_TRUE(proc.tryBeginRender());
    proc.reset();
    // Still holding old values until the next pass
    TEST_ASSERT_EQUAL_UINT8(150, proc.getFeatures().peaks[0]);
    proc.process(10);
    proc.endRender();

    TEST_ASSERT_EQUAL_UINT8(0, proc.getFeatures().peaks[0]);
    TEST_ASSERT_TRUE(proc.getFeatures().stale);
}

//==============================================================================
// Test Suite Runner
//==============================================================================

void run_audio_feature_tests() {
    RUN_TEST(test_audio_attack_is_instant);
    RUN_TEST(test_audio_release_halves_distance);
    RUN_TEST(test_audio_bands_are_independent);

    RUN_TEST(test_audio_peak_holds_then_decays);
    RUN_TEST(test_audio_new_peak_restarts_hold);
    RUN_TEST(test_audio_peak_decay_floors_at_zero);

    RUN_TEST(test_beat_needs_history);
    RUN_TEST(test_beat_onset_over_quiet_history);
    RUN_TEST(test_beat_reference_sequences);
    RUN_TEST(test_beat_requires_absolute_floor);
    RUN_TEST(test_beat_requires_margin_over_average);
    RUN_TEST(test_beat_history_is_bounded);
    RUN_TEST(test_audio_processor_flags_beat);

    RUN_TEST(test_audio_stale_without_frames);
    RUN_TEST(test_audio_goes_stale_and_fades);

    RUN_TEST(test_audio_frame_dropped_while_rendering);
    RUN_TEST(test_audio_render_cannot_claim_twice);
    RUN_TEST(test_audio_newer_frame_replaces_unprocessed);
    RUN_TEST(test_audio_reset_clears_everything);
    RUN_TEST(test_audio_reset_deferred_while_busy);
}
