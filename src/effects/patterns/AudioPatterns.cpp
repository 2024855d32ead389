// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AudioPatterns.cpp
 * @brief Audio-reactive pattern implementations
 */

#include "AudioPatterns.h"

#include <cstring>

namespace ledlink {
namespace effects {
namespace patterns {

using audio::AudioFeatures;
using audio::NUM_BANDS;

namespace {

CRGB s_scratch[PATTERN_MAX_LEDS];

uint8_t bandForPixel(uint16_t i, uint16_t count) {
    return static_cast<uint8_t>((static_cast<uint32_t>(i) * NUM_BANDS) / count);
}

uint8_t dominantBand(const AudioFeatures& audio) {
    uint8_t best = 0;
    for (uint8_t b = 1; b < NUM_BANDS; b++) {
        if (audio.bands[b] > audio.bands[best]) {
            best = b;
        }
    }
    return best;
}

} // namespace

// ==================== Spectrum ====================

void AudioSpectrumPattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    if (count == 0) return;
    const AudioFeatures& audio = *frame.audio;

    fill_solid(s_scratch, count, CRGB::Black);

    if (count < NUM_BANDS) {
        // Too few pixels for segments: one band per pixel
        for (uint16_t i = 0; i < count; i++) {
            uint8_t band = bandForPixel(i, count);
            s_scratch[i] = CHSV(band * (256 / NUM_BANDS), 255, audio.bands[band]);
        }
        writeStrip(ctx, s_scratch);
        return;
    }

    for (uint8_t band = 0; band < NUM_BANDS; band++) {
        uint16_t start = static_cast<uint16_t>((static_cast<uint32_t>(band) * count) / NUM_BANDS);
        uint16_t end = static_cast<uint16_t>((static_cast<uint32_t>(band + 1) * count) / NUM_BANDS);
        uint16_t len = end - start;
        if (len == 0) continue;

        uint8_t hue = band * (256 / NUM_BANDS);
        uint16_t lit = static_cast<uint16_t>((static_cast<uint32_t>(len) * audio.bands[band] + 127) / 255);
        for (uint16_t k = 0; k < lit; k++) {
            // Brighter toward the top of the bar
            uint8_t val = static_cast<uint8_t>(96 + (159 * (k + 1)) / len);
            s_scratch[start + k] = CHSV(hue, 255, val);
        }

        if (audio.peaks[band] > 0) {
            uint16_t peakPos = static_cast<uint16_t>(((len - 1) * static_cast<uint32_t>(audio.peaks[band])) / 255);
            s_scratch[start + peakPos] = CHSV(hue, 60, 255);
        }
    }
    writeStrip(ctx, s_scratch);
}

// ==================== Wave ====================

AudioWavePattern::AudioWavePattern() {
    reset();
}

void AudioWavePattern::reset() {
    fill_solid(m_wave, PATTERN_MAX_LEDS, CRGB::Black);
}

void AudioWavePattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    if (count == 0) return;
    const AudioFeatures& audio = *frame.audio;

    uint16_t centre = count / 2;
    for (uint16_t i = count - 1; i > centre; i--) {
        m_wave[i] = m_wave[i - 1];
    }
    for (uint16_t i = 0; i + 1 <= centre && i + 1 < count; i++) {
        m_wave[i] = m_wave[i + 1];
    }

    CRGB injected;
    if (audio.beat) {
        injected = CRGB(audio.energy, audio.energy, audio.energy);
    } else {
        uint8_t hue = static_cast<uint8_t>(dominantBand(audio) * (256 / NUM_BANDS) + frame.elapsedMs / 100);
        injected = CHSV(hue, 240, qadd8(audio.energy, audio.energy));
    }
    m_wave[centre] = injected;
    if (count % 2 == 0 && centre > 0) {
        m_wave[centre - 1] = injected;
    }

    writeStrip(ctx, m_wave);
}

// ==================== Energy ====================

AudioEnergyPattern::AudioEnergyPattern()
    : m_beatGlow(0) {
}

void AudioEnergyPattern::reset() {
    m_beatGlow = 0;
}

void AudioEnergyPattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    if (count == 0) return;
    const AudioFeatures& audio = *frame.audio;

    if (audio.beat) {
        m_beatGlow = 255;
    } else {
        m_beatGlow = qsub8(m_beatGlow, 32);
    }

    // Meter reaches the ends at full energy
    uint8_t reach = audio.energy;
    for (uint16_t i = 0; i < count; i++) {
        uint8_t dist = centreDistance(i, count);
        CRGB color = CRGB::Black;
        if (dist < reach) {
            uint8_t hue = 96 - scale8(dist, 96);  // Green centre, red tips
            color = CHSV(hue, 255, 255);
        }
        uint8_t white = scale8(m_beatGlow, 90);
        color += CRGB(white, white, white);
        s_scratch[i] = color;
    }
    writeStrip(ctx, s_scratch);
}

// ==================== Particles ====================

AudioParticlesPattern::AudioParticlesPattern() {
    reset();
}

void AudioParticlesPattern::reset() {
    memset(m_particles, 0, sizeof(m_particles));
    fill_solid(m_trail, PATTERN_MAX_LEDS, CRGB::Black);
}

void AudioParticlesPattern::spawn(uint16_t count, uint8_t hue, uint8_t strength) {
    for (uint8_t p = 0; p < MAX_PARTICLES; p++) {
        Particle& slot = m_particles[p];
        if (slot.life != 0) continue;

        slot.pos = static_cast<int32_t>(count / 2) << 8;
        int16_t speed = static_cast<int16_t>(96 + random8(scale8(strength, 160) + 1));
        slot.vel = (random8() & 1) ? speed : static_cast<int16_t>(-speed);
        slot.hue = hue + random8(24);
        slot.life = 255;
        return;
    }
}

void AudioParticlesPattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    if (count == 0) return;
    const AudioFeatures& audio = *frame.audio;

    fadeToBlackBy(m_trail, count, 64);

    if (audio.beat) {
        uint8_t hue = static_cast<uint8_t>(dominantBand(audio) * (256 / NUM_BANDS));
        uint8_t burst = 1 + audio.energy / 64;
        for (uint8_t n = 0; n < burst; n++) {
            spawn(count, hue, audio.energy);
        }
    }

    const int32_t limit = static_cast<int32_t>(count) << 8;
    for (uint8_t p = 0; p < MAX_PARTICLES; p++) {
        Particle& part = m_particles[p];
        if (part.life == 0) continue;

        part.pos += part.vel;
        part.vel = static_cast<int16_t>((part.vel * 15) / 16);
        part.life = qsub8(part.life, 6);

        if (part.pos < 0 || part.pos >= limit) {
            part.life = 0;
            continue;
        }
        m_trail[part.pos >> 8] += CHSV(part.hue, 220, part.life);
    }

    writeStrip(ctx, m_trail);
}

// ==================== Rainbow bars ====================

void AudioRainbowBarsPattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    if (count == 0) return;
    const AudioFeatures& audio = *frame.audio;

    uint8_t drift = static_cast<uint8_t>(frame.elapsedMs / 30);
    for (uint16_t i = 0; i < count; i++) {
        uint8_t hue = static_cast<uint8_t>((static_cast<uint32_t>(i) * 256) / count) + drift;
        uint8_t level = audio.bands[bandForPixel(i, count)];
        s_scratch[i] = CHSV(hue, 255, dim8_video(level));
    }
    writeStrip(ctx, s_scratch);
}

} // namespace patterns
} // namespace effects
} // namespace ledlink
