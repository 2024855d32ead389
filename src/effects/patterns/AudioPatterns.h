// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AudioPatterns.h
 * @brief Mode 10-14: patterns driven by the smoothed band energies
 *
 * Renderers read RenderFrame::audio only. Once the stream goes stale the
 * processor decays every band toward zero, so these fade out on their own.
 */

#pragma once

#include <FastLED.h>

#include "audio/AudioFrame.h"
#include "effects/IEffectRenderer.h"
#include "PatternUtils.h"

namespace ledlink {
namespace effects {
namespace patterns {

/**
 * @brief One segment per band, lit in proportion to its energy, peak pixel on top
 */
class AudioSpectrumPattern : public IEffectRenderer {
public:
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    const char* getName() const override { return "Audio Spectrum"; }
};

/**
 * @brief Color waves pushed outward from the centre, one step per tick
 */
class AudioWavePattern : public IEffectRenderer {
public:
    AudioWavePattern();
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    void reset() override;
    const char* getName() const override { return "Audio Wave"; }

private:
    CRGB m_wave[PATTERN_MAX_LEDS];
};

/**
 * @brief Centre-out level meter of the mean energy, beats flash white
 */
class AudioEnergyPattern : public IEffectRenderer {
public:
    AudioEnergyPattern();
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    void reset() override;
    const char* getName() const override { return "Audio Energy"; }

private:
    uint8_t m_beatGlow;
};

/**
 * @brief Beats launch particles from the centre; they slow and fade out
 */
class AudioParticlesPattern : public IEffectRenderer {
public:
    AudioParticlesPattern();
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    void reset() override;
    const char* getName() const override { return "Audio Particles"; }

private:
    static constexpr uint8_t MAX_PARTICLES = 16;

    struct Particle {
        int32_t pos;      // 8.8 fixed point, in pixels
        int16_t vel;      // 8.8 pixels per tick
        uint8_t hue;
        uint8_t life;     // 0 = free slot
    };

    void spawn(uint16_t count, uint8_t hue, uint8_t strength);

    Particle m_particles[MAX_PARTICLES];
    CRGB m_trail[PATTERN_MAX_LEDS];
};

/**
 * @brief Full rainbow across the strip, each pixel scaled by its band
 */
class AudioRainbowBarsPattern : public IEffectRenderer {
public:
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    const char* getName() const override { return "Audio Rainbow Bars"; }
};

} // namespace patterns
} // namespace effects
} // namespace ledlink
