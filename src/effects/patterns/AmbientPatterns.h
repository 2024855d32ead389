// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AmbientPatterns.h
 * @brief Mode 1-9: non-audio patterns drawn with FastLED color math
 *
 * All timing comes from RenderFrame::elapsedMs so a pattern restarts from
 * its first frame whenever the mode is selected again.
 */

#pragma once

#include <FastLED.h>

#include "effects/IEffectRenderer.h"
#include "PatternUtils.h"

namespace ledlink {
namespace effects {
namespace patterns {

class RainbowPattern : public IEffectRenderer {
public:
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    const char* getName() const override { return "Rainbow"; }
};

/**
 * @brief Fire2012-style heat simulation, sparks injected at the centre
 */
class FirePattern : public IEffectRenderer {
public:
    FirePattern();
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    void reset() override;
    const char* getName() const override { return "Fire"; }

private:
    static constexpr uint8_t COOLING = 55;
    static constexpr uint8_t SPARKING = 120;

    uint8_t m_heat[PATTERN_MAX_LEDS];
};

/**
 * @brief Cycles through a handful of stock palettes, 10 s each
 */
class PalettePattern : public IEffectRenderer {
public:
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    const char* getName() const override { return "Palette"; }
};

class CylonPattern : public IEffectRenderer {
public:
    CylonPattern();
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    void reset() override;
    const char* getName() const override { return "Cylon"; }

private:
    CRGB m_trail[PATTERN_MAX_LEDS];
};

/**
 * @brief Layered ocean waves (after the FastLED Pacifica demo)
 */
class PacificaPattern : public IEffectRenderer {
public:
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    const char* getName() const override { return "Pacifica"; }

private:
    void addLayer(CRGB* out, uint16_t count, const CRGBPalette16& palette,
                  uint16_t start, uint16_t scale, uint8_t bri, uint16_t offset);
};

/**
 * @brief Pride2015: continuously shifting saturated rainbow
 */
class PridePattern : public IEffectRenderer {
public:
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    const char* getName() const override { return "Pride"; }
};

class PlasmaPattern : public IEffectRenderer {
public:
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    const char* getName() const override { return "Plasma"; }
};

class AuroraPattern : public IEffectRenderer {
public:
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    const char* getName() const override { return "Aurora"; }
};

/**
 * @brief Green code rain falling toward index 0
 */
class MatrixPattern : public IEffectRenderer {
public:
    MatrixPattern();
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    void reset() override;
    const char* getName() const override { return "Matrix"; }

private:
    static constexpr uint32_t STEP_MS = 60;

    CRGB m_rain[PATTERN_MAX_LEDS];
    uint32_t m_lastStepMs;
};

} // namespace patterns
} // namespace effects
} // namespace ledlink
