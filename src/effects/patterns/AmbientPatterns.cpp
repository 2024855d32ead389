// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file AmbientPatterns.cpp
 * @brief Non-audio pattern implementations
 */

#include "AmbientPatterns.h"

#include <cstring>

namespace ledlink {
namespace effects {
namespace patterns {

namespace {

// Patterns run one at a time on the loop thread; stateless ones share this
CRGB s_scratch[PATTERN_MAX_LEDS];

/// sin16-shaped sweep between lo and hi with the given period
uint16_t oscillate(uint32_t t, uint32_t periodMs, uint16_t lo, uint16_t hi) {
    uint16_t phase = static_cast<uint16_t>(((t % periodMs) * 65536ULL) / periodMs);
    uint16_t s = static_cast<uint16_t>(sin16(phase) + 32768);
    return lo + scale16(s, hi - lo);
}

const CRGBPalette16 kPacificaShallow = {
    0x000507, 0x000409, 0x00030B, 0x00030D, 0x000210, 0x000212, 0x000114, 0x000117,
    0x000019, 0x00001C, 0x000026, 0x000031, 0x00003B, 0x000046, 0x14554B, 0x28AA50
};
const CRGBPalette16 kPacificaSwell = {
    0x000507, 0x000409, 0x00030B, 0x00030D, 0x000210, 0x000212, 0x000114, 0x000117,
    0x000019, 0x00001C, 0x000026, 0x000031, 0x00003B, 0x000046, 0x0C5F52, 0x19BE5F
};
const CRGBPalette16 kPacificaDeep = {
    0x000208, 0x00030E, 0x000514, 0x00061A, 0x000820, 0x000927, 0x000B2D, 0x000C33,
    0x000E39, 0x001040, 0x001450, 0x001860, 0x001C70, 0x002080, 0x1040BF, 0x2060FF
};

const CRGBPalette16 kPaletteCycle[] = {
    CRGBPalette16(RainbowColors_p),
    CRGBPalette16(PartyColors_p),
    CRGBPalette16(OceanColors_p),
    CRGBPalette16(LavaColors_p),
    CRGBPalette16(ForestColors_p),
    CRGBPalette16(CloudColors_p)
};
constexpr uint8_t PALETTE_CYCLE_COUNT = sizeof(kPaletteCycle) / sizeof(kPaletteCycle[0]);
constexpr uint32_t PALETTE_HOLD_MS = 10000;

} // namespace

// ==================== Rainbow ====================

void RainbowPattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    if (count == 0) return;

    uint8_t startHue = static_cast<uint8_t>(frame.elapsedMs / 20);
    uint8_t delta = count >= 256 ? 1 : static_cast<uint8_t>(256 / count);
    fill_rainbow(s_scratch, count, startHue, delta);
    writeStrip(ctx, s_scratch);
}

// ==================== Fire ====================

FirePattern::FirePattern() {
    reset();
}

void FirePattern::reset() {
    memset(m_heat, 0, sizeof(m_heat));
}

void FirePattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    (void)frame;
    uint16_t count = clampedCount(ctx);
    if (count == 0) return;

    // Heat flows outward from the centre; m_heat[0] is the centre pixel
    uint16_t half = (count + 1) / 2;

    uint8_t maxCool = static_cast<uint8_t>(((COOLING * 10) / half) + 2);
    for (uint16_t i = 0; i < half; i++) {
        m_heat[i] = qsub8(m_heat[i], random8(0, maxCool));
    }

    for (uint16_t k = half - 1; k >= 2; k--) {
        m_heat[k] = static_cast<uint8_t>((m_heat[k - 1] + m_heat[k - 2] + m_heat[k - 2]) / 3);
    }

    if (random8() < SPARKING) {
        uint8_t y = random8(half < 3 ? half : 3);
        m_heat[y] = qadd8(m_heat[y], random8(160, 255));
    }

    uint16_t centre = count / 2;
    for (uint16_t i = 0; i < count; i++) {
        uint16_t k;
        if (i >= centre) {
            k = i - centre;
        } else {
            k = (count % 2 == 0) ? centre - 1 - i : centre - i;
        }
        s_scratch[i] = HeatColor(m_heat[k]);
    }
    writeStrip(ctx, s_scratch);
}

// ==================== Palette ====================

void PalettePattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    uint8_t which = static_cast<uint8_t>((frame.elapsedMs / PALETTE_HOLD_MS) % PALETTE_CYCLE_COUNT);
    const CRGBPalette16& palette = kPaletteCycle[which];

    uint8_t index = static_cast<uint8_t>(frame.elapsedMs / 20);
    for (uint16_t i = 0; i < count; i++) {
        s_scratch[i] = ColorFromPalette(palette, index, 255, LINEARBLEND);
        index += 3;
    }
    writeStrip(ctx, s_scratch);
}

// ==================== Cylon ====================

CylonPattern::CylonPattern() {
    reset();
}

void CylonPattern::reset() {
    fill_solid(m_trail, PATTERN_MAX_LEDS, CRGB::Black);
}

void CylonPattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    if (count == 0) return;

    fadeToBlackBy(m_trail, count, 48);

    uint16_t pos = oscillate(frame.elapsedMs, 2000, 0, count - 1);
    m_trail[pos] = CHSV(static_cast<uint8_t>(frame.elapsedMs / 40), 255, 255);
    writeStrip(ctx, m_trail);
}

// ==================== Pacifica ====================

void PacificaPattern::addLayer(CRGB* out, uint16_t count, const CRGBPalette16& palette,
                               uint16_t start, uint16_t scale, uint8_t bri, uint16_t offset) {
    uint16_t ci = start;
    uint16_t waveAngle = offset;
    uint16_t halfScale = (scale / 2) + 20;
    for (uint16_t i = 0; i < count; i++) {
        waveAngle += 250;
        uint16_t s16 = static_cast<uint16_t>(sin16(waveAngle) + 32768);
        uint16_t cs = scale16(s16, halfScale) + halfScale;
        ci += cs;
        uint16_t index16 = static_cast<uint16_t>(sin16(ci) + 32768);
        uint8_t index8 = static_cast<uint8_t>(scale16(index16, 240));
        out[i] += ColorFromPalette(palette, index8, bri, LINEARBLEND);
    }
}

void PacificaPattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    uint32_t t = frame.elapsedMs;

    fill_solid(s_scratch, count, CRGB(2, 6, 10));

    addLayer(s_scratch, count, kPacificaShallow, static_cast<uint16_t>(t * 2),
             oscillate(t, 20000, 11 * 256, 14 * 256), static_cast<uint8_t>(oscillate(t, 9000, 70, 130)),
             static_cast<uint16_t>(0 - t * 5));
    addLayer(s_scratch, count, kPacificaSwell, static_cast<uint16_t>(0 - t * 3),
             oscillate(t, 27000, 6 * 256, 9 * 256), static_cast<uint8_t>(oscillate(t, 13000, 40, 80)),
             static_cast<uint16_t>(t * 4));
    addLayer(s_scratch, count, kPacificaDeep, static_cast<uint16_t>(t * 5),
             6 * 256, static_cast<uint8_t>(oscillate(t, 7000, 10, 38)),
             static_cast<uint16_t>(0 - t * 7));
    addLayer(s_scratch, count, kPacificaDeep, static_cast<uint16_t>(0 - t * 4),
             5 * 256, static_cast<uint8_t>(oscillate(t, 11000, 10, 28)),
             static_cast<uint16_t>(t * 6));

    // Whitecaps where the layers pile up
    uint8_t threshold = static_cast<uint8_t>(oscillate(t, 6500, 55, 65));
    uint8_t wave = static_cast<uint8_t>(t / 8);
    for (uint16_t i = 0; i < count; i++) {
        uint8_t local = scale8(sin8(wave), 20) + threshold;
        wave += 7;
        uint8_t light = s_scratch[i].getAverageLight();
        if (light > local) {
            uint8_t over = light - local;
            uint8_t over2 = qadd8(over, over);
            s_scratch[i] += CRGB(over, over2, qadd8(over2, over2));
        }
    }

    for (uint16_t i = 0; i < count; i++) {
        s_scratch[i].blue = scale8(s_scratch[i].blue, 145);
        s_scratch[i].green = scale8(s_scratch[i].green, 200);
        s_scratch[i] |= CRGB(2, 5, 7);
    }
    writeStrip(ctx, s_scratch);
}

// ==================== Pride ====================

void PridePattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    uint32_t t = frame.elapsedMs;

    uint8_t sat8 = static_cast<uint8_t>(oscillate(t, 17000, 220, 250));
    uint8_t brightDepth = static_cast<uint8_t>(oscillate(t, 45000, 96, 224));
    uint16_t thetaInc = oscillate(t, 29000, 25 * 256, 40 * 256);
    uint16_t hueInc = oscillate(t, 53000, 1, 3000);

    uint16_t hue16 = static_cast<uint16_t>(t * 7);
    uint16_t theta = static_cast<uint16_t>(t * 40);

    for (uint16_t i = 0; i < count; i++) {
        hue16 += hueInc;
        theta += thetaInc;

        uint16_t b16 = static_cast<uint16_t>(sin16(theta) + 32768);
        uint32_t bri16 = (static_cast<uint32_t>(b16) * b16) / 65536;
        uint8_t bri8 = static_cast<uint8_t>((bri16 * brightDepth) / 65536);
        bri8 += (255 - brightDepth);

        // Painted from the far end so the motion runs toward index 0
        s_scratch[count - 1 - i] = CHSV(static_cast<uint8_t>(hue16 >> 8), sat8, bri8);
    }
    writeStrip(ctx, s_scratch);
}

// ==================== Plasma ====================

void PlasmaPattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    uint16_t t = static_cast<uint16_t>(frame.elapsedMs / 4);

    for (uint16_t i = 0; i < count; i++) {
        uint8_t dist = centreDistance(i, count);
        uint8_t v1 = sin8(static_cast<uint8_t>(dist * 2 + t));
        uint8_t v2 = sin8(static_cast<uint8_t>(dist + (t >> 1) * 3));
        uint8_t v3 = cos8(static_cast<uint8_t>(i * 5 - (t >> 2)));

        uint8_t index = static_cast<uint8_t>((v1 + v2 + v3) / 3 + (t >> 3));
        uint8_t bri = qadd8(scale8(v1, 128), scale8(v2, 127));
        s_scratch[i] = ColorFromPalette(PartyColors_p, index, bri, LINEARBLEND);
    }
    writeStrip(ctx, s_scratch);
}

// ==================== Aurora ====================

void AuroraPattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    uint32_t t = frame.elapsedMs;

    for (uint16_t i = 0; i < count; i++) {
        uint8_t curtain = inoise8(static_cast<uint16_t>(i * 40), static_cast<uint16_t>(t / 6));
        uint8_t shimmer = inoise8(static_cast<uint16_t>(i * 90 + 5000), static_cast<uint16_t>(t / 3));

        // Green at the base of the curtain, violet at its edges
        uint8_t hue = static_cast<uint8_t>(96 + scale8(curtain, 96));
        uint8_t val = qsub8(curtain, 60);
        val = scale8(qadd8(val, val), 255 - scale8(centreDistance(i, count), 110));
        val = qadd8(val, scale8(shimmer, 24));

        s_scratch[i] = CHSV(hue, 230, val);
    }
    writeStrip(ctx, s_scratch);
}

// ==================== Matrix ====================

MatrixPattern::MatrixPattern()
    : m_lastStepMs(0) {
    reset();
}

void MatrixPattern::reset() {
    fill_solid(m_rain, PATTERN_MAX_LEDS, CRGB::Black);
    m_lastStepMs = 0;
}

void MatrixPattern::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    uint16_t count = clampedCount(ctx);
    if (count == 0) return;

    uint8_t steps = 0;
    while (frame.elapsedMs - m_lastStepMs >= STEP_MS && steps < 4) {
        m_lastStepMs += STEP_MS;
        steps++;

        for (uint16_t i = 0; i + 1 < count; i++) {
            m_rain[i] = m_rain[i + 1];
        }

        CRGB& head = m_rain[count - 1];
        if (random8() < 40) {
            head = CRGB(175, 255, 175);
        } else {
            head = m_rain[count >= 2 ? count - 2 : 0];
            head.nscale8(160);
            head.red = scale8(head.red, 80);
            head.blue = scale8(head.blue, 80);
        }
    }

    // Large gaps (first frame after a long stall) resync instead of replaying
    if (frame.elapsedMs - m_lastStepMs >= STEP_MS) {
        m_lastStepMs = frame.elapsedMs;
    }

    writeStrip(ctx, m_rain);
}

} // namespace patterns
} // namespace effects
} // namespace ledlink
