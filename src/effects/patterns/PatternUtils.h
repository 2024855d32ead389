// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PatternUtils.h
 * @brief FastLED helpers shared by the device pattern set
 */

#pragma once

#include <FastLED.h>

#include "config/hardware_config.h"
#include "render/RenderContext.h"

namespace ledlink {
namespace effects {
namespace patterns {

/// Patterns that keep their own frame between ticks size it to this
static constexpr uint16_t PATTERN_MAX_LEDS = config::HardwareConfig::MAX_LEDS;

inline hal::RGB toRgb(const CRGB& c) {
    return hal::RGB(c.r, c.g, c.b);
}

inline void writeStrip(const render::RenderContext& ctx, const CRGB* src) {
    for (uint16_t i = 0; i < ctx.ledCount; ++i) {
        ctx.leds[i] = toRgb(src[i]);
    }
}

inline uint16_t clampedCount(const render::RenderContext& ctx) {
    return ctx.ledCount < PATTERN_MAX_LEDS ? ctx.ledCount : PATTERN_MAX_LEDS;
}

/// Distance from the strip centre, 0 at the middle and 255 at either end
inline uint8_t centreDistance(uint16_t i, uint16_t count) {
    if (count < 2) return 0;
    int32_t twice = static_cast<int32_t>(i) * 2 - static_cast<int32_t>(count - 1);
    if (twice < 0) twice = -twice;
    return static_cast<uint8_t>((twice * 255) / static_cast<int32_t>(count - 1));
}

} // namespace patterns
} // namespace effects
} // namespace ledlink
