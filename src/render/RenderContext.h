// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RenderContext.h
 * @brief What a renderer may read and write during one tick
 *
 * Renderers receive these and must not reach for anything else: no global
 * LED buffer, no global mode. The scheduler owns the buffer that ctx.leds
 * points at, and it is valid only for the duration of render().
 */

#pragma once

#include <cstdint>

#include "audio/AudioFrame.h"
#include "config/hardware_config.h"
#include "effects/ModeId.h"
#include "hal/ILedDriver.h"

namespace ledlink {
namespace render {

/**
 * @brief Light settings changed by protocol commands and the console
 *
 * Written and read on the loop thread only.
 */
struct LightState {
    effects::ModeId mode = effects::ModeId::Static;
    uint8_t brightness = config::HardwareConfig::DEFAULT_BRIGHTNESS;
    hal::RGB staticColor = hal::RGB::White();

    /// Set on a mode change; the scheduler resets renderer state on its next tick
    bool modeResetPending = false;
};

/**
 * @brief Per-tick view of the settings plus the output buffer
 */
struct RenderContext {
    effects::ModeId mode;
    uint8_t brightness;
    hal::RGB staticColor;
    hal::RGB* leds;
    uint16_t ledCount;
};

/**
 * @brief Timing and audio for one tick
 */
struct RenderFrame {
    uint32_t nowMs;
    uint32_t elapsedMs;   // Since the current mode started
    uint32_t deltaMs;     // Since the previous rendered tick
    const audio::AudioFeatures* audio;  // Never null; stale/zero outside audio modes
};

} // namespace render
} // namespace ledlink
