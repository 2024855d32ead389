// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RenderScheduler.h
 * @brief Fixed-budget main loop tick
 *
 * One tick per loop wake:
 *   1. Service the network transport (queued protocol work)
 *   2. Advance the connection manager
 *   3-4. Skip the tick (yield + watchdog) until the mode's budget has elapsed
 *   5. Claim the audio busy flag, apply a pending mode reset, run the audio pass
 *   6. Indicator > connected flash > active mode renderer
 *   7. Flush the buffer once
 *   8. Release the busy flag, feed the watchdog
 *
 * The LED buffer is owned here and written only inside tick().
 */

#pragma once

#include <cstdint>

#include "ConnectedFlash.h"
#include "ConnectionIndicator.h"
#include "RenderContext.h"
#include "config/hardware_config.h"
#include "effects/ModeId.h"
#include "hal/ILedDriver.h"
#include "hal/IPlatformServices.h"

namespace ledlink {

namespace audio { class AudioFeatureProcessor; }
namespace effects { class EffectRegistry; }
namespace network { class ConnectionManager; }

namespace render {

/**
 * @brief Scheduler counters (console "status")
 */
struct SchedulerStats {
    uint32_t framesRendered = 0;
    uint32_t budgetYields = 0;   // Ticks skipped because the budget had not elapsed
    uint32_t busyYields = 0;     // Ticks skipped because the transport held the slot
    uint32_t lastRenderUs = 0;   // Not measured on host builds
};

class RenderScheduler {
public:
    RenderScheduler(LightState& lights,
                    audio::AudioFeatureProcessor& audio,
                    network::ConnectionManager& connection,
                    effects::EffectRegistry& effects,
                    hal::ILedDriver& driver,
                    hal::IPlatformServices& platform);

    RenderScheduler(const RenderScheduler&) = delete;
    RenderScheduler& operator=(const RenderScheduler&) = delete;

    /**
     * @brief Initialize the driver and blank the strip
     * @return false if the LED driver failed to initialize
     */
    bool begin(uint32_t nowMs);

    void tick(uint32_t nowMs);

    /**
     * @brief Budget for a mode in milliseconds
     */
    static uint32_t budgetFor(effects::ModeId mode);

    const SchedulerStats& getStats() const { return m_stats; }
    const hal::RGB* getBuffer() const { return m_leds; }
    uint16_t getLedCount() const { return m_ledCount; }
    bool isFlashActive() const { return m_flash.isActive(); }

private:
    void renderFrame(uint32_t nowMs);
    void idle();
    void reportPerf(uint32_t nowMs);

    LightState& m_lights;
    audio::AudioFeatureProcessor& m_audio;
    network::ConnectionManager& m_connection;
    effects::EffectRegistry& m_effects;
    hal::ILedDriver& m_driver;
    hal::IPlatformServices& m_platform;

    ConnectionIndicator m_indicator;
    ConnectedFlash m_flash;

    hal::RGB m_leds[config::HardwareConfig::MAX_LEDS];
    uint16_t m_ledCount = 0;

    effects::ModeId m_activeMode = effects::ModeId::Static;
    uint32_t m_modeStartMs = 0;
    uint32_t m_lastRenderMs = 0;
    bool m_hasRendered = false;

    SchedulerStats m_stats;
    uint32_t m_perfWindowStartMs = 0;
    uint32_t m_perfWindowFrames = 0;
};

} // namespace render
} // namespace ledlink
