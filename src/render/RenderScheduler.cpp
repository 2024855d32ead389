// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RenderScheduler.cpp
 * @brief Tick arbitration between network, audio, overlays and renderers
 */

#include "RenderScheduler.h"

#include "audio/AudioFeatureProcessor.h"
#include "config/features.h"
#include "config/render_config.h"
#include "effects/EffectRegistry.h"
#include "network/ConnectionManager.h"
#include "utils/Timing.h"

#define LL_LOG_TAG "Scheduler"
#include "utils/Log.h"

#ifdef ARDUINO
#include <Arduino.h>
#endif

namespace ledlink {
namespace render {

using config::RenderConfig::AUDIO_TICK_BUDGET_MS;
using config::RenderConfig::AMBIENT_TICK_BUDGET_MS;
using config::RenderConfig::IDLE_YIELD_MS;
using config::RenderConfig::PERF_REPORT_INTERVAL_MS;

RenderScheduler::RenderScheduler(LightState& lights,
                                 audio::AudioFeatureProcessor& audio,
                                 network::ConnectionManager& connection,
                                 effects::EffectRegistry& effects,
                                 hal::ILedDriver& driver,
                                 hal::IPlatformServices& platform)
    : m_lights(lights)
    , m_audio(audio)
    , m_connection(connection)
    , m_effects(effects)
    , m_driver(driver)
    , m_platform(platform) {
}

bool RenderScheduler::begin(uint32_t nowMs) {
    if (!m_driver.init()) {
        LL_RENDER_LOGE("LED driver init failed");
        return false;
    }

    m_ledCount = m_driver.getLedCount();
    if (m_ledCount > config::HardwareConfig::MAX_LEDS) {
        LL_RENDER_LOGW("Driver reports %u LEDs, clamping to %u",
                       m_ledCount, config::HardwareConfig::MAX_LEDS);
        m_ledCount = config::HardwareConfig::MAX_LEDS;
    }

    for (uint16_t i = 0; i < m_ledCount; ++i) {
        m_leds[i] = hal::RGB::Black();
    }
    m_driver.setBrightness(m_lights.brightness);
    m_driver.show(m_leds, m_ledCount);

    m_activeMode = m_lights.mode;
    m_modeStartMs = nowMs;
    m_perfWindowStartMs = nowMs;
    LL_RENDER_LOGI("Scheduler ready: %u LEDs, mode %s",
                   m_ledCount, effects::modeName(m_activeMode));
    return true;
}

uint32_t RenderScheduler::budgetFor(effects::ModeId mode) {
    return effects::isAudioReactive(mode) ? AUDIO_TICK_BUDGET_MS : AMBIENT_TICK_BUDGET_MS;
}

void RenderScheduler::tick(uint32_t nowMs) {
    // 1. Network input
    m_platform.serviceNetwork(nowMs);

    // 2. Association state
    network::ConnectionEvents events = m_connection.update(nowMs);
    if (events.reconfigured) {
        m_flash.cancel();
    }
    if (events.associated) {
        m_flash.arm();
    }

    // 3-4. Budget
    if (m_hasRendered && !utils::hasElapsed(nowMs, m_lastRenderMs, budgetFor(m_lights.mode))) {
        m_stats.budgetYields++;
        idle();
        return;
    }

    // 5. Busy flag
    if (!m_audio.tryBeginRender()) {
        m_stats.busyYields++;
        LL_RENDER_LOGT("Audio slot busy, yielding");
        idle();
        return;
    }

#ifdef ARDUINO
    uint32_t startUs = micros();
#endif

    renderFrame(nowMs);

    // 7. Single flush
    m_driver.setBrightness(m_lights.brightness);
    m_driver.show(m_leds, m_ledCount);

    // 8. Release
    m_audio.endRender();
    m_platform.feedWatchdog();

#ifdef ARDUINO
    m_stats.lastRenderUs = micros() - startUs;
#endif

    m_lastRenderMs = nowMs;
    m_hasRendered = true;
    m_stats.framesRendered++;
    m_perfWindowFrames++;

#if FEATURE_PERF_REPORT
    reportPerf(nowMs);
#endif
}

void RenderScheduler::renderFrame(uint32_t nowMs) {
    if (m_lights.modeResetPending || m_lights.mode != m_activeMode) {
        m_effects.resetEffect(m_lights.mode);
        m_activeMode = m_lights.mode;
        m_modeStartMs = nowMs;
        m_lights.modeResetPending = false;
        LL_RENDER_LOGD("Renderer reset for %s", effects::modeName(m_activeMode));
    }

    if (effects::isAudioReactive(m_activeMode)) {
        m_audio.process(nowMs);
    }

    // 6. Overlays take the whole strip
    network::ConnectionState state = m_connection.getState();
    if (m_connection.showsIndicator()) {
        m_indicator.render(state, m_leds, m_ledCount, nowMs);
        return;
    }
    if (m_flash.render(m_leds, m_ledCount, nowMs)) {
        return;
    }

    RenderContext ctx;
    ctx.mode = m_activeMode;
    ctx.brightness = m_lights.brightness;
    ctx.staticColor = m_lights.staticColor;
    ctx.leds = m_leds;
    ctx.ledCount = m_ledCount;

    RenderFrame frame;
    frame.nowMs = nowMs;
    frame.elapsedMs = utils::elapsedMs(nowMs, m_modeStartMs);
    frame.deltaMs = m_hasRendered ? utils::elapsedMs(nowMs, m_lastRenderMs) : 0;
    frame.audio = &m_audio.getFeatures();

    effects::IEffectRenderer* renderer = m_effects.get(m_activeMode);
    if (renderer == nullptr) {
        static uint32_t s_lastWarn = 0;
        LL_LOG_THROTTLE(s_lastWarn, 5000,
            LL_RENDER_LOGW("No renderer for mode %u", static_cast<uint8_t>(m_activeMode)));
        for (uint16_t i = 0; i < m_ledCount; ++i) {
            m_leds[i] = hal::RGB::Black();
        }
        return;
    }

    renderer->render(ctx, frame);
}

void RenderScheduler::idle() {
    m_platform.yieldFor(IDLE_YIELD_MS);
    m_platform.feedWatchdog();
}

void RenderScheduler::reportPerf(uint32_t nowMs) {
    uint32_t window = utils::elapsedMs(nowMs, m_perfWindowStartMs);
    if (window < PERF_REPORT_INTERVAL_MS) {
        return;
    }

    uint32_t fps = (m_perfWindowFrames * 1000) / window;
    LL_RENDER_LOGI("[PERF] fps=%lu frames=%lu budgetYields=%lu busyYields=%lu renderUs=%lu",
                   static_cast<unsigned long>(fps),
                   static_cast<unsigned long>(m_stats.framesRendered),
                   static_cast<unsigned long>(m_stats.budgetYields),
                   static_cast<unsigned long>(m_stats.busyYields),
                   static_cast<unsigned long>(m_stats.lastRenderUs));

    m_perfWindowStartMs = nowMs;
    m_perfWindowFrames = 0;
}

} // namespace render
} // namespace ledlink
