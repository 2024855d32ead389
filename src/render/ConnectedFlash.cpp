// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "ConnectedFlash.h"

#include <cstring>

#include "config/render_config.h"
#include "utils/Timing.h"

#define LL_LOG_TAG "Flash"
#include "utils/Log.h"

namespace ledlink {
namespace render {

using config::RenderConfig::CONNECTED_FLASH_MS;
using config::RenderConfig::CONNECTED_FLASH_PULSES;

ConnectedFlash::ConnectedFlash()
    : m_armed(false)
    , m_running(false)
    , m_startMs(0)
    , m_snapshotCount(0) {
}

void ConnectedFlash::arm() {
    m_armed = true;
    m_running = false;
}

void ConnectedFlash::cancel() {
    if (isActive()) {
        LL_RENDER_LOGD("Connected flash cancelled");
    }
    m_armed = false;
    m_running = false;
}

bool ConnectedFlash::render(hal::RGB* leds, uint16_t count, uint32_t nowMs) {
    if (!isActive()) {
        return false;
    }

    if (count > config::HardwareConfig::MAX_LEDS) {
        count = config::HardwareConfig::MAX_LEDS;
    }

    if (!m_running) {
        m_running = true;
        m_armed = false;
        m_startMs = nowMs;
        m_snapshotCount = count;
        memcpy(m_snapshot, leds, sizeof(hal::RGB) * count);
        LL_RENDER_LOGI("Connected flash started");
    }

    uint32_t elapsed = utils::elapsedMs(nowMs, m_startMs);
    if (elapsed >= CONNECTED_FLASH_MS) {
        m_running = false;
        uint16_t restore = (m_snapshotCount < count) ? m_snapshotCount : count;
        memcpy(leds, m_snapshot, sizeof(hal::RGB) * restore);
        LL_RENDER_LOGD("Connected flash done");
        return false;
    }

    // Each pulse: lit for the first half of its slot
    uint32_t slot = CONNECTED_FLASH_MS / CONNECTED_FLASH_PULSES;
    bool lit = (elapsed % slot) < (slot / 2);
    hal::RGB color = lit ? hal::RGB::Green() : hal::RGB::Black();
    for (uint16_t i = 0; i < count; ++i) {
        leds[i] = color;
    }
    return true;
}

} // namespace render
} // namespace ledlink
