// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConnectedFlash.h
 * @brief Short green pulse train confirming a successful association
 *
 * Armed when association succeeds, it starts on the first tick the
 * connection indicator is no longer showing. On start the current buffer is
 * snapshotted; on completion the snapshot is written back and the active
 * mode renders over it on that same tick.
 */

#pragma once

#include <cstdint>

#include "config/hardware_config.h"
#include "hal/ILedDriver.h"

namespace ledlink {
namespace render {

class ConnectedFlash {
public:
    ConnectedFlash();

    void arm();

    /**
     * @brief Drop an armed or running flash without restoring the snapshot
     */
    void cancel();

    bool isActive() const { return m_armed || m_running; }
    bool isRunning() const { return m_running; }

    /**
     * @brief Paint the flash frame (starts it on the first call after arm())
     * @return true if a flash frame was written; false when idle or on the
     *         completing call, which leaves the restored snapshot in the buffer
     */
    bool render(hal::RGB* leds, uint16_t count, uint32_t nowMs);

private:
    bool m_armed;
    bool m_running;
    uint32_t m_startMs;
    uint16_t m_snapshotCount;
    hal::RGB m_snapshot[config::HardwareConfig::MAX_LEDS];
};

} // namespace render
} // namespace ledlink
