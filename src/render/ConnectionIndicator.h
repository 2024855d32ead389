// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConnectionIndicator.h
 * @brief Full-strip status pattern while the device is not in steady operation
 *
 *   HOTSPOT            blue breathing (2 s period)
 *   CONNECTING         amber blink (250 ms on / 250 ms off)
 *   CONNECTED /
 *   AWAITING_COMMAND   steady dim green
 */

#pragma once

#include <cstdint>

#include "hal/ILedDriver.h"
#include "network/ConnectionState.h"

namespace ledlink {
namespace render {

class ConnectionIndicator {
public:
    static constexpr uint32_t BREATHE_PERIOD_MS = 2000;
    static constexpr uint32_t BLINK_HALF_PERIOD_MS = 250;
    static constexpr uint8_t CONNECTED_LEVEL = 64;

    void render(network::ConnectionState state, hal::RGB* leds, uint16_t count,
                uint32_t nowMs) const;

    /**
     * @brief Color for the whole strip at a given time (exposed for tests)
     */
    static hal::RGB colorFor(network::ConnectionState state, uint32_t nowMs);
};

} // namespace render
} // namespace ledlink
