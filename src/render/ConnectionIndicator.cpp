// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "ConnectionIndicator.h"

namespace ledlink {
namespace render {

using network::ConnectionState;

hal::RGB ConnectionIndicator::colorFor(ConnectionState state, uint32_t nowMs) {
    switch (state) {
        case ConnectionState::HotspotMode: {
            // Triangle wave 0 -> 255 -> 0 over BREATHE_PERIOD_MS
            uint32_t phase = nowMs % BREATHE_PERIOD_MS;
            uint32_t half = BREATHE_PERIOD_MS / 2;
            uint32_t ramp = (phase < half) ? phase : (BREATHE_PERIOD_MS - phase);
            uint8_t level = static_cast<uint8_t>((ramp * 255) / half);
            return hal::RGB::Blue().scaled(level);
        }

        case ConnectionState::Connecting:
            return ((nowMs / BLINK_HALF_PERIOD_MS) % 2 == 0) ? hal::RGB::Amber()
                                                             : hal::RGB::Black();

        case ConnectionState::Connected:
        case ConnectionState::AwaitingFirstCommand:
            return hal::RGB::Green().scaled(CONNECTED_LEVEL);

        case ConnectionState::ConfigBroadcast:
        default:
            return hal::RGB::Black();
    }
}

void ConnectionIndicator::render(ConnectionState state, hal::RGB* leds, uint16_t count,
                                 uint32_t nowMs) const {
    hal::RGB color = colorFor(state, nowMs);
    for (uint16_t i = 0; i < count; ++i) {
        leds[i] = color;
    }
}

} // namespace render
} // namespace ledlink
