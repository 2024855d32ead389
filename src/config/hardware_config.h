// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#ifndef LEDLINK_HARDWARE_CONFIG_H
#define LEDLINK_HARDWARE_CONFIG_H

#include <cstdint>

namespace ledlink {
namespace config {

namespace HardwareConfig {
    // WS2812B strip on a single data pin
#ifndef LEDLINK_LED_PIN
    constexpr uint8_t LED_PIN = 5;
#else
    constexpr uint8_t LED_PIN = LEDLINK_LED_PIN;
#endif

#ifndef LEDLINK_NUM_LEDS
    constexpr uint16_t NUM_LEDS = 60;
#else
    constexpr uint16_t NUM_LEDS = LEDLINK_NUM_LEDS;
#endif

    // Upper bound for the scheduler-owned buffer
    constexpr uint16_t MAX_LEDS = 300;
    static_assert(NUM_LEDS <= MAX_LEDS, "NUM_LEDS exceeds MAX_LEDS");

    // Power limiting (USB-powered strips)
    constexpr uint8_t POWER_VOLTS = 5;
    constexpr uint32_t POWER_MILLIAMPS = 2000;

    constexpr uint8_t DEFAULT_BRIGHTNESS = 128;

    // Task watchdog deadline for the loop task
    constexpr uint32_t WATCHDOG_TIMEOUT_S = 5;
}

} // namespace config
} // namespace ledlink

#endif // LEDLINK_HARDWARE_CONFIG_H
