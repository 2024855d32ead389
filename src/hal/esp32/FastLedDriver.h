// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FastLedDriver.h
 * @brief FastLED-based implementation of ILedDriver for a WS2812 strip
 *
 * Hardware configuration (config/hardware_config.h):
 * - One strip on LED_PIN, NUM_LEDS pixels, GRB order
 * - Power limited to POWER_VOLTS / POWER_MILLIAMPS
 *
 * The scheduler's buffer is copied into a static CRGB buffer on show(), so
 * FastLED never reads scheduler memory.
 */

#ifndef LEDLINK_HAL_FASTLED_DRIVER_H
#define LEDLINK_HAL_FASTLED_DRIVER_H

#include "hal/ILedDriver.h"

namespace ledlink {
namespace hal {

class FastLedDriver : public ILedDriver {
public:
    FastLedDriver();

    FastLedDriver(const FastLedDriver&) = delete;
    FastLedDriver& operator=(const FastLedDriver&) = delete;

    bool init() override;
    uint16_t getLedCount() const override;
    void setBrightness(uint8_t brightness) override;
    void show(const RGB* pixels, uint16_t count) override;

    uint32_t getLastShowTimeUs() const { return m_lastShowTimeUs; }

private:
    bool m_initialized;
    uint8_t m_brightness;
    uint32_t m_lastShowTimeUs;
};

} // namespace hal
} // namespace ledlink

#endif // LEDLINK_HAL_FASTLED_DRIVER_H
