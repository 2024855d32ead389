// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file FastLedDriver.cpp
 * @brief WS2812 output through FastLED
 */

#include "FastLedDriver.h"

#include <Arduino.h>
#include <FastLED.h>

#include "config/hardware_config.h"

#define LL_LOG_TAG "LedDriver"
#include "utils/Log.h"

namespace ledlink {
namespace hal {

using config::HardwareConfig::LED_PIN;
using config::HardwareConfig::NUM_LEDS;

namespace {
    CRGB s_strip[NUM_LEDS];
}

FastLedDriver::FastLedDriver()
    : m_initialized(false)
    , m_brightness(config::HardwareConfig::DEFAULT_BRIGHTNESS)
    , m_lastShowTimeUs(0) {
}

bool FastLedDriver::init() {
    if (m_initialized) {
        return true;
    }

    FastLED.addLeds<WS2812, LED_PIN, GRB>(s_strip, NUM_LEDS);
    FastLED.setBrightness(m_brightness);
    FastLED.setCorrection(TypicalLEDStrip);
    FastLED.setMaxRefreshRate(0, true);  // Non-blocking mode
    FastLED.setMaxPowerInVoltsAndMilliamps(config::HardwareConfig::POWER_VOLTS,
                                           config::HardwareConfig::POWER_MILLIAMPS);
    FastLED.clear(true);

    m_initialized = true;
    LL_LOGI("WS2812 on GPIO%u, %u LEDs, %umA limit",
            LED_PIN, NUM_LEDS, static_cast<unsigned>(config::HardwareConfig::POWER_MILLIAMPS));
    return true;
}

uint16_t FastLedDriver::getLedCount() const {
    return NUM_LEDS;
}

void FastLedDriver::setBrightness(uint8_t brightness) {
    if (brightness == m_brightness) {
        return;
    }
    m_brightness = brightness;
    FastLED.setBrightness(m_brightness);
}

void FastLedDriver::show(const RGB* pixels, uint16_t count) {
    if (!m_initialized) {
        return;
    }

    if (count > NUM_LEDS) {
        count = NUM_LEDS;
    }
    for (uint16_t i = 0; i < count; ++i) {
        s_strip[i].setRGB(pixels[i].r, pixels[i].g, pixels[i].b);
    }
    for (uint16_t i = count; i < NUM_LEDS; ++i) {
        s_strip[i] = CRGB::Black;
    }

    uint32_t start = micros();
    FastLED.show();
    m_lastShowTimeUs = micros() - start;
}

} // namespace hal
} // namespace ledlink
