// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ILedDriver.h
 * @brief Hardware Abstraction Layer interface for LED drivers
 *
 * LedLink HAL - LED Driver Interface
 *
 * The render scheduler owns the pixel buffer and hands it to the driver once
 * per tick. Drivers copy it into their own output buffers, so no driver ever
 * holds a pointer into scheduler memory between ticks.
 */

#ifndef LEDLINK_HAL_ILED_DRIVER_H
#define LEDLINK_HAL_ILED_DRIVER_H

#include <cstdint>
#include <cstddef>

namespace ledlink {
namespace hal {

/**
 * @brief RGB color structure
 *
 * Simple 24-bit RGB color representation.
 * Memory layout matches most LED drivers (3 bytes per LED).
 */
struct RGB {
    uint8_t r;
    uint8_t g;
    uint8_t b;

    constexpr RGB() : r(0), g(0), b(0) {}
    constexpr RGB(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    constexpr bool operator==(const RGB& other) const {
        return r == other.r && g == other.g && b == other.b;
    }

    constexpr bool operator!=(const RGB& other) const {
        return !(*this == other);
    }

    /**
     * @brief Scale color by 8-bit factor (0 = black, 255 = full)
     */
    RGB scaled(uint8_t scale) const {
        return RGB(
            static_cast<uint8_t>((static_cast<uint16_t>(r) * (scale + 1)) >> 8),
            static_cast<uint8_t>((static_cast<uint16_t>(g) * (scale + 1)) >> 8),
            static_cast<uint8_t>((static_cast<uint16_t>(b) * (scale + 1)) >> 8)
        );
    }

    static constexpr RGB Black()   { return RGB(0, 0, 0); }
    static constexpr RGB White()   { return RGB(255, 255, 255); }
    static constexpr RGB Red()     { return RGB(255, 0, 0); }
    static constexpr RGB Green()   { return RGB(0, 255, 0); }
    static constexpr RGB Blue()    { return RGB(0, 0, 255); }
    static constexpr RGB Amber()   { return RGB(255, 140, 0); }
};

/**
 * @brief Abstract LED driver
 *
 * Implementations:
 * - FastLedDriver (ESP32, WS2812B)
 * - MockLedDriver (native tests)
 */
class ILedDriver {
public:
    virtual ~ILedDriver() = default;

    /**
     * @brief Initialize output hardware
     * @return true if the strip is ready
     */
    virtual bool init() = 0;

    /**
     * @brief Number of physical LEDs driven
     */
    virtual uint16_t getLedCount() const = 0;

    /**
     * @brief Global brightness applied at output time (0-255)
     */
    virtual void setBrightness(uint8_t brightness) = 0;

    /**
     * @brief Copy one frame into the driver and push it to the strip
     * @param pixels Frame to output
     * @param count Number of pixels (clamped to getLedCount())
     */
    virtual void show(const RGB* pixels, uint16_t count) = 0;
};

} // namespace hal
} // namespace ledlink

#endif // LEDLINK_HAL_ILED_DRIVER_H
