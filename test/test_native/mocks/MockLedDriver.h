// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file MockLedDriver.h
 * @brief ILedDriver that records the last frame shown
 */

#pragma once

#include <vector>

#include "hal/ILedDriver.h"

namespace ledlink {
namespace test {

class MockLedDriver : public hal::ILedDriver {
public:
    explicit MockLedDriver(uint16_t ledCount = 8)
        : m_ledCount(ledCount) {}

    bool initResult = true;
    int initCalls = 0;
    int showCalls = 0;
    uint8_t brightness = 0;
    std::vector<hal::RGB> lastFrame;

    bool init() override {
        initCalls++;
        return initResult;
    }

    uint16_t getLedCount() const override { return m_ledCount; }

    void setBrightness(uint8_t value) override { brightness = value; }

    void show(const hal::RGB* pixels, uint16_t count) override {
        showCalls++;
        if (count > m_ledCount) {
            count = m_ledCount;
        }
        lastFrame.assign(pixels, pixels + count);
    }

    /// True if every pixel of the last frame equals color
    bool allPixels(const hal::RGB& color) const {
        if (lastFrame.empty()) return false;
        for (const hal::RGB& px : lastFrame) {
            if (px != color) return false;
        }
        return true;
    }

private:
    uint16_t m_ledCount;
};

} // namespace test
} // namespace ledlink
