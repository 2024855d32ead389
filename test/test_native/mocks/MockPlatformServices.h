// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file MockPlatformServices.h
 * @brief Counts scheduler calls into the platform
 */

#pragma once

#include <functional>

#include "hal/IPlatformServices.h"

namespace ledlink {
namespace test {

class MockPlatformServices : public hal::IPlatformServices {
public:
    int serviceCalls = 0;
    int watchdogFeeds = 0;
    int yields = 0;
    uint32_t yieldedMs = 0;

    /// Runs inside serviceNetwork(), e.g. to drain a SessionPump
    std::function<void(uint32_t)> onService;

    void serviceNetwork(uint32_t nowMs) override {
        serviceCalls++;
        if (onService) {
            onService(nowMs);
        }
    }

    void feedWatchdog() override { watchdogFeeds++; }

    void yieldFor(uint32_t ms) override {
        yields++;
        yieldedMs += ms;
    }
};

} // namespace test
} // namespace ledlink
