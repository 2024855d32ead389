// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IPlatformServices.h
 * @brief External subsystems the render scheduler services every tick
 */

#pragma once

#include <cstdint>

namespace ledlink {
namespace hal {

class IPlatformServices {
public:
    virtual ~IPlatformServices() = default;

    /**
     * @brief Drain transport input and run queued protocol work (non-blocking)
     * @param nowMs Loop clock, used as arrival time for queued messages
     */
    virtual void serviceNetwork(uint32_t nowMs) = 0;

    /**
     * @brief Reset the task watchdog
     */
    virtual void feedWatchdog() = 0;

    /**
     * @brief Short fixed delay so the network stack and idle task can run
     */
    virtual void yieldFor(uint32_t ms) = 0;
};

} // namespace hal
} // namespace ledlink
