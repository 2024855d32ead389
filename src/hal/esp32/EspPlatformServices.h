// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspPlatformServices.h
 * @brief Network servicing, task watchdog and yield on the ESP32
 */

#pragma once

#include "hal/IPlatformServices.h"

namespace ledlink {

namespace network { class WsTransport; }

namespace hal {

class EspPlatformServices : public IPlatformServices {
public:
    explicit EspPlatformServices(network::WsTransport& transport);

    /**
     * @brief Subscribe the loop task to the task watchdog
     * @return false if the watchdog could not be configured
     */
    bool begin();

    void serviceNetwork(uint32_t nowMs) override;
    void feedWatchdog() override;
    void yieldFor(uint32_t ms) override;

private:
    network::WsTransport& m_transport;
    bool m_watchdogActive;
};

} // namespace hal
} // namespace ledlink
