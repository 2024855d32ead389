// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#ifndef LEDLINK_NETWORK_CONFIG_H
#define LEDLINK_NETWORK_CONFIG_H

#include <cstdint>
#include <cstddef>

namespace ledlink {
namespace config {

namespace NetworkConfig {
    // Hotspot used for first-time setup (open network, companion app joins it)
    constexpr const char* AP_SSID = "ESP_LED";
    constexpr const char* AP_PASSWORD = "";

    // WebSocket endpoint: ws://<addr>:80/
    constexpr uint16_t WEB_SERVER_PORT = 80;
    constexpr const char* WS_PATH = "/";
    constexpr size_t WS_MAX_CLIENTS = 4;
    constexpr size_t WS_MAX_MESSAGE_SIZE = 128;

    // mDNS host name advertised after the hotspot grace period (esp-led.local)
    constexpr const char* MDNS_HOSTNAME = "esp-led";

    // Association window; not retried automatically after it elapses
#ifndef LEDLINK_CONNECT_TIMEOUT_MS
    constexpr uint32_t CONNECT_TIMEOUT_MS = 15000;
#else
    constexpr uint32_t CONNECT_TIMEOUT_MS = LEDLINK_CONNECT_TIMEOUT_MS;
#endif

    // Hotspot stays up this long after association so the app can read the address
#ifndef LEDLINK_HOTSPOT_GRACE_MS
    constexpr uint32_t HOTSPOT_GRACE_MS = 20000;
#else
    constexpr uint32_t HOTSPOT_GRACE_MS = LEDLINK_HOTSPOT_GRACE_MS;
#endif
}

} // namespace config
} // namespace ledlink

#endif // LEDLINK_NETWORK_CONFIG_H
