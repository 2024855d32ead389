// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConnectionState.h
 * @brief Network association states
 */

#pragma once

#include <cstdint>

namespace ledlink {
namespace network {

enum class ConnectionState : uint8_t {
    HotspotMode = 0,          // Soft-AP up, waiting for credentials
    Connecting = 1,           // Association window open
    Connected = 2,            // Associated, address reported
    AwaitingFirstCommand = 3, // Hotspot grace running, no light command yet
    ConfigBroadcast = 4       // Steady operation
};

inline const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::HotspotMode:          return "HOTSPOT";
        case ConnectionState::Connecting:           return "CONNECTING";
        case ConnectionState::Connected:            return "CONNECTED";
        case ConnectionState::AwaitingFirstCommand: return "AWAITING_COMMAND";
        case ConnectionState::ConfigBroadcast:      return "CONFIG_BROADCAST";
        default:                                    return "UNKNOWN";
    }
}

} // namespace network
} // namespace ledlink
