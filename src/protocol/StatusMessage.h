// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file StatusMessage.h
 * @brief Outbound text status lines sent to the companion app
 *
 *   IP:<addr>              first-time association succeeded
 *   AUTO_CONNECTED:<addr>  stored-credential association succeeded
 *   AP_MODE                device is (back) in hotspot mode
 *   RECONFIG:<ssid>        new credentials accepted
 *   ERR:<reason>           command rejected
 *   FAIL:<reason>          association failed
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace ledlink {
namespace protocol {

/// Longest status line (prefix + 32-byte SSID or dotted address + NUL)
static constexpr size_t MAX_STATUS_LENGTH = 64;

enum class StatusKind : uint8_t {
    IpAddress,
    AutoConnected,
    HotspotMode,
    Reconfigured,
    Error,
    Failure
};

/**
 * @brief Prefix for a status kind ("IP:", "AP_MODE", ...)
 */
const char* statusPrefix(StatusKind kind);

/**
 * @brief Format one status line
 * @param out Destination buffer
 * @param len Size of out
 * @param kind Line kind
 * @param detail Address, SSID or reason; ignored for HotspotMode
 * @return Characters written, 0 if out is too small
 */
size_t formatStatus(char* out, size_t len, StatusKind kind, const char* detail = nullptr);

} // namespace protocol
} // namespace ledlink
