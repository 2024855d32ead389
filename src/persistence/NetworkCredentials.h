// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file NetworkCredentials.h
 * @brief In-RAM WiFi credential pair
 */

#pragma once

#include <cstddef>
#include <cstring>

namespace ledlink {
namespace persistence {

/// Maximum SSID length (802.11 limit)
static constexpr size_t MAX_SSID_LENGTH = 32;

/// Maximum WPA2 passphrase length
static constexpr size_t MAX_PASSWORD_LENGTH = 63;

/**
 * @brief SSID/password pair, always NUL-terminated
 *
 * An empty SSID means "no credentials".
 */
struct NetworkCredentials {
    char ssid[MAX_SSID_LENGTH + 1] = {};
    char password[MAX_PASSWORD_LENGTH + 1] = {};

    bool empty() const { return ssid[0] == '\0'; }

    /**
     * @brief Set both fields from raw (not necessarily terminated) bytes
     * @return false if either field is too long; the pair is left unchanged
     */
    bool assign(const char* ssidBytes, size_t ssidLen,
                const char* passwordBytes, size_t passwordLen) {
        if (ssidLen > MAX_SSID_LENGTH || passwordLen > MAX_PASSWORD_LENGTH) {
            return false;
        }
        memset(ssid, 0, sizeof(ssid));
        memset(password, 0, sizeof(password));
        if (ssidLen > 0) {
            memcpy(ssid, ssidBytes, ssidLen);
        }
        if (passwordLen > 0) {
            memcpy(password, passwordBytes, passwordLen);
        }
        return true;
    }

    void clear() {
        memset(ssid, 0, sizeof(ssid));
        memset(password, 0, sizeof(password));
    }
};

} // namespace persistence
} // namespace ledlink
