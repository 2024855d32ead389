// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IRadio.h
 * @brief Hardware abstraction for the dual-mode WiFi radio
 *
 * The Connection Manager drives the radio only through this interface:
 * hotspot (soft-AP) on/off, station association, and name advertisement.
 * All calls are non-blocking; association progress is polled.
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace ledlink {
namespace hal {

class IRadio {
public:
    virtual ~IRadio() = default;

    /**
     * @brief Start broadcasting the setup hotspot
     * @param ssid Hotspot SSID
     * @param password Hotspot password (empty for an open network)
     * @return true if the soft-AP came up
     */
    virtual bool startHotspot(const char* ssid, const char* password) = 0;

    /**
     * @brief Stop the hotspot (station side is unaffected)
     */
    virtual void stopHotspot() = 0;

    /**
     * @brief Begin joining a network as a client (non-blocking)
     * @return true if the attempt was started
     */
    virtual bool beginAssociation(const char* ssid, const char* password) = 0;

    /**
     * @brief Abandon an in-flight or established association
     */
    virtual void abortAssociation() = 0;

    /**
     * @brief True once associated with an address assigned
     */
    virtual bool isAssociated() const = 0;

    /**
     * @brief Dotted address assigned on the client side
     * @param out Destination buffer
     * @param len Size of out
     * @return true if an address is available
     */
    virtual bool localAddress(char* out, size_t len) const = 0;

    /**
     * @brief Advertise host name (mDNS) on the client network
     * @return true if advertisement started
     */
    virtual bool startNameAdvertisement(const char* hostname) = 0;

    virtual void stopNameAdvertisement() = 0;
};

} // namespace hal
} // namespace ledlink
