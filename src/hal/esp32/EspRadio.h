// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspRadio.h
 * @brief Arduino WiFi + ESPmDNS implementation of IRadio
 *
 * The radio mode follows what is needed: AP while only the hotspot is up,
 * STA while only associating, AP+STA while both (so the app can stay on the
 * hotspot and read the association result).
 */

#pragma once

#include "hal/IRadio.h"

namespace ledlink {
namespace hal {

class EspRadio : public IRadio {
public:
    EspRadio();

    EspRadio(const EspRadio&) = delete;
    EspRadio& operator=(const EspRadio&) = delete;

    bool startHotspot(const char* ssid, const char* password) override;
    void stopHotspot() override;
    bool beginAssociation(const char* ssid, const char* password) override;
    void abortAssociation() override;
    bool isAssociated() const override;
    bool localAddress(char* out, size_t len) const override;
    bool startNameAdvertisement(const char* hostname) override;
    void stopNameAdvertisement() override;

    /**
     * @brief True if the address belongs to the hotspot subnet
     * @param remote Peer IPv4 address in network byte order (as IPAddress stores it)
     */
    bool isHotspotPeer(uint32_t remote) const;

private:
    void applyMode();

    bool m_apWanted;
    bool m_staWanted;
    bool m_mdnsRunning;
};

} // namespace hal
} // namespace ledlink
