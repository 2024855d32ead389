// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EspRadio.cpp
 * @brief Soft-AP, station association and mDNS on the ESP32
 */

#include "EspRadio.h"

#include <Arduino.h>
#include <ESPmDNS.h>
#include <WiFi.h>
#include <esp_wifi.h>

#include <cstring>

#include "config/network_config.h"

#define LL_LOG_TAG "Radio"
#include "utils/Log.h"

namespace ledlink {
namespace hal {

EspRadio::EspRadio()
    : m_apWanted(false)
    , m_staWanted(false)
    , m_mdnsRunning(false) {
}

void EspRadio::applyMode() {
    wifi_mode_t mode = WIFI_OFF;
    if (m_apWanted && m_staWanted) {
        mode = WIFI_AP_STA;
    } else if (m_apWanted) {
        mode = WIFI_AP;
    } else if (m_staWanted) {
        mode = WIFI_STA;
    }

    if (WiFi.getMode() != mode) {
        WiFi.mode(mode);
    }
}

bool EspRadio::startHotspot(const char* ssid, const char* password) {
    m_apWanted = true;
    applyMode();

    const char* pw = (password != nullptr && password[0] != '\0') ? password : nullptr;
    if (!WiFi.softAP(ssid, pw)) {
        LL_LOGE("Failed to start Soft-AP '%s'", ssid);
        m_apWanted = false;
        applyMode();
        return false;
    }

    LL_LOGI("AP started - SSID: %s IP: %s", ssid, WiFi.softAPIP().toString().c_str());
    return true;
}

void EspRadio::stopHotspot() {
    if (!m_apWanted) {
        return;
    }
    WiFi.softAPdisconnect(false);
    m_apWanted = false;
    applyMode();
    LL_LOGI("AP stopped");
}

bool EspRadio::beginAssociation(const char* ssid, const char* password) {
    m_staWanted = true;
    applyMode();

    WiFi.setHostname(config::NetworkConfig::MDNS_HOSTNAME);
    WiFi.setAutoReconnect(false);  // Connection manager owns retries

    wl_status_t status = WiFi.begin(ssid, password);
    if (status == WL_CONNECT_FAILED) {
        LL_LOGE("WiFi.begin('%s') failed", ssid);
        return false;
    }

    // Modem sleep causes ASSOC_LEAVE disconnects under WebSocket load
    WiFi.setSleep(false);
    esp_wifi_set_ps(WIFI_PS_NONE);

    LL_LOGD("Associating with '%s'", ssid);
    return true;
}

void EspRadio::abortAssociation() {
    if (!m_staWanted) {
        return;
    }
    WiFi.disconnect(false);
    m_staWanted = false;
    applyMode();
}

bool EspRadio::isAssociated() const {
    return m_staWanted &&
           WiFi.status() == WL_CONNECTED &&
           WiFi.localIP() != IPAddress(0, 0, 0, 0);
}

bool EspRadio::localAddress(char* out, size_t len) const {
    if (out == nullptr || len == 0 || !isAssociated()) {
        return false;
    }
    String ip = WiFi.localIP().toString();
    if (ip.length() >= len) {
        return false;
    }
    memcpy(out, ip.c_str(), ip.length() + 1);
    return true;
}

bool EspRadio::startNameAdvertisement(const char* hostname) {
    if (m_mdnsRunning) {
        return true;
    }
    if (!MDNS.begin(hostname)) {
        LL_LOGE("mDNS responder failed to start");
        return false;
    }
    MDNS.addService("ws", "tcp", config::NetworkConfig::WEB_SERVER_PORT);
    m_mdnsRunning = true;
    LL_LOGI("mDNS: %s.local (_ws._tcp:%u)", hostname, config::NetworkConfig::WEB_SERVER_PORT);
    return true;
}

void EspRadio::stopNameAdvertisement() {
    if (!m_mdnsRunning) {
        return;
    }
    MDNS.end();
    m_mdnsRunning = false;
}

bool EspRadio::isHotspotPeer(uint32_t remote) const {
    if (!m_apWanted) {
        return false;
    }
    IPAddress apIp = WiFi.softAPIP();
    IPAddress mask = WiFi.softAPSubnetMask();
    return (static_cast<uint32_t>(apIp) & static_cast<uint32_t>(mask)) ==
           (remote & static_cast<uint32_t>(mask));
}

} // namespace hal
} // namespace ledlink
