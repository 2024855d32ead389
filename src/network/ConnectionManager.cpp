// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConnectionManager.cpp
 * @brief Association state machine implementation
 */

#include "ConnectionManager.h"

#include <cstring>

#include "config/features.h"
#include "config/network_config.h"
#include "protocol/StatusMessage.h"
#include "utils/Timing.h"

#define LL_LOG_TAG "ConnMgr"
#include "utils/Log.h"

namespace ledlink {
namespace network {

using config::NetworkConfig::AP_SSID;
using config::NetworkConfig::AP_PASSWORD;
using config::NetworkConfig::CONNECT_TIMEOUT_MS;
using config::NetworkConfig::HOTSPOT_GRACE_MS;
using config::NetworkConfig::MDNS_HOSTNAME;
using protocol::StatusKind;

ConnectionManager::ConnectionManager(hal::IRadio& radio,
                                     persistence::CredentialStore& store,
                                     IStatusSink& sink)
    : m_radio(radio)
    , m_store(store)
    , m_sink(sink) {
}

void ConnectionManager::begin() {
    persistence::NetworkCredentials stored;
    if (m_store.load(stored) && !stored.empty()) {
        m_credentials = stored;
        m_autoConnect = true;
        LL_NET_LOGI("Stored credentials for '%s', auto-connecting", m_credentials.ssid);
        setState(ConnectionState::Connecting);
        return;
    }

    LL_NET_LOGI("No usable credentials, starting hotspot '%s'", AP_SSID);
    enterHotspot();
    setState(ConnectionState::HotspotMode);
}

ConnectionEvents ConnectionManager::update(uint32_t nowMs) {
    ConnectionEvents events;
    events.reconfigured = m_reconfigured;
    m_reconfigured = false;

    bool commandSeen = m_commandPending.exchange(false, std::memory_order_acq_rel);

    switch (m_state) {
        case ConnectionState::HotspotMode:
            break;

        case ConnectionState::Connecting:
            handleConnecting(nowMs, events);
            break;

        case ConnectionState::Connected:
            setState(ConnectionState::AwaitingFirstCommand);
            handleAssociated(nowMs);
            break;

        case ConnectionState::AwaitingFirstCommand:
            if (commandSeen) {
                LL_NET_LOGI("First light command received");
                setState(ConnectionState::ConfigBroadcast);
            }
            handleAssociated(nowMs);
            break;

        case ConnectionState::ConfigBroadcast:
            handleAssociated(nowMs);
            break;
    }

    return events;
}

bool ConnectionManager::reconfigure(const char* ssid, const char* password) {
    persistence::NetworkCredentials next;
    if (!next.assign(ssid, strlen(ssid), password, strlen(password))) {
        LL_NET_LOGW("Reconfigure rejected: credentials too long");
        return false;
    }

    m_credentials = next;
    m_autoConnect = false;
    m_graceActive = false;
    m_address[0] = '\0';
    stopAdvertising();
    m_radio.abortAssociation();
    m_reconfigured = true;

    LL_NET_LOGI("Reconfigured for '%s'", m_credentials.ssid);
    setState(ConnectionState::Connecting);
    return true;
}

bool ConnectionManager::describeStatus(char* out, size_t len) const {
    switch (m_state) {
        case ConnectionState::HotspotMode:
            return protocol::formatStatus(out, len, StatusKind::HotspotMode) > 0;

        case ConnectionState::Connected:
        case ConnectionState::AwaitingFirstCommand:
        case ConnectionState::ConfigBroadcast:
            return protocol::formatStatus(out, len,
                m_autoConnect ? StatusKind::AutoConnected : StatusKind::IpAddress,
                m_address) > 0;

        case ConnectionState::Connecting:
        default:
            return false;
    }
}

bool ConnectionManager::showsIndicator() const {
    return m_state != ConnectionState::ConfigBroadcast;
}

// ============================================================================
// State handlers
// ============================================================================

void ConnectionManager::setState(ConnectionState newState) {
    if (newState == ConnectionState::Connecting) {
        // Entry resets the window; association starts on the next update()
        m_connectStarted = false;
        m_connectStartMs = 0;
    }

    if (newState != m_state) {
        LL_NET_LOGI("%s -> %s", connectionStateName(m_state), connectionStateName(newState));
    }
    m_state = newState;
}

void ConnectionManager::handleConnecting(uint32_t nowMs, ConnectionEvents& events) {
    if (!m_connectStarted) {
        m_connectStarted = true;
        m_connectStartMs = nowMs;

        if (!m_radio.beginAssociation(m_credentials.ssid, m_credentials.password)) {
            LL_NET_LOGE("Failed to initiate association with '%s'", m_credentials.ssid);
            failAssociation("radio");
            return;
        }
        LL_NET_LOGD("Association started (%s)", m_autoConnect ? "auto" : "first-time");
    }

    if (m_radio.isAssociated()) {
        onAssociated(nowMs);
        events.associated = true;
        return;
    }

    if (utils::hasElapsed(nowMs, m_connectStartMs, CONNECT_TIMEOUT_MS)) {
        LL_NET_LOGW("Association with '%s' timed out after %lu ms",
                    m_credentials.ssid, static_cast<unsigned long>(CONNECT_TIMEOUT_MS));
        failAssociation("timeout");
    }
}

void ConnectionManager::handleAssociated(uint32_t nowMs) {
    if (!m_radio.isAssociated()) {
        // One fresh window with the cached credentials
        LL_NET_LOGW("Link to '%s' lost, re-associating", m_credentials.ssid);
        m_graceActive = false;
        m_address[0] = '\0';
        stopAdvertising();
        m_radio.abortAssociation();
        m_autoConnect = true;
        setState(ConnectionState::Connecting);
        return;
    }

    if (m_graceActive && utils::hasElapsed(nowMs, m_graceStartMs, HOTSPOT_GRACE_MS)) {
        m_graceActive = false;
        if (m_hotspotActive) {
            m_radio.stopHotspot();
            m_hotspotActive = false;
            LL_NET_LOGI("Hotspot grace period ended, hotspot off");
        }
        startAdvertising();
    }
}

void ConnectionManager::onAssociated(uint32_t nowMs) {
    if (!m_radio.localAddress(m_address, sizeof(m_address))) {
        LL_NET_LOGW("Associated but no address reported");
        m_address[0] = '\0';
    }

    char line[protocol::MAX_STATUS_LENGTH];
    protocol::formatStatus(line, sizeof(line),
        m_autoConnect ? StatusKind::AutoConnected : StatusKind::IpAddress, m_address);
    broadcast(line);

    LL_NET_LOGI("Associated with '%s', address %s", m_credentials.ssid, m_address);
    setState(ConnectionState::Connected);

    if (m_hotspotActive) {
        m_graceActive = true;
        m_graceStartMs = nowMs;
    } else {
        startAdvertising();
    }
}

void ConnectionManager::failAssociation(const char* reason) {
    m_radio.abortAssociation();
    m_connectStarted = false;
    enterHotspot();

    char line[protocol::MAX_STATUS_LENGTH];
    protocol::formatStatus(line, sizeof(line), StatusKind::Failure, reason);
    broadcast(line);
    protocol::formatStatus(line, sizeof(line), StatusKind::HotspotMode);
    broadcast(line);

    setState(ConnectionState::HotspotMode);
}

void ConnectionManager::enterHotspot() {
    if (m_hotspotActive) {
        return;
    }
    m_hotspotActive = m_radio.startHotspot(AP_SSID, AP_PASSWORD);
    if (!m_hotspotActive) {
        LL_NET_LOGE("Hotspot '%s' failed to start", AP_SSID);
    }
}

void ConnectionManager::startAdvertising() {
    if (m_advertising) {
        return;
    }
#if FEATURE_MDNS
    m_advertising = m_radio.startNameAdvertisement(MDNS_HOSTNAME);
    if (m_advertising) {
        LL_NET_LOGI("Advertising as %s.local", MDNS_HOSTNAME);
    } else {
        LL_NET_LOGW("Name advertisement failed to start");
    }
#else
    LL_NET_LOGD("Name advertisement disabled at build time");
#endif
}

void ConnectionManager::stopAdvertising() {
    if (!m_advertising) {
        return;
    }
    m_radio.stopNameAdvertisement();
    m_advertising = false;
}

void ConnectionManager::broadcast(const char* text) {
    if (text[0] == '\0') {
        return;
    }
    LL_NET_LOGD("-> %s", text);
    m_sink.broadcast(text);
}

} // namespace network
} // namespace ledlink
