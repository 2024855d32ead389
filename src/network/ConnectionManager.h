// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ConnectionManager.h
 * @brief Hotspot / client association state machine
 *
 * State Machine:
 *   HOTSPOT -> CONNECTING -> CONNECTED -> AWAITING_COMMAND -> CONFIG_BROADCAST
 *                  |                            |                  |
 *                  +--(timeout)--> HOTSPOT      +---(link lost)----+--> CONNECTING
 *
 *   Any state --(reconfigure)--> CONNECTING (first-time association)
 *
 * Timing:
 * - Association window: CONNECT_TIMEOUT_MS, never retried with the same attempt
 * - Hotspot grace after association: HOTSPOT_GRACE_MS, then name advertisement
 *
 * Threading:
 * - update(), begin(), reconfigure() run on the loop thread
 * - notifyCommandReceived() may be called from the transport callback thread
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <cstddef>

#include "ConnectionState.h"
#include "IStatusSink.h"
#include "hal/IRadio.h"
#include "persistence/CredentialStore.h"
#include "persistence/NetworkCredentials.h"

namespace ledlink {
namespace network {

/**
 * @brief Edges reported by one update() call
 */
struct ConnectionEvents {
    bool associated = false;    // Connecting -> Connected happened
    bool reconfigured = false;  // New credentials were applied since the last update
};

class ConnectionManager {
public:
    ConnectionManager(hal::IRadio& radio,
                      persistence::CredentialStore& store,
                      IStatusSink& sink);

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Pick the initial state from stored credentials
     *
     * Stored credentials -> CONNECTING (auto-reconnect, hotspot off).
     * Nothing stored -> HOTSPOT.
     */
    void begin();

    /**
     * @brief Advance the state machine (call once per loop tick)
     */
    ConnectionEvents update(uint32_t nowMs);

    /**
     * @brief Apply new credentials and restart association
     *
     * Cancels a pending hotspot grace timer and stops name advertisement.
     * The hotspot is left as it is so the app can read the result.
     *
     * @return false if the credentials are too long (state unchanged)
     */
    bool reconfigure(const char* ssid, const char* password);

    /**
     * @brief Record that a light-control command arrived (thread-safe)
     */
    void notifyCommandReceived() {
        m_commandPending.store(true, std::memory_order_release);
    }

    /**
     * @brief Greeting line for a newly opened session
     * @return false while connecting (nothing to report)
     */
    bool describeStatus(char* out, size_t len) const;

    ConnectionState getState() const { return m_state; }
    bool isHotspotActive() const { return m_hotspotActive; }
    bool isAdvertising() const { return m_advertising; }
    bool isGracePending() const { return m_graceActive; }
    bool isAutoConnect() const { return m_autoConnect; }

    /// True while the scheduler should render the connection indicator
    bool showsIndicator() const;

    const char* getSsid() const { return m_credentials.ssid; }
    const char* getAddress() const { return m_address; }

private:
    void setState(ConnectionState newState);
    void handleConnecting(uint32_t nowMs, ConnectionEvents& events);
    void handleAssociated(uint32_t nowMs);
    void onAssociated(uint32_t nowMs);
    void failAssociation(const char* reason);
    void enterHotspot();
    void startAdvertising();
    void stopAdvertising();
    void broadcast(const char* text);

    hal::IRadio& m_radio;
    persistence::CredentialStore& m_store;
    IStatusSink& m_sink;

    ConnectionState m_state = ConnectionState::HotspotMode;
    persistence::NetworkCredentials m_credentials;
    char m_address[16] = {};

    bool m_autoConnect = false;
    bool m_connectStarted = false;
    uint32_t m_connectStartMs = 0;

    bool m_hotspotActive = false;
    bool m_graceActive = false;
    uint32_t m_graceStartMs = 0;
    bool m_advertising = false;
    bool m_reconfigured = false;

    std::atomic<bool> m_commandPending{false};
};

} // namespace network
} // namespace ledlink
