// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file WsTransport.h
 * @brief AsyncWebSocket endpoint carrying the binary control protocol
 *
 * ws://<addr>:80/ - binary frames only, one message per frame.
 *
 * AsyncTCP callback thread:
 *   - connect: queue a greeting for the session
 *   - data: audio frames dispatched in place, others queued in SessionPump
 *   - text, fragmented or oversized frames answered with ERR:bad_length
 *   - full queue answered with ERR:busy
 *
 * Loop thread:
 *   - service(): drain the pump, purge closed clients
 *   - IStatusSink: broadcast / per-session text
 */

#pragma once

#include <ESPAsyncWebServer.h>

#include "IStatusSink.h"

namespace ledlink {

namespace hal { class EspRadio; }

namespace network {

class SessionPump;

class WsTransport : public IStatusSink {
public:
    explicit WsTransport(hal::EspRadio& radio);

    WsTransport(const WsTransport&) = delete;
    WsTransport& operator=(const WsTransport&) = delete;

    /**
     * @brief Attach the pump and start the HTTP server
     */
    void begin(SessionPump& pump);

    /**
     * @brief Loop-thread service step
     */
    void service(uint32_t nowMs);

    void broadcast(const char* text) override;
    void sendTo(uint32_t sessionId, const char* text) override;

    static void onEvent(AsyncWebSocket* server, AsyncWebSocketClient* client,
                        AwsEventType type, void* arg, uint8_t* data, size_t len);

private:
    void handleConnect(AsyncWebSocketClient* client);
    void handleDisconnect(AsyncWebSocketClient* client);
    void handleData(AsyncWebSocketClient* client, void* arg, uint8_t* data, size_t len);
    void replyError(AsyncWebSocketClient* client, const char* reason);

    static WsTransport* s_instance;

    hal::EspRadio& m_radio;
    SessionPump* m_pump;
    AsyncWebServer m_server;
    AsyncWebSocket m_ws;
    uint32_t m_lastCleanupMs;
};

} // namespace network
} // namespace ledlink
