// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file WsTransport.cpp
 * @brief WebSocket endpoint implementation
 */

#include "WsTransport.h"

#include <Arduino.h>

#include "SessionPump.h"
#include "config/network_config.h"
#include "hal/esp32/EspRadio.h"
#include "protocol/StatusMessage.h"
#include "utils/Timing.h"

#define LL_LOG_TAG "WsTransport"
#include "utils/Log.h"

namespace ledlink {
namespace network {

using config::NetworkConfig::WEB_SERVER_PORT;
using config::NetworkConfig::WS_MAX_CLIENTS;
using config::NetworkConfig::WS_PATH;

namespace {
    constexpr uint32_t CLEANUP_INTERVAL_MS = 1000;
}

WsTransport* WsTransport::s_instance = nullptr;

WsTransport::WsTransport(hal::EspRadio& radio)
    : m_radio(radio)
    , m_pump(nullptr)
    , m_server(WEB_SERVER_PORT)
    , m_ws(WS_PATH)
    , m_lastCleanupMs(0) {
    s_instance = this;
}

void WsTransport::begin(SessionPump& pump) {
    m_pump = &pump;
    m_ws.onEvent(&WsTransport::onEvent);
    m_server.addHandler(&m_ws);
    m_server.begin();
    LL_NET_LOGI("WebSocket listening on ws://*:%u%s", WEB_SERVER_PORT, WS_PATH);
}

void WsTransport::service(uint32_t nowMs) {
    if (m_pump != nullptr) {
        m_pump->drain(nowMs);
    }

    if (utils::hasElapsed(nowMs, m_lastCleanupMs, CLEANUP_INTERVAL_MS)) {
        m_lastCleanupMs = nowMs;
        m_ws.cleanupClients(WS_MAX_CLIENTS);
    }
}

void WsTransport::broadcast(const char* text) {
    if (m_ws.count() == 0) {
        return;
    }
    m_ws.textAll(text);
}

void WsTransport::sendTo(uint32_t sessionId, const char* text) {
    AsyncWebSocketClient* client = m_ws.client(sessionId);
    if (client == nullptr || client->status() != WS_CONNECTED) {
        LL_NET_LOGD("Session %lu gone, dropping '%s'", static_cast<unsigned long>(sessionId), text);
        return;
    }
    client->text(text);
}

void WsTransport::onEvent(AsyncWebSocket* server, AsyncWebSocketClient* client,
                          AwsEventType type, void* arg, uint8_t* data, size_t len) {
    (void)server;
    if (!s_instance) return;

    switch (type) {
        case WS_EVT_CONNECT:
            s_instance->handleConnect(client);
            break;

        case WS_EVT_DISCONNECT:
            s_instance->handleDisconnect(client);
            break;

        case WS_EVT_DATA:
            s_instance->handleData(client, arg, data, len);
            break;

        case WS_EVT_ERROR:
            LL_NET_LOGW("WS: Error from client %lu", static_cast<unsigned long>(client->id()));
            break;

        case WS_EVT_PONG:
        default:
            break;
    }
}

void WsTransport::handleConnect(AsyncWebSocketClient* client) {
    if (m_ws.count() > WS_MAX_CLIENTS) {
        LL_NET_LOGW("WS: Max clients reached, rejecting %lu", static_cast<unsigned long>(client->id()));
        client->close(1008, "Connection limit");
        return;
    }

    LL_NET_LOGI("WS: Client %lu connected from %s",
                static_cast<unsigned long>(client->id()),
                client->remoteIP().toString().c_str());

    if (m_pump == nullptr || !m_pump->acceptSessionOpen(client->id())) {
        LL_NET_LOGW("WS: Greeting for %lu dropped (queue full)",
                    static_cast<unsigned long>(client->id()));
    }
}

void WsTransport::handleDisconnect(AsyncWebSocketClient* client) {
    LL_NET_LOGI("WS: Client %lu disconnected", static_cast<unsigned long>(client->id()));
}

void WsTransport::handleData(AsyncWebSocketClient* client, void* arg, uint8_t* data, size_t len) {
    AwsFrameInfo* info = static_cast<AwsFrameInfo*>(arg);

    // One complete binary message per frame
    bool whole = info->final && info->index == 0 && info->len == len;
    if (info->opcode != WS_BINARY || !whole) {
        replyError(client, "bad_length");
        return;
    }

    if (m_pump == nullptr) {
        return;
    }

    protocol::SessionContext session;
    session.sessionId = client->id();
    session.viaHotspot = m_radio.isHotspotPeer(static_cast<uint32_t>(client->remoteIP()));

    protocol::DispatchResult reply;
    switch (m_pump->acceptMessage(session, data, len, millis(), reply)) {
        case AcceptResult::Handled:
            if (reply.hasReply()) {
                client->text(reply.reply);
            }
            break;
        case AcceptResult::Queued:
            break;
        case AcceptResult::Busy:
            LL_NET_LOGW("WS: Queue full, rejecting message from %lu",
                        static_cast<unsigned long>(client->id()));
            replyError(client, "busy");
            break;
        case AcceptResult::TooLarge:
            replyError(client, "bad_length");
            break;
    }
}

void WsTransport::replyError(AsyncWebSocketClient* client, const char* reason) {
    char line[protocol::MAX_STATUS_LENGTH];
    if (protocol::formatStatus(line, sizeof(line), protocol::StatusKind::Error, reason) > 0) {
        client->text(line);
    }
}

} // namespace network
} // namespace ledlink
