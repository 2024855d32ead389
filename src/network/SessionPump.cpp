// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "SessionPump.h"

#include <cstring>

#include "ConnectionManager.h"
#include "protocol/StatusMessage.h"

#define LL_LOG_TAG "SessionPump"
#include "utils/Log.h"

namespace ledlink {
namespace network {

using config::NetworkConfig::WS_MAX_MESSAGE_SIZE;

SessionPump::SessionPump(protocol::ProtocolEngine& engine,
                         ConnectionManager& connection,
                         IStatusSink& sink)
    : m_engine(engine)
    , m_connection(connection)
    , m_sink(sink) {
}

AcceptResult SessionPump::acceptMessage(const protocol::SessionContext& session,
                                        const uint8_t* data, size_t len, uint32_t nowMs,
                                        protocol::DispatchResult& reply) {
    if (len > WS_MAX_MESSAGE_SIZE) {
        return AcceptResult::TooLarge;
    }

    if (len > 0 && protocol::ProtocolEngine::isImmediate(data[0])) {
        reply = m_engine.dispatch(data, len, session, nowMs);
        return AcceptResult::Handled;
    }

    Entry entry;
    entry.kind = EntryKind::Message;
    entry.session = session;
    entry.length = static_cast<uint8_t>(len);
    if (len > 0) {
        memcpy(entry.data, data, len);
    }

    if (!m_queue.push(entry)) {
        return AcceptResult::Busy;
    }
    return AcceptResult::Queued;
}

bool SessionPump::acceptSessionOpen(uint32_t sessionId) {
    Entry entry;
    entry.kind = EntryKind::SessionOpen;
    entry.session.sessionId = sessionId;
    entry.length = 0;
    return m_queue.push(entry);
}

uint16_t SessionPump::drain(uint32_t nowMs) {
    uint16_t processed = 0;
    Entry entry;

    while (m_queue.pop(entry)) {
        processed++;

        if (entry.kind == EntryKind::SessionOpen) {
            char greeting[protocol::MAX_STATUS_LENGTH];
            if (m_connection.describeStatus(greeting, sizeof(greeting))) {
                m_sink.sendTo(entry.session.sessionId, greeting);
            }
            continue;
        }

        protocol::DispatchResult result =
            m_engine.dispatch(entry.data, entry.length, entry.session, nowMs);
        if (result.hasReply()) {
            m_sink.sendTo(entry.session.sessionId, result.reply);
        }
    }

    if (processed > 0) {
        LL_NET_LOGT("Drained %u queued entries", processed);
    }
    return processed;
}

} // namespace network
} // namespace ledlink
