// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SessionPump.h
 * @brief Hand-off of inbound WebSocket traffic to the loop thread
 *
 * Producer side (transport callback thread):
 *   acceptMessage()  - audio frames dispatched in place, everything else queued
 *   acceptSessionOpen() - queue a greeting for a new session
 *
 * Consumer side (loop thread, scheduler network step):
 *   drain() - dispatch queued messages, send replies and greetings
 *
 * A full queue is reported to the producer, which answers ERR:busy.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "IStatusSink.h"
#include "config/network_config.h"
#include "protocol/ProtocolEngine.h"
#include "utils/LockFreeQueue.h"

namespace ledlink {
namespace network {

class ConnectionManager;

/**
 * @brief Outcome of handing one message to the pump
 */
enum class AcceptResult : uint8_t {
    Handled = 0,   // Dispatched in place; reply (if any) in the out param
    Queued = 1,    // Will be dispatched on the loop thread
    Busy = 2,      // Queue full, caller replies ERR:busy
    TooLarge = 3   // Over WS_MAX_MESSAGE_SIZE, caller replies ERR:bad_length
};

class SessionPump {
public:
    static constexpr size_t QUEUE_CAPACITY = 8;

    SessionPump(protocol::ProtocolEngine& engine,
                ConnectionManager& connection,
                IStatusSink& sink);

    SessionPump(const SessionPump&) = delete;
    SessionPump& operator=(const SessionPump&) = delete;

    /**
     * @brief Take one complete binary message (producer thread)
     * @param reply Filled for Handled messages that produce a reply
     */
    AcceptResult acceptMessage(const protocol::SessionContext& session,
                               const uint8_t* data, size_t len, uint32_t nowMs,
                               protocol::DispatchResult& reply);

    /**
     * @brief Queue a greeting for a newly opened session (producer thread)
     * @return false if the queue is full
     */
    bool acceptSessionOpen(uint32_t sessionId);

    /**
     * @brief Dispatch everything queued (loop thread)
     * @return Number of entries processed
     */
    uint16_t drain(uint32_t nowMs);

    /**
     * @brief Drop queued work (loop thread)
     */
    void clear() { m_queue.clear(); }

private:
    enum class EntryKind : uint8_t {
        Message = 0,
        SessionOpen = 1
    };

    struct Entry {
        EntryKind kind;
        protocol::SessionContext session;
        uint8_t length;
        uint8_t data[config::NetworkConfig::WS_MAX_MESSAGE_SIZE];
    };

    static_assert(config::NetworkConfig::WS_MAX_MESSAGE_SIZE <= 255,
                  "Entry::length is 8-bit");

    protocol::ProtocolEngine& m_engine;
    ConnectionManager& m_connection;
    IStatusSink& m_sink;
    utils::LockFreeQueue<Entry, QUEUE_CAPACITY> m_queue;
};

} // namespace network
} // namespace ledlink
