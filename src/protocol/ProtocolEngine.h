// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ProtocolEngine.h
 * @brief Validates binary commands and applies them to device state
 *
 * Threading:
 * - Audio frames (isImmediate) are dispatched on the transport callback
 *   thread. They only touch the feature processor's latest-frame slot and
 *   the connection manager's atomic command flag.
 * - Every other opcode is dispatched on the loop thread.
 *
 * Reconfigure trust boundary:
 *   Reconfigure is honoured only when the session arrived through the
 *   hotspot interface and the hotspot is currently up. Payloads are not
 *   authenticated; anyone who can join the open setup hotspot can change
 *   the stored network.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "CommandMessage.h"
#include "StatusMessage.h"

namespace ledlink {

namespace audio { class AudioFeatureProcessor; }
namespace effects { class EffectRegistry; }
namespace network { class ConnectionManager; }
namespace persistence { class CredentialStore; }
namespace render { struct LightState; }

namespace protocol {

/**
 * @brief Where a message came from
 */
struct SessionContext {
    uint32_t sessionId = 0;
    bool viaHotspot = false;  // Peer is on the hotspot subnet
};

/**
 * @brief Outcome of one dispatch
 */
struct DispatchResult {
    bool accepted = false;
    char reply[MAX_STATUS_LENGTH] = {};

    bool hasReply() const { return reply[0] != '\0'; }
};

class ProtocolEngine {
public:
    ProtocolEngine(render::LightState& lights,
                   audio::AudioFeatureProcessor& audio,
                   network::ConnectionManager& connection,
                   persistence::CredentialStore& store,
                   const effects::EffectRegistry& effects);

    ProtocolEngine(const ProtocolEngine&) = delete;
    ProtocolEngine& operator=(const ProtocolEngine&) = delete;

    /**
     * @brief Validate and apply one message
     * @param data Message bytes (opcode first)
     * @param len Message length
     * @param session Originating session
     * @param nowMs Arrival time
     */
    DispatchResult dispatch(const uint8_t* data, size_t len,
                            const SessionContext& session, uint32_t nowMs);

    /**
     * @brief True for opcodes handled directly on the transport thread
     */
    static bool isImmediate(uint8_t opcode) {
        return opcode == static_cast<uint8_t>(Opcode::AudioFrame);
    }

    /**
     * @brief Switch mode and reset per-mode state
     * @return false if no renderer is registered for the id
     */
    bool selectMode(uint8_t modeId);

    void setBrightness(uint8_t brightness);

    uint32_t getRejectedCount() const { return m_rejected.load(std::memory_order_relaxed); }

private:
    DispatchResult reject(DecodeStatus status);
    DispatchResult rejectReason(const char* reason);
    void applyReconfigure(const CommandMessage& msg, const SessionContext& session,
                          DispatchResult& result);

    render::LightState& m_lights;
    audio::AudioFeatureProcessor& m_audio;
    network::ConnectionManager& m_connection;
    persistence::CredentialStore& m_store;
    const effects::EffectRegistry& m_effects;

    std::atomic<uint32_t> m_rejected{0};
};

} // namespace protocol
} // namespace ledlink
