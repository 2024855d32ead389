// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ProtocolEngine.cpp
 * @brief Command dispatch
 */

#include "ProtocolEngine.h"

#include "audio/AudioFeatureProcessor.h"
#include "effects/EffectRegistry.h"
#include "network/ConnectionManager.h"
#include "persistence/CredentialStore.h"
#include "render/RenderContext.h"

#define LL_LOG_TAG "Protocol"
#include "utils/Log.h"

namespace ledlink {
namespace protocol {

ProtocolEngine::ProtocolEngine(render::LightState& lights,
                               audio::AudioFeatureProcessor& audio,
                               network::ConnectionManager& connection,
                               persistence::CredentialStore& store,
                               const effects::EffectRegistry& effects)
    : m_lights(lights)
    , m_audio(audio)
    , m_connection(connection)
    , m_store(store)
    , m_effects(effects) {
}

DispatchResult ProtocolEngine::dispatch(const uint8_t* data, size_t len,
                                        const SessionContext& session, uint32_t nowMs) {
    CommandMessage msg;
    DecodeStatus status = decodeCommand(data, len, msg);
    if (status != DecodeStatus::OK) {
        return reject(status);
    }

    DispatchResult result;

    switch (msg.opcode) {
        case Opcode::SetColor: {
            hal::RGB color(msg.color.r, msg.color.g, msg.color.b);
            if (m_lights.mode != effects::ModeId::Static) {
                if (!selectMode(static_cast<uint8_t>(effects::ModeId::Static))) {
                    return rejectReason("bad_mode");
                }
            }
            m_lights.staticColor = color;
            LL_PROTO_LOGD("Color %u,%u,%u", color.r, color.g, color.b);
            result.accepted = true;
            break;
        }

        case Opcode::SetMode:
            if (!selectMode(msg.mode)) {
                return reject(DecodeStatus::BAD_MODE);
            }
            result.accepted = true;
            break;

        case Opcode::SetBrightness:
            setBrightness(msg.brightness);
            result.accepted = true;
            break;

        case Opcode::AudioFrame:
            if (!m_audio.submitFrame(msg.bands, nowMs)) {
                // Render in progress: silent drop
                return result;
            }
            result.accepted = true;
            break;

        case Opcode::Reconfigure:
            applyReconfigure(msg, session, result);
            return result;
    }

    m_connection.notifyCommandReceived();
    return result;
}

bool ProtocolEngine::selectMode(uint8_t modeId) {
    if (!m_effects.isRegistered(modeId)) {
        LL_PROTO_LOGW("Mode %u has no renderer", modeId);
        return false;
    }

    effects::ModeId mode = static_cast<effects::ModeId>(modeId);
    m_lights.mode = mode;
    m_lights.modeResetPending = true;
    m_audio.reset();

    LL_PROTO_LOGI("Mode -> %u (%s)", modeId, effects::modeName(mode));
    return true;
}

void ProtocolEngine::setBrightness(uint8_t brightness) {
    m_lights.brightness = brightness;
    LL_PROTO_LOGD("Brightness -> %u", brightness);
}

void ProtocolEngine::applyReconfigure(const CommandMessage& msg, const SessionContext& session,
                                      DispatchResult& result) {
    if (!session.viaHotspot || !m_connection.isHotspotActive()) {
        LL_PROTO_LOGW("Reconfigure refused (session %lu, viaHotspot=%d, hotspot=%d)",
                      static_cast<unsigned long>(session.sessionId),
                      session.viaHotspot ? 1 : 0,
                      m_connection.isHotspotActive() ? 1 : 0);
        result = rejectReason("not_in_hotspot");
        return;
    }

    const char* ssid = msg.credentials.ssid;
    const char* password = msg.credentials.password;

    if (!m_store.save(ssid, password)) {
        result = reject(DecodeStatus::BAD_SSID);
        return;
    }

    result.accepted = true;
    formatStatus(result.reply, sizeof(result.reply), StatusKind::Reconfigured, ssid);

    if (!m_connection.reconfigure(ssid, password)) {
        LL_PROTO_LOGE("Connection manager refused saved credentials for '%s'", ssid);
    }
}

DispatchResult ProtocolEngine::reject(DecodeStatus status) {
    return rejectReason(decodeStatusReason(status));
}

DispatchResult ProtocolEngine::rejectReason(const char* reason) {
    m_rejected.fetch_add(1, std::memory_order_relaxed);
    LL_PROTO_LOGW("Rejected: %s", reason);

    DispatchResult result;
    formatStatus(result.reply, sizeof(result.reply), StatusKind::Error, reason);
    return result;
}

} // namespace protocol
} // namespace ledlink
