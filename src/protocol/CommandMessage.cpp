// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "CommandMessage.h"

#include <cstring>

#include "effects/ModeId.h"

namespace ledlink {
namespace protocol {

namespace {
    // Reconfigure header: opcode, ssidLen, passLen
    constexpr size_t RECONFIG_HEADER = 3;
}

const char* decodeStatusReason(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::OK:             return "ok";
        case DecodeStatus::EMPTY:          return "empty";
        case DecodeStatus::UNKNOWN_OPCODE: return "unknown_opcode";
        case DecodeStatus::BAD_LENGTH:     return "bad_length";
        case DecodeStatus::BAD_MODE:       return "bad_mode";
        case DecodeStatus::BAD_SSID:       return "bad_ssid";
        case DecodeStatus::BAD_PASSWORD:   return "bad_password";
        default:                           return "unknown";
    }
}

size_t expectedLength(Opcode opcode) {
    switch (opcode) {
        case Opcode::SetColor:      return 4;
        case Opcode::SetMode:       return 2;
        case Opcode::SetBrightness: return 2;
        case Opcode::AudioFrame:    return 1 + audio::NUM_BANDS;
        case Opcode::Reconfigure:
        default:                    return 0;
    }
}

static DecodeStatus decodeReconfigure(const uint8_t* data, size_t len, CommandMessage& out) {
    if (len < RECONFIG_HEADER) {
        return DecodeStatus::BAD_LENGTH;
    }

    size_t ssidLen = data[1];
    size_t passLen = data[2];

    if (ssidLen == 0 || ssidLen > persistence::MAX_SSID_LENGTH) {
        return DecodeStatus::BAD_SSID;
    }
    if (passLen > persistence::MAX_PASSWORD_LENGTH) {
        return DecodeStatus::BAD_PASSWORD;
    }
    if (len != RECONFIG_HEADER + ssidLen + passLen) {
        return DecodeStatus::BAD_LENGTH;
    }

    const uint8_t* ssid = data + RECONFIG_HEADER;
    const uint8_t* pass = ssid + ssidLen;

    // Embedded NULs would silently truncate the stored strings
    if (memchr(ssid, '\0', ssidLen) != nullptr) {
        return DecodeStatus::BAD_SSID;
    }
    if (passLen > 0 && memchr(pass, '\0', passLen) != nullptr) {
        return DecodeStatus::BAD_PASSWORD;
    }

    out.opcode = Opcode::Reconfigure;
    memset(&out.credentials, 0, sizeof(out.credentials));
    memcpy(out.credentials.ssid, ssid, ssidLen);
    if (passLen > 0) {
        memcpy(out.credentials.password, pass, passLen);
    }
    return DecodeStatus::OK;
}

DecodeStatus decodeCommand(const uint8_t* data, size_t len, CommandMessage& out) {
    if (data == nullptr || len == 0) {
        return DecodeStatus::EMPTY;
    }

    Opcode opcode = static_cast<Opcode>(data[0]);
    switch (opcode) {
        case Opcode::SetColor:
        case Opcode::SetMode:
        case Opcode::SetBrightness:
        case Opcode::AudioFrame:
            break;
        case Opcode::Reconfigure:
            return decodeReconfigure(data, len, out);
        default:
            return DecodeStatus::UNKNOWN_OPCODE;
    }

    if (len != expectedLength(opcode)) {
        return DecodeStatus::BAD_LENGTH;
    }

    switch (opcode) {
        case Opcode::SetColor:
            out.opcode = opcode;
            out.color.r = data[1];
            out.color.g = data[2];
            out.color.b = data[3];
            break;
        case Opcode::SetMode:
            if (!effects::isValidModeId(data[1])) {
                return DecodeStatus::BAD_MODE;
            }
            out.opcode = opcode;
            out.mode = data[1];
            break;
        case Opcode::SetBrightness:
            out.opcode = opcode;
            out.brightness = data[1];
            break;
        case Opcode::AudioFrame:
            out.opcode = opcode;
            memcpy(out.bands, data + 1, audio::NUM_BANDS);
            break;
        default:
            return DecodeStatus::UNKNOWN_OPCODE;
    }
    return DecodeStatus::OK;
}

} // namespace protocol
} // namespace ledlink
