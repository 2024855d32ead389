// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file CommandMessage.h
 * @brief Binary command decoding
 *
 * Wire format: one opcode byte followed by a fixed-arity payload.
 *
 *   0x01  R, G, B                          set static color
 *   0x02  mode id                          switch mode
 *   0x03  brightness                       set brightness
 *   0x04  16 band energies                 audio frame
 *   0xFF  ssidLen, passLen, ssid, pass     reconfigure
 *
 * Decoding never has side effects; a message that fails any check is
 * rejected whole.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "audio/AudioFrame.h"
#include "persistence/NetworkCredentials.h"

namespace ledlink {
namespace protocol {

enum class Opcode : uint8_t {
    SetColor = 0x01,
    SetMode = 0x02,
    SetBrightness = 0x03,
    AudioFrame = 0x04,
    Reconfigure = 0xFF
};

enum class DecodeStatus : uint8_t {
    OK = 0,
    EMPTY,
    UNKNOWN_OPCODE,
    BAD_LENGTH,
    BAD_MODE,
    BAD_SSID,
    BAD_PASSWORD
};

/**
 * @brief Reason text used in ERR:<reason> replies
 */
const char* decodeStatusReason(DecodeStatus status);

/**
 * @brief Decoded command (tagged by opcode)
 *
 * Only the member matching opcode is meaningful. Reconfigure strings are
 * NUL-terminated copies.
 */
struct CommandMessage {
    Opcode opcode;

    struct Color { uint8_t r, g, b; };
    struct Credentials {
        char ssid[persistence::MAX_SSID_LENGTH + 1];
        char password[persistence::MAX_PASSWORD_LENGTH + 1];
    };

    union {
        Color color;
        uint8_t mode;
        uint8_t brightness;
        uint8_t bands[audio::NUM_BANDS];
        Credentials credentials;
    };
};

/**
 * @brief Total message length for a fixed-size opcode (0 for Reconfigure)
 */
size_t expectedLength(Opcode opcode);

/**
 * @brief Validate and decode one message
 * @param data Message bytes (opcode first)
 * @param len Message length
 * @param out Decoded command; untouched unless OK
 */
DecodeStatus decodeCommand(const uint8_t* data, size_t len, CommandMessage& out);

} // namespace protocol
} // namespace ledlink
