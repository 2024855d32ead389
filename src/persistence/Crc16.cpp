// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Crc16.cpp
 * @brief Bitwise CRC-16/MODBUS (reflected 0xA001, init 0xFFFF)
 */

#include "Crc16.h"

namespace ledlink {
namespace persistence {

namespace {
    constexpr uint16_t CRC16_POLY = 0xA001;
    constexpr uint16_t CRC16_INIT = 0xFFFF;
}

uint16_t crc16(const uint8_t* data, size_t len) {
    uint16_t crc = CRC16_INIT;
    for (size_t i = 0; i < len; ++i) {
        crc ^= data[i];
        for (uint8_t bit = 0; bit < 8; ++bit) {
            if (crc & 0x0001) {
                crc = static_cast<uint16_t>((crc >> 1) ^ CRC16_POLY);
            } else {
                crc = static_cast<uint16_t>(crc >> 1);
            }
        }
    }
    return crc;
}

} // namespace persistence
} // namespace ledlink
