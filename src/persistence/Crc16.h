// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Crc16.h
 * @brief CRC-16 (poly 0xA001 reflected, init 0xFFFF) for the credential record
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace ledlink {
namespace persistence {

/**
 * @brief CRC-16/MODBUS over a byte range
 *
 * Check value: crc16("123456789") == 0x4B37
 */
uint16_t crc16(const uint8_t* data, size_t len);

} // namespace persistence
} // namespace ledlink
