// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IRecordStorage.h
 * @brief Non-volatile storage for one fixed-size record
 *
 * Backends must make write() all-or-nothing from the reader's point of view:
 * a read() never observes a partially written record.
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace ledlink {
namespace hal {

class IRecordStorage {
public:
    virtual ~IRecordStorage() = default;

    /**
     * @brief Read exactly len bytes of the stored record
     * @return false if nothing is stored or the stored size differs
     */
    virtual bool read(uint8_t* out, size_t len) = 0;

    /**
     * @brief Replace the stored record with len bytes
     * @return false if the backend reported a failure
     */
    virtual bool write(const uint8_t* data, size_t len) = 0;
};

} // namespace hal
} // namespace ledlink
