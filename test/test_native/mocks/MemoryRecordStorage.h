// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file MemoryRecordStorage.h
 * @brief RAM-backed IRecordStorage with fault injection
 */

#pragma once

#include <cstdint>
#include <vector>

#include "hal/IRecordStorage.h"

namespace ledlink {
namespace test {

class MemoryRecordStorage : public hal::IRecordStorage {
public:
    std::vector<uint8_t> record;
    bool hasRecord = false;
    bool failWrites = false;
    int writes = 0;

    bool read(uint8_t* out, size_t len) override {
        if (!hasRecord || record.size() != len) {
            return false;
        }
        for (size_t i = 0; i < len; ++i) {
            out[i] = record[i];
        }
        return true;
    }

    bool write(const uint8_t* data, size_t len) override {
        writes++;
        if (failWrites) {
            return false;
        }
        record.assign(data, data + len);
        hasRecord = true;
        return true;
    }

    void flipBit(size_t offset, uint8_t mask) {
        if (offset < record.size()) {
            record[offset] ^= mask;
        }
    }
};

} // namespace test
} // namespace ledlink
