// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file NvsRecordStorage.h
 * @brief ESP-IDF NVS backend for the credential record
 *
 * The record is one blob (namespace "ledlink", key "cred"). nvs_set_blob +
 * nvs_commit replaces the blob atomically from a reader's view.
 */

#pragma once

#include <cstdint>
#include <cstddef>

#include "hal/IRecordStorage.h"

namespace ledlink {
namespace hal {

enum class NvsResult : uint8_t {
    OK = 0,             // Operation successful
    NOT_INITIALIZED,    // init() not called or failed
    NOT_FOUND,          // Namespace or key missing
    INVALID_HANDLE,     // Failed to open namespace
    READ_ERROR,         // Failed to read data
    WRITE_ERROR,        // Failed to write data
    SIZE_MISMATCH,      // Stored size differs from expected
    COMMIT_FAILED       // Failed to commit changes
};

class NvsRecordStorage : public IRecordStorage {
public:
    static constexpr const char* NAMESPACE = "ledlink";
    static constexpr const char* KEY = "cred";

    NvsRecordStorage();

    /**
     * @brief Initialize NVS flash (erases the partition if it needs repair)
     */
    bool init();

    bool read(uint8_t* out, size_t len) override;
    bool write(const uint8_t* data, size_t len) override;

    NvsResult getLastResult() const { return m_lastResult; }

    static const char* resultToString(NvsResult result);

private:
    NvsResult loadBlob(uint8_t* out, size_t len);
    NvsResult saveBlob(const uint8_t* data, size_t len);

    bool m_initialized;
    NvsResult m_lastResult;
};

} // namespace hal
} // namespace ledlink
