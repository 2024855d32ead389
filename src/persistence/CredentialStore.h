// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file CredentialStore.h
 * @brief Corruption-checked persistence of one WiFi credential record
 *
 * Record layout (little-endian, fixed offsets, no version field):
 *
 *   offset  size  field
 *   0       2     signature (RECORD_SIGNATURE)
 *   2       33    ssid, NUL-terminated, zero padded
 *   35      64    password, NUL-terminated, zero padded
 *   99      2     CRC-16 over bytes [2, 99)
 *
 * A record failing the signature or CRC check is treated as absent. A layout
 * change requires a new signature constant.
 *
 * Known gap: a failed storage write is logged but cannot be detected by a
 * later load() beyond the CRC check, and is not retried.
 */

#pragma once

#include <cstdint>
#include <cstddef>

#include "NetworkCredentials.h"
#include "hal/IRecordStorage.h"

namespace ledlink {
namespace persistence {

class CredentialStore {
public:
    static constexpr uint16_t RECORD_SIGNATURE = 0x4C4C;

    static constexpr size_t SIGNATURE_OFFSET = 0;
    static constexpr size_t SSID_OFFSET = 2;
    static constexpr size_t SSID_FIELD_SIZE = MAX_SSID_LENGTH + 1;
    static constexpr size_t PASSWORD_OFFSET = SSID_OFFSET + SSID_FIELD_SIZE;
    static constexpr size_t PASSWORD_FIELD_SIZE = MAX_PASSWORD_LENGTH + 1;
    static constexpr size_t CRC_OFFSET = PASSWORD_OFFSET + PASSWORD_FIELD_SIZE;
    static constexpr size_t RECORD_SIZE = CRC_OFFSET + 2;

    explicit CredentialStore(hal::IRecordStorage& storage);

    CredentialStore(const CredentialStore&) = delete;
    CredentialStore& operator=(const CredentialStore&) = delete;

    /**
     * @brief Load and validate the stored record
     * @param out Receives the credentials on success
     * @return true only if signature and CRC both match
     */
    bool load(NetworkCredentials& out);

    /**
     * @brief Build a fresh record and write it in one storage call
     * @return false if ssid > 32 or password > 63 bytes (nothing written)
     */
    bool save(const char* ssid, const char* password);

    /**
     * @brief Overwrite the whole record with zeros
     */
    void clear();

private:
    hal::IRecordStorage& m_storage;
};

} // namespace persistence
} // namespace ledlink
