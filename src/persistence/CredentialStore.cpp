// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file CredentialStore.cpp
 * @brief Credential record encode/validate
 */

#include "CredentialStore.h"
#include "Crc16.h"

#include <cstring>

#define LL_LOG_TAG "CredStore"
#include "utils/Log.h"

namespace ledlink {
namespace persistence {

static_assert(CredentialStore::RECORD_SIZE == 101, "Record layout changed; bump RECORD_SIGNATURE");

namespace {

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

void writeU16(uint8_t* p, uint16_t value) {
    p[0] = static_cast<uint8_t>(value & 0xFF);
    p[1] = static_cast<uint8_t>(value >> 8);
}

bool isTerminated(const uint8_t* field, size_t width) {
    return memchr(field, '\0', width) != nullptr;
}

} // namespace

CredentialStore::CredentialStore(hal::IRecordStorage& storage)
    : m_storage(storage) {
}

bool CredentialStore::load(NetworkCredentials& out) {
    uint8_t record[RECORD_SIZE];

    if (!m_storage.read(record, sizeof(record))) {
        LL_SYS_LOGI("No stored credential record");
        return false;
    }

    if (readU16(record + SIGNATURE_OFFSET) != RECORD_SIGNATURE) {
        LL_SYS_LOGW("Credential record signature mismatch, ignoring");
        return false;
    }

    uint16_t expected = crc16(record + SSID_OFFSET, CRC_OFFSET - SSID_OFFSET);
    uint16_t stored = readU16(record + CRC_OFFSET);
    if (expected != stored) {
        LL_SYS_LOGW("Credential record CRC mismatch (stored=0x%04X calc=0x%04X), ignoring",
                    stored, expected);
        return false;
    }

    if (!isTerminated(record + SSID_OFFSET, SSID_FIELD_SIZE) ||
        !isTerminated(record + PASSWORD_OFFSET, PASSWORD_FIELD_SIZE)) {
        LL_SYS_LOGW("Credential record fields not terminated, ignoring");
        return false;
    }

    const char* ssid = reinterpret_cast<const char*>(record + SSID_OFFSET);
    const char* password = reinterpret_cast<const char*>(record + PASSWORD_OFFSET);
    if (!out.assign(ssid, strlen(ssid), password, strlen(password))) {
        return false;
    }

    LL_SYS_LOGI("Loaded credentials for '%s'", out.ssid);
    return true;
}

bool CredentialStore::save(const char* ssid, const char* password) {
    size_t ssidLen = strnlen(ssid, MAX_SSID_LENGTH + 1);
    size_t passwordLen = strnlen(password, MAX_PASSWORD_LENGTH + 1);

    if (ssidLen > MAX_SSID_LENGTH || passwordLen > MAX_PASSWORD_LENGTH) {
        LL_SYS_LOGW("Refusing to save oversized credentials (ssid=%u pass=%u)",
                    static_cast<unsigned>(ssidLen), static_cast<unsigned>(passwordLen));
        return false;
    }

    uint8_t record[RECORD_SIZE];
    memset(record, 0, sizeof(record));

    writeU16(record + SIGNATURE_OFFSET, RECORD_SIGNATURE);
    memcpy(record + SSID_OFFSET, ssid, ssidLen);
    memcpy(record + PASSWORD_OFFSET, password, passwordLen);
    writeU16(record + CRC_OFFSET, crc16(record + SSID_OFFSET, CRC_OFFSET - SSID_OFFSET));

    if (!m_storage.write(record, sizeof(record))) {
        LL_SYS_LOGW("Storage write failed for credential record");
    } else {
        LL_SYS_LOGI("Saved credentials for '%s'", ssid);
    }
    return true;
}

void CredentialStore::clear() {
    uint8_t zeros[RECORD_SIZE];
    memset(zeros, 0, sizeof(zeros));

    if (!m_storage.write(zeros, sizeof(zeros))) {
        LL_SYS_LOGW("Storage write failed while clearing credentials");
        return;
    }
    LL_SYS_LOGI("Credential record cleared");
}

} // namespace persistence
} // namespace ledlink
