// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file NvsRecordStorage.cpp
 * @brief NVS blob read/write for the credential record
 */

#include "NvsRecordStorage.h"

#include <Arduino.h>
#include <nvs.h>
#include <nvs_flash.h>

#define LL_LOG_TAG "NVS"
#include "utils/Log.h"

namespace ledlink {
namespace hal {

NvsRecordStorage::NvsRecordStorage()
    : m_initialized(false)
    , m_lastResult(NvsResult::NOT_INITIALIZED) {
}

bool NvsRecordStorage::init() {
    if (m_initialized) {
        return true;
    }

    esp_err_t err = nvs_flash_init();

    // Partition full or written by a newer IDF: erase and start over
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        LL_LOGW("NVS partition needs repair, erasing");
        err = nvs_flash_erase();
        if (err != ESP_OK) {
            LL_LOGE("Failed to erase NVS: %s", esp_err_to_name(err));
            return false;
        }
        err = nvs_flash_init();
    }

    if (err != ESP_OK) {
        LL_LOGE("Failed to init NVS: %s", esp_err_to_name(err));
        return false;
    }

    m_initialized = true;
    m_lastResult = NvsResult::OK;
    LL_LOGI("NVS flash initialized");
    return true;
}

bool NvsRecordStorage::read(uint8_t* out, size_t len) {
    m_lastResult = loadBlob(out, len);
    return m_lastResult == NvsResult::OK;
}

bool NvsRecordStorage::write(const uint8_t* data, size_t len) {
    m_lastResult = saveBlob(data, len);
    if (m_lastResult != NvsResult::OK) {
        LL_LOGW("Record write failed: %s", resultToString(m_lastResult));
        return false;
    }
    return true;
}

NvsResult NvsRecordStorage::loadBlob(uint8_t* out, size_t len) {
    if (!m_initialized) {
        return NvsResult::NOT_INITIALIZED;
    }

    nvs_handle_t handle;
    esp_err_t err = nvs_open(NAMESPACE, NVS_READONLY, &handle);
    if (err == ESP_ERR_NVS_NOT_FOUND) {
        return NvsResult::NOT_FOUND;
    }
    if (err != ESP_OK) {
        LL_LOGE("Failed to open namespace '%s': %s", NAMESPACE, esp_err_to_name(err));
        return NvsResult::INVALID_HANDLE;
    }

    size_t actualSize = len;
    err = nvs_get_blob(handle, KEY, out, &actualSize);
    nvs_close(handle);

    if (err == ESP_ERR_NVS_NOT_FOUND) {
        return NvsResult::NOT_FOUND;
    }
    if (err == ESP_ERR_NVS_INVALID_LENGTH) {
        LL_LOGW("Size mismatch for '%s/%s': stored blob larger than %u",
                NAMESPACE, KEY, static_cast<unsigned>(len));
        return NvsResult::SIZE_MISMATCH;
    }
    if (err != ESP_OK) {
        LL_LOGE("Failed to read '%s/%s': %s", NAMESPACE, KEY, esp_err_to_name(err));
        return NvsResult::READ_ERROR;
    }

    if (actualSize != len) {
        LL_LOGW("Size mismatch for '%s/%s': expected %u, got %u",
                NAMESPACE, KEY, static_cast<unsigned>(len), static_cast<unsigned>(actualSize));
        return NvsResult::SIZE_MISMATCH;
    }

    return NvsResult::OK;
}

NvsResult NvsRecordStorage::saveBlob(const uint8_t* data, size_t len) {
    if (!m_initialized) {
        return NvsResult::NOT_INITIALIZED;
    }

    nvs_handle_t handle;
    esp_err_t err = nvs_open(NAMESPACE, NVS_READWRITE, &handle);
    if (err != ESP_OK) {
        LL_LOGE("Failed to open namespace '%s': %s", NAMESPACE, esp_err_to_name(err));
        return NvsResult::INVALID_HANDLE;
    }

    err = nvs_set_blob(handle, KEY, data, len);
    if (err != ESP_OK) {
        LL_LOGE("Failed to write '%s/%s': %s", NAMESPACE, KEY, esp_err_to_name(err));
        nvs_close(handle);
        return NvsResult::WRITE_ERROR;
    }

    err = nvs_commit(handle);
    nvs_close(handle);

    if (err != ESP_OK) {
        LL_LOGE("Failed to commit '%s/%s': %s", NAMESPACE, KEY, esp_err_to_name(err));
        return NvsResult::COMMIT_FAILED;
    }

    return NvsResult::OK;
}

const char* NvsRecordStorage::resultToString(NvsResult result) {
    switch (result) {
        case NvsResult::OK:              return "OK";
        case NvsResult::NOT_INITIALIZED: return "NOT_INITIALIZED";
        case NvsResult::NOT_FOUND:       return "NOT_FOUND";
        case NvsResult::INVALID_HANDLE:  return "INVALID_HANDLE";
        case NvsResult::READ_ERROR:      return "READ_ERROR";
        case NvsResult::WRITE_ERROR:     return "WRITE_ERROR";
        case NvsResult::SIZE_MISMATCH:   return "SIZE_MISMATCH";
        case NvsResult::COMMIT_FAILED:   return "COMMIT_FAILED";
        default:                         return "UNKNOWN";
    }
}

} // namespace hal
} // namespace ledlink
