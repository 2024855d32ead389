// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "EspPlatformServices.h"

#include <Arduino.h>
#include <esp_idf_version.h>
#include <esp_task_wdt.h>

#include "config/features.h"
#include "config/hardware_config.h"
#include "network/WsTransport.h"

#define LL_LOG_TAG "Platform"
#include "utils/Log.h"

namespace ledlink {
namespace hal {

EspPlatformServices::EspPlatformServices(network::WsTransport& transport)
    : m_transport(transport)
    , m_watchdogActive(false) {
}

bool EspPlatformServices::begin() {
#if FEATURE_TASK_WATCHDOG
    const uint32_t timeoutS = config::HardwareConfig::WATCHDOG_TIMEOUT_S;

#if ESP_IDF_VERSION_MAJOR >= 5
    esp_task_wdt_config_t wdtConfig = {
        .timeout_ms = timeoutS * 1000,
        .idle_core_mask = 0,
        .trigger_panic = true
    };
    esp_err_t err = esp_task_wdt_init(&wdtConfig);
    if (err == ESP_ERR_INVALID_STATE) {
        // Already started by the Arduino core
        err = esp_task_wdt_reconfigure(&wdtConfig);
    }
#else
    esp_err_t err = esp_task_wdt_init(timeoutS, true);
#endif
    if (err != ESP_OK) {
        LL_LOGE("Task watchdog init failed: %s", esp_err_to_name(err));
        return false;
    }

    err = esp_task_wdt_add(nullptr);  // nullptr means current task
    if (err != ESP_OK) {
        LL_LOGE("Task watchdog subscribe failed: %s", esp_err_to_name(err));
        return false;
    }

    m_watchdogActive = true;
    LL_LOGI("[WDT] Watchdog initialized (%lus timeout)", static_cast<unsigned long>(timeoutS));
#endif
    return true;
}

void EspPlatformServices::serviceNetwork(uint32_t nowMs) {
    m_transport.service(nowMs);
}

void EspPlatformServices::feedWatchdog() {
    if (m_watchdogActive) {
        esp_task_wdt_reset();
    }
}

void EspPlatformServices::yieldFor(uint32_t ms) {
    delay(ms);
}

} // namespace hal
} // namespace ledlink
