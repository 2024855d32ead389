// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Log.h
 * @brief Unified logging for LedLink
 *
 * Consistent, colored logging with automatic timestamps and component tags.
 *
 * Usage:
 *   #define LL_LOG_TAG "MyComponent"
 *   #include "utils/Log.h"
 *
 *   LL_LOGI("Initialized with %d items", count);
 *   LL_LOGE("Failed: %s (code=%d)", msg, err);
 *
 * Output format:
 *   [12345][INFO][MyComponent] Initialized with 5 items
 */

#pragma once

#include <cstdio>
#include <cstdint>

// ============================================================================
// ANSI Color Constants
// ============================================================================

#define LL_ANSI_RESET      "\033[0m"

#define LL_CLR_GREEN       "\033[1;32m"   // Mode selection feedback
#define LL_CLR_YELLOW      "\033[1;33m"   // Hardware diagnostics
#define LL_CLR_CYAN        "\033[1;36m"   // Audio analysis
#define LL_CLR_RED         "\033[1;31m"   // Errors
#define LL_CLR_MAGENTA     "\033[1;35m"   // Warnings
#define LL_CLR_GRAY        "\033[0;37m"   // Debug (dim)
#define LL_CLR_BLUE        "\033[1;34m"   // Network/WebSocket

// Semantic aliases for log levels
#define LL_CLR_ERROR       LL_CLR_RED
#define LL_CLR_WARN        LL_CLR_MAGENTA
#define LL_CLR_INFO        LL_CLR_GREEN
#define LL_CLR_DEBUG       LL_CLR_GRAY
#define LL_CLR_VERBOSE     LL_CLR_GRAY
#define LL_CLR_TRACE       LL_CLR_GRAY

// ============================================================================
// Log Level Configuration
// ============================================================================
// Set via build flags:
//   -D LL_LOG_LEVEL=3   (0=None, 1=Error, 2=Warn, 3=Info, 4=Debug)

#ifndef LL_LOG_LEVEL
    #ifdef NDEBUG
        #define LL_LOG_LEVEL 2   // Release: Warn and above
    #else
        #define LL_LOG_LEVEL 3   // Debug: Info and above
    #endif
#endif

#define LL_LOG_LEVEL_NONE  0
#define LL_LOG_LEVEL_ERROR 1
#define LL_LOG_LEVEL_WARN  2
#define LL_LOG_LEVEL_INFO  3
#define LL_LOG_LEVEL_DEBUG 4

// ============================================================================
// Platform Detection
// ============================================================================

#ifdef ARDUINO
    #include <Arduino.h>
    #define LL_LOG_MILLIS()    millis()
    #define LL_LOG_PRINTF(...) Serial.printf(__VA_ARGS__)
#else
    // Native build support (unit tests)
    static inline uint32_t _ll_mock_millis() {
        static uint32_t mock_time = 0;
        return mock_time++;
    }
    #define LL_LOG_MILLIS()    _ll_mock_millis()
    #define LL_LOG_PRINTF(...) printf(__VA_ARGS__)
#endif

// ============================================================================
// Core Logging Macros
// ============================================================================

#ifndef LL_LOG_TAG
    #define LL_LOG_TAG "LL"
#endif

#define LL_LOG_FORMAT(level_str, level_color, fmt) \
    "[%lu]" level_color "[" level_str "]" LL_ANSI_RESET "[" LL_LOG_TAG "] " fmt "\n"

#if LL_LOG_LEVEL >= LL_LOG_LEVEL_ERROR
    #define LL_LOGE(fmt, ...) \
        LL_LOG_PRINTF(LL_LOG_FORMAT("ERROR", LL_CLR_ERROR, fmt), \
                      (unsigned long)LL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define LL_LOGE(fmt, ...) ((void)0)
#endif

#if LL_LOG_LEVEL >= LL_LOG_LEVEL_WARN
    #define LL_LOGW(fmt, ...) \
        LL_LOG_PRINTF(LL_LOG_FORMAT("WARN", LL_CLR_WARN, fmt), \
                      (unsigned long)LL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define LL_LOGW(fmt, ...) ((void)0)
#endif

#if LL_LOG_LEVEL >= LL_LOG_LEVEL_INFO
    #define LL_LOGI(fmt, ...) \
        LL_LOG_PRINTF(LL_LOG_FORMAT("INFO", LL_CLR_INFO, fmt), \
                      (unsigned long)LL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define LL_LOGI(fmt, ...) ((void)0)
#endif

#if LL_LOG_LEVEL >= LL_LOG_LEVEL_DEBUG
    #define LL_LOGD(fmt, ...) \
        LL_LOG_PRINTF(LL_LOG_FORMAT("DEBUG", LL_CLR_DEBUG, fmt), \
                      (unsigned long)LL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define LL_LOGD(fmt, ...) ((void)0)
#endif

// ============================================================================
// Conditional Logging (Throttled)
// ============================================================================
// For logs inside the render tick that should only appear occasionally.
//
// Usage:
//   static uint32_t lastLog = 0;
//   LL_LOG_THROTTLE(lastLog, 1000, LL_LOGI("Status: %d", val));

#define LL_LOG_THROTTLE(last_var, interval_ms, log_statement) \
    do { \
        uint32_t _now = LL_LOG_MILLIS(); \
        if (_now - (last_var) >= (interval_ms)) { \
            (last_var) = _now; \
            log_statement; \
        } \
    } while(0)

// ============================================================================
// Domain-Aware Logging Macros
// ============================================================================
// Checked against the runtime DebugConfig so verbosity can be changed per
// domain from the serial console ("dbg network 4").
//
//   E = ERROR   (1) - Actual failures
//   W = WARN    (2) - Actionable warnings
//   I = INFO    (3) - Significant events
//   D = VERBOSE (4) - Diagnostic values
//   T = TRACE   (5) - Everything (per-tick)

#include "config/DebugConfig.h"

#define LL_DOMAIN_LOG(domain, level, fmt, ...) \
    do { \
        if (ledlink::config::getDebugConfig().shouldLog( \
                ledlink::config::DebugDomain::domain, \
                ledlink::config::DebugLevel::level)) { \
            LL_LOG_PRINTF(LL_LOG_FORMAT(#level, LL_CLR_##level, fmt), \
                          (unsigned long)LL_LOG_MILLIS(), ##__VA_ARGS__); \
        } \
    } while(0)

// Audio: frame ingest, smoothing, beat detection
#define LL_AUDIO_LOGE(fmt, ...) LL_DOMAIN_LOG(AUDIO, ERROR, fmt, ##__VA_ARGS__)
#define LL_AUDIO_LOGW(fmt, ...) LL_DOMAIN_LOG(AUDIO, WARN, fmt, ##__VA_ARGS__)
#define LL_AUDIO_LOGI(fmt, ...) LL_DOMAIN_LOG(AUDIO, INFO, fmt, ##__VA_ARGS__)
#define LL_AUDIO_LOGD(fmt, ...) LL_DOMAIN_LOG(AUDIO, VERBOSE, fmt, ##__VA_ARGS__)
#define LL_AUDIO_LOGT(fmt, ...) LL_DOMAIN_LOG(AUDIO, TRACE, fmt, ##__VA_ARGS__)

// Render: scheduler ticks, renderers, LED flush
#define LL_RENDER_LOGE(fmt, ...) LL_DOMAIN_LOG(RENDER, ERROR, fmt, ##__VA_ARGS__)
#define LL_RENDER_LOGW(fmt, ...) LL_DOMAIN_LOG(RENDER, WARN, fmt, ##__VA_ARGS__)
#define LL_RENDER_LOGI(fmt, ...) LL_DOMAIN_LOG(RENDER, INFO, fmt, ##__VA_ARGS__)
#define LL_RENDER_LOGD(fmt, ...) LL_DOMAIN_LOG(RENDER, VERBOSE, fmt, ##__VA_ARGS__)
#define LL_RENDER_LOGT(fmt, ...) LL_DOMAIN_LOG(RENDER, TRACE, fmt, ##__VA_ARGS__)

// Network: WiFi association, hotspot, mDNS, WebSocket sessions
#define LL_NET_LOGE(fmt, ...) LL_DOMAIN_LOG(NETWORK, ERROR, fmt, ##__VA_ARGS__)
#define LL_NET_LOGW(fmt, ...) LL_DOMAIN_LOG(NETWORK, WARN, fmt, ##__VA_ARGS__)
#define LL_NET_LOGI(fmt, ...) LL_DOMAIN_LOG(NETWORK, INFO, fmt, ##__VA_ARGS__)
#define LL_NET_LOGD(fmt, ...) LL_DOMAIN_LOG(NETWORK, VERBOSE, fmt, ##__VA_ARGS__)
#define LL_NET_LOGT(fmt, ...) LL_DOMAIN_LOG(NETWORK, TRACE, fmt, ##__VA_ARGS__)

// Protocol: opcode validation and dispatch
#define LL_PROTO_LOGE(fmt, ...) LL_DOMAIN_LOG(PROTOCOL, ERROR, fmt, ##__VA_ARGS__)
#define LL_PROTO_LOGW(fmt, ...) LL_DOMAIN_LOG(PROTOCOL, WARN, fmt, ##__VA_ARGS__)
#define LL_PROTO_LOGI(fmt, ...) LL_DOMAIN_LOG(PROTOCOL, INFO, fmt, ##__VA_ARGS__)
#define LL_PROTO_LOGD(fmt, ...) LL_DOMAIN_LOG(PROTOCOL, VERBOSE, fmt, ##__VA_ARGS__)
#define LL_PROTO_LOGT(fmt, ...) LL_DOMAIN_LOG(PROTOCOL, TRACE, fmt, ##__VA_ARGS__)

// System: boot, persistence, watchdog, console
#define LL_SYS_LOGE(fmt, ...) LL_DOMAIN_LOG(SYSTEM, ERROR, fmt, ##__VA_ARGS__)
#define LL_SYS_LOGW(fmt, ...) LL_DOMAIN_LOG(SYSTEM, WARN, fmt, ##__VA_ARGS__)
#define LL_SYS_LOGI(fmt, ...) LL_DOMAIN_LOG(SYSTEM, INFO, fmt, ##__VA_ARGS__)
#define LL_SYS_LOGD(fmt, ...) LL_DOMAIN_LOG(SYSTEM, VERBOSE, fmt, ##__VA_ARGS__)
#define LL_SYS_LOGT(fmt, ...) LL_DOMAIN_LOG(SYSTEM, TRACE, fmt, ##__VA_ARGS__)
