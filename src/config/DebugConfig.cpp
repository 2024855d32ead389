// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DebugConfig.cpp
 * @brief Runtime debug verbosity implementation
 */

#include "DebugConfig.h"

#include <cstring>

#ifdef ARDUINO
#include <Arduino.h>
#define DBG_PRINTF(...) Serial.printf(__VA_ARGS__)
#else
#include <cstdio>
#define DBG_PRINTF(...) printf(__VA_ARGS__)
#endif

namespace ledlink {
namespace config {

namespace {
    DebugConfig s_debugConfig;
}

DebugConfig& getDebugConfig() {
    return s_debugConfig;
}

void resetDebugConfig() {
    s_debugConfig = DebugConfig();
}

const char* DebugConfig::domainName(DebugDomain domain) {
    switch (domain) {
        case DebugDomain::AUDIO:    return "audio";
        case DebugDomain::RENDER:   return "render";
        case DebugDomain::NETWORK:  return "network";
        case DebugDomain::PROTOCOL: return "protocol";
        case DebugDomain::SYSTEM:   return "system";
        default:                    return "unknown";
    }
}

const char* DebugConfig::levelName(uint8_t level) {
    switch (level) {
        case 0:  return "OFF";
        case 1:  return "ERROR";
        case 2:  return "WARN";
        case 3:  return "INFO";
        case 4:  return "VERBOSE";
        case 5:  return "TRACE";
        default: return "INVALID";
    }
}

bool DebugConfig::parseDomain(const char* name, DebugDomain& out) {
    if (name == nullptr) {
        return false;
    }
    for (uint8_t i = 0; i < static_cast<uint8_t>(DebugDomain::_COUNT); ++i) {
        DebugDomain domain = static_cast<DebugDomain>(i);
        if (strcmp(name, domainName(domain)) == 0) {
            out = domain;
            return true;
        }
    }
    return false;
}

void printDebugConfig() {
    auto& cfg = getDebugConfig();

    DBG_PRINTF("\n=== Debug Configuration ===\n");
    DBG_PRINTF("Global Level: %u (%s)\n", cfg.globalLevel, DebugConfig::levelName(cfg.globalLevel));
    DBG_PRINTF("\nDomain Levels:\n");

    for (uint8_t i = 0; i < static_cast<uint8_t>(DebugDomain::_COUNT); ++i) {
        DebugDomain domain = static_cast<DebugDomain>(i);
        uint8_t effectiveLevel = cfg.effectiveLevel(domain);
        DBG_PRINTF("  %-8s: %u (%s) [%s]\n",
                   DebugConfig::domainName(domain),
                   effectiveLevel,
                   DebugConfig::levelName(effectiveLevel),
                   cfg.getDomainLevel(domain) >= 0 ? "override" : "global");
    }
    DBG_PRINTF("===========================\n\n");
}

} // namespace config
} // namespace ledlink
