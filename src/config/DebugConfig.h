// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file DebugConfig.h
 * @brief Runtime debug verbosity for LedLink
 *
 * Global verbosity level with per-domain overrides. Adjusted at runtime
 * from the serial console.
 *
 * Levels:
 *   0 = OFF      - No debug output
 *   1 = ERROR    - Actual errors (storage corruption, radio failure)
 *   2 = WARN     - Errors + actionable warnings (default)
 *   3 = INFO     - Warn + significant events
 *   4 = VERBOSE  - Info + diagnostic values
 *   5 = TRACE    - Everything (per-tick)
 *
 * Serial Commands:
 *   dbg                    - Show all debug config
 *   dbg <0-5>              - Set global level
 *   dbg <domain> <0-5>     - Set a domain level (audio, render, network, protocol, system)
 */

#pragma once

#include <cstdint>

namespace ledlink {
namespace config {

/**
 * @brief Debug domains for per-domain verbosity control
 */
enum class DebugDomain : uint8_t {
    AUDIO = 0,
    RENDER = 1,
    NETWORK = 2,
    PROTOCOL = 3,
    SYSTEM = 4,
    _COUNT = 5
};

/**
 * @brief Debug levels
 *
 * VERBOSE is used instead of DEBUG to avoid colliding with a DEBUG macro.
 */
enum class DebugLevel : uint8_t {
    OFF = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    VERBOSE = 4,
    TRACE = 5
};

struct DebugConfig {
    /// Global verbosity level (affects all domains unless overridden)
    uint8_t globalLevel = static_cast<uint8_t>(DebugLevel::WARN);

    /// Domain-specific overrides (-1 = use global level)
    int8_t domainLevels[static_cast<uint8_t>(DebugDomain::_COUNT)] = {-1, -1, -1, -1, -1};

    uint8_t effectiveLevel(DebugDomain domain) const {
        uint8_t index = static_cast<uint8_t>(domain);
        if (index >= static_cast<uint8_t>(DebugDomain::_COUNT)) {
            return globalLevel;
        }
        int8_t domainLevel = domainLevels[index];
        return (domainLevel >= 0) ? static_cast<uint8_t>(domainLevel) : globalLevel;
    }

    void setDomainLevel(DebugDomain domain, int8_t level) {
        uint8_t index = static_cast<uint8_t>(domain);
        if (index < static_cast<uint8_t>(DebugDomain::_COUNT)) {
            domainLevels[index] = level;
        }
    }

    int8_t getDomainLevel(DebugDomain domain) const {
        uint8_t index = static_cast<uint8_t>(domain);
        return (index < static_cast<uint8_t>(DebugDomain::_COUNT)) ? domainLevels[index] : -1;
    }

    bool shouldLog(DebugDomain domain, DebugLevel level) const {
        return effectiveLevel(domain) >= static_cast<uint8_t>(level);
    }

    static const char* domainName(DebugDomain domain);
    static const char* levelName(uint8_t level);

    /**
     * @brief Parse a domain name as typed on the console
     * @param name Lowercase domain name ("audio", "render", ...)
     * @param out Parsed domain
     * @return true if the name is known
     */
    static bool parseDomain(const char* name, DebugDomain& out);
};

/**
 * @brief Get the global debug configuration singleton
 */
DebugConfig& getDebugConfig();

/**
 * @brief Reset debug configuration to defaults
 */
void resetDebugConfig();

/**
 * @brief Print current debug configuration to the log output
 */
void printDebugConfig();

} // namespace config
} // namespace ledlink
