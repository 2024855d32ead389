// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SerialConsole.cpp
 * @brief Line-oriented serial command handler
 */

#include "SerialConsole.h"

#include <cctype>
#include <cstdlib>
#include <cstring>

#include "audio/AudioFeatureProcessor.h"
#include "config/DebugConfig.h"
#include "effects/ModeId.h"
#include "network/ConnectionManager.h"
#include "persistence/CredentialStore.h"
#include "protocol/ProtocolEngine.h"
#include "render/RenderContext.h"
#include "render/RenderScheduler.h"

#define LL_LOG_TAG "Console"
#include "utils/Log.h"

#ifdef ARDUINO
#include <Arduino.h>
#define CONSOLE_PRINTF(...) Serial.printf(__VA_ARGS__)
#else
#include <cstdio>
#define CONSOLE_PRINTF(...) printf(__VA_ARGS__)
#endif

namespace ledlink {
namespace console {

namespace {

/// Split off the next space-delimited token, advancing cursor
char* nextToken(char*& cursor) {
    while (*cursor == ' ') {
        cursor++;
    }
    if (*cursor == '\0') {
        return nullptr;
    }
    char* token = cursor;
    while (*cursor != '\0' && *cursor != ' ') {
        cursor++;
    }
    if (*cursor == ' ') {
        *cursor++ = '\0';
    }
    return token;
}

/// Parse a decimal integer in [0, maxValue]
bool parseNumber(const char* text, unsigned long maxValue, unsigned long& out) {
    if (text == nullptr || *text == '\0' || !isdigit(static_cast<unsigned char>(*text))) {
        return false;
    }
    char* end = nullptr;
    unsigned long value = strtoul(text, &end, 10);
    if (end == nullptr || *end != '\0' || value > maxValue) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

SerialConsole::SerialConsole(render::LightState& lights,
                             protocol::ProtocolEngine& engine,
                             network::ConnectionManager& connection,
                             persistence::CredentialStore& store,
                             audio::AudioFeatureProcessor& audio,
                             const render::RenderScheduler& scheduler)
    : m_lights(lights)
    , m_engine(engine)
    , m_connection(connection)
    , m_store(store)
    , m_audio(audio)
    , m_scheduler(scheduler)
    , m_length(0)
    , m_overflow(false) {
    m_line[0] = '\0';
}

void SerialConsole::begin() {
    CONSOLE_PRINTF("\n=== LedLink Console ===\n");
    CONSOLE_PRINTF("Type 'help' for commands\n");
}

bool SerialConsole::feed(char c) {
    if (c == '\n' || c == '\r') {
        if (m_length == 0 && !m_overflow) {
            return false;
        }
        bool overflowed = m_overflow;
        m_line[m_length] = '\0';
        m_length = 0;
        m_overflow = false;

        if (overflowed) {
            CONSOLE_PRINTF("Line too long (max %u)\n", static_cast<unsigned>(MAX_LINE));
            return false;
        }
        execute(m_line);
        return true;
    }

    if (c == 8 || c == 127) {  // Backspace
        if (m_length > 0) {
            m_length--;
        }
        return false;
    }

    if (c >= 32 && c <= 126) {
        if (m_length < MAX_LINE) {
            m_line[m_length++] = c;
        } else {
            m_overflow = true;
        }
    }
    return false;
}

CommandResult SerialConsole::execute(const char* line) {
    char buffer[MAX_LINE + 1];
    strncpy(buffer, line, MAX_LINE);
    buffer[MAX_LINE] = '\0';

    for (char* p = buffer; *p != '\0'; ++p) {
        *p = static_cast<char>(tolower(static_cast<unsigned char>(*p)));
    }

    char* cursor = buffer;
    char* command = nextToken(cursor);
    if (command == nullptr) {
        return CommandResult::EMPTY;
    }

    CommandResult result;
    if (strcmp(command, "help") == 0 || strcmp(command, "h") == 0) {
        showHelp();
        result = CommandResult::OK;
    } else if (strcmp(command, "status") == 0 || strcmp(command, "s") == 0) {
        showStatus();
        result = CommandResult::OK;
    } else if (strcmp(command, "dbg") == 0) {
        result = handleDebug(cursor);
    } else if (strcmp(command, "mode") == 0) {
        result = handleMode(cursor);
    } else if (strcmp(command, "bright") == 0) {
        result = handleBrightness(cursor);
    } else if (strcmp(command, "wifi") == 0) {
        result = handleWifi(cursor);
    } else {
        CONSOLE_PRINTF("Unknown command '%s'. Type 'help' for commands.\n", command);
        return CommandResult::UNKNOWN;
    }

    if (result == CommandResult::BAD_ARGUMENT) {
        CONSOLE_PRINTF("Bad argument. Type 'help' for usage.\n");
    }
    return result;
}

void SerialConsole::showHelp() {
    CONSOLE_PRINTF("\n=== COMMAND HELP ===\n");
    CONSOLE_PRINTF("  help                - Show this help\n");
    CONSOLE_PRINTF("  status              - Show current status\n");
    CONSOLE_PRINTF("  dbg                 - Show debug levels\n");
    CONSOLE_PRINTF("  dbg <0-5>           - Set global debug level\n");
    CONSOLE_PRINTF("  dbg <domain> <0-5>  - audio|render|network|protocol|system\n");
    CONSOLE_PRINTF("  mode <0-%u>         - Set light mode\n",
                   static_cast<unsigned>(effects::MODE_COUNT - 1));
    CONSOLE_PRINTF("  bright <0-255>      - Set brightness\n");
    CONSOLE_PRINTF("  wifi forget         - Erase stored WiFi credentials\n");
    CONSOLE_PRINTF("====================\n");
}

void SerialConsole::showStatus() {
    const render::SchedulerStats& stats = m_scheduler.getStats();

    CONSOLE_PRINTF("\n=== STATUS ===\n");
    CONSOLE_PRINTF("Network:    %s%s\n",
                   network::connectionStateName(m_connection.getState()),
                   m_connection.isHotspotActive() ? " (hotspot up)" : "");
    CONSOLE_PRINTF("SSID:       %s\n",
                   m_connection.getSsid()[0] != '\0' ? m_connection.getSsid() : "(none)");
    CONSOLE_PRINTF("Address:    %s\n",
                   m_connection.getAddress()[0] != '\0' ? m_connection.getAddress() : "-");
    CONSOLE_PRINTF("Mode:       %u (%s)\n",
                   static_cast<unsigned>(m_lights.mode), effects::modeName(m_lights.mode));
    CONSOLE_PRINTF("Brightness: %u\n", m_lights.brightness);
    CONSOLE_PRINTF("Color:      %u,%u,%u\n",
                   m_lights.staticColor.r, m_lights.staticColor.g, m_lights.staticColor.b);
    CONSOLE_PRINTF("Audio:      %lu frames, %lu dropped, energy %u\n",
                   static_cast<unsigned long>(m_audio.getFramesAccepted()),
                   static_cast<unsigned long>(m_audio.getFramesDropped()),
                   m_audio.getFeatures().energy);
    CONSOLE_PRINTF("Render:     %lu frames, %lu budget yields, %lu busy yields\n",
                   static_cast<unsigned long>(stats.framesRendered),
                   static_cast<unsigned long>(stats.budgetYields),
                   static_cast<unsigned long>(stats.busyYields));
    CONSOLE_PRINTF("Protocol:   %lu rejected\n",
                   static_cast<unsigned long>(m_engine.getRejectedCount()));
    CONSOLE_PRINTF("==============\n");
}

CommandResult SerialConsole::handleDebug(char* args) {
    config::DebugConfig& cfg = config::getDebugConfig();

    char* first = nextToken(args);
    if (first == nullptr) {
        config::printDebugConfig();
        return CommandResult::OK;
    }

    unsigned long level = 0;
    char* second = nextToken(args);

    if (second == nullptr) {
        if (!parseNumber(first, 5, level)) {
            return CommandResult::BAD_ARGUMENT;
        }
        cfg.globalLevel = static_cast<uint8_t>(level);
        CONSOLE_PRINTF("Global debug level: %lu (%s)\n",
                       level, config::DebugConfig::levelName(cfg.globalLevel));
        return CommandResult::OK;
    }

    config::DebugDomain domain;
    if (!config::DebugConfig::parseDomain(first, domain) || !parseNumber(second, 5, level)) {
        return CommandResult::BAD_ARGUMENT;
    }
    cfg.setDomainLevel(domain, static_cast<int8_t>(level));
    CONSOLE_PRINTF("%s debug level: %lu (%s)\n",
                   config::DebugConfig::domainName(domain), level,
                   config::DebugConfig::levelName(static_cast<uint8_t>(level)));
    return CommandResult::OK;
}

CommandResult SerialConsole::handleMode(char* args) {
    unsigned long id = 0;
    if (!parseNumber(nextToken(args), effects::MODE_COUNT - 1, id)) {
        return CommandResult::BAD_ARGUMENT;
    }
    if (!m_engine.selectMode(static_cast<uint8_t>(id))) {
        CONSOLE_PRINTF("Mode %lu is not available\n", id);
        return CommandResult::BAD_ARGUMENT;
    }
    CONSOLE_PRINTF("Mode: %lu (%s)\n", id, effects::modeName(m_lights.mode));
    return CommandResult::OK;
}

CommandResult SerialConsole::handleBrightness(char* args) {
    unsigned long value = 0;
    if (!parseNumber(nextToken(args), 255, value)) {
        return CommandResult::BAD_ARGUMENT;
    }
    m_engine.setBrightness(static_cast<uint8_t>(value));
    CONSOLE_PRINTF("Brightness: %lu\n", value);
    return CommandResult::OK;
}

CommandResult SerialConsole::handleWifi(char* args) {
    char* sub = nextToken(args);
    if (sub == nullptr || strcmp(sub, "forget") != 0) {
        return CommandResult::BAD_ARGUMENT;
    }
    m_store.clear();
    LL_SYS_LOGI("Stored credentials erased from console");
    CONSOLE_PRINTF("WiFi credentials erased. Reboot to start the setup hotspot.\n");
    return CommandResult::OK;
}

} // namespace console
} // namespace ledlink
