// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file SerialConsole.h
 * @brief Operator commands over the USB serial port
 *
 * Commands:
 *   help                 - Show this list
 *   status               - Connection, mode, audio and scheduler counters
 *   dbg                  - Show debug levels
 *   dbg <0-5>            - Set global debug level
 *   dbg <domain> <0-5>   - Set one domain (audio, render, network, protocol, system)
 *   mode <id>            - Switch mode (0-14)
 *   bright <0-255>       - Set brightness
 *   wifi forget          - Erase stored credentials (next boot starts the hotspot)
 *
 * Runs on the loop thread; feed() is called with bytes read from Serial.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace ledlink {

namespace audio { class AudioFeatureProcessor; }
namespace network { class ConnectionManager; }
namespace persistence { class CredentialStore; }
namespace protocol { class ProtocolEngine; }
namespace render {
    struct LightState;
    class RenderScheduler;
}

namespace console {

enum class CommandResult : uint8_t {
    OK = 0,
    EMPTY,
    UNKNOWN,
    BAD_ARGUMENT
};

class SerialConsole {
public:
    static constexpr size_t MAX_LINE = 64;

    SerialConsole(render::LightState& lights,
                  protocol::ProtocolEngine& engine,
                  network::ConnectionManager& connection,
                  persistence::CredentialStore& store,
                  audio::AudioFeatureProcessor& audio,
                  const render::RenderScheduler& scheduler);

    void begin();

    /**
     * @brief Feed one received byte; runs the line on CR/LF
     * @return true if a line was executed
     */
    bool feed(char c);

    /**
     * @brief Run one command line
     */
    CommandResult execute(const char* line);

private:
    void showHelp();
    void showStatus();
    CommandResult handleDebug(char* args);
    CommandResult handleMode(char* args);
    CommandResult handleBrightness(char* args);
    CommandResult handleWifi(char* args);

    render::LightState& m_lights;
    protocol::ProtocolEngine& m_engine;
    network::ConnectionManager& m_connection;
    persistence::CredentialStore& m_store;
    audio::AudioFeatureProcessor& m_audio;
    const render::RenderScheduler& m_scheduler;

    char m_line[MAX_LINE + 1];
    size_t m_length;
    bool m_overflow;
};

} // namespace console
} // namespace ledlink
