// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file main.cpp
 * @brief LedLink firmware entry point
 *
 * WS2812 strip controller driven by the companion app over a binary
 * WebSocket protocol. Boots into the stored network or the setup hotspot.
 */

#include <Arduino.h>

#include "audio/AudioFeatureProcessor.h"
#include "config/features.h"
#include "config/hardware_config.h"
#include "console/SerialConsole.h"
#include "effects/EffectRegistry.h"
#include "effects/StaticColorRenderer.h"
#include "effects/patterns/PatternSet.h"
#include "hal/esp32/EspPlatformServices.h"
#include "hal/esp32/EspRadio.h"
#include "hal/esp32/FastLedDriver.h"
#include "hal/esp32/NvsRecordStorage.h"
#include "network/ConnectionManager.h"
#include "network/SessionPump.h"
#include "network/WsTransport.h"
#include "persistence/CredentialStore.h"
#include "protocol/ProtocolEngine.h"
#include "render/RenderContext.h"
#include "render/RenderScheduler.h"

#define LL_LOG_TAG "Main"
#include "utils/Log.h"

using namespace ledlink;

// ==================== Global Instances ====================

static hal::EspRadio radio;
static hal::NvsRecordStorage recordStorage;
static persistence::CredentialStore credentials(recordStorage);
static network::WsTransport transport(radio);
static network::ConnectionManager connection(radio, credentials, transport);

static render::LightState lights;
static audio::AudioFeatureProcessor audioProcessor;
static effects::EffectRegistry effectRegistry;
static effects::StaticColorRenderer staticRenderer;

static protocol::ProtocolEngine engine(lights, audioProcessor, connection, credentials, effectRegistry);
static network::SessionPump pump(engine, connection, transport);

static hal::FastLedDriver ledDriver;
static hal::EspPlatformServices platform(transport);
static render::RenderScheduler scheduler(lights, audioProcessor, connection, effectRegistry,
                                         ledDriver, platform);

#if FEATURE_SERIAL_CONSOLE
static console::SerialConsole serialConsole(lights, engine, connection, credentials,
                                            audioProcessor, scheduler);
#endif

// ==================== Setup ====================

void setup() {
    Serial.begin(115200);
    delay(1000);

    Serial.println("\n\n==========================================");
    Serial.println("LedLink - WebSocket LED Controller");
    Serial.println("==========================================\n");

    Serial.println("Registering effects...");
    effectRegistry.registerEffect(effects::ModeId::Static, &staticRenderer);
    effects::patterns::registerPatterns(effectRegistry);
    Serial.printf("  Effects registered: %u\n\n", static_cast<unsigned>(effectRegistry.getRegisteredCount()));

    // Blank the strip before the radio starts drawing current
    Serial.println("Initializing LED strip...");
    if (!scheduler.begin(millis())) {
        Serial.println("ERROR: LED driver init failed!");
        while (1) delay(1000);  // Halt
    }
    Serial.printf("  LEDs: %u on GPIO%u\n\n",
                  static_cast<unsigned>(config::HardwareConfig::NUM_LEDS),
                  static_cast<unsigned>(config::HardwareConfig::LED_PIN));

    Serial.println("Initializing NVS...");
    if (!recordStorage.init()) {
        Serial.println("WARNING: NVS init failed - credentials won't persist!");
    } else {
        Serial.println("  NVS: INITIALIZED\n");
    }

    Serial.println("Starting network...");
    connection.begin();
    transport.begin(pump);
    Serial.printf("  Network: %s\n\n", network::connectionStateName(connection.getState()));

    if (!platform.begin()) {
        LL_LOGW("Running without task watchdog");
    }

#if FEATURE_SERIAL_CONSOLE
    serialConsole.begin();
#endif

    LL_LOGI("Setup complete");
}

// ==================== Main Loop ====================

void loop() {
#if FEATURE_SERIAL_CONSOLE
    while (Serial.available() > 0) {
        int c = Serial.read();
        if (c < 0) break;
        serialConsole.feed(static_cast<char>(c));
    }
#endif

    scheduler.tick(millis());
}
