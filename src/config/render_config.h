// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#ifndef LEDLINK_RENDER_CONFIG_H
#define LEDLINK_RENDER_CONFIG_H

#include <cstdint>

namespace ledlink {
namespace config {

namespace RenderConfig {
    // Tick budgets. Audio modes refresh faster than the app's 25 ms frame cadence.
    constexpr uint32_t AUDIO_TICK_BUDGET_MS = 16;    // ~60 FPS
    constexpr uint32_t AMBIENT_TICK_BUDGET_MS = 33;  // ~30 FPS

    // Connection-established flash
    constexpr uint32_t CONNECTED_FLASH_MS = 1500;
    constexpr uint8_t CONNECTED_FLASH_PULSES = 3;

    // Fixed yield while waiting for the next budget slot
    constexpr uint32_t IDLE_YIELD_MS = 1;

    // [PERF] report cadence
    constexpr uint32_t PERF_REPORT_INTERVAL_MS = 30000;
}

} // namespace config
} // namespace ledlink

#endif // LEDLINK_RENDER_CONFIG_H
