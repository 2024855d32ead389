// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file ModeId.h
 * @brief Light mode ids as sent by the companion app (opcode 0x02)
 *
 * Ids are part of the wire protocol and must never be renumbered.
 */

#pragma once

#include <cstdint>

namespace ledlink {
namespace effects {

enum class ModeId : uint8_t {
    Static = 0,
    Rainbow = 1,
    Fire = 2,
    Palette = 3,
    Cylon = 4,
    Pacifica = 5,
    Pride = 6,
    Plasma = 7,
    Aurora = 8,
    Matrix = 9,
    // Audio-reactive
    AudioSpectrum = 10,
    AudioWave = 11,
    AudioEnergy = 12,
    AudioParticles = 13,
    AudioRainbowBars = 14
};

static constexpr uint8_t MODE_COUNT = 15;
static constexpr uint8_t FIRST_AUDIO_MODE = 10;

constexpr bool isValidModeId(uint8_t id) {
    return id < MODE_COUNT;
}

constexpr bool isAudioReactive(ModeId mode) {
    return static_cast<uint8_t>(mode) >= FIRST_AUDIO_MODE;
}

inline const char* modeName(ModeId mode) {
    switch (mode) {
        case ModeId::Static:           return "Static";
        case ModeId::Rainbow:          return "Rainbow";
        case ModeId::Fire:             return "Fire";
        case ModeId::Palette:          return "Palette";
        case ModeId::Cylon:            return "Cylon";
        case ModeId::Pacifica:         return "Pacifica";
        case ModeId::Pride:            return "Pride";
        case ModeId::Plasma:           return "Plasma";
        case ModeId::Aurora:           return "Aurora";
        case ModeId::Matrix:           return "Matrix";
        case ModeId::AudioSpectrum:    return "Audio Spectrum";
        case ModeId::AudioWave:        return "Audio Wave";
        case ModeId::AudioEnergy:      return "Audio Energy";
        case ModeId::AudioParticles:   return "Audio Particles";
        case ModeId::AudioRainbowBars: return "Audio Rainbow Bars";
        default:                       return "Unknown";
    }
}

} // namespace effects
} // namespace ledlink
