// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "PatternSet.h"

#include "AmbientPatterns.h"
#include "AudioPatterns.h"

#define LL_LOG_TAG "Patterns"
#include "utils/Log.h"

namespace ledlink {
namespace effects {
namespace patterns {

namespace {

RainbowPattern s_rainbow;
FirePattern s_fire;
PalettePattern s_palette;
CylonPattern s_cylon;
PacificaPattern s_pacifica;
PridePattern s_pride;
PlasmaPattern s_plasma;
AuroraPattern s_aurora;
MatrixPattern s_matrix;

AudioSpectrumPattern s_audioSpectrum;
AudioWavePattern s_audioWave;
AudioEnergyPattern s_audioEnergy;
AudioParticlesPattern s_audioParticles;
AudioRainbowBarsPattern s_audioRainbowBars;

struct Entry {
    ModeId id;
    IEffectRenderer* renderer;
};

const Entry kPatterns[] = {
    {ModeId::Rainbow,          &s_rainbow},
    {ModeId::Fire,             &s_fire},
    {ModeId::Palette,          &s_palette},
    {ModeId::Cylon,            &s_cylon},
    {ModeId::Pacifica,         &s_pacifica},
    {ModeId::Pride,            &s_pride},
    {ModeId::Plasma,           &s_plasma},
    {ModeId::Aurora,           &s_aurora},
    {ModeId::Matrix,           &s_matrix},
    {ModeId::AudioSpectrum,    &s_audioSpectrum},
    {ModeId::AudioWave,        &s_audioWave},
    {ModeId::AudioEnergy,      &s_audioEnergy},
    {ModeId::AudioParticles,   &s_audioParticles},
    {ModeId::AudioRainbowBars, &s_audioRainbowBars},
};

} // namespace

uint8_t registerPatterns(EffectRegistry& registry) {
    uint8_t registered = 0;
    for (const Entry& entry : kPatterns) {
        if (registry.registerEffect(entry.id, entry.renderer)) {
            registered++;
        } else {
            LL_RENDER_LOGW("Failed to register %s", entry.renderer->getName());
        }
    }
    LL_RENDER_LOGI("Registered %u patterns", static_cast<unsigned>(registered));
    return registered;
}

} // namespace patterns
} // namespace effects
} // namespace ledlink
