// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "EffectRegistry.h"

#define LL_LOG_TAG "Effects"
#include "utils/Log.h"

namespace ledlink {
namespace effects {

EffectRegistry::EffectRegistry() : m_count(0) {
    for (uint8_t i = 0; i < MODE_COUNT; ++i) {
        m_table[i] = nullptr;
    }
}

bool EffectRegistry::registerEffect(ModeId id, IEffectRenderer* renderer) {
    uint8_t index = static_cast<uint8_t>(id);
    if (!isValidModeId(index) || renderer == nullptr) {
        LL_RENDER_LOGW("Rejected registration for mode %u", index);
        return false;
    }

    if (m_table[index] == nullptr) {
        m_count++;
    }
    m_table[index] = renderer;
    LL_RENDER_LOGD("Mode %u -> %s", index, renderer->getName());
    return true;
}

IEffectRenderer* EffectRegistry::get(ModeId id) const {
    uint8_t index = static_cast<uint8_t>(id);
    return isValidModeId(index) ? m_table[index] : nullptr;
}

bool EffectRegistry::isRegistered(uint8_t id) const {
    return isValidModeId(id) && m_table[id] != nullptr;
}

void EffectRegistry::resetEffect(ModeId id) {
    IEffectRenderer* renderer = get(id);
    if (renderer != nullptr) {
        renderer->reset();
    }
}

} // namespace effects
} // namespace ledlink
