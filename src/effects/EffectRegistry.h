// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file EffectRegistry.h
 * @brief Lookup table from ModeId to renderer
 *
 * Renderers are owned elsewhere (static instances on the device, locals in
 * tests) and must outlive the registry.
 */

#pragma once

#include <cstdint>

#include "IEffectRenderer.h"
#include "ModeId.h"

namespace ledlink {
namespace effects {

class EffectRegistry {
public:
    EffectRegistry();

    /**
     * @brief Register a renderer for a mode id
     * @return false if the id is out of range or renderer is null
     */
    bool registerEffect(ModeId id, IEffectRenderer* renderer);

    /**
     * @brief Renderer for a mode, or nullptr
     */
    IEffectRenderer* get(ModeId id) const;

    bool isRegistered(uint8_t id) const;

    uint8_t getRegisteredCount() const { return m_count; }

    /**
     * @brief Call reset() on the renderer for a mode (no-op if unregistered)
     */
    void resetEffect(ModeId id);

private:
    IEffectRenderer* m_table[MODE_COUNT];
    uint8_t m_count;
};

} // namespace effects
} // namespace ledlink
