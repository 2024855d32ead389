// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IEffectRenderer.h
 * @brief Per-mode painter interface
 *
 * A renderer paints ctx.leds[0 .. ctx.ledCount) each tick. It may keep
 * private state between ticks for its own mode; the scheduler calls reset()
 * whenever the active mode changes so nothing leaks across modes.
 */

#pragma once

#include "render/RenderContext.h"

namespace ledlink {
namespace effects {

class IEffectRenderer {
public:
    virtual ~IEffectRenderer() = default;

    /**
     * @brief Paint one frame
     */
    virtual void render(const render::RenderContext& ctx, const render::RenderFrame& frame) = 0;

    /**
     * @brief Forget private state (mode changed)
     */
    virtual void reset() {}

    virtual const char* getName() const = 0;
};

} // namespace effects
} // namespace ledlink
