// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file StaticColorRenderer.h
 * @brief Mode 0: fill the strip with the static color
 */

#pragma once

#include "IEffectRenderer.h"

namespace ledlink {
namespace effects {

class StaticColorRenderer : public IEffectRenderer {
public:
    void render(const render::RenderContext& ctx, const render::RenderFrame& frame) override;
    const char* getName() const override { return "Static"; }
};

} // namespace effects
} // namespace ledlink
