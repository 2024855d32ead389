// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "StaticColorRenderer.h"

namespace ledlink {
namespace effects {

void StaticColorRenderer::render(const render::RenderContext& ctx, const render::RenderFrame& frame) {
    (void)frame;
    for (uint16_t i = 0; i < ctx.ledCount; ++i) {
        ctx.leds[i] = ctx.staticColor;
    }
}

} // namespace effects
} // namespace ledlink
