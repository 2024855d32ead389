// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file PatternSet.h
 * @brief Registers the device pattern renderers for modes 1-14
 */

#pragma once

#include "effects/EffectRegistry.h"

namespace ledlink {
namespace effects {
namespace patterns {

/**
 * @brief Register every FastLED pattern with the registry
 *
 * The renderers are static instances; mode 0 (Static) is registered by the
 * caller since it is portable.
 *
 * @return Number of patterns registered
 */
uint8_t registerPatterns(EffectRegistry& registry);

} // namespace patterns
} // namespace effects
} // namespace ledlink
