// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file IStatusSink.h
 * @brief Where text status lines go (WebSocket sessions on the device)
 *
 * Called from the loop thread only.
 */

#pragma once

#include <cstdint>

namespace ledlink {
namespace network {

class IStatusSink {
public:
    virtual ~IStatusSink() = default;

    /**
     * @brief Send a text line to every open session
     */
    virtual void broadcast(const char* text) = 0;

    /**
     * @brief Send a text line to one session
     * @param sessionId Transport-assigned session id
     */
    virtual void sendTo(uint32_t sessionId, const char* text) = 0;
};

} // namespace network
} // namespace ledlink
