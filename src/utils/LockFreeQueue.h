// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file LockFreeQueue.h
 * @brief Fixed-capacity SPSC queue between the AsyncTCP task and the loop
 *
 * - Producer calls push() from the transport callback
 * - Consumer calls pop() from the render loop
 * - No locks, no blocking, no allocation
 */

#pragma once

#include <atomic>
#include <cstddef>

namespace ledlink {
namespace utils {

template<typename T, size_t Capacity>
class LockFreeQueue {
    static_assert(Capacity > 0, "Capacity must be positive");

public:
    LockFreeQueue() : m_head(0), m_tail(0) {}

    LockFreeQueue(const LockFreeQueue&) = delete;
    LockFreeQueue& operator=(const LockFreeQueue&) = delete;

    /**
     * @brief Push an item (producer only)
     * @return true if pushed, false if queue full
     */
    bool push(const T& item) {
        size_t tail = m_tail.load(std::memory_order_relaxed);
        size_t nextTail = (tail + 1) % (Capacity + 1);

        if (nextTail == m_head.load(std::memory_order_acquire)) {
            return false;
        }

        m_buffer[tail] = item;
        m_tail.store(nextTail, std::memory_order_release);
        return true;
    }

    /**
     * @brief Pop an item (consumer only)
     * @return true if popped, false if queue empty
     */
    bool pop(T& item) {
        size_t head = m_head.load(std::memory_order_relaxed);

        if (head == m_tail.load(std::memory_order_acquire)) {
            return false;
        }

        item = m_buffer[head];
        m_head.store((head + 1) % (Capacity + 1), std::memory_order_release);
        return true;
    }

    /**
     * @brief Drop everything queued (consumer only)
     */
    void clear() {
        m_head.store(m_tail.load(std::memory_order_relaxed),
                     std::memory_order_release);
    }

private:
    T m_buffer[Capacity + 1];  // +1 for full/empty disambiguation
    std::atomic<size_t> m_head;
    std::atomic<size_t> m_tail;
};

} // namespace utils
} // namespace ledlink
