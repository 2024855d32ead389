// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file RecordingStatusSink.h
 * @brief IStatusSink that keeps every line for inspection
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "network/IStatusSink.h"

namespace ledlink {
namespace test {

class RecordingStatusSink : public network::IStatusSink {
public:
    std::vector<std::string> broadcasts;
    std::vector<std::pair<uint32_t, std::string>> sent;

    void broadcast(const char* text) override {
        broadcasts.push_back(text);
    }

    void sendTo(uint32_t sessionId, const char* text) override {
        sent.push_back(std::make_pair(sessionId, std::string(text)));
    }

    bool hasBroadcast(const std::string& text) const {
        for (const std::string& line : broadcasts) {
            if (line == text) return true;
        }
        return false;
    }

    int countBroadcast(const std::string& text) const {
        int n = 0;
        for (const std::string& line : broadcasts) {
            if (line == text) n++;
        }
        return n;
    }

    void clear() {
        broadcasts.clear();
        sent.clear();
    }
};

} // namespace test
} // namespace ledlink
