// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq

#include "StatusMessage.h"

#include <cstdio>

namespace ledlink {
namespace protocol {

const char* statusPrefix(StatusKind kind) {
    switch (kind) {
        case StatusKind::IpAddress:     return "IP:";
        case StatusKind::AutoConnected: return "AUTO_CONNECTED:";
        case StatusKind::HotspotMode:   return "AP_MODE";
        case StatusKind::Reconfigured:  return "RECONFIG:";
        case StatusKind::Error:         return "ERR:";
        case StatusKind::Failure:       return "FAIL:";
        default:                        return "";
    }
}

size_t formatStatus(char* out, size_t len, StatusKind kind, const char* detail) {
    if (out == nullptr || len == 0) {
        return 0;
    }

    int written;
    if (kind == StatusKind::HotspotMode || detail == nullptr) {
        written = snprintf(out, len, "%s", statusPrefix(kind));
    } else {
        written = snprintf(out, len, "%s%s", statusPrefix(kind), detail);
    }

    if (written < 0 || static_cast<size_t>(written) >= len) {
        out[0] = '\0';
        return 0;
    }
    return static_cast<size_t>(written);
}

} // namespace protocol
} // namespace ledlink
