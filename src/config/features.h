// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
#ifndef LEDLINK_FEATURES_H
#define LEDLINK_FEATURES_H

// Feature flags to enable/disable functionality at compile time.
// Override from the build: -D FEATURE_SERIAL_CONSOLE=0

// Line-oriented operator console on the USB serial port
#ifndef FEATURE_SERIAL_CONSOLE
#define FEATURE_SERIAL_CONSOLE 1
#endif

// mDNS advertisement once the hotspot grace period ends
#ifndef FEATURE_MDNS
#define FEATURE_MDNS 1
#endif

// Task watchdog on the loop task
#ifndef FEATURE_TASK_WATCHDOG
#define FEATURE_TASK_WATCHDOG 1
#endif

// Periodic [PERF] line with tick statistics
#ifndef FEATURE_PERF_REPORT
#define FEATURE_PERF_REPORT 1
#endif

#endif // LEDLINK_FEATURES_H
