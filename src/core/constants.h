// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_CORE_CONSTANTS_H_
#define FUNCMAP_CORE_CONSTANTS_H_

#include <cstddef>

namespace funcmap {
namespace constants {

// Address display widths (hex digits)
constexpr int kDefaultAddressDigits = 8;
constexpr int kWideAddressDigits = 16;

// Debug artifact naming: dbg_function_0x00001000.dot
constexpr const char* kDebugDrawPrefix = "dbg_function_";

// Event replay
constexpr size_t kMaxEventsLogged = 64;  // Per-event DEBUG lines before going quiet

// Report format version written into JSON output
constexpr int kReportFormatVersion = 1;

}  // namespace constants
}  // namespace funcmap

#endif  // FUNCMAP_CORE_CONSTANTS_H_
