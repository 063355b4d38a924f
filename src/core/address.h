// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_CORE_ADDRESS_H_
#define FUNCMAP_CORE_ADDRESS_H_

#include <cstdint>
#include <string>

#include "core/constants.h"

namespace funcmap {
namespace core {

// Wide enough for any supported target pointer width
using Address = uint64_t;

// Format address as "0x" followed by at least `digits` lowercase hex digits
std::string FormatAddress(Address address,
                          int digits = constants::kDefaultAddressDigits);

// Parse "0x1000", "$1000" or decimal "4096"
// Returns false and fills error on malformed input
bool ParseAddress(const std::string& text, Address* address,
                  std::string* error);

}  // namespace core
}  // namespace funcmap

#endif  // FUNCMAP_CORE_ADDRESS_H_
