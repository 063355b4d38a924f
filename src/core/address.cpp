// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "core/address.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace funcmap {
namespace core {

std::string FormatAddress(Address address, int digits) {
  std::ostringstream out;
  out << "0x" << std::hex << std::nouppercase << std::setw(digits)
      << std::setfill('0') << address;
  return out.str();
}

bool ParseAddress(const std::string& text, Address* address,
                  std::string* error) {
  try {
    size_t consumed = 0;
    std::string digits = text;
    int base = 10;

    // Check for hex prefix (0x or $)
    if (text.size() >= 2 && text[0] == '0' &&
        (text[1] == 'x' || text[1] == 'X')) {
      digits = text.substr(2);
      base = 16;
    } else if (!text.empty() && text[0] == '$') {
      digits = text.substr(1);
      base = 16;
    }

    // Only digits of the chosen base; stoull would skip blanks, signs
    // and a second 0x prefix
    auto is_digit = [base](unsigned char c) {
      return base == 16 ? std::isxdigit(c) != 0 : std::isdigit(c) != 0;
    };
    if (digits.empty() ||
        !std::all_of(digits.begin(), digits.end(), is_digit)) {
      *error = "Invalid address format: " + text;
      return false;
    }

    *address = std::stoull(digits, &consumed, base);
    if (consumed != digits.size()) {
      *error = "Invalid address format: " + text;
      return false;
    }
    return true;

  } catch (const std::exception&) {
    *error = "Invalid address format: " + text;
    return false;
  }
}

}  // namespace core
}  // namespace funcmap
