// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_OUTPUT_REPORT_CONFIG_H_
#define FUNCMAP_OUTPUT_REPORT_CONFIG_H_

#include "core/constants.h"

namespace funcmap {
namespace output {

// Configuration for dumps, renderers and reports
struct ReportConfig {
  // Minimum hex digits when printing an address
  int address_digits = constants::kDefaultAddressDigits;

  // Mark call-site and return-site blocks in rendered graphs
  bool annotate_sites = true;

  // JSON indentation (-1 for compact)
  int json_indent = 2;

  // Create default configuration
  static ReportConfig Default() {
    return ReportConfig{};
  }

  // Create configuration for a given address width
  static ReportConfig WithAddressDigits(int digits) {
    ReportConfig config;
    config.address_digits = digits;
    return config;
  }
};

}  // namespace output
}  // namespace funcmap

#endif  // FUNCMAP_OUTPUT_REPORT_CONFIG_H_
