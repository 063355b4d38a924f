// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#ifndef FUNCMAP_ANALYSIS_EVENT_TRACE_PARSER_H_
#define FUNCMAP_ANALYSIS_EVENT_TRACE_PARSER_H_

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "analysis/recovery_event.h"

namespace funcmap {
namespace analysis {

// Parses recorded recovery sessions from JSON
//
// {
//   "events": [
//     {"type": "transit_to", "function": "0x1000", "from": "0x1000", "to": "0x1010"},
//     {"type": "call_to", "function": "0x1000", "from": "0x1010",
//      "to": "0x2000", "return": "0x1020"},
//     {"type": "return_from", "function": "0x1000", "from": "0x1020"},
//     {"type": "return_from_call", "function": "0x1000",
//      "first_block": "0x1020", "to": "0x1030"}
//   ],
//   "functions": {
//     "0x1000": {"name": "main", "argument_registers": [16, 24],
//                "argument_stack_variables": [4], "bp_on_stack": true,
//                "retaddr_on_stack": true, "sp_difference": 8}
//   }
// }
//
// Addresses may be hex strings ("0x1000", "$1000"), decimal strings or
// integers. Events keep their file order.
class EventTraceParser {
 public:
  EventTraceParser() = default;

  // Parse trace from JSON file
  // Returns true on success, false on error
  bool ParseFile(const std::string& file_path, EventTrace* trace,
                 std::string* error);

  // Parse trace from JSON string
  bool ParseJson(const std::string& json_content, EventTrace* trace,
                 std::string* error);

 private:
  static bool ParseEvent(const nlohmann::json& entry, size_t index,
                         RecoveryEvent* event, std::string* error);
  static bool ParseFunctionHint(const std::string& addr_str,
                                const nlohmann::json& entry,
                                FunctionHint* hint, std::string* error);

  // Helper: Parse address from JSON string or integer
  static bool ParseAddressValue(const nlohmann::json& value,
                                core::Address* address, std::string* error);

  // Helper: Parse required address member of an event object
  static bool ParseAddressField(const nlohmann::json& entry, const char* key,
                                core::Address* address, std::string* error);

  static bool ParseOffsets(const nlohmann::json& value, const char* key,
                           std::vector<int64_t>* offsets, std::string* error);
};

}  // namespace analysis
}  // namespace funcmap

#endif  // FUNCMAP_ANALYSIS_EVENT_TRACE_PARSER_H_
