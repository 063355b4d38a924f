// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "analysis/event_trace_parser.h"

#include <fstream>

#include "utils/logger.h"

using json = nlohmann::json;

namespace funcmap {
namespace analysis {

bool EventTraceParser::ParseFile(const std::string& file_path,
                                 EventTrace* trace, std::string* error) {
  // Read file
  std::ifstream file(file_path);
  if (!file.is_open()) {
    *error = "Failed to open trace file: " + file_path;
    return false;
  }

  std::string json_content((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
  file.close();

  return ParseJson(json_content, trace, error);
}

bool EventTraceParser::ParseJson(const std::string& json_content,
                                 EventTrace* trace, std::string* error) {
  try {
    json j = json::parse(json_content);

    if (!j.is_object()) {
      *error = "Trace root must be a JSON object";
      return false;
    }

    // Parse events
    if (j.contains("events")) {
      if (!j["events"].is_array()) {
        *error = "'events' must be an array";
        return false;
      }
      size_t index = 0;
      for (const auto& entry : j["events"]) {
        RecoveryEvent event;
        if (!ParseEvent(entry, index, &event, error)) {
          return false;
        }
        trace->events.push_back(event);
        ++index;
      }
    }

    // Parse per-function recovery results
    if (j.contains("functions")) {
      if (!j["functions"].is_object()) {
        *error = "'functions' must be an object keyed by entry address";
        return false;
      }
      for (auto& [addr_str, entry] : j["functions"].items()) {
        FunctionHint hint;
        if (!ParseFunctionHint(addr_str, entry, &hint, error)) {
          return false;
        }
        trace->function_hints.push_back(hint);
      }
    }

    LOG_DEBUG("Parsed " + std::to_string(trace->events.size()) +
              " events and " + std::to_string(trace->function_hints.size()) +
              " function hints");
    return true;

  } catch (const json::exception& e) {
    *error = std::string("JSON parse error: ") + e.what();
    return false;
  }
}

bool EventTraceParser::ParseEvent(const json& entry, size_t index,
                                  RecoveryEvent* event, std::string* error) {
  std::string where = "Event " + std::to_string(index);

  if (!entry.is_object()) {
    *error = where + ": must be an object";
    return false;
  }
  if (!entry.contains("type") || !entry["type"].is_string()) {
    *error = where + ": missing 'type' field";
    return false;
  }

  std::string type_str = entry["type"].get<std::string>();
  if (!ParseEventType(type_str, &event->type)) {
    *error = where + ": unknown event type '" + type_str + "'";
    return false;
  }

  std::string field_error;
  bool ok = ParseAddressField(entry, "function", &event->function,
                              &field_error);

  switch (event->type) {
    case EventType::CALL_TO:
      ok = ok && ParseAddressField(entry, "from", &event->from, &field_error) &&
           ParseAddressField(entry, "to", &event->to, &field_error) &&
           ParseAddressField(entry, "return", &event->return_address,
                             &field_error);
      break;
    case EventType::RETURN_FROM:
      ok = ok && ParseAddressField(entry, "from", &event->from, &field_error);
      // Return targets are not part of the model
      if (ok && entry.contains("to")) {
        LOG_DEBUG(where + ": ignoring 'to' on return_from");
      }
      break;
    case EventType::TRANSIT_TO:
      ok = ok && ParseAddressField(entry, "from", &event->from, &field_error) &&
           ParseAddressField(entry, "to", &event->to, &field_error);
      break;
    case EventType::RETURN_FROM_CALL: {
      const char* first_key = entry.contains("first_block") ? "first_block"
                                                             : "from";
      ok = ok &&
           ParseAddressField(entry, first_key, &event->from, &field_error) &&
           ParseAddressField(entry, "to", &event->to, &field_error);
      break;
    }
  }

  if (!ok) {
    *error = where + " (" + type_str + "): " + field_error;
    return false;
  }
  return true;
}

bool EventTraceParser::ParseFunctionHint(const std::string& addr_str,
                                         const json& entry, FunctionHint* hint,
                                         std::string* error) {
  if (!core::ParseAddress(addr_str, &hint->entry, error)) {
    *error = "Invalid function address: " + addr_str;
    return false;
  }
  if (!entry.is_object()) {
    *error = "Function " + addr_str + ": must be an object";
    return false;
  }

  if (entry.contains("name")) {
    if (!entry["name"].is_string()) {
      *error = "Function " + addr_str + ": 'name' must be a string";
      return false;
    }
    hint->name = entry["name"].get<std::string>();
  }

  if (!ParseOffsets(entry, "argument_registers", &hint->argument_registers,
                    error) ||
      !ParseOffsets(entry, "argument_stack_variables",
                    &hint->argument_stack_variables, error)) {
    *error = "Function " + addr_str + ": " + *error;
    return false;
  }

  for (const char* key : {"bp_on_stack", "retaddr_on_stack"}) {
    if (entry.contains(key) && !entry[key].is_boolean()) {
      *error = "Function " + addr_str + ": '" + key + "' must be a boolean";
      return false;
    }
  }
  if (entry.contains("bp_on_stack")) {
    hint->bp_on_stack = entry["bp_on_stack"].get<bool>();
  }
  if (entry.contains("retaddr_on_stack")) {
    hint->retaddr_on_stack = entry["retaddr_on_stack"].get<bool>();
  }

  if (entry.contains("sp_difference")) {
    if (!entry["sp_difference"].is_number_integer()) {
      *error = "Function " + addr_str + ": 'sp_difference' must be an integer";
      return false;
    }
    hint->sp_difference = entry["sp_difference"].get<int64_t>();
  }

  return true;
}

bool EventTraceParser::ParseAddressValue(const json& value,
                                         core::Address* address,
                                         std::string* error) {
  if (value.is_string()) {
    return core::ParseAddress(value.get<std::string>(), address, error);
  }
  if (value.is_number_unsigned()) {
    *address = value.get<core::Address>();
    return true;
  }
  if (value.is_number_integer() && value.get<int64_t>() >= 0) {
    *address = static_cast<core::Address>(value.get<int64_t>());
    return true;
  }
  *error = "Invalid address value: " + value.dump();
  return false;
}

bool EventTraceParser::ParseAddressField(const json& entry, const char* key,
                                         core::Address* address,
                                         std::string* error) {
  if (!entry.contains(key)) {
    *error = std::string("missing '") + key + "' field";
    return false;
  }
  return ParseAddressValue(entry[key], address, error);
}

bool EventTraceParser::ParseOffsets(const json& value, const char* key,
                                    std::vector<int64_t>* offsets,
                                    std::string* error) {
  if (!value.contains(key)) {
    return true;
  }
  if (!value[key].is_array()) {
    *error = std::string("'") + key + "' must be an array";
    return false;
  }
  for (const auto& offset : value[key]) {
    if (!offset.is_number_integer()) {
      *error = std::string("'") + key + "' entries must be integers";
      return false;
    }
    offsets->push_back(offset.get<int64_t>());
  }
  return true;
}

}  // namespace analysis
}  // namespace funcmap
