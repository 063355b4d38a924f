// Copyright (c) 2025 Cortexa LLC
// SPDX-License-Identifier: MIT

#include "analysis/event_replayer.h"

#include "core/constants.h"
#include "utils/logger.h"

namespace funcmap {
namespace analysis {

EventReplayer::EventReplayer(core::FunctionRegistry* registry)
    : registry_(registry) {}

void EventReplayer::Apply(const RecoveryEvent& event) {
  if (!registry_) {
    return;
  }

  if (statistics_.TotalEvents() < constants::kMaxEventsLogged) {
    std::string message = std::string(EventTypeName(event.type)) + " in " +
                          core::FormatAddress(event.function) + ": " +
                          core::FormatAddress(event.from);
    // return_from carries no target
    if (event.type != EventType::RETURN_FROM) {
      message += " -> " + core::FormatAddress(event.to);
    }
    LOG_DEBUG(message);
  }

  switch (event.type) {
    case EventType::CALL_TO:
      registry_->CallTo(event.function, event.from, event.to,
                        event.return_address);
      statistics_.call_to++;
      break;
    case EventType::RETURN_FROM:
      registry_->ReturnFrom(event.function, event.from);
      statistics_.return_from++;
      break;
    case EventType::TRANSIT_TO:
      registry_->TransitTo(event.function, event.from, event.to);
      statistics_.transit_to++;
      break;
    case EventType::RETURN_FROM_CALL:
      registry_->ReturnFromCall(event.function, event.from, event.to);
      statistics_.return_from_call++;
      break;
  }
}

bool EventReplayer::ApplyHint(const FunctionHint& hint) {
  if (!registry_) {
    return false;
  }

  // Hints describe recovered functions; they never create one
  core::Function* function = registry_->Lookup(hint.entry);
  if (!function) {
    LOG_WARNING("Skipping hint for unknown function " +
                core::FormatAddress(hint.entry));
    statistics_.hints_skipped++;
    return false;
  }

  if (hint.name) {
    function->set_name(*hint.name);
  }
  for (int64_t offset : hint.argument_registers) {
    function->AddArgumentRegister(offset);
  }
  for (int64_t offset : hint.argument_stack_variables) {
    function->AddArgumentStackVariable(offset);
  }
  if (hint.bp_on_stack) {
    function->set_bp_on_stack(*hint.bp_on_stack);
  }
  if (hint.retaddr_on_stack) {
    function->set_retaddr_on_stack(*hint.retaddr_on_stack);
  }
  if (hint.sp_difference) {
    function->set_sp_difference(*hint.sp_difference);
  }

  statistics_.hints_applied++;
  return true;
}

void EventReplayer::Replay(const EventTrace& trace) {
  for (const auto& event : trace.events) {
    Apply(event);
  }
  for (const auto& hint : trace.function_hints) {
    ApplyHint(hint);
  }

  LOG_INFO("Replayed " + std::to_string(statistics_.TotalEvents()) +
           " events (" + std::to_string(statistics_.transit_to) +
           " transit_to, " + std::to_string(statistics_.call_to) +
           " call_to, " + std::to_string(statistics_.return_from) +
           " return_from, " + std::to_string(statistics_.return_from_call) +
           " return_from_call)");
  if (statistics_.hints_skipped > 0) {
    LOG_WARNING(std::to_string(statistics_.hints_skipped) +
                " function hints referred to unknown functions");
  }
}

}  // namespace analysis
}  // namespace funcmap
