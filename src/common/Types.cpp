#include "common/Types.hpp"

namespace fleet::common {

std::string OperationMeta::displayName() const {
  std::string sName;
  for (const auto& sPart : vNameStack) {
    if (!sName.empty()) sName += " | ";
    sName += sPart;
  }
  return sName;
}

const char* toString(CommandKind kind) {
  switch (kind) {
    case CommandKind::FactProbe: return "fact_probe";
    case CommandKind::StateChange: return "state_change";
  }
  return "unknown";
}

const char* toString(HostOutcome outcome) {
  switch (outcome) {
    case HostOutcome::NoChange: return "no change";
    case HostOutcome::Changed: return "changed";
    case HostOutcome::WouldChange: return "would change";
    case HostOutcome::Failed: return "failed";
    case HostOutcome::Cancelled: return "cancelled";
  }
  return "unknown";
}

const char* toString(EngineState state) {
  switch (state) {
    case EngineState::Idle: return "Idle";
    case EngineState::Evaluating: return "Evaluating";
    case EngineState::Planned: return "Planned";
    case EngineState::Executing: return "Executing";
    case EngineState::Completed: return "Completed";
    case EngineState::Aborted: return "Aborted";
  }
  return "Unknown";
}

}  // namespace fleet::common
