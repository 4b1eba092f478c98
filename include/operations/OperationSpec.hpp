#pragma once

#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fleet::inventory {
class Host;
}  // namespace fleet::inventory

namespace fleet::facts {
class FactGatherer;
}  // namespace fleet::facts

namespace fleet::operations {

/// Produces the commands one host needs for an operation, consulting facts to
/// diff current against desired state. An empty list means already satisfied.
using CommandGenerator =
    std::function<std::vector<std::string>(const inventory::Host&, facts::FactGatherer&)>;

/// A concrete, not yet recorded operation: its default name, effective
/// arguments and command generator.
/// Class abbreviation: os
struct OperationSpec {
  std::string sName;
  nlohmann::json jArgs = nlohmann::json::object();
  CommandGenerator fnGenerate;
};

}  // namespace fleet::operations
