#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "operations/OperationSpec.hpp"

namespace fleet::operations {

/// Builds an OperationSpec from JSON keyword arguments.
using OperationFactory = std::function<OperationSpec(const nlohmann::json& jArgs)>;

/// Name ("module.op") -> factory lookup used by deploy files and the CLI.
/// Class abbreviation: orr
class OperationRegistry {
 public:
  struct Entry {
    std::string sDescription;
    std::vector<std::string> vPositional;  // argument names for positional CLI values
    OperationFactory fnFactory;
  };

  OperationRegistry();
  ~OperationRegistry();

  /// Registry pre-populated with the built-in operations.
  static const OperationRegistry& builtin();

  void add(const std::string& sName, Entry entry);

  /// Throws UnknownOperationError for an unknown name and ValidationError
  /// for missing or ill-typed arguments.
  OperationSpec create(const std::string& sName, const nlohmann::json& jArgs) const;

  /// Map CLI tokens onto keyword arguments. "key=value" tokens are keyword
  /// arguments (value parsed as JSON when possible); others fill the
  /// positional names in order, extra values extending the last into a list.
  /// Throws ValidationError for positionals the operation does not take.
  nlohmann::json argsFromCli(const std::string& sName,
                             const std::vector<std::string>& vTokens) const;

  bool contains(const std::string& sName) const;
  const Entry& get(const std::string& sName) const;

  /// Sorted operation names.
  std::vector<std::string> names() const;

 private:
  std::map<std::string, Entry> _mOperations;
};

void registerBuiltinOperations(OperationRegistry& orRegistry);

}  // namespace fleet::operations
