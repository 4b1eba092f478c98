#pragma once

#include <map>
#include <string>
#include <vector>

#include "facts/FactDefinition.hpp"

namespace fleet::facts {

/// Name -> FactDefinition lookup.
/// Class abbreviation: fr
class FactRegistry {
 public:
  FactRegistry();
  ~FactRegistry();

  /// Registry pre-populated with the built-in fact library.
  static const FactRegistry& builtin();

  /// Add or replace a fact definition.
  void add(FactDefinition fdFact);

  /// Throws UnknownFactError if sName is not registered.
  const FactDefinition& get(const std::string& sName) const;

  bool contains(const std::string& sName) const;

  /// Sorted fact names.
  std::vector<std::string> names() const;

 private:
  std::map<std::string, FactDefinition> _mFacts;
};

/// Adds every built-in fact to frRegistry.
void registerBuiltinFacts(FactRegistry& frRegistry);

}  // namespace fleet::facts
