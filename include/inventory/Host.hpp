#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fleet::inventory {

/// A target host: identity, group memberships and merged data.
/// Immutable once the inventory is loaded.
/// Class abbreviation: host
class Host {
 public:
  Host(std::string sName, std::vector<std::string> vGroups, nlohmann::json jData);

  const std::string& name() const { return _sName; }
  const std::vector<std::string>& groups() const { return _vGroups; }
  const nlohmann::json& data() const { return _jData; }

  bool inGroup(const std::string& sGroup) const;

  /// Data value for sKey, or jDefault if the key is absent.
  nlohmann::json dataValue(const std::string& sKey,
                           const nlohmann::json& jDefault = nullptr) const;

  /// True when commands for this host run on the local machine.
  bool isLocal() const;

 private:
  std::string _sName;
  std::vector<std::string> _vGroups;
  nlohmann::json _jData;
};

}  // namespace fleet::inventory
