#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "inventory/Host.hpp"

namespace fleet::inventory {

using HostPtr = std::shared_ptr<const Host>;

/// Ordered collection of hosts plus group definitions.
/// Subsets produced by limit() share Host objects with their parent.
/// Class abbreviation: inv
class Inventory {
 public:
  Inventory() = default;
  Inventory(std::vector<HostPtr> vHosts,
            std::vector<std::pair<std::string, std::vector<std::string>>> vGroups);

  /// Load a JSON inventory file. Data precedence: global < group < host < jOverrides.
  /// Throws DefinitionError if the file is missing, unreadable or malformed.
  static Inventory load(const std::string& sPath, const nlohmann::json& jOverrides = {});

  /// Build from an inventory file, "@local", or a comma-separated host list.
  static Inventory fromSpec(const std::string& sSpec, const nlohmann::json& jOverrides = {});

  /// Build from an already-parsed JSON document (same shape as load()).
  static Inventory fromJson(const nlohmann::ordered_json& jDoc,
                            const nlohmann::json& jOverrides = {});

  /// Hosts matching any comma-separated name glob or group name, in inventory order.
  /// An empty match is not an error.
  Inventory limit(const std::string& sPatterns) const;
  Inventory limit(const std::vector<std::string>& vPatterns) const;

  /// Host by exact name, or nullptr.
  HostPtr get(const std::string& sName) const;
  bool contains(const std::string& sName) const { return get(sName) != nullptr; }

  const std::vector<HostPtr>& hosts() const { return _vHosts; }
  std::vector<std::string> hostNames() const;
  const std::vector<std::pair<std::string, std::vector<std::string>>>& groups() const {
    return _vGroups;
  }

  size_t size() const { return _vHosts.size(); }
  bool empty() const { return _vHosts.empty(); }
  auto begin() const { return _vHosts.begin(); }
  auto end() const { return _vHosts.end(); }

 private:
  std::vector<HostPtr> _vHosts;
  std::vector<std::pair<std::string, std::vector<std::string>>> _vGroups;
};

}  // namespace fleet::inventory
