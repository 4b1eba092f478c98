#include "inventory/Inventory.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fleet::inventory {

namespace {

/// Shallow merge: top-level keys of jSource replace those in jTarget.
void mergeData(nlohmann::json& jTarget, const nlohmann::ordered_json& jSource) {
  if (!jSource.is_object()) return;
  for (auto it = jSource.begin(); it != jSource.end(); ++it) {
    jTarget[it.key()] = nlohmann::json::parse(it.value().dump());
  }
}

void mergeData(nlohmann::json& jTarget, const nlohmann::json& jSource) {
  if (!jSource.is_object()) return;
  for (auto it = jSource.begin(); it != jSource.end(); ++it) {
    jTarget[it.key()] = it.value();
  }
}

std::vector<std::string> splitPatterns(const std::string& sPatterns) {
  std::vector<std::string> vResult;
  std::stringstream ss(sPatterns);
  std::string sItem;
  while (std::getline(ss, sItem, ',')) {
    sItem.erase(0, sItem.find_first_not_of(" \t"));
    sItem.erase(sItem.find_last_not_of(" \t") + 1);
    if (!sItem.empty()) vResult.push_back(sItem);
  }
  return vResult;
}

}  // namespace

Inventory::Inventory(std::vector<HostPtr> vHosts,
                     std::vector<std::pair<std::string, std::vector<std::string>>> vGroups)
    : _vHosts(std::move(vHosts)), _vGroups(std::move(vGroups)) {}

Inventory Inventory::load(const std::string& sPath, const nlohmann::json& jOverrides) {
  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    throw common::DefinitionError("inventory_unreadable", "No inventory file: `" + sPath + "`");
  }

  nlohmann::ordered_json jDoc;
  try {
    jDoc = nlohmann::ordered_json::parse(ifs);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::DefinitionError("inventory_malformed",
                                  "Invalid inventory file `" + sPath + "`: " + ex.what());
  }

  return fromJson(jDoc, jOverrides);
}

Inventory Inventory::fromJson(const nlohmann::ordered_json& jDoc, const nlohmann::json& jOverrides) {
  if (!jDoc.is_object()) {
    throw common::DefinitionError("inventory_malformed", "Inventory must be a JSON object");
  }

  // Host declaration order: explicit "hosts" first, then hosts only named by groups
  std::vector<std::string> vOrder;
  std::set<std::string> setSeen;
  auto addName = [&](const std::string& sName) {
    if (setSeen.insert(sName).second) vOrder.push_back(sName);
  };

  nlohmann::ordered_json jHostData = nlohmann::ordered_json::object();
  if (jDoc.contains("hosts")) {
    const auto& jHosts = jDoc.at("hosts");
    if (jHosts.is_array()) {
      for (const auto& jName : jHosts) {
        if (!jName.is_string()) {
          throw common::DefinitionError("inventory_malformed", "Host names must be strings");
        }
        addName(jName.get<std::string>());
      }
    } else if (jHosts.is_object()) {
      for (auto it = jHosts.begin(); it != jHosts.end(); ++it) {
        if (!it.value().is_object() && !it.value().is_null()) {
          throw common::DefinitionError("inventory_malformed",
                                        "Data for host '" + it.key() + "' must be an object");
        }
        addName(it.key());
        if (it.value().is_object()) jHostData[it.key()] = it.value();
      }
    } else {
      throw common::DefinitionError("inventory_malformed", "'hosts' must be an array or object");
    }
  }

  std::vector<std::pair<std::string, std::vector<std::string>>> vGroups;
  std::vector<std::pair<std::string, nlohmann::ordered_json>> vGroupData;
  if (jDoc.contains("groups")) {
    const auto& jGroups = jDoc.at("groups");
    if (!jGroups.is_object()) {
      throw common::DefinitionError("inventory_malformed", "'groups' must be an object");
    }
    for (auto it = jGroups.begin(); it != jGroups.end(); ++it) {
      const auto& jGroup = it.value();
      std::vector<std::string> vMembers;
      nlohmann::ordered_json jData = nlohmann::ordered_json::object();
      const nlohmann::ordered_json* pMembers = &jGroup;
      if (jGroup.is_object()) {
        if (!jGroup.contains("hosts")) {
          throw common::DefinitionError("inventory_malformed",
                                        "Group '" + it.key() + "' has no 'hosts'");
        }
        pMembers = &jGroup.at("hosts");
        if (jGroup.contains("data")) jData = jGroup.at("data");
      }
      if (!pMembers->is_array()) {
        throw common::DefinitionError("inventory_malformed",
                                      "Hosts of group '" + it.key() + "' must be an array");
      }
      for (const auto& jName : *pMembers) {
        if (!jName.is_string()) {
          throw common::DefinitionError("inventory_malformed", "Host names must be strings");
        }
        vMembers.push_back(jName.get<std::string>());
        addName(vMembers.back());
      }
      vGroups.emplace_back(it.key(), vMembers);
      vGroupData.emplace_back(it.key(), jData);
    }
  }

  const nlohmann::ordered_json jGlobal =
      jDoc.contains("data") ? jDoc.at("data") : nlohmann::ordered_json::object();

  std::vector<HostPtr> vHosts;
  vHosts.reserve(vOrder.size());
  for (const auto& sName : vOrder) {
    std::vector<std::string> vHostGroups;
    nlohmann::json jData = nlohmann::json::object();
    mergeData(jData, jGlobal);
    for (size_t i = 0; i < vGroups.size(); ++i) {
      const auto& vMembers = vGroups[i].second;
      if (std::find(vMembers.begin(), vMembers.end(), sName) != vMembers.end()) {
        vHostGroups.push_back(vGroups[i].first);
        mergeData(jData, vGroupData[i].second);
      }
    }
    if (jHostData.contains(sName)) mergeData(jData, jHostData.at(sName));
    mergeData(jData, jOverrides);
    vHosts.push_back(std::make_shared<const Host>(sName, std::move(vHostGroups), std::move(jData)));
  }

  common::Logger::get()->debug("Loaded inventory: {} hosts, {} groups", vHosts.size(),
                               vGroups.size());
  return Inventory(std::move(vHosts), std::move(vGroups));
}

Inventory Inventory::fromSpec(const std::string& sSpec, const nlohmann::json& jOverrides) {
  if (sSpec.empty()) {
    throw common::DefinitionError("inventory_empty", "No inventory given");
  }

  std::error_code ec;
  if (std::filesystem::is_regular_file(sSpec, ec)) {
    return load(sSpec, jOverrides);
  }
  if (sSpec.ends_with(".json")) {
    throw common::DefinitionError("inventory_unreadable", "No inventory file: `" + sSpec + "`");
  }

  nlohmann::ordered_json jDoc = {{"hosts", nlohmann::ordered_json::array()}};
  for (const auto& sName : splitPatterns(sSpec)) {
    jDoc["hosts"].push_back(sName);
  }
  return fromJson(jDoc, jOverrides);
}

Inventory Inventory::limit(const std::string& sPatterns) const {
  return limit(splitPatterns(sPatterns));
}

Inventory Inventory::limit(const std::vector<std::string>& vPatterns) const {
  std::vector<HostPtr> vSelected;
  for (const auto& spHost : _vHosts) {
    const bool bMatch = std::any_of(vPatterns.begin(), vPatterns.end(), [&](const auto& sPattern) {
      return spHost->inGroup(sPattern) ||
             fnmatch(sPattern.c_str(), spHost->name().c_str(), 0) == 0;
    });
    if (bMatch) vSelected.push_back(spHost);
  }
  return Inventory(std::move(vSelected), _vGroups);
}

HostPtr Inventory::get(const std::string& sName) const {
  auto it = std::find_if(_vHosts.begin(), _vHosts.end(),
                         [&](const HostPtr& spHost) { return spHost->name() == sName; });
  return it == _vHosts.end() ? nullptr : *it;
}

std::vector<std::string> Inventory::hostNames() const {
  std::vector<std::string> vNames;
  vNames.reserve(_vHosts.size());
  for (const auto& spHost : _vHosts) vNames.push_back(spHost->name());
  return vNames;
}

}  // namespace fleet::inventory
