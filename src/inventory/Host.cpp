#include "inventory/Host.hpp"

#include <algorithm>

namespace fleet::inventory {

Host::Host(std::string sName, std::vector<std::string> vGroups, nlohmann::json jData)
    : _sName(std::move(sName)), _vGroups(std::move(vGroups)), _jData(std::move(jData)) {}

bool Host::inGroup(const std::string& sGroup) const {
  return std::find(_vGroups.begin(), _vGroups.end(), sGroup) != _vGroups.end();
}

nlohmann::json Host::dataValue(const std::string& sKey, const nlohmann::json& jDefault) const {
  if (!_jData.is_object()) return jDefault;
  auto it = _jData.find(sKey);
  return it == _jData.end() ? jDefault : *it;
}

bool Host::isLocal() const {
  if (_sName == "@local" || _sName == "localhost") return true;
  const auto jTransport = dataValue("transport");
  return jTransport.is_string() && jTransport.get<std::string>() == "local";
}

}  // namespace fleet::inventory
