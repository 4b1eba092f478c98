#include "operations/Operations.hpp"

#include "common/Shell.hpp"
#include "facts/FactGatherer.hpp"
#include "inventory/Host.hpp"

namespace fleet::operations {

namespace {

/// Packages from vWanted whose installed state differs from bPresent.
std::vector<std::string> packagesToChange(const std::vector<std::string>& vWanted,
                                          const nlohmann::json& jInstalled, bool bPresent) {
  std::vector<std::string> vChange;
  for (const auto& sPackage : vWanted) {
    const bool bInstalled = jInstalled.is_object() && jInstalled.contains(sPackage);
    if (bInstalled != bPresent) vChange.push_back(sPackage);
  }
  return vChange;
}

std::string joinQuoted(const std::vector<std::string>& vItems) {
  std::string sJoined;
  for (const auto& sItem : vItems) {
    if (!sJoined.empty()) sJoined += ' ';
    sJoined += common::shellQuote(sItem);
  }
  return sJoined;
}

}  // namespace

namespace apt {

OperationSpec packages(const std::vector<std::string>& vPackages, bool bPresent, bool bUpdate) {
  OperationSpec osSpec;
  osSpec.sName = "apt.packages";
  osSpec.jArgs = {{"packages", vPackages}, {"present", bPresent}, {"update", bUpdate}};
  osSpec.fnGenerate = [vPackages, bPresent, bUpdate](const inventory::Host& host,
                                                     facts::FactGatherer& fgFacts) {
    const auto vChange = packagesToChange(vPackages, fgFacts.getFact(host, "deb_packages"),
                                          bPresent);
    std::vector<std::string> vCommands;
    if (vChange.empty()) return vCommands;

    if (bPresent) {
      if (bUpdate) vCommands.push_back("apt-get update");
      vCommands.push_back("DEBIAN_FRONTEND=noninteractive apt-get install -y " +
                          joinQuoted(vChange));
    } else {
      vCommands.push_back("DEBIAN_FRONTEND=noninteractive apt-get remove -y " +
                          joinQuoted(vChange));
    }
    return vCommands;
  };
  return osSpec;
}

}  // namespace apt

namespace npm {

OperationSpec packages(const std::vector<std::string>& vPackages, bool bPresent,
                       const std::optional<std::string>& oDirectory) {
  OperationSpec osSpec;
  osSpec.sName = "npm.packages";
  osSpec.jArgs = {{"packages", vPackages}, {"present", bPresent}};
  if (oDirectory) osSpec.jArgs["directory"] = *oDirectory;

  osSpec.fnGenerate = [vPackages, bPresent, oDirectory](const inventory::Host& host,
                                                        facts::FactGatherer& fgFacts) {
    const nlohmann::json jArgs =
        oDirectory ? nlohmann::json::array({*oDirectory}) : nlohmann::json::array();
    const auto vChange =
        packagesToChange(vPackages, fgFacts.getFact(host, "npm_packages", jArgs), bPresent);

    std::vector<std::string> vCommands;
    if (vChange.empty()) return vCommands;

    const std::string sVerb = bPresent ? "install" : "uninstall";
    if (oDirectory) {
      vCommands.push_back("cd " + common::shellQuote(*oDirectory) + " && npm " + sVerb + " " +
                          joinQuoted(vChange));
    } else {
      vCommands.push_back("npm " + sVerb + " -g " + joinQuoted(vChange));
    }
    return vCommands;
  };
  return osSpec;
}

}  // namespace npm

}  // namespace fleet::operations
