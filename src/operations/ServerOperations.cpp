#include "operations/Operations.hpp"

#include "common/Shell.hpp"
#include "facts/FactGatherer.hpp"
#include "inventory/Host.hpp"

#include <algorithm>

namespace fleet::operations::server {

OperationSpec shell(const std::vector<std::string>& vCommands) {
  OperationSpec osSpec;
  osSpec.sName = "server.shell";
  osSpec.jArgs = {{"commands", vCommands}};
  osSpec.fnGenerate = [vCommands](const inventory::Host&, facts::FactGatherer&) {
    return vCommands;
  };
  return osSpec;
}

OperationSpec group(const std::string& sGroup, bool bPresent) {
  OperationSpec osSpec;
  osSpec.sName = "server.group";
  osSpec.jArgs = {{"group", sGroup}, {"present", bPresent}};
  osSpec.fnGenerate = [sGroup, bPresent](const inventory::Host& host,
                                         facts::FactGatherer& fgFacts) {
    const auto jGroups = fgFacts.getFact(host, "groups");
    const bool bExists =
        std::find(jGroups.begin(), jGroups.end(), nlohmann::json(sGroup)) != jGroups.end();

    std::vector<std::string> vCommands;
    if (bPresent && !bExists) {
      vCommands.push_back("groupadd " + common::shellQuote(sGroup));
    } else if (!bPresent && bExists) {
      vCommands.push_back("groupdel " + common::shellQuote(sGroup));
    }
    return vCommands;
  };
  return osSpec;
}

}  // namespace fleet::operations::server
