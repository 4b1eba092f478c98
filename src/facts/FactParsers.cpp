#include "facts/FactParsers.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <set>

namespace fleet::facts::parsers {

const char* const kDebPackagesRegex =
    R"(^ii\s+([a-zA-Z0-9\+\-\.]+):?[a-zA-Z0-9]*\s+([a-zA-Z0-9:~\.\-\+]+).+$)";
const char* const kNpmPackagesRegex = R"(^(?:└|├)──\s([a-zA-Z0-9\-]+)@([0-9\.]+)$)";

namespace {

std::string trim(const std::string& s) {
  const auto uStart = s.find_first_not_of(" \t\r\n");
  if (uStart == std::string::npos) return {};
  const auto uEnd = s.find_last_not_of(" \t\r\n");
  return s.substr(uStart, uEnd - uStart + 1);
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

/// Split on cSep into at most uMaxSplits + 1 parts (like Python's str.split(sep, n)).
std::vector<std::string> splitN(const std::string& s, char cSep, size_t uMaxSplits) {
  std::vector<std::string> vParts;
  size_t uStart = 0;
  while (vParts.size() < uMaxSplits) {
    const auto uPos = s.find(cSep, uStart);
    if (uPos == std::string::npos) break;
    vParts.push_back(s.substr(uStart, uPos - uStart));
    uStart = uPos + 1;
  }
  vParts.push_back(s.substr(uStart));
  return vParts;
}

std::vector<std::string> split(const std::string& s, char cSep) {
  return splitN(s, cSep, std::string::npos);
}

std::vector<std::string> splitWhitespace(const std::string& s) {
  std::vector<std::string> vParts;
  std::string sCurrent;
  for (char c : s) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!sCurrent.empty()) vParts.push_back(std::move(sCurrent));
      sCurrent.clear();
    } else {
      sCurrent += c;
    }
  }
  if (!sCurrent.empty()) vParts.push_back(std::move(sCurrent));
  return vParts;
}

}  // namespace

nlohmann::json tryInt(const std::string& sValue) {
  static const std::regex rxInt(R"(^-?[0-9]+$)");
  if (std::regex_match(sValue, rxInt)) {
    try {
      return std::stoll(sValue);
    } catch (const std::out_of_range&) {
      return sValue;
    }
  }
  return sValue;
}

nlohmann::json parseText(const std::vector<std::string>& vLines) {
  std::string sText;
  for (const auto& sLine : vLines) {
    if (!sText.empty()) sText += '\n';
    sText += sLine;
  }
  return trim(sText);
}

nlohmann::json parseFirstLine(const std::vector<std::string>& vLines) {
  for (const auto& sLine : vLines) {
    auto sTrimmed = trim(sLine);
    if (!sTrimmed.empty()) return sTrimmed;
  }
  return nullptr;
}

nlohmann::json parseLines(const std::vector<std::string>& vLines) {
  auto jLines = nlohmann::json::array();
  for (const auto& sLine : vLines) {
    if (!trim(sLine).empty()) jLines.push_back(sLine);
  }
  return jLines;
}

nlohmann::json parsePackages(const std::string& sRegex, const std::vector<std::string>& vLines) {
  const std::regex rxPackage(sRegex);
  std::map<std::string, std::set<std::string>> mPackages;

  for (const auto& sLine : vLines) {
    std::smatch match;
    if (std::regex_match(sLine, match, rxPackage)) {
      mPackages[toLower(match[1].str())].insert(match[2].str());
    }
  }

  auto jPackages = nlohmann::json::object();
  for (const auto& [sName, setVersions] : mPackages) {
    jPackages[sName] = std::vector<std::string>(setVersions.begin(), setVersions.end());
  }
  return jPackages;
}

nlohmann::json parseMounts(const std::vector<std::string>& vLines) {
  auto jDevices = nlohmann::json::object();

  for (std::string sLine : vLines) {
    bool bIsMap = false;
    if (sLine.rfind("map ", 0) == 0) {
      sLine = sLine.substr(4);
      bIsMap = true;
    }

    auto vParts = splitN(sLine, ' ', 3);
    if (vParts.size() < 4) continue;

    std::string sDevice = bIsMap ? "map " + vParts[0] : vParts[0];
    const std::string& sPath = vParts[2];
    const std::string& sOther = vParts[3];

    std::string sType;
    std::vector<std::string> vOptions;
    auto stripParens = [](std::string s) {
      s = trim(s);
      if (!s.empty() && s.front() == '(') s.erase(0, 1);
      if (!s.empty() && s.back() == ')') s.pop_back();
      return s;
    };

    if (sOther.rfind("type", 0) == 0) {
      auto vTypeParts = splitN(sOther, ' ', 2);
      if (vTypeParts.size() < 3) continue;
      sType = vTypeParts[1];
      vOptions = split(stripParens(vTypeParts[2]), ',');
    } else {
      vOptions = split(stripParens(sOther), ',');
      sType = trim(vOptions.front());
      vOptions.erase(vOptions.begin());
    }

    auto jOptions = nlohmann::json::array();
    for (const auto& sOption : vOptions) jOptions.push_back(trim(sOption));

    jDevices[sPath] = {{"device", sDevice}, {"type", sType}, {"options", jOptions}};
  }

  return jDevices;
}

nlohmann::json parseKernelModules(const std::vector<std::string>& vLines) {
  auto jModules = nlohmann::json::object();

  for (const auto& sLine : vLines) {
    auto vParts = splitN(sLine, ' ', 5);
    if (vParts.size() < 5) continue;

    nlohmann::json jModule = {
        {"size", tryInt(vParts[1])},
        {"instances", tryInt(vParts[2])},
        {"state", vParts[4]},
    };

    if (vParts[3] != "-") {
      auto jDepends = nlohmann::json::array();
      for (const auto& sDep : split(vParts[3], ',')) {
        if (!sDep.empty()) jDepends.push_back(sDep);
      }
      jModule["depends"] = jDepends;
    }

    jModules[vParts[0]] = jModule;
  }

  return jModules;
}

nlohmann::json parseLsbRelease(const std::vector<std::string>& vLines) {
  auto jItems = nlohmann::json::object();

  for (const auto& sLine : vLines) {
    const auto uColon = sLine.find(':');
    if (uColon == std::string::npos) continue;

    std::string sKey = toLower(trim(sLine.substr(0, uColon)));
    const auto uSpace = sKey.rfind(' ');
    if (uSpace != std::string::npos) {
      sKey = sKey.substr(uSpace + 1);  // "distributor id" -> "id"
    }
    jItems[sKey] = trim(sLine.substr(uColon + 1));
  }

  return jItems;
}

nlohmann::json parseSysctl(const std::vector<std::string>& vLines) {
  static const std::regex rxSimple(R"(^[a-zA-Z0-9_\.\s]+$)");
  auto jSysctls = nlohmann::json::object();

  for (const auto& sLine : vLines) {
    auto uSep = sLine.find('=');
    if (uSep == std::string::npos) uSep = sLine.find(':');
    if (uSep == std::string::npos) continue;

    const std::string sKey = trim(sLine.substr(0, uSep));
    const std::string sValues = trim(sLine.substr(uSep + 1));
    if (sKey.empty() || sValues.empty()) continue;

    if (std::regex_match(sValues, rxSimple)) {
      auto jValues = nlohmann::json::array();
      for (const auto& sItem : splitWhitespace(sValues)) jValues.push_back(tryInt(sItem));
      jSysctls[sKey] = jValues.size() == 1 ? jValues[0] : jValues;
    } else {
      jSysctls[sKey] = sValues;
    }
  }

  return jSysctls;
}

nlohmann::json parseGroups(const std::vector<std::string>& vLines) {
  auto jGroups = nlohmann::json::array();
  for (const auto& sLine : vLines) {
    const auto uColon = sLine.find(':');
    if (uColon != std::string::npos) jGroups.push_back(sLine.substr(0, uColon));
  }
  return jGroups;
}

nlohmann::json parseCrontab(const std::vector<std::string>& vLines) {
  auto jCrons = nlohmann::json::object();
  auto jComments = nlohmann::json::array();

  for (const auto& sRaw : vLines) {
    const std::string sLine = trim(sRaw);
    if (sLine.empty()) continue;
    if (sLine.front() == '#') {
      jComments.push_back(sLine);
      continue;
    }

    auto vParts = splitN(sLine, ' ', 5);
    if (vParts.size() < 6) continue;

    jCrons[vParts[5]] = {
        {"minute", tryInt(vParts[0])},
        {"hour", tryInt(vParts[1])},
        {"day_of_month", tryInt(vParts[2])},
        {"month", tryInt(vParts[3])},
        {"day_of_week", tryInt(vParts[4])},
        {"comments", jComments},
    };
    jComments = nlohmann::json::array();
  }

  return jCrons;
}

nlohmann::json parseSelinux(const std::vector<std::string>& vLines) {
  nlohmann::json jInfo = {{"mode", nullptr}};
  if (vLines.empty()) return jInfo;

  static const std::regex rxStatus(R"(^SELinux status:\s+(\S+))");
  std::smatch match;
  if (std::regex_search(vLines.front(), match, rxStatus)) {
    jInfo["mode"] = match[1].str();
  }
  return jInfo;
}

nlohmann::json parseDebPackage(const std::vector<std::string>& vLines) {
  static const std::vector<std::pair<std::string, std::regex>> vRegexes = {
      {"name", std::regex(R"(^Package: ([a-zA-Z0-9\-]+)$)")},
      {"version", std::regex(R"(^Version: ([0-9\:\.\-]+)$)")},
  };

  auto jData = nlohmann::json::object();
  for (const auto& sRaw : vLines) {
    const std::string sLine = trim(sRaw);
    for (const auto& [sKey, rx] : vRegexes) {
      std::smatch match;
      if (std::regex_match(sLine, match, rx)) {
        jData[sKey] = match[1].str();
        break;
      }
    }
  }
  return jData;
}

}  // namespace fleet::facts::parsers
