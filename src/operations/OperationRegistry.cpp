#include "operations/OperationRegistry.hpp"

#include "common/Errors.hpp"
#include "operations/Operations.hpp"

#include <optional>

namespace fleet::operations {

namespace {

/// String or list-of-strings argument.
std::vector<std::string> stringList(const nlohmann::json& jArgs, const std::string& sKey) {
  if (!jArgs.contains(sKey)) {
    throw common::ValidationError("missing_argument", "Missing argument '" + sKey + "'");
  }
  const auto& jValue = jArgs.at(sKey);
  if (jValue.is_string()) {
    return {jValue.get<std::string>()};
  }
  if (jValue.is_array()) {
    std::vector<std::string> vValues;
    for (const auto& jItem : jValue) {
      if (!jItem.is_string()) {
        throw common::ValidationError("invalid_argument",
                                      "Argument '" + sKey + "' must contain strings");
      }
      vValues.push_back(jItem.get<std::string>());
    }
    return vValues;
  }
  throw common::ValidationError("invalid_argument",
                                "Argument '" + sKey + "' must be a string or list");
}

std::string stringArg(const nlohmann::json& jArgs, const std::string& sKey) {
  if (!jArgs.contains(sKey) || !jArgs.at(sKey).is_string()) {
    throw common::ValidationError("missing_argument",
                                  "Argument '" + sKey + "' must be a string");
  }
  return jArgs.at(sKey).get<std::string>();
}

bool boolArg(const nlohmann::json& jArgs, const std::string& sKey, bool bDefault) {
  if (!jArgs.contains(sKey)) return bDefault;
  const auto& jValue = jArgs.at(sKey);
  if (jValue.is_boolean()) return jValue.get<bool>();
  if (jValue.is_string()) {
    const auto s = jValue.get<std::string>();
    return s == "true" || s == "1" || s == "yes";
  }
  throw common::ValidationError("invalid_argument",
                                "Argument '" + sKey + "' must be a boolean");
}

}  // namespace

OperationRegistry::OperationRegistry() = default;
OperationRegistry::~OperationRegistry() = default;

const OperationRegistry& OperationRegistry::builtin() {
  static const OperationRegistry orBuiltin = [] {
    OperationRegistry orr;
    registerBuiltinOperations(orr);
    return orr;
  }();
  return orBuiltin;
}

void OperationRegistry::add(const std::string& sName, Entry entry) {
  _mOperations.insert_or_assign(sName, std::move(entry));
}

bool OperationRegistry::contains(const std::string& sName) const {
  return _mOperations.find(sName) != _mOperations.end();
}

const OperationRegistry::Entry& OperationRegistry::get(const std::string& sName) const {
  auto it = _mOperations.find(sName);
  if (it == _mOperations.end()) {
    throw common::UnknownOperationError("unknown_operation", "No such operation: " + sName);
  }
  return it->second;
}

OperationSpec OperationRegistry::create(const std::string& sName,
                                        const nlohmann::json& jArgs) const {
  const Entry& entry = get(sName);
  const nlohmann::json jEffective = jArgs.is_null() ? nlohmann::json::object() : jArgs;
  if (!jEffective.is_object()) {
    throw common::ValidationError("invalid_argument",
                                  "Arguments for " + sName + " must be an object");
  }
  return entry.fnFactory(jEffective);
}

nlohmann::json OperationRegistry::argsFromCli(const std::string& sName,
                                              const std::vector<std::string>& vTokens) const {
  const Entry& entry = get(sName);
  auto jArgs = nlohmann::json::object();
  size_t uPositional = 0;

  for (const auto& sToken : vTokens) {
    const auto uEq = sToken.find('=');
    if (uEq != std::string::npos && uEq > 0 && sToken.find(' ') > uEq) {
      const std::string sKey = sToken.substr(0, uEq);
      const std::string sValue = sToken.substr(uEq + 1);
      jArgs[sKey] = nlohmann::json::parse(sValue, nullptr, false);
      if (jArgs[sKey].is_discarded()) jArgs[sKey] = sValue;
      continue;
    }

    if (entry.vPositional.empty()) {
      throw common::ValidationError("invalid_argument",
                                    sName + " takes no positional arguments");
    }

    if (uPositional < entry.vPositional.size()) {
      jArgs[entry.vPositional[uPositional++]] = sToken;
      continue;
    }

    auto& jLast = jArgs[entry.vPositional.back()];
    if (!jLast.is_array()) jLast = nlohmann::json::array({jLast});
    jLast.push_back(sToken);
  }

  return jArgs;
}

std::vector<std::string> OperationRegistry::names() const {
  std::vector<std::string> vNames;
  vNames.reserve(_mOperations.size());
  for (const auto& [sName, entry] : _mOperations) vNames.push_back(sName);
  return vNames;
}

void registerBuiltinOperations(OperationRegistry& orRegistry) {
  orRegistry.add("server.shell",
                 {"Run shell commands on the remote host", {"commands"},
                  [](const nlohmann::json& jArgs) {
                    return server::shell(stringList(jArgs, "commands"));
                  }});

  orRegistry.add("server.group",
                 {"Add or remove a system group", {"group"},
                  [](const nlohmann::json& jArgs) {
                    return server::group(stringArg(jArgs, "group"),
                                         boolArg(jArgs, "present", true));
                  }});

  orRegistry.add("apt.packages",
                 {"Install or remove deb packages with apt", {"packages"},
                  [](const nlohmann::json& jArgs) {
                    return apt::packages(stringList(jArgs, "packages"),
                                         boolArg(jArgs, "present", true),
                                         boolArg(jArgs, "update", false));
                  }});

  orRegistry.add("npm.packages",
                 {"Install or remove npm packages", {"packages"},
                  [](const nlohmann::json& jArgs) {
                    std::optional<std::string> oDirectory;
                    if (jArgs.contains("directory")) oDirectory = stringArg(jArgs, "directory");
                    return npm::packages(stringList(jArgs, "packages"),
                                         boolArg(jArgs, "present", true), oDirectory);
                  }});
}

}  // namespace fleet::operations
