#include "facts/FactRegistry.hpp"

#include "common/Errors.hpp"
#include "common/Shell.hpp"
#include "facts/FactParsers.hpp"

#include <optional>

namespace fleet::facts {

namespace {

/// Optional string argument at iIndex of an argument array.
std::optional<std::string> argAt(const nlohmann::json& jArgs, size_t uIndex) {
  if (!jArgs.is_array() || uIndex >= jArgs.size() || jArgs[uIndex].is_null()) {
    return std::nullopt;
  }
  const auto& jArg = jArgs[uIndex];
  return jArg.is_string() ? jArg.get<std::string>() : jArg.dump();
}

std::string requireArg(const nlohmann::json& jArgs, size_t uIndex, const std::string& sFact) {
  auto oArg = argAt(jArgs, uIndex);
  if (!oArg) {
    throw common::ValidationError("missing_fact_argument",
                                  "Fact '" + sFact + "' requires argument " +
                                      std::to_string(uIndex + 1));
  }
  return *oArg;
}

auto staticCommand(std::string sCommand) {
  return [sCommand = std::move(sCommand)](const nlohmann::json&) { return sCommand; };
}

auto requiresTool(std::string sTool) {
  return [sTool = std::move(sTool)](const nlohmann::json&) -> std::optional<std::string> {
    return sTool;
  };
}

nlohmann::json nullDefault() { return nullptr; }
nlohmann::json objectDefault() { return nlohmann::json::object(); }
nlohmann::json arrayDefault() { return nlohmann::json::array(); }

FactDefinition scalarFact(std::string sName, std::string sDescription, std::string sCommand) {
  FactDefinition fd;
  fd.sName = std::move(sName);
  fd.sDescription = std::move(sDescription);
  fd.fnBuildCommand = staticCommand(std::move(sCommand));
  fd.fnParse = parsers::parseText;
  fd.fnDefault = nullDefault;
  return fd;
}

}  // namespace

FactRegistry::FactRegistry() = default;
FactRegistry::~FactRegistry() = default;

const FactRegistry& FactRegistry::builtin() {
  static const FactRegistry frBuiltin = [] {
    FactRegistry fr;
    registerBuiltinFacts(fr);
    return fr;
  }();
  return frBuiltin;
}

void FactRegistry::add(FactDefinition fdFact) {
  std::string sName = fdFact.sName;
  _mFacts.insert_or_assign(std::move(sName), std::move(fdFact));
}

const FactDefinition& FactRegistry::get(const std::string& sName) const {
  auto it = _mFacts.find(sName);
  if (it == _mFacts.end()) {
    throw common::UnknownFactError("unknown_fact", "No such fact: " + sName);
  }
  return it->second;
}

bool FactRegistry::contains(const std::string& sName) const {
  return _mFacts.find(sName) != _mFacts.end();
}

std::vector<std::string> FactRegistry::names() const {
  std::vector<std::string> vNames;
  vNames.reserve(_mFacts.size());
  for (const auto& [sName, fd] : _mFacts) vNames.push_back(sName);
  return vNames;
}

void registerBuiltinFacts(FactRegistry& frRegistry) {
  // ── Server ─────────────────────────────────────────────────────────────
  frRegistry.add(scalarFact("hostname", "Current hostname of the server", "hostname"));
  frRegistry.add(scalarFact("home", "Home directory of the current user", "echo $HOME"));
  frRegistry.add(scalarFact("os", "OS name according to uname", "uname -s"));
  frRegistry.add(scalarFact("os_version", "OS version according to uname", "uname -r"));
  frRegistry.add(scalarFact("arch", "System architecture according to uname", "uname -m"));

  {
    FactDefinition fd;
    fd.sName = "command";
    fd.sDescription = "Raw output of a given command";
    fd.fnBuildCommand = [](const nlohmann::json& jArgs) {
      return requireArg(jArgs, 0, "command");
    };
    fd.fnParse = parsers::parseText;
    fd.fnDefault = nullDefault;
    frRegistry.add(std::move(fd));
  }

  {
    FactDefinition fd;
    fd.sName = "which";
    fd.sDescription = "Path of a given command, if available";
    fd.fnBuildCommand = [](const nlohmann::json& jArgs) {
      return "command -v " + common::shellQuote(requireArg(jArgs, 0, "which"));
    };
    fd.fnParse = parsers::parseFirstLine;
    fd.fnDefault = nullDefault;
    fd.vAbsentExitCodes = {1, 127};
    frRegistry.add(std::move(fd));
  }

  {
    FactDefinition fd;
    fd.sName = "mounts";
    fd.sDescription = "Mounted filesystems by path";
    fd.fnBuildCommand = staticCommand("mount");
    fd.fnParse = parsers::parseMounts;
    fd.fnDefault = objectDefault;
    frRegistry.add(std::move(fd));
  }

  {
    FactDefinition fd;
    fd.sName = "kernel_modules";
    fd.sDescription = "Loaded kernel modules by name";
    fd.fnBuildCommand = staticCommand("cat /proc/modules");
    fd.fnParse = parsers::parseKernelModules;
    fd.fnDefault = objectDefault;
    fd.vAbsentExitCodes = {1};  // no /proc/modules
    frRegistry.add(std::move(fd));
  }

  {
    FactDefinition fd;
    fd.sName = "lsb_release";
    fd.sDescription = "Release information from lsb_release";
    fd.fnBuildCommand = staticCommand("lsb_release -ca");
    fd.fnParse = parsers::parseLsbRelease;
    fd.fnDefault = objectDefault;
    fd.fnRequires = requiresTool("lsb_release");
    frRegistry.add(std::move(fd));
  }

  {
    FactDefinition fd;
    fd.sName = "sysctl";
    fd.sDescription = "Kernel parameters from sysctl";
    fd.fnBuildCommand = staticCommand("sysctl -a");
    fd.fnParse = parsers::parseSysctl;
    fd.fnDefault = objectDefault;
    fd.fnRequires = requiresTool("sysctl");
    frRegistry.add(std::move(fd));
  }

  {
    FactDefinition fd;
    fd.sName = "groups";
    fd.sDescription = "Groups defined on the system";
    fd.fnBuildCommand = staticCommand("cat /etc/group");
    fd.fnParse = parsers::parseGroups;
    fd.fnDefault = arrayDefault;
    frRegistry.add(std::move(fd));
  }

  {
    FactDefinition fd;
    fd.sName = "crontab";
    fd.sDescription = "Cron entries by command, optionally for a given user";
    fd.fnBuildCommand = [](const nlohmann::json& jArgs) {
      auto oUser = argAt(jArgs, 0);
      return oUser ? "crontab -l -u " + common::shellQuote(*oUser) : std::string("crontab -l");
    };
    fd.fnParse = parsers::parseCrontab;
    fd.fnDefault = objectDefault;
    fd.fnRequires = requiresTool("crontab");
    fd.vAbsentExitCodes = {1};  // "no crontab for <user>"
    frRegistry.add(std::move(fd));
  }

  {
    FactDefinition fd;
    fd.sName = "selinux";
    fd.sDescription = "SELinux status";
    fd.fnBuildCommand = staticCommand("sestatus");
    fd.fnParse = parsers::parseSelinux;
    fd.fnDefault = [] { return nlohmann::json{{"mode", nullptr}}; };
    fd.fnRequires = requiresTool("sestatus");
    frRegistry.add(std::move(fd));
  }

  // ── Packages ───────────────────────────────────────────────────────────
  {
    FactDefinition fd;
    fd.sName = "deb_packages";
    fd.sDescription = "Installed dpkg packages: name -> [versions]";
    fd.fnBuildCommand = staticCommand("dpkg -l");
    fd.fnParse = [](const std::vector<std::string>& vLines) {
      return parsers::parsePackages(parsers::kDebPackagesRegex, vLines);
    };
    fd.fnDefault = objectDefault;
    fd.fnRequires = requiresTool("dpkg");
    frRegistry.add(std::move(fd));
  }

  {
    FactDefinition fd;
    fd.sName = "deb_package";
    fd.sDescription = "Name and version of a .deb archive or installed package";
    fd.fnBuildCommand = [](const nlohmann::json& jArgs) {
      const std::string sTarget = common::shellQuote(requireArg(jArgs, 0, "deb_package"));
      return "dpkg -I " + sTarget + " 2> /dev/null || dpkg -s " + sTarget;
    };
    fd.fnParse = parsers::parseDebPackage;
    fd.fnDefault = objectDefault;
    fd.fnRequires = requiresTool("dpkg");
    fd.vAbsentExitCodes = {1};  // not installed
    frRegistry.add(std::move(fd));
  }

  {
    FactDefinition fd;
    fd.sName = "npm_packages";
    fd.sDescription = "Globally installed npm packages, or those in a directory";
    fd.fnBuildCommand = [](const nlohmann::json& jArgs) {
      auto oDirectory = argAt(jArgs, 0);
      return oDirectory ? "cd " + common::shellQuote(*oDirectory) + " && npm list -g --depth=0"
                        : std::string("npm list -g --depth=0");
    };
    fd.fnParse = [](const std::vector<std::string>& vLines) {
      return parsers::parsePackages(parsers::kNpmPackagesRegex, vLines);
    };
    fd.fnDefault = objectDefault;
    fd.fnRequires = requiresTool("npm");
    frRegistry.add(std::move(fd));
  }
}

}  // namespace fleet::facts
