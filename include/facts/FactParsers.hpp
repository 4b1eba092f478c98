#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

/// Parsers turning probe output lines into structured fact values.
/// Each is a pure function, tested against literal fixture text.
namespace fleet::facts::parsers {

/// Integer if sValue is a base-10 integer, otherwise the string itself.
nlohmann::json tryInt(const std::string& sValue);

/// All lines joined with '\n', trailing whitespace trimmed.
nlohmann::json parseText(const std::vector<std::string>& vLines);

/// First non-empty line, or null.
nlohmann::json parseFirstLine(const std::vector<std::string>& vLines);

/// Non-empty lines as a list.
nlohmann::json parseLines(const std::vector<std::string>& vLines);

/// "name -> [versions]" from lines matching sRegex with name and version groups.
/// Names are lower-cased; versions are de-duplicated and sorted.
nlohmann::json parsePackages(const std::string& sRegex, const std::vector<std::string>& vLines);

/// `mount` output -> { path: {device, type, options[]} }.
nlohmann::json parseMounts(const std::vector<std::string>& vLines);

/// /proc/modules -> { name: {size, instances, state, depends[]?} }.
nlohmann::json parseKernelModules(const std::vector<std::string>& vLines);

/// `lsb_release -ca` -> { key: value }, "distributor id" shortened to "id".
nlohmann::json parseLsbRelease(const std::vector<std::string>& vLines);

/// `sysctl -a` -> { key: int | [ints] | string }.
nlohmann::json parseSysctl(const std::vector<std::string>& vLines);

/// /etc/group -> [ group names ].
nlohmann::json parseGroups(const std::vector<std::string>& vLines);

/// `crontab -l` -> { command: {minute, hour, month, day_of_month, day_of_week, comments[]} }.
nlohmann::json parseCrontab(const std::vector<std::string>& vLines);

/// `sestatus` -> { "mode": status-or-null }.
nlohmann::json parseSelinux(const std::vector<std::string>& vLines);

/// `dpkg -I` / `dpkg -s` -> { name, version }.
nlohmann::json parseDebPackage(const std::vector<std::string>& vLines);

extern const char* const kDebPackagesRegex;
extern const char* const kNpmPackagesRegex;

}  // namespace fleet::facts::parsers
