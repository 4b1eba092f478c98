#pragma once

#include <optional>
#include <string>
#include <vector>

#include "operations/OperationSpec.hpp"

/// Built-in operations. Each returns an OperationSpec whose generator diffs
/// the host's facts against the desired state.
namespace fleet::operations {

namespace server {

/// Run shell commands unconditionally.
OperationSpec shell(const std::vector<std::string>& vCommands);

/// Ensure a system group exists (or not), based on the "groups" fact.
OperationSpec group(const std::string& sGroup, bool bPresent = true);

}  // namespace server

namespace apt {

/// Ensure deb packages are installed (or removed), based on "deb_packages".
OperationSpec packages(const std::vector<std::string>& vPackages, bool bPresent = true,
                       bool bUpdate = false);

}  // namespace apt

namespace npm {

/// Ensure npm packages are installed (or removed), globally or in sDirectory.
OperationSpec packages(const std::vector<std::string>& vPackages, bool bPresent = true,
                       const std::optional<std::string>& oDirectory = std::nullopt);

}  // namespace npm

}  // namespace fleet::operations
