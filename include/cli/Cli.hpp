#pragma once

#include <iosfwd>
#include <memory>

#include <nlohmann/json.hpp>

#include "cli/CliOptions.hpp"
#include "core/DeployContext.hpp"

namespace fleet::common {
struct Config;
}  // namespace fleet::common

namespace fleet::core {
class OperationRecorder;
struct RunResult;
}  // namespace fleet::core

namespace fleet::transport {
class ITransport;
}  // namespace fleet::transport

namespace fleet::cli {

inline constexpr const char* kVersion = "0.4.0";

/// Execute a parsed command line against cfg (overrides already applied).
/// Reports to osOut; errors go to osErr. spTransport replaces the transport
/// built from cfg when given. Returns the process exit code.
int run(const CliOptions& coOpts, const common::Config& cfg, std::ostream& osOut,
        std::ostream& osErr, std::shared_ptr<transport::ITransport> spTransport = nullptr);

void printHelp(std::ostream& os);

/// Inventory data overrides from "key=value" strings; values parse as JSON
/// where possible and are kept as strings otherwise.
nlohmann::json parseDataOverrides(const std::vector<std::string>& vData);

/// Deploy definition for the COMMAND part of the command line.
core::DeployFn resolveCommand(const std::vector<std::string>& vCommand);

/// JSON rendering of a frozen plan.
nlohmann::json planToJson(const core::OperationRecorder& recPlan);

void printResults(const core::RunResult& rrResult, std::ostream& os);

}  // namespace fleet::cli
