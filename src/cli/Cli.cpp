#include "cli/Cli.hpp"

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/DeployLoader.hpp"
#include "core/ExecutionEngine.hpp"
#include "core/OperationRecorder.hpp"
#include "facts/FactGatherer.hpp"
#include "facts/FactRegistry.hpp"
#include "inventory/Inventory.hpp"
#include "operations/OperationRegistry.hpp"
#include "operations/Operations.hpp"
#include "transport/TransportFactory.hpp"

#include <algorithm>
#include <filesystem>
#include <ostream>

namespace fleet::cli {

namespace {

constexpr const char* kAdHocSite = "cli#0";

std::string joinTokens(const std::vector<std::string>& vTokens, size_t uFrom) {
  std::string sOut;
  for (size_t i = uFrom; i < vTokens.size(); ++i) {
    if (!sOut.empty()) sOut += ' ';
    sOut += vTokens[i];
  }
  return sOut;
}

// "server.teleport": the module exists but the operation does not
bool namesUnknownOperation(const operations::OperationRegistry& orRegistry,
                           const std::string& sToken) {
  const auto uDot = sToken.find('.');
  if (uDot == std::string::npos || uDot == 0) return false;
  std::error_code ec;
  if (std::filesystem::exists(sToken, ec)) return false;

  const std::string sModule = sToken.substr(0, uDot + 1);
  const auto vNames = orRegistry.names();
  return std::any_of(vNames.begin(), vNames.end(),
                     [&](const std::string& sName) { return sName.starts_with(sModule); });
}

int runFactCommand(const CliOptions& coOpts, const inventory::Inventory& invActive,
                   facts::FactGatherer& fgFacts, size_t uParallel, std::ostream& osOut) {
  if (coOpts.vCommand.size() < 2) {
    throw common::ValidationError("missing_argument", "Usage: fact NAME [ARGS...]");
  }

  const std::string& sFact = coOpts.vCommand[1];
  if (!facts::FactRegistry::builtin().contains(sFact)) {
    throw common::UnknownFactError("unknown_fact", "No such fact: " + sFact);
  }

  nlohmann::json jArgs = nlohmann::json::array();
  for (size_t i = 2; i < coOpts.vCommand.size(); ++i) jArgs.push_back(coOpts.vCommand[i]);

  const auto mValues = fgFacts.getFacts(invActive.hosts(), sFact, jArgs, uParallel,
                                         facts::FactGatherer::OnFailure::MapToNull);
  nlohmann::json jOut = nlohmann::json::object();
  for (const auto& [sHost, jValue] : mValues) jOut[sHost] = jValue;
  osOut << jOut.dump(2) << "\n";
  return 0;
}

}  // namespace

// ── Help and listings ─────────────────────────────────────────────────────

void printHelp(std::ostream& os) {
  os << "Usage: fleet-orchestrator [OPTIONS] INVENTORY COMMAND...\n"
        "\n"
        "INVENTORY  JSON inventory file, @local, or comma-separated host names\n"
        "COMMAND    deploy file | fact NAME [ARGS...] | exec -- CMD... | module.op ARGS...\n"
        "\n"
        "Options:\n"
        "  --parallel N        Number of hosts to operate on at once\n"
        "  --serial            Run operations host by host\n"
        "  --fail-percent N    Tolerated percentage of failed hosts per operation\n"
        "  --limit PATTERN     Restrict execution to matching hosts or groups\n"
        "  --no-wait           Keep executing hosts after the fail threshold is hit\n"
        "  --dry               Report what would change without changing anything\n"
        "  --data KEY=VALUE    Override inventory data (repeatable)\n"
        "  --user USER         SSH user\n"
        "  --port PORT         SSH port\n"
        "  --key PATH          SSH private key\n"
        "  -v                  Verbose logging\n"
        "  --debug             Trace logging\n"
        "  --debug-data        Print inventory data and exit\n"
        "  --debug-facts       Print gathered facts after planning and exit\n"
        "  --debug-operations  Print the operation plan and exit\n"
        "  --facts             List available facts\n"
        "  --operations        List available operations\n"
        "  --version           Print version\n"
        "  -h, --help          Show this message\n";
}

// ── Command resolution ────────────────────────────────────────────────────

nlohmann::json parseDataOverrides(const std::vector<std::string>& vData) {
  nlohmann::json jOverrides = nlohmann::json::object();
  for (const auto& sItem : vData) {
    const auto uEq = sItem.find('=');
    if (uEq == std::string::npos || uEq == 0) {
      throw common::ValidationError("invalid_option",
                                    "--data expects key=value, got '" + sItem + "'");
    }
    const std::string sKey = sItem.substr(0, uEq);
    const std::string sValue = sItem.substr(uEq + 1);
    auto jValue = nlohmann::json::parse(sValue, nullptr, /*allow_exceptions=*/false);
    jOverrides[sKey] = jValue.is_discarded() ? nlohmann::json(sValue) : jValue;
  }
  return jOverrides;
}

core::DeployFn resolveCommand(const std::vector<std::string>& vCommand) {
  if (vCommand.empty()) {
    throw common::ValidationError("missing_argument", "Missing argument 'COMMAND'");
  }

  const auto& orRegistry = operations::OperationRegistry::builtin();
  const std::string& sHead = vCommand.front();

  if (sHead == "exec") {
    const size_t uFrom = (vCommand.size() > 1 && vCommand[1] == "--") ? 2 : 1;
    const std::string sCommand = joinTokens(vCommand, uFrom);
    if (sCommand.empty()) {
      throw common::ValidationError("missing_argument", "Usage: exec -- COMMAND...");
    }
    auto osSpec = operations::server::shell({sCommand});
    return [osSpec](core::DeployContext& ctx) { ctx.operationAt(kAdHocSite, osSpec); };
  }

  if (orRegistry.contains(sHead)) {
    const std::vector<std::string> vTokens(vCommand.begin() + 1, vCommand.end());
    auto osSpec = orRegistry.create(sHead, orRegistry.argsFromCli(sHead, vTokens));
    return [osSpec](core::DeployContext& ctx) { ctx.operationAt(kAdHocSite, osSpec); };
  }

  if (namesUnknownOperation(orRegistry, sHead)) {
    throw common::UnknownOperationError("unknown_operation", "No such operation: " + sHead);
  }
  if (vCommand.size() > 1) {
    throw common::ValidationError("invalid_argument",
                                  "Unexpected arguments after deploy file " + sHead);
  }

  // Anything else names a deploy file; load() reports it missing
  core::DeployLoader dlLoader(orRegistry);
  return dlLoader.load(sHead);
}

// ── Output ────────────────────────────────────────────────────────────────

nlohmann::json planToJson(const core::OperationRecorder& recPlan) {
  nlohmann::json jOps = nlohmann::json::array();
  for (const auto& sHash : recPlan.opOrder()) {
    const auto& omMeta = recPlan.opMeta(sHash);
    jOps.push_back({{"hash", sHash},
                    {"order", omMeta.uOrder},
                    {"names", omMeta.vNameStack},
                    {"hosts", omMeta.setHosts}});
  }

  nlohmann::json jHosts = nlohmann::json::object();
  for (const auto& [sHost, vHashes] : recPlan.plan().mHostOps) jHosts[sHost] = vHashes;

  return {{"operations", jOps}, {"hosts", jHosts}};
}

void printResults(const core::RunResult& rrResult, std::ostream& os) {
  for (const auto& oprResult : rrResult.vOperations) {
    size_t uChanged = 0;
    size_t uNoChange = 0;
    size_t uWould = 0;
    size_t uCancelled = 0;
    for (const auto& hrHost : oprResult.vHosts) {
      switch (hrHost.outcome) {
        case common::HostOutcome::Changed: ++uChanged; break;
        case common::HostOutcome::NoChange: ++uNoChange; break;
        case common::HostOutcome::WouldChange: ++uWould; break;
        case common::HostOutcome::Cancelled: ++uCancelled; break;
        case common::HostOutcome::Failed: break;
      }
    }

    os << "--> " << oprResult.sName << ": changed=" << uChanged << " no_change=" << uNoChange;
    if (uWould > 0) os << " would_change=" << uWould;
    os << " failed=" << oprResult.uFailed;
    if (uCancelled > 0) os << " cancelled=" << uCancelled;
    os << "\n";

    for (const auto& hrHost : oprResult.vHosts) {
      if (hrHost.outcome == common::HostOutcome::Failed) {
        os << "    [" << hrHost.sHost << "] failed: " << hrHost.sError << "\n";
      }
    }
  }

  os << "--> Results:\n";
  for (const auto& [sHost, hsSummary] : rrResult.hostSummaries()) {
    os << "    " << sHost << ": changed=" << hsSummary.uChanged
       << " no_change=" << hsSummary.uNoChange << " failed=" << hsSummary.uFailed << "\n";
  }

  if (rrResult.state == common::EngineState::Aborted) {
    os << "--> Aborted: " << rrResult.sAbortReason << "\n";
  }
}

// ── Entry point ───────────────────────────────────────────────────────────

int run(const CliOptions& coOpts, const common::Config& cfg, std::ostream& osOut,
        std::ostream& osErr, std::shared_ptr<transport::ITransport> spTransport) {
  auto spLog = common::Logger::get();

  try {
    if (coOpts.bHelp) {
      printHelp(osOut);
      return 0;
    }
    if (coOpts.bVersion) {
      osOut << "fleet-orchestrator " << kVersion << "\n";
      return 0;
    }
    if (coOpts.bListFacts) {
      const auto& frRegistry = facts::FactRegistry::builtin();
      for (const auto& sName : frRegistry.names()) {
        osOut << sName << "  " << frRegistry.get(sName).sDescription << "\n";
      }
      return 0;
    }
    if (coOpts.bListOperations) {
      const auto& orRegistry = operations::OperationRegistry::builtin();
      for (const auto& sName : orRegistry.names()) {
        osOut << sName << "  " << orRegistry.get(sName).sDescription << "\n";
      }
      return 0;
    }

    const auto invHosts =
        inventory::Inventory::fromSpec(coOpts.sInventory, parseDataOverrides(coOpts.vData));
    const auto invActive = cfg.oLimit ? invHosts.limit(*cfg.oLimit) : invHosts;
    spLog->info("Loaded inventory with {} hosts ({} active)", invHosts.size(), invActive.size());

    if (cfg.bDebugData) {
      nlohmann::json jData = nlohmann::json::object();
      for (const auto& spHost : invActive) {
        jData[spHost->name()] = {{"groups", spHost->groups()}, {"data", spHost->data()}};
      }
      osOut << jData.dump(2) << "\n";
      return 0;
    }

    if (coOpts.vCommand.empty()) {
      throw common::ValidationError("missing_argument", "Missing argument 'COMMAND'");
    }

    if (!spTransport) spTransport = transport::TransportFactory::create(cfg);
    facts::FactGatherer fgFacts(spTransport, facts::FactRegistry::builtin());

    if (coOpts.vCommand.front() == "fact") {
      return runFactCommand(coOpts, invActive, fgFacts, cfg.resolveParallel(invActive.size()),
                            osOut);
    }

    const auto fnDeploy = resolveCommand(coOpts.vCommand);

    // A dry execution runs every command generator, so each fact the plan needs is probed
    common::Config cfgRun = cfg;
    if (cfg.bDebugFacts) cfgRun.bDryRun = true;

    core::ExecutionEngine eeEngine(cfgRun, invHosts, spTransport, fgFacts);
    eeEngine.evaluate(fnDeploy);

    if (cfg.bDebugFacts || cfg.bDebugOperations) {
      if (cfg.bDebugOperations) osOut << planToJson(eeEngine.recorder()).dump(2) << "\n";
      if (cfg.bDebugFacts) {
        eeEngine.execute();
        osOut << fgFacts.snapshot().dump(2) << "\n";
      }
      return 0;
    }

    const auto rrResult = eeEngine.execute();
    printResults(rrResult, osOut);
    return rrResult.exitCode();
  } catch (const common::AppError& ex) {
    spLog->error("{} ({})", ex.what(), ex._sErrorCode);
    osErr << "--> " << ex.what() << "\n";
    return ex._iExitCode;
  }
}

}  // namespace fleet::cli
