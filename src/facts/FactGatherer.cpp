#include "facts/FactGatherer.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/Shell.hpp"
#include "core/ThreadPool.hpp"
#include "facts/FactDefinition.hpp"
#include "facts/FactRegistry.hpp"
#include "transport/ITransport.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace fleet::facts {

namespace {

bool hasOutput(const std::vector<std::string>& vLines) {
  return std::any_of(vLines.begin(), vLines.end(), [](const std::string& sLine) {
    return sLine.find_first_not_of(" \t\r") != std::string::npos;
  });
}

}  // namespace

FactGatherer::FactGatherer(std::shared_ptr<transport::ITransport> spTransport,
                           const FactRegistry& frRegistry)
    : _spTransport(std::move(spTransport)), _frRegistry(frRegistry) {}

FactGatherer::~FactGatherer() = default;

std::string FactGatherer::cacheKey(const std::string& sFact, const nlohmann::json& jArgs) {
  return sFact + "(" + (jArgs.is_null() ? std::string("[]") : jArgs.dump()) + ")";
}

nlohmann::json FactGatherer::getFact(const inventory::Host& host, const std::string& sFact,
                                     const nlohmann::json& jArgs) {
  const FactDefinition& fdFact = _frRegistry.get(sFact);
  const std::string sKey = cacheKey(sFact, jArgs);

  std::promise<nlohmann::json> prmValue;
  std::shared_future<nlohmann::json> sfValue;
  bool bOwner = false;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    auto& mHostCache = _mCache[host.name()];
    auto it = mHostCache.find(sKey);
    if (it != mHostCache.end()) {
      sfValue = it->second;
    } else {
      sfValue = prmValue.get_future().share();
      mHostCache.emplace(sKey, sfValue);
      bOwner = true;
    }
  }

  if (!bOwner) {
    return sfValue.get();
  }

  try {
    nlohmann::json jValue = gather(host, fdFact, jArgs);
    prmValue.set_value(jValue);
    return jValue;
  } catch (...) {
    // Failures are not cached: waiting callers see this error, later callers retry
    {
      std::lock_guard<std::mutex> lock(_mtx);
      _mCache[host.name()].erase(sKey);
    }
    prmValue.set_exception(std::current_exception());
    throw;
  }
}

nlohmann::json FactGatherer::gather(const inventory::Host& host, const FactDefinition& fdFact,
                                    const nlohmann::json& jArgs) {
  auto spLog = common::Logger::get();

  // Step 1: explicit existence check for the tool this fact depends on
  if (fdFact.fnRequires) {
    if (auto oTool = fdFact.fnRequires(jArgs)) {
      common::CommandResult crCheck;
      try {
        crCheck = _spTransport->execute(host, "command -v " + common::shellQuote(*oTool),
                                        common::CommandKind::FactProbe);
      } catch (const common::TransportError& ex) {
        throw common::GatherError("transport_failed", "[" + host.name() + "] fact '" +
                                                          fdFact.sName + "': " + ex.what());
      }
      if (!crCheck.ok()) {
        spLog->debug("[{}] fact '{}': '{}' not available, using default", host.name(),
                     fdFact.sName, *oTool);
        return fdFact.fnDefault();
      }
    }
  }

  // Step 2: the probe itself
  const std::string sCommand = fdFact.fnBuildCommand(jArgs);
  common::CommandResult crProbe;
  try {
    crProbe = _spTransport->execute(host, sCommand, common::CommandKind::FactProbe);
  } catch (const common::TransportError& ex) {
    throw common::GatherError("transport_failed", "[" + host.name() + "] fact '" +
                                                      fdFact.sName + "': " + ex.what());
  }

  if (!crProbe.ok()) {
    const auto& vAbsent = fdFact.vAbsentExitCodes;
    if (std::find(vAbsent.begin(), vAbsent.end(), crProbe.iExitCode) != vAbsent.end()) {
      spLog->debug("[{}] fact '{}': nothing found (exit {}), using default", host.name(),
                   fdFact.sName, crProbe.iExitCode);
      return fdFact.fnDefault();
    }
    std::string sDetail = crProbe.vStderr.empty() ? std::string{} : ": " + crProbe.vStderr.back();
    throw common::GatherError("probe_failed", "[" + host.name() + "] fact '" + fdFact.sName +
                                                  "' probe exited " +
                                                  std::to_string(crProbe.iExitCode) + sDetail);
  }

  if (!hasOutput(crProbe.vStdout)) {
    return fdFact.fnDefault();
  }

  try {
    nlohmann::json jValue = fdFact.fnParse(crProbe.vStdout);
    spLog->debug("[{}] fact '{}' gathered", host.name(), fdFact.sName);
    return jValue;
  } catch (const std::exception& ex) {
    throw common::GatherError("parse_failed", "[" + host.name() + "] fact '" + fdFact.sName +
                                                  "': could not parse output: " + ex.what());
  }
}

std::map<std::string, nlohmann::json> FactGatherer::getFacts(
    const std::vector<inventory::HostPtr>& vHosts, const std::string& sFact,
    const nlohmann::json& jArgs, size_t uParallel, OnFailure onFailure) {
  std::map<std::string, nlohmann::json> mResults;
  if (vHosts.empty()) return mResults;

  // Validate the name up front so an unknown fact is raised once, not per host
  _frRegistry.get(sFact);

  const size_t uWorkers = std::clamp<size_t>(uParallel, 1, vHosts.size());
  core::ThreadPool tpPool(static_cast<int>(uWorkers));

  std::vector<std::pair<std::string, std::future<nlohmann::json>>> vPending;
  vPending.reserve(vHosts.size());
  for (const auto& spHost : vHosts) {
    vPending.emplace_back(spHost->name(), tpPool.submit([this, spHost, &sFact, &jArgs]() {
                            return getFact(*spHost, sFact, jArgs);
                          }));
  }

  std::exception_ptr epFirst;
  for (auto& [sHost, futValue] : vPending) {
    try {
      mResults[sHost] = futValue.get();
    } catch (const common::GatherError& ex) {
      if (onFailure == OnFailure::Propagate) {
        if (!epFirst) epFirst = std::current_exception();
        continue;
      }
      common::Logger::get()->warn("{}", ex.what());
      mResults[sHost] = nullptr;
    }
  }

  if (epFirst) std::rethrow_exception(epFirst);
  return mResults;
}

nlohmann::json FactGatherer::snapshot() const {
  auto jSnapshot = nlohmann::json::object();
  std::lock_guard<std::mutex> lock(_mtx);
  for (const auto& [sHost, mHostCache] : _mCache) {
    auto jHost = nlohmann::json::object();
    for (const auto& [sKey, sfValue] : mHostCache) {
      if (sfValue.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        jHost[sKey] = sfValue.get();
      }
    }
    jSnapshot[sHost] = jHost;
  }
  return jSnapshot;
}

}  // namespace fleet::facts
