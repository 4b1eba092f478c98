#pragma once

#include <functional>
#include <map>
#include <source_location>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "inventory/Inventory.hpp"
#include "operations/OperationSpec.hpp"

namespace fleet::facts {
class FactGatherer;
}  // namespace fleet::facts

namespace fleet::core {

class OperationRecorder;
class DeployContext;

/// A deploy definition: sequential logic evaluated once per run.
using DeployFn = std::function<void(DeployContext&)>;

/// Builder API handed to a deploy definition during its single evaluation pass.
/// Carries the current host scope, name prefix and call-site frames explicitly;
/// nothing here is process-wide.
/// Class abbreviation: ctx
class DeployContext {
 public:
  DeployContext(const inventory::Inventory& invHosts, OperationRecorder& recPlan,
                facts::FactGatherer& fgFacts, size_t uParallel);
  ~DeployContext();

  DeployContext(const DeployContext&) = delete;
  DeployContext& operator=(const DeployContext&) = delete;

  /// Hosts in the current scope, in inventory order.
  const std::vector<inventory::HostPtr>& hosts() const { return _vScope; }
  const inventory::Inventory& inventory() const { return _invHosts; }

  /// Record osSpec for every host in scope under sName (osSpec.sName if empty).
  /// The call site is the caller's source location inside the current frames.
  /// Returns the operation hash, or an empty string when the scope is empty.
  std::string operation(const operations::OperationSpec& osSpec, const std::string& sName = {},
                        std::source_location loc = std::source_location::current());

  /// Same as operation() with an explicit call-site id instead of a source location.
  std::string operationAt(const std::string& sSiteId, const operations::OperationSpec& osSpec,
                          const std::string& sName = {});

  /// Evaluate fn with the scope narrowed to hosts matching any name glob or group.
  void onHosts(const std::vector<std::string>& vPatterns, const DeployFn& fn);

  /// Evaluate fn with the scope narrowed to hosts for which fnPredicate holds.
  /// The predicate runs once per host in scope, in inventory order.
  void when(const std::function<bool(const inventory::Host&)>& fnPredicate, const DeployFn& fn);

  /// Evaluate fn as a named sub-deploy: sName prefixes the operation names
  /// recorded inside, and each include call site is a distinct frame.
  void include(const std::string& sName, const DeployFn& fn,
               std::source_location loc = std::source_location::current());

  /// Same as include() with an explicit call-site id.
  void includeAt(const std::string& sSiteId, const std::string& sName, const DeployFn& fn);

  /// Fact value for one host; blocks until the probe resolves.
  nlohmann::json fact(const inventory::Host& host, const std::string& sFact,
                      const nlohmann::json& jArgs = nlohmann::json::array());

  /// Fact value for every host in scope, probed concurrently.
  /// Throws GatherError when the probe fails on any host.
  std::map<std::string, nlohmann::json> facts(const std::string& sFact,
                                               const nlohmann::json& jArgs = nlohmann::json::array());

  /// Current call-site frames joined with sLeaf.
  std::string callSite(const std::string& sLeaf) const;

  static std::string siteId(const std::source_location& loc);

 private:
  void withScope(std::vector<inventory::HostPtr> vScope, const DeployFn& fn);

  const inventory::Inventory& _invHosts;
  OperationRecorder& _recPlan;
  facts::FactGatherer& _fgFacts;
  size_t _uParallel;

  std::vector<inventory::HostPtr> _vScope;
  std::vector<std::string> _vNamePrefix;
  std::vector<std::string> _vFrames;
};

}  // namespace fleet::core
