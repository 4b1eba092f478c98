#pragma once

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "inventory/Inventory.hpp"

namespace fleet::transport {
class ITransport;
}  // namespace fleet::transport

namespace fleet::facts {

class FactRegistry;
struct FactDefinition;

/// Runs fact probes through the transport and caches parsed values per
/// (host, fact, args) for the lifetime of one run.
/// Concurrent requests for the same key share a single in-flight probe.
/// Class abbreviation: fg
class FactGatherer {
 public:
  FactGatherer(std::shared_ptr<transport::ITransport> spTransport,
               const FactRegistry& frRegistry);
  ~FactGatherer();

  FactGatherer(const FactGatherer&) = delete;
  FactGatherer& operator=(const FactGatherer&) = delete;

  /// Cached or freshly probed value of sFact for host.
  /// Returns the fact's default when the probed tool or resource is absent.
  /// Throws GatherError on transport failure or a failing probe.
  /// Throws UnknownFactError for an unregistered fact.
  nlohmann::json getFact(const inventory::Host& host, const std::string& sFact,
                         const nlohmann::json& jArgs = nlohmann::json::array());

  /// Handling of hosts whose probe failed in getFacts().
  enum class OnFailure { Propagate, MapToNull };

  /// Gathers sFact for every host with up to uParallel concurrent probes.
  /// Every probe completes before returning. With Propagate the first
  /// GatherError (in host order) is rethrown; with MapToNull the failed
  /// hosts map to null and the error is logged.
  std::map<std::string, nlohmann::json> getFacts(const std::vector<inventory::HostPtr>& vHosts,
                                                 const std::string& sFact,
                                                 const nlohmann::json& jArgs,
                                                 size_t uParallel,
                                                 OnFailure onFailure = OnFailure::Propagate);

  /// Completed cache entries as { host: { "fact(args)": value } }.
  nlohmann::json snapshot() const;

  /// Cache key for a fact call: name plus canonical JSON of the arguments.
  static std::string cacheKey(const std::string& sFact, const nlohmann::json& jArgs);

 private:
  nlohmann::json gather(const inventory::Host& host, const FactDefinition& fdFact,
                        const nlohmann::json& jArgs);

  std::shared_ptr<transport::ITransport> _spTransport;
  const FactRegistry& _frRegistry;

  // host name -> cache key -> value
  std::map<std::string, std::map<std::string, std::shared_future<nlohmann::json>>> _mCache;
  mutable std::mutex _mtx;
};

}  // namespace fleet::facts
