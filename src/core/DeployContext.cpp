#include "core/DeployContext.hpp"

#include "core/OperationRecorder.hpp"
#include "facts/FactGatherer.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace fleet::core {

namespace {

/// Restores a value on scope exit, including when fn throws.
template <typename T>
class Restore {
 public:
  explicit Restore(T& ref) : _ref(ref), _saved(ref) {}
  ~Restore() { _ref = std::move(_saved); }
  Restore(const Restore&) = delete;
  Restore& operator=(const Restore&) = delete;

 private:
  T& _ref;
  T _saved;
};

}  // namespace

DeployContext::DeployContext(const inventory::Inventory& invHosts, OperationRecorder& recPlan,
                             facts::FactGatherer& fgFacts, size_t uParallel)
    : _invHosts(invHosts),
      _recPlan(recPlan),
      _fgFacts(fgFacts),
      _uParallel(uParallel),
      _vScope(invHosts.hosts()) {}

DeployContext::~DeployContext() = default;

std::string DeployContext::siteId(const std::source_location& loc) {
  return std::string(loc.file_name()) + ":" + std::to_string(loc.line()) + ":" +
         std::to_string(loc.column());
}

std::string DeployContext::callSite(const std::string& sLeaf) const {
  std::string sSite;
  for (const auto& sFrame : _vFrames) {
    sSite += sFrame;
    sSite += " > ";
  }
  return sSite + sLeaf;
}

std::string DeployContext::operation(const operations::OperationSpec& osSpec,
                                     const std::string& sName, std::source_location loc) {
  return operationAt(siteId(loc), osSpec, sName);
}

std::string DeployContext::operationAt(const std::string& sSiteId,
                                       const operations::OperationSpec& osSpec,
                                       const std::string& sName) {
  if (_vScope.empty()) {
    return {};
  }

  std::vector<std::string> vNameStack = _vNamePrefix;
  vNameStack.push_back(sName.empty() ? osSpec.sName : sName);

  std::vector<std::string> vTargets;
  vTargets.reserve(_vScope.size());
  for (const auto& spHost : _vScope) vTargets.push_back(spHost->name());

  return _recPlan.record(vNameStack, osSpec.jArgs, callSite(sSiteId), vTargets,
                         osSpec.fnGenerate);
}

void DeployContext::withScope(std::vector<inventory::HostPtr> vScope, const DeployFn& fn) {
  Restore<std::vector<inventory::HostPtr>> restore(_vScope);
  _vScope = std::move(vScope);
  fn(*this);
}

void DeployContext::onHosts(const std::vector<std::string>& vPatterns, const DeployFn& fn) {
  const auto invMatched = _invHosts.limit(vPatterns);
  std::set<std::string> setMatched;
  for (const auto& spHost : invMatched) setMatched.insert(spHost->name());

  std::vector<inventory::HostPtr> vScope;
  for (const auto& spHost : _vScope) {
    if (setMatched.count(spHost->name()) != 0) vScope.push_back(spHost);
  }
  withScope(std::move(vScope), fn);
}

void DeployContext::when(const std::function<bool(const inventory::Host&)>& fnPredicate,
                         const DeployFn& fn) {
  std::vector<inventory::HostPtr> vScope;
  for (const auto& spHost : _vScope) {
    if (fnPredicate(*spHost)) vScope.push_back(spHost);
  }
  withScope(std::move(vScope), fn);
}

void DeployContext::include(const std::string& sName, const DeployFn& fn,
                            std::source_location loc) {
  includeAt(siteId(loc), sName, fn);
}

void DeployContext::includeAt(const std::string& sSiteId, const std::string& sName,
                              const DeployFn& fn) {
  Restore<std::vector<std::string>> restoreNames(_vNamePrefix);
  Restore<std::vector<std::string>> restoreFrames(_vFrames);
  _vNamePrefix.push_back(sName);
  _vFrames.push_back(sSiteId);
  fn(*this);
}

nlohmann::json DeployContext::fact(const inventory::Host& host, const std::string& sFact,
                                   const nlohmann::json& jArgs) {
  return _fgFacts.getFact(host, sFact, jArgs);
}

std::map<std::string, nlohmann::json> DeployContext::facts(const std::string& sFact,
                                                           const nlohmann::json& jArgs) {
  return _fgFacts.getFacts(_vScope, sFact, jArgs, _uParallel);
}

}  // namespace fleet::core
