#include "core/OperationRecorder.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace fleet::core {

namespace {

constexpr char kRecordSep = '\x1e';
constexpr char kUnitSep = '\x1f';

std::string sha256Hex(const std::string& sInput) {
  unsigned char vHash[EVP_MAX_MD_SIZE];
  unsigned int uHashLen = 0;

  EVP_MD_CTX* pCtx = EVP_MD_CTX_new();
  if (!pCtx) {
    throw std::runtime_error("Failed to create digest context");
  }

  if (EVP_DigestInit_ex(pCtx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(pCtx, sInput.data(), sInput.size()) != 1 ||
      EVP_DigestFinal_ex(pCtx, vHash, &uHashLen) != 1) {
    EVP_MD_CTX_free(pCtx);
    throw std::runtime_error("SHA-256 hash computation failed");
  }

  EVP_MD_CTX_free(pCtx);

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < uHashLen; ++i) {
    oss << std::setw(2) << static_cast<int>(vHash[i]);
  }
  return oss.str();
}

}  // namespace

OperationRecorder::OperationRecorder() = default;
OperationRecorder::~OperationRecorder() = default;

void OperationRecorder::begin() {
  _plan = Plan{};
  _bFinished = false;
}

std::string OperationRecorder::computeHash(const std::vector<std::string>& vNameStack,
                                           const nlohmann::json& jArgs,
                                           const std::string& sCallSite) {
  std::string sInput;
  for (const auto& sName : vNameStack) {
    sInput += sName;
    sInput += kRecordSep;
  }
  sInput += kUnitSep;
  sInput += jArgs.dump();  // object keys are sorted, so the dump is canonical
  sInput += kUnitSep;
  sInput += sCallSite;
  return sha256Hex(sInput);
}

std::string OperationRecorder::record(const std::vector<std::string>& vNameStack,
                                      const nlohmann::json& jArgs, const std::string& sCallSite,
                                      const std::vector<std::string>& vTargetHosts,
                                      operations::CommandGenerator fnGenerate) {
  if (_bFinished) {
    throw common::PlanFrozenError("plan_frozen",
                                  "Cannot record operations after evaluation has finished");
  }

  const std::string sHash = computeHash(vNameStack, jArgs, sCallSite);

  auto it = _plan.mOpMeta.find(sHash);
  if (it == _plan.mOpMeta.end()) {
    common::OperationMeta omMeta;
    omMeta.sHash = sHash;
    omMeta.vNameStack = vNameStack;
    omMeta.uOrder = _plan.vOpOrder.size();
    it = _plan.mOpMeta.emplace(sHash, std::move(omMeta)).first;
    _plan.vOpOrder.push_back(sHash);
    _plan.mGenerators.emplace(sHash, std::move(fnGenerate));

    common::Logger::get()->debug("Recorded operation #{} '{}' ({})", it->second.uOrder,
                                 it->second.displayName(), sHash.substr(0, 12));
  }

  const size_t uOrder = it->second.uOrder;
  for (const auto& sHost : vTargetHosts) {
    if (!it->second.setHosts.insert(sHost).second) continue;

    // Usually an append; a host joining an older operation is slotted in by
    // order index so its list stays a subsequence of the global order.
    auto& vHostOps = _plan.mHostOps[sHost];
    auto itPos = std::upper_bound(vHostOps.begin(), vHostOps.end(), uOrder,
                                  [this](size_t uValue, const std::string& sOther) {
                                    return uValue < _plan.mOpMeta.at(sOther).uOrder;
                                  });
    vHostOps.insert(itPos, sHash);
  }

  return sHash;
}

void OperationRecorder::finish() { _bFinished = true; }

const common::OperationMeta& OperationRecorder::opMeta(const std::string& sHash) const {
  auto it = _plan.mOpMeta.find(sHash);
  if (it == _plan.mOpMeta.end()) {
    throw common::ValidationError("unknown_operation", "No operation with hash " + sHash);
  }
  return it->second;
}

const std::vector<std::string>& OperationRecorder::hostOps(const std::string& sHost) const {
  static const std::vector<std::string> vEmpty;
  auto it = _plan.mHostOps.find(sHost);
  return it == _plan.mHostOps.end() ? vEmpty : it->second;
}

}  // namespace fleet::core
