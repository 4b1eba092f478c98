#include "core/DeployLoader.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "operations/OperationRegistry.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>

namespace fleet::core {

namespace {

constexpr size_t kMaxIncludeDepth = 32;

std::vector<std::string> stringArray(const nlohmann::json& jValue, const std::string& sWhat) {
  if (jValue.is_string()) return {jValue.get<std::string>()};
  if (!jValue.is_array()) {
    throw common::DefinitionError("deploy_invalid", sWhat + " must be a string or array");
  }
  std::vector<std::string> vValues;
  for (const auto& jItem : jValue) {
    if (!jItem.is_string()) {
      throw common::DefinitionError("deploy_invalid", sWhat + " must contain strings");
    }
    vValues.push_back(jItem.get<std::string>());
  }
  return vValues;
}

DeployCondition parseCondition(const nlohmann::json& jWhen, const std::string& sWhere) {
  if (!jWhen.is_object() || !jWhen.contains("fact") || !jWhen.at("fact").is_string()) {
    throw common::DefinitionError("deploy_invalid", sWhere + ": 'when' needs a 'fact' name");
  }

  DeployCondition dcCondition;
  dcCondition.sFact = jWhen.at("fact").get<std::string>();
  if (jWhen.contains("args")) {
    dcCondition.jArgs = jWhen.at("args").is_array() ? jWhen.at("args")
                                                    : nlohmann::json::array({jWhen.at("args")});
  }

  if (jWhen.contains("equals")) {
    dcCondition.jValue = jWhen.at("equals");
  } else if (jWhen.contains("not_equals")) {
    dcCondition.jValue = jWhen.at("not_equals");
    dcCondition.bNegate = true;
  } else {
    throw common::DefinitionError("deploy_invalid",
                                  sWhere + ": 'when' needs 'equals' or 'not_equals'");
  }
  return dcCondition;
}

void evaluateSteps(DeployContext& ctx, const std::vector<DeployStep>& vSteps,
                   const std::string& sFile);

void evaluateStep(DeployContext& ctx, const DeployStep& dsStep, const std::string& sFile) {
  const std::string sSiteId = sFile + "#" + std::to_string(dsStep.uIndex);

  if (dsStep.kind == DeployStep::Kind::Operation) {
    ctx.operationAt(sSiteId, dsStep.osSpec, dsStep.sName);
  } else {
    ctx.includeAt(sSiteId, dsStep.sInclude, [&](DeployContext& ctxInner) {
      evaluateSteps(ctxInner, dsStep.vChildren, dsStep.sInclude);
    });
  }
}

void evaluateScoped(DeployContext& ctx, const DeployStep& dsStep, const std::string& sFile) {
  if (!dsStep.oWhen) {
    evaluateStep(ctx, dsStep, sFile);
    return;
  }

  const auto& dcCondition = *dsStep.oWhen;
  // Probe all hosts in scope up front, concurrently; the predicate reads the cache
  const auto mValues = ctx.facts(dcCondition.sFact, dcCondition.jArgs);
  ctx.when(
      [&](const inventory::Host& host) {
        auto it = mValues.find(host.name());
        const bool bEqual = it != mValues.end() && it->second == dcCondition.jValue;
        return dcCondition.bNegate ? !bEqual : bEqual;
      },
      [&](DeployContext& ctxInner) { evaluateStep(ctxInner, dsStep, sFile); });
}

void evaluateSteps(DeployContext& ctx, const std::vector<DeployStep>& vSteps,
                   const std::string& sFile) {
  for (const auto& dsStep : vSteps) {
    if (dsStep.oHosts) {
      ctx.onHosts(*dsStep.oHosts,
                  [&](DeployContext& ctxInner) { evaluateScoped(ctxInner, dsStep, sFile); });
    } else {
      evaluateScoped(ctx, dsStep, sFile);
    }
  }
}

}  // namespace

DeployLoader::DeployLoader(const operations::OperationRegistry& orRegistry)
    : _orRegistry(orRegistry) {}

DeployLoader::~DeployLoader() = default;

DeployFn DeployLoader::load(const std::string& sPath) const {
  std::vector<std::string> vIncludeStack;
  auto vSteps = loadFile(sPath, sPath, vIncludeStack);
  common::Logger::get()->debug("Loaded deploy file {} ({} top-level steps)", sPath, vSteps.size());
  return toDeploy(std::move(vSteps), sPath);
}

std::vector<DeployStep> DeployLoader::loadFile(const std::string& sPath,
                                               const std::string& sDisplayName,
                                               std::vector<std::string>& vIncludeStack) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(sPath, ec)) {
    throw common::DefinitionError("deploy_missing", "No deploy file: `" + sPath + "`");
  }

  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    throw common::DefinitionError("deploy_missing", "No deploy file: `" + sPath + "`");
  }

  nlohmann::json jDoc;
  try {
    jDoc = nlohmann::json::parse(ifs);
  } catch (const nlohmann::json::parse_error& ex) {
    throw common::DefinitionError("deploy_malformed",
                                  "Invalid deploy file `" + sPath + "`: " + ex.what());
  }

  const auto sCanonical = std::filesystem::weakly_canonical(sPath, ec).string();
  if (std::find(vIncludeStack.begin(), vIncludeStack.end(), sCanonical) != vIncludeStack.end()) {
    throw common::DefinitionError("deploy_include_cycle", "Include cycle through `" + sPath + "`");
  }
  if (vIncludeStack.size() >= kMaxIncludeDepth) {
    throw common::DefinitionError("deploy_include_depth", "Includes nested too deeply at `" +
                                                              sPath + "`");
  }

  vIncludeStack.push_back(sCanonical);
  auto vSteps =
      parse(jDoc, sDisplayName, std::filesystem::path(sPath).parent_path().string(), vIncludeStack);
  vIncludeStack.pop_back();
  return vSteps;
}

std::vector<DeployStep> DeployLoader::parse(const nlohmann::json& jDoc, const std::string& sFile,
                                            const std::string& sBaseDir,
                                            std::vector<std::string>& vIncludeStack) const {
  if (!jDoc.is_array()) {
    throw common::DefinitionError("deploy_invalid", "Deploy file `" + sFile +
                                                        "` must contain an array of steps");
  }

  std::vector<DeployStep> vSteps;
  vSteps.reserve(jDoc.size());

  for (size_t i = 0; i < jDoc.size(); ++i) {
    const auto& jStep = jDoc[i];
    const std::string sWhere = sFile + " step " + std::to_string(i + 1);
    if (!jStep.is_object()) {
      throw common::DefinitionError("deploy_invalid", sWhere + ": must be an object");
    }

    DeployStep dsStep;
    dsStep.uIndex = i;
    if (jStep.contains("hosts")) dsStep.oHosts = stringArray(jStep.at("hosts"), sWhere + " hosts");
    if (jStep.contains("when")) dsStep.oWhen = parseCondition(jStep.at("when"), sWhere);
    if (jStep.contains("name")) {
      if (!jStep.at("name").is_string()) {
        throw common::DefinitionError("deploy_invalid", sWhere + ": 'name' must be a string");
      }
      dsStep.sName = jStep.at("name").get<std::string>();
    }

    if (jStep.contains("include")) {
      if (!jStep.at("include").is_string()) {
        throw common::DefinitionError("deploy_invalid", sWhere + ": 'include' must be a string");
      }
      dsStep.kind = DeployStep::Kind::Include;
      dsStep.sInclude = jStep.at("include").get<std::string>();
      const auto pathInclude = std::filesystem::path(sBaseDir) / dsStep.sInclude;
      dsStep.vChildren = loadFile(pathInclude.string(), dsStep.sInclude, vIncludeStack);
    } else if (jStep.contains("op")) {
      if (!jStep.at("op").is_string()) {
        throw common::DefinitionError("deploy_invalid", sWhere + ": 'op' must be a string");
      }
      dsStep.kind = DeployStep::Kind::Operation;
      dsStep.sOp = jStep.at("op").get<std::string>();
      const nlohmann::json jArgs =
          jStep.contains("args") ? jStep.at("args") : nlohmann::json::object();
      try {
        dsStep.osSpec = _orRegistry.create(dsStep.sOp, jArgs);
      } catch (const common::UnknownOperationError& ex) {
        throw common::DefinitionError("deploy_invalid", sWhere + ": " + ex.what());
      } catch (const common::ValidationError& ex) {
        throw common::DefinitionError("deploy_invalid", sWhere + ": " + ex.what());
      }
    } else {
      throw common::DefinitionError("deploy_invalid", sWhere + ": needs 'op' or 'include'");
    }

    vSteps.push_back(std::move(dsStep));
  }

  return vSteps;
}

DeployFn DeployLoader::toDeploy(std::vector<DeployStep> vSteps, std::string sFile) {
  auto spSteps = std::make_shared<const std::vector<DeployStep>>(std::move(vSteps));
  return [spSteps, sFile = std::move(sFile)](DeployContext& ctx) {
    evaluateSteps(ctx, *spSteps, sFile);
  };
}

}  // namespace fleet::core
