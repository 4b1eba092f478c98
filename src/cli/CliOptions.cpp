#include "cli/CliOptions.hpp"

#include "common/Config.hpp"
#include "common/Errors.hpp"

#include <getopt.h>

#include <charconv>

namespace fleet::cli {

namespace {

enum LongOnly {
  kOptVersion = 1000,
  kOptFacts,
  kOptOperations,
  kOptParallel,
  kOptSerial,
  kOptFailPercent,
  kOptLimit,
  kOptNoWait,
  kOptDry,
  kOptData,
  kOptUser,
  kOptPort,
  kOptKey,
  kOptDebug,
  kOptDebugData,
  kOptDebugFacts,
  kOptDebugOperations,
};

int parseInt(const char* pValue, const std::string& sOption) {
  const std::string sValue = pValue ? pValue : "";
  int iValue = 0;
  auto [pEnd, ec] = std::from_chars(sValue.data(), sValue.data() + sValue.size(), iValue);
  if (sValue.empty() || ec != std::errc() || pEnd != sValue.data() + sValue.size()) {
    throw common::ValidationError("invalid_option",
                                  "--" + sOption + " expects an integer, got '" + sValue + "'");
  }
  return iValue;
}

}  // namespace

void CliOptions::applyTo(common::Config& cfg) const {
  if (oParallel) cfg.iParallel = *oParallel;
  if (bSerial) cfg.bSerial = true;
  if (oFailPercent) cfg.iFailPercent = *oFailPercent;
  if (oLimit) cfg.oLimit = oLimit;
  if (bNoWait) cfg.bNoWait = true;
  if (bDryRun) cfg.bDryRun = true;
  if (oUser) cfg.oSshUser = oUser;
  if (oPort) cfg.iSshPort = *oPort;
  if (oKeyPath) cfg.oSshKeyPath = oKeyPath;

  if (bDebug) {
    cfg.sLogLevel = "trace";
  } else if (bVerbose) {
    cfg.sLogLevel = "debug";
  }

  cfg.bDebugData = cfg.bDebugData || bDebugData;
  cfg.bDebugFacts = cfg.bDebugFacts || bDebugFacts;
  cfg.bDebugOperations = cfg.bDebugOperations || bDebugOperations;

  cfg.validate();
}

CliOptions parseArgs(int argc, char* argv[]) {
  static const struct option kLongOptions[] = {
      {"help", no_argument, nullptr, 'h'},
      {"version", no_argument, nullptr, kOptVersion},
      {"facts", no_argument, nullptr, kOptFacts},
      {"operations", no_argument, nullptr, kOptOperations},
      {"parallel", required_argument, nullptr, kOptParallel},
      {"serial", no_argument, nullptr, kOptSerial},
      {"fail-percent", required_argument, nullptr, kOptFailPercent},
      {"limit", required_argument, nullptr, kOptLimit},
      {"no-wait", no_argument, nullptr, kOptNoWait},
      {"dry", no_argument, nullptr, kOptDry},
      {"data", required_argument, nullptr, kOptData},
      {"user", required_argument, nullptr, kOptUser},
      {"port", required_argument, nullptr, kOptPort},
      {"key", required_argument, nullptr, kOptKey},
      {"debug", no_argument, nullptr, kOptDebug},
      {"debug-data", no_argument, nullptr, kOptDebugData},
      {"debug-facts", no_argument, nullptr, kOptDebugFacts},
      {"debug-operations", no_argument, nullptr, kOptDebugOperations},
      {nullptr, 0, nullptr, 0}};

  CliOptions coOpts;

  // optind = 0 fully reinitialises GNU getopt between calls; '+' stops at the
  // first positional so command arguments such as "--" reach the command
  optind = 0;
  opterr = 0;

  int iOpt = 0;
  int iIndex = 0;
  while ((iOpt = getopt_long(argc, argv, "+hv", kLongOptions, &iIndex)) != -1) {
    switch (iOpt) {
      case 'h': coOpts.bHelp = true; break;
      case 'v': coOpts.bVerbose = true; break;
      case kOptVersion: coOpts.bVersion = true; break;
      case kOptFacts: coOpts.bListFacts = true; break;
      case kOptOperations: coOpts.bListOperations = true; break;
      case kOptParallel: coOpts.oParallel = parseInt(optarg, "parallel"); break;
      case kOptSerial: coOpts.bSerial = true; break;
      case kOptFailPercent: coOpts.oFailPercent = parseInt(optarg, "fail-percent"); break;
      case kOptLimit: coOpts.oLimit = optarg; break;
      case kOptNoWait: coOpts.bNoWait = true; break;
      case kOptDry: coOpts.bDryRun = true; break;
      case kOptData: coOpts.vData.emplace_back(optarg); break;
      case kOptUser: coOpts.oUser = optarg; break;
      case kOptPort: coOpts.oPort = parseInt(optarg, "port"); break;
      case kOptKey: coOpts.oKeyPath = optarg; break;
      case kOptDebug: coOpts.bDebug = true; break;
      case kOptDebugData: coOpts.bDebugData = true; break;
      case kOptDebugFacts: coOpts.bDebugFacts = true; break;
      case kOptDebugOperations: coOpts.bDebugOperations = true; break;
      default: {
        const std::string sOpt = (optind > 0 && optind <= argc && argv[optind - 1])
                                     ? argv[optind - 1]
                                     : std::string("?");
        throw common::ValidationError("invalid_option", "Unknown or incomplete option: " + sOpt);
      }
    }
  }

  if (optind < argc) coOpts.sInventory = argv[optind++];
  while (optind < argc) coOpts.vCommand.emplace_back(argv[optind++]);

  if (!coOpts.eager()) {
    if (coOpts.sInventory.empty()) {
      throw common::ValidationError("missing_argument", "Missing argument 'INVENTORY'");
    }
    if (coOpts.vCommand.empty()) {
      throw common::ValidationError("missing_argument", "Missing argument 'COMMAND'");
    }
  }

  for (const auto& sData : coOpts.vData) {
    if (sData.find('=') == std::string::npos) {
      throw common::ValidationError("invalid_option",
                                    "--data expects key=value, got '" + sData + "'");
    }
  }

  return coOpts;
}

CliOptions parseArgs(const std::vector<std::string>& vArgs) {
  std::vector<std::string> vStorage = vArgs;
  std::vector<char*> vArgv;
  vArgv.reserve(vStorage.size() + 1);
  for (auto& sArg : vStorage) vArgv.push_back(sArg.data());
  vArgv.push_back(nullptr);
  return parseArgs(static_cast<int>(vStorage.size()), vArgv.data());
}

}  // namespace fleet::cli
