#include "transport/SshTransport.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/Shell.hpp"
#include "inventory/Host.hpp"

#include <string>

namespace fleet::transport {

namespace {
constexpr int kSshConnectionFailure = 255;
}  // namespace

SshTransport::SshTransport(SshOptions soOptions)
    : _soOptions(std::move(soOptions)), _prRunner(_soOptions.durTimeout) {}

SshTransport::~SshTransport() = default;

std::string SshTransport::name() const { return "ssh"; }

std::vector<std::string> SshTransport::buildArgv(const inventory::Host& host,
                                                 const std::string& sCommand) const {
  std::vector<std::string> vArgv = {"ssh", "-o", "BatchMode=yes", "-o",
                                    "StrictHostKeyChecking=accept-new"};

  int iPort = _soOptions.iPort;
  const auto jPort = host.dataValue("ssh_port");
  if (jPort.is_number_integer()) iPort = jPort.get<int>();
  vArgv.insert(vArgv.end(), {"-p", std::to_string(iPort)});

  std::optional<std::string> oKey = _soOptions.oKeyPath;
  const auto jKey = host.dataValue("ssh_key");
  if (jKey.is_string()) oKey = jKey.get<std::string>();
  if (oKey) vArgv.insert(vArgv.end(), {"-i", *oKey});

  std::optional<std::string> oUser = _soOptions.oUser;
  const auto jUser = host.dataValue("ssh_user");
  if (jUser.is_string()) oUser = jUser.get<std::string>();
  if (oUser) vArgv.insert(vArgv.end(), {"-l", *oUser});

  const auto jHostname = host.dataValue("ssh_hostname");
  vArgv.push_back(jHostname.is_string() ? jHostname.get<std::string>() : host.name());

  vArgv.push_back("--");
  vArgv.push_back("sh -c " + common::shellQuote(sCommand));
  return vArgv;
}

common::CommandResult SshTransport::execute(const inventory::Host& host,
                                            const std::string& sCommand,
                                            common::CommandKind kind) {
  common::Logger::get()->trace("[{}] ssh {}: {}", host.name(), common::toString(kind), sCommand);

  auto crResult = _prRunner.run(buildArgv(host, sCommand));
  if (crResult.iExitCode == kSshConnectionFailure) {
    std::string sReason = crResult.vStderr.empty() ? "ssh exited with 255" : crResult.vStderr.back();
    throw common::TransportError("connection_failed",
                                 "Could not connect to " + host.name() + ": " + sReason);
  }
  return crResult;
}

}  // namespace fleet::transport
