#include "transport/TransportFactory.hpp"

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "inventory/Host.hpp"
#include "transport/LocalTransport.hpp"
#include "transport/SshTransport.hpp"

#include <chrono>

namespace fleet::transport {

namespace {

SshOptions sshOptionsFrom(const common::Config& cfg) {
  SshOptions soOptions;
  soOptions.oUser = cfg.oSshUser;
  soOptions.iPort = cfg.iSshPort;
  soOptions.oKeyPath = cfg.oSshKeyPath;
  soOptions.durTimeout = std::chrono::seconds(cfg.iCommandTimeoutSeconds);
  return soOptions;
}

}  // namespace

RoutingTransport::RoutingTransport(std::unique_ptr<ITransport> upLocal,
                                   std::unique_ptr<ITransport> upRemote)
    : _upLocal(std::move(upLocal)), _upRemote(std::move(upRemote)) {}

RoutingTransport::~RoutingTransport() = default;

std::string RoutingTransport::name() const { return "routing"; }

common::CommandResult RoutingTransport::execute(const inventory::Host& host,
                                                const std::string& sCommand,
                                                common::CommandKind kind) {
  return host.isLocal() ? _upLocal->execute(host, sCommand, kind)
                        : _upRemote->execute(host, sCommand, kind);
}

std::shared_ptr<ITransport> TransportFactory::create(const common::Config& cfg) {
  return std::make_shared<RoutingTransport>(
      std::make_unique<LocalTransport>(std::chrono::seconds(cfg.iCommandTimeoutSeconds)),
      std::make_unique<SshTransport>(sshOptionsFrom(cfg)));
}

std::shared_ptr<ITransport> TransportFactory::create(const std::string& sType,
                                                     const common::Config& cfg) {
  if (sType == "local") {
    return std::make_shared<LocalTransport>(std::chrono::seconds(cfg.iCommandTimeoutSeconds));
  }
  if (sType == "ssh") {
    return std::make_shared<SshTransport>(sshOptionsFrom(cfg));
  }
  throw common::ValidationError("unknown_transport", "Unknown transport type: " + sType);
}

}  // namespace fleet::transport
