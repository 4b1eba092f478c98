#pragma once

#include <memory>
#include <string>

#include "transport/ITransport.hpp"

namespace fleet::common {
struct Config;
}  // namespace fleet::common

namespace fleet::transport {

/// Dispatches each call to the local or SSH transport depending on the host.
/// Class abbreviation: rt
class RoutingTransport : public ITransport {
 public:
  RoutingTransport(std::unique_ptr<ITransport> upLocal, std::unique_ptr<ITransport> upRemote);
  ~RoutingTransport() override;

  std::string name() const override;
  common::CommandResult execute(const inventory::Host& host, const std::string& sCommand,
                                common::CommandKind kind) override;

 private:
  std::unique_ptr<ITransport> _upLocal;
  std::unique_ptr<ITransport> _upRemote;
};

/// Creates concrete ITransport instances from run configuration.
class TransportFactory {
 public:
  /// Routing transport: local hosts run through /bin/sh, others through ssh.
  static std::shared_ptr<ITransport> create(const common::Config& cfg);

  /// Single transport by type string: "local" or "ssh".
  static std::shared_ptr<ITransport> create(const std::string& sType, const common::Config& cfg);
};

}  // namespace fleet::transport
