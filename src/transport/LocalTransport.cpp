#include "transport/LocalTransport.hpp"

#include "common/Logger.hpp"
#include "inventory/Host.hpp"

namespace fleet::transport {

LocalTransport::LocalTransport(std::chrono::seconds durTimeout) : _prRunner(durTimeout) {}
LocalTransport::~LocalTransport() = default;

std::string LocalTransport::name() const { return "local"; }

common::CommandResult LocalTransport::execute(const inventory::Host& host,
                                              const std::string& sCommand,
                                              common::CommandKind kind) {
  common::Logger::get()->trace("[{}] local {}: {}", host.name(), common::toString(kind), sCommand);
  return _prRunner.runShell(sCommand);
}

}  // namespace fleet::transport
