#pragma once

#include <string>

#include "common/Types.hpp"

namespace fleet::inventory {
class Host;
}  // namespace fleet::inventory

namespace fleet::transport {

/// Pure abstract interface for command execution on a host.
/// Implementations must be safe for concurrent calls on distinct hosts.
/// A non-zero exit is returned, not thrown; connectivity problems and
/// timeouts throw common::TransportError.
class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual std::string name() const = 0;
  virtual common::CommandResult execute(const inventory::Host& host,
                                        const std::string& sCommand,
                                        common::CommandKind kind) = 0;
};

}  // namespace fleet::transport
