#pragma once

#include <chrono>
#include <string>

#include "transport/ITransport.hpp"
#include "transport/ProcessRunner.hpp"

namespace fleet::transport {

/// Runs commands on the local machine through /bin/sh.
/// Class abbreviation: lt
class LocalTransport : public ITransport {
 public:
  explicit LocalTransport(std::chrono::seconds durTimeout = std::chrono::seconds(0));
  ~LocalTransport() override;

  std::string name() const override;
  common::CommandResult execute(const inventory::Host& host, const std::string& sCommand,
                                common::CommandKind kind) override;

 private:
  ProcessRunner _prRunner;
};

}  // namespace fleet::transport
