#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "transport/ITransport.hpp"
#include "transport/ProcessRunner.hpp"

namespace fleet::transport {

/// Connection defaults; per-host data keys ssh_user, ssh_port, ssh_key and
/// ssh_hostname take precedence.
/// Class abbreviation: so
struct SshOptions {
  std::optional<std::string> oUser;
  int iPort = 22;
  std::optional<std::string> oKeyPath;
  std::chrono::seconds durTimeout{0};
};

/// Runs commands on remote hosts through the system ssh client in batch mode.
/// Class abbreviation: st
class SshTransport : public ITransport {
 public:
  explicit SshTransport(SshOptions soOptions);
  ~SshTransport() override;

  std::string name() const override;
  common::CommandResult execute(const inventory::Host& host, const std::string& sCommand,
                                common::CommandKind kind) override;

  /// Full ssh argv used for sCommand on host.
  std::vector<std::string> buildArgv(const inventory::Host& host,
                                     const std::string& sCommand) const;

 private:
  SshOptions _soOptions;
  ProcessRunner _prRunner;
};

}  // namespace fleet::transport
