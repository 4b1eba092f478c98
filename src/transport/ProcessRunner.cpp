#include "transport/ProcessRunner.hpp"

#include "common/Errors.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

extern char** environ;

namespace fleet::transport {

namespace {

constexpr int kPollIntervalMs = 100;

/// Owns a pipe pair and closes whatever is left open.
/// Both ends are close-on-exec so children spawned concurrently by other
/// threads never hold this pipe open; dup2 onto 1/2 clears the flag in the child.
struct Pipe {
  int aFds[2] = {-1, -1};

  Pipe() {
    if (pipe2(aFds, O_CLOEXEC) != 0) {
      throw common::TransportError("pipe_failed",
                                   std::string("Failed to create pipe: ") + std::strerror(errno));
    }
  }
  ~Pipe() {
    closeRead();
    closeWrite();
  }
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  void closeRead() {
    if (aFds[0] >= 0) close(aFds[0]);
    aFds[0] = -1;
  }
  void closeWrite() {
    if (aFds[1] >= 0) close(aFds[1]);
    aFds[1] = -1;
  }
};

std::vector<std::string> splitLines(const std::string& sBuffer) {
  std::vector<std::string> vLines;
  size_t uStart = 0;
  while (uStart < sBuffer.size()) {
    size_t uEnd = sBuffer.find('\n', uStart);
    if (uEnd == std::string::npos) uEnd = sBuffer.size();
    std::string sLine = sBuffer.substr(uStart, uEnd - uStart);
    if (!sLine.empty() && sLine.back() == '\r') sLine.pop_back();
    vLines.push_back(std::move(sLine));
    uStart = uEnd + 1;
  }
  return vLines;
}

}  // namespace

ProcessRunner::ProcessRunner(std::chrono::seconds durTimeout) : _durTimeout(durTimeout) {}

common::CommandResult ProcessRunner::runShell(const std::string& sCommand) const {
  return run({"/bin/sh", "-c", sCommand});
}

common::CommandResult ProcessRunner::run(const std::vector<std::string>& vArgv) const {
  if (vArgv.empty()) {
    throw common::TransportError("spawn_failed", "Empty command line");
  }

  Pipe pOut;
  Pipe pErr;

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, pOut.aFds[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, pErr.aFds[1], STDERR_FILENO);
  posix_spawn_file_actions_addclose(&actions, pOut.aFds[0]);
  posix_spawn_file_actions_addclose(&actions, pErr.aFds[0]);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

  std::vector<char*> vArgs;
  vArgs.reserve(vArgv.size() + 1);
  for (const auto& sArg : vArgv) vArgs.push_back(const_cast<char*>(sArg.c_str()));
  vArgs.push_back(nullptr);

  pid_t pid = 0;
  const int iSpawn = posix_spawnp(&pid, vArgs[0], &actions, nullptr, vArgs.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  if (iSpawn != 0) {
    throw common::TransportError("spawn_failed", "Failed to spawn '" + vArgv[0] +
                                                     "': " + std::strerror(iSpawn));
  }

  pOut.closeWrite();
  pErr.closeWrite();

  const auto tpDeadline = std::chrono::steady_clock::now() + _durTimeout;
  std::string sOut;
  std::string sErr;
  std::array<char, 4096> aBuf{};
  bool bTimedOut = false;

  std::array<pollfd, 2> aPoll{{{pOut.aFds[0], POLLIN, 0}, {pErr.aFds[0], POLLIN, 0}}};
  int iOpen = 2;
  while (iOpen > 0) {
    if (_durTimeout.count() > 0 && std::chrono::steady_clock::now() >= tpDeadline) {
      bTimedOut = true;
      break;
    }
    const int iReady = poll(aPoll.data(), aPoll.size(), kPollIntervalMs);
    if (iReady < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (size_t i = 0; i < aPoll.size(); ++i) {
      if (aPoll[i].fd < 0 || aPoll[i].revents == 0) continue;
      const ssize_t iRead = read(aPoll[i].fd, aBuf.data(), aBuf.size());
      if (iRead > 0) {
        (i == 0 ? sOut : sErr).append(aBuf.data(), static_cast<size_t>(iRead));
      } else if (iRead == 0 || errno != EINTR) {
        aPoll[i].fd = -1;
        --iOpen;
      }
    }
  }

  if (bTimedOut) {
    kill(pid, SIGKILL);
  }

  int iStatus = 0;
  while (waitpid(pid, &iStatus, 0) < 0 && errno == EINTR) {
  }

  if (bTimedOut) {
    throw common::TransportError("command_timeout",
                                 "Command timed out after " +
                                     std::to_string(_durTimeout.count()) + "s");
  }

  common::CommandResult crResult;
  if (WIFEXITED(iStatus)) {
    crResult.iExitCode = WEXITSTATUS(iStatus);
  } else if (WIFSIGNALED(iStatus)) {
    crResult.iExitCode = 128 + WTERMSIG(iStatus);
  } else {
    crResult.iExitCode = -1;
  }
  crResult.vStdout = splitLines(sOut);
  crResult.vStderr = splitLines(sErr);
  return crResult;
}

}  // namespace fleet::transport
