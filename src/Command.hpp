#pragma once

#include "Rustify/Result.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <utility>
#include <vector>

namespace gocov {

class ExitStatus {
  int rawStatus;  // Original status from waitpid

public:
  ExitStatus() noexcept : rawStatus(EXIT_SUCCESS) {}
  explicit ExitStatus(int status) noexcept : rawStatus(status) {}

  bool exitedNormally() const noexcept;
  bool killedBySignal() const noexcept;
  int exitCode() const noexcept;
  int termSignal() const noexcept;
  bool coreDumped() const noexcept;

  // Successful only if normally exited with code 0
  bool success() const noexcept;

  std::string toString() const;
};

struct CommandOutput {
  const ExitStatus exitStatus;
  const std::string stdOut;
  const std::string stdErr;
};

class Child {
  const pid_t pid;
  const int stdOutFd;
  const int stdErrFd;

  Child(pid_t pid, int stdOutFd, int stdErrFd) noexcept
      : pid(pid), stdOutFd(stdOutFd), stdErrFd(stdErrFd) {}

  void closeFds() const noexcept;

  friend struct Command;

public:
  Result<ExitStatus> wait() const noexcept;
  // Like wait(), but sends SIGTERM to the child once a stop is requested.
  Result<ExitStatus> wait(std::stop_token stopToken) const noexcept;
  Result<CommandOutput> waitWithOutput() const noexcept;
};

struct Command {
  enum class IOConfig : uint8_t {
    Null,
    Inherit,
    Piped,
  };

  std::string command;
  std::vector<std::string> arguments;
  std::filesystem::path workingDirectory;
  // Set (or overridden) in the child's environment only.
  std::vector<std::pair<std::string, std::string>> envVars;
  IOConfig stdOutConfig = IOConfig::Inherit;
  IOConfig stdErrConfig = IOConfig::Inherit;

  explicit Command(std::string_view cmd) : command(cmd) {}
  Command(std::string_view cmd, std::vector<std::string> args)
      : command(cmd), arguments(std::move(args)) {}

  Command& addArg(const std::string_view arg) {
    arguments.emplace_back(arg);
    return *this;
  }
  Command& addArgs(const std::span<const std::string> args) {
    arguments.insert(arguments.end(), args.begin(), args.end());
    return *this;
  }
  Command& addEnv(const std::string_view key, const std::string_view val) {
    envVars.emplace_back(key, val);
    return *this;
  }

  Command& setStdOutConfig(IOConfig config) noexcept {
    stdOutConfig = config;
    return *this;
  }
  Command& setStdErrConfig(IOConfig config) noexcept {
    stdErrConfig = config;
    return *this;
  }
  Command& setWorkingDirectory(const std::filesystem::path& dir) {
    workingDirectory = dir;
    return *this;
  }

  std::string toString() const;

  // Fails when the child could not enter `workingDirectory` or exec
  // `command`; the child's exit status is reported by Child::wait().
  Result<Child> spawn() const noexcept;
  Result<CommandOutput> output() const noexcept;
};

}  // namespace gocov

template <>
struct fmt::formatter<gocov::ExitStatus> : formatter<std::string> {
  auto format(const gocov::ExitStatus& v, format_context& ctx) const
      -> format_context::iterator;
};

template <>
struct fmt::formatter<gocov::Command> : formatter<std::string> {
  auto format(const gocov::Command& v, format_context& ctx) const
      -> format_context::iterator;
};
