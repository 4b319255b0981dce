#pragma once

#include "Command.hpp"
#include "Error.hpp"
#include "Package.hpp"
#include "Rustify/Result.hpp"

#include <cstdint>
#include <filesystem>
#include <fmt/format.h>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gocov {

namespace fs = std::filesystem;

inline constexpr std::string_view CURRENT_DIR_SPEC = ".";

// The only package spec a workspace accepts.
inline bool
isCurrentDirSpec(const std::string_view spec) noexcept {
  return spec == CURRENT_DIR_SPEC;
}

struct WorkspaceOptions {
  std::string packageSpec{ CURRENT_DIR_SPEC };
  std::vector<std::string> buildFlags;
  std::string runExec;  // `go run -exec` wrapper, empty for none
  std::vector<std::string> runArgs;

  fs::path workingDir;  // defaults to the current directory
  fs::path baseDir;     // defaults to the system temp directory
  // Paths relative to the copied root that are left out of the workspace.
  std::vector<fs::path> excludes;
  std::string goBin = "go";
};

// A Go project relocated into a temporary directory, and the toolchain
// invocations against it.
//
// Operations must be called in order: init(), relocate(), resolveTarget(),
// then build() or run() any number of times.  Calling one too early fails
// with CallSequenceViolation and leaves the workspace untouched.
class Workspace {
public:
  enum class State : std::uint8_t {
    Uninitialized,
    Validated,
    Relocated,
    PathResolved,
    Built,
    Ran,
  };

  static constexpr std::string_view TMP_DIR_PREFIX = "gocov-build-";

private:
  State state = State::Uninitialized;
  WorkspaceOptions opts;

  PackageGraph packageGraph;
  std::string origGopath;
  std::string newGopath;
  fs::path tmpDir;
  fs::path tmpWorkingDir;
  bool isModuleProject = false;
  fs::path projectRoot;
  std::string modulePath;
  fs::path targetPath;

  explicit Workspace(WorkspaceOptions opts) noexcept
      : opts(std::move(opts)) {}

public:
  // Rejects any package spec but `.` before touching the filesystem.
  static Result<Workspace, Error> init(WorkspaceOptions opts) noexcept;

  // Copies the project into <baseDir>/gocov-build-<hash> and lists its
  // packages.
  Result<void, Error> relocate() noexcept;

  // Absolute path of the binary to build.  A non-empty `output` is taken
  // as given (relative to the working directory); otherwise the name is
  // derived from the working directory.  The first successful call fixes
  // the result.
  Result<fs::path, Error> resolveTarget(const std::string& output) noexcept;

  // init(), relocate() and resolveTarget() in one go.
  static Result<Workspace, Error>
  prepare(WorkspaceOptions opts, const std::string& output) noexcept;

  Result<Command, Error> buildCommand() const noexcept;
  Result<Command, Error> runCommand() const noexcept;

  // Run the toolchain in the workspace and wait for it.  A stop request
  // terminates the child and yields Cancelled.
  Result<void, Error> build(std::stop_token stopToken = {}) noexcept;
  Result<void, Error> run(std::stop_token stopToken = {}) noexcept;

  State getState() const noexcept {
    return state;
  }
  // Import path -> package, for the instrumentation step.
  const PackageGraph& getPackages() const noexcept {
    return packageGraph;
  }
  const std::string& getOrigGopath() const noexcept {
    return origGopath;
  }
  // Empty in module layout.
  const std::string& getNewGopath() const noexcept {
    return newGopath;
  }
  const fs::path& getTmpDir() const noexcept {
    return tmpDir;
  }
  const fs::path& getTmpWorkingDir() const noexcept {
    return tmpWorkingDir;
  }
  bool isModule() const noexcept {
    return isModuleProject;
  }
  const fs::path& getRoot() const noexcept {
    return projectRoot;
  }
  const std::string& getModulePath() const noexcept {
    return modulePath;
  }
  const fs::path& getTarget() const noexcept {
    return targetPath;
  }

private:
  Result<void, Error> ensureState(State least, std::string_view op) const;
  Command toolchainCommand(std::string_view subcmd) const;
  Result<void, Error>
  invoke(const Command& cmd, std::string_view what, std::stop_token stopToken);
};

std::string_view toString(Workspace::State state) noexcept;

// Copies `from` into `to`, skipping `excludes` (relative to `from`).
// Symlinks are recreated, not followed.
Result<void> copyTree(
    const fs::path& from, const fs::path& to,
    const std::vector<fs::path>& excludes
);

}  // namespace gocov

template <>
struct fmt::formatter<gocov::Workspace::State> : formatter<std::string_view> {
  auto format(gocov::Workspace::State v, format_context& ctx) const
      -> format_context::iterator {
    return formatter<std::string_view>::format(gocov::toString(v), ctx);
  }
};
