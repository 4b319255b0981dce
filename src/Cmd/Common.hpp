#pragma once

#include "../Cli.hpp"
#include "../Config.hpp"
#include "../Error.hpp"
#include "../Parallelism.hpp"
#include "../Rustify/Result.hpp"
#include "../Workspace.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gocov {

inline const Opt OPT_BUILDFLAGS =
    Opt{ "--buildflags" }
        .setDesc("Flags passed to the go toolchain, split like a shell")
        .setPlaceholder("<FLAGS>");
inline const Opt OPT_JOBS =
    Opt{ "--jobs" }
        .setShort("-j")
        .setDesc("Number of threads copying the project")
        .setPlaceholder("<NUM>")
        .setDefault(NUM_DEFAULT_THREADS);
inline const Opt OPT_KEEP_WORKSPACE =
    Opt{ "--keep-workspace" }.setDesc(
        "Keep the temporary workspace after the command finishes"
    );

// Command line values shared by build and run; unset ones fall back to
// gocov.toml.
struct WorkspaceArgs {
  std::optional<std::string> buildFlags;
  bool keepWorkspace = false;
  std::optional<std::string> packageSpec;
};

// Consumes `--buildflags`, `-j` or `--keep-workspace` at `itr`.  Returns
// false when `*itr` is none of them.
Result<bool> parseWorkspaceOpt(
    CliArgsView::iterator& itr, CliArgsView::iterator end, WorkspaceArgs& args
);

Result<void> parseJobs(std::string_view arg);

// Options for a workspace rooted at the current directory.
Result<WorkspaceOptions>
toWorkspaceOptions(const Config& config, const WorkspaceArgs& args);

// Relocates the project, resolves the target, and hands the workspace to
// `action`.  Afterwards the workspace directory is removed unless `keep`,
// whether or not `action` succeeded.
Result<void> withWorkspace(
    WorkspaceOptions opts, const std::string& output, bool keep,
    const std::function<Result<void, Error>(Workspace&)>& action
);

inline std::shared_ptr<anyhow::error>
toAnyhow(const Error& err) {
  return err.toAnyhow();
}

}  // namespace gocov
