#include "Workspace.hpp"

#include "Algos.hpp"
#include "Command.hpp"
#include "Diag.hpp"
#include "Error.hpp"
#include "Layout.hpp"
#include "Package.hpp"
#include "Parallelism.hpp"
#include "Rustify/Result.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>
#include <spdlog/spdlog.h>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <tbb/blocked_range.h>
#include <tbb/concurrent_vector.h>
#include <tbb/parallel_for.h>
#include <tuple>
#include <utility>
#include <vector>

namespace gocov {

std::string_view
toString(const Workspace::State state) noexcept {
  switch (state) {
    case Workspace::State::Uninitialized:
      return "uninitialized";
    case Workspace::State::Validated:
      return "validated";
    case Workspace::State::Relocated:
      return "relocated";
    case Workspace::State::PathResolved:
      return "path-resolved";
    case Workspace::State::Built:
      return "built";
    case Workspace::State::Ran:
      return "ran";
  }
  return "unknown";
}

// Lexically normal, without a trailing separator (except for `/`).
static fs::path
normalize(const fs::path& path) {
  fs::path norm = path.lexically_normal();
  if (!norm.has_filename() && norm.has_relative_path()) {
    norm = norm.parent_path();
  }
  return norm;
}

Result<void>
copyTree(
    const fs::path& from, const fs::path& to,
    const std::vector<fs::path>& excludes
) {
  std::vector<fs::path> normExcludes;
  normExcludes.reserve(excludes.size());
  for (const fs::path& exclude : excludes) {
    normExcludes.push_back(normalize(exclude));
  }
  const auto isExcluded = [&normExcludes](const fs::path& rel) {
    return std::ranges::any_of(normExcludes, [&rel](const fs::path& exclude) {
      return std::mismatch(
                 exclude.begin(), exclude.end(), rel.begin(), rel.end()
             )
                 .first
             == exclude.end();
    });
  };

  std::error_code ec;
  fs::create_directories(to, ec);
  Ensure(!ec, "cannot create {}: {}", to.string(), ec.message());

  // Directories and symlinks are created while walking; regular files are
  // copied afterwards, when every parent directory exists.
  std::vector<std::pair<fs::path, fs::path>> files;
  for (auto itr = fs::recursive_directory_iterator(from, ec);
       !ec && itr != fs::recursive_directory_iterator(); itr.increment(ec)) {
    const fs::directory_entry& entry = *itr;
    const fs::path rel = entry.path().lexically_relative(from);
    const fs::path dest = to / rel;
    if (isExcluded(rel)) {
      Diag::veryVerbose("Excluding {}", rel.string());
      itr.disable_recursion_pending();
      continue;
    }

    if (entry.is_symlink(ec)) {
      fs::copy_symlink(entry.path(), dest, ec);
    } else if (entry.is_directory(ec)) {
      fs::create_directories(dest, ec);
    } else if (entry.is_regular_file(ec)) {
      files.emplace_back(entry.path(), dest);
    } else if (!ec) {
      spdlog::debug("Skipping special file {}", entry.path().string());
    }
    Ensure(!ec, "cannot copy {}: {}", entry.path().string(), ec.message());
  }
  Ensure(!ec, "cannot read {}: {}", from.string(), ec.message());

  const auto copyFile =
      [](const std::pair<fs::path, fs::path>& file) -> Result<void> {
    std::error_code ec;
    fs::copy_file(
        file.first, file.second, fs::copy_options::overwrite_existing, ec
    );
    Ensure(!ec, "cannot copy {}: {}", file.first.string(), ec.message());
    spdlog::trace("Copied {}", file.first.string());
    return Ok();
  };

  if (isParallel()) {
    tbb::concurrent_vector<std::string> results;
    tbb::parallel_for(
        tbb::blocked_range<std::size_t>(0, files.size()),
        [&](const tbb::blocked_range<std::size_t>& rng) {
          for (std::size_t i = rng.begin(); i != rng.end(); ++i) {
            std::ignore =
                copyFile(files[i]).map_err([&results](const auto& err) {
                  results.push_back(err->what());
                });
          }
        }
    );
    if (!results.empty()) {
      Bail("{}", fmt::join(results, "\n"));
    }
  } else {
    for (const auto& file : files) {
      Try(copyFile(file));
    }
  }

  Diag::verbose(
      "Copied {} file(s) from {} to {}", files.size(), from.string(),
      to.string()
  );
  return Ok();
}

Result<Workspace, Error>
Workspace::init(WorkspaceOptions opts) noexcept {
  if (!isCurrentDirSpec(opts.packageSpec)) {
    return fail(
        ErrorKind::InvalidPackageSpec,
        "unsupported package `{}`: only `{}` can be built", opts.packageSpec,
        CURRENT_DIR_SPEC
    );
  }

  std::error_code ec;
  if (opts.workingDir.empty()) {
    opts.workingDir = fs::current_path(ec);
    if (ec) {
      return fail(
          ErrorKind::RelocationFailure,
          "cannot determine the current directory: {}", ec.message()
      );
    }
  }
  const fs::path absWorkingDir = fs::absolute(opts.workingDir, ec);
  if (ec) {
    return fail(
        ErrorKind::RelocationFailure, "cannot resolve {}: {}",
        opts.workingDir.string(), ec.message()
    );
  }
  opts.workingDir = normalize(absWorkingDir);

  if (opts.baseDir.empty()) {
    opts.baseDir = fs::temp_directory_path(ec);
    if (ec) {
      return fail(
          ErrorKind::RelocationFailure,
          "cannot determine the temporary directory: {}", ec.message()
      );
    }
  }
  const fs::path absBaseDir = fs::absolute(opts.baseDir, ec);
  if (ec) {
    return fail(
        ErrorKind::RelocationFailure, "cannot resolve {}: {}",
        opts.baseDir.string(), ec.message()
    );
  }
  opts.baseDir = normalize(absBaseDir);

  Workspace ws(std::move(opts));
  ws.state = State::Validated;
  return Ok(std::move(ws));
}

Result<void, Error>
Workspace::relocate() noexcept {
  if (state != State::Validated) {
    return fail(
        ErrorKind::CallSequenceViolation,
        "relocate() needs a validated workspace, but it is {}", state
    );
  }

  const Layout layout =
      Try(detectLayout(opts.workingDir, opts.goBin)
              .map_err(toError(ErrorKind::RelocationFailure)));
  PackageGraph graph = Try(listPackages(opts.goBin, opts.workingDir)
                               .map_err(toError(ErrorKind::RelocationFailure)));

  const fs::path dir =
      opts.baseDir
      / fmt::format("{}{}", TMP_DIR_PREFIX, hashHex(opts.workingDir.string()));
  std::error_code ec;
  const fs::path rel = fs::relative(opts.workingDir, layout.root, ec);
  if (ec) {
    return fail(
        ErrorKind::RelocationFailure, "cannot locate {} within {}: {}",
        opts.workingDir.string(), layout.root.string(), ec.message()
    );
  }
  const fs::path workDir = normalize(dir / rel);

  // The module root is copied as a whole; in GOPATH only the working
  // directory subtree, the rest stays reachable through the original GOPATH.
  const fs::path& copyFrom = layout.isModule ? layout.root : opts.workingDir;
  const fs::path& copyTo = layout.isModule ? dir : workDir;
  if (isWithin(dir, copyFrom)) {
    return fail(
        ErrorKind::RelocationFailure,
        "workspace directory {} must not be inside {}", dir.string(),
        copyFrom.string()
    );
  }

  if (fs::exists(dir, ec)) {
    spdlog::debug("Removing previous workspace {}", dir.string());
    fs::remove_all(dir, ec);
  }
  if (ec) {
    return fail(
        ErrorKind::RelocationFailure, "cannot remove previous workspace {}: {}",
        dir.string(), ec.message()
    );
  }

  if (const auto res = copyTree(copyFrom, copyTo, opts.excludes);
      res.is_err()) {
    fs::remove_all(dir, ec);
    if (ec) {
      spdlog::debug("cannot remove {}: {}", dir.string(), ec.message());
    }
    return fail(
        ErrorKind::RelocationFailure, "cannot relocate {}: {}",
        copyFrom.string(), res.unwrap_err()->what()
    );
  }

  packageGraph = std::move(graph);
  tmpDir = dir;
  tmpWorkingDir = workDir;
  isModuleProject = layout.isModule;
  projectRoot = layout.root;
  modulePath = layout.modulePath;
  if (!layout.isModule) {
    origGopath = layout.gopath;
    newGopath = fmt::format("{}:{}", dir.string(), layout.gopath);
  }
  state = State::Relocated;

  Diag::info(
      "Relocated", "{} to {}", opts.workingDir.string(), tmpWorkingDir.string()
  );
  return Ok();
}

Result<fs::path, Error>
Workspace::resolveTarget(const std::string& output) noexcept {
  if (tmpDir.empty()) {
    return fail(
        ErrorKind::CallSequenceViolation,
        "the output path cannot be resolved before the workspace is relocated"
    );
  }
  if (state >= State::PathResolved) {
    if (!output.empty() && normalize(opts.workingDir / output) != targetPath) {
      spdlog::debug(
          "Output path already resolved to {}; ignoring {}",
          targetPath.string(), output
      );
    }
    return Ok(targetPath);
  }

  if (!output.empty()) {
    // An absolute `output` replaces workingDir entirely.
    targetPath = normalize(opts.workingDir / output);
  } else {
    std::string name = opts.workingDir.filename().string();
    if (isModuleProject) {
      name = replaceAll(std::move(name), "_", "-");
    }
    targetPath = opts.workingDir / name;
  }
  state = State::PathResolved;
  spdlog::debug("Output path: {}", targetPath.string());
  return Ok(targetPath);
}

Result<Workspace, Error>
Workspace::prepare(WorkspaceOptions opts, const std::string& output) noexcept {
  Workspace ws = Try(init(std::move(opts)));
  Try(ws.relocate());
  Try(ws.resolveTarget(output));
  return Ok(std::move(ws));
}

Result<void, Error>
Workspace::ensureState(const State least, const std::string_view op) const {
  if (state < least) {
    return fail(
        ErrorKind::CallSequenceViolation,
        "{} needs a workspace that is at least {}, but it is {}", op, least,
        state
    );
  }
  return Ok();
}

Command
Workspace::toolchainCommand(const std::string_view subcmd) const {
  Command cmd = Command(opts.goBin)
                    .addArg(subcmd)
                    .addArgs(opts.buildFlags)
                    .setWorkingDirectory(tmpWorkingDir);
  if (!newGopath.empty()) {
    cmd.addEnv("GOPATH", newGopath);
  }
  return cmd;
}

Result<Command, Error>
Workspace::buildCommand() const noexcept {
  Try(ensureState(State::PathResolved, "buildCommand()"));
  return Ok(toolchainCommand("build")
                .addArg("-o")
                .addArg(targetPath.string())
                .addArg(opts.packageSpec));
}

Result<Command, Error>
Workspace::runCommand() const noexcept {
  Try(ensureState(State::PathResolved, "runCommand()"));
  Command cmd = toolchainCommand("run");
  if (!opts.runExec.empty()) {
    cmd.addArg("-exec").addArg(opts.runExec);
  }
  return Ok(cmd.addArg(opts.packageSpec).addArgs(opts.runArgs));
}

Result<void, Error>
Workspace::invoke(
    const Command& cmd, const std::string_view what,
    const std::stop_token stopToken
) {
  Diag::verbose("Running `{}` in {}", cmd, tmpWorkingDir.string());
  const Child child =
      Try(cmd.spawn().map_err(toError(ErrorKind::ProcessStartFailure)));
  const ExitStatus status = Try(
      child.wait(stopToken).map_err(toError(ErrorKind::ProcessExecutionFailure))
  );
  if (!status.success()) {
    if (stopToken.stop_requested()) {
      return fail(ErrorKind::Cancelled, "`go {}` was cancelled", what);
    }
    return fail(
        ErrorKind::ProcessExecutionFailure, "`go {}` {}", what, status
    );
  }
  return Ok();
}

Result<void, Error>
Workspace::build(const std::stop_token stopToken) noexcept {
  const Command cmd = Try(buildCommand());
  Diag::info("Building", "{}", targetPath.string());
  Try(invoke(cmd, "build", stopToken));
  state = State::Built;
  return Ok();
}

Result<void, Error>
Workspace::run(const std::stop_token stopToken) noexcept {
  const Command cmd = Try(runCommand());
  Diag::info("Running", "`{}`", cmd);
  Try(invoke(cmd, "run", stopToken));
  state = State::Ran;
  return Ok();
}

}  // namespace gocov

#ifdef GOCOV_TEST

#  include "Rustify/Tests.hpp"

#  include <chrono>
#  include <cstdio>
#  include <fcntl.h>
#  include <fstream>
#  include <iterator>
#  include <thread>
#  include <unistd.h>

namespace tests {

using namespace gocov;  // NOLINT(build/namespaces,google-build-using-namespace)

// A `go` that answers `env GOPATH` and `list`, and appends every build or
// run invocation to `log`.  `buildBody` replaces the recording for build.
static fs::path
writeFakeGo(
    const fs::path& dir, const fs::path& gopath, const fs::path& log,
    const std::string_view buildBody = ""
) {
  const fs::path goBin = dir / "fakego/go";
  writeScript(
      goBin,
      fmt::format(
          R"(case "$1" in
env) echo '{0}' ;;
list)
  printf '{{"ImportPath": "example.com/app", "Name": "main", "Dir": "%s"}}\n' \
    "$(pwd)"
  ;;
build|run)
  {2}
  echo "args: $*" >> '{1}'
  echo "GOPATH: $GOPATH" >> '{1}'
  echo "pwd: $(pwd)" >> '{1}'
  ;;
*) exit 2 ;;
esac
)",
          gopath.string(), log.string(), buildBody
      )
  );
  return goBin;
}

static std::string
readFile(const fs::path& path) {
  std::ifstream ifs(path);
  return { std::istreambuf_iterator<char>(ifs),
           std::istreambuf_iterator<char>() };
}

// <tmp>/gopath/src/myapp with a main package and a fake toolchain.
struct LegacyFixture {
  TempDir tmp;
  fs::path gopath = tmp.path() / "gopath";
  fs::path project = gopath / "src/myapp";
  fs::path log = tmp.path() / "go.log";
  fs::path goBin;

  explicit LegacyFixture(const std::string_view buildBody = "") {
    writeFile(project / "main.go", "package main\n");
    writeFile(project / "internal/util.go", "package internal\n");
    goBin = writeFakeGo(tmp.path(), gopath, log, buildBody);
  }

  WorkspaceOptions options() const {
    WorkspaceOptions opts;
    opts.workingDir = project;
    opts.baseDir = tmp.path() / "base";
    opts.goBin = goBin.string();
    return opts;
  }
};

// <tmp>/src/my_app with go.mod, working in its `cmd` subdirectory.
struct ModuleFixture {
  TempDir tmp;
  fs::path root = tmp.path() / "src/my_app";
  fs::path log = tmp.path() / "go.log";
  fs::path goBin;

  ModuleFixture() {
    writeFile(root / "go.mod", "module example.com/my_app\n\ngo 1.21\n");
    writeFile(root / "main.go", "package main\n");
    writeFile(root / "cmd/tool/main.go", "package main\n");
    writeFile(root / ".git/HEAD", "ref: refs/heads/main\n");
    fs::create_symlink("main.go", root / "alias.go");
    goBin = writeFakeGo(tmp.path(), "/unused", log);
  }

  WorkspaceOptions options(const fs::path& workingDir) const {
    WorkspaceOptions opts;
    opts.workingDir = workingDir;
    opts.baseDir = tmp.path() / "base";
    opts.goBin = goBin.string();
    return opts;
  }
};

static void
testRejectsOtherPackageSpecs() {
  const TempDir tmp;
  for (const char* spec : { "./sub", "", "./...", "example.com/app", "..",
                            "./" }) {
    WorkspaceOptions opts;
    opts.packageSpec = spec;
    opts.workingDir = tmp.path();
    opts.baseDir = tmp.path() / "base";

    const auto res = Workspace::init(opts);
    assertTrue(res.is_err());
    assertEq(res.unwrap_err().kind, ErrorKind::InvalidPackageSpec);
  }
  assertFalse(fs::exists(tmp.path() / "base"));

  pass();
}

static void
testOutOfOrderCalls() {
  const LegacyFixture fx;
  Workspace ws = Workspace::init(fx.options()).unwrap();
  assertEq(ws.getState(), Workspace::State::Validated);

  const auto early = ws.resolveTarget("");
  assertTrue(early.is_err());
  assertEq(early.unwrap_err().kind, ErrorKind::CallSequenceViolation);
  assertEq(
      ws.buildCommand().unwrap_err().kind, ErrorKind::CallSequenceViolation
  );
  assertEq(ws.build().unwrap_err().kind, ErrorKind::CallSequenceViolation);
  assertEq(ws.run().unwrap_err().kind, ErrorKind::CallSequenceViolation);
  assertEq(ws.getState(), Workspace::State::Validated);
  assertFalse(fs::exists(fx.log));

  ws.relocate().unwrap();
  assertEq(ws.getState(), Workspace::State::Relocated);
  assertEq(ws.relocate().unwrap_err().kind, ErrorKind::CallSequenceViolation);
  assertEq(ws.build().unwrap_err().kind, ErrorKind::CallSequenceViolation);

  pass();
}

static void
testLegacyRelocation() {
  const LegacyFixture fx;
  Workspace ws = Workspace::init(fx.options()).unwrap();
  ws.relocate().unwrap();

  assertFalse(ws.isModule());
  assertEq(ws.getRoot(), fx.gopath);
  assertEq(ws.getTmpDir().parent_path(), fx.tmp.path() / "base");
  assertTrue(ws.getTmpDir().filename().string().starts_with(
      Workspace::TMP_DIR_PREFIX
  ));
  assertEq(ws.getTmpWorkingDir(), ws.getTmpDir() / "src/myapp");
  assertEq(ws.getOrigGopath(), fx.gopath.string());
  assertEq(
      ws.getNewGopath(),
      fmt::format("{}:{}", ws.getTmpDir().string(), fx.gopath.string())
  );
  assertTrue(fs::is_regular_file(ws.getTmpWorkingDir() / "main.go"));
  assertTrue(fs::is_regular_file(ws.getTmpWorkingDir() / "internal/util.go"));
  assertEq(ws.getPackages().size(), 1UL);
  assertTrue(ws.getPackages().at("example.com/app").isMain());

  // Legacy names keep their underscores; only the name is derived.
  assertEq(ws.resolveTarget("").unwrap(), fx.project / "myapp");

  pass();
}

static void
testModuleRelocation() {
  const ModuleFixture fx;
  WorkspaceOptions opts = fx.options(fx.root / "cmd/tool");
  opts.excludes = { ".git" };
  Workspace ws = Workspace::init(opts).unwrap();
  ws.relocate().unwrap();

  assertTrue(ws.isModule());
  assertEq(ws.getModulePath(), "example.com/my_app");
  assertEq(ws.getRoot(), fx.root);
  assertTrue(ws.getNewGopath().empty());
  assertTrue(ws.getOrigGopath().empty());
  assertEq(ws.getTmpWorkingDir(), ws.getTmpDir() / "cmd/tool");

  // The whole module is copied, minus exclusions.
  assertTrue(fs::is_regular_file(ws.getTmpDir() / "go.mod"));
  assertTrue(fs::is_regular_file(ws.getTmpDir() / "main.go"));
  assertTrue(fs::is_regular_file(ws.getTmpWorkingDir() / "main.go"));
  assertFalse(fs::exists(ws.getTmpDir() / ".git"));
  assertTrue(fs::is_symlink(ws.getTmpDir() / "alias.go"));
  assertEq(fs::read_symlink(ws.getTmpDir() / "alias.go"), fs::path("main.go"));

  pass();
}

static void
testModuleDefaultTarget() {
  const ModuleFixture fx;
  Workspace ws = Workspace::prepare(fx.options(fx.root), "").unwrap();
  assertEq(ws.getState(), Workspace::State::PathResolved);
  assertEq(ws.getTarget(), fx.root / "my-app");

  pass();
}

static void
testExplicitTarget() {
  {
    const ModuleFixture fx;
    const Workspace ws =
        Workspace::prepare(fx.options(fx.root), "/out").unwrap();
    assertEq(ws.getTarget(), fs::path("/out"));
  }
  {
    const LegacyFixture fx;
    const Workspace ws = Workspace::prepare(fx.options(), "/out/").unwrap();
    assertEq(ws.getTarget(), fs::path("/out"));
  }
  {
    const LegacyFixture fx;
    const Workspace ws =
        Workspace::prepare(fx.options(), "bin/../out/app").unwrap();
    assertEq(ws.getTarget(), fx.project / "out/app");
  }

  pass();
}

static void
testTargetIsStable() {
  const LegacyFixture fx;
  Workspace ws = Workspace::init(fx.options()).unwrap();
  ws.relocate().unwrap();
  const fs::path first = ws.resolveTarget("").unwrap();
  assertEq(ws.resolveTarget("").unwrap(), first);
  assertEq(ws.resolveTarget("/elsewhere").unwrap(), first);

  // Same inputs, same workspace and target.
  const Workspace again = Workspace::prepare(fx.options(), "").unwrap();
  assertEq(again.getTarget(), first);
  assertEq(again.getTmpDir(), ws.getTmpDir());

  pass();
}

static void
testRelocationReplacesPreviousWorkspace() {
  const LegacyFixture fx;
  const fs::path tmpDir =
      Workspace::prepare(fx.options(), "").unwrap().getTmpDir();
  writeFile(tmpDir / "src/myapp/stale.go", "package main\n");

  const Workspace ws = Workspace::prepare(fx.options(), "").unwrap();
  assertEq(ws.getTmpDir(), tmpDir);
  assertFalse(fs::exists(tmpDir / "src/myapp/stale.go"));
  assertTrue(fs::exists(tmpDir / "src/myapp/main.go"));

  pass();
}

static void
testRelocationFailure() {
  const TempDir tmp;
  fs::create_directories(tmp.path() / "loose");
  WorkspaceOptions opts;
  opts.workingDir = tmp.path() / "loose";
  opts.baseDir = tmp.path() / "base";
  opts.goBin =
      writeFakeGo(tmp.path(), tmp.path() / "gopath", tmp.path() / "log")
          .string();

  Workspace ws = Workspace::init(opts).unwrap();
  assertEq(ws.relocate().unwrap_err().kind, ErrorKind::RelocationFailure);
  assertEq(ws.getState(), Workspace::State::Validated);
  assertTrue(ws.getTmpDir().empty());

  // The workspace must not end up inside the tree being copied.
  const LegacyFixture fx;
  WorkspaceOptions nested = fx.options();
  nested.baseDir = fx.project / "tmp";
  assertEq(
      Workspace::init(nested).unwrap().relocate().unwrap_err().kind,
      ErrorKind::RelocationFailure
  );

  pass();
}

static void
testBuildCommand() {
  const LegacyFixture fx;
  WorkspaceOptions opts = fx.options();
  opts.buildFlags = { "-v" };
  const Workspace ws = Workspace::prepare(opts, "/out/app").unwrap();

  const Command cmd = ws.buildCommand().unwrap();
  assertEq(cmd.command, fx.goBin.string());
  assertEq(
      cmd.arguments,
      (std::vector<std::string>{ "build", "-v", "-o", "/out/app", "." })
  );
  assertEq(cmd.workingDirectory, ws.getTmpWorkingDir());
  assertEq(cmd.envVars.size(), 1UL);
  assertEq(cmd.envVars[0].first, "GOPATH");
  assertEq(cmd.envVars[0].second, ws.getNewGopath());

  // Asking again yields the same command.
  assertEq(ws.buildCommand().unwrap().arguments, cmd.arguments);

  pass();
}

static void
testRunCommand() {
  const ModuleFixture fx;
  WorkspaceOptions opts = fx.options(fx.root);
  opts.buildFlags = { "-race" };
  opts.runExec = "xprog";
  opts.runArgs = { "--port", "80" };
  const Workspace ws = Workspace::prepare(opts, "").unwrap();

  const Command cmd = ws.runCommand().unwrap();
  assertEq(
      cmd.arguments, (std::vector<std::string>{ "run", "-race", "-exec",
                                                "xprog", ".", "--port", "80" })
  );
  // Module builds inherit the environment untouched.
  assertTrue(cmd.envVars.empty());

  pass();
}

static void
testBuildIsIdempotent() {
  const LegacyFixture fx;
  WorkspaceOptions opts = fx.options();
  opts.buildFlags = { "-v" };
  Workspace ws = Workspace::prepare(opts, "").unwrap();

  ws.build().unwrap();
  assertEq(ws.getState(), Workspace::State::Built);
  ws.build().unwrap();

  const std::string expected = fmt::format(
      "args: build -v -o {} .\nGOPATH: {}\npwd: {}\n",
      ws.getTarget().string(), ws.getNewGopath(),
      fs::canonical(ws.getTmpWorkingDir()).string()
  );
  assertEq(readFile(fx.log), expected + expected);

  pass();
}

static void
testRunPassesArguments() {
  const ModuleFixture fx;
  WorkspaceOptions opts = fx.options(fx.root);
  opts.runArgs = { "hello world" };
  Workspace ws = Workspace::prepare(opts, "").unwrap();

  ws.run().unwrap();
  assertEq(ws.getState(), Workspace::State::Ran);
  assertTrue(readFile(fx.log).starts_with("args: run . hello world\n"));

  pass();
}

static void
testBuildFailure() {
  const LegacyFixture fx("exit 3");
  Workspace ws = Workspace::prepare(fx.options(), "").unwrap();

  const auto res = ws.build();
  assertTrue(res.is_err());
  assertEq(res.unwrap_err().kind, ErrorKind::ProcessExecutionFailure);
  assertEq(ws.getState(), Workspace::State::PathResolved);
  // The workspace is left for the caller to inspect or remove.
  assertTrue(fs::exists(ws.getTmpWorkingDir()));

  // Run reports failures the same way instead of exiting.
  assertEq(ws.run().unwrap_err().kind, ErrorKind::ProcessExecutionFailure);

  pass();
}

static void
testStartFailure() {
  const LegacyFixture fx;
  Workspace ws = Workspace::prepare(fx.options(), "").unwrap();
  fs::remove_all(ws.getTmpDir());

  assertEq(ws.build().unwrap_err().kind, ErrorKind::ProcessStartFailure);
  assertEq(ws.run().unwrap_err().kind, ErrorKind::ProcessStartFailure);

  pass();
}

static void
testCancelledBuild() {
  const LegacyFixture fx("exec sleep 30");
  Workspace ws = Workspace::prepare(fx.options(), "").unwrap();

  std::stop_source source;
  const std::jthread stopper([&source] {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    source.request_stop();
  });
  const auto begin = std::chrono::steady_clock::now();
  const auto res = ws.build(source.get_token());
  assertTrue(res.is_err());
  assertEq(res.unwrap_err().kind, ErrorKind::Cancelled);
  assertTrue(
      std::chrono::steady_clock::now() - begin < std::chrono::seconds(10)
  );

  pass();
}

static void
testCopyTreeExcludesNestedPaths() {
  const TempDir tmp;
  writeFile(tmp.path() / "from/a/b/keep.go", "x");
  writeFile(tmp.path() / "from/a/b/vendor/skip.go", "x");
  writeFile(tmp.path() / "from/ab/keep.go", "x");
  writeFile(tmp.path() / "from/a/skip.txt", "x");

  copyTree(
      tmp.path() / "from", tmp.path() / "to", { "a/b/vendor/", "a/skip.txt" }
  )
      .unwrap();
  assertTrue(fs::exists(tmp.path() / "to/a/b/keep.go"));
  assertTrue(fs::exists(tmp.path() / "to/ab/keep.go"));
  assertFalse(fs::exists(tmp.path() / "to/a/b/vendor"));
  assertFalse(fs::exists(tmp.path() / "to/a/skip.txt"));

  pass();
}

// Runs `fn` with stderr redirected to `path`.
template <typename Fn>
static void
captureStderr(const fs::path& path, Fn&& fn) {
  std::fflush(stderr);
  const int saved = ::dup(STDERR_FILENO);
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  assertTrue(saved != -1 && fd != -1);
  ::dup2(fd, STDERR_FILENO);
  ::close(fd);
  std::forward<Fn>(fn)();
  std::fflush(stderr);
  ::dup2(saved, STDERR_FILENO);
  ::close(saved);
}

static void
testCopyTreeReportsWhenVerbose() {
  const TempDir tmp;
  writeFile(tmp.path() / "from/main.go", "package main\n");
  writeFile(tmp.path() / "from/vendor/dep.go", "package dep\n");
  const fs::path log = tmp.path() / "stderr.log";
  const auto copyTo = [&tmp](const std::string_view to) {
    assertTrue(
        copyTree(tmp.path() / "from", tmp.path() / to, { "vendor" }).is_ok()
    );
  };

  setDiagLevel(DiagLevel::Info);
  captureStderr(log, [&] { copyTo("info"); });
  assertEq(readFile(log), "");

  setDiagLevel(DiagLevel::Verbose);
  captureStderr(log, [&] { copyTo("verbose"); });
  std::string out = readFile(log);
  assertTrue(out.starts_with("Copied 1 file(s) from "));
  assertTrue(out.find("Excluding") == std::string::npos);

  setDiagLevel(DiagLevel::VeryVerbose);
  captureStderr(log, [&] { copyTo("very-verbose"); });
  out = readFile(log);
  assertTrue(out.find("Excluding vendor\n") != std::string::npos);
  assertTrue(out.find("Copied 1 file(s) from ") != std::string::npos);

  setDiagLevel(DiagLevel::Info);
  pass();
}

static void
testBuildReportsCommandWhenVerbose() {
  const LegacyFixture fx;
  Workspace ws = Workspace::prepare(fx.options(), "").unwrap();
  const fs::path log = fx.tmp.path() / "stderr.log";

  setDiagLevel(DiagLevel::Verbose);
  captureStderr(log, [&ws] { assertTrue(ws.build().is_ok()); });
  setDiagLevel(DiagLevel::Info);

  assertTrue(
      readFile(log).find(fmt::format(
          "Running `{} build -o {} .` in {}", fx.goBin.string(),
          (fx.project / "myapp").string(), ws.getTmpWorkingDir().string()
      ))
      != std::string::npos
  );

  pass();
}

}  // namespace tests

int
main() {
  tests::testRejectsOtherPackageSpecs();
  tests::testOutOfOrderCalls();
  tests::testLegacyRelocation();
  tests::testModuleRelocation();
  tests::testModuleDefaultTarget();
  tests::testExplicitTarget();
  tests::testTargetIsStable();
  tests::testRelocationReplacesPreviousWorkspace();
  tests::testRelocationFailure();
  tests::testBuildCommand();
  tests::testRunCommand();
  tests::testBuildIsIdempotent();
  tests::testRunPassesArguments();
  tests::testBuildFailure();
  tests::testStartFailure();
  tests::testCancelledBuild();
  tests::testCopyTreeExcludesNestedPaths();
  tests::testCopyTreeReportsWhenVerbose();
  tests::testBuildReportsCommandWhenVerbose();
}

#endif
