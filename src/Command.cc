#include "Command.hpp"

#include "Rustify/Result.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <stop_token>
#include <string>
#include <string_view>
#include <sys/select.h>
#include <sys/wait.h>
#include <tuple>
#include <unistd.h>
#include <vector>

extern char** environ;  // NOLINT(readability-redundant-declaration)

namespace gocov {

constexpr std::size_t BUFFER_SIZE = 128;

bool
ExitStatus::exitedNormally() const noexcept {
  return WIFEXITED(rawStatus);
}
bool
ExitStatus::killedBySignal() const noexcept {
  return WIFSIGNALED(rawStatus);
}
int
ExitStatus::exitCode() const noexcept {
  return WEXITSTATUS(rawStatus);
}
int
ExitStatus::termSignal() const noexcept {
  return WTERMSIG(rawStatus);
}
bool
ExitStatus::coreDumped() const noexcept {
  return WCOREDUMP(rawStatus);
}

bool
ExitStatus::success() const noexcept {
  return exitedNormally() && exitCode() == 0;
}

std::string
ExitStatus::toString() const {
  if (exitedNormally()) {
    return fmt::format("exited with code {}", exitCode());
  } else if (killedBySignal()) {
    return fmt::format(
        "killed by signal {}{}", termSignal(),
        coreDumped() ? " (core dumped)" : ""
    );
  }
  return "unknown status";
}

void
Child::closeFds() const noexcept {
  if (stdOutFd != -1) {
    close(stdOutFd);
  }
  if (stdErrFd != -1) {
    close(stdErrFd);
  }
}

Result<ExitStatus>
Child::wait() const noexcept {
  int status{};
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      closeFds();
      Bail("waitpid() failed: {}", std::strerror(errno));
    }
  }
  closeFds();
  return Ok(ExitStatus{ status });
}

Result<ExitStatus>
Child::wait(const std::stop_token stopToken) const noexcept {
  if (!stopToken.stop_possible()) {
    return wait();
  }

  {
    const std::stop_callback onStop(stopToken, [pid = pid]() noexcept {
      kill(pid, SIGTERM);
    });
    // Wait without reaping: the pid stays valid while onStop may still fire.
    siginfo_t info{};
    while (waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT)
           == -1) {
      if (errno != EINTR) {
        closeFds();
        Bail("waitid() failed: {}", std::strerror(errno));
      }
    }
  }
  return wait();
}

Result<CommandOutput>
Child::waitWithOutput() const noexcept {
  std::string stdOutOutput;
  std::string stdErrOutput;

  const int maxfd = std::max(stdOutFd, stdErrFd);
  fd_set readfds;

  bool stdOutEOF = (stdOutFd == -1);
  bool stdErrEOF = (stdErrFd == -1);

  const auto drain = [&](const int fd, bool& eof,
                         std::string& out) -> Result<void> {
    std::array<char, BUFFER_SIZE> buffer{};
    const ssize_t count = read(fd, buffer.data(), buffer.size());
    if (count == -1) {
      if (errno == EINTR) {
        return Ok();
      }
      Bail("read() failed: {}", std::strerror(errno));
    } else if (count == 0) {
      eof = true;
    } else {
      out.append(buffer.data(), static_cast<std::size_t>(count));
    }
    return Ok();
  };

  while (!stdOutEOF || !stdErrEOF) {
    FD_ZERO(&readfds);
    if (!stdOutEOF) {
      FD_SET(stdOutFd, &readfds);
    }
    if (!stdErrEOF) {
      FD_SET(stdErrFd, &readfds);
    }

    if (select(maxfd + 1, &readfds, nullptr, nullptr, nullptr) == -1) {
      if (errno == EINTR) {
        continue;
      }
      closeFds();
      Bail("select() failed: {}", std::strerror(errno));
    }

    if (!stdOutEOF && FD_ISSET(stdOutFd, &readfds)) {
      const auto res = drain(stdOutFd, stdOutEOF, stdOutOutput);
      if (res.is_err()) {
        closeFds();
        return Err(res.unwrap_err());
      }
    }
    if (!stdErrEOF && FD_ISSET(stdErrFd, &readfds)) {
      const auto res = drain(stdErrFd, stdErrEOF, stdErrOutput);
      if (res.is_err()) {
        closeFds();
        return Err(res.unwrap_err());
      }
    }
  }

  const ExitStatus exitStatus = Try(wait());
  return Ok(CommandOutput{ .exitStatus = exitStatus,
                           .stdOut = std::move(stdOutOutput),
                           .stdErr = std::move(stdErrOutput) });
}

// What the child writes to the exec-error pipe before giving up.
struct ChildFailure {
  enum Step : int {
    Chdir,
    Exec,
  };
  Step step;
  int err;
};

[[noreturn]] static void
reportChildFailure(
    const int fd, const ChildFailure::Step step, const int err
) noexcept {
  const ChildFailure failure{ step, err };
  [[maybe_unused]] const ssize_t n = write(fd, &failure, sizeof(failure));
  _exit(127);
}

static void
redirectChildStream(
    const Command::IOConfig config, const std::array<int, 2>& pipeFds,
    const int target
) noexcept {
  if (config == Command::IOConfig::Piped) {
    close(pipeFds[0]);  // Child doesn't read from its own output
    dup2(pipeFds[1], target);
    close(pipeFds[1]);
  } else if (config == Command::IOConfig::Null) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
    const int nullfd = open("/dev/null", O_WRONLY);
    dup2(nullfd, target);
    close(nullfd);
  }
}

// Builds the child's environment: the inherited one with `envVars` applied.
static std::vector<std::string>
buildEnviron(const std::vector<std::pair<std::string, std::string>>& envVars) {
  std::vector<std::string> env;
  for (char** cur = environ; cur && *cur; ++cur) {
    const std::string_view entry = *cur;
    const std::string_view key = entry.substr(0, entry.find('='));
    const bool overridden = std::ranges::any_of(envVars, [&](const auto& kv) {
      return kv.first == key;
    });
    if (!overridden) {
      env.emplace_back(entry);
    }
  }
  for (const auto& [key, val] : envVars) {
    env.emplace_back(fmt::format("{}={}", key, val));
  }
  return env;
}

static std::vector<char*>
toCStrings(std::vector<std::string>& strs) {
  std::vector<char*> ptrs;
  ptrs.reserve(strs.size() + 1);
  for (std::string& str : strs) {
    ptrs.push_back(str.data());
  }
  ptrs.push_back(nullptr);
  return ptrs;
}

Result<Child>
Command::spawn() const noexcept {
  // Everything the child needs is prepared before fork(); the child only
  // makes async-signal-safe calls.
  std::vector<std::string> argStrs;
  argStrs.reserve(arguments.size() + 1);
  argStrs.push_back(command);
  argStrs.insert(argStrs.end(), arguments.begin(), arguments.end());
  std::vector<char*> argv = toCStrings(argStrs);

  std::vector<std::string> envStrs;
  std::vector<char*> envp;
  if (!envVars.empty()) {
    envStrs = buildEnviron(envVars);
    envp = toCStrings(envStrs);
  }

  std::array<int, 2> stdOutPipe{ -1, -1 };
  std::array<int, 2> stdErrPipe{ -1, -1 };
  std::array<int, 2> failurePipe{ -1, -1 };

  const auto closePipes = [&] {
    for (const int fd : { stdOutPipe[0], stdOutPipe[1], stdErrPipe[0],
                          stdErrPipe[1], failurePipe[0], failurePipe[1] }) {
      if (fd != -1) {
        close(fd);
      }
    }
  };

  if (stdOutConfig == IOConfig::Piped && pipe(stdOutPipe.data()) == -1) {
    Bail("pipe() failed for stdout: {}", std::strerror(errno));
  }
  if (stdErrConfig == IOConfig::Piped && pipe(stdErrPipe.data()) == -1) {
    closePipes();
    Bail("pipe() failed for stderr: {}", std::strerror(errno));
  }
  // Closed by a successful exec, so an empty read means the exec went fine.
  if (pipe2(failurePipe.data(), O_CLOEXEC) == -1) {
    closePipes();
    Bail("pipe2() failed: {}", std::strerror(errno));
  }

  const pid_t pid = fork();
  if (pid == -1) {
    closePipes();
    Bail("fork() failed: {}", std::strerror(errno));
  } else if (pid == 0) {
    // Child process
    close(failurePipe[0]);
    redirectChildStream(stdOutConfig, stdOutPipe, STDOUT_FILENO);
    redirectChildStream(stdErrConfig, stdErrPipe, STDERR_FILENO);

    if (!workingDirectory.empty() && chdir(workingDirectory.c_str()) == -1) {
      reportChildFailure(failurePipe[1], ChildFailure::Chdir, errno);
    }
    if (envp.empty()) {
      execvp(command.c_str(), argv.data());
    } else {
      execvpe(command.c_str(), argv.data(), envp.data());
    }
    reportChildFailure(failurePipe[1], ChildFailure::Exec, errno);
  }

  // Parent process
  close(failurePipe[1]);
  if (stdOutConfig == IOConfig::Piped) {
    close(stdOutPipe[1]);  // Parent doesn't write to stdout pipe
  }
  if (stdErrConfig == IOConfig::Piped) {
    close(stdErrPipe[1]);  // Parent doesn't write to stderr pipe
  }
  const Child child{ pid,
                     stdOutConfig == IOConfig::Piped ? stdOutPipe[0] : -1,
                     stdErrConfig == IOConfig::Piped ? stdErrPipe[0] : -1 };

  ChildFailure failure{};
  ssize_t count = 0;
  do {
    count = read(failurePipe[0], &failure, sizeof(failure));
  } while (count == -1 && errno == EINTR);
  close(failurePipe[0]);

  if (count == static_cast<ssize_t>(sizeof(failure))) {
    std::ignore = child.wait();  // reap; the status carries no information
    if (failure.step == ChildFailure::Chdir) {
      Bail(
          "cannot enter `{}`: {}", workingDirectory.string(),
          std::strerror(failure.err)
      );
    }
    Bail("cannot execute `{}`: {}", command, std::strerror(failure.err));
  }
  return Ok(child);
}

Result<CommandOutput>
Command::output() const noexcept {
  Command cmd = *this;
  cmd.setStdOutConfig(IOConfig::Piped);
  cmd.setStdErrConfig(IOConfig::Piped);
  return Try(cmd.spawn()).waitWithOutput();
}

std::string
Command::toString() const {
  std::string res = command;
  for (const std::string& arg : arguments) {
    res += ' ';
    if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
      res += fmt::format("'{}'", arg);
    } else {
      res += arg;
    }
  }
  return res;
}

}  // namespace gocov

auto
fmt::formatter<gocov::ExitStatus>::format(
    const gocov::ExitStatus& v, format_context& ctx
) const -> format_context::iterator {
  return formatter<std::string>::format(v.toString(), ctx);
}

auto
fmt::formatter<gocov::Command>::format(
    const gocov::Command& v, format_context& ctx
) const -> format_context::iterator {
  return formatter<std::string>::format(v.toString(), ctx);
}

#ifdef GOCOV_TEST

#  include "Rustify/Tests.hpp"

#  include <chrono>
#  include <thread>

namespace tests {

using namespace gocov;  // NOLINT(build/namespaces,google-build-using-namespace)

static void
testExitStatus() {
  const auto ok = Command("true").spawn().unwrap().wait().unwrap();
  assertTrue(ok.success());
  assertEq(ok.toString(), "exited with code 0");

  const auto ng = Command("false").spawn().unwrap().wait().unwrap();
  assertFalse(ng.success());
  assertEq(ng.exitCode(), 1);

  pass();
}

static void
testOutputCapturesBothStreams() {
  const auto out = Command("/bin/sh", { "-c", "echo out; echo err >&2" })
                       .output()
                       .unwrap();
  assertTrue(out.exitStatus.success());
  assertEq(out.stdOut, "out\n");
  assertEq(out.stdErr, "err\n");

  pass();
}

static void
testSpawnReportsExecFailure() {
  const auto res = Command("/nonexistent/gocov-no-such-tool").spawn();
  assertTrue(res.is_err());
  assertTrue(
      std::string(res.unwrap_err()->what()).starts_with("cannot execute")
  );

  pass();
}

static void
testSpawnReportsChdirFailure() {
  const auto res = Command("true")
                       .setWorkingDirectory("/nonexistent/gocov-no-such-dir")
                       .spawn();
  assertTrue(res.is_err());
  assertTrue(std::string(res.unwrap_err()->what()).starts_with("cannot enter"));

  pass();
}

static void
testWorkingDirectory() {
  const TempDir tmp;
  const auto out =
      Command("pwd").setWorkingDirectory(tmp.path()).output().unwrap();
  assertEq(
      std::filesystem::canonical(out.stdOut.substr(0, out.stdOut.size() - 1)),
      std::filesystem::canonical(tmp.path())
  );

  pass();
}

static void
testEnvOverrideIsChildOnly() {
  setenv("GOCOV_TEST_VAR", "parent", 1);
  const auto out = Command("/bin/sh", { "-c", "printf %s \"$GOCOV_TEST_VAR\"" })
                       .addEnv("GOCOV_TEST_VAR", "child")
                       .output()
                       .unwrap();
  assertEq(out.stdOut, "child");
  assertEq(std::string(std::getenv("GOCOV_TEST_VAR")), "parent");

  // Without an override the inherited value is seen.
  const auto inherited =
      Command("/bin/sh", { "-c", "printf %s \"$GOCOV_TEST_VAR\"" })
          .output()
          .unwrap();
  assertEq(inherited.stdOut, "parent");

  pass();
}

static void
testWaitWithStopToken() {
  std::stop_source source;
  const Child child = Command("sleep", { "30" }).spawn().unwrap();
  std::jthread stopper([&source] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    source.request_stop();
  });
  const ExitStatus status = child.wait(source.get_token()).unwrap();
  assertTrue(status.killedBySignal());
  assertEq(status.termSignal(), SIGTERM);

  pass();
}

static void
testToString() {
  const Command cmd("go", { "build", "-ldflags", "-X main.v=1", "." });
  assertEq(cmd.toString(), "go build -ldflags '-X main.v=1' .");

  pass();
}

}  // namespace tests

int
main() {
  tests::testExitStatus();
  tests::testOutputCapturesBothStreams();
  tests::testSpawnReportsExecFailure();
  tests::testSpawnReportsChdirFailure();
  tests::testWorkingDirectory();
  tests::testEnvOverrideIsChildOnly();
  tests::testWaitWithStopToken();
  tests::testToString();
}

#endif
