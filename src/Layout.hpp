#pragma once

#include "Rustify/Result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gocov {

namespace fs = std::filesystem;

// How the project at the working directory is laid out.
struct Layout {
  static constexpr const char* GO_MOD = "go.mod";

  bool isModule = false;
  // Directory holding go.mod, or the GOPATH entry holding the project.
  fs::path root;
  // Module layout only: the `module` directive of go.mod.
  std::string modulePath;
  // Legacy layout only: GOPATH as the toolchain reports it.
  std::string gopath;
};

// Searches `dir` and its ancestors for go.mod.
std::optional<fs::path> findGoMod(fs::path dir);

Result<std::string> parseModulePath(std::string_view goModContent);

// Splits a GOPATH-style list; empty entries are dropped.
std::vector<fs::path> splitPathList(std::string_view list);

// Module layout when a go.mod is found above `workingDir`, otherwise the
// GOPATH entry (from `<goBin> env GOPATH`) that contains `workingDir`.
Result<Layout>
detectLayout(const fs::path& workingDir, const std::string& goBin);

// True when `path` is `base` or lies below it, comparing canonical forms.
// False when either cannot be resolved.
bool isWithin(const fs::path& path, const fs::path& base);

}  // namespace gocov
