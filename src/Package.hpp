#pragma once

#include "Rustify/Result.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gocov {

namespace fs = std::filesystem;

struct Module {
  std::string path;  // e.g. github.com/acme/app
  std::string dir;   // directory holding go.mod
  std::string goMod;
};

// Metadata of one package as printed by `go list -json`.  Only the fields
// the instrumentation step consumes are kept.
struct Package {
  std::string importPath;
  std::string name;
  std::string dir;
  std::string root;  // GOPATH entry or GOROOT containing the package
  bool standard = false;
  std::vector<std::string> goFiles;
  std::vector<std::string> cgoFiles;
  std::vector<std::string> testGoFiles;
  std::vector<std::string> deps;
  std::optional<Module> module;
  std::optional<std::string> error;

  bool isMain() const noexcept {
    return name == "main";
  }
};

// Import path -> package; ordered so iteration is deterministic.
using PackageGraph = std::map<std::string, Package>;

// Decodes the concatenated JSON objects `go list -json` prints.
Result<PackageGraph> parsePackageList(std::string_view json);

// Runs `<goBin> list -json ./...` in `dir`.
Result<PackageGraph>
listPackages(const std::string& goBin, const fs::path& dir);

}  // namespace gocov
