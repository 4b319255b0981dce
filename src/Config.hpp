#pragma once

#include "Rustify/Result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <toml.hpp>
#include <vector>

namespace gocov {

namespace fs = std::filesystem;

// Settings read from gocov.toml.  Every field is optional; command line
// options take precedence over them.
struct Config {
  static constexpr const char* FILE_NAME = "gocov.toml";
  static constexpr const char* ENV_NAME = "GOCOV_CONFIG";

  fs::path path;  // empty when no file was loaded

  std::optional<std::string> goBin;

  std::optional<std::vector<std::string>> buildFlags;
  std::optional<std::string> buildOutput;

  std::optional<std::string> runExec;
  std::optional<std::vector<std::string>> runArgs;

  // Relative to the directory holding the config file.
  std::optional<fs::path> baseDir;
  bool keepWorkspace = false;
  std::vector<std::string> excludes;

  std::optional<std::string> listHost;
  bool listWide = false;

  static Result<Config>
  tryFromToml(const toml::value& val, fs::path path = "unknown") noexcept;

  // Reads $GOCOV_CONFIG if set, else the nearest gocov.toml at or above
  // `workingDir`.  Without either, returns the defaults.
  static Result<Config> load(const fs::path& workingDir) noexcept;

  static std::optional<fs::path> findPath(fs::path dir);
};

}  // namespace gocov
