#pragma once
#include <mergeimport/diff3.hpp>

#include <filesystem>
#include <string>

namespace mergeimport {

struct LogOptions {
  std::string name = "mergeimport";
  std::string level = "info";
  std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct Config {
  Diff3Options diff3;
  LogOptions log;

  // [Diff3] Binary, Args, ConflictExitCode, Environment
  // [Log]   Level, Pattern
  static Config Load(const std::filesystem::path &p);

  // MERGEIMPORT_DIFF3_BIN, MERGEIMPORT_CONFLICT_EXIT_CODE, MERGEIMPORT_LOG_LEVEL
  void apply_env();
};

} // namespace mergeimport
