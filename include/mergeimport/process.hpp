#pragma once
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace mergeimport {

struct ProcResult {
  bool started{false};   // false: pipe/fork/exec failed, see error
  int exit_code{-1};     // 128 + signal when the child was killed
  std::string out;       // captured stdout
  std::string error;
};

// Runs argv[0] (PATH lookup) in cwd with extra environment variables.
// stdout is captured; stderr goes to stderr_path, or is inherited when empty.
ProcResult run_process(const std::vector<std::string> &argv,
                       const std::filesystem::path &cwd,
                       const std::unordered_map<std::string, std::string> &env,
                       const std::filesystem::path &stderr_path);

} // namespace mergeimport
