#pragma once
#include <mergeimport/merge_tool.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace mergeimport {

struct Diff3Options {
  std::string binary = "diff3";
  std::vector<std::string> args{"-m"};
  int conflict_exit_code = 1;
  std::unordered_map<std::string, std::string> env;
};

// Runs `<binary> <args> mine base theirs` in the scratch directory.
class Diff3Tool : public MergeTool {
public:
  explicit Diff3Tool(Diff3Options opts = {},
                     std::shared_ptr<spdlog::logger> log = nullptr)
      : opts_(std::move(opts)),
        log_(log ? std::move(log) : spdlog::default_logger()) {}

  MergeOutcome merge(const std::filesystem::path &mine,
                     const std::filesystem::path &theirs,
                     const std::filesystem::path &base,
                     const std::filesystem::path &scratch_dir) override;

private:
  Diff3Options opts_;
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace mergeimport
