#pragma once
#include <filesystem>
#include <string>
#include <variant>

namespace mergeimport {

struct MergeClean {
  std::string content;
};

struct MergeConflict {};

// The tool could not run, or failed for a reason other than a content conflict.
struct MergeExecError {
  std::string message;
};

using MergeOutcome = std::variant<MergeClean, MergeConflict, MergeExecError>;

// Line-based three-way merge engine.
class MergeTool {
public:
  virtual ~MergeTool() = default;

  // mine: origin copy, theirs: destination copy, base: common ancestor.
  // scratch_dir exists and may hold temporary artifacts.
  virtual MergeOutcome merge(const std::filesystem::path &mine,
                             const std::filesystem::path &theirs,
                             const std::filesystem::path &base,
                             const std::filesystem::path &scratch_dir) = 0;
};

} // namespace mergeimport
