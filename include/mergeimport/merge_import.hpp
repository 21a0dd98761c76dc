#pragma once
#include <mergeimport/merge_tool.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace mergeimport {

struct Workdirs {
  std::filesystem::path origin;
  std::filesystem::path destination;
  std::filesystem::path baseline;
};

// State shared by the two passes of one merge import.
struct MergeState {
  // relative paths the origin pass attempted to merge
  std::unordered_set<std::string> visited;
  // absolute origin paths left in conflict
  std::set<std::filesystem::path> conflicts;

  std::vector<std::filesystem::path> merged;
  std::vector<std::filesystem::path> copied;
  std::vector<std::filesystem::path> deleted;

  bool is_visited(const std::filesystem::path &rel) const {
    return visited.count(rel.generic_string()) != 0;
  }
};

struct MergeReport {
  std::vector<std::filesystem::path> merged;    // relative
  std::vector<std::filesystem::path> conflicts; // absolute origin paths
  std::vector<std::filesystem::path> copied;    // relative, destination -> origin
  std::vector<std::filesystem::path> deleted;   // relative, from destination

  bool has_conflicts() const { return !conflicts.empty(); }
};

// Merges every origin file that also exists in destination and baseline.
// Clean results overwrite the origin file; conflicts leave it untouched.
// Throws IoError when the tool cannot run or a write fails.
void origin_pass(const Workdirs &dirs, MergeTool &tool,
                 const std::filesystem::path &scratch_dir, MergeState &st,
                 spdlog::logger &log);

// Copies destination-only files into origin and deletes destination files
// that origin removed. Paths visited by origin_pass are left alone.
void destination_pass(const Workdirs &dirs, MergeState &st,
                      spdlog::logger &log);

/**
 * Merge import: persists destination-only changes across one-way syncs.
 *
 * The origin is the source of truth. Files that exist at baseline and
 * destination but not in origin are deleted from the destination. Files that
 * exist only in the destination are copied into the origin. Files present in
 * all three trees are three-way merged into the origin tree.
 *
 * The three trees must already be populated. Symlinks are ignored.
 */
class MergeImportTool {
public:
  explicit MergeImportTool(MergeTool &tool,
                           std::shared_ptr<spdlog::logger> log = nullptr);

  // Emits one warning per conflicting path. Throws IoError on the first
  // file system or tool execution failure; the trees are then left as-is.
  MergeReport merge_import(const std::filesystem::path &origin_workdir,
                           const std::filesystem::path &destination_workdir,
                           const std::filesystem::path &baseline_workdir,
                           const std::filesystem::path &scratch_dir);

private:
  MergeTool &tool_;
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace mergeimport
