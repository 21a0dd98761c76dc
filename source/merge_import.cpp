#include <mergeimport/errors.hpp>
#include <mergeimport/io.hpp>
#include <mergeimport/merge_import.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <type_traits>

namespace fs = std::filesystem;

namespace mergeimport {

void origin_pass(const Workdirs &dirs, MergeTool &tool,
                 const fs::path &scratch_dir, MergeState &st,
                 spdlog::logger &log) {
  io::walk_files(dirs.origin, [&](const fs::path &file, const fs::path &rel) {
    const auto baseline_file = dirs.baseline / rel;
    const auto destination_file = dirs.destination / rel;
    if (!io::exists(destination_file)) {
      if (io::exists(baseline_file))
        log.debug("[merge] {} removed in destination, origin copy kept",
                  rel.string());
      return;
    }
    if (!io::exists(baseline_file))
      return;

    auto outcome = tool.merge(file, destination_file, baseline_file, scratch_dir);
    st.visited.insert(rel.generic_string());

    std::visit(
        [&](auto &&o) {
          using T = std::decay_t<decltype(o)>;
          if constexpr (std::is_same_v<T, MergeConflict>) {
            log.debug("[merge] conflict {}", rel.string());
            st.conflicts.insert(fs::absolute(file));
          } else if constexpr (std::is_same_v<T, MergeClean>) {
            io::write_file(file, o.content);
            log.debug("[merge] merged {}", rel.string());
            st.merged.push_back(rel);
          } else {
            log.error("[merge] merge tool failed on {}: {}", rel.string(),
                      o.message);
            throw IoError(fmt::format("Could not execute merge tool: {}", o.message),
                          file);
          }
        },
        outcome);
  });
}

void destination_pass(const Workdirs &dirs, MergeState &st,
                      spdlog::logger &log) {
  io::walk_files(dirs.destination, [&](const fs::path &file,
                                       const fs::path &rel) {
    if (st.is_visited(rel))
      return;
    const auto origin_file = dirs.origin / rel;
    const bool in_origin = io::exists(origin_file);
    const bool in_baseline = io::exists(dirs.baseline / rel);

    if (!in_origin && !in_baseline) {
      // destination only file - keep it
      io::copy_new_file(file, origin_file);
      log.debug("[merge] destination-only {}", rel.string());
      st.copied.push_back(rel);
    } else if (!in_origin) {
      // deleted in origin, propagate to destination
      io::remove_file(file);
      log.debug("[merge] deleted {}", rel.string());
      st.deleted.push_back(rel);
    } else {
      log.debug("[merge] {} not merged, kept", rel.string());
    }
  });
}

MergeImportTool::MergeImportTool(MergeTool &tool,
                                 std::shared_ptr<spdlog::logger> log)
    : tool_(tool), log_(log ? std::move(log) : spdlog::default_logger()) {}

MergeReport MergeImportTool::merge_import(const fs::path &origin_workdir,
                                          const fs::path &destination_workdir,
                                          const fs::path &baseline_workdir,
                                          const fs::path &scratch_dir) {
  const Workdirs dirs{origin_workdir, destination_workdir, baseline_workdir};
  io::ensure_dir(scratch_dir);

  MergeState st;
  origin_pass(dirs, tool_, scratch_dir, st, *log_);
  destination_pass(dirs, st, *log_);

  for (const auto &p : st.conflicts)
    log_->warn("Merge error for path {}", p.string());

  MergeReport rep;
  rep.merged = std::move(st.merged);
  rep.conflicts.assign(st.conflicts.begin(), st.conflicts.end());
  rep.copied = std::move(st.copied);
  rep.deleted = std::move(st.deleted);
  std::sort(rep.merged.begin(), rep.merged.end());
  std::sort(rep.copied.begin(), rep.copied.end());
  std::sort(rep.deleted.begin(), rep.deleted.end());

  log_->info("[merge] {} merged, {} conflicts, {} copied, {} deleted",
             rep.merged.size(), rep.conflicts.size(), rep.copied.size(),
             rep.deleted.size());
  return rep;
}

} // namespace mergeimport
