#include <mergeimport/diff3.hpp>
#include <mergeimport/process.hpp>

#include <fmt/format.h>

#include <fstream>

namespace fs = std::filesystem;

namespace mergeimport {

static std::string first_line(const fs::path &p) {
  std::ifstream in(p);
  std::string line;
  if (in) std::getline(in, line);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  return line;
}

MergeOutcome Diff3Tool::merge(const fs::path &mine, const fs::path &theirs,
                              const fs::path &base, const fs::path &scratch_dir) {
  std::vector<std::string> argv;
  argv.reserve(opts_.args.size() + 4);
  argv.push_back(opts_.binary);
  argv.insert(argv.end(), opts_.args.begin(), opts_.args.end());
  // the child runs in scratch_dir, relative inputs must not move with it
  argv.push_back(fs::absolute(mine).string());
  argv.push_back(fs::absolute(base).string());
  argv.push_back(fs::absolute(theirs).string());

  const auto errp = scratch_dir / "diff3.stderr";
  log_->debug("[diff3] {} {}", opts_.binary, mine.string());
  auto r = run_process(argv, scratch_dir, opts_.env, errp);

  if (!r.started)
    return MergeExecError{r.error};
  if (r.exit_code == 0)
    return MergeClean{std::move(r.out)};
  if (r.exit_code == opts_.conflict_exit_code)
    return MergeConflict{};

  auto msg = fmt::format("{} exited with status {}", opts_.binary, r.exit_code);
  auto detail = first_line(errp);
  if (!detail.empty())
    msg += ": " + detail;
  return MergeExecError{msg};
}

} // namespace mergeimport
