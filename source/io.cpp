#include <mergeimport/errors.hpp>
#include <mergeimport/io.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace mergeimport {
namespace io {

static IoError fs_error(const std::string &op, const fs::path &p,
                        const std::error_code &ec) {
  return IoError(fmt::format("{} {}: {}", op, p.string(), ec.message()), p);
}

void ensure_dir(const fs::path &p) {
  std::error_code ec;
  if (fs::is_directory(p, ec))
    return;
  fs::create_directories(p, ec);
  if (ec)
    throw fs_error("mkdir", p, ec);
}

bool exists(const fs::path &p) {
  std::error_code ec;
  auto st = fs::status(p, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory ||
        ec == std::errc::not_a_directory)
      return false;
    throw fs_error("stat", p, ec);
  }
  return fs::exists(st);
}

void write_file(const fs::path &p, const std::string &data) {
  std::ofstream o(p, std::ios::binary | std::ios::trunc);
  if (!o)
    throw IoError(fmt::format("open {}: {}", p.string(), std::strerror(errno)),
                  p);
  o.write(data.data(), static_cast<std::streamsize>(data.size()));
  o.flush();
  if (!o)
    throw IoError("write " + p.string(), p);
}

void copy_new_file(const fs::path &from, const fs::path &to) {
  std::error_code ec;
  auto parent = to.parent_path();
  if (!parent.empty())
    ensure_dir(parent);
  // fails with file_exists when something is already at the target
  fs::copy_file(from, to, fs::copy_options::none, ec);
  if (ec)
    throw IoError(fmt::format("copy {} -> {}: {}", from.string(), to.string(),
                              ec.message()),
                  to);
}

void remove_file(const fs::path &p) {
  std::error_code ec;
  if (!fs::remove(p, ec) && !ec)
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
  if (ec)
    throw fs_error("delete", p, ec);
}

void walk_files(const fs::path &root, const FileVisitor &fn) {
  std::vector<fs::path> files;
  std::error_code ec;
  fs::recursive_directory_iterator it(root, ec), end;
  if (ec)
    throw fs_error("walk", root, ec);

  for (; it != end; it.increment(ec)) {
    if (ec)
      throw fs_error("walk", root, ec);
    const auto &e = *it;
    std::error_code sec;
    if (e.is_symlink(sec))
      continue;
    if (sec)
      throw fs_error("stat", e.path(), sec);
    if (e.is_regular_file(sec))
      files.push_back(e.path());
    if (sec)
      throw fs_error("stat", e.path(), sec);
  }
  if (ec)
    throw fs_error("walk", root, ec);

  std::sort(files.begin(), files.end());
  for (auto &f : files)
    fn(f, f.lexically_relative(root));
}

} // namespace io
} // namespace mergeimport
