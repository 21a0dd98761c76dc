#pragma once
#include <filesystem>
#include <functional>
#include <string>

namespace mergeimport {
namespace io {
  void ensure_dir(const std::filesystem::path& p);

  // true if p resolves to an existing entry (symlinks followed).
  // A missing path component counts as "does not exist"; other stat
  // failures throw IoError.
  bool exists(const std::filesystem::path& p);

  void write_file(const std::filesystem::path& p, const std::string& data);
  void copy_new_file(const std::filesystem::path& from,
                     const std::filesystem::path& to);
  void remove_file(const std::filesystem::path& p);

  // Calls fn(absolute_entry, relative_path) for every regular file below
  // root. Symlinks are skipped and symlinked directories are not entered.
  // Entries are collected before the first callback and visited in sorted
  // order, so fn may delete the file it is given.
  using FileVisitor = std::function<void(const std::filesystem::path&,
                                         const std::filesystem::path&)>;
  void walk_files(const std::filesystem::path& root, const FileVisitor& fn);
}
} // namespace mergeimport
