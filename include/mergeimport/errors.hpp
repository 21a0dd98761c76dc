#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>

namespace mergeimport {

// Any failure that aborts a merge import: file system errors and a merge tool
// that could not be executed.
class IoError : public std::runtime_error {
public:
  explicit IoError(const std::string &what) : std::runtime_error(what) {}
  IoError(const std::string &what, std::filesystem::path path)
      : std::runtime_error(what), path_(std::move(path)) {}

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace mergeimport
