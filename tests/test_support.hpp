#pragma once
#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include <mergeimport/merge_tool.hpp>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static fs::path mkd(const std::string& name){
  auto d = fs::temp_directory_path() / ("mergeimport_" + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static void put(const fs::path& p, const std::string& data){
  fs::create_directories(p.parent_path());
  std::ofstream o(p, std::ios::binary | std::ios::trunc);
  o << data;
}

static std::string slurp(const fs::path& p){
  std::ifstream in(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), {});
}

static fs::path script(const fs::path& p, const std::string& body){
  put(p, "#!/bin/sh\n" + body);
  fs::permissions(p, fs::perms::owner_all, fs::perm_options::add);
  return p;
}

static size_t count_of(const std::string& hay, const std::string& needle){
  size_t n = 0;
  for (auto pos = hay.find(needle); pos != std::string::npos;
       pos = hay.find(needle, pos + needle.size()))
    ++n;
  return n;
}

// generic strings, so Catch never has to print a std::filesystem::path
static std::vector<std::string> strs(const std::vector<fs::path>& v){
  std::vector<std::string> out;
  for (auto& p : v) out.push_back(p.generic_string());
  return out;
}

using Names = std::vector<std::string>;

// Logger writing "<level> <message>" lines into a string stream.
struct CapturedLog {
  std::ostringstream out;
  std::shared_ptr<spdlog::logger> logger;

  CapturedLog() {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    logger = std::make_shared<spdlog::logger>("capture", sink);
    logger->set_pattern("%l %v");
    logger->set_level(spdlog::level::debug);
  }
  std::string text() { logger->flush(); return out.str(); }
};

static std::shared_ptr<spdlog::logger> quiet(){
  return std::make_shared<spdlog::logger>("quiet", std::make_shared<spdlog::sinks::null_sink_mt>());
}

// Whole-file three-way merge: takes the side that changed, conflicts when
// both changed differently. Scripted outcomes override it per file name.
class ScriptedTool : public mergeimport::MergeTool {
public:
  std::map<std::string, mergeimport::MergeOutcome> scripted;
  std::vector<std::string> calls;

  mergeimport::MergeOutcome merge(const fs::path& mine, const fs::path& theirs,
                                  const fs::path& base,
                                  const fs::path& scratch_dir) override {
    REQUIRE(fs::is_directory(scratch_dir));
    calls.push_back(mine.filename().string());
    auto it = scripted.find(mine.filename().string());
    if (it != scripted.end()) return it->second;

    auto m = slurp(mine), t = slurp(theirs), b = slurp(base);
    if (m == b) return mergeimport::MergeClean{t};
    if (t == b || t == m) return mergeimport::MergeClean{m};
    return mergeimport::MergeConflict{};
  }
};

struct Trees {
  fs::path origin, destination, baseline, scratch;

  explicit Trees(const std::string& name) {
    auto root = mkd(name);
    origin = root / "origin";
    destination = root / "destination";
    baseline = root / "baseline";
    scratch = root / "scratch";
    fs::create_directories(origin);
    fs::create_directories(destination);
    fs::create_directories(baseline);
  }
};
