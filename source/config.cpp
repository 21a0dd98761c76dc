#include <mergeimport/config.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace mergeimport {

static std::string trim(std::string s){
  while(!s.empty() && (s.back()==' '||s.back()=='\t'||s.back()=='\r'||s.back()=='\n')) s.pop_back();
  size_t i=0; while(i<s.size() && (s[i]==' '||s[i]=='\t')) ++i; return s.substr(i);
}

// drops an unquoted " #" / " ;" trailing comment
static std::string strip_comment(const std::string& s){
  bool in_single=false, in_double=false;
  for (size_t i=0; i<s.size(); ++i) {
    char c = s[i];
    if (c=='\'' && !in_double) in_single=!in_single;
    else if (c=='"' && !in_single) in_double=!in_double;
    else if ((c=='#' || c==';') && !in_single && !in_double &&
             i>0 && (s[i-1]==' ' || s[i-1]=='\t'))
      return s.substr(0, i);
  }
  return s;
}

static std::vector<std::string> split_args(const std::string& s){
  std::vector<std::string> out;
  std::string cur; bool in_single=false, in_double=false, esc=false;
  for(char c: s){
    if (esc){ cur.push_back(c); esc=false; continue; }
    if (c=='\\'){ esc=true; continue; }
    if (c=='\'' && !in_double){ in_single=!in_single; continue; }
    if (c=='"'  && !in_single){ in_double=!in_double; continue; }
    if (!in_single && !in_double && (c==' '||c=='\t')){
      if (!cur.empty()){ out.push_back(cur); cur.clear(); }
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty()) out.push_back(cur);
  return out;
}

static int parse_int(const std::string& key, const std::string& val){
  size_t pos = 0;
  int v = 0;
  try { v = std::stoi(val, &pos); }
  catch (const std::exception&) { pos = 0; }
  if (pos == 0 || pos != val.size())
    throw std::runtime_error("invalid integer for " + key + ": '" + val + "'");
  return v;
}

static std::string check_level(const std::string& val){
  auto lvl = spdlog::level::from_str(val);
  // from_str maps unknown names to off
  if (lvl == spdlog::level::off && val != "off")
    throw std::runtime_error("unknown log level: '" + val + "'");
  return val;
}

Config Config::Load(const fs::path& p) {
  Config c;
  std::ifstream in(p);
  if (!in) throw std::runtime_error("Config file not found: " + p.string());

  std::string section;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0]=='#' || line[0]==';') continue;
    if (line.front()=='[' && line.back()==']') {
      section = line.substr(1, line.size()-2);
      if (section != "Diff3" && section != "Log")
        spdlog::warn("[config] {}: unknown section [{}]", p.string(), section);
      continue;
    }

    auto eq = line.find('=');
    if (eq==std::string::npos) continue;
    auto key = trim(line.substr(0,eq));
    auto val = trim(strip_comment(line.substr(eq+1)));

    if (section=="Diff3") {
      if (key=="Binary") {
        if (val.empty()) throw std::runtime_error("Diff3.Binary must not be empty");
        c.diff3.binary = val;
      } else if (key=="Args") {
        c.diff3.args = split_args(val);
      } else if (key=="ConflictExitCode") {
        c.diff3.conflict_exit_code = parse_int("Diff3.ConflictExitCode", val);
      } else if (key=="Environment") {
        std::stringstream ss(val); std::string kv;
        while (std::getline(ss, kv, ';')) {
          auto pos = kv.find('=');
          if (pos!=std::string::npos) {
            auto k = trim(kv.substr(0,pos));
            auto v = trim(kv.substr(pos+1));
            if (!k.empty()) c.diff3.env[k] = v;
          }
        }
      } else {
        spdlog::warn("[config] unknown key Diff3.{}", key);
      }

    } else if (section=="Log") {
      if (key=="Level") {
        c.log.level = check_level(val);
      } else if (key=="Pattern") {
        c.log.pattern = val;
      } else {
        spdlog::warn("[config] unknown key Log.{}", key);
      }

    } else if (section.empty()) {
      spdlog::warn("[config] {}: key {} outside any section ignored", p.string(), key);
    } else {
      spdlog::warn("[config] unknown key {}.{}", section, key);
    }
  }
  return c;
}

void Config::apply_env() {
  if (const char* v = ::getenv("MERGEIMPORT_DIFF3_BIN")) {
    if (*v) diff3.binary = v;
  }
  if (const char* v = ::getenv("MERGEIMPORT_CONFLICT_EXIT_CODE")) {
    diff3.conflict_exit_code = parse_int("MERGEIMPORT_CONFLICT_EXIT_CODE", v);
  }
  if (const char* v = ::getenv("MERGEIMPORT_LOG_LEVEL")) {
    log.level = check_level(v);
  }
}

} // namespace mergeimport
