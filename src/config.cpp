// SPDX-License-Identifier: MIT

#include "qlab/config.hpp"
#include "qlab/types.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace qlab {

static std::string trim(const std::string& s){
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
  return s.substr(b, e-b);
}

bool parse_u64(const std::string& s, uint64_t& out){
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) return false;
  try {
    std::size_t pos = 0;
    out = std::stoull(s, &pos, 10);
    return pos == s.size();
  } catch (const std::exception&) { return false; }
}

static bool parse_bool(const std::string& s, bool& out){
  if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
  if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
  return false;
}

// Applies one setting; returns an error message or "".
static std::string set_key(Config& cfg, const std::string& key, const std::string& val){
  uint64_t v = 0;
  if (key == "shots"){
    if (!parse_u64(val, v) || v == 0 || v > kMaxShots)
      return "shots must be between 1 and " + std::to_string(kMaxShots) + ", got '" + val + "'";
    cfg.shots = static_cast<std::size_t>(v);
  } else if (key == "seed"){
    if (!parse_u64(val, v)) return "seed must be a non-negative integer, got '" + val + "'";
    cfg.seed = v;
  } else if (key == "opt_level"){
    if (!parse_u64(val, v) || v > 3) return "opt_level must be 0, 1, 2 or 3, got '" + val + "'";
    cfg.opt_level = static_cast<int>(v);
  } else if (key == "max_qubits"){
    if (!parse_u64(val, v) || v == 0 || v > kMaxQubits)
      return "max_qubits must be between 1 and " + std::to_string(kMaxQubits) + ", got '" + val + "'";
    cfg.max_qubits = static_cast<std::size_t>(v);
  } else if (key == "verbose"){
    if (!parse_bool(val, cfg.verbose)) return "verbose must be a boolean, got '" + val + "'";
  } else {
    return "unknown key '" + key + "'";
  }
  return "";
}

bool load_config_string(const std::string& text, Config& cfg, std::string& err){
  Config next = cfg;
  std::istringstream in(text);
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)){
    ++lineno;
    auto hash = line.find('#');
    if (hash != std::string::npos) line = line.substr(0, hash);
    line = trim(line);
    if (line.empty()) continue;
    auto p = line.find('=');
    if (p == std::string::npos){ err = "expected key=value at line " + std::to_string(lineno); return false; }
    auto msg = set_key(next, trim(line.substr(0, p)), trim(line.substr(p+1)));
    if (!msg.empty()){ err = msg + " at line " + std::to_string(lineno); return false; }
  }
  cfg = next;
  return true;
}

bool load_config_file(const std::string& path, Config& cfg, std::string& err){
  std::ifstream in(path);
  if (!in){ err = "Cannot open config file: " + path; return false; }
  std::stringstream buf;
  buf << in.rdbuf();
  if (!load_config_string(buf.str(), cfg, err)){ err = path + ": " + err; return false; }
  return true;
}

bool apply_env(Config& cfg, std::string& err){
  Config next = cfg;
  for (auto [var, key] : {std::pair{"QLAB_SEED", "seed"}, std::pair{"QLAB_SHOTS", "shots"}}){
    const char* v = std::getenv(var);
    if (!v) continue;
    auto msg = set_key(next, key, trim(v));
    if (!msg.empty()){ err = std::string(var) + ": " + msg; return false; }
  }
  cfg = next;
  return true;
}

} // namespace qlab
