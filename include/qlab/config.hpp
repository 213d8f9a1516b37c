// SPDX-License-Identifier: MIT

#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace qlab {

struct Config {
  std::size_t shots = 1000;
  std::optional<uint64_t> seed;
  int opt_level = 1;
  std::size_t max_qubits = 24;
  bool verbose = false;
};

// key=value lines, '#' comments. Keys: shots, seed, opt_level, max_qubits,
// verbose. Returns false and fills `err` (with the line number) on an unknown
// key or a bad value; `cfg` is left untouched in that case.
bool load_config_file(const std::string& path, Config& cfg, std::string& err);
bool load_config_string(const std::string& text, Config& cfg, std::string& err);

// Decimal digits only (no sign, no whitespace), within uint64_t.
bool parse_u64(const std::string& s, uint64_t& out);

// QLAB_SEED and QLAB_SHOTS override whatever is already in `cfg`.
bool apply_env(Config& cfg, std::string& err);

} // namespace qlab
