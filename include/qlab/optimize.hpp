// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"

namespace qlab {

struct OptimizeOptions {
  bool cancel_adjacent = true;   // x x, s sdg, rz(a) rz(-a) with nothing in between on that qubit
  bool commute = false;          // look back past operations that commute with the candidate
  bool cancel_two_qubit = false; // cx cx, cz cz, swap swap, rzz(a) rzz(-a), ...
  bool merge_rotations = false;  // rz(a) rz(b) -> rz(a+b), phase family -> canonical gate
};

// Level 0: nothing. 1: adjacent cancellation. 2: + commutation and
// two-qubit cancellation. 3: + rotation merging.
OptimizeOptions options_for_level(int level);

// Rewrites to a fixed point, so a second call never finds more to remove.
// The unitary action is preserved up to global phase.
Circuit optimize(const Circuit& in, OptimizeOptions opts);

struct OptimizeReport {
  int level = 0;
  std::size_t original_gate_count{};
  std::size_t optimized_gate_count{};
  std::size_t original_depth{};
  std::size_t optimized_depth{};

  std::size_t size_reduction() const { return original_gate_count - optimized_gate_count; }
  std::size_t depth_reduction() const { return original_depth - optimized_depth; }
  double improvement_percentage() const;
};

struct OptimizeResult {
  Circuit circuit; // unnamed; the caller decides where it lives
  OptimizeReport report;
};

// Throws InvalidParameterError unless 0 <= level <= 3. Never mutates `in`.
OptimizeResult optimize(const Circuit& in, int level);

} // namespace qlab
