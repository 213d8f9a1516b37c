// SPDX-License-Identifier: MIT

#include "qlab/optimize.hpp"
#include "qlab/errors.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <optional>

namespace qlab {

namespace {

constexpr double kAngleTol = 1e-12;
constexpr double kTwoPi = 2.0 * std::numbers::pi;

bool is_self_inverse(OpType t){
  return t==OpType::H || t==OpType::X || t==OpType::Y || t==OpType::Z ||
         t==OpType::CX || t==OpType::CZ || t==OpType::SWAP;
}

bool is_rotation(OpType t){
  return t==OpType::P || t==OpType::RX || t==OpType::RY || t==OpType::RZ ||
         t==OpType::CP || t==OpType::RXX || t==OpType::RYY || t==OpType::RZZ;
}

bool is_diagonal(OpType t){
  return t==OpType::Z || t==OpType::S || t==OpType::SDG || t==OpType::T || t==OpType::TDG ||
         t==OpType::P || t==OpType::RZ || t==OpType::CZ || t==OpType::CP || t==OpType::RZZ;
}

// diag(1, e^{i lambda}) family
std::optional<double> phase_angle(const Op& op){
  switch (op.type){
    case OpType::Z:   return std::numbers::pi;
    case OpType::S:   return std::numbers::pi/2;
    case OpType::SDG: return -std::numbers::pi/2;
    case OpType::T:   return std::numbers::pi/4;
    case OpType::TDG: return -std::numbers::pi/4;
    case OpType::P:   return op.params[0];
    default: return std::nullopt;
  }
}

bool near_zero_mod_2pi(double a){ return std::fabs(std::remainder(a, kTwoPi)) < kAngleTol; }

bool same_qubits(const Op& a, const Op& b){
  if (a.qubits == b.qubits) return true;
  // symmetric two-qubit gates act the same under operand exchange
  bool symmetric = a.type==OpType::CZ || a.type==OpType::SWAP || a.type==OpType::CP ||
                   a.type==OpType::RXX || a.type==OpType::RYY || a.type==OpType::RZZ;
  return symmetric && a.type==b.type && a.qubits.size()==2 && b.qubits.size()==2 &&
         a.qubits[0]==b.qubits[1] && a.qubits[1]==b.qubits[0];
}

bool shares_qubit(const Op& a, const Op& b, std::size_t n){
  auto qa = op_qubits(a, n), qb = op_qubits(b, n);
  for (auto x : qa) for (auto y : qb) if (x==y) return true;
  return false;
}

bool cancels(const Op& prev, const Op& op, const OptimizeOptions& o){
  if (!is_unitary(prev.type) || !is_unitary(op.type)) return false;
  if (op.qubits.size() > 1 && !o.cancel_two_qubit) return false;
  if (!same_qubits(prev, op)) return false;
  if (prev.type == op.type && is_self_inverse(op.type)) return true;
  auto pair = [&](OpType a, OpType b){ return (prev.type==a && op.type==b) || (prev.type==b && op.type==a); };
  if (pair(OpType::S, OpType::SDG) || pair(OpType::T, OpType::TDG)) return true;
  if (prev.type == op.type && is_rotation(op.type))
    return std::fabs(prev.params[0] + op.params[0]) < kAngleTol;
  return false;
}

Op canonical_phase(std::size_t q, double lambda){
  lambda = std::remainder(lambda, kTwoPi);
  auto near = [&](double v){ return std::fabs(lambda - v) < kAngleTol; };
  if (near(std::numbers::pi) || near(-std::numbers::pi)) return {OpType::Z, {q}, {}};
  if (near(std::numbers::pi/2))  return {OpType::S, {q}, {}};
  if (near(-std::numbers::pi/2)) return {OpType::SDG, {q}, {}};
  if (near(std::numbers::pi/4))  return {OpType::T, {q}, {}};
  if (near(-std::numbers::pi/4)) return {OpType::TDG, {q}, {}};
  return {OpType::P, {q}, {lambda}};
}

enum class Merge { None, Replaced, Vanished };

// Level-3 merge of `op` into `prev`.
Merge merge_into(Op& prev, const Op& op){
  if (!same_qubits(prev, op)) return Merge::None;
  auto lp = phase_angle(prev), lo = phase_angle(op);
  if (lp && lo){
    double lambda = *lp + *lo;
    if (near_zero_mod_2pi(lambda)) return Merge::Vanished;
    prev = canonical_phase(prev.qubits[0], lambda);
    return Merge::Replaced;
  }
  if (prev.type == op.type && is_rotation(op.type)){
    double theta = prev.params[0] + op.params[0];
    // rotations by 2*pi*k are +-I, a global phase
    if (near_zero_mod_2pi(theta)) return Merge::Vanished;
    prev.params[0] = theta;
    return Merge::Replaced;
  }
  return Merge::None;
}

bool commutes(const Op& a, const Op& b){
  if (!is_unitary(a.type) || !is_unitary(b.type)) return false;
  if (is_diagonal(a.type) && is_diagonal(b.type)) return true;
  if (a.type == b.type && same_qubits(a, b) && (is_rotation(a.type) || is_self_inverse(a.type))) return true;
  auto x_axis = [](OpType t){ return t==OpType::X || t==OpType::RX; };
  auto y_axis = [](OpType t){ return t==OpType::Y || t==OpType::RY; };
  if (a.qubits.size()==1 && b.qubits.size()==1){
    if (x_axis(a.type) && x_axis(b.type)) return true;
    if (y_axis(a.type) && y_axis(b.type)) return true;
    return false;
  }
  if (a.type==OpType::CX && b.type==OpType::CX)
    return a.qubits[0] != b.qubits[1] && a.qubits[1] != b.qubits[0];
  auto cx_vs_1q = [&](const Op& cx, const Op& g){
    if (cx.type != OpType::CX || g.qubits.size() != 1) return false;
    std::size_t q = g.qubits[0];
    if (q == cx.qubits[0]) return is_diagonal(g.type);
    if (q == cx.qubits[1]) return x_axis(g.type);
    return true;
  };
  return cx_vs_1q(a, b) || cx_vs_1q(b, a);
}

bool vanishes(const Op& op){
  if (is_rotation(op.type)) return near_zero_mod_2pi(op.params[0]);
  return false;
}

// Index below `from` in `out` of the operation `op` may combine with, if any.
std::optional<std::size_t> find_partner(const std::vector<Op>& out, std::size_t from, const Op& op,
                                        std::size_t n, const OptimizeOptions& o){
  for (std::size_t i = from; i-- > 0;){
    const Op& p = out[i];
    if (!shares_qubit(p, op, n)) continue;
    if (same_qubits(p, op) && is_unitary(p.type)) return i;
    if (o.commute && commutes(p, op)) continue;
    return std::nullopt;
  }
  return std::nullopt;
}

// Folds `op` into an earlier operation of `out`. False if it must be appended.
bool absorb(std::vector<Op>& out, const Op& op, std::size_t n, const OptimizeOptions& o){
  std::size_t from = out.size();
  while (auto k = find_partner(out, from, op, n, o)){
    Op& prev = out[*k];
    if (cancels(prev, op, o)){ out.erase(out.begin() + *k); return true; }
    if (o.merge_rotations){
      Op merged = prev;
      switch (merge_into(merged, op)){
        case Merge::Vanished: out.erase(out.begin() + *k); return true;
        case Merge::Replaced: prev = std::move(merged); return true;
        case Merge::None: break;
      }
    }
    // same operands, nothing to fold: keep looking past it only if it commutes
    if (!o.commute || !commutes(prev, op)) return false;
    from = *k;
  }
  return false;
}

std::vector<Op> run_pass(const std::vector<Op>& in, std::size_t n, const OptimizeOptions& o, bool& changed){
  std::vector<Op> out;
  out.reserve(in.size());
  for (const auto& op : in){
    if (!is_unitary(op.type)){ out.push_back(op); continue; }
    if (o.merge_rotations && vanishes(op)){ changed = true; continue; }
    if (absorb(out, op, n, o)){ changed = true; continue; }
    out.push_back(op);
  }
  return out;
}

} // namespace

OptimizeOptions options_for_level(int level){
  if (level < 0 || level > 3)
    throw InvalidParameterError("Optimization level must be 0, 1, 2, or 3, got " + std::to_string(level));
  OptimizeOptions o;
  o.cancel_adjacent = level >= 1;
  o.commute = level >= 2;
  o.cancel_two_qubit = level >= 2;
  o.merge_rotations = level >= 3;
  return o;
}

Circuit optimize(const Circuit& in, OptimizeOptions opts){
  Circuit out{"", in.nqubits, in.nclbits, in.ops};
  if (!opts.cancel_adjacent && !opts.merge_rotations) return out;
  // every change removes at least one operation, so this terminates
  bool changed = true;
  while (changed){
    changed = false;
    out.ops = run_pass(out.ops, out.nqubits, opts, changed);
  }
  return out;
}

double OptimizeReport::improvement_percentage() const {
  if (original_gate_count == 0) return 0.0;
  double pct = 100.0 * double(size_reduction()) / double(original_gate_count);
  return std::round(pct * 100.0) / 100.0;
}

OptimizeResult optimize(const Circuit& in, int level){
  OptimizeOptions o = options_for_level(level);
  OptimizeResult r{optimize(in, o), {}};
  r.report.level = level;
  r.report.original_gate_count = in.size();
  r.report.optimized_gate_count = r.circuit.size();
  r.report.original_depth = in.depth();
  r.report.optimized_depth = r.circuit.depth();
  return r;
}

} // namespace qlab
