// SPDX-License-Identifier: MIT

#include "qlab/state_vector.hpp"
#include "qlab/errors.hpp"
#include <algorithm>
#include <cmath>
#ifdef QLAB_OPENMP
#include <omp.h>
#endif

namespace qlab {

static std::size_t checked_width(std::size_t n) {
  if (n == 0 || n > kMaxQubits)
    throw InvalidParameterError("Qubit count must be between 1 and " + std::to_string(kMaxQubits) +
                                ", got " + std::to_string(n));
  return n;
}

StateVector::StateVector(std::size_t n) : n_(checked_width(n)), amp_(std::size_t(1) << n, c64{0.0, 0.0}) {
  amp_[0] = {1.0, 0.0};
}

void StateVector::apply_gate_1q(std::size_t target, const c64 u00, const c64 u01, const c64 u10, const c64 u11) {
  const std::size_t N = amp_.size();
  const std::size_t mask = std::size_t(1) << target;
#ifdef QLAB_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (std::size_t i = 0; i < N; ++i) {
    if ((i & mask) == 0) {
      const std::size_t j = i | mask;
      c64 a0 = amp_[i];
      c64 a1 = amp_[j];
      amp_[i] = u00 * a0 + u01 * a1;
      amp_[j] = u10 * a0 + u11 * a1;
    }
  }
}

void StateVector::apply_matrix(std::span<const std::size_t> targets, const vec_c64& u) {
  const std::size_t k = targets.size();
  const std::size_t d = std::size_t(1) << k;
  if (u.size() != d*d) throw InvalidParameterError("Gate matrix size does not match " + std::to_string(k) + " target(s)");
  for (auto t : targets)
    if (t >= n_) throw InvalidParameterError("Qubit index " + std::to_string(t) + " out of range for " + std::to_string(n_) + " qubits");
  if (k == 1) { apply_gate_1q(targets[0], u[0], u[1], u[2], u[3]); return; }

  // offsets[m] is the global index offset of local basis state m
  std::vector<std::size_t> offsets(d, 0);
  std::size_t tmask = 0;
  for (std::size_t m = 0; m < d; ++m)
    for (std::size_t b = 0; b < k; ++b)
      if ((m >> b) & 1) offsets[m] |= std::size_t(1) << targets[b];
  for (auto t : targets) tmask |= std::size_t(1) << t;

  const std::size_t N = amp_.size();
#ifdef QLAB_OPENMP
#pragma omp parallel for schedule(static)
#endif
  for (std::size_t i = 0; i < N; ++i) {
    if ((i & tmask) != 0) continue;
    c64 in[8], out[8];
    c64* src = in; c64* dst = out;
    std::vector<c64> big_in, big_out;
    if (d > 8) { big_in.resize(d); big_out.resize(d); src = big_in.data(); dst = big_out.data(); }
    for (std::size_t m = 0; m < d; ++m) src[m] = amp_[i | offsets[m]];
    for (std::size_t r = 0; r < d; ++r) {
      c64 acc{0.0, 0.0};
      for (std::size_t c = 0; c < d; ++c) acc += u[r*d + c] * src[c];
      dst[r] = acc;
    }
    for (std::size_t m = 0; m < d; ++m) amp_[i | offsets[m]] = dst[m];
  }
}

void StateVector::apply_unitary(OpType gate, std::span<const std::size_t> targets, std::span<const double> params) {
  const auto& g = gate_spec(gate);
  if (targets.size() != g.arity)
    throw InvalidParameterError("'" + std::string(g.name) + "' acts on " + std::to_string(g.arity) +
                                " qubit(s), got " + std::to_string(targets.size()));
  auto u = gate_matrix(gate, params);
  const std::size_t d = std::size_t(1) << g.arity;
  if (double err = unitarity_error(u, d); err > kUnitarityTolerance)
    throw NumericalError("Matrix of '" + std::string(g.name) + "' deviates from unitary by " + std::to_string(err));
  apply_matrix(targets, u);
}

double StateVector::norm2() const {
  // Kahan summation keeps drift checks meaningful for large registers
  double norm2 = 0.0, c = 0.0;
  for (auto& a : amp_) { double y = std::norm(a) - c; double t = norm2 + y; c = (t - norm2) - y; norm2 = t; }
  return norm2;
}

double StateVector::probability_of_basis(std::size_t basis_index) const {
  return std::norm(amp_.at(basis_index));
}

std::vector<double> StateVector::probabilities() const {
  std::vector<double> p(amp_.size());
  for (std::size_t i = 0; i < amp_.size(); ++i) p[i] = std::norm(amp_[i]);
  return p;
}

std::map<std::size_t, std::size_t> StateVector::sample_indices(std::size_t shots, Rng& rng) const {
  if (shots == 0 || shots > kMaxShots)
    throw InvalidParameterError("Shot count must be between 1 and " + std::to_string(kMaxShots) +
                                ", got " + std::to_string(shots));
  const std::size_t N = amp_.size();
  // Cumulative distribution, searched once per draw
  std::vector<double> cdf(N);
  double acc = 0.0;
  for (std::size_t i = 0; i < N; ++i) { acc += std::norm(amp_[i]); cdf[i] = acc; }
  std::map<std::size_t, std::size_t> counts;
  for (std::size_t s = 0; s < shots; ++s) {
    double r = rng.uniform() * acc;
    auto it = std::upper_bound(cdf.begin(), cdf.end(), r);
    std::size_t idx = (it == cdf.end()) ? N - 1 : std::size_t(it - cdf.begin());
    // never report a zero-probability outcome on a boundary hit
    while (idx > 0 && std::norm(amp_[idx]) == 0.0) --idx;
    ++counts[idx];
  }
  return counts;
}

std::map<std::string, std::size_t> StateVector::sample(std::size_t shots, Rng& rng) const {
  std::map<std::string, std::size_t> out;
  for (auto [idx, n] : sample_indices(shots, rng)) out[index_to_bits(idx, n_)] += n;
  return out;
}

} // namespace qlab
