// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "gates.hpp"
#include "rng.hpp"
#include <map>
#include <span>

namespace qlab {

// Dense amplitude vector. Qubit 0 is the least-significant bit of the index.
class StateVector {
  std::size_t n_;
  vec_c64 amp_;

public:
  explicit StateVector(std::size_t n);
  std::size_t num_qubits() const { return n_; }
  std::size_t dimension() const { return amp_.size(); }
  const vec_c64& amplitudes() const { return amp_; }

  // Single-qubit 2x2 gate on target qubit.
  void apply_gate_1q(std::size_t target, const c64 u00, const c64 u01, const c64 u10, const c64 u11);

  // Arbitrary k-qubit gate given as a row-major 2^k x 2^k matrix; targets[0]
  // is the least-significant bit of the local index. Only the 2^k amplitudes
  // of each affected group are touched.
  void apply_matrix(std::span<const std::size_t> targets, const vec_c64& u);

  // Builds the catalog matrix, checks it is unitary (NumericalError otherwise) and applies it.
  void apply_unitary(OpType gate, std::span<const std::size_t> targets, std::span<const double> params);

  double norm2() const;
  double probability_of_basis(std::size_t basis_index) const;
  std::vector<double> probabilities() const;

  // Draws `shots` basis indices from |amp|^2; returns index -> count, zero counts omitted.
  std::map<std::size_t, std::size_t> sample_indices(std::size_t shots, Rng& rng) const;
  // Same, keyed by the n-qubit bitstring (qubit n-1 leftmost).
  std::map<std::string, std::size_t> sample(std::size_t shots, Rng& rng) const;
};

} // namespace qlab
