// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "state_vector.hpp"
#include <span>
#include <vector>

namespace qlab {

// Full-register density matrices hold 4^n entries; beyond this many qubits
// callers must work with reduced states instead.
inline constexpr std::size_t kMaxDensityQubits = 12;

class DensityMatrix {
  std::size_t n_;
  vec_c64 rho_; // row-major 2^n x 2^n
public:
  explicit DensityMatrix(std::size_t n); // |0..0><0..0|
  DensityMatrix(std::size_t n, vec_c64 rho);
  static DensityMatrix from_state(const StateVector& sv); // |psi><psi|

  std::size_t num_qubits() const { return n_; }
  std::size_t dim() const { return (std::size_t(1) << n_); }
  const vec_c64& data() const { return rho_; }
  c64 at(std::size_t row, std::size_t col) const { return rho_[row*dim() + col]; }

  c64 trace() const;
  double purity() const; // Tr(rho^2)
  // Ascending, from a Hermitian eigensolver.
  std::vector<double> eigenvalues() const;
  // -Tr(rho log2 rho); eigenvalues clipped at 0 and zeros contribute nothing.
  double entropy() const;
};

// Reduced state over `keep` (kept qubit keep[j] becomes qubit j); the
// complementary qubits are summed out.
DensityMatrix partial_trace(const DensityMatrix& rho, std::span<const std::size_t> keep);
// Same quantity straight from amplitudes, without the 4^n intermediate.
DensityMatrix reduced_density_matrix(const StateVector& sv, std::span<const std::size_t> keep);

double entropy_from_eigenvalues(const std::vector<double>& eig);

} // namespace qlab
