// SPDX-License-Identifier: MIT

#include "qlab/density_matrix.hpp"
#include "qlab/errors.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>

namespace qlab {

static inline std::size_t idx(std::size_t row, std::size_t col, std::size_t dim){ return row*dim + col; }

static std::size_t checked_width(std::size_t n){
  if (n > kMaxDensityQubits)
    throw InvalidParameterError("Density matrix limited to " + std::to_string(kMaxDensityQubits) +
                                " qubits, got " + std::to_string(n));
  return n;
}

// n_ is initialized first, so the size check runs before the allocation
DensityMatrix::DensityMatrix(std::size_t n)
  : n_(checked_width(n)), rho_( (std::size_t(1)<<n)*(std::size_t(1)<<n), {0.0,0.0} ){
  rho_[0] = {1.0,0.0};
}

DensityMatrix::DensityMatrix(std::size_t n, vec_c64 rho) : n_(checked_width(n)), rho_(std::move(rho)) {
  if (rho_.size() != dim()*dim())
    throw InvalidParameterError("Density matrix data has " + std::to_string(rho_.size()) +
                                " entries, expected " + std::to_string(dim()*dim()));
}

DensityMatrix DensityMatrix::from_state(const StateVector& sv){
  const std::size_t n = checked_width(sv.num_qubits());
  const auto& a = sv.amplitudes();
  const std::size_t d = a.size();
  vec_c64 rho(d*d);
  for (std::size_t r=0;r<d;++r)
    for (std::size_t c=0;c<d;++c)
      rho[idx(r,c,d)] = a[r] * std::conj(a[c]);
  return DensityMatrix(n, std::move(rho));
}

c64 DensityMatrix::trace() const {
  const std::size_t d = dim();
  c64 tr{0.0,0.0};
  for (std::size_t i=0;i<d;i++) tr += rho_[idx(i,i,d)];
  return tr;
}

double DensityMatrix::purity() const {
  // Tr(rho^2) = sum_ij rho_ij rho_ji
  const std::size_t d = dim();
  double p = 0.0;
  for (std::size_t i=0;i<d;++i)
    for (std::size_t j=0;j<d;++j)
      p += std::real(rho_[idx(i,j,d)] * rho_[idx(j,i,d)]);
  return p;
}

std::vector<double> DensityMatrix::eigenvalues() const {
  using RowMajorXcd = Eigen::Matrix<std::complex<double>, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
  const Eigen::Index d = static_cast<Eigen::Index>(dim());
  Eigen::Map<const RowMajorXcd> m(rho_.data(), d, d);
  Eigen::MatrixXcd h = m;
  Eigen::SelfAdjointEigenSolver<Eigen::MatrixXcd> es(h, Eigen::EigenvaluesOnly);
  if (es.info() != Eigen::Success)
    throw NumericalError("Eigen decomposition of a " + std::to_string(dim()) + "x" + std::to_string(dim()) +
                         " density matrix did not converge");
  std::vector<double> out(static_cast<std::size_t>(d));
  for (Eigen::Index i=0;i<d;++i) out[static_cast<std::size_t>(i)] = es.eigenvalues()[i];
  return out;
}

double entropy_from_eigenvalues(const std::vector<double>& eig){
  double s = 0.0;
  for (double l : eig){
    l = std::max(l, 0.0);
    if (l <= 1e-15) continue;
    s -= l * std::log2(l);
  }
  return std::max(s, 0.0);
}

double DensityMatrix::entropy() const { return entropy_from_eigenvalues(eigenvalues()); }

namespace {

// offsets of the kept / traced subsystems' basis states in the full index
struct Split {
  std::vector<std::size_t> kept, traced;
};

Split split_qubits(std::size_t n, std::span<const std::size_t> keep){
  std::vector<bool> used(n, false);
  for (auto q : keep){
    if (q >= n) throw InvalidParameterError("Subsystem qubit " + std::to_string(q) + " out of range for " + std::to_string(n) + " qubits");
    if (used[q]) throw InvalidParameterError("Subsystem lists qubit " + std::to_string(q) + " twice");
    used[q] = true;
  }
  std::vector<std::size_t> rest;
  for (std::size_t q=0;q<n;++q) if (!used[q]) rest.push_back(q);
  auto expand = [](const std::vector<std::size_t>& qs){
    std::vector<std::size_t> off(std::size_t(1) << qs.size(), 0);
    for (std::size_t m=0;m<off.size();++m)
      for (std::size_t b=0;b<qs.size();++b)
        if ((m >> b) & 1) off[m] |= std::size_t(1) << qs[b];
    return off;
  };
  return { expand({keep.begin(), keep.end()}), expand(rest) };
}

} // namespace

DensityMatrix partial_trace(const DensityMatrix& rho, std::span<const std::size_t> keep){
  auto sp = split_qubits(rho.num_qubits(), keep);
  const std::size_t dk = sp.kept.size();
  vec_c64 out(dk*dk, {0.0,0.0});
  for (std::size_t r=0;r<dk;++r)
    for (std::size_t c=0;c<dk;++c){
      c64 acc{0.0,0.0};
      for (auto t : sp.traced) acc += rho.at(sp.kept[r] | t, sp.kept[c] | t);
      out[idx(r,c,dk)] = acc;
    }
  return DensityMatrix(keep.size(), std::move(out));
}

DensityMatrix reduced_density_matrix(const StateVector& sv, std::span<const std::size_t> keep){
  if (keep.size() > kMaxDensityQubits)
    throw InvalidParameterError("Subsystem of " + std::to_string(keep.size()) + " qubits exceeds the " +
                                std::to_string(kMaxDensityQubits) + "-qubit density matrix limit");
  auto sp = split_qubits(sv.num_qubits(), keep);
  const auto& a = sv.amplitudes();
  const std::size_t dk = sp.kept.size();
  vec_c64 out(dk*dk, {0.0,0.0});
  for (auto t : sp.traced)
    for (std::size_t r=0;r<dk;++r){
      const c64 ar = a[sp.kept[r] | t];
      if (ar == c64{0.0,0.0}) continue;
      for (std::size_t c=0;c<dk;++c) out[idx(r,c,dk)] += ar * std::conj(a[sp.kept[c] | t]);
    }
  return DensityMatrix(keep.size(), std::move(out));
}

} // namespace qlab
