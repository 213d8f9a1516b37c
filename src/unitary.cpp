// SPDX-License-Identifier: MIT

#include "qlab/unitary.hpp"
#include "qlab/errors.hpp"
#include <cmath>
#include <fstream>

namespace qlab {

static vec_c64 eye(std::size_t d){
  vec_c64 m(d*d, {0.0,0.0});
  for (std::size_t i=0;i<d;i++) m[i*d+i] = {1.0,0.0};
  return m;
}

static vec_c64 matmul(const vec_c64& A, const vec_c64& B, std::size_t d){
  vec_c64 C(d*d, {0.0,0.0});
  for (std::size_t i=0;i<d;i++)
    for (std::size_t k=0;k<d;k++){
      auto aik = A[i*d+k];
      if (aik == c64{0.0,0.0}) continue;
      for (std::size_t j=0;j<d;j++)
        C[i*d+j] += aik * B[k*d+j];
    }
  return C;
}

// Lifts a 2^k x 2^k gate on `targets` to the full register; targets[0] is
// the low bit of the local index.
static vec_c64 embed_gate(const vec_c64& u, const std::vector<std::size_t>& targets, std::size_t n){
  std::size_t d = std::size_t(1) << n;
  std::size_t k = targets.size(), dk = std::size_t(1) << k;
  std::size_t mask = 0;
  for (auto t : targets) mask |= std::size_t(1) << t;
  vec_c64 G(d*d, {0.0,0.0});
  for (std::size_t col=0; col<d; ++col){
    std::size_t local_col = 0;
    for (std::size_t b=0;b<k;b++) if ((col >> targets[b]) & 1) local_col |= std::size_t(1) << b;
    std::size_t base = col & ~mask;
    for (std::size_t local_row=0; local_row<dk; ++local_row){
      std::size_t row = base;
      for (std::size_t b=0;b<k;b++) if ((local_row >> b) & 1) row |= std::size_t(1) << targets[b];
      G[row*d + col] = u[local_row*dk + local_col];
    }
  }
  return G;
}

vec_c64 build_unitary(const Circuit& c){
  if (c.has_measurement()) throw MeasurementPresentError(c.name);
  std::size_t n = c.nqubits;
  std::size_t d = std::size_t(1) << n;
  auto U = eye(d);
  for (const auto& op : c.ops){
    auto G = embed_gate(gate_matrix(op.type, op.params), op.qubits, n);
    U = matmul(G, U, d);
  }
  return U;
}

bool export_unitary_csv(const Circuit& c, const std::string& path){
  std::size_t d = std::size_t(1) << c.nqubits;
  if (d > (1u<<10)) return false;
  auto U = build_unitary(c);
  std::ofstream out(path);
  if (!out) return false;
  for (std::size_t i=0;i<d;i++){
    for (std::size_t j=0;j<d;j++){
      auto z = U[i*d+j];
      out << std::real(z) << (std::imag(z) < 0 ? "" : "+") << std::imag(z) << "i";
      if (j+1<d) out << ",";
    }
    out << "\n";
  }
  return bool(out);
}

bool equal_up_to_global_phase(const vec_c64& a, const vec_c64& b, double tol){
  if (a.size() != b.size()) return false;
  // phase from the largest entry of b
  std::size_t k = 0;
  for (std::size_t i=1;i<b.size();++i) if (std::abs(b[i]) > std::abs(b[k])) k = i;
  if (b.empty() || std::abs(b[k]) < tol){
    for (const auto& z : a) if (std::abs(z) > tol) return false;
    return true;
  }
  if (std::abs(a[k]) < tol) return false;
  c64 phase = a[k] / b[k];
  phase /= std::abs(phase);
  for (std::size_t i=0;i<a.size();++i)
    if (std::abs(a[i] - phase*b[i]) > tol) return false;
  return true;
}

} // namespace qlab
