// SPDX-License-Identifier: MIT

#include "qlab/gates.hpp"
#include "qlab/errors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <numbers>

namespace qlab {

namespace {

constexpr double kInvSqrt2 = 0.70710678118654752440;

c64 expi(double a){ return { std::cos(a), std::sin(a) }; }

vec_c64 mat_h(std::span<const double>){ return { kInvSqrt2, kInvSqrt2, kInvSqrt2, -kInvSqrt2 }; }
vec_c64 mat_x(std::span<const double>){ return { 0, 1, 1, 0 }; }
vec_c64 mat_y(std::span<const double>){ return { 0, c64{0,-1}, c64{0,1}, 0 }; } // [[0,-i],[i,0]]
vec_c64 mat_z(std::span<const double>){ return { 1, 0, 0, -1 }; }
vec_c64 mat_s(std::span<const double>){ return { 1, 0, 0, c64{0,1} }; }
vec_c64 mat_sdg(std::span<const double>){ return { 1, 0, 0, c64{0,-1} }; }
vec_c64 mat_t(std::span<const double>){ return { 1, 0, 0, expi(std::numbers::pi/4) }; }
vec_c64 mat_tdg(std::span<const double>){ return { 1, 0, 0, expi(-std::numbers::pi/4) }; }
vec_c64 mat_p(std::span<const double> p){ return { 1, 0, 0, expi(p[0]) }; }

vec_c64 mat_rx(std::span<const double> p){
  double c = std::cos(p[0]/2.0), s = std::sin(p[0]/2.0);
  return { c, c64{0,-s}, c64{0,-s}, c };
}
vec_c64 mat_ry(std::span<const double> p){
  double c = std::cos(p[0]/2.0), s = std::sin(p[0]/2.0);
  return { c, -s, s, c };
}
vec_c64 mat_rz(std::span<const double> p){
  // diag(e^{-iθ/2}, e^{iθ/2})
  return { expi(-p[0]/2.0), 0, 0, expi(p[0]/2.0) };
}
vec_c64 mat_u(std::span<const double> p){
  double theta = p[0], phi = p[1], lam = p[2];
  double c = std::cos(theta/2.0), s = std::sin(theta/2.0);
  return { c, -expi(lam)*s, expi(phi)*s, expi(phi+lam)*c };
}

// Two-qubit matrices: local index k = b(q0) + 2*b(q1).
vec_c64 mat_cx(std::span<const double>){
  // control q0, target q1: |01> <-> |11> in (q1 q0) order, i.e. k=1 <-> k=3
  return { 1,0,0,0,
           0,0,0,1,
           0,0,1,0,
           0,1,0,0 };
}
vec_c64 mat_cz(std::span<const double>){
  return { 1,0,0,0, 0,1,0,0, 0,0,1,0, 0,0,0,-1 };
}
vec_c64 mat_swap(std::span<const double>){
  return { 1,0,0,0,
           0,0,1,0,
           0,1,0,0,
           0,0,0,1 };
}
vec_c64 mat_cp(std::span<const double> p){
  return { 1,0,0,0, 0,1,0,0, 0,0,1,0, 0,0,0,expi(p[0]) };
}
vec_c64 mat_rxx(std::span<const double> p){
  double c = std::cos(p[0]/2.0), s = std::sin(p[0]/2.0);
  c64 m{0,-s};
  return { c,0,0,m,
           0,c,m,0,
           0,m,c,0,
           m,0,0,c };
}
vec_c64 mat_ryy(std::span<const double> p){
  double c = std::cos(p[0]/2.0), s = std::sin(p[0]/2.0);
  c64 m{0,-s}, q{0,s};
  return { c,0,0,q,
           0,c,m,0,
           0,m,c,0,
           q,0,0,c };
}
vec_c64 mat_rzz(std::span<const double> p){
  c64 a = expi(-p[0]/2.0), b = expi(p[0]/2.0);
  return { a,0,0,0, 0,b,0,0, 0,0,b,0, 0,0,0,a };
}

// Indexed by OpType.
constexpr std::array<GateSpec, 22> kCatalog{{
  {"h",    OpType::H,    1, 0, mat_h},
  {"x",    OpType::X,    1, 0, mat_x},
  {"y",    OpType::Y,    1, 0, mat_y},
  {"z",    OpType::Z,    1, 0, mat_z},
  {"s",    OpType::S,    1, 0, mat_s},
  {"sdg",  OpType::SDG,  1, 0, mat_sdg},
  {"t",    OpType::T,    1, 0, mat_t},
  {"tdg",  OpType::TDG,  1, 0, mat_tdg},
  {"p",    OpType::P,    1, 1, mat_p},
  {"rx",   OpType::RX,   1, 1, mat_rx},
  {"ry",   OpType::RY,   1, 1, mat_ry},
  {"rz",   OpType::RZ,   1, 1, mat_rz},
  {"u",    OpType::U,    1, 3, mat_u},
  {"cx",   OpType::CX,   2, 0, mat_cx},
  {"cz",   OpType::CZ,   2, 0, mat_cz},
  {"swap", OpType::SWAP, 2, 0, mat_swap},
  {"cp",   OpType::CP,   2, 1, mat_cp},
  {"rxx",  OpType::RXX,  2, 1, mat_rxx},
  {"ryy",  OpType::RYY,  2, 1, mat_ryy},
  {"rzz",  OpType::RZZ,  2, 1, mat_rzz},
  {"measure",     OpType::MEASURE,     1, 0, nullptr},
  {"measure_all", OpType::MEASURE_ALL, 0, 0, nullptr},
}};

bool iequals(std::string_view a, std::string_view b){
  if (a.size()!=b.size()) return false;
  for (std::size_t i=0;i<a.size();++i)
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  return true;
}

} // namespace

std::span<const GateSpec> gate_catalog(){ return kCatalog; }

const GateSpec& gate_spec(OpType t){ return kCatalog[static_cast<std::size_t>(t)]; }

const GateSpec* find_gate(std::string_view name){
  if (iequals(name, "cnot")) return &gate_spec(OpType::CX);
  for (const auto& g : kCatalog) if (iequals(g.name, name)) return &g;
  return nullptr;
}

vec_c64 gate_matrix(OpType t, std::span<const double> params){
  const auto& g = gate_spec(t);
  if (!g.matrix) throw InvalidParameterError("'" + std::string(g.name) + "' has no unitary matrix");
  if (params.size() != g.param_count)
    throw InvalidParameterError("'" + std::string(g.name) + "' expects " + std::to_string(g.param_count) +
                                " parameter(s), got " + std::to_string(params.size()));
  return g.matrix(params);
}

double unitarity_error(const vec_c64& u, std::size_t dim){
  double worst = 0.0;
  for (std::size_t i=0;i<dim;++i)
    for (std::size_t j=0;j<dim;++j){
      c64 acc{0.0,0.0};
      for (std::size_t k=0;k<dim;++k) acc += std::conj(u[k*dim+i]) * u[k*dim+j];
      if (i==j) acc -= 1.0;
      worst = std::max(worst, std::abs(acc));
    }
  return worst;
}

bool check_unitary(OpType t, std::span<const double> params, double tol){
  const std::size_t dim = std::size_t(1) << gate_spec(t).arity;
  return unitarity_error(gate_matrix(t, params), dim) <= tol;
}

} // namespace qlab
