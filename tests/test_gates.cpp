// SPDX-License-Identifier: MIT

#include "qlab/errors.hpp"
#include "qlab/gates.hpp"
#include "qlab/state_vector.hpp"
#include <cmath>
#include <iostream>
#include <numbers>
#include <vector>

using namespace qlab;

static int tests_failed = 0;
#define CHECK(cond) do{ if (!(cond)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #cond "\n"; ++tests_failed; } }while(0)
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)

// Some state with no special symmetry.
static StateVector scrambled(std::size_t n){
  StateVector sv(n);
  for (std::size_t q=0;q<n;++q){
    const double a[] = {0.3 + 0.4*double(q)};
    const double b[] = {-0.7 + 0.2*double(q)};
    const std::size_t t[] = {q};
    sv.apply_unitary(OpType::RY, t, a);
    sv.apply_unitary(OpType::RZ, t, b);
  }
  const std::size_t pair[] = {0, 1};
  sv.apply_unitary(OpType::CX, pair, {});
  return sv;
}

static void check_inverse(OpType g, std::vector<double> p, OpType ginv, std::vector<double> pinv, std::vector<std::size_t> targets){
  StateVector sv = scrambled(3);
  auto before = sv.amplitudes();
  sv.apply_unitary(g, targets, p);
  sv.apply_unitary(ginv, targets, pinv);
  for (std::size_t i=0;i<before.size();++i) EXPECT_NEAR(std::abs(sv.amplitudes()[i] - before[i]), 0.0, 1e-9);
}

int main(){
  // every unitary catalog entry is unitary for a few parameter choices
  for (const auto& g : gate_catalog()){
    if (!is_unitary(g.type)) { CHECK(g.matrix == nullptr); continue; }
    for (double a : {0.0, 0.37, -2.1, std::numbers::pi}){
      std::vector<double> params(g.param_count, a);
      if (!check_unitary(g.type, params)) { std::cerr << "not unitary: " << g.name << "(" << a << ")\n"; ++tests_failed; }
      CHECK(gate_matrix(g.type, params).size() == (std::size_t(1) << (2*g.arity)));
    }
  }

  // g followed by its inverse is the identity
  check_inverse(OpType::H, {}, OpType::H, {}, {1});
  check_inverse(OpType::X, {}, OpType::X, {}, {0});
  check_inverse(OpType::Y, {}, OpType::Y, {}, {2});
  check_inverse(OpType::Z, {}, OpType::Z, {}, {1});
  check_inverse(OpType::S, {}, OpType::SDG, {}, {0});
  check_inverse(OpType::T, {}, OpType::TDG, {}, {2});
  check_inverse(OpType::RX, {0.81}, OpType::RX, {-0.81}, {1});
  check_inverse(OpType::RY, {1.3}, OpType::RY, {-1.3}, {0});
  check_inverse(OpType::RZ, {-2.2}, OpType::RZ, {2.2}, {2});
  check_inverse(OpType::P, {0.4}, OpType::P, {-0.4}, {0});
  check_inverse(OpType::U, {0.3, 0.5, 0.7}, OpType::U, {-0.3, -0.7, -0.5}, {1});
  check_inverse(OpType::CX, {}, OpType::CX, {}, {2, 0});
  check_inverse(OpType::SWAP, {}, OpType::SWAP, {}, {0, 2});
  check_inverse(OpType::CP, {0.9}, OpType::CP, {-0.9}, {1, 2});
  check_inverse(OpType::RZZ, {0.6}, OpType::RZZ, {-0.6}, {0, 1});
  check_inverse(OpType::RXX, {0.6}, OpType::RXX, {-0.6}, {2, 1});

  // lookup
  CHECK(find_gate("CX") && find_gate("CX")->type == OpType::CX);
  CHECK(find_gate("cnot") && find_gate("cnot")->type == OpType::CX);
  CHECK(find_gate("Rz") && find_gate("Rz")->param_count == 1);
  CHECK(find_gate("measure_all") && find_gate("measure_all")->arity == 0);
  CHECK(find_gate("toffoli") == nullptr);
  CHECK(op_name(OpType::SDG) == "sdg");

  bool threw = false;
  try { (void)gate_matrix(OpType::RX, {}); } catch (const InvalidParameterError&) { threw = true; }
  CHECK(threw);
  threw = false;
  try { (void)gate_matrix(OpType::MEASURE, {}); } catch (const InvalidParameterError&) { threw = true; }
  CHECK(threw);

  // qubit 0 is the low bit
  {
    StateVector sv(2);
    const std::size_t q0[] = {0};
    sv.apply_unitary(OpType::X, q0, {});
    EXPECT_NEAR(sv.probability_of_basis(1), 1.0, 1e-12);
    CHECK(index_to_bits(1, 2) == "01");
    const std::size_t cx01[] = {0, 1};
    sv.apply_unitary(OpType::CX, cx01, {});
    EXPECT_NEAR(sv.probability_of_basis(3), 1.0, 1e-12);
  }
  {
    // control on qubit 1, target qubit 0
    StateVector sv(2);
    const std::size_t q1[] = {1};
    sv.apply_unitary(OpType::X, q1, {});
    const std::size_t cx10[] = {1, 0};
    sv.apply_unitary(OpType::CX, cx10, {});
    EXPECT_NEAR(sv.probability_of_basis(3), 1.0, 1e-12);
    const std::size_t cx01[] = {0, 1};
    sv.apply_unitary(OpType::CX, cx01, {});
    EXPECT_NEAR(sv.probability_of_basis(1), 1.0, 1e-12);
  }
  {
    // cp only phases |11>
    StateVector sv(2);
    const std::size_t q0[] = {0}, q1[] = {1};
    sv.apply_unitary(OpType::H, q0, {});
    sv.apply_unitary(OpType::H, q1, {});
    const std::size_t pr[] = {0, 1};
    const double lam[] = {std::numbers::pi / 2};
    sv.apply_unitary(OpType::CP, pr, lam);
    EXPECT_NEAR(std::abs(sv.amplitudes()[3] - c64(0.0, 0.5)), 0.0, 1e-12);
    EXPECT_NEAR(std::abs(sv.amplitudes()[1] - c64(0.5, 0.0)), 0.0, 1e-12);
  }

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
