// SPDX-License-Identifier: MIT

#include "qlab/builders.hpp"
#include "qlab/errors.hpp"
#include <cmath>
#include <iostream>
#include <numbers>

using namespace qlab;

static int fails = 0;
#define CHECK(cond) do{ if (!(cond)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #cond "\n"; ++fails; } }while(0)
#define CHECK_NEAR(a,b,e) do{ if (std::fabs((a)-(b))>(e)) { std::cerr << "Mismatch at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++fails; } }while(0)

// |x> prepared with X gates, followed by `tail`.
static Circuit on_basis(std::size_t n, std::size_t x, const std::vector<Circuit>& tail){
  Circuit c{"basis", n, n, {}};
  for (std::size_t q=0;q<n;++q) if ((x >> q) & 1) c.ops.push_back({OpType::X, {q}, {}});
  for (const auto& t : tail) c.ops.insert(c.ops.end(), t.ops.begin(), t.ops.end());
  return c;
}

template <class F>
static bool throws_param(F&& f){
  try { f(); } catch (const InvalidParameterError&) { return true; }
  return false;
}

int main(){
  // QFT then inverse QFT is the identity on every basis state
  for (std::size_t n : {1u, 2u, 3u, 4u}){
    Circuit fwd = build_qft(n, false), inv = build_qft(n, true);
    for (std::size_t x=0; x < (std::size_t(1) << n); ++x){
      auto sv = final_state(on_basis(n, x, {fwd, inv}));
      CHECK_NEAR(sv.probability_of_basis(x), 1.0, 1e-9);
      CHECK_NEAR(std::abs(sv.amplitudes()[x] - c64(1.0, 0.0)), 0.0, 1e-9);
    }
  }

  // QFT|x> = sum_k e^{2 pi i x k / N} |k> / sqrt(N)
  {
    const std::size_t n = 3, N = 8;
    for (std::size_t x : {1u, 5u, 6u}){
      auto sv = final_state(on_basis(n, x, {build_qft(n, false)}));
      for (std::size_t k=0;k<N;++k){
        c64 want = std::polar(1.0 / std::sqrt(double(N)), 2.0 * std::numbers::pi * double(x * k) / double(N));
        CHECK_NEAR(std::abs(sv.amplitudes()[k] - want), 0.0, 1e-9);
      }
    }
  }

  // shape of the construction
  {
    Circuit q = build_qft(4, false);
    auto counts = q.count_ops();
    CHECK(counts["h"] == 4 && counts["cp"] == 6 && counts["swap"] == 2);
    CHECK(q.ops.front().type == OpType::H && q.ops.front().qubits[0] == 3);
    CHECK(q.ops.back().type == OpType::SWAP);
    Circuit iq = build_qft(4, true);
    CHECK(iq.ops.front().type == OpType::SWAP);
    CHECK(iq.ops.back().type == OpType::H && iq.ops.back().qubits[0] == 3);
    CHECK(iq.size() == q.size());
    CHECK_NEAR(q.ops[1].params[0], std::numbers::pi / 2, 1e-15);
    CHECK_NEAR(iq.ops[iq.size()-2].params[0], -std::numbers::pi / 2, 1e-15);
    CHECK(build_qft(1, false).size() == 1);
  }

  // ansatz topology and parameter count
  {
    auto v = build_variational(3, 2, Entanglement::Linear);
    CHECK(v.parameter_count == 12);
    CHECK(v.circuit.size() == 16);
    auto counts = v.circuit.count_ops();
    CHECK(counts["ry"] == 6 && counts["rz"] == 6 && counts["cx"] == 4);
    CHECK(!v.circuit.has_measurement());

    auto pairs = entangling_pairs(3, Entanglement::Circular);
    CHECK(pairs.size() == 3 && pairs[2] == std::make_pair(std::size_t(2), std::size_t(0)));
    CHECK(entangling_pairs(2, Entanglement::Circular).size() == 1);
    CHECK(entangling_pairs(4, Entanglement::Full).size() == 6);
    CHECK(entangling_pairs(1, Entanglement::Full).empty());
    CHECK(build_variational(1, 3, Entanglement::Full).circuit.count_ops().count("cx") == 0);
  }

  // zero parameters leave |0...0>; parameters are used in emission order
  {
    auto v = build_variational(3, 1, Entanglement::Linear);
    CHECK_NEAR(final_state(v.circuit).probability_of_basis(0), 1.0, 1e-12);
    std::vector<double> p(v.parameter_count, 0.0);
    p[0] = std::numbers::pi; // ry on qubit 0
    auto w = build_variational(3, 1, Entanglement::Linear, p);
    // ry(pi) flips qubit 0, the cx chain carries it to qubits 1 and 2
    CHECK_NEAR(final_state(w.circuit).probability_of_basis(7), 1.0, 1e-12);
  }

  // names and errors
  CHECK(parse_entanglement("Circular") == Entanglement::Circular);
  CHECK(entanglement_name(Entanglement::Full) == "full");
  CHECK(throws_param([]{ parse_entanglement("star"); }));
  CHECK(throws_param([]{ build_variational(2, 0, Entanglement::Full); }));
  CHECK(throws_param([]{ build_variational(2, kMaxAnsatzLayers + 1, Entanglement::Linear); }));
  CHECK(throws_param([]{ build_variational(2, std::size_t(-1), Entanglement::Linear); }));
  CHECK(build_variational(1, kMaxAnsatzLayers, Entanglement::Linear).parameter_count == 2 * kMaxAnsatzLayers);
  CHECK(throws_param([]{ build_variational(0, 1, Entanglement::Full); }));
  CHECK(throws_param([]{ build_variational(2, 1, Entanglement::Full, {0.1, 0.2}); }));
  CHECK(throws_param([]{ build_qft(0, false); }));
  CHECK(throws_param([]{ build_qft(kMaxQubits + 1, true); }));

  if (fails==0) std::cout << "OK\n";
  return fails==0?0:1;
}
