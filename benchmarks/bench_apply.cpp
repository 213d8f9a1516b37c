// SPDX-License-Identifier: MIT

#include "qlab/builders.hpp"
#include "qlab/circuit.hpp"
#include "qlab/optimize.hpp"
#include <chrono>
#include <iostream>

using namespace qlab;

int main(){
  std::size_t n=20;
  Circuit c; c.nqubits=n; c.nclbits=n;
  for(std::size_t i=0;i<100;++i){ c.ops.push_back({OpType::H,{i% n},{}}); }
  for(std::size_t i=0;i<100;++i){ c.ops.push_back({OpType::CX,{i% (n-1), (i% (n-1))+1},{}}); }
  auto t0 = std::chrono::steady_clock::now();
  auto sv = final_state(c); (void)sv;
  auto t1 = std::chrono::steady_clock::now();
  std::chrono::duration<double> dt = t1 - t0;
  std::cout << "statevector " << n << "q, " << c.size() << " ops: " << dt.count() << " s\n";

  Circuit q = build_qft(16, false);
  t0 = std::chrono::steady_clock::now();
  auto sq = final_state(q); (void)sq;
  t1 = std::chrono::steady_clock::now();
  dt = t1 - t0;
  std::cout << "qft 16q, " << q.size() << " ops: " << dt.count() << " s\n";

  auto ans = build_variational(12, 8, Entanglement::Full);
  t0 = std::chrono::steady_clock::now();
  auto r = optimize(ans.circuit, 3);
  t1 = std::chrono::steady_clock::now();
  dt = t1 - t0;
  std::cout << "optimize ansatz " << r.report.original_gate_count << " -> " << r.report.optimized_gate_count
            << " ops: " << dt.count() << " s\n";
  return 0;
}
