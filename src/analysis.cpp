// SPDX-License-Identifier: MIT

#include "qlab/analysis.hpp"
#include <algorithm>

namespace qlab {

StatevectorReport analyze_statevector(const Circuit& c){
  StateVector sv = final_state(c);
  StatevectorReport r;
  r.nqubits = c.nqubits;
  const auto& a = sv.amplitudes();
  r.amplitudes.reserve(a.size());
  for (std::size_t i=0;i<a.size();++i){
    auto bits = index_to_bits(i, c.nqubits);
    double p = std::norm(a[i]);
    r.total_probability += p;
    r.amplitudes.emplace_back(bits, a[i]);
    if (p > kProbabilityCutoff) r.probabilities.emplace_back(std::move(bits), p);
  }
  // stable: ties keep basis order, so the arg-max is the lowest index
  std::stable_sort(r.probabilities.begin(), r.probabilities.end(),
                   [](const auto& x, const auto& y){ return x.second > y.second; });
  if (!r.probabilities.empty()){
    r.most_probable = r.probabilities.front().first;
    r.max_probability = r.probabilities.front().second;
  }
  return r;
}

DensityMatrix density_matrix(const Circuit& c){
  return DensityMatrix::from_state(final_state(c));
}

DensityReport analyze_density_matrix(const Circuit& c){
  StateVector sv = final_state(c);
  DensityMatrix rho = DensityMatrix::from_state(sv);
  DensityReport r;
  r.nqubits = c.nqubits;
  r.purity = rho.purity();
  r.entropy = rho.entropy();
  r.trace = rho.trace().real();
  r.is_pure = r.purity > 0.99;
  if (c.nqubits >= 2){
    r.entanglement_entropy.reserve(c.nqubits);
    for (std::size_t q=0;q<c.nqubits;++q){
      const std::size_t keep[] = {q};
      r.entanglement_entropy.push_back(reduced_density_matrix(sv, keep).entropy());
    }
    r.partial_trace_entropy = r.entanglement_entropy[0];
    r.entangled = *r.partial_trace_entropy > 0.01;
  }
  return r;
}

double entanglement_entropy(const Circuit& c, std::span<const std::size_t> subsystem){
  StateVector sv = final_state(c);
  return reduced_density_matrix(sv, subsystem).entropy();
}

} // namespace qlab
