// SPDX-License-Identifier: MIT

#include "qlab/builders.hpp"
#include "qlab/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numbers>

namespace qlab {

static void check_qubits(std::size_t nqubits){
  if (nqubits == 0 || nqubits > kMaxQubits)
    throw InvalidParameterError("Qubit count must be between 1 and " + std::to_string(kMaxQubits) +
                                ", got " + std::to_string(nqubits));
}

Entanglement parse_entanglement(std::string_view name){
  std::string s(name);
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return char(std::tolower(c)); });
  if (s == "full") return Entanglement::Full;
  if (s == "linear") return Entanglement::Linear;
  if (s == "circular") return Entanglement::Circular;
  throw InvalidParameterError("Unknown entanglement pattern '" + std::string(name) +
                              "' (expected full, linear or circular)");
}

std::string_view entanglement_name(Entanglement e){
  switch (e){
    case Entanglement::Full: return "full";
    case Entanglement::Linear: return "linear";
    case Entanglement::Circular: return "circular";
  }
  return "unknown";
}

std::vector<std::pair<std::size_t, std::size_t>> entangling_pairs(std::size_t n, Entanglement e){
  std::vector<std::pair<std::size_t, std::size_t>> pairs;
  if (n < 2) return pairs;
  if (e == Entanglement::Full){
    for (std::size_t i=0;i<n;++i)
      for (std::size_t j=i+1;j<n;++j) pairs.emplace_back(i, j);
    return pairs;
  }
  for (std::size_t i=0;i+1<n;++i) pairs.emplace_back(i, i+1);
  // with two qubits the wraparound pair would repeat (0,1)
  if (e == Entanglement::Circular && n > 2) pairs.emplace_back(n-1, 0);
  return pairs;
}

VariationalCircuit build_variational(std::size_t nqubits, std::size_t layers, Entanglement e,
                                     const std::vector<double>& params){
  check_qubits(nqubits);
  if (layers == 0 || layers > kMaxAnsatzLayers)
    throw InvalidParameterError("Layer count must be between 1 and " + std::to_string(kMaxAnsatzLayers) +
                                ", got " + std::to_string(layers));
  const std::size_t count = nqubits * 2 * layers;
  if (!params.empty() && params.size() != count)
    throw InvalidParameterError("Ansatz needs " + std::to_string(count) + " parameters, got " +
                                std::to_string(params.size()));
  for (double p : params)
    if (!std::isfinite(p)) throw InvalidParameterError("Ansatz parameters must be finite");

  VariationalCircuit vc;
  vc.parameter_count = count;
  Circuit& c = vc.circuit;
  c.nqubits = nqubits;
  c.nclbits = nqubits;
  auto pairs = entangling_pairs(nqubits, e);
  std::size_t k = 0;
  auto next = [&]{ return params.empty() ? 0.0 : params[k++]; };
  for (std::size_t l=0;l<layers;++l){
    for (std::size_t q=0;q<nqubits;++q){
      c.ops.push_back({OpType::RY, {q}, {next()}});
      c.ops.push_back({OpType::RZ, {q}, {next()}});
    }
    for (auto [a, b] : pairs) c.ops.push_back({OpType::CX, {a, b}, {}});
  }
  return vc;
}

Circuit build_qft(std::size_t nqubits, bool inverse){
  check_qubits(nqubits);
  Circuit c;
  c.nqubits = nqubits;
  c.nclbits = nqubits;
  for (std::size_t j = nqubits; j-- > 0;){
    c.ops.push_back({OpType::H, {j}, {}});
    for (std::size_t k = j; k-- > 0;)
      c.ops.push_back({OpType::CP, {k, j}, {std::numbers::pi / double(std::size_t(1) << (j-k))}});
  }
  for (std::size_t i=0;i<nqubits/2;++i)
    c.ops.push_back({OpType::SWAP, {i, nqubits-1-i}, {}});
  if (inverse){
    std::reverse(c.ops.begin(), c.ops.end());
    for (auto& op : c.ops) for (auto& p : op.params) p = -p;
  }
  return c;
}

} // namespace qlab
