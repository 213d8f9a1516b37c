// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qlab {

enum class Entanglement { Full, Linear, Circular };

// "full" | "linear" | "circular" (case-insensitive); InvalidParameterError otherwise.
Entanglement parse_entanglement(std::string_view name);
std::string_view entanglement_name(Entanglement e);

// Qubit pairs of one entangling layer, in emission order.
std::vector<std::pair<std::size_t, std::size_t>> entangling_pairs(std::size_t nqubits, Entanglement e);

inline constexpr std::size_t kMaxAnsatzLayers = 1024;

struct VariationalCircuit {
  Circuit circuit;
  std::size_t parameter_count{};
};

// Per layer: ry(theta) then rz(theta) on every qubit, then a cx layer over
// entangling_pairs(). Parameters are consumed in emission order; an empty
// `params` means all zeros. layers must be in [1, kMaxAnsatzLayers].
VariationalCircuit build_variational(std::size_t nqubits, std::size_t layers, Entanglement e,
                                     const std::vector<double>& params = {});

// QFT with qubit 0 as the least-significant bit: H and controlled phases from
// the top qubit down, then a swap network reversing qubit order. The inverse
// is the exact adjoint (swaps first, negated angles, reversed order).
Circuit build_qft(std::size_t nqubits, bool inverse);

} // namespace qlab
