// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include "density_matrix.hpp"
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace qlab {

// Probabilities below this are left out of reports.
inline constexpr double kProbabilityCutoff = 1e-12;

struct StatevectorReport {
  std::size_t nqubits{};
  std::vector<std::pair<std::string, c64>> amplitudes;       // basis order
  std::vector<std::pair<std::string, double>> probabilities; // descending
  std::string most_probable;
  double max_probability = 0.0;
  double total_probability = 0.0;
};

struct DensityReport {
  std::size_t nqubits{};
  double purity = 0.0;
  double entropy = 0.0; // bits
  double trace = 0.0;
  bool is_pure = false;
  // entanglement_entropy[q]: entropy of qubit q's reduced state
  std::vector<double> entanglement_entropy;
  std::optional<double> partial_trace_entropy; // qubit 0 vs. the rest, n >= 2
  std::optional<bool> entangled;
};

// All of these need a unitary-only circuit (MeasurementPresentError otherwise).
StatevectorReport analyze_statevector(const Circuit& c);
DensityMatrix density_matrix(const Circuit& c);
DensityReport analyze_density_matrix(const Circuit& c);
// Entropy (bits) of the reduced state over `subsystem`.
double entanglement_entropy(const Circuit& c, std::span<const std::size_t> subsystem);

} // namespace qlab
