// SPDX-License-Identifier: MIT

#pragma once
#include "state_vector.hpp"
#include "gates.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <optional>

namespace qlab {

// One operation. Unitary ops use `qubits` (ordered, distinct) and `params`;
// MEASURE uses qubits[0] and `cbit`; MEASURE_ALL has no operands.
struct Op {
  OpType type;
  std::vector<std::size_t> qubits;
  std::vector<double> params;
  std::size_t cbit = 0;
};

struct Circuit {
  std::string name;
  std::size_t nqubits{};
  std::size_t nclbits{};
  std::vector<Op> ops;

  std::size_t size() const { return ops.size(); }
  std::size_t width() const { return nqubits + nclbits; }
  // Longest qubit-wise dependency chain; MEASURE_ALL spans every qubit.
  std::size_t depth() const;
  std::map<std::string, std::size_t> count_ops() const;
  bool has_measurement() const;
};

// Qubits an operation touches (all qubits for MEASURE_ALL).
std::vector<std::size_t> op_qubits(const Op& op, std::size_t nqubits);

// Untyped operation as it arrives from a caller: {type, qubits, params?, classical_bit?}.
struct GateRequest {
  std::string type;
  std::vector<std::size_t> qubits;
  std::vector<double> params;
  std::optional<std::size_t> classical_bit;
};

// Resolves the gate name and checks the operation against the circuit's
// registers, including the no-unitary-after-measurement rule.
// Throws InvalidOperationError tagged with `index`.
Op make_op(const Circuit& c, const GateRequest& req, std::size_t index);
void validate_op(const Circuit& c, const Op& op, std::size_t index);

// Human-readable one-liner, e.g. "CX on qubits 0, 1" or "RZ(0.5) on qubit 2".
std::string describe_op(const Op& op);

// Text format:
//   QUBITS 2
//   CLBITS 2        (optional, defaults to QUBITS)
//   H 0
//   RZ 0 1.57079632679
//   CX 0 1
//   MEASURE 0 0
//   MEASURE ALL
std::optional<Circuit> parse_circuit_string(const std::string& text, std::string& err);
std::optional<Circuit> parse_circuit_file(const std::string& path, std::string& err);
std::string format_circuit(const Circuit& c);

// NumericalError naming `circuit` unless |norm2 - 1| <= kNormTolerance.
void check_normalized(const StateVector& sv, const std::string& circuit);

// Final pre-measurement state. Throws MeasurementPresentError if the circuit
// measures and `allow_measurement` is false; NumericalError on norm drift.
StateVector final_state(const Circuit& c, bool allow_measurement=false);

// Measurement outcomes keyed by classical bitstring (bit nclbits-1 leftmost).
struct RunResult {
  std::map<std::string, std::size_t> counts;
  std::size_t shots = 0;
};

RunResult run(const Circuit& c, std::size_t shots, std::optional<uint64_t> seed);

// Norm tolerance after the unitary phase.
inline constexpr double kNormTolerance = 1e-6;

} // namespace qlab
