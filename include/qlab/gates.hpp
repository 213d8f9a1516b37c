// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include <span>
#include <string_view>

namespace qlab {

// Closed catalog of operations. MEASURE/MEASURE_ALL are pseudo-ops with no matrix.
enum class OpType {
  H, X, Y, Z, S, SDG, T, TDG, P,
  RX, RY, RZ, U,
  CX, CZ, SWAP, CP, RXX, RYY, RZZ,
  MEASURE, MEASURE_ALL
};

// Row-major 2^arity x 2^arity matrix from the gate's parameters. For
// multi-qubit gates the first target qubit is the least-significant bit of
// the local basis index.
using MatrixFn = vec_c64 (*)(std::span<const double>);

struct GateSpec {
  std::string_view name;
  OpType type;
  std::size_t arity;
  std::size_t param_count;
  MatrixFn matrix; // nullptr for measurement pseudo-ops
};

std::span<const GateSpec> gate_catalog();
const GateSpec& gate_spec(OpType t);
// Case-insensitive lookup; "cnot" is an alias of "cx". nullptr if unknown.
const GateSpec* find_gate(std::string_view name);

inline std::string_view op_name(OpType t) { return gate_spec(t).name; }
inline bool is_unitary(OpType t) { return t != OpType::MEASURE && t != OpType::MEASURE_ALL; }

// Throws InvalidParameterError on a parameter-count mismatch or a measurement type.
vec_c64 gate_matrix(OpType t, std::span<const double> params);

// Catalog matrices deviating further than this are an engine bug (NumericalError).
inline constexpr double kUnitarityTolerance = 1e-10;

// Max-abs deviation of U^dagger U from identity.
double unitarity_error(const vec_c64& u, std::size_t dim);
bool check_unitary(OpType t, std::span<const double> params, double tol = 1e-12);

} // namespace qlab
