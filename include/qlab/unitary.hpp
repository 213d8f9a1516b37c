// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include <string>
#include <vector>

namespace qlab {

// Full 2^n x 2^n operator of a unitary-only circuit, row-major.
// Throws MeasurementPresentError if the circuit measures.
vec_c64 build_unitary(const Circuit& c);

// Export unitary to CSV ("re+imi" per cell). Refuses circuits over 10 qubits.
bool export_unitary_csv(const Circuit& c, const std::string& path);

// True if a = e^{i phi} b for some phi, entrywise within tol. Works for
// statevectors and flattened operators alike.
bool equal_up_to_global_phase(const vec_c64& a, const vec_c64& b, double tol);

} // namespace qlab
