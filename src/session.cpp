// SPDX-License-Identifier: MIT

#include "qlab/session.hpp"
#include "qlab/errors.hpp"

namespace qlab {

std::string Session::create_circuit(std::size_t nqubits, std::optional<std::size_t> nclbits,
                                    std::optional<std::string> name){
  return registry_.create(nqubits, nclbits, std::move(name));
}

AppendSummary Session::append_gates(const std::string& id, const std::vector<GateRequest>& ops){
  AppendSummary s;
  s.circuit = id;
  for (const auto& op : registry_.append_operations(id, ops, &s.total_operations))
    s.operations.push_back(describe_op(op));
  s.added = s.operations.size();
  return s;
}

RunResult Session::run(const std::string& id, std::size_t shots, std::optional<uint64_t> seed) const {
  return qlab::run(registry_.get(id), shots, seed);
}

CircuitDescription Session::describe(const std::string& id) const {
  Circuit c = registry_.get(id);
  CircuitDescription d;
  d.name = c.name;
  d.nqubits = c.nqubits;
  d.nclbits = c.nclbits;
  d.depth = c.depth();
  d.total_operations = c.size();
  d.gate_counts = c.count_ops();
  for (const auto& op : c.ops) d.operations.push_back(describe_op(op));
  return d;
}

StatevectorReport Session::analyze_statevector(const std::string& id) const {
  return qlab::analyze_statevector(registry_.get(id));
}

DensityReport Session::analyze_density_matrix(const std::string& id) const {
  return qlab::analyze_density_matrix(registry_.get(id));
}

double Session::entanglement_entropy(const std::string& id, std::span<const std::size_t> subsystem) const {
  return qlab::entanglement_entropy(registry_.get(id), subsystem);
}

OptimizeOutcome Session::optimize(const std::string& id, int level){
  Circuit src = registry_.get(id);
  auto r = qlab::optimize(src, level);
  OptimizeOutcome out;
  out.report = r.report;
  out.circuit = registry_.add(std::move(r.circuit), id + "_opt" + std::to_string(level));
  return out;
}

std::string Session::store_(Circuit c, std::optional<std::string> name, const std::string& stem){
  if (name){
    if (name->empty()) throw InvalidParameterError("Circuit name must not be empty");
    c.name = *name;
  }
  return registry_.add(std::move(c), stem);
}

VariationalOutcome Session::build_variational(std::size_t nqubits, std::size_t layers,
                                              const std::string& entanglement,
                                              std::optional<std::string> name,
                                              const std::vector<double>& params){
  auto vc = qlab::build_variational(nqubits, layers, parse_entanglement(entanglement), params);
  VariationalOutcome out;
  out.parameter_count = vc.parameter_count;
  out.circuit = store_(std::move(vc.circuit), std::move(name), timestamp_stem());
  return out;
}

std::string Session::build_qft(std::size_t nqubits, bool inverse, std::optional<std::string> name){
  std::string stem = std::string(inverse ? "iqft_" : "qft_") + std::to_string(nqubits) + "q";
  return store_(qlab::build_qft(nqubits, inverse), std::move(name), stem);
}

} // namespace qlab
