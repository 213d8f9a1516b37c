// SPDX-License-Identifier: MIT

#include "qlab/registry.hpp"
#include "qlab/errors.hpp"
#include <chrono>
#include <cstdio>
#include <mutex>

namespace qlab {

std::string timestamp_stem(){
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::system_clock::now().time_since_epoch()).count();
  return "circuit_" + std::to_string(ms);
}

CircuitRegistry::CircuitRegistry(std::size_t max_qubits)
  : max_qubits_(max_qubits), tokens_(std::random_device{}()) {
  if (max_qubits == 0 || max_qubits > kMaxQubits)
    throw InvalidParameterError("max_qubits must be between 1 and " + std::to_string(kMaxQubits) +
                                ", got " + std::to_string(max_qubits));
}

void CircuitRegistry::check_width_(std::size_t nqubits, std::size_t nclbits) const {
  if (nqubits == 0 || nqubits > max_qubits_)
    throw InvalidParameterError("Qubit count must be between 1 and " + std::to_string(max_qubits_) +
                                ", got " + std::to_string(nqubits));
  if (nclbits > kMaxClbits)
    throw InvalidParameterError("Classical bit count must be at most " + std::to_string(kMaxClbits) +
                                ", got " + std::to_string(nclbits));
}

std::string CircuitRegistry::unique_name_locked_(const std::string& stem){
  char hex[9];
  std::string name;
  do {
    std::snprintf(hex, sizeof(hex), "%08x", static_cast<unsigned>(tokens_() & 0xffffffffu));
    name = stem + "_" + hex;
  } while (circuits_.count(name));
  return name;
}

std::string CircuitRegistry::create(std::size_t nqubits, std::optional<std::size_t> nclbits, std::optional<std::string> name){
  check_width_(nqubits, nclbits.value_or(nqubits));
  if (name && name->empty()) throw InvalidParameterError("Circuit name must not be empty");
  Circuit c;
  c.nqubits = nqubits;
  c.nclbits = nclbits.value_or(nqubits);

  std::unique_lock lock(mutex_);
  if (name) {
    if (circuits_.count(*name)) throw DuplicateNameError(*name);
    c.name = *name;
  } else {
    c.name = unique_name_locked_(timestamp_stem());
  }
  std::string out = c.name;
  circuits_.emplace(out, std::move(c));
  return out;
}

std::string CircuitRegistry::add(Circuit c, const std::string& stem){
  check_width_(c.nqubits, c.nclbits);
  // re-validate against the growing prefix so measurement ordering is enforced too
  Circuit prefix{c.name, c.nqubits, c.nclbits, {}};
  for (std::size_t i=0;i<c.ops.size();++i){
    validate_op(prefix, c.ops[i], i);
    prefix.ops.push_back(c.ops[i]);
  }
  std::unique_lock lock(mutex_);
  if (c.name.empty()) c.name = unique_name_locked_(stem);
  else if (circuits_.count(c.name)) throw DuplicateNameError(c.name);
  std::string out = c.name;
  circuits_.emplace(out, std::move(c));
  return out;
}

Circuit CircuitRegistry::get(const std::string& name) const {
  std::shared_lock lock(mutex_);
  auto it = circuits_.find(name);
  if (it == circuits_.end()) throw NotFoundError(name);
  return it->second;
}

bool CircuitRegistry::contains(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return circuits_.count(name) != 0;
}

std::vector<CircuitSummary> CircuitRegistry::list() const {
  std::shared_lock lock(mutex_);
  std::vector<CircuitSummary> out;
  out.reserve(circuits_.size());
  for (const auto& [name, c] : circuits_)
    out.push_back({name, c.nqubits, c.nclbits, c.size(), c.depth()});
  return out;
}

std::size_t CircuitRegistry::size() const {
  std::shared_lock lock(mutex_);
  return circuits_.size();
}

std::vector<Op> CircuitRegistry::append_operations(const std::string& name, const std::vector<GateRequest>& reqs,
                                                   std::size_t* total){
  std::unique_lock lock(mutex_);
  auto it = circuits_.find(name);
  if (it == circuits_.end()) throw NotFoundError(name);
  Circuit& c = it->second;

  // Validate on a scratch copy so a failure leaves the stored circuit untouched.
  Circuit scratch{c.name, c.nqubits, c.nclbits, c.ops};
  std::vector<Op> added;
  added.reserve(reqs.size());
  for (std::size_t i=0;i<reqs.size();++i){
    Op op = make_op(scratch, reqs[i], i);
    scratch.ops.push_back(op);
    added.push_back(std::move(op));
  }
  c.ops = std::move(scratch.ops);
  if (total) *total = c.ops.size();
  return added;
}

void CircuitRegistry::remove(const std::string& name){
  std::unique_lock lock(mutex_);
  if (circuits_.erase(name) == 0) throw NotFoundError(name);
}

} // namespace qlab
