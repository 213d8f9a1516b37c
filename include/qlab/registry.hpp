// SPDX-License-Identifier: MIT

#pragma once
#include "circuit.hpp"
#include <map>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <vector>

namespace qlab {

struct CircuitSummary {
  std::string name;
  std::size_t nqubits{};
  std::size_t nclbits{};
  std::size_t size{};
  std::size_t depth{};
};

// "circuit_<ms since epoch>", the stem of auto-generated names.
std::string timestamp_stem();

// Process-wide store of named circuits. Created once by the owner (CLI,
// Python session) and passed by reference to whatever needs lookups; torn
// down with its owner. Writers (create/add/append/remove) take the lock
// exclusively, readers share it; get() hands out snapshots so no caller
// ever holds a reference into the store.
class CircuitRegistry {
public:
  explicit CircuitRegistry(std::size_t max_qubits = 24);

  // nclbits defaults to nqubits. Without a name, one is generated
  // ("circuit_<ms>_<8 hex>"). An explicit name that is taken throws
  // DuplicateNameError.
  std::string create(std::size_t nqubits,
                     std::optional<std::size_t> nclbits = std::nullopt,
                     std::optional<std::string> name = std::nullopt);

  // Inserts a fully-built circuit. An empty c.name is replaced by
  // "<stem>_<8 hex>". Returns the stored name.
  std::string add(Circuit c, const std::string& stem = "circuit");

  Circuit get(const std::string& name) const;
  bool contains(const std::string& name) const;
  std::vector<CircuitSummary> list() const;
  std::size_t size() const;
  std::size_t max_qubits() const { return max_qubits_; }

  // All-or-nothing: every request is validated (against the circuit as it
  // would look after the preceding requests of the same batch) before any
  // is appended. Returns the operations appended; `total`, when given,
  // receives the circuit's operation count taken under the same lock.
  std::vector<Op> append_operations(const std::string& name, const std::vector<GateRequest>& reqs,
                                    std::size_t* total = nullptr);

  void remove(const std::string& name);

private:
  void check_width_(std::size_t nqubits, std::size_t nclbits) const;
  std::string unique_name_locked_(const std::string& stem);

  mutable std::shared_mutex mutex_;
  std::map<std::string, Circuit> circuits_;
  std::size_t max_qubits_;
  std::mt19937_64 tokens_;
};

} // namespace qlab
