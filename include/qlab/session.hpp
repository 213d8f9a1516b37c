// SPDX-License-Identifier: MIT

#pragma once
#include "analysis.hpp"
#include "builders.hpp"
#include "optimize.hpp"
#include "registry.hpp"
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace qlab {

struct AppendSummary {
  std::string circuit;
  std::size_t added{};
  std::size_t total_operations{};
  std::vector<std::string> operations; // describe_op() of each appended op
};

struct CircuitDescription {
  std::string name;
  std::size_t nqubits{};
  std::size_t nclbits{};
  std::size_t depth{};
  std::size_t total_operations{};
  std::map<std::string, std::size_t> gate_counts;
  std::vector<std::string> operations;
};

struct OptimizeOutcome {
  std::string circuit; // name of the stored optimized copy
  OptimizeReport report;
};

struct VariationalOutcome {
  std::string circuit;
  std::size_t parameter_count{};
};

// Call-shaped front end over a registry. Holds a reference only; the owner
// keeps the registry alive for as long as the session is used.
class Session {
public:
  explicit Session(CircuitRegistry& registry) : registry_(registry) {}

  std::string create_circuit(std::size_t nqubits,
                             std::optional<std::size_t> nclbits = std::nullopt,
                             std::optional<std::string> name = std::nullopt);
  AppendSummary append_gates(const std::string& id, const std::vector<GateRequest>& ops);
  RunResult run(const std::string& id, std::size_t shots = 1000,
                std::optional<uint64_t> seed = std::nullopt) const;
  CircuitDescription describe(const std::string& id) const;
  std::vector<CircuitSummary> list_circuits() const { return registry_.list(); }
  StatevectorReport analyze_statevector(const std::string& id) const;
  DensityReport analyze_density_matrix(const std::string& id) const;
  double entanglement_entropy(const std::string& id, std::span<const std::size_t> subsystem) const;
  // Stores the result as "<id>_opt<level>_<8 hex>"; the source is untouched.
  OptimizeOutcome optimize(const std::string& id, int level);
  VariationalOutcome build_variational(std::size_t nqubits, std::size_t layers,
                                       const std::string& entanglement,
                                       std::optional<std::string> name = std::nullopt,
                                       const std::vector<double>& params = {});
  // Auto names: "qft_<n>q_<8 hex>" / "iqft_<n>q_<8 hex>".
  std::string build_qft(std::size_t nqubits, bool inverse, std::optional<std::string> name = std::nullopt);
  void remove_circuit(const std::string& id) { registry_.remove(id); }

  CircuitRegistry& registry() { return registry_; }

private:
  std::string store_(Circuit c, std::optional<std::string> name, const std::string& stem);

  CircuitRegistry& registry_;
};

} // namespace qlab
