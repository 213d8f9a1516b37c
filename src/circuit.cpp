// SPDX-License-Identifier: MIT

#include "qlab/circuit.hpp"
#include "qlab/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace qlab {

std::vector<std::size_t> op_qubits(const Op& op, std::size_t nqubits){
  if (op.type == OpType::MEASURE_ALL){
    std::vector<std::size_t> all(nqubits);
    for (std::size_t q=0;q<nqubits;++q) all[q]=q;
    return all;
  }
  return op.qubits;
}

std::size_t Circuit::depth() const {
  std::vector<std::size_t> level(nqubits, 0);
  std::size_t d = 0;
  for (const auto& op : ops){
    auto qs = op_qubits(op, nqubits);
    std::size_t m = 0;
    for (auto q : qs) m = std::max(m, level[q]);
    for (auto q : qs) level[q] = m + 1;
    d = std::max(d, m + 1);
  }
  return d;
}

std::map<std::string, std::size_t> Circuit::count_ops() const {
  std::map<std::string, std::size_t> counts;
  for (const auto& op : ops) ++counts[std::string(op_name(op.type))];
  return counts;
}

bool Circuit::has_measurement() const {
  return std::any_of(ops.begin(), ops.end(), [](const Op& op){ return !is_unitary(op.type); });
}

void validate_op(const Circuit& c, const Op& op, std::size_t index){
  auto fail = [&](const std::string& why){ throw InvalidOperationError(index, why); };
  const auto& g = gate_spec(op.type);
  const std::string name(g.name);
  if (op.type == OpType::MEASURE_ALL){
    if (c.nclbits < c.nqubits)
      fail("measure_all needs " + std::to_string(c.nqubits) + " classical bits, circuit '" + c.name +
           "' has " + std::to_string(c.nclbits));
    return;
  }
  if (op.qubits.size() != g.arity)
    fail("'" + name + "' acts on " + std::to_string(g.arity) + " qubit(s), got " + std::to_string(op.qubits.size()));
  for (auto q : op.qubits)
    if (q >= c.nqubits)
      fail("qubit index " + std::to_string(q) + " out of range for '" + name + "' (circuit has " +
           std::to_string(c.nqubits) + " qubits)");
  if (op.type == OpType::MEASURE){
    if (op.cbit >= c.nclbits)
      fail("classical bit " + std::to_string(op.cbit) + " out of range for 'measure' (circuit has " +
           std::to_string(c.nclbits) + " classical bits)");
    return;
  }
  for (std::size_t i=0;i<op.qubits.size();++i)
    for (std::size_t j=i+1;j<op.qubits.size();++j)
      if (op.qubits[i]==op.qubits[j]) fail("duplicate qubit " + std::to_string(op.qubits[i]) + " in '" + name + "'");
  if (op.params.size() != g.param_count)
    fail("'" + name + "' expects " + std::to_string(g.param_count) + " parameter(s), got " + std::to_string(op.params.size()));
  for (double p : op.params)
    if (!std::isfinite(p)) fail("non-finite parameter for '" + name + "'");
  if (c.has_measurement())
    fail("unitary '" + name + "' after measurement is not allowed in circuit '" + c.name + "'");
}

Op make_op(const Circuit& c, const GateRequest& req, std::size_t index){
  const GateSpec* g = find_gate(req.type);
  if (!g) throw InvalidOperationError(index, "unknown gate '" + req.type + "'");
  Op op{g->type, req.qubits, req.params, 0};
  if (op.type == OpType::MEASURE){
    if (op.qubits.size() != 1)
      throw InvalidOperationError(index, "'measure' acts on 1 qubit, got " + std::to_string(op.qubits.size()));
    op.cbit = req.classical_bit.value_or(op.qubits[0]);
  } else if (op.type == OpType::MEASURE_ALL){
    op.qubits.clear();
  }
  validate_op(c, op, index);
  return op;
}

std::string describe_op(const Op& op){
  std::ostringstream os;
  std::string name(op_name(op.type));
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch){ return char(std::toupper(ch)); });
  if (op.type == OpType::MEASURE_ALL) return "Measure all qubits";
  if (op.type == OpType::MEASURE){
    os << "Measure qubit " << op.qubits[0] << " into classical bit " << op.cbit;
    return os.str();
  }
  os << name;
  if (!op.params.empty()){
    os << "(";
    for (std::size_t i=0;i<op.params.size();++i){ if (i) os << ", "; os << op.params[i]; }
    os << ")";
  }
  os << (op.qubits.size()==1 ? " on qubit " : " on qubits ");
  for (std::size_t i=0;i<op.qubits.size();++i){ if (i) os << ", "; os << op.qubits[i]; }
  return os.str();
}

static bool parse_size_t(const std::string& s, std::size_t& out) {
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) return false;
  try {
    std::size_t pos=0;
    unsigned long long v = std::stoull(s, &pos, 10);
    if (pos != s.size()) return false;
    out = static_cast<std::size_t>(v);
    return true;
  } catch(const std::exception&) { return false; }
}

static bool parse_double(const std::string& s, double& out) {
  try {
    std::size_t pos=0;
    out = std::stod(s, &pos);
    return pos == s.size();
  } catch(const std::exception&) { return false; }
}

std::optional<Circuit> parse_circuit_string(const std::string& text, std::string& err) {
  std::istringstream in(text);
  std::optional<std::size_t> nq, nc;
  std::vector<std::pair<std::size_t, GateRequest>> reqs; // (line, request)
  std::size_t max_qubit = 0;
  bool any_qubit = false;
  std::string line;
  std::size_t lineno = 0;
  auto at = [&](const std::string& msg){ err = msg + " at line " + std::to_string(lineno); };
  while (std::getline(in, line)) {
    ++lineno;
    auto hash = line.find('#');
    if (hash != std::string::npos) line = line.substr(0, hash);
    std::istringstream ss(line);
    std::vector<std::string> tok;
    for (std::string t; ss >> t;) tok.push_back(t);
    if (tok.empty()) continue;
    std::string op = tok[0];
    std::transform(op.begin(), op.end(), op.begin(), [](unsigned char ch){ return char(std::toupper(ch)); });

    if (op == "QUBITS" || op == "CLBITS") {
      std::size_t v;
      if (tok.size() != 2 || !parse_size_t(tok[1], v)) { at("Invalid " + op + " header"); return std::nullopt; }
      if (!reqs.empty()) { at(op + " must precede operations"); return std::nullopt; }
      (op == "QUBITS" ? nq : nc) = v;
      continue;
    }

    GateRequest req;
    req.type = tok[0];
    if (op == "MEASURE_ALL" && tok.size() == 1) {
      req.type = "measure_all";
    } else if (op == "MEASURE") {
      if (tok.size() == 2 && (tok[1] == "ALL" || tok[1] == "all")) {
        req.type = "measure_all";
      } else {
        std::size_t q, cb;
        if (tok.size() < 2 || tok.size() > 3 || !parse_size_t(tok[1], q)) { at("Invalid MEASURE"); return std::nullopt; }
        req.qubits = {q};
        if (tok.size() == 3) {
          if (!parse_size_t(tok[2], cb)) { at("Invalid classical bit"); return std::nullopt; }
          req.classical_bit = cb;
        }
      }
    } else {
      const GateSpec* g = find_gate(tok[0]);
      if (!g || !g->matrix) { at("Unknown op '" + tok[0] + "'"); return std::nullopt; }
      if (tok.size() != 1 + g->arity + g->param_count) {
        at("'" + tok[0] + "' expects " + std::to_string(g->arity) + " qubit(s) and " +
           std::to_string(g->param_count) + " parameter(s)");
        return std::nullopt;
      }
      for (std::size_t i=0;i<g->arity;++i){
        std::size_t q;
        if (!parse_size_t(tok[1+i], q)) { at("Invalid target"); return std::nullopt; }
        req.qubits.push_back(q);
      }
      for (std::size_t i=0;i<g->param_count;++i){
        double a;
        if (!parse_double(tok[1+g->arity+i], a)) { at("Invalid angle"); return std::nullopt; }
        req.params.push_back(a);
      }
    }
    for (auto q : req.qubits) { max_qubit = std::max(max_qubit, q); any_qubit = true; }
    reqs.emplace_back(lineno, std::move(req));
  }

  Circuit c;
  c.nqubits = nq ? *nq : (any_qubit ? max_qubit + 1 : 0);
  c.nclbits = nc ? *nc : c.nqubits;
  if (c.nqubits == 0) { err = "Circuit declares no qubits"; return std::nullopt; }
  if (c.nqubits > kMaxQubits) { err = "Circuit declares " + std::to_string(c.nqubits) + " qubits, limit is " + std::to_string(kMaxQubits); return std::nullopt; }
  if (c.nclbits > kMaxClbits) { err = "Circuit declares " + std::to_string(c.nclbits) + " classical bits, limit is " + std::to_string(kMaxClbits); return std::nullopt; }
  for (std::size_t i=0;i<reqs.size();++i){
    try {
      c.ops.push_back(make_op(c, reqs[i].second, i));
    } catch (const InvalidOperationError& e) {
      err = std::string(e.what()) + " at line " + std::to_string(reqs[i].first);
      return std::nullopt;
    }
  }
  return c;
}

std::optional<Circuit> parse_circuit_file(const std::string& path, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "Cannot open circuit file: " + path; return std::nullopt; }
  std::stringstream buf;
  buf << in.rdbuf();
  auto c = parse_circuit_string(buf.str(), err);
  if (!c) err = path + ": " + err;
  return c;
}

std::string format_circuit(const Circuit& c){
  std::ostringstream out;
  out << std::setprecision(17);
  if (!c.name.empty()) out << "# " << c.name << "\n";
  out << "QUBITS " << c.nqubits << "\n";
  out << "CLBITS " << c.nclbits << "\n";
  for (const auto& op : c.ops){
    if (op.type == OpType::MEASURE_ALL) { out << "MEASURE ALL\n"; continue; }
    if (op.type == OpType::MEASURE) { out << "MEASURE " << op.qubits[0] << " " << op.cbit << "\n"; continue; }
    std::string name(op_name(op.type));
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch){ return char(std::toupper(ch)); });
    out << name;
    for (auto q : op.qubits) out << " " << q;
    for (auto p : op.params) out << " " << p;
    out << "\n";
  }
  return out.str();
}

void check_normalized(const StateVector& sv, const std::string& circuit) {
  double n2 = sv.norm2();
  if (std::fabs(n2 - 1.0) > kNormTolerance) {
    std::ostringstream os;
    os << "Statevector norm drifted to " << std::setprecision(12) << n2 << " in circuit '" << circuit << "'";
    throw NumericalError(os.str());
  }
}

StateVector final_state(const Circuit& c, bool allow_measurement) {
  if (!allow_measurement && c.has_measurement()) throw MeasurementPresentError(c.name);
  StateVector sv(c.nqubits);
  for (const auto& op : c.ops) {
    // measurement ends the unitary phase
    if (!is_unitary(op.type)) break;
    sv.apply_unitary(op.type, op.qubits, op.params);
  }
  check_normalized(sv, c.name);
  return sv;
}

RunResult run(const Circuit& c, std::size_t shots, std::optional<uint64_t> seed) {
  if (shots == 0 || shots > kMaxShots)
    throw InvalidParameterError("Shot count must be between 1 and " + std::to_string(kMaxShots) +
                                ", got " + std::to_string(shots));
  if (!c.has_measurement()) throw NoMeasurementError(c.name);
  StateVector sv = final_state(c, true);
  Rng rng(seed);

  // classical bit -> measured qubit, last writer wins
  std::vector<std::optional<std::size_t>> source(c.nclbits);
  for (const auto& op : c.ops) {
    if (op.type == OpType::MEASURE) source[op.cbit] = op.qubits[0];
    else if (op.type == OpType::MEASURE_ALL) for (std::size_t q=0;q<c.nqubits;++q) source[q] = q;
  }

  RunResult rr;
  rr.shots = shots;
  for (auto [idx, n] : sv.sample_indices(shots, rng)) {
    std::string key(c.nclbits, '0');
    for (std::size_t b=0;b<c.nclbits;++b)
      if (source[b] && ((idx >> *source[b]) & 1)) key[c.nclbits-1-b] = '1';
    rr.counts[key] += n;
  }
  return rr;
}

} // namespace qlab
