// SPDX-License-Identifier: MIT

#include "qlab/config.hpp"
#include "qlab/errors.hpp"
#include "qlab/session.hpp"
#include "qlab/unitary.hpp"
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#ifndef QLAB_VERSION
#define QLAB_VERSION "0.0.0"
#endif

using namespace qlab;

namespace {

// Exit codes
constexpr int kOk = 0;
constexpr int kUsage = 1;
constexpr int kBadArgs = 2;
constexpr int kIoError = 3;
constexpr int kRequestError = 4;
constexpr int kEngineError = 5;
constexpr int kFatal = 6;

void usage(){
  std::cout <<
    "qlab " QLAB_VERSION "\n"
    "usage: qlab [--version] [--config FILE] [--verbose] <command> [options]\n"
    "  run      --circuit F [--shots K] [--seed S] [--optimize [L]] [--out F.json]\n"
    "  analyze  --circuit F [--density] [--entropy q0,q1,...] [--unitary-csv F] [--out F.json]\n"
    "  optimize --circuit F [--level L] [--out F.qlab]\n"
    "  describe --circuit F\n"
    "  gen      --qft N [--inverse] | --ansatz N [--layers L] [--entanglement full|linear|circular]\n"
    "           [--params a,b,...] [--out F.qlab]\n";
}

std::string json_str(const std::string& s){
  std::string out = "\"";
  for (char ch : s){
    switch (ch){
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\t"; break;
      default: out += ch;
    }
  }
  return out + "\"";
}

std::vector<std::string> split_str(const std::string& s, char sep){
  std::vector<std::string> out; std::size_t p=0;
  while (p<=s.size()){
    std::size_t q = s.find(sep, p);
    if (q==std::string::npos){ out.push_back(s.substr(p)); break; }
    out.push_back(s.substr(p, q-p)); p = q+1;
  }
  return out;
}

struct Args {
  std::string cmd;
  std::string circuit_path, out_path, unitary_csv, entanglement = "linear", entropy_qubits, params;
  std::optional<std::size_t> shots;
  std::optional<uint64_t> seed;
  std::optional<int> level;
  std::size_t qft = 0, ansatz = 0, layers = 1;
  bool inverse = false, density = false, optimize = false;
};

// Parses everything after the command name. Returns "" or an error message.
std::string parse_args(int argc, char** argv, int start, Args& a, Config& cfg, std::string& config_path){
  for (int i=start;i<argc;i++){
    std::string s = argv[i];
    auto nx = [&](std::string& dst) -> bool {
      if (i+1>=argc) return false;
      dst = argv[++i];
      return true;
    };
    std::string v;
    uint64_t n = 0;
    auto bad = [&]{ return "Bad value for " + s + ": '" + v + "'"; };
    // positive integer; "-5" is rejected rather than wrapped
    auto count = [&](const std::string& text){ return parse_u64(text, n) && n > 0; };
    try {
      if (s=="--circuit"){ if(!nx(a.circuit_path)) return "Missing value for --circuit"; }
      else if (s=="--out"){ if(!nx(a.out_path)) return "Missing value for --out"; }
      else if (s=="--config"){ if(!nx(config_path)) return "Missing value for --config"; }
      else if (s=="--shots"){ if(!nx(v)) return "Missing value for --shots"; if(!count(v)) return bad(); a.shots = n; }
      else if (s=="--seed"){ if(!nx(v)) return "Missing value for --seed"; if(!parse_u64(v, n)) return bad(); a.seed = n; }
      else if (s=="--level"){ if(!nx(v)) return "Missing value for --level"; a.level = std::stoi(v); }
      else if (s=="--optimize"){
        a.optimize = true;
        if (i+1<argc && std::isdigit(static_cast<unsigned char>(argv[i+1][0]))) a.level = std::stoi(argv[++i]);
      }
      else if (s=="--qft"){ if(!nx(v)) return "Missing value for --qft"; if(!count(v)) return bad(); a.qft = n; }
      else if (s=="--ansatz"){ if(!nx(v)) return "Missing value for --ansatz"; if(!count(v)) return bad(); a.ansatz = n; }
      else if (s=="--layers"){ if(!nx(v)) return "Missing value for --layers"; if(!count(v)) return bad(); a.layers = n; }
      else if (s=="--entanglement"){ if(!nx(a.entanglement)) return "Missing value for --entanglement"; }
      else if (s=="--params"){ if(!nx(a.params)) return "Missing value for --params"; }
      else if (s=="--entropy"){ if(!nx(a.entropy_qubits)) return "Missing value for --entropy"; }
      else if (s=="--unitary-csv"){ if(!nx(a.unitary_csv)) return "Missing value for --unitary-csv"; }
      else if (s=="--inverse") a.inverse = true;
      else if (s=="--density") a.density = true;
      else if (s=="--verbose") cfg.verbose = true;
      else return "Unknown arg: " + s;
    } catch (const std::exception&) {
      return "Bad value for " + s + ": '" + v + "'";
    }
  }
  return "";
}

int emit(const std::string& json, const std::string& out_path){
  if (out_path.empty()){ std::cout << json; return kOk; }
  std::ofstream out(out_path);
  if (!out){ std::cerr << "Cannot write output: " << out_path << "\n"; return kIoError; }
  out << json;
  std::cout << "Wrote " << out_path << "\n";
  return kOk;
}

// Loads --circuit into the session's registry and returns its name.
std::optional<std::string> load_circuit(Session& s, const Args& a, const Config& cfg){
  if (a.circuit_path.empty()){ std::cerr << "Missing --circuit\n"; return std::nullopt; }
  std::string err;
  auto c = parse_circuit_file(a.circuit_path, err);
  if (!c){ std::cerr << err << "\n"; return std::nullopt; }
  c->name = std::filesystem::path(a.circuit_path).stem().string();
  std::string name = s.registry().add(std::move(*c));
  if (cfg.verbose) std::cerr << "[qlab] loaded '" << name << "' from " << a.circuit_path << "\n";
  return name;
}

void write_report(std::ostringstream& js, const OptimizeReport& r, const std::string& indent){
  js << indent << "\"level\": " << r.level << ",\n"
     << indent << "\"original_gate_count\": " << r.original_gate_count << ",\n"
     << indent << "\"optimized_gate_count\": " << r.optimized_gate_count << ",\n"
     << indent << "\"original_depth\": " << r.original_depth << ",\n"
     << indent << "\"optimized_depth\": " << r.optimized_depth << ",\n"
     << indent << "\"size_reduction\": " << r.size_reduction() << ",\n"
     << indent << "\"depth_reduction\": " << r.depth_reduction() << ",\n"
     << indent << "\"improvement_percentage\": " << r.improvement_percentage() << "\n";
}

int cmd_run(Session& s, const Args& a, const Config& cfg){
  auto name = load_circuit(s, a, cfg);
  if (!name) return kIoError;
  std::string target = *name;
  std::optional<OptimizeReport> rep;
  if (a.optimize){
    auto o = s.optimize(target, a.level.value_or(cfg.opt_level));
    target = o.circuit;
    rep = o.report;
  }
  std::size_t shots = a.shots.value_or(cfg.shots);
  auto seed = a.seed ? a.seed : cfg.seed;
  auto t0 = std::chrono::steady_clock::now();
  auto rr = s.run(target, shots, seed);
  std::chrono::duration<double> dt = std::chrono::steady_clock::now() - t0;
  if (cfg.verbose) std::cerr << "[qlab] " << shots << " shots in " << dt.count() << " s\n";

  std::ostringstream js;
  js << std::setprecision(12);
  js << "{\n  \"circuit\": " << json_str(target) << ",\n  \"shots\": " << rr.shots << ",\n";
  if (seed) js << "  \"seed\": " << *seed << ",\n";
  if (rep){ js << "  \"optimization\": {\n"; write_report(js, *rep, "    "); js << "  },\n"; }
  js << "  \"counts\": {";
  bool first = true;
  for (const auto& [bits, n] : rr.counts){
    js << (first ? "\n" : ",\n") << "    " << json_str(bits) << ": " << n;
    first = false;
  }
  js << "\n  }\n}\n";
  return emit(js.str(), a.out_path);
}

int cmd_analyze(Session& s, const Args& a, const Config& cfg){
  auto name = load_circuit(s, a, cfg);
  if (!name) return kIoError;
  std::ostringstream js;
  js << std::setprecision(12);
  js << "{\n  \"circuit\": " << json_str(*name) << ",\n";
  auto sv = s.analyze_statevector(*name);
  js << "  \"nqubits\": " << sv.nqubits << ",\n  \"amplitudes\": {";
  bool first = true;
  for (const auto& [bits, z] : sv.amplitudes){
    if (std::norm(z) <= kProbabilityCutoff) continue;
    js << (first ? "\n" : ",\n") << "    " << json_str(bits) << ": [" << z.real() << ", " << z.imag() << "]";
    first = false;
  }
  js << "\n  },\n  \"probabilities\": {";
  first = true;
  for (const auto& [bits, p] : sv.probabilities){
    js << (first ? "\n" : ",\n") << "    " << json_str(bits) << ": " << p;
    first = false;
  }
  js << "\n  },\n  \"most_probable\": " << json_str(sv.most_probable)
     << ",\n  \"max_probability\": " << sv.max_probability
     << ",\n  \"total_probability\": " << sv.total_probability;
  if (a.density){
    auto d = s.analyze_density_matrix(*name);
    js << ",\n  \"density\": {\n    \"purity\": " << d.purity << ",\n    \"entropy\": " << d.entropy
       << ",\n    \"trace\": " << d.trace << ",\n    \"is_pure\": " << (d.is_pure ? "true" : "false");
    if (!d.entanglement_entropy.empty()){
      js << ",\n    \"entanglement_entropy\": [";
      for (std::size_t q=0;q<d.entanglement_entropy.size();++q) js << (q ? ", " : "") << d.entanglement_entropy[q];
      js << "]";
    }
    if (d.partial_trace_entropy)
      js << ",\n    \"partial_trace_entropy\": " << *d.partial_trace_entropy
         << ",\n    \"entangled\": " << (*d.entangled ? "true" : "false");
    js << "\n  }";
  }
  if (!a.entropy_qubits.empty()){
    std::vector<std::size_t> keep;
    for (const auto& t : split_str(a.entropy_qubits, ',')){
      uint64_t q = 0;
      if (!parse_u64(t, q)) { std::cerr << "Bad qubit in --entropy: '" << t << "'\n"; return kBadArgs; }
      keep.push_back(static_cast<std::size_t>(q));
    }
    js << ",\n  \"subsystem_entropy\": " << s.entanglement_entropy(*name, keep);
  }
  js << "\n}\n";
  if (!a.unitary_csv.empty()){
    if (!export_unitary_csv(s.registry().get(*name), a.unitary_csv)){
      std::cerr << "Failed to export unitary (too large or I/O error)\n";
      return kIoError;
    }
    if (cfg.verbose) std::cerr << "[qlab] wrote unitary to " << a.unitary_csv << "\n";
  }
  return emit(js.str(), a.out_path);
}

int cmd_optimize(Session& s, const Args& a, const Config& cfg){
  auto name = load_circuit(s, a, cfg);
  if (!name) return kIoError;
  auto o = s.optimize(*name, a.level.value_or(cfg.opt_level));
  std::ostringstream js;
  js << std::setprecision(12);
  js << "{\n  \"source\": " << json_str(*name) << ",\n  \"circuit\": " << json_str(o.circuit) << ",\n";
  write_report(js, o.report, "  ");
  js << "}\n";
  if (!a.out_path.empty()){
    std::ofstream out(a.out_path);
    if (!out){ std::cerr << "Cannot write output: " << a.out_path << "\n"; return kIoError; }
    out << format_circuit(s.registry().get(o.circuit));
  }
  std::cout << js.str();
  return kOk;
}

int cmd_describe(Session& s, const Args& a, const Config& cfg){
  auto name = load_circuit(s, a, cfg);
  if (!name) return kIoError;
  auto d = s.describe(*name);
  std::ostringstream js;
  js << "{\n  \"name\": " << json_str(d.name) << ",\n  \"nqubits\": " << d.nqubits
     << ",\n  \"nclbits\": " << d.nclbits << ",\n  \"depth\": " << d.depth
     << ",\n  \"total_operations\": " << d.total_operations << ",\n  \"gate_counts\": {";
  bool first = true;
  for (const auto& [g, n] : d.gate_counts){
    js << (first ? "\n" : ",\n") << "    " << json_str(g) << ": " << n;
    first = false;
  }
  js << "\n  },\n  \"operations\": [";
  for (std::size_t i=0;i<d.operations.size();++i)
    js << (i ? ",\n" : "\n") << "    " << json_str(d.operations[i]);
  js << "\n  ]\n}\n";
  return emit(js.str(), a.out_path);
}

int cmd_gen(Session& s, const Args& a, const Config& cfg){
  if ((a.qft == 0) == (a.ansatz == 0)){ std::cerr << "Choose exactly one of --qft N or --ansatz N\n"; return kBadArgs; }
  std::string name;
  if (a.qft){
    name = s.build_qft(a.qft, a.inverse);
  } else {
    std::vector<double> params;
    if (!a.params.empty()){
      for (const auto& t : split_str(a.params, ',')){
        try { params.push_back(std::stod(t)); }
        catch (const std::exception&) { std::cerr << "Bad value in --params: '" << t << "'\n"; return kBadArgs; }
      }
    }
    auto v = s.build_variational(a.ansatz, a.layers, a.entanglement, std::nullopt, params);
    name = v.circuit;
    if (cfg.verbose) std::cerr << "[qlab] ansatz with " << v.parameter_count << " parameters\n";
  }
  Circuit c = s.registry().get(name);
  std::string text = format_circuit(c);
  if (a.out_path.empty()){ std::cout << text; return kOk; }
  std::ofstream out(a.out_path);
  if (!out){ std::cerr << "Cannot write output: " << a.out_path << "\n"; return kIoError; }
  out << text;
  std::cout << "Wrote " << a.out_path << "\n";
  return kOk;
}

} // namespace

int main(int argc, char** argv){
  if (argc < 2){ usage(); return kUsage; }
  int i = 1;
  Config cfg;
  std::string config_path;
  // global flags before the command
  for (; i<argc; ++i){
    std::string s = argv[i];
    if (s == "--version"){ std::cout << QLAB_VERSION << "\n"; return kOk; }
    if (s == "--help" || s == "-h"){ usage(); return kOk; }
    if (s == "--verbose"){ cfg.verbose = true; continue; }
    if (s == "--config"){
      if (i+1 >= argc){ std::cerr << "Missing value for --config\n"; return kBadArgs; }
      config_path = argv[++i];
      continue;
    }
    break;
  }
  if (i >= argc){ usage(); return kUsage; }

  Args a;
  a.cmd = argv[i];
  bool verbose_flag = cfg.verbose;
  auto perr = parse_args(argc, argv, i+1, a, cfg, config_path);
  if (!perr.empty()){ std::cerr << perr << "\n"; return kBadArgs; }
  verbose_flag = verbose_flag || cfg.verbose;

  std::string err;
  if (!config_path.empty() && !load_config_file(config_path, cfg, err)){ std::cerr << err << "\n"; return kIoError; }
  if (!apply_env(cfg, err)){ std::cerr << err << "\n"; return kBadArgs; }
  if (verbose_flag) cfg.verbose = true;
  if (cfg.verbose)
    std::cerr << "[qlab] shots=" << cfg.shots << " opt_level=" << cfg.opt_level
              << " max_qubits=" << cfg.max_qubits << (cfg.seed ? " seed=" + std::to_string(*cfg.seed) : "") << "\n";

  try {
    CircuitRegistry registry(cfg.max_qubits);
    Session session(registry);
    if (a.cmd == "run") return cmd_run(session, a, cfg);
    if (a.cmd == "analyze") return cmd_analyze(session, a, cfg);
    if (a.cmd == "optimize") return cmd_optimize(session, a, cfg);
    if (a.cmd == "describe") return cmd_describe(session, a, cfg);
    if (a.cmd == "gen") return cmd_gen(session, a, cfg);
    std::cerr << "Unknown command: " << a.cmd << "\n";
    usage();
    return kUsage;
  } catch (const qlab::Error& e) {
    std::cerr << "error: " << e.what() << "\n";
    return kRequestError;
  } catch (const qlab::NumericalError& e) {
    std::cerr << "internal error: " << e.what() << "\n";
    return kEngineError;
  } catch (const std::exception& e) {
    std::cerr << "fatal: " << e.what() << "\n";
    return kFatal;
  }
}
