// SPDX-License-Identifier: MIT

#include <pybind11/pybind11.h>
#include <pybind11/complex.h>
#include <pybind11/stl.h>
#include "qlab/errors.hpp"
#include "qlab/session.hpp"

namespace py = pybind11;
using namespace qlab;

namespace {

// Owns the registry a Python-side session works on.
struct PySession {
  explicit PySession(std::size_t max_qubits) : registry(max_qubits), session(registry) {}
  CircuitRegistry registry;
  Session session;
};

GateRequest to_request(const py::dict& d){
  GateRequest r;
  r.type = py::cast<std::string>(d["type"]);
  r.qubits = py::cast<std::vector<std::size_t>>(d["qubits"]);
  if (d.contains("params") && !d["params"].is_none()) r.params = py::cast<std::vector<double>>(d["params"]);
  if (d.contains("classical_bit") && !d["classical_bit"].is_none())
    r.classical_bit = py::cast<std::size_t>(d["classical_bit"]);
  return r;
}

py::dict report_dict(const OptimizeReport& r){
  py::dict d;
  d["level"] = r.level;
  d["original_gate_count"] = r.original_gate_count;
  d["optimized_gate_count"] = r.optimized_gate_count;
  d["original_depth"] = r.original_depth;
  d["optimized_depth"] = r.optimized_depth;
  d["size_reduction"] = r.size_reduction();
  d["depth_reduction"] = r.depth_reduction();
  d["improvement_percentage"] = r.improvement_percentage();
  return d;
}

} // namespace

PYBIND11_MODULE(qlab_python, m){
  auto base = py::register_exception<Error>(m, "QlabError");
  py::register_exception<NotFoundError>(m, "NotFoundError", base.ptr());
  py::register_exception<DuplicateNameError>(m, "DuplicateNameError", base.ptr());
  py::register_exception<InvalidOperationError>(m, "InvalidOperationError", base.ptr());
  py::register_exception<NoMeasurementError>(m, "NoMeasurementError", base.ptr());
  py::register_exception<MeasurementPresentError>(m, "MeasurementPresentError", base.ptr());
  py::register_exception<InvalidParameterError>(m, "InvalidParameterError", base.ptr());
  py::register_exception<NumericalError>(m, "NumericalError");

  py::class_<PySession>(m, "Session")
    .def(py::init<std::size_t>(), py::arg("max_qubits") = 24)
    .def("create_circuit", [](PySession& s, std::size_t nq, std::optional<std::size_t> nc, std::optional<std::string> name){
      return s.session.create_circuit(nq, nc, name);
    }, py::arg("num_qubits"), py::arg("num_classical_bits") = py::none(), py::arg("name") = py::none())
    .def("append_gates", [](PySession& s, const std::string& id, const py::list& ops){
      std::vector<GateRequest> reqs;
      for (const auto& o : ops) reqs.push_back(to_request(py::cast<py::dict>(o)));
      auto r = s.session.append_gates(id, reqs);
      py::dict d;
      d["circuit"] = r.circuit;
      d["added"] = r.added;
      d["total_operations"] = r.total_operations;
      d["operations"] = r.operations;
      return d;
    })
    .def("run", [](PySession& s, const std::string& id, std::size_t shots, std::optional<uint64_t> seed){
      return s.session.run(id, shots, seed).counts;
    }, py::arg("circuit"), py::arg("shots") = 1000, py::arg("seed") = py::none())
    .def("describe", [](PySession& s, const std::string& id){
      auto c = s.session.describe(id);
      py::dict d;
      d["name"] = c.name;
      d["num_qubits"] = c.nqubits;
      d["num_classical_bits"] = c.nclbits;
      d["depth"] = c.depth;
      d["gate_counts"] = c.gate_counts;
      d["total_operations"] = c.total_operations;
      d["operations"] = c.operations;
      return d;
    })
    .def("list_circuits", [](PySession& s){
      py::list out;
      for (const auto& c : s.session.list_circuits()){
        py::dict d;
        d["name"] = c.name;
        d["num_qubits"] = c.nqubits;
        d["num_classical_bits"] = c.nclbits;
        d["size"] = c.size;
        d["depth"] = c.depth;
        out.append(d);
      }
      return out;
    })
    .def("analyze_statevector", [](PySession& s, const std::string& id){
      auto r = s.session.analyze_statevector(id);
      py::dict d;
      d["amplitudes"] = r.amplitudes;
      d["probabilities"] = r.probabilities;
      d["most_probable"] = r.most_probable;
      d["max_probability"] = r.max_probability;
      d["total_probability"] = r.total_probability;
      return d;
    })
    .def("analyze_density_matrix", [](PySession& s, const std::string& id){
      auto r = s.session.analyze_density_matrix(id);
      py::dict d;
      d["purity"] = r.purity;
      d["entropy"] = r.entropy;
      d["trace"] = r.trace;
      d["is_pure"] = r.is_pure;
      d["entanglement_entropy"] = r.entanglement_entropy;
      d["partial_trace_entropy"] = r.partial_trace_entropy;
      d["entangled"] = r.entangled;
      return d;
    })
    .def("entanglement_entropy", [](PySession& s, const std::string& id, const std::vector<std::size_t>& subsystem){
      return s.session.entanglement_entropy(id, subsystem);
    })
    .def("optimize", [](PySession& s, const std::string& id, int level){
      auto o = s.session.optimize(id, level);
      return py::make_tuple(o.circuit, report_dict(o.report));
    }, py::arg("circuit"), py::arg("level") = 1)
    .def("build_variational", [](PySession& s, std::size_t nq, std::size_t layers, const std::string& ent,
                                 std::optional<std::string> name, const std::vector<double>& params){
      auto v = s.session.build_variational(nq, layers, ent, name, params);
      return py::make_tuple(v.circuit, v.parameter_count);
    }, py::arg("num_qubits"), py::arg("layers") = 1, py::arg("entanglement") = "linear",
       py::arg("name") = py::none(), py::arg("params") = std::vector<double>{})
    .def("build_qft", [](PySession& s, std::size_t nq, bool inverse, std::optional<std::string> name){
      return s.session.build_qft(nq, inverse, name);
    }, py::arg("num_qubits"), py::arg("inverse") = false, py::arg("name") = py::none())
    .def("remove_circuit", [](PySession& s, const std::string& id){ s.session.remove_circuit(id); });
}
