// SPDX-License-Identifier: MIT

#include "qlab/circuit.hpp"
#include "qlab/errors.hpp"
#include <cmath>
#include <iostream>

using namespace qlab;

static int tests_failed = 0;
#define CHECK(cond) do{ if (!(cond)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #cond "\n"; ++tests_failed; } }while(0)
#define EXPECT_NEAR(a,b,eps) do{ if (std::fabs((a)-(b))>(eps)) { std::cerr << "EXPECT_NEAR failed at " << __LINE__ << ": " << (a) << " vs " << (b) << "\n"; ++tests_failed; } }while(0)

static Circuit bell(bool measured){
  Circuit c{"bell", 2, 2, {}};
  c.ops.push_back({OpType::H, {0}, {}});
  c.ops.push_back({OpType::CX, {0, 1}, {}});
  if (measured) c.ops.push_back({OpType::MEASURE_ALL, {}, {}});
  return c;
}

int main(){
  // Bell: only 00 and 11, reproducible per seed
  {
    auto sv = final_state(bell(false));
    EXPECT_NEAR(sv.probability_of_basis(0), 0.5, 1e-12);
    EXPECT_NEAR(sv.probability_of_basis(3), 0.5, 1e-12);
    EXPECT_NEAR(sv.norm2(), 1.0, 1e-12);

    auto r1 = run(bell(true), 2000, 42);
    auto r2 = run(bell(true), 2000, 42);
    CHECK(r1.counts == r2.counts);
    CHECK(r1.shots == 2000);
    std::size_t total = 0;
    for (const auto& [k, n] : r1.counts){ CHECK(k == "00" || k == "11"); total += n; }
    CHECK(total == 2000);
  }

  // sampling converges to the Born probabilities
  {
    Circuit c{"mix", 3, 3, {}};
    c.ops.push_back({OpType::RY, {0}, {1.1}});
    c.ops.push_back({OpType::H, {1}, {}});
    c.ops.push_back({OpType::CX, {1, 2}, {}});
    c.ops.push_back({OpType::RX, {2}, {0.4}});
    auto sv = final_state(c);
    c.ops.push_back({OpType::MEASURE_ALL, {}, {}});
    const std::size_t shots = 100000;
    auto r = run(c, shots, 7);
    auto probs = sv.probabilities();
    for (std::size_t i=0;i<probs.size();++i){
      if (probs[i] < 0.01) continue;
      auto it = r.counts.find(index_to_bits(i, 3));
      double f = it == r.counts.end() ? 0.0 : double(it->second) / double(shots);
      EXPECT_NEAR(f, probs[i], 0.02);
    }
  }

  // x on qubit 0 only reads as "01"
  {
    Circuit c{"asym", 2, 2, {{OpType::X, {0}, {}}, {OpType::MEASURE_ALL, {}, {}}}};
    auto r = run(c, 100, 1);
    CHECK(r.counts.size() == 1 && r.counts.count("01") && r.counts["01"] == 100);
  }

  // measuring into a chosen classical bit; unwritten bits stay 0
  {
    Circuit c{"cbit", 2, 3, {{OpType::X, {0}, {}}, {OpType::MEASURE, {0}, {}, 2}}};
    auto r = run(c, 50, 3);
    CHECK(r.counts.size() == 1 && r.counts["100"] == 50);
    // later measurement of the same classical bit wins
    c.ops.push_back({OpType::MEASURE, {1}, {}, 2});
    r = run(c, 50, 3);
    CHECK(r.counts.size() == 1 && r.counts["000"] == 50);
  }

  // StateVector sampling directly
  {
    StateVector sv(3);
    const std::size_t q[] = {2};
    sv.apply_unitary(OpType::X, q, {});
    Rng rng(uint64_t(9));
    auto counts = sv.sample(10, rng);
    CHECK(counts.size() == 1 && counts["100"] == 10);
  }

  // errors
  {
    bool threw = false;
    try { run(bell(true), 0, 1); } catch (const InvalidParameterError&) { threw = true; }
    CHECK(threw);
    threw = false;
    try { run(bell(false), 10, 1); } catch (const NoMeasurementError& e) {
      threw = std::string(e.what()).find("bell") != std::string::npos;
    }
    CHECK(threw);
    threw = false;
    try { final_state(bell(true)); } catch (const MeasurementPresentError&) { threw = true; }
    CHECK(threw);
    threw = false;
    try { StateVector sv(0); } catch (const InvalidParameterError&) { threw = true; }
    CHECK(threw);
    threw = false;
    try { StateVector sv(kMaxQubits + 1); } catch (const InvalidParameterError&) { threw = true; }
    CHECK(threw);
    threw = false;
    try { run(bell(true), kMaxShots + 1, 1); } catch (const InvalidParameterError&) { threw = true; }
    CHECK(threw);
  }

  // norm drift is an engine fault, not a request error
  {
    StateVector sv(1);
    const std::size_t target[] = {0};
    sv.apply_matrix(target, vec_c64{2.0, 0.0, 0.0, 2.0});
    EXPECT_NEAR(sv.norm2(), 4.0, 1e-12);
    bool numerical = false, request = false;
    try { check_normalized(sv, "scaled"); }
    catch (const NumericalError& e) { numerical = std::string(e.what()).find("scaled") != std::string::npos; }
    catch (const Error&) { request = true; }
    CHECK(numerical);
    CHECK(!request);

    StateVector ok(2);
    ok.apply_unitary(OpType::H, target, {});
    check_normalized(ok, "fine");
  }

  // depth and counts
  {
    Circuit c = bell(true);
    c.ops.insert(c.ops.begin(), Op{OpType::X, {1}, {}});
    CHECK(c.depth() == 3);
    CHECK(c.size() == 4);
    CHECK(c.width() == 4);
    auto counts = c.count_ops();
    CHECK(counts["h"] == 1 && counts["cx"] == 1 && counts["measure_all"] == 1);
    CHECK(describe_op(c.ops[2]) == "CX on qubits 0, 1");
    CHECK(describe_op({OpType::MEASURE, {1}, {}, 0}) == "Measure qubit 1 into classical bit 0");
  }

  if (tests_failed==0){ std::cout << "OK\n"; }
  return tests_failed == 0 ? 0 : 1;
}
