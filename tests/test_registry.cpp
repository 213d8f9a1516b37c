// SPDX-License-Identifier: MIT

#include "qlab/errors.hpp"
#include "qlab/registry.hpp"
#include <iostream>
#include <set>
#include <thread>
#include <vector>

using namespace qlab;

static int fails = 0;
#define CHECK(cond) do{ if (!(cond)) { std::cerr << "CHECK failed at " << __LINE__ << ": " #cond "\n"; ++fails; } }while(0)

template <class E, class F>
static bool throws(F&& f){
  try { f(); } catch (const E&) { return true; }
  return false;
}

int main(){
  CircuitRegistry reg(8);

  // names
  CHECK(reg.create(2, std::nullopt, std::string("a")) == "a");
  CHECK(throws<DuplicateNameError>([&]{ reg.create(3, std::nullopt, std::string("a")); }));
  CHECK(reg.get("a").nqubits == 2);
  CHECK(throws<InvalidParameterError>([&]{ reg.create(2, std::nullopt, std::string("")); }));
  {
    std::set<std::string> names;
    for (int i=0;i<500;++i) names.insert(reg.create(1));
    CHECK(names.size() == 500);
    CHECK(names.begin()->rfind("circuit_", 0) == 0);
    CHECK(names.begin()->size() > std::string("circuit_").size() + 9);
  }

  // widths
  CHECK(throws<InvalidParameterError>([&]{ reg.create(0); }));
  CHECK(throws<InvalidParameterError>([&]{ reg.create(9); }));
  CHECK(throws<InvalidParameterError>([&]{ CircuitRegistry bad(31); }));
  auto id = reg.create(3, 1);
  CHECK(reg.get(id).nclbits == 1);
  CHECK(reg.get(reg.create(3)).nclbits == 3);
  CHECK(reg.get(reg.create(2, 0)).nclbits == 0);
  CHECK(reg.get(reg.create(2, kMaxClbits)).nclbits == kMaxClbits);
  CHECK(throws<InvalidParameterError>([&]{ reg.create(2, kMaxClbits + 1); }));
  CHECK(throws<InvalidParameterError>([&]{ reg.create(2, std::size_t(1) << 40); }));
  CHECK(throws<InvalidParameterError>([&]{ reg.add(Circuit{"", 2, std::size_t(1) << 40, {}}); }));

  // all-or-nothing append
  reg.create(2, std::nullopt, std::string("b"));
  try {
    reg.append_operations("b", {{"h", {0}}, {"x", {5}}});
    CHECK(false);
  } catch (const InvalidOperationError& e) {
    CHECK(e.operation_index() == 1);
    CHECK(std::string(e.what()).find("qubit index 5") != std::string::npos);
  }
  CHECK(reg.get("b").ops.empty());

  CHECK(throws<InvalidOperationError>([&]{ reg.append_operations("b", {{"toffoli", {0, 1}}}); }));
  CHECK(throws<InvalidOperationError>([&]{ reg.append_operations("b", {{"cx", {1, 1}}}); }));
  CHECK(throws<InvalidOperationError>([&]{ reg.append_operations("b", {{"cx", {0}}}); }));
  CHECK(throws<InvalidOperationError>([&]{ reg.append_operations("b", {{"rz", {0}}}); }));
  CHECK(throws<InvalidOperationError>([&]{ reg.append_operations("b", {{"h", {0}, {0.5}}}); }));
  CHECK(throws<InvalidOperationError>([&]{ reg.append_operations("b", {{"measure", {0}, {}, 2}}); }));
  CHECK(throws<NotFoundError>([&]{ reg.append_operations("nope", {{"h", {0}}}); }));

  auto added = reg.append_operations("b", {{"H", {0}}, {"cnot", {0, 1}}, {"measure", {1}}});
  CHECK(added.size() == 3);
  CHECK(added[1].type == OpType::CX);
  CHECK(added[2].cbit == 1);
  // after a measurement only further measurements are accepted
  CHECK(throws<InvalidOperationError>([&]{ reg.append_operations("b", {{"x", {0}}}); }));
  reg.append_operations("b", {{"measure", {0}, {}, 0}});
  CHECK(reg.get("b").size() == 4);

  // measure_all needs a classical bit per qubit
  reg.create(2, 1, std::string("narrow"));
  CHECK(throws<InvalidOperationError>([&]{ reg.append_operations("narrow", {{"measure_all", {}}}); }));

  // add / remove
  Circuit c{"", 2, 2, {{OpType::H, {0}, {}}}};
  auto stored = reg.add(c, "bell_opt1");
  CHECK(stored.rfind("bell_opt1_", 0) == 0 && stored.size() == std::string("bell_opt1_").size() + 8);
  CHECK(reg.contains(stored));
  Circuit bad{"bad", 2, 2, {{OpType::X, {3}, {}}}};
  CHECK(throws<InvalidOperationError>([&]{ reg.add(bad); }));
  CHECK(!reg.contains("bad"));
  auto before = reg.size();
  reg.remove(stored);
  CHECK(reg.size() == before - 1);
  CHECK(throws<NotFoundError>([&]{ reg.remove(stored); }));
  CHECK(throws<NotFoundError>([&]{ (void)reg.get(stored); }));

  // concurrent writers and readers
  {
    CircuitRegistry shared(4);
    shared.create(2, std::nullopt, std::string("s"));
    const int kThreads = 8, kPer = 50;
    std::vector<std::thread> pool;
    std::vector<std::vector<std::string>> made(kThreads);
    std::vector<std::vector<std::size_t>> totals(kThreads);
    for (int t=0;t<kThreads;++t){
      pool.emplace_back([&, t]{
        for (int i=0;i<kPer;++i){
          made[t].push_back(shared.create(1));
          std::size_t total = 0;
          shared.append_operations("s", {{"h", {std::size_t(t % 2)}}}, &total);
          totals[t].push_back(total);
          (void)shared.list();
          (void)shared.get("s");
        }
      });
    }
    for (auto& th : pool) th.join();
    CHECK(shared.get("s").size() == std::size_t(kThreads * kPer));
    std::set<std::string> all;
    for (const auto& v : made) all.insert(v.begin(), v.end());
    CHECK(all.size() == std::size_t(kThreads * kPer));
    CHECK(shared.size() == std::size_t(kThreads * kPer + 1));
    // each append saw its own count, so the counts are exactly 1..kThreads*kPer
    std::set<std::size_t> seen;
    for (const auto& v : totals) seen.insert(v.begin(), v.end());
    CHECK(seen.size() == std::size_t(kThreads * kPer));
    CHECK(*seen.begin() == 1 && *seen.rbegin() == std::size_t(kThreads * kPer));
  }

  if (fails==0) std::cout << "OK\n";
  return fails==0?0:1;
}
