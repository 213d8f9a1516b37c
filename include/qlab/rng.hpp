// SPDX-License-Identifier: MIT

#pragma once
#include <random>
#include <cstdint>
#include <optional>

namespace qlab {
class Rng {
  std::mt19937_64 gen;
  std::uniform_real_distribution<double> dist;
public:
  explicit Rng(uint64_t seed) : gen(seed), dist(0.0, 1.0) {}
  // Seeded when a seed is given, entropy-seeded otherwise.
  explicit Rng(std::optional<uint64_t> seed)
    : gen(seed ? *seed : (uint64_t(std::random_device{}()) << 32) ^ std::random_device{}()), dist(0.0, 1.0) {}
  double uniform() { return dist(gen); }
};
}
