// SPDX-License-Identifier: MIT

#pragma once
#include <complex>
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace qlab {
  using c64 = std::complex<double>;
  using vec_c64 = std::vector<c64>;

  // Hard ceiling on register width; 2^30 amplitudes is 16 GiB.
  inline constexpr std::size_t kMaxQubits = 30;

  // Shots per run; sampling is one draw per shot.
  inline constexpr std::size_t kMaxShots = 100'000'000;

  // Ceiling on the classical register; outcome keys are this many characters.
  inline constexpr std::size_t kMaxClbits = 1024;

  // Bitstring of the low `width` bits of `index`, most significant first.
  inline std::string index_to_bits(std::size_t index, std::size_t width){
    std::string s(width, '0');
    for (std::size_t q=0; q<width; ++q) if ((index >> q) & 1) s[width-1-q] = '1';
    return s;
  }
}
