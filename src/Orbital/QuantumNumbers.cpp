#include "QuantumNumbers.hpp"
#include "horbital/Errors.hpp"
#include <cstdlib>
#include <fmt/format.h>
#include <string>
#include <vector>

namespace Orbital {

//==============================================================================
QuantumNumbers QuantumNumbers::validated(int n, int l, int m) {
  if (n < 1) {
    throw horbital::InvalidQuantumNumberError(
        fmt::format("n must be >= 1 (got n={})", n));
  }
  if (l < 0) {
    throw horbital::InvalidQuantumNumberError(
        fmt::format("l must be >= 0 (got l={})", l));
  }
  if (l > n - 1) {
    throw horbital::InvalidQuantumNumberError(
        fmt::format("l must satisfy 0 <= l <= n-1 (got n={}, l={})", n, l));
  }
  if (std::abs(m) > l) {
    throw horbital::InvalidQuantumNumberError(
        fmt::format("m must satisfy -l <= m <= l (got l={}, m={})", l, m));
  }
  return QuantumNumbers{n, l, m};
}

std::string QuantumNumbers::spectroscopic() const {
  return std::to_string(m_n) + l_symbol(m_l);
}

//==============================================================================
QuantumNumbers parse_quantum_numbers(const std::vector<int> &values) {
  if (values.empty() || values.size() > 3) {
    throw horbital::InvalidQuantumNumberError(fmt::format(
        "Expected 1 to 3 quantum numbers (n [l [m]]), got {}", values.size()));
  }
  const auto n = values.at(0);
  const auto l = values.size() > 1 ? values.at(1) : 0;
  const auto m = values.size() > 2 ? values.at(2) : 0;
  return QuantumNumbers::validated(n, l, m);
}

//==============================================================================
std::string l_symbol(int l) {
  static const std::string spectroscopic_letters = "spdfghiklmnoqrtuv";
  if (l >= 0 && l < int(spectroscopic_letters.size()))
    return std::string(1, spectroscopic_letters[std::size_t(l)]);
  return "[" + std::to_string(l) + "]";
}

} // namespace Orbital
