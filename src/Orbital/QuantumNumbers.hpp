#pragma once
#include <string>
#include <vector>

//! @brief Hydrogen orbitals: quantum numbers, radial and angular parts, and
//! the full (non-relativistic) wavefunction psi_nlm. Atomic units (a0 = 1).
namespace Orbital {

//! Validated triple (n, l, m): n >= 1, 0 <= l <= n-1, |m| <= l.
/*! @details Only constructed via validated() (or parse_quantum_numbers()), so
 every QuantumNumbers object that exists is physically allowed. */
class QuantumNumbers {
  int m_n, m_l, m_m;
  QuantumNumbers(int n, int l, int m) : m_n(n), m_l(l), m_m(m) {}

public:
  //! Checks the triple; throws horbital::InvalidQuantumNumberError naming the
  //! violated constraint
  static QuantumNumbers validated(int n, int l, int m);

  int n() const { return m_n; }
  int l() const { return m_l; }
  int m() const { return m_m; }

  //! e.g., "2p" (n, then spectroscopic letter for l)
  std::string spectroscopic() const;

  friend bool operator==(const QuantumNumbers &a, const QuantumNumbers &b) {
    return a.m_n == b.m_n && a.m_l == b.m_l && a.m_m == b.m_m;
  }
  friend bool operator!=(const QuantumNumbers &a, const QuantumNumbers &b) {
    return !(a == b);
  }
};

//! Builds QuantumNumbers from 1 to 3 integers {n, [l, [m]]}; missing trailing
//! values are 0. Throws horbital::InvalidQuantumNumberError
QuantumNumbers parse_quantum_numbers(const std::vector<int> &values);

//! Spectroscopic letter for l: s, p, d, f, g, h, ... ; [l] for very large l
std::string l_symbol(int l);

} // namespace Orbital
