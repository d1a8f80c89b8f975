#pragma once
#include "QuantumNumbers.hpp"
#include <complex>

namespace Orbital {

//! Spherical coordinates: r >= 0, theta in [0,pi], phi in [-pi,pi]
struct Spherical {
  double r, theta, phi;
};

//! Cartesian -> spherical. At the origin, theta = phi = 0.
Spherical to_spherical(double x, double y, double z);

//==============================================================================
//! Non-relativistic hydrogen wavefunction psi_nlm = R_nl(r) Y_lm(theta, phi)
/*!
@details
Atomic units (a0 = 1, Z = 1, infinite nuclear mass). Constructed from a
validated QuantumNumbers, so every evaluation is for an allowed state.
Evaluations are pure: same input always gives the same output, and every
result is finite for finite input (including r = 0 and the poles).
*/
class Hydrogen {
  QuantumNumbers m_qn;

public:
  explicit Hydrogen(QuantumNumbers qn) : m_qn(qn) {}

  const QuantumNumbers &qn() const { return m_qn; }

  //! Energy, E_n = -1/(2n^2), in Hartree
  double energy() const;

  //! psi at cartesian point (x, y, z)
  std::complex<double> psi(double x, double y, double z) const;
  //! psi at spherical point (r, theta, phi)
  std::complex<double> psi_spherical(double r, double theta,
                                     double phi) const;

  double real_part(double x, double y, double z) const {
    return psi(x, y, z).real();
  }
  double imag_part(double x, double y, double z) const {
    return psi(x, y, z).imag();
  }
  //! |psi|^2
  double density(double x, double y, double z) const {
    return std::norm(psi(x, y, z));
  }

  //! r^2 R_nl(r)^2: no angular part
  double radial_distribution(double r) const;

  //! Y_lm(theta, phi): angles only, independent of r
  std::complex<double> harmonic(double theta, double phi) const;
};

} // namespace Orbital
