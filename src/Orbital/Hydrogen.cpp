#include "Hydrogen.hpp"
#include "Radial.hpp"
#include "SphericalHarmonic.hpp"
#include <algorithm>
#include <cmath>
#include <complex>

namespace Orbital {

//==============================================================================
Spherical to_spherical(double x, double y, double z) {
  const auto r = std::sqrt(x * x + y * y + z * z);
  if (r == 0.0)
    return {0.0, 0.0, 0.0};
  const auto cos_theta = std::max(-1.0, std::min(1.0, z / r));
  return {r, std::acos(cos_theta), std::atan2(y, x)};
}

//==============================================================================
double Hydrogen::energy() const {
  const auto n = double(m_qn.n());
  return -0.5 / (n * n);
}

std::complex<double> Hydrogen::psi(double x, double y, double z) const {
  const auto [r, theta, phi] = to_spherical(x, y, z);
  return psi_spherical(r, theta, phi);
}

std::complex<double> Hydrogen::psi_spherical(double r, double theta,
                                             double phi) const {
  return radial(m_qn.n(), m_qn.l(), r) * harmonic(theta, phi);
}

double Hydrogen::radial_distribution(double r) const {
  return Orbital::radial_distribution(m_qn.n(), m_qn.l(), r);
}

std::complex<double> Hydrogen::harmonic(double theta, double phi) const {
  return Ylm(m_qn.l(), m_qn.m(), theta, phi);
}

} // namespace Orbital
