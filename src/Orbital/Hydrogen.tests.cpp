#include "Hydrogen.hpp"
#include "QuantumNumbers.hpp"
#include "Radial.hpp"
#include "catch2/catch.hpp"
#include "qip/Vector.hpp"
#include <array>
#include <cmath>
#include <complex>
#include <iostream>

TEST_CASE("Orbital::to_spherical", "[Orbital][Hydrogen][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Orbital::to_spherical\n";

  const auto origin = Orbital::to_spherical(0.0, 0.0, 0.0);
  REQUIRE(origin.r == 0.0);
  REQUIRE(origin.theta == 0.0);
  REQUIRE(origin.phi == 0.0);

  const auto [r, theta, phi] = Orbital::to_spherical(0.0, 2.0, 0.0);
  REQUIRE(r == Approx(2.0));
  REQUIRE(theta == Approx(M_PI / 2));
  REQUIRE(phi == Approx(M_PI / 2));

  const auto south = Orbital::to_spherical(0.0, 0.0, -3.0);
  REQUIRE(south.theta == Approx(M_PI));
  const auto west = Orbital::to_spherical(-1.0, -1.0e-300, 0.0);
  REQUIRE(west.phi == Approx(-M_PI));
}

//==============================================================================
TEST_CASE("Orbital::Hydrogen", "[Orbital][Hydrogen][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Orbital::Hydrogen\n";

  using Orbital::QuantumNumbers;

  const Orbital::Hydrogen h1s{QuantumNumbers::validated(1, 0, 0)};
  REQUIRE(h1s.energy() == Approx(-0.5));

  // psi_100 = e^{-r}/sqrt(pi)
  REQUIRE(h1s.psi(0.0, 0.0, 0.0).real() == Approx(1.0 / std::sqrt(M_PI)));
  REQUIRE(h1s.density(0.0, 0.0, 0.0) == Approx(1.0 / M_PI));
  REQUIRE(h1s.imag_part(0.3, -0.2, 0.1) == 0.0);

  // 1s is spherically symmetric
  const auto d0 = h1s.density(1.5, 0.0, 0.0);
  REQUIRE(h1s.density(0.0, 1.5, 0.0) == Approx(d0));
  REQUIRE(h1s.density(0.0, 0.0, -1.5) == Approx(d0));
  REQUIRE(h1s.density(0.866025403784, 0.5, 0.0) == Approx(d0));
  REQUIRE(d0 == Approx(std::exp(-3.0) / M_PI));

  // Finite everywhere, including origin and poles
  for (int n = 1; n <= 5; ++n) {
    for (int l = 0; l < n; ++l) {
      for (int m = -l; m <= l; ++m) {
        const Orbital::Hydrogen h{QuantumNumbers::validated(n, l, m)};
        for (const auto &[x, y, z] :
             {std::array{0.0, 0.0, 0.0}, std::array{0.0, 0.0, 2.0},
              std::array{0.0, 0.0, -2.0}, std::array{1.0, -2.0, 0.5}}) {
          const auto psi = h.psi(x, y, z);
          REQUIRE(std::isfinite(psi.real()));
          REQUIRE(std::isfinite(psi.imag()));
          REQUIRE(h.density(x, y, z) >= 0.0);
        }
      }
    }
  }

  // psi = R Y, and parts consistent
  const Orbital::Hydrogen h32m1{QuantumNumbers::validated(3, 2, -1)};
  const auto psi = h32m1.psi_spherical(2.5, 0.8, -1.9);
  const auto RY = Orbital::radial(3, 2, 2.5) * h32m1.harmonic(0.8, -1.9);
  REQUIRE(psi.real() == Approx(RY.real()));
  REQUIRE(psi.imag() == Approx(RY.imag()));
  const auto x = 1.0, y = 2.0, z = -0.5;
  REQUIRE(h32m1.real_part(x, y, z) == h32m1.psi(x, y, z).real());
  REQUIRE(h32m1.imag_part(x, y, z) == h32m1.psi(x, y, z).imag());
  REQUIRE(h32m1.density(x, y, z) == Approx(std::norm(h32m1.psi(x, y, z))));
  REQUIRE(h32m1.radial_distribution(2.5) ==
          Approx(Orbital::radial_distribution(3, 2, 2.5)));
  // harmonic() is independent of r
  REQUIRE(h32m1.harmonic(0.8, -1.9) == h32m1.harmonic(0.8, -1.9));

  // real m=0 states
  const Orbital::Hydrogen h2p0{QuantumNumbers::validated(2, 1, 0)};
  REQUIRE(h2p0.imag_part(1.0, 1.0, 1.0) == 0.0);
  REQUIRE(h2p0.real_part(0.0, 0.0, 1.0) ==
          Approx(-h2p0.real_part(0.0, 0.0, -1.0)));
}

//==============================================================================
TEST_CASE("Orbital::Hydrogen normalisation", "[Orbital][Hydrogen][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Orbital::Hydrogen normalisation\n";

  // Int |psi|^2 d^3r = 1; trapezoid in r and theta, periodic sum in phi
  const auto rs = qip::uniform_range(0.0, 40.0, 2001);
  const auto thetas = qip::uniform_range(0.0, M_PI, 121);
  const int num_phi = 8;
  const auto dr = rs.at(1) - rs.at(0);
  const auto dtheta = thetas.at(1) - thetas.at(0);
  const auto dphi = 2.0 * M_PI / num_phi;

  using Orbital::QuantumNumbers;
  for (const auto &qn :
       {QuantumNumbers::validated(1, 0, 0), QuantumNumbers::validated(2, 1, 1),
        QuantumNumbers::validated(3, 2, -2)}) {
    const Orbital::Hydrogen h{qn};
    double sum = 0.0;
    for (std::size_t i = 0; i < rs.size(); ++i) {
      const auto wr = (i == 0 || i == rs.size() - 1) ? 0.5 : 1.0;
      for (std::size_t j = 0; j < thetas.size(); ++j) {
        const auto wt = (j == 0 || j == thetas.size() - 1) ? 0.5 : 1.0;
        for (int k = 0; k < num_phi; ++k) {
          const auto phi = -M_PI + k * dphi;
          const auto p = h.psi_spherical(rs[i], thetas[j], phi);
          sum += wr * wt * std::norm(p) * rs[i] * rs[i] * std::sin(thetas[j]);
        }
      }
    }
    INFO(qn.spectroscopic() << " m=" << qn.m());
    REQUIRE(sum * dr * dtheta * dphi == Approx(1.0).margin(1.0e-3));
  }
}
