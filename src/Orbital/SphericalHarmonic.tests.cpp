#include "SphericalHarmonic.hpp"
#include "catch2/catch.hpp"
#include "qip/Maths.hpp"
#include "qip/Vector.hpp"
#include <cmath>
#include <complex>
#include <iostream>

TEST_CASE("Orbital::Ylm", "[Orbital][Ylm][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Orbital::Ylm\n";

  using Orbital::Ylm;

  // Known values
  REQUIRE(Ylm(0, 0, 0.7, -2.1).real() == Approx(0.28209479177));
  REQUIRE(Ylm(0, 0, 0.7, -2.1).imag() == 0.0);
  REQUIRE(Ylm(1, 0, 0.0, 0.0).real() == Approx(0.48860251190));
  // Condon-Shortley phase
  REQUIRE(Ylm(1, 1, M_PI / 2, 0.0).real() == Approx(-0.34549414947));
  REQUIRE(Ylm(1, -1, M_PI / 2, 0.0).real() == Approx(0.34549414947));
  REQUIRE(Ylm(1, 1, M_PI / 2, M_PI / 2).imag() == Approx(-0.34549414947));

  // Y_22 = (1/4) sqrt(15/(2pi)) sin^2(theta) e^{2 i phi}
  const auto theta = 1.1, phi = 0.4;
  const auto Y22 = Ylm(2, 2, theta, phi);
  const auto Y22_exact = 0.25 * std::sqrt(15.0 / (2.0 * M_PI)) *
                         std::pow(std::sin(theta), 2) *
                         std::complex<double>{std::cos(2 * phi),
                                              std::sin(2 * phi)};
  REQUIRE(Y22.real() == Approx(Y22_exact.real()));
  REQUIRE(Y22.imag() == Approx(Y22_exact.imag()));

  // Y_l^{-m} = (-1)^m conj(Y_l^m)
  for (int l = 0; l <= 6; ++l) {
    for (int m = 1; m <= l; ++m) {
      const auto Yp = Ylm(l, m, theta, phi);
      const auto Ym = Ylm(l, -m, theta, phi);
      REQUIRE(Ym.real() == Approx(qip::parity(m) * Yp.real()).margin(1e-14));
      REQUIRE(Ym.imag() == Approx(-qip::parity(m) * Yp.imag()).margin(1e-14));
    }
  }
}

//==============================================================================
TEST_CASE("Orbital::Ylm poles", "[Orbital][Ylm][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Orbital::Ylm poles\n";

  for (int l = 0; l <= 8; ++l) {
    for (int m = -l; m <= l; ++m) {
      for (const auto theta : {0.0, M_PI}) {
        for (const auto phi : {-M_PI, 0.0, 1.3, M_PI}) {
          const auto Y = Orbital::Ylm(l, m, theta, phi);
          REQUIRE(std::isfinite(Y.real()));
          REQUIRE(Y.imag() == 0.0);
          if (m != 0) {
            REQUIRE(Y.real() == 0.0);
          }
        }
      }
    }
  }
  // Y_l0(0) = sqrt((2l+1)/4pi), Y_l0(pi) = (-1)^l sqrt((2l+1)/4pi)
  for (int l = 0; l <= 8; ++l) {
    const auto expected = std::sqrt((2.0 * l + 1.0) / (4.0 * M_PI));
    REQUIRE(Orbital::Ylm(l, 0, 0.0, 0.0).real() == Approx(expected));
    REQUIRE(Orbital::Ylm(l, 0, M_PI, 0.0).real() ==
            Approx(qip::parity(l) * expected));
  }
  // cos(theta) slightly outside [-1,1] from rounding is clamped
  REQUIRE(std::isfinite(Orbital::Ylm(3, 0, -1.0e-17, 0.0).real()));
}

//==============================================================================
TEST_CASE("Orbital::Ylm normalisation", "[Orbital][Ylm][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Orbital::Ylm normalisation\n";

  // Int |Y|^2 dOmega = 1; trapezoid in theta, periodic sum in phi
  const int num_theta = 801;
  const int num_phi = 24;
  const auto thetas = qip::uniform_range(0.0, M_PI, num_theta);
  const auto dtheta = thetas.at(1) - thetas.at(0);
  const auto dphi = 2.0 * M_PI / num_phi;
  for (int l = 0; l <= 5; ++l) {
    for (int m = -l; m <= l; ++m) {
      double sum = 0.0;
      for (int i = 0; i < num_theta; ++i) {
        const auto w = (i == 0 || i == num_theta - 1) ? 0.5 : 1.0;
        for (int j = 0; j < num_phi; ++j) {
          const auto phi = -M_PI + j * dphi;
          const auto theta = thetas[std::size_t(i)];
          sum += w * std::norm(Orbital::Ylm(l, m, theta, phi)) *
                 std::sin(theta);
        }
      }
      INFO("l=" << l << " m=" << m);
      REQUIRE(sum * dtheta * dphi == Approx(1.0).margin(1.0e-4));
    }
  }
}
