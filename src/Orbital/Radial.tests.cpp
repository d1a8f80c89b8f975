#include "Radial.hpp"
#include "catch2/catch.hpp"
#include "qip/Vector.hpp"
#include <cmath>
#include <iostream>
#include <vector>

namespace {
// Trapezoid rule, on uniform grid
double integrate_trapz(const std::vector<double> &f, double dr) {
  double sum = 0.0;
  for (std::size_t i = 0; i < f.size(); ++i) {
    sum += (i == 0 || i == f.size() - 1) ? 0.5 * f[i] : f[i];
  }
  return sum * dr;
}
} // namespace

//==============================================================================
TEST_CASE("Orbital::radial", "[Orbital][Radial][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Orbital::radial\n";

  // Closed-form, low n
  for (const auto r : qip::uniform_range(0.0, 30.0, 61)) {
    REQUIRE(Orbital::radial(1, 0, r) == Approx(2.0 * std::exp(-r)));
    REQUIRE(Orbital::radial(2, 0, r) ==
            Approx((2.0 - r) * std::exp(-0.5 * r) / (2.0 * std::sqrt(2.0)))
                .margin(1.0e-14));
    REQUIRE(Orbital::radial(2, 1, r) ==
            Approx(r * std::exp(-0.5 * r) / (2.0 * std::sqrt(6.0)))
                .margin(1.0e-14));
    REQUIRE(Orbital::radial(3, 2, r) ==
            Approx(4.0 / (81.0 * std::sqrt(30.0)) * r * r *
                   std::exp(-r / 3.0))
                .margin(1.0e-14));
  }

  // Finite at the origin: R_n0(0) = 2/n^{3/2}, and 0 for l>0
  for (int n = 1; n <= 12; ++n) {
    REQUIRE(Orbital::radial(n, 0, 0.0) ==
            Approx(2.0 / std::pow(double(n), 1.5)));
    for (int l = 1; l < n; ++l) {
      REQUIRE(Orbital::radial(n, l, 0.0) == 0.0);
    }
  }

  // Far tail underflows cleanly to zero (no NaN/inf)
  REQUIRE(std::isfinite(Orbital::radial(8, 3, 5000.0)));
  REQUIRE(Orbital::radial(1, 0, 1.0e4) == Approx(0.0).margin(1.0e-300));

  // vector overload
  const auto r_list = qip::uniform_range(0.0, 10.0, 11);
  const auto R31 = Orbital::radial(3, 1, r_list);
  REQUIRE(R31.size() == r_list.size());
  for (std::size_t i = 0; i < r_list.size(); ++i) {
    REQUIRE(R31.at(i) == Orbital::radial(3, 1, r_list.at(i)));
  }

  REQUIRE(Orbital::radial_distribution(2, 1, 3.0) ==
          Approx(9.0 * std::pow(Orbital::radial(2, 1, 3.0), 2)));
  REQUIRE(Orbital::radial_distribution(1, 0, 0.0) == 0.0);
}

//==============================================================================
TEST_CASE("Orbital::radial normalisation", "[Orbital][Radial][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Orbital::radial normalisation\n";

  // Int_0^inf r^2 R^2 dr = 1, for n up to well beyond 6
  for (const int n : {1, 2, 3, 4, 5, 6, 8, 12, 20}) {
    const auto r_max = 6.0 * n * n + 30.0;
    const auto num_points = 400 * n * n + 2000;
    const auto r = qip::uniform_range(0.0, r_max, num_points);
    const auto dr = r.at(1) - r.at(0);
    for (int l = 0; l < n; l += (n > 6 ? 3 : 1)) {
      std::vector<double> P;
      P.reserve(r.size());
      for (const auto ri : r)
        P.push_back(Orbital::radial_distribution(n, l, ri));
      const auto norm = integrate_trapz(P, dr);
      INFO("n=" << n << " l=" << l);
      REQUIRE(norm == Approx(1.0).margin(1.0e-3));
    }
  }
}

//==============================================================================
TEST_CASE("Orbital::radial_nodes", "[Orbital][Radial][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Orbital::radial_nodes\n";

  REQUIRE(Orbital::radial_nodes(1, 0).empty());
  REQUIRE(Orbital::radial_nodes(4, 3).empty());

  const auto n20 = Orbital::radial_nodes(2, 0);
  REQUIRE(n20.size() == 1);
  REQUIRE(n20.at(0) == Approx(2.0));

  const auto n30 = Orbital::radial_nodes(3, 0);
  REQUIRE(n30.size() == 2);
  REQUIRE(n30.at(0) == Approx(0.5 * (9.0 - 3.0 * std::sqrt(3.0))));
  REQUIRE(n30.at(1) == Approx(0.5 * (9.0 + 3.0 * std::sqrt(3.0))));

  const auto n31 = Orbital::radial_nodes(3, 1);
  REQUIRE(n31.size() == 1);
  REQUIRE(n31.at(0) == Approx(6.0));

  // n-l-1 nodes, ascending, R changes sign across each
  for (int n = 1; n <= 10; ++n) {
    for (int l = 0; l < n; ++l) {
      const auto nodes = Orbital::radial_nodes(n, l);
      REQUIRE(nodes.size() == std::size_t(n - l - 1));
      for (std::size_t i = 1; i < nodes.size(); ++i)
        REQUIRE(nodes.at(i) > nodes.at(i - 1));
      for (const auto r0 : nodes) {
        const auto below = Orbital::radial(n, l, r0 * (1.0 - 1.0e-4));
        const auto above = Orbital::radial(n, l, r0 * (1.0 + 1.0e-4));
        REQUIRE(below * above < 0.0);
      }
    }
  }
}
