#include "Vector.hpp"
#include "catch2/catch.hpp"
#include <iostream>
#include <vector>

TEST_CASE("qip::Vector: ranges", "[qip][Vector][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "qip::Vector: ranges\n";

  const auto u = qip::uniform_range(-10.0, 10.0, 401);
  REQUIRE(u.size() == 401);
  REQUIRE(u.front() == -10.0);
  REQUIRE(u.back() == 10.0);
  REQUIRE(u[200] == Approx(0.0).margin(1.0e-14));
  REQUIRE(u[1] - u[0] == Approx(0.05));

  const auto u2 = qip::uniform_range(0.0, 1.0, 2);
  REQUIRE(u2 == std::vector{0.0, 1.0});

  const auto l = qip::logarithmic_range(1.0e-3, 1.0, 4);
  REQUIRE(l.size() == 4);
  REQUIRE(l.front() == 1.0e-3);
  REQUIRE(l.back() == 1.0);
  REQUIRE(l[1] == Approx(1.0e-2));
  REQUIRE(l[2] == Approx(1.0e-1));
}

//==============================================================================
TEST_CASE("qip::Vector: statistics", "[qip][Vector][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "qip::Vector: statistics\n";

  const std::vector a{1.0, -4.0, 3.0, 0.0};
  const std::vector b{2.0, 0.5};
  REQUIRE(qip::max_abs(a) == 4.0);
  REQUIRE(qip::max_abs(b) == 2.0);
  REQUIRE(qip::max_abs(b, a) == 4.0);
  REQUIRE(qip::max_abs(std::vector<double>{}) == 0.0);

  REQUIRE(qip::min_positive(a) == 1.0);
  REQUIRE(qip::min_positive(std::vector{1.0e-5, 3.0, 2.0e-5}) == 1.0e-5);
  REQUIRE(qip::min_positive(std::vector{-1.0, 0.0}) == 0.0);

  const std::vector p{5.0, 1.0, 4.0, 2.0, 3.0};
  REQUIRE(qip::percentile(p, 0.0) == 1.0);
  REQUIRE(qip::percentile(p, 100.0) == 5.0);
  REQUIRE(qip::percentile(p, 50.0) == 3.0);
  REQUIRE(qip::percentile(p, 62.5) == Approx(3.5));
  REQUIRE(qip::percentile(std::vector<double>{}, 50.0) == 0.0);

  REQUIRE(qip::standard_deviation(std::vector{2.0, 2.0, 2.0}) == 0.0);
  REQUIRE(qip::standard_deviation(std::vector{1.0, 3.0}) == Approx(1.0));
  REQUIRE(qip::standard_deviation(
              std::vector{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) ==
          Approx(2.0));
}
