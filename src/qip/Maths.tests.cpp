#include "Maths.hpp"
#include "catch2/catch.hpp"
#include <iostream>

TEST_CASE("qip::Maths", "[qip][Maths][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "qip::Maths\n";

  REQUIRE(qip::sign(5) == 1);
  REQUIRE(qip::sign(-3) == -1);
  REQUIRE(qip::sign(0) == 0);
  REQUIRE(qip::sign(-2.5) == -1);
  REQUIRE(qip::sign(1.0e-300) == 1);
  REQUIRE(qip::sign(0.0) == 0);
  REQUIRE(qip::sign(-0.0) == 0);

  REQUIRE(qip::clamp(0.5, 0.0, 1.0) == 0.5);
  REQUIRE(qip::clamp(-0.5, 0.0, 1.0) == 0.0);
  REQUIRE(qip::clamp(1.5, 0.0, 1.0) == 1.0);
  REQUIRE(qip::clamp(7, -1, 1) == 1);
  REQUIRE(qip::clamp(-7, -1, 1) == -1);

  REQUIRE(qip::parity(0) == 1);
  REQUIRE(qip::parity(1) == -1);
  REQUIRE(qip::parity(2) == 1);
  REQUIRE(qip::parity(-3) == -1);
  REQUIRE(qip::parity(-4) == 1);

  static_assert(qip::sign(-4) == -1);
  static_assert(qip::clamp(3, 0, 2) == 2);
  static_assert(qip::parity(5) == -1);
}
