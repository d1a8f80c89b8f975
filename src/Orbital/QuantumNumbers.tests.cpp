#include "QuantumNumbers.hpp"
#include "catch2/catch.hpp"
#include "horbital/Errors.hpp"
#include <iostream>
#include <string>

TEST_CASE("Orbital::QuantumNumbers", "[Orbital][QuantumNumbers][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Orbital::QuantumNumbers\n";

  using Orbital::QuantumNumbers;

  const auto qn = QuantumNumbers::validated(3, 2, -1);
  REQUIRE(qn.n() == 3);
  REQUIRE(qn.l() == 2);
  REQUIRE(qn.m() == -1);
  REQUIRE(qn.spectroscopic() == "3d");

  // every allowed state, up to n=6
  for (int n = 1; n <= 6; ++n) {
    for (int l = 0; l < n; ++l) {
      for (int m = -l; m <= l; ++m) {
        REQUIRE_NOTHROW(QuantumNumbers::validated(n, l, m));
      }
    }
  }

  REQUIRE_THROWS_AS(QuantumNumbers::validated(0, 0, 0),
                    horbital::InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(QuantumNumbers::validated(-2, 0, 0),
                    horbital::InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(QuantumNumbers::validated(2, 2, 0),
                    horbital::InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(QuantumNumbers::validated(3, -1, 0),
                    horbital::InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(QuantumNumbers::validated(3, 1, 2),
                    horbital::InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(QuantumNumbers::validated(3, 1, -2),
                    horbital::InvalidQuantumNumberError);

  // The message names the violated constraint
  try {
    QuantumNumbers::validated(2, 2, 0);
    FAIL("Expected InvalidQuantumNumberError");
  } catch (const horbital::InvalidQuantumNumberError &e) {
    REQUIRE(std::string(e.what()).find("n-1") != std::string::npos);
    REQUIRE(std::string(e.kind()) == "InvalidQuantumNumberError");
  }
}

//==============================================================================
TEST_CASE("Orbital::parse_quantum_numbers", "[Orbital][QuantumNumbers][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Orbital::parse_quantum_numbers\n";

  using Orbital::parse_quantum_numbers;
  using Orbital::QuantumNumbers;

  // Missing trailing values are zero
  REQUIRE(parse_quantum_numbers({4}) == QuantumNumbers::validated(4, 0, 0));
  REQUIRE(parse_quantum_numbers({4, 3}) == QuantumNumbers::validated(4, 3, 0));
  REQUIRE(parse_quantum_numbers({4, 3, -3}) ==
          QuantumNumbers::validated(4, 3, -3));
  REQUIRE(parse_quantum_numbers({4, 3, -3}) !=
          QuantumNumbers::validated(4, 3, 3));

  REQUIRE_THROWS_AS(parse_quantum_numbers({}),
                    horbital::InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(parse_quantum_numbers({3, 1, 0, 1}),
                    horbital::InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(parse_quantum_numbers({0}),
                    horbital::InvalidQuantumNumberError);
  REQUIRE_THROWS_AS(parse_quantum_numbers({2, 1, 2}),
                    horbital::InvalidQuantumNumberError);

  REQUIRE(Orbital::l_symbol(0) == "s");
  REQUIRE(Orbital::l_symbol(3) == "f");
}
