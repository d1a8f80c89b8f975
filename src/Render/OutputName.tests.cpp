#include "Orbital/QuantumNumbers.hpp"
#include "OutputName.hpp"
#include "catch2/catch.hpp"
#include <iostream>

TEST_CASE("Render::default_output_name", "[Render][OutputName][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Render::default_output_name\n";

  using namespace Render;
  using Slice::FieldMode;
  using Slice::Plane;

  REQUIRE(value_token(0.0) == "0p0");
  REQUIRE(value_token(-1.5) == "m1p5");
  REQUIRE(value_token(2.0) == "2p0");
  REQUIRE(value_token(0.25) == "0p25");
  REQUIRE(value_token(-3.0) == "m3p0");

  const auto qn = Orbital::QuantumNumbers::validated(2, 1, 0);
  REQUIRE(default_output_name(qn, FieldMode::real, "z", 0.0) ==
          "orbital_n2_l1_m0_real_z0p0.png");
  REQUIRE(default_output_name(qn, FieldMode::density, "x", -1.5, "svg") ==
          "orbital_n2_l1_m0_density_xm1p5.svg");

  const auto qn2 = Orbital::QuantumNumbers::validated(3, 2, -2);
  REQUIRE(plane_token(FieldMode::radial_distribution, Plane::none) == "r");
  REQUIRE(plane_token(FieldMode::spherical_harmonic, Plane::none) ==
          "angles");
  REQUIRE(plane_token(FieldMode::imag, Plane::y) == "y");
  REQUIRE(default_output_name(
              qn2, FieldMode::spherical_harmonic,
              plane_token(FieldMode::spherical_harmonic, Plane::none), 0.0) ==
          "orbital_n3_l2_m-2_spherical_harmonic_angles0p0.png");
  REQUIRE(default_output_name(
              qn2, FieldMode::radial_distribution,
              plane_token(FieldMode::radial_distribution, Plane::none), 0.0,
              "pdf") == "orbital_n3_l2_m-2_radial_distribution_r0p0.pdf");
}
