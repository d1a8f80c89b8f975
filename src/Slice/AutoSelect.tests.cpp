#include "AutoSelect.hpp"
#include "Orbital/QuantumNumbers.hpp"
#include "Orbital/Radial.hpp"
#include "catch2/catch.hpp"
#include "horbital/Errors.hpp"
#include <cmath>
#include <iostream>

TEST_CASE("Slice::cumulative_radial_probability", "[Slice][Auto][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Slice::cumulative_radial_probability\n";

  using Slice::cumulative_radial_probability;

  REQUIRE(cumulative_radial_probability(1, 0, 0.0) == 0.0);
  // 1s: P(r) = 1 - e^{-2r}(1 + 2r + 2r^2)
  for (const auto r : {0.1, 1.0, 2.5, 6.0}) {
    const auto exact = 1.0 - std::exp(-2.0 * r) * (1.0 + 2.0 * r + 2.0 * r * r);
    REQUIRE(cumulative_radial_probability(1, 0, r) == Approx(exact));
  }
  // Normalised
  for (int n = 1; n <= 7; ++n) {
    for (int l = 0; l < n; ++l) {
      REQUIRE(cumulative_radial_probability(n, l, 12.0 * n * n) ==
              Approx(1.0).margin(1.0e-6));
    }
  }
}

//==============================================================================
TEST_CASE("Slice::auto_extent", "[Slice][Auto][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Slice::auto_extent\n";

  using namespace Slice;
  using Orbital::QuantumNumbers;

  // 1s: 99% radius is 4.2 a0
  const auto e1s = auto_extent(QuantumNumbers::validated(1, 0, 0),
                               FieldMode::density);
  REQUIRE(Slice::cumulative_radial_probability(1, 0, e1s / 1.15) ==
          Approx(0.99).margin(1.0e-6));
  REQUIRE(e1s == Approx(1.15 * 4.2).epsilon(0.01));

  // Clamped, and pure: same input, same result
  for (int n = 1; n <= 6; ++n) {
    for (int l = 0; l < n; ++l) {
      const auto qn = QuantumNumbers::validated(n, l, 0);
      for (const auto mode : all_modes()) {
        const auto e = auto_extent(qn, mode);
        REQUIRE(e >= 4.0);
        REQUIRE(e <= std::max(10.0, std::max(8.0, 6.0 + 2.0 * l) * n));
        REQUIRE(e == auto_extent(qn, mode));
      }
      REQUIRE(auto_extent(qn, FieldMode::density) <= std::max(10.0, 8.0 * n));
    }
  }

  // Coverage is clamped to [0.95, 0.999]
  const auto qn2 = QuantumNumbers::validated(2, 0, 0);
  REQUIRE(auto_extent(qn2, FieldMode::density, 0.5) ==
          auto_extent(qn2, FieldMode::density, 0.95));

  // Signed modes keep the outermost node in view
  const auto qn30 = QuantumNumbers::validated(3, 0, 0);
  const auto last_node = Orbital::radial_nodes(3, 0).back();
  REQUIRE(auto_extent(qn30, FieldMode::real) > last_node);
}

//==============================================================================
TEST_CASE("Slice::auto_range monotonic in n", "[Slice][Auto][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Slice::auto_range monotonic in n\n";

  using namespace Slice;
  using Orbital::QuantumNumbers;

  for (const auto mode : {FieldMode::density, FieldMode::radial_distribution}) {
    for (int l = 0; l <= 2; ++l) {
      for (int m : {0, l}) {
        double previous = 0.0;
        for (int n = l + 1; n <= 9; ++n) {
          const auto range =
              auto_range(QuantumNumbers::validated(n, l, m), mode);
          REQUIRE(range.max >= previous);
          previous = range.max;
        }
      }
    }
  }

  for (const auto mode :
       {FieldMode::real, FieldMode::imag, FieldMode::real_imag}) {
    for (int l = 0; l <= 2; ++l) {
      for (int m : {0, l}) {
        double previous = 0.0;
        for (int n = l + 1; n <= 9; ++n) {
          const auto range =
              auto_range(QuantumNumbers::validated(n, l, m), mode);
          REQUIRE(range.max >= previous);
          previous = range.max;
        }
      }
    }
  }

  const auto qn = QuantumNumbers::validated(2, 1, 0);
  const auto planar = auto_range(qn, FieldMode::density);
  REQUIRE(planar.min == -planar.max);
  const auto radial = auto_range(qn, FieldMode::radial_distribution);
  REQUIRE(radial.min == 0.0);
  REQUIRE(radial.max == planar.max);
}

//==============================================================================
TEST_CASE("Slice::auto_plane", "[Slice][Auto][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Slice::auto_plane\n";

  using namespace Slice;
  using Orbital::QuantumNumbers;

  // Spherically symmetric: all planes tie, so z is kept
  REQUIRE(auto_plane(QuantumNumbers::validated(1, 0, 0), FieldMode::density,
                     6.0) == Plane::z);
  // 2p0 (p_z) vanishes on the z=0 plane: pick a plane containing the z-axis
  REQUIRE(auto_plane(QuantumNumbers::validated(2, 1, 0), FieldMode::density,
                     12.0) != Plane::z);
  // 2p1: ring in the xy plane, strongest on z=0
  REQUIRE(auto_plane(QuantumNumbers::validated(2, 1, 1), FieldMode::density,
                     12.0) == Plane::z);
  // Plane-independent modes
  REQUIRE(auto_plane(QuantumNumbers::validated(2, 1, 1),
                     FieldMode::radial_distribution, 12.0) == Plane::none);
  REQUIRE(auto_plane(QuantumNumbers::validated(2, 1, 1),
                     FieldMode::spherical_harmonic, 12.0) == Plane::none);
}

//==============================================================================
TEST_CASE("Slice::resolve", "[Slice][Auto][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Slice::resolve\n";

  using namespace Slice;
  using Orbital::QuantumNumbers;
  const auto qn = QuantumNumbers::validated(3, 1, 0);

  REQUIRE(parse_plane_request("auto") == std::nullopt);
  REQUIRE(parse_plane_request("X") == Plane::x);
  REQUIRE_THROWS_AS(parse_plane_request("q"), horbital::InvalidOptionError);

  // Everything automatic
  const auto spec = resolve(qn, FieldMode::real, {});
  REQUIRE(spec.plane != Plane::none);
  REQUIRE(spec.value == 0.0);
  REQUIRE(spec.resolution == 401);
  REQUIRE(spec.range.max == auto_extent(qn, FieldMode::real));
  // identical inputs -> identical spec
  const auto spec2 = resolve(qn, FieldMode::real, {});
  REQUIRE(spec2.plane == spec.plane);
  REQUIRE(spec2.range.min == spec.range.min);

  // Explicit values are kept
  SliceRequest request;
  request.plane = Plane::y;
  request.value = -2.5;
  request.range = Range{-8.0, 4.0};
  request.resolution = 99;
  const auto explicit_spec = resolve(qn, FieldMode::density, request);
  REQUIRE(explicit_spec.plane == Plane::y);
  REQUIRE(explicit_spec.value == -2.5);
  REQUIRE(explicit_spec.range.min == -8.0);
  REQUIRE(explicit_spec.range.max == 4.0);
  REQUIRE(explicit_spec.resolution == 99);

  // Bad range
  SliceRequest bad_range;
  bad_range.range = Range{3.0, -3.0};
  REQUIRE_THROWS_AS(resolve(qn, FieldMode::density, bad_range),
                    horbital::InvalidSliceSpecError);

  // Plane-independent modes
  const auto radial = resolve(qn, FieldMode::radial_distribution, {});
  REQUIRE(radial.plane == Plane::none);
  REQUIRE(radial.range.min == 0.0);
  SliceRequest with_plane;
  with_plane.plane = Plane::z;
  REQUIRE_THROWS_AS(resolve(qn, FieldMode::radial_distribution, with_plane),
                    horbital::InvalidSliceSpecError);
  SliceRequest with_value;
  with_value.value = 0.0;
  REQUIRE_THROWS_AS(resolve(qn, FieldMode::spherical_harmonic, with_value),
                    horbital::InvalidSliceSpecError);
  SliceRequest with_range;
  with_range.range = Range{0.0, 10.0};
  REQUIRE_THROWS_AS(resolve(qn, FieldMode::spherical_harmonic, with_range),
                    horbital::InvalidSliceSpecError);
  REQUIRE(resolve(qn, FieldMode::radial_distribution, with_range).range.max ==
          10.0);
  with_range.range = Range{-1.0, 10.0};
  REQUIRE_THROWS_AS(resolve(qn, FieldMode::radial_distribution, with_range),
                    horbital::InvalidSliceSpecError);
}
