#include "Colourmap.hpp"
#include "catch2/catch.hpp"
#include "horbital/Errors.hpp"
#include <algorithm>
#include <iostream>

TEST_CASE("Render::RGB", "[Render][Colourmap][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Render::RGB\n";

  using Render::RGB;
  const auto orange = RGB::from_hex("#ffa500");
  REQUIRE(orange.r == 255);
  REQUIRE(orange.g == 165);
  REQUIRE(orange.b == 0);
  REQUIRE(orange.hex() == "#ffa500");
  REQUIRE(RGB::from_hex("A8A8A8") == RGB{168, 168, 168});
  REQUIRE_THROWS_AS(RGB::from_hex("#ffa50"), horbital::InvalidOptionError);
  REQUIRE_THROWS_AS(RGB::from_hex("#ffa5zz"), horbital::InvalidOptionError);
  // non-ASCII bytes are not hex digits
  REQUIRE_THROWS_AS(RGB::from_hex("#ffa5\xe9\xe9"),
                    horbital::InvalidOptionError);
}

//==============================================================================
TEST_CASE("Render::Colourmap", "[Render][Colourmap][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Render::Colourmap\n";

  using Render::Colourmap;
  using Render::RGB;

  const auto coolwarm = Colourmap::named("coolwarm");
  REQUIRE(coolwarm.name() == "coolwarm");
  REQUIRE(coolwarm.anchors().size() == 8);
  REQUIRE(coolwarm.at(0.0) == RGB::from_hex("#3b4cc0"));
  REQUIRE(coolwarm.at(1.0) == RGB::from_hex("#b40426"));
  // clamped outside [0,1]
  REQUIRE(coolwarm.at(-3.0) == coolwarm.at(0.0));
  REQUIRE(coolwarm.at(7.0) == coolwarm.at(1.0));

  // Half way between two anchors
  const Colourmap bw{"bw", {RGB{0, 0, 0}, RGB{200, 100, 50}}};
  REQUIRE(bw.at(0.5) == RGB{100, 50, 25});
  REQUIRE_THROWS_AS((Colourmap{"one", {RGB{0, 0, 0}}}),
                    horbital::InvalidOptionError);

  // Reversed
  const auto coolwarm_r = Colourmap::named("coolwarm_r");
  REQUIRE(coolwarm_r.name() == "coolwarm_r");
  REQUIRE(coolwarm_r.at(0.0) == coolwarm.at(1.0));
  REQUIRE(coolwarm_r.at(0.25) == coolwarm.at(0.75));
  REQUIRE(coolwarm_r.reversed().name() == "coolwarm");
  REQUIRE(coolwarm_r.reversed().anchors() == coolwarm.anchors());

  // Presets
  REQUIRE(Colourmap::named("sample").name() == "RdYlBu_r");
  REQUIRE(Colourmap::named("sample_density").name() == "YlOrRd");
  REQUIRE(Colourmap::named(Render::default_colourmap).at(1.0) ==
          RGB::from_hex("#a50026"));

  // Every advertised name resolves
  for (const auto &name : Colourmap::available()) {
    INFO(name);
    REQUIRE_NOTHROW(Colourmap::named(name));
  }
  const auto names = Colourmap::available();
  REQUIRE(std::find(names.cbegin(), names.cend(), "viridis_r") !=
          names.cend());

  REQUIRE_THROWS_AS(Colourmap::named("jet"), horbital::InvalidOptionError);
  REQUIRE_THROWS_AS(Colourmap::named("_r"), horbital::InvalidOptionError);
}
