#include "InputBlock.hpp"
#include "catch2/catch.hpp"
#include "horbital/Errors.hpp"
#include <iostream>
#include <sstream>

inline void check_orbital_input(const IO::InputBlock &ib);

TEST_CASE("InputBlock", "[InputBlock][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "InputBlock\n";

  using namespace IO;

  InputBlock ib("horbital", {{"title", "test_run"}});
  ib.add(InputBlock("Orbital", {{"n", "3"}, {"l", "1"}, {"l", "2"}}));
  ib.add(InputBlock("Slice", {{"mode", "real"}}));
  // 'true' means will be merged with existing block (if exists)
  ib.add(InputBlock("Slice", {{"value", "-1.5"}}), true);
  ib.add(std::string("Colour{ scale = symlog; line_mode; /* filled */ "
                     "levels = 6; } // trailing comment"));
  ib.add(Option{"range", "-20,20"});
  ib.add(Option{"render", "false"});
  ib.add(Option{"points", "default"});

  check_orbital_input(ib);

  // Construct a new InputBlock using the string output of another
  std::stringstream ostr1;
  ib.print(ostr1);
  InputBlock ib2("horbital", ostr1.str());
  check_orbital_input(ib2);

  // test copy construct
  auto ib3 = ib2;
  check_orbital_input(ib3);

  // test copy assign, then string outputs are identical
  ib2 = ib;
  std::stringstream ostr2;
  ib2.print(ostr2);
  REQUIRE(ostr1.str() == ostr2.str());
}

//==============================================================================
void check_orbital_input(const IO::InputBlock &ib) {

  REQUIRE(ib.get("title") == "test_run");
  REQUIRE(ib.get<int>({"Orbital"}, "n") == 3);
  // later option overrides earlier
  REQUIRE(ib.get({"Orbital"}, "l", 0) == 2);
  REQUIRE(ib.get({"Orbital"}, "m", 0) == 0);

  // case insensitive block and option names
  REQUIRE(ib.getBlock("slice")->get("MODE") == "real");
  REQUIRE(ib.getBlock("Slice")->get("value", 0.0) == -1.5);
  REQUIRE(ib.getBlock("Output") == std::nullopt);

  REQUIRE(ib.get<std::string>({"Colour"}, "scale") == "symlog");
  REQUIRE(ib.get<int>({"Colour"}, "levels") == 6);
  // a bare option is a switched-on flag
  REQUIRE(ib.get<bool>(std::initializer_list<std::string>{"Colour"}, "line_mode") == true);
  REQUIRE(ib.get<bool>(std::initializer_list<std::string>{"Colour"}, "colorbar") == std::nullopt);

  const auto range = ib.get<std::vector<double>>("range", {});
  REQUIRE(range.size() == 2);
  REQUIRE(range.at(0) == -20.0);
  REQUIRE(range.at(1) == 20.0);

  REQUIRE(ib.get<bool>("render").value() == false);

  // 'default' is the same as not given
  REQUIRE(ib.get<int>("points") == std::nullopt);
  REQUIRE(ib.get("points", 401) == 401);

  REQUIRE(ib.check({{"title", ""},
                    {"range", ""},
                    {"render", ""},
                    {"points", ""},
                    {"Orbital{}", ""},
                    {"Slice{}", ""},
                    {"Colour{}", ""}}));

  std::cout
      << "Note: following warning message is expected as part of tests:\n";
  REQUIRE_FALSE(ib.check({"Orbital"}, {{"n", ""}, {"m", ""}}));
  // a missing block is not a spelling mistake
  REQUIRE(ib.check({"Output"}, {{"output", ""}}));
}

//==============================================================================
TEST_CASE("InputBlock: bad values", "[InputBlock][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "InputBlock: bad values\n";

  const IO::InputBlock ib("in", std::string("Orbital{ n = two; l = 1.5; "
                                            "m = -1; } flag = maybe;"));
  REQUIRE_THROWS_AS(ib.get<int>({"Orbital"}, "n"),
                    horbital::InvalidOptionError);
  // partial parse of "1.5" as an int is not accepted
  REQUIRE_THROWS_AS(ib.get<int>({"Orbital"}, "l"),
                    horbital::InvalidOptionError);
  REQUIRE(ib.get<int>({"Orbital"}, "m") == -1);
  REQUIRE_THROWS_AS(ib.get<bool>("flag"), horbital::InvalidOptionError);

  REQUIRE_THROWS_AS(IO::InputBlock("in", std::string("Orbital{ n = 1;")),
                    horbital::InvalidOptionError);

  // last option in a block, or in the input, must still end with ';'
  REQUIRE_THROWS_AS(
      IO::InputBlock("in", std::string("Orbital{n=2;l=1} Slice{mode=real;}")),
      horbital::InvalidOptionError);
  REQUIRE_THROWS_AS(IO::InputBlock("in", std::string("Slice{mode=real}")),
                    horbital::InvalidOptionError);
  REQUIRE_THROWS_AS(IO::InputBlock("in", std::string("points = 30")),
                    horbital::InvalidOptionError);
  REQUIRE_THROWS_AS(IO::InputBlock("in", std::string("{n=1;}")),
                    horbital::InvalidOptionError);
  // empty options are skipped, not the end of the input
  const IO::InputBlock spare("in", std::string("Orbital{n=2;;l=1;};;m=0;"));
  REQUIRE(spare.get({"Orbital"}, "l", -99) == 1);
  REQUIRE(spare.get("m", -99) == 0);
}
