#include "qip/String.hpp"
#include "catch2/catch.hpp"
#include <iostream>
#include <string>
#include <vector>

TEST_CASE("qip::String", "[qip][String][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "qip::String\n";

  REQUIRE(qip::ci_compare("density", "density") == true);
  REQUIRE(qip::ci_compare("density", "densityx") == false);
  REQUIRE(qip::ci_compare("densityx", "density") == false);
  REQUIRE(qip::ci_compare("Density", "dENSITY") == true);
  REQUIRE(qip::ci_compare("RdYlBu_r", "rdylbu_R") == true);
  REQUIRE(qip::ci_compare("real!", "real?") == false);
  REQUIRE(qip::ci_compare("", "") == true);

  // Wildcard only in the second argument
  REQUIRE(qip::ci_wc_compare("linthresh", "linthresh") == true);
  REQUIRE(qip::ci_wc_compare("linthresh", "lin*") == true);
  REQUIRE(qip::ci_wc_compare("linthresh", "*THRESH") == true);
  REQUIRE(qip::ci_wc_compare("linthresh", "l*h") == true);
  REQUIRE(qip::ci_wc_compare("linthresh", "*") == true);
  REQUIRE(qip::ci_wc_compare("linthresh", "x*") == false);
  REQUIRE(qip::ci_wc_compare("linthresh", "*x") == false);
  REQUIRE(qip::ci_wc_compare("linthresh", "linthres") == false);

  const std::vector<std::string> list = {"density", "real", "imag",
                                         "real_imag"};
  REQUIRE(qip::ci_Levenstein("real", "REAL") == 0);
  REQUIRE(qip::ci_Levenstein("real", "reel") == 1);
  REQUIRE(qip::ci_Levenstein("", "imag") == 4);
  REQUIRE(*qip::ci_closest_match("densty", list) == "density");
  REQUIRE(*qip::ci_closest_match("IMAG", list) == "imag");
  REQUIRE(*qip::ci_closest_match("real_imga", list) == "real_imag");

  REQUIRE(qip::string_is_integer("16"));
  REQUIRE(qip::string_is_integer("-16"));
  REQUIRE(qip::string_is_integer("+16"));
  REQUIRE_FALSE(qip::string_is_integer("16.0"));
  REQUIRE_FALSE(qip::string_is_integer("16x"));
  REQUIRE_FALSE(qip::string_is_integer("-"));
  REQUIRE_FALSE(qip::string_is_integer("--mode"));
  REQUIRE_FALSE(qip::string_is_integer(""));

  REQUIRE(qip::concat(std::vector<std::string>{"a", "b", "c"}, ",") ==
          std::string{"a,b,c"});
  REQUIRE(qip::concat(std::vector<std::string>{"a", "b", "c"}) ==
          std::string{"abc"});
  REQUIRE(qip::concat(std::vector<std::string>{}, ",").empty());

  REQUIRE(qip::split(std::string{"a b c"}, ' ') ==
          std::vector<std::string>{"a", "b", "c"});
  REQUIRE(qip::split(std::string{"-20,20"}, ',') ==
          std::vector<std::string>{"-20", "20"});

  REQUIRE(qip::replace("m-2.5", '.', 'p') == "m-2p5");
  REQUIRE(qip::replace("abc", 'x', 'y') == "abc");
}

//==============================================================================
TEST_CASE("qip::wrap", "[qip][String][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "qip::wrap\n";

  REQUIRE(qip::wrap("short line", 80) == "short line\n");
  REQUIRE(qip::wrap("aaa bbb ccc", 7) == "aaa bbb\nccc\n");
  REQUIRE(qip::wrap("aaa bbb", 7, "  ") == "  aaa\n  bbb\n");
  // existing newlines kept
  REQUIRE(qip::wrap("one\ntwo", 80, "-") == "-one\n-two\n");

  // no wrapped line is longer than 'at' (unless a single word is)
  const std::string text{"Slice plane and range are chosen automatically "
                         "unless given, and values are mapped to colours."};
  for (const auto &line : qip::split(qip::wrap(text, 20, "    "), '\n')) {
    REQUIRE(line.size() <= 20);
  }
}
