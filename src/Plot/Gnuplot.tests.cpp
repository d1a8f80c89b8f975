#include "Gnuplot.hpp"
#include "Orbital/Hydrogen.hpp"
#include "Orbital/QuantumNumbers.hpp"
#include "Render/ColourScale.hpp"
#include "Render/Colourmap.hpp"
#include "Render/Contours.hpp"
#include "Slice/Sampler.hpp"
#include "catch2/catch.hpp"
#include "horbital/Errors.hpp"
#include "qip/String.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

namespace {
bool contains(const std::string &text, const std::string &part) {
  return text.find(part) != std::string::npos;
}
std::size_t occurrences(const std::string &text, const std::string &part) {
  std::size_t n = 0;
  for (auto pos = text.find(part); pos != std::string::npos;
       pos = text.find(part, pos + part.size()))
    ++n;
  return n;
}
} // namespace

//==============================================================================
TEST_CASE("Plot: formats and names", "[Plot][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Plot: formats and names\n";

  using namespace Plot;
  REQUIRE(parse_format("PNG") == Format::png);
  REQUIRE(parse_format("pdf") == Format::pdf);
  REQUIRE_THROWS_AS(parse_format("jpg"), horbital::InvalidOptionError);
  REQUIRE(format_from_path("out/orbital.svg") == Format::svg);
  REQUIRE(format_from_path("a.b/orbital.pdf") == Format::pdf);
  REQUIRE_THROWS_AS(format_from_path("a.b/orbital"),
                    horbital::InvalidOptionError);
  REQUIRE_THROWS_AS(format_from_path("orbital.gif"),
                    horbital::InvalidOptionError);

  REQUIRE(output_stem("orbital_n1_l0_m0_density_z0p0.png") ==
          "orbital_n1_l0_m0_density_z0p0");
  REQUIRE(output_stem("dir.x/plot.svg") == "dir.x/plot");
  REQUIRE(output_stem("dir.x/plot") == "dir.x/plot");
}

//==============================================================================
TEST_CASE("Plot: gnuplot script", "[Plot][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Plot: gnuplot script\n";

  using namespace Render;
  using Slice::FieldMode;

  const Orbital::Hydrogen h{Orbital::QuantumNumbers::validated(2, 1, 1)};
  const Slice::SliceSpec spec{Slice::Plane::z, 0.0, {-8.0, 8.0}, 25};
  const auto cmap = Colourmap::named("RdBu_r");

  // Two panels, filled, with nodal lines
  const auto field = Slice::sample(h, spec, FieldMode::real_imag);
  const auto mapping = map_colours(field, cmap, Scale::linear);
  const auto policy = colour_policy(field.mode, Scale::linear);
  const ContourSpec no_contours;
  Plot::PlotRequest request{field,         mapping, cmap,   policy,
                            no_contours,   "orbital.png", "Title", false,
                            true,          false};
  const auto gp = Plot::gnuplot_script(request, "orbital.dat");
  REQUIRE(contains(gp, "set terminal pngcairo"));
  REQUIRE(contains(gp, "set output 'orbital.png'"));
  REQUIRE(contains(gp, "set multiplot layout 1,2"));
  REQUIRE(contains(gp, "set cbrange [-1:1]"));
  REQUIRE(contains(gp, "unset colorbox"));
  REQUIRE(contains(gp, "#a8a8a8"));
  REQUIRE(contains(gp, "nocontours"));
  REQUIRE(occurrences(gp, "splot") == 2);
  REQUIRE(contains(gp, "'orbital.dat' index 1"));
  REQUIRE(contains(gp, "unset multiplot"));

  // Line mode: contour levels with their styles, no filled surface
  const auto levels = contour_levels(field, mapping, cmap, policy, 6);
  Plot::PlotRequest lines{field,  mapping,       cmap,    policy, levels,
                          "o.svg", "Lines", true, false,  true};
  const auto gp_lines = Plot::gnuplot_script(lines, "o.dat");
  REQUIRE(contains(gp_lines, "set terminal svg"));
  REQUIRE_FALSE(contains(gp_lines, "pm3d"));
  REQUIRE(contains(gp_lines, "set cntrparam levels discrete"));
  REQUIRE(occurrences(gp_lines, "dt 2") == 3);
  REQUIRE(occurrences(gp_lines, "dt 1") == 3);

  // Density, single panel, colour bar on
  const auto fd = Slice::sample(h, spec, FieldMode::density);
  const auto md = map_colours(fd, cmap, Scale::log);
  const auto pd = colour_policy(fd.mode, Scale::log);
  Plot::PlotRequest density{fd,          md,      cmap,  pd,   no_contours,
                            "d.pdf",     "Dens",  false, true, true};
  const auto gp_d = Plot::gnuplot_script(density, "d.dat");
  REQUIRE(contains(gp_d, "pdfcairo"));
  REQUIRE(contains(gp_d, "set cbrange [0:1]"));
  REQUIRE(contains(gp_d, "set colorbox"));
  REQUIRE_FALSE(contains(gp_d, "multiplot"));
  // nodal lines only for signed fields
  REQUIRE_FALSE(contains(gp_d, "set contour"));

  // Radial distribution: line plot
  const Slice::SliceSpec spec_r{Slice::Plane::none, 0.0, {0.0, 20.0}, 50};
  const auto fr = Slice::sample(h, spec_r, FieldMode::radial_distribution);
  const auto mr = map_colours(fr, cmap, Scale::linear);
  const auto pr = colour_policy(fr.mode, Scale::linear);
  Plot::PlotRequest radial{fr,       mr,       cmap,  pr,    no_contours,
                           "r.png",  "Radial", false, false, false};
  const auto gp_r = Plot::gnuplot_script(radial, "r.dat");
  REQUIRE(contains(gp_r, "using 1:4 with lines"));
  REQUIRE(contains(gp_r, "#1f4e79"));
  REQUIRE_FALSE(contains(gp_r, "splot"));

  // Unknown extension is rejected
  Plot::PlotRequest bad{fr,        mr,       cmap,  pr,    no_contours,
                        "r.bmp",   "Radial", false, false, false};
  REQUIRE_THROWS_AS(Plot::gnuplot_script(bad, "r.dat"),
                    horbital::InvalidOptionError);
}

//==============================================================================
TEST_CASE("Plot::write_gnuplot", "[Plot][unit]") {
  std::cout << "\n----------------------------------------\n";
  std::cout << "Plot::write_gnuplot\n";

  using namespace Render;
  const Orbital::Hydrogen h{Orbital::QuantumNumbers::validated(1, 0, 0)};
  const Slice::SliceSpec spec{Slice::Plane::x, 0.0, {-4.0, 4.0}, 5};
  const auto field = Slice::sample(h, spec, Slice::FieldMode::density);
  const auto cmap = Colourmap::named("YlOrRd");
  const auto mapping = map_colours(field, cmap, Scale::linear);
  const auto policy = colour_policy(field.mode, Scale::linear);
  const ContourSpec no_contours;

  const Plot::PlotRequest request{
      field, mapping, cmap,  policy, no_contours, "horbital_plot_test.png",
      "1s",  false,   false, false};
  const auto files = Plot::write_gnuplot(request);
  REQUIRE(files.data == "horbital_plot_test.dat");
  REQUIRE(files.script == "horbital_plot_test.gp");

  std::ifstream data_in(files.data);
  REQUIRE(data_in.good());
  const std::string data{std::istreambuf_iterator<char>(data_in),
                         std::istreambuf_iterator<char>()};
  REQUIRE(data == Plot::gnuplot_data(field, mapping));
  // 5x5 points, each line: u v intensity raw
  std::size_t num_points = 0;
  for (const auto &line : qip::split(data, '\n')) {
    if (!line.empty() && line.front() != '#')
      ++num_points;
  }
  REQUIRE(num_points == 25);

  std::ifstream script_in(files.script);
  REQUIRE(script_in.good());
  const std::string script{std::istreambuf_iterator<char>(script_in),
                           std::istreambuf_iterator<char>()};
  REQUIRE(contains(script, "'horbital_plot_test.dat'"));

  std::remove(files.data.c_str());
  std::remove(files.script.c_str());
}
