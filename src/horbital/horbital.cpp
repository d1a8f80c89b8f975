#include "horbital.hpp"
#include "Errors.hpp"
#include "IO/ChronoTimer.hpp"
#include "IO/InputBlock.hpp"
#include "IO/StyledPrint.hpp"
#include "Orbital/Hydrogen.hpp"
#include "Physics/PhysConst_constants.hpp"
#include "Render/Colourmap.hpp"
#include "Render/OutputName.hpp"
#include "Slice/Sampler.hpp"
#include "qip/String.hpp"
#include <cmath>
#include <fmt/format.h>
#include <iostream>

namespace horbital {

//==============================================================================
const std::vector<std::pair<std::string, std::string>> &input_blocks() {
  static const std::vector<std::pair<std::string, std::string>> blocks{
      {"", "These are the top-level horbital input blocks. Default values are "
           "given in square brackets following the description: "
           "[default_value]. Blocks end with '{}', options end with ';'. Run "
           "`horbital -a BlockName` to see the options for any block."},
      {"Orbital{}", "Quantum numbers n, l, m of the hydrogen orbital"},
      {"Slice{}", "What to sample (mode), and where (plane, value, range)"},
      {"Colour{}", "Colour scale, colourmap, and contour-line options"},
      {"Output{}", "Output file name, format, and rendering"}};
  return blocks;
}

const std::vector<std::pair<std::string, std::string>> &
input_options(std::string_view block) {
  static const std::vector<std::pair<std::string, std::string>> orbital{
      {"n", "Principal quantum number, n >= 1. Required"},
      {"l", "Orbital angular momentum, 0 <= l <= n-1 [0]"},
      {"m", "Magnetic quantum number, -l <= m <= l [0]"}};
  static const std::vector<std::pair<std::string, std::string>> slice{
      {"mode", "density, real, imag, real_imag, radial_distribution, "
               "spherical_harmonic [density]"},
      {"plane", "Constant-coordinate plane: x, y, z, or auto. Only for "
                "density, real, imag, real_imag [auto]"},
      {"value", "Value of the constant coordinate, in a0. Only for planar "
                "modes [0.0]"},
      {"range", "Range on each free axis, in a0, as: min, max. For "
                "radial_distribution this is the r range. Not used for "
                "spherical_harmonic [automatic]"},
      {"points", "Number of grid points along each axis, at least 25 [401]"}};
  static const std::vector<std::pair<std::string, std::string>> colour{
      {"scale", "linear, log, symlog, or auto (log for density, symlog for "
                "signed fields) [linear]"},
      {"cmap", fmt::format("Colourmap. Any of: {} [RdYlBu_r]",
                           qip::concat(Render::Colourmap::available(), ", "))},
      {"line_mode", "Draw contour lines only, no filled surface [false]"},
      {"nodal_lines", "Overlay the zero contour (nodal lines) on signed "
                      "fields. Not with line_mode [false]"},
      {"colorbar", "Show the colour bar [false]"},
      {"linthresh", "symlog: linear threshold, as fraction of max|value|, in "
                    "(0,1] [1.0e-3]"},
      {"levels", "line_mode: number of contour levels, at least 2 [8]"}};
  static const std::vector<std::pair<std::string, std::string>> output{
      {"output", "Output image path; extension (png, svg, pdf) sets the "
                 "format [orbital_n{n}_l{l}_m{m}_{mode}_{plane}{value}.png]"},
      {"format", "png, svg, or pdf. Must match the output extension if both "
                 "are given [png]"},
      {"render", "Run gnuplot on the written script [false]"}};

  if (qip::ci_compare(block, "Orbital"))
    return orbital;
  if (qip::ci_compare(block, "Slice"))
    return slice;
  if (qip::ci_compare(block, "Colour"))
    return colour;
  if (qip::ci_compare(block, "Output"))
    return output;
  throw InvalidOptionError(fmt::format(
      "Unknown input block '{}'; expected Orbital, Slice, Colour, or Output",
      block));
}

void print_input_options(const std::vector<std::string> &blocks) {
  IO::InputBlock{"horbital", {"help;"}}.check(input_blocks(), true);
  for (const auto &name : blocks) {
    IO::InputBlock{name, {"help;"}}.check(input_options(name), true);
  }
}

//==============================================================================
Settings read_settings(const IO::InputBlock &input) {
  using namespace std::string_literals;

  // Orbital
  const auto n = input.get<int>({"Orbital"}, "n");
  if (!n) {
    throw InvalidQuantumNumberError(
        "Principal quantum number n is required, e.g., Orbital{n=2;}");
  }
  const auto qn = Orbital::parse_quantum_numbers(
      {*n, input.get({"Orbital"}, "l", 0), input.get({"Orbital"}, "m", 0)});

  // Slice
  const auto mode =
      Slice::parse_mode(input.get({"Slice"}, "mode", "density"s));

  Slice::SliceRequest slice;
  slice.plane =
      Slice::parse_plane_request(input.get({"Slice"}, "plane", "auto"s));
  slice.value = input.get<double>({"Slice"}, "value");
  if (const auto range = input.get<std::vector<double>>({"Slice"}, "range")) {
    if (range->size() != 2) {
      throw InvalidOptionError(fmt::format(
          "Slice range must be given as: min, max (got {} values)",
          range->size()));
    }
    slice.range = Slice::Range{range->at(0), range->at(1)};
  }
  slice.resolution = input.get({"Slice"}, "points", 401);
  if (slice.resolution < min_points) {
    throw InvalidSliceSpecError(fmt::format(
        "points must be at least {} (got {})", min_points, slice.resolution));
  }

  // Colour
  const auto scale = Render::resolve_scale(
      mode, Render::parse_scale(input.get({"Colour"}, "scale", "linear"s)));
  const auto colourmap = Render::Colourmap::named(input.get(
      {"Colour"}, "cmap", std::string(Render::default_colourmap)));
  const auto line_mode = input.get({"Colour"}, "line_mode", false);
  const auto nodal_lines = input.get({"Colour"}, "nodal_lines", false);
  const auto colorbar = input.get({"Colour"}, "colorbar", false);

  Render::MappingOptions mapping;
  mapping.linthresh_fraction =
      input.get({"Colour"}, "linthresh", mapping.linthresh_fraction);
  if (!std::isfinite(mapping.linthresh_fraction) ||
      mapping.linthresh_fraction <= 0.0 || mapping.linthresh_fraction > 1.0) {
    throw InvalidOptionError(fmt::format(
        "linthresh must be in (0, 1] (got {})", mapping.linthresh_fraction));
  }
  const auto levels = input.get({"Colour"}, "levels", 8);
  if (levels < 2) {
    throw InvalidOptionError(
        fmt::format("levels must be at least 2 (got {})", levels));
  }

  Render::check_scale(mode, scale, line_mode);
  Render::check_line_options(line_mode, nodal_lines);
  // a non-negative field has no zero contour to overlay
  if (nodal_lines && !Render::is_signed(mode)) {
    throw ConflictingOptionError(
        fmt::format("nodal_lines needs a signed field; mode={} is never "
                    "negative",
                    Slice::mode_name(mode)));
  }

  // Output
  const auto output_block = input.getBlock("Output").value_or(IO::InputBlock{});
  const auto output = output_block.get<std::string>("output");
  const auto format_str = output_block.get<std::string>("format");
  auto format =
      format_str ? Plot::parse_format(*format_str) : Plot::Format::png;
  if (output) {
    const auto path_format = Plot::format_from_path(*output);
    if (format_str && path_format != format) {
      throw ConflictingOptionError(fmt::format(
          "Output {} does not match format={}", *output, *format_str));
    }
    format = path_format;
  }
  const auto render = input.get({"Output"}, "render", false);

  return Settings{qn,       mode,     slice,  scale,  colourmap.name(),
                  line_mode, nodal_lines, colorbar, mapping, levels,
                  output,   format,   render};
}

//==============================================================================
std::string plot_title(const Orbital::QuantumNumbers &qn, Slice::FieldMode mode,
                       Slice::Plane plane, Render::Scale scale) {
  std::string title;
  switch (mode) {
  case Slice::FieldMode::radial_distribution:
    return fmt::format("Hydrogen Radial Distribution n={}, l={}", qn.n(),
                       qn.l());
  case Slice::FieldMode::spherical_harmonic:
    title = fmt::format("Spherical Harmonic l={}, m={} | mode={}", qn.l(),
                        qn.m(), Slice::mode_name(mode));
    break;
  case Slice::FieldMode::density:
  case Slice::FieldMode::real:
  case Slice::FieldMode::imag:
  case Slice::FieldMode::real_imag:
    title = fmt::format("Hydrogen Orbital n={}, l={}, m={} | mode={} | "
                        "slice={}-plane",
                        qn.n(), qn.l(), qn.m(), Slice::mode_name(mode),
                        Slice::plane_name(plane));
    break;
  }
  if (scale != Render::Scale::linear)
    title += fmt::format(" | scale={}", Render::scale_name(scale));
  return title;
}

//==============================================================================
RunResult compute(const Settings &settings) {
  const auto &qn = settings.qn;
  // Validates slice request before evaluating anything
  const auto spec = Slice::resolve(qn, settings.mode, settings.slice);

  const Orbital::Hydrogen orbital{qn};
  auto field = Slice::sample(orbital, spec, settings.mode, settings.scale);

  const auto colourmap = Render::Colourmap::named(settings.colourmap);
  auto mapping =
      Render::map_colours(field, colourmap, settings.scale, settings.mapping);

  Render::ContourSpec contours;
  if (settings.line_mode) {
    const auto policy = Render::colour_policy(settings.mode, settings.scale);
    contours = Render::contour_levels(field, mapping, colourmap, policy,
                                      settings.levels);
  }

  auto output = settings.output.value_or(Render::default_output_name(
      qn, settings.mode, Render::plane_token(settings.mode, spec.plane),
      spec.value, Plot::format_extension(settings.format)));
  auto title = plot_title(qn, settings.mode, spec.plane, settings.scale);

  return {spec,
          std::move(field),
          std::move(mapping),
          std::move(contours),
          std::move(output),
          std::move(title)};
}

//==============================================================================
RunResult run(const IO::InputBlock &input) {
  IO::ChronoTimer timer("\nhorbital");

  std::cout << '\n';
  IO::print_line();
  input.print();

  input.check(input_blocks());
  for (const auto &[block, description] : input_blocks()) {
    if (block.empty())
      continue;
    const auto name = block.substr(0, block.size() - 2); // remove "{}"
    input.check({name}, input_options(name));
  }

  const auto settings = read_settings(input);
  const auto &qn = settings.qn;
  const Orbital::Hydrogen orbital{qn};
  fmt::print("\nHydrogen {} orbital: n={}, l={}, m={}\n", qn.spectroscopic(),
             qn.n(), qn.l(), qn.m());
  fmt::print("E = {:.8f} Eh = {:.6f} eV\n", orbital.energy(),
             orbital.energy() * PhysConst::Hartree_eV);

  auto result = compute(settings);
  const auto &spec = result.spec;

  fmt::print("\nMode: {}\n", Slice::mode_name(settings.mode));
  if (Slice::is_planar(settings.mode)) {
    fmt::print("Plane: {} = {}{}\n", Slice::plane_name(spec.plane), spec.value,
               settings.slice.plane ? "" : " (auto)");
  }
  if (settings.mode != Slice::FieldMode::spherical_harmonic) {
    fmt::print("Range: [{:.4f}, {:.4f}] a0 = [{:.4f}, {:.4f}] nm{}\n",
               spec.range.min, spec.range.max,
               spec.range.min * PhysConst::aB_nm,
               spec.range.max * PhysConst::aB_nm,
               settings.slice.range ? "" : " (auto)");
  }
  fmt::print("Grid: {} points per axis\n", spec.resolution);
  fmt::print("Colour: scale={}, cmap={}, |value| max = {:.6e}\n",
             Render::scale_name(settings.scale), result.mapping.colourmap,
             result.mapping.vmax);
  if (settings.line_mode)
    fmt::print("Contour lines: {}\n", result.contours.size());

  const auto colourmap = Render::Colourmap::named(settings.colourmap);
  const auto policy = Render::colour_policy(settings.mode, settings.scale);
  const Plot::PlotRequest request{result.field,    result.mapping,
                                  colourmap,       policy,
                                  result.contours, result.output,
                                  result.title,    settings.line_mode,
                                  settings.nodal_lines, settings.colorbar};
  const auto files = Plot::write_gnuplot(request);
  fmt::print("\nWrote data to: {}\nWrote gnuplot script to: {}\n", files.data,
             files.script);

  if (settings.render) {
    if (Plot::run_gnuplot(files)) {
      fmt::print("Saved plot to: {}\n", result.output);
    } else {
      fmt2::warning(fmt::format(
          "gnuplot failed (or is not installed); {} was not produced. Data "
          "and script were kept: run `gnuplot {}` to render.",
          result.output, files.script));
    }
  } else {
    fmt::print("Render with: gnuplot {}\n", files.script);
  }

  return result;
}

} // namespace horbital
