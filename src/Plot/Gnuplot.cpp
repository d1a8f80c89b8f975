#include "Gnuplot.hpp"
#include "horbital/Errors.hpp"
#include "qip/String.hpp"
#include <cstdlib>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fstream>
#include <string>
#include <vector>

namespace Plot {

//==============================================================================
std::string_view format_extension(Format format) {
  switch (format) {
  case Format::png:
    return "png";
  case Format::svg:
    return "svg";
  case Format::pdf:
    return "pdf";
  }
  return "png";
}

Format parse_format(std::string_view name) {
  for (const auto format : {Format::png, Format::svg, Format::pdf}) {
    if (qip::ci_compare(name, format_extension(format)))
      return format;
  }
  throw horbital::InvalidOptionError(fmt::format(
      "Unknown output format '{}'; expected one of: png, svg, pdf", name));
}

Format format_from_path(std::string_view path) {
  const auto slash = path.find_last_of('/');
  const auto dot = path.find_last_of('.');
  if (dot == std::string_view::npos ||
      (slash != std::string_view::npos && dot < slash)) {
    throw horbital::InvalidOptionError(fmt::format(
        "Output '{}' has no file extension (png, svg, or pdf)", path));
  }
  return parse_format(path.substr(dot + 1));
}

std::string output_stem(std::string_view output) {
  const auto slash = output.find_last_of('/');
  const auto dot = output.find_last_of('.');
  if (dot == std::string_view::npos ||
      (slash != std::string_view::npos && dot < slash))
    return std::string(output);
  return std::string(output.substr(0, dot));
}

//==============================================================================
namespace {

// gnuplot single-quoted string: ' is written as ''
std::string quoted(std::string_view s) {
  std::string out{"'"};
  for (const auto c : s) {
    out += c;
    if (c == '\'')
      out += '\'';
  }
  return out + "'";
}

// gnuplot double-quoted string
std::string dquoted(std::string_view s) {
  std::string out{"\""};
  for (const auto c : s) {
    if (c == '"' || c == '\\')
      out += '\\';
    out += c;
  }
  return out + "\"";
}

std::string terminal(Format format, bool two_panels) {
  switch (format) {
  case Format::png:
    return two_panels ? "pngcairo size 2000,900 font 'Sans,12'" :
                        "pngcairo size 1100,1000 font 'Sans,12'";
  case Format::svg:
    return two_panels ? "svg size 2000,900 font 'Sans,12'" :
                        "svg size 1100,1000 font 'Sans,12'";
  case Format::pdf:
    return two_panels ? "pdfcairo size 14in,6.3in font 'Sans,12'" :
                        "pdfcairo size 7.7in,7in font 'Sans,12'";
  }
  return "pngcairo";
}

// Palette over the colourmap interval used by the policy. Positions are in
// intensity units ([-1,1] signed, [0,1] otherwise)
std::string palette(const Render::Colourmap &colourmap,
                    const Render::ColourPolicy &policy) {
  constexpr int num_samples = 17;
  std::string out = "set palette defined (";
  for (int i = 0; i < num_samples; ++i) {
    const auto t = double(i) / double(num_samples - 1);
    const auto intensity = policy.signed_field ? 2.0 * t - 1.0 : t;
    const auto colour = colourmap.at(
        Render::colourmap_position(policy, intensity));
    out += fmt::format("{}{:.4f} '{}'", i == 0 ? "" : ", ", intensity,
                       colour.hex());
  }
  return out + ")\n";
}

// Line styles for each level (ascending), and the levels themselves. A field
// with no levels (all zero) draws nothing
std::string contour_linetypes(const Render::ContourSpec &contours) {
  if (contours.empty())
    return "unset contour\n";
  std::string out;
  std::vector<std::string> levels;
  for (std::size_t i = 0; i < contours.size(); ++i) {
    const auto &c = contours[i];
    const auto dash = c.style == Render::LineStyle::dashed ? 2 : 1;
    out += fmt::format("set linetype {} lc rgb '{}' lw 1.5 dt {}\n", i + 1,
                       c.colour.hex(), dash);
    levels.push_back(fmt::format("{:.8e}", c.level));
  }
  out += fmt::format("set cntrparam levels discrete {}\n",
                     qip::concat(levels, ","));
  return out;
}

} // namespace

//==============================================================================
std::string gnuplot_data(const Slice::Field &field,
                         const Render::ColourMapping &mapping) {
  std::string out = fmt::format(
      "# horbital data: mode={}, scale={}\n# columns: {} {} intensity raw\n",
      Slice::mode_name(field.mode), Render::scale_name(mapping.scale),
      field.u_label, field.v.empty() ? "-" : field.v_label);

  for (std::size_t ip = 0; ip < field.panels.size(); ++ip) {
    const auto &intensity = mapping.intensities.at(ip);
    out += fmt::format("# panel {}: {}\n", ip, field.panels[ip].title);
    for (std::size_t row = 0; row < field.rows(); ++row) {
      const auto v = field.v.empty() ? 0.0 : field.v.at(row);
      for (std::size_t col = 0; col < field.cols(); ++col) {
        const auto i = row * field.cols() + col;
        out += fmt::format("{:+.8e} {:+.8e} {:+.8e} {:+.10e}\n", field.u[col],
                           v, intensity.at(i), field.at(ip, row, col));
      }
      out += '\n';
    }
    out += "\n";
  }
  return out;
}

//==============================================================================
std::string gnuplot_script(const PlotRequest &request,
                           std::string_view data_file) {
  const auto &field = request.field;
  const auto format = format_from_path(request.output);
  const auto two_panels = field.panels.size() > 1;

  std::string gp = "# horbital gnuplot script\n";
  gp += fmt::format("set terminal {}\n", terminal(format, two_panels));
  gp += fmt::format("set output {}\n", quoted(request.output));
  gp += "unset key\n";

  // Radial distribution: a simple line plot
  if (field.mode == Slice::FieldMode::radial_distribution) {
    gp += fmt::format("set title {} noenhanced\n", dquoted(request.title));
    gp += fmt::format("set xlabel {} noenhanced\n", dquoted(field.u_label));
    gp += fmt::format("set ylabel {} noenhanced\n", dquoted(field.v_label));
    gp += fmt::format("set xrange [{}:{}]\n", field.u.front(), field.u.back());
    gp += "set yrange [0:*]\nset grid\n";
    gp += fmt::format(
        "plot {} index 0 using 1:4 with lines lw 2 lc rgb '#1f4e79'\n",
        quoted(data_file));
    return gp;
  }

  gp += "set view map\n";
  if (Slice::is_planar(field.mode))
    gp += "set size ratio -1\n";
  gp += fmt::format("set xrange [{}:{}]\n", field.u.front(), field.u.back());
  gp += fmt::format("set yrange [{}:{}]\n", field.v.front(), field.v.back());
  gp += fmt::format("set xlabel {} noenhanced\n", dquoted(field.u_label));
  gp += fmt::format("set ylabel {} noenhanced\n", dquoted(field.v_label));

  if (request.line_mode) {
    gp += "unset colorbox\nset contour base\n";
    gp += contour_linetypes(request.contours);
  } else {
    gp += "set pm3d at b\n";
    gp += palette(request.colourmap, request.policy);
    gp += request.policy.signed_field ? "set cbrange [-1:1]\n" :
                                        "set cbrange [0:1]\n";
    gp += request.colorbar ? "set colorbox\n" : "unset colorbox\n";
    if (request.nodal_lines && request.policy.signed_field) {
      gp += fmt::format("set contour base\nset cntrparam levels discrete 0\n"
                        "set linetype 1 lc rgb '{}' lw 1.2 dt 1\n",
                        Render::nodal_line().colour.hex());
    }
  }

  if (two_panels) {
    gp += fmt::format("set multiplot layout 1,{} title {} noenhanced\n",
                      field.panels.size(), dquoted(request.title));
  } else {
    gp += fmt::format("set title {} noenhanced\n", dquoted(request.title));
  }

  for (std::size_t ip = 0; ip < field.panels.size(); ++ip) {
    if (two_panels) {
      gp += fmt::format("set title {} noenhanced\n",
                        dquoted(field.panels[ip].title));
    }
    const auto data = fmt::format("{} index {}", quoted(data_file), ip);
    if (request.line_mode) {
      gp += fmt::format("splot {} using 1:2:4 with lines lt 1 nosurface\n",
                        data);
    } else if (request.nodal_lines && request.policy.signed_field) {
      gp += fmt::format("splot {0} using 1:2:3 with pm3d nocontours, "
                        "{0} using 1:2:4 with lines lt 1 nosurface\n",
                        data);
    } else {
      gp += fmt::format("splot {} using 1:2:3 with pm3d\n", data);
    }
  }

  if (two_panels)
    gp += "unset multiplot\n";
  return gp;
}

//==============================================================================
PlotFiles write_gnuplot(const PlotRequest &request) {
  const auto stem = output_stem(request.output);
  PlotFiles files{stem + ".dat", stem + ".gp"};

  // Check the output format before writing anything
  const auto script = gnuplot_script(request, files.data);

  std::ofstream data_file(files.data);
  if (!data_file) {
    throw horbital::Error(fmt::format("Could not write {}", files.data));
  }
  fmt::print(data_file, "{}", gnuplot_data(request.field, request.mapping));

  std::ofstream script_file(files.script);
  if (!script_file) {
    throw horbital::Error(fmt::format("Could not write {}", files.script));
  }
  fmt::print(script_file, "{}", script);
  return files;
}

bool run_gnuplot(const PlotFiles &files) {
  // Single-quote for the shell: ' -> '\''
  std::string path;
  for (const auto c : files.script) {
    if (c == '\'')
      path += "'\\''";
    else
      path += c;
  }
  const auto command = fmt::format("gnuplot '{}'", path);
  return std::system(command.c_str()) == 0;
}

} // namespace Plot
