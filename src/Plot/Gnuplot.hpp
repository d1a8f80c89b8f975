#pragma once
#include "Render/ColourScale.hpp"
#include "Render/Colourmap.hpp"
#include "Render/Contours.hpp"
#include "Slice/Field.hpp"
#include <string>
#include <string_view>

//! @brief Exports a mapped Field as gnuplot data + script. The only part of
//! horbital that writes files.
namespace Plot {

//! Image formats gnuplot can render to
enum class Format { png, svg, pdf };

std::string_view format_extension(Format format);
//! "png", "svg", "pdf" (case insensitive). Throws horbital::InvalidOptionError
Format parse_format(std::string_view name);
//! Format implied by the file extension of path. Throws
//! horbital::InvalidOptionError if there is no recognised extension
Format format_from_path(std::string_view path);

//! Everything the exporter needs; borrowed (must outlive the call)
struct PlotRequest {
  const Slice::Field &field;
  const Render::ColourMapping &mapping;
  const Render::Colourmap &colourmap;
  const Render::ColourPolicy &policy;
  //! Levels drawn in line mode (ignored otherwise)
  const Render::ContourSpec &contours;
  //! Image the script renders to; extension sets the gnuplot terminal
  std::string output;
  std::string title;
  bool line_mode{false};
  bool nodal_lines{false};
  bool colorbar{false};
};

//! Names of the files written by write_gnuplot
struct PlotFiles {
  std::string data;
  std::string script;
};

//! Output path without its extension, e.g. "dir/orbital" for "dir/orbital.png"
std::string output_stem(std::string_view output);

//! Text of the gnuplot data file: one block per panel (separated by two blank
//! lines, so panel i is 'index i'), rows separated by a blank line. Columns:
//! u v intensity raw
std::string gnuplot_data(const Slice::Field &field,
                         const Render::ColourMapping &mapping);

//! Text of the gnuplot script that reads 'data_file'
std::string gnuplot_script(const PlotRequest &request,
                           std::string_view data_file);

//! Writes <stem>.dat and <stem>.gp. Throws horbital::Error if a file cannot
//! be written
PlotFiles write_gnuplot(const PlotRequest &request);

//! Runs gnuplot on the script. Returns false (does not throw) if gnuplot is
//! missing or fails
bool run_gnuplot(const PlotFiles &files);

} // namespace Plot
