#pragma once
#include "IO/InputBlock.hpp"
#include "Orbital/QuantumNumbers.hpp"
#include "Plot/Gnuplot.hpp"
#include "Render/ColourScale.hpp"
#include "Render/Contours.hpp"
#include "Render/Scale.hpp"
#include "Slice/AutoSelect.hpp"
#include "Slice/Field.hpp"
#include "Slice/SliceSpec.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace horbital {

//! Minimum grid points per axis for a run
constexpr int min_points = 25;

//! Every run option, parsed and checked. No orbital has been evaluated yet.
struct Settings {
  Orbital::QuantumNumbers qn;
  Slice::FieldMode mode;
  Slice::SliceRequest slice;
  Render::Scale scale;
  std::string colourmap;
  bool line_mode;
  bool nodal_lines;
  bool colorbar;
  Render::MappingOptions mapping;
  int levels;
  //! Explicit output path (else generated from the resolved slice)
  std::optional<std::string> output;
  Plot::Format format;
  bool render;
};

//! Reads and validates all options from input (see input_options()).
/*!
@details
Throws (before any evaluation):
 - InvalidQuantumNumberError: n missing, or n/l/m out of domain
 - InvalidOptionError: unknown mode/plane/scale/colourmap/format names,
   unparsable numbers, range not given as 'min, max', levels < 2,
   linthresh not in (0, 1]
 - InvalidSliceSpecError: points < 25
 - UnsupportedScaleError: log scale for a signed mode, symlog + line_mode for
   a density mode
 - ConflictingOptionError: line_mode with nodal_lines; output extension
   different from an explicit format
Slice options that do not apply to the mode (or a bad range) are rejected by
compute(), also before any evaluation.
*/
Settings read_settings(const IO::InputBlock &input);

//! Everything produced by a run
struct RunResult {
  Slice::SliceSpec spec;
  Slice::Field field;
  Render::ColourMapping mapping;
  Render::ContourSpec contours;
  std::string output;
  std::string title;
};

//! Resolves the slice, samples, and maps colours (no file I/O)
RunResult compute(const Settings &settings);

//! Plot title, e.g.
//! "Hydrogen Orbital n=2, l=1, m=0 | mode=real | slice=z-plane"
std::string plot_title(const Orbital::QuantumNumbers &qn, Slice::FieldMode mode,
                       Slice::Plane plane, Render::Scale scale);

//! Runs the full program: reads settings, computes, writes gnuplot files, and
//! (optionally) renders them. Prints progress to screen
RunResult run(const IO::InputBlock &input);

//! Top-level blocks, and the options in each block: {name, description}
const std::vector<std::pair<std::string, std::string>> &input_blocks();
const std::vector<std::pair<std::string, std::string>> &
input_options(std::string_view block);

//! Prints available blocks (and the options for each block in 'blocks')
void print_input_options(const std::vector<std::string> &blocks);

} // namespace horbital
