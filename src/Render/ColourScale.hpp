#pragma once
#include "Render/Colourmap.hpp"
#include "Render/Scale.hpp"
#include "Slice/Field.hpp"
#include "Slice/SliceSpec.hpp"
#include <string>
#include <vector>

namespace Render {

//! True for modes whose values take both signs (real, imag, real_imag,
//! spherical_harmonic)
bool is_signed(Slice::FieldMode mode);

//! 'automatic' -> log for the density family, symlog for signed modes
Scale resolve_scale(Slice::FieldMode mode, ScaleRequest request);

//! Which part of the colourmap a mode uses, and where the contour-line
//! colours are sampled from
struct ColourPolicy {
  bool signed_field;
  double colourmap_from;
  double colourmap_to;
  double negative_line_position;
  double positive_line_position;
};

//! Density family: positive half [0.5, 1] of the map. Signed: full [0, 1],
//! zero at 0.5.
ColourPolicy colour_policy(Slice::FieldMode mode, Scale scale);

//! Throws horbital::UnsupportedScaleError for log on a signed mode, or for
//! symlog with line_mode on a density-family mode
void check_scale(Slice::FieldMode mode, Scale scale, bool line_mode);

//==============================================================================
struct MappingOptions {
  //! symlog: linear threshold, as a fraction of max|v|
  double linthresh_fraction{1.0e-3};
};

//! Normalised colour intensities for every panel of a Field.
/*!
@details
Intensities are in [0,1] for non-negative fields and [-1,1] for signed
ones. All panels share one global limit (vmax), so two-panel modes are
directly comparable. For log scale, vmin is the floor below which values are
clamped; for the others it is -vmax (signed) or 0.
*/
struct ColourMapping {
  std::string colourmap;
  Scale scale;
  bool signed_field;
  double vmin;
  double vmax;
  double linthresh;
  std::vector<std::vector<double>> intensities;
};

//! Maps raw field values to intensities (see ColourMapping). All-zero fields
//! map to 0 everywhere. Does not validate scale/mode pairing (check_scale)
ColourMapping map_colours(const Slice::Field &field,
                          const Colourmap &colourmap, Scale scale,
                          const MappingOptions &options = {});

//! Symmetric-log transform (linscale = 1, base 10): linear inside
//! |x| <= linthresh, logarithmic beyond, continuous and odd
double symlog_transform(double x, double linthresh);

//! Position [0,1] on the colourmap for an intensity
double colourmap_position(const ColourPolicy &policy, double intensity);

} // namespace Render
