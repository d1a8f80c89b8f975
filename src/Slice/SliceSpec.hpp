#pragma once
#include <string>
#include <string_view>
#include <vector>

//! @brief Turning the 3D orbital into a concrete 2D (or 1D) grid of samples:
//! slice description, sampling, and automatic choice of plane and range.
namespace Slice {

//! What is evaluated at each grid point
enum class FieldMode {
  density,             //!< |psi|^2 on a plane
  real,                //!< Re(psi) on a plane
  imag,                //!< Im(psi) on a plane
  real_imag,           //!< Re(psi) and Im(psi) panels, on a plane
  radial_distribution, //!< r^2 R_nl^2, 1D in r
  spherical_harmonic   //!< Re(Y_lm) and Im(Y_lm) on (theta, phi)
};

//! Constant-coordinate plane; 'none' for the plane-independent modes
enum class Plane { x, y, z, none };

//! All modes, in the order they are listed to the user
const std::vector<FieldMode> &all_modes();

std::string_view mode_name(FieldMode mode);
//! Throws horbital::InvalidOptionError for unknown names
FieldMode parse_mode(std::string_view name);

std::string_view plane_name(Plane plane);
//! Parses "x", "y", "z" (not 'auto'). Throws horbital::InvalidOptionError
Plane parse_plane(std::string_view name);

//! True for modes sampled on a cartesian plane (density, real, imag,
//! real_imag)
bool is_planar(FieldMode mode);
//! density and radial_distribution: non-negative fields
bool is_density_family(FieldMode mode);
//! real_imag and spherical_harmonic give two panels
int num_panels(FieldMode mode);

//! Closed interval [min, max], in units of a0
struct Range {
  double min, max;
  double width() const { return max - min; }
};

//! A concrete, validated, slice: plane = value, range on each free axis, and
//! resolution points per axis.
struct SliceSpec {
  Plane plane{Plane::z};
  double value{0.0};
  Range range{-10.0, 10.0};
  int resolution{401};

  //! Throws horbital::InvalidSliceSpecError if: range not finite or
  //! min >= max; resolution < 2; value not finite; plane is 'none' for a
  //! planar mode (or not 'none' for a plane-independent one); range.min < 0
  //! for radial_distribution.
  void validate(FieldMode mode) const;
};

} // namespace Slice
