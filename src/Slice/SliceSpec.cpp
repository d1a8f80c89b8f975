#include "SliceSpec.hpp"
#include "horbital/Errors.hpp"
#include "qip/String.hpp"
#include <cmath>
#include <fmt/format.h>
#include <string>
#include <vector>

namespace Slice {

//==============================================================================
const std::vector<FieldMode> &all_modes() {
  static const std::vector<FieldMode> modes{
      FieldMode::density,
      FieldMode::real,
      FieldMode::imag,
      FieldMode::real_imag,
      FieldMode::radial_distribution,
      FieldMode::spherical_harmonic};
  return modes;
}

std::string_view mode_name(FieldMode mode) {
  switch (mode) {
  case FieldMode::density:
    return "density";
  case FieldMode::real:
    return "real";
  case FieldMode::imag:
    return "imag";
  case FieldMode::real_imag:
    return "real_imag";
  case FieldMode::radial_distribution:
    return "radial_distribution";
  case FieldMode::spherical_harmonic:
    return "spherical_harmonic";
  }
  return "unknown";
}

FieldMode parse_mode(std::string_view name) {
  std::vector<std::string> names;
  for (const auto mode : all_modes()) {
    if (qip::ci_compare(name, mode_name(mode)))
      return mode;
    names.emplace_back(mode_name(mode));
  }
  const auto closest = qip::ci_closest_match(name, names);
  throw horbital::InvalidOptionError(
      fmt::format("Unknown mode '{}' (did you mean '{}'?). Valid modes: {}",
                  name, *closest, qip::concat(names, ", ")));
}

//==============================================================================
std::string_view plane_name(Plane plane) {
  switch (plane) {
  case Plane::x:
    return "x";
  case Plane::y:
    return "y";
  case Plane::z:
    return "z";
  case Plane::none:
    return "none";
  }
  return "unknown";
}

Plane parse_plane(std::string_view name) {
  if (qip::ci_compare(name, "x"))
    return Plane::x;
  if (qip::ci_compare(name, "y"))
    return Plane::y;
  if (qip::ci_compare(name, "z"))
    return Plane::z;
  throw horbital::InvalidOptionError(
      fmt::format("Unknown plane '{}'; expected one of: x, y, z, auto", name));
}

//==============================================================================
bool is_planar(FieldMode mode) {
  switch (mode) {
  case FieldMode::density:
  case FieldMode::real:
  case FieldMode::imag:
  case FieldMode::real_imag:
    return true;
  case FieldMode::radial_distribution:
  case FieldMode::spherical_harmonic:
    return false;
  }
  return false;
}

bool is_density_family(FieldMode mode) {
  switch (mode) {
  case FieldMode::density:
  case FieldMode::radial_distribution:
    return true;
  case FieldMode::real:
  case FieldMode::imag:
  case FieldMode::real_imag:
  case FieldMode::spherical_harmonic:
    return false;
  }
  return false;
}

int num_panels(FieldMode mode) {
  switch (mode) {
  case FieldMode::real_imag:
  case FieldMode::spherical_harmonic:
    return 2;
  case FieldMode::density:
  case FieldMode::real:
  case FieldMode::imag:
  case FieldMode::radial_distribution:
    return 1;
  }
  return 1;
}

//==============================================================================
void SliceSpec::validate(FieldMode mode) const {
  const auto mode_str = mode_name(mode);
  if (!std::isfinite(range.min) || !std::isfinite(range.max)) {
    throw horbital::InvalidSliceSpecError(fmt::format(
        "Range must be finite (got [{}, {}])", range.min, range.max));
  }
  if (range.min >= range.max) {
    throw horbital::InvalidSliceSpecError(
        fmt::format("Range must satisfy min < max (got min={}, max={})",
                    range.min, range.max));
  }
  if (resolution < 2) {
    throw horbital::InvalidSliceSpecError(fmt::format(
        "Resolution must be at least 2 points (got {})", resolution));
  }
  if (!std::isfinite(value)) {
    throw horbital::InvalidSliceSpecError(
        fmt::format("Plane value must be finite (got {})", value));
  }
  if (is_planar(mode) && plane == Plane::none) {
    throw horbital::InvalidSliceSpecError(
        fmt::format("Mode {} requires a plane (x, y, or z)", mode_str));
  }
  if (!is_planar(mode) && plane != Plane::none) {
    throw horbital::InvalidSliceSpecError(
        fmt::format("Mode {} does not use a plane (got {}={})", mode_str,
                    plane_name(plane), value));
  }
  if (mode == FieldMode::radial_distribution && range.min < 0.0) {
    throw horbital::InvalidSliceSpecError(fmt::format(
        "Mode {} needs r >= 0 (got min={})", mode_str, range.min));
  }
}

} // namespace Slice
