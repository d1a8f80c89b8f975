#include "OutputName.hpp"
#include "qip/String.hpp"
#include <cmath>
#include <fmt/format.h>

namespace Render {

std::string plane_token(Slice::FieldMode mode, Slice::Plane plane) {
  if (mode == Slice::FieldMode::radial_distribution)
    return "r";
  if (mode == Slice::FieldMode::spherical_harmonic)
    return "angles";
  return std::string(Slice::plane_name(plane));
}

std::string value_token(double value) {
  // Integral values keep one decimal (0 -> 0.0); otherwise shortest form
  const auto str = std::isfinite(value) && std::trunc(value) == value ?
                       fmt::format("{:.1f}", value) :
                       fmt::format("{}", value);
  return qip::replace(qip::replace(str, '-', 'm'), '.', 'p');
}

std::string default_output_name(const Orbital::QuantumNumbers &qn,
                                Slice::FieldMode mode,
                                std::string_view plane_token, double value,
                                std::string_view ext) {
  return fmt::format("orbital_n{}_l{}_m{}_{}_{}{}.{}", qn.n(), qn.l(), qn.m(),
                     Slice::mode_name(mode), plane_token, value_token(value),
                     ext);
}

} // namespace Render
