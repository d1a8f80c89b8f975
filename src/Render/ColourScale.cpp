#include "ColourScale.hpp"
#include "horbital/Errors.hpp"
#include "qip/Maths.hpp"
#include "qip/Vector.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <utility>

namespace Render {

//==============================================================================
bool is_signed(Slice::FieldMode mode) {
  using Slice::FieldMode;
  switch (mode) {
  case FieldMode::real:
  case FieldMode::imag:
  case FieldMode::real_imag:
  case FieldMode::spherical_harmonic:
    return true;
  case FieldMode::density:
  case FieldMode::radial_distribution:
    return false;
  }
  return false;
}

Scale resolve_scale(Slice::FieldMode mode, ScaleRequest request) {
  switch (request) {
  case ScaleRequest::linear:
    return Scale::linear;
  case ScaleRequest::log:
    return Scale::log;
  case ScaleRequest::symlog:
    return Scale::symlog;
  case ScaleRequest::automatic:
    return is_signed(mode) ? Scale::symlog : Scale::log;
  }
  return Scale::linear;
}

ColourPolicy colour_policy(Slice::FieldMode mode, Scale) {
  if (is_signed(mode))
    return {true, 0.0, 1.0, 0.0, 1.0};
  return {false, 0.5, 1.0, 0.5, 1.0};
}

void check_scale(Slice::FieldMode mode, Scale scale, bool line_mode) {
  if (scale == Scale::log && is_signed(mode)) {
    throw horbital::UnsupportedScaleError(fmt::format(
        "Log scale is not supported for signed mode {}; use linear or symlog",
        Slice::mode_name(mode)));
  }
  if (scale == Scale::symlog && line_mode && Slice::is_density_family(mode)) {
    throw horbital::UnsupportedScaleError(fmt::format(
        "Symlog scale with line mode is not supported for mode {}; use "
        "linear or log",
        Slice::mode_name(mode)));
  }
}

//==============================================================================
double symlog_transform(double x, double linthresh) {
  constexpr double base = 10.0;
  constexpr double linscale = 1.0;
  const auto linscale_adj = linscale / (1.0 - 1.0 / base);
  const auto ax = std::abs(x);
  if (ax <= linthresh)
    return x * linscale_adj;
  return qip::sign(x) * linthresh *
         (linscale_adj + std::log10(ax / linthresh));
}

double colourmap_position(const ColourPolicy &policy, double intensity) {
  if (policy.signed_field)
    return qip::clamp(0.5 + 0.5 * intensity, 0.0, 1.0);
  const auto t = qip::clamp(intensity, 0.0, 1.0);
  return policy.colourmap_from +
         (policy.colourmap_to - policy.colourmap_from) * t;
}

//==============================================================================
ColourMapping map_colours(const Slice::Field &field,
                          const Colourmap &colourmap, Scale scale,
                          const MappingOptions &options) {
  ColourMapping mapping;
  mapping.colourmap = colourmap.name();
  mapping.scale = scale;
  mapping.signed_field = is_signed(field.mode);
  mapping.intensities.reserve(field.panels.size());

  // Shared global limit over all panels
  double vmax = 0.0;
  double min_positive = 0.0;
  for (const auto &panel : field.panels) {
    vmax = std::max(vmax, qip::max_abs(panel.values));
    const auto mp = qip::min_positive(panel.values);
    if (mp > 0.0 && (min_positive == 0.0 || mp < min_positive))
      min_positive = mp;
  }

  const auto all_zero = !(vmax > 0.0);
  // Limit used for normalisation; 1.0 avoids division by zero
  const auto limit = all_zero ? 1.0 : vmax;
  mapping.vmax = limit;
  mapping.vmin = mapping.signed_field ? -limit : 0.0;
  mapping.linthresh = std::max(options.linthresh_fraction * limit, 1.0e-16);

  if (scale == Scale::log)
    mapping.vmin = std::max(min_positive, limit * 1.0e-7);

  const auto log_vmin = std::log10(mapping.vmin > 0.0 ? mapping.vmin : 1.0);
  const auto log_span = std::log10(limit) - log_vmin;
  const auto symlog_max = symlog_transform(limit, mapping.linthresh);

  const auto intensity = [&](double v) -> double {
    if (all_zero)
      return 0.0;
    switch (scale) {
    case Scale::linear:
      return v / limit;
    case Scale::log: {
      const auto clamped = qip::clamp(v, mapping.vmin, limit);
      return log_span > 0.0 ? (std::log10(clamped) - log_vmin) / log_span :
                              1.0;
    }
    case Scale::symlog:
      return symlog_transform(v, mapping.linthresh) / symlog_max;
    }
    return v / limit;
  };

  for (const auto &panel : field.panels) {
    std::vector<double> out;
    out.reserve(panel.values.size());
    for (const auto v : panel.values) {
      const auto x = intensity(v);
      out.push_back(mapping.signed_field ? qip::clamp(x, -1.0, 1.0) :
                                           qip::clamp(x, 0.0, 1.0));
    }
    mapping.intensities.push_back(std::move(out));
  }
  return mapping;
}

} // namespace Render
