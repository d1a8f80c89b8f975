#include "Contours.hpp"
#include "horbital/Errors.hpp"
#include "qip/Vector.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace Render {

namespace {

// count levels in [lower, upper], geometric or linear. A single level sits at
// 'upper'
std::vector<double> spaced_levels(double lower, double upper, int count,
                                  bool geometric) {
  if (count == 1 || !(lower < upper))
    return {upper};
  if (geometric && lower > 0.0)
    return qip::logarithmic_range(lower, upper, count);
  return qip::uniform_range(lower, upper, count);
}

} // namespace

//==============================================================================
ContourSpec contour_levels(const Slice::Field &field,
                           const ColourMapping &mapping,
                           const Colourmap &colourmap,
                           const ColourPolicy &policy, int num_levels) {
  if (num_levels < 2) {
    throw horbital::InvalidOptionError(
        fmt::format("Number of contour levels must be at least 2 (got {})",
                    num_levels));
  }

  double max_abs = 0.0;
  for (const auto &panel : field.panels)
    max_abs = std::max(max_abs, qip::max_abs(panel.values));
  if (!(max_abs > 0.0))
    return {};

  const auto positive_colour = colourmap.at(policy.positive_line_position);

  ContourSpec spec;
  if (policy.signed_field) {
    const auto negative_colour = colourmap.at(policy.negative_line_position);
    const auto per_sign = num_levels / 2;
    const auto geometric = mapping.scale == Scale::symlog;
    const auto lower = geometric ? mapping.linthresh : 0.12 * max_abs;
    const auto levels = spaced_levels(lower, max_abs, per_sign, geometric);
    for (auto it = levels.crbegin(); it != levels.crend(); ++it)
      spec.push_back({-*it, LineStyle::dashed, negative_colour});
    for (const auto level : levels)
      spec.push_back({level, LineStyle::solid, positive_colour});
    return spec;
  }

  const auto geometric = mapping.scale == Scale::log;
  const auto lower = geometric ? mapping.vmin : 0.12 * max_abs;
  for (const auto level : spaced_levels(lower, max_abs, num_levels, geometric))
    spec.push_back({level, LineStyle::solid, positive_colour});
  return spec;
}

ContourLevel nodal_line() {
  return {0.0, LineStyle::solid, RGB::from_hex("#a8a8a8")};
}

void check_line_options(bool line_mode, bool nodal_lines) {
  if (line_mode && nodal_lines) {
    throw horbital::ConflictingOptionError(
        "line_mode and nodal_lines cannot be used together");
  }
}

} // namespace Render
