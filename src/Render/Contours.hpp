#pragma once
#include "Render/ColourScale.hpp"
#include "Render/Colourmap.hpp"
#include "Slice/Field.hpp"
#include <vector>

namespace Render {

enum class LineStyle { solid, dashed };

//! One iso-value line, in raw field units
struct ContourLevel {
  double level;
  LineStyle style;
  RGB colour;
};

//! Ordered (ascending in level) set of contour lines
using ContourSpec = std::vector<ContourLevel>;

//! Contour levels for line-mode rendering.
/*!
@details
 - Signed fields: num_levels/2 negative (dashed) and num_levels/2 positive
   (solid) levels, symmetric about zero. Evenly spaced from 0.12 max|v| to
   max|v|, or geometrically from linthresh to max|v| for symlog. Negative
   lines take the colour at policy.negative_line_position, positive ones at
   policy.positive_line_position.
 - Non-negative fields: num_levels solid levels, evenly spaced from
   0.12 vmax to vmax (geometric from the log floor for log scale).
Zero is never a level; an all-zero field has no levels.
Throws horbital::InvalidOptionError if num_levels < 2.
*/
ContourSpec contour_levels(const Slice::Field &field,
                           const ColourMapping &mapping,
                           const Colourmap &colourmap,
                           const ColourPolicy &policy, int num_levels = 8);

//! The zero contour overlaid on signed fields ('nodal lines'): gray, solid
ContourLevel nodal_line();

//! line_mode and nodal_lines are mutually exclusive: throws
//! horbital::ConflictingOptionError if both are set
void check_line_options(bool line_mode, bool nodal_lines);

} // namespace Render
