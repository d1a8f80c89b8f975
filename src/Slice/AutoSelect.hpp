#pragma once
#include "SliceSpec.hpp"
#include <optional>
#include <string_view>

namespace Orbital {
class QuantumNumbers;
}

namespace Slice {

//! Probability of finding the electron within radius r:
//! P(r) = Int_0^r r'^2 R_nl(r')^2 dr'. Adaptive GSL integration (qag).
//! Throws horbital::NumericalError if the integration fails
double cumulative_radial_probability(int n, int l, double r);

//! Suggested plot half-width (units a0) for the orbital and mode.
/*!
@details
 - density family (and spherical_harmonic): 1.15 x the radius enclosing
   'coverage' of the radial probability (coverage clamped to [0.95,0.999]),
   clamped to [4, max(10, 8n)].
 - signed modes: 1.25 x the last radius where |R_nl| is above 2e-3 of its
   peak, and at least 1.8 x the outermost radial node; clamped to
   [4, max(10, (6+2l)n)].
Pure function of (n, l, m, mode). Density-family extent is non-decreasing
in n (for fixed l).
*/
double auto_extent(const Orbital::QuantumNumbers &qn, FieldMode mode,
                   double coverage = 0.99);

//! Default range: [-e, e] (or [0, e] for radial_distribution), e =
//! auto_extent
Range auto_range(const Orbital::QuantumNumbers &qn, FieldMode mode);

//! Picks the central plane (x=0, y=0, or z=0) that shows the most structure.
/*!
@details
Each of z, x, y (in that order) is sampled on a coarse 121x121 grid over
[-extent, extent], and scored by: 99.5th percentile of |f| + standard
deviation of f (f = hypot(Re,Im) for real_imag). A later plane must score
strictly higher to be chosen, so ties keep z. Returns Plane::none for
plane-independent modes.
*/
Plane auto_plane(const Orbital::QuantumNumbers &qn, FieldMode mode,
                 double extent);

//==============================================================================
//! User's (partial) slice request. Empty = choose automatically
struct SliceRequest {
  std::optional<Plane> plane{};
  std::optional<double> value{};
  std::optional<Range> range{};
  int resolution{401};
};

//! "auto" -> empty; otherwise parse_plane() (throws
//! horbital::InvalidOptionError)
std::optional<Plane> parse_plane_request(std::string_view name);

//! Fills in everything not given in request, and validates.
/*!
@details
Validation happens before any field evaluation. Throws
horbital::InvalidSliceSpecError for a malformed request, including an explicit
plane or value for a plane-independent mode, or an explicit range for
spherical_harmonic (these would otherwise be silently ignored).
*/
SliceSpec resolve(const Orbital::QuantumNumbers &qn, FieldMode mode,
                  const SliceRequest &request);

} // namespace Slice
