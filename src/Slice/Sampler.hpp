#pragma once
#include "Field.hpp"
#include "Render/Scale.hpp"
#include "SliceSpec.hpp"
#include <array>
#include <string>

namespace Orbital {
class Hydrogen;
}

namespace Slice {

//! Samples the orbital on the grid described by spec, for the given mode.
/*!
@details
Validates spec (throws horbital::InvalidSliceSpecError) before any
evaluation. Planar modes: resolution x resolution points, uniform over range
on both free axes, fixed axis = spec.value. radial_distribution:
resolution points in r over range. spherical_harmonic: theta in [0,pi] (rows)
and phi in [-pi,pi] (columns); range/plane unused.
Deterministic: each point is evaluated independently (in parallel if built
with OpenMP), so the result does not depend on the number of threads.
'scale' is only recorded in the Field's metadata.
*/
Field sample(const Orbital::Hydrogen &orbital, const SliceSpec &spec,
             FieldMode mode, Render::Scale scale = Render::Scale::linear);

//! Cartesian point (x,y,z) for grid coordinates (u,v) on the given plane
std::array<double, 3> plane_point(Plane plane, double value, double u,
                                  double v);

//! Axis labels (u, v) for a plane/mode, e.g. {"X", "Y"} for plane z
std::array<std::string, 2> axis_labels(FieldMode mode, Plane plane);

} // namespace Slice
