#pragma once
#include "Render/Scale.hpp"
#include "SliceSpec.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace Slice {

//! One sampled quantity (e.g., Re(psi)), row-major: values[row * cols + col]
struct Panel {
  std::string title;
  std::vector<double> values;
};

//==============================================================================
//! Sampled field: one or two panels on a shared grid, plus the metadata
//! describing how it was produced. Read-only once produced.
/*!
@details
 - Planar modes: u is the first free axis (columns), v the second (rows).
   Plane x: (u,v) = (y,z); plane y: (u,v) = (x,z); plane z: (u,v) = (x,y).
 - radial_distribution: u = r, v is empty (a single row).
 - spherical_harmonic: u = phi/pi in [-1,1], v = theta/pi in [0,1].
*/
struct Field {
  FieldMode mode{FieldMode::density};
  Plane plane{Plane::z};
  double value{0.0};
  Range range{-10.0, 10.0};
  Render::Scale scale{Render::Scale::linear};

  std::vector<double> u{};
  std::vector<double> v{};
  std::string u_label{};
  std::string v_label{};
  std::vector<Panel> panels{};

  std::size_t cols() const { return u.size(); }
  std::size_t rows() const { return std::max(v.size(), std::size_t{1}); }

  double at(std::size_t panel, std::size_t row, std::size_t col) const {
    return panels.at(panel).values.at(row * cols() + col);
  }

  friend bool operator==(const Field &a, const Field &b) {
    const auto same_panels = std::equal(
        a.panels.cbegin(), a.panels.cend(), b.panels.cbegin(),
        b.panels.cend(), [](const Panel &pa, const Panel &pb) {
          return pa.title == pb.title && pa.values == pb.values;
        });
    return a.mode == b.mode && a.plane == b.plane && a.value == b.value &&
           a.range.min == b.range.min && a.range.max == b.range.max &&
           a.scale == b.scale && a.u == b.u && a.v == b.v &&
           a.u_label == b.u_label && a.v_label == b.v_label && same_panels;
  }
  friend bool operator!=(const Field &a, const Field &b) { return !(a == b); }
};

} // namespace Slice
