#include "Sampler.hpp"
#include "Orbital/Hydrogen.hpp"
#include "qip/Vector.hpp"
#include "qip/omp.hpp"
#include <cmath>
#include <complex>
#include <exception>
#include <fmt/format.h>
#include <string>
#include <vector>

namespace Slice {

//==============================================================================
std::array<double, 3> plane_point(Plane plane, double value, double u,
                                  double v) {
  switch (plane) {
  case Plane::x:
    return {value, u, v};
  case Plane::y:
    return {u, value, v};
  case Plane::z:
    return {u, v, value};
  case Plane::none:
    break;
  }
  return {u, v, value};
}

std::array<std::string, 2> axis_labels(FieldMode mode, Plane plane) {
  switch (mode) {
  case FieldMode::radial_distribution:
    return {"r / a0", "P(r)"};
  case FieldMode::spherical_harmonic:
    return {"phi / pi", "theta / pi"};
  case FieldMode::density:
  case FieldMode::real:
  case FieldMode::imag:
  case FieldMode::real_imag:
    break;
  }
  switch (plane) {
  case Plane::x:
    return {"Y", "Z"};
  case Plane::y:
    return {"X", "Z"};
  case Plane::z:
  case Plane::none:
    break;
  }
  return {"X", "Y"};
}

//==============================================================================
namespace {

std::vector<Panel> empty_panels(FieldMode mode, const Orbital::Hydrogen &h,
                                std::size_t size) {
  const auto &qn = h.qn();
  switch (mode) {
  case FieldMode::density:
    return {{"|psi|^2", std::vector<double>(size)}};
  case FieldMode::real:
    return {{"Re(psi)", std::vector<double>(size)}};
  case FieldMode::imag:
    return {{"Im(psi)", std::vector<double>(size)}};
  case FieldMode::real_imag:
    return {{"Re(psi)", std::vector<double>(size)},
            {"Im(psi)", std::vector<double>(size)}};
  case FieldMode::radial_distribution:
    return {{fmt::format("r^2 |R_{}{}|^2", qn.n(), qn.l()),
             std::vector<double>(size)}};
  case FieldMode::spherical_harmonic:
    return {{fmt::format("Re(Y_{}^{})", qn.l(), qn.m()),
             std::vector<double>(size)},
            {fmt::format("Im(Y_{}^{})", qn.l(), qn.m()),
             std::vector<double>(size)}};
  }
  return {};
}

// Fill panel values at index i from psi (planar modes)
void store_planar(FieldMode mode, std::complex<double> psi,
                  std::vector<Panel> &panels, std::size_t i) {
  switch (mode) {
  case FieldMode::density:
    panels[0].values[i] = std::norm(psi);
    break;
  case FieldMode::real:
    panels[0].values[i] = psi.real();
    break;
  case FieldMode::imag:
    panels[0].values[i] = psi.imag();
    break;
  case FieldMode::real_imag:
    panels[0].values[i] = psi.real();
    panels[1].values[i] = psi.imag();
    break;
  case FieldMode::radial_distribution:
  case FieldMode::spherical_harmonic:
    break;
  }
}

} // namespace

//==============================================================================
Field sample(const Orbital::Hydrogen &orbital, const SliceSpec &spec,
             FieldMode mode, Render::Scale scale) {
  spec.validate(mode);

  Field field;
  field.mode = mode;
  field.plane = spec.plane;
  field.value = spec.value;
  field.range = spec.range;
  field.scale = scale;
  const auto [u_label, v_label] = axis_labels(mode, spec.plane);
  field.u_label = u_label;
  field.v_label = v_label;

  const auto N = std::size_t(spec.resolution);
  switch (mode) {
  case FieldMode::radial_distribution:
    field.u = qip::uniform_range(spec.range.min, spec.range.max, N);
    break;
  case FieldMode::spherical_harmonic:
    field.u = qip::uniform_range(-1.0, 1.0, N); // phi/pi
    field.v = qip::uniform_range(0.0, 1.0, N);  // theta/pi
    break;
  case FieldMode::density:
  case FieldMode::real:
  case FieldMode::imag:
  case FieldMode::real_imag:
    field.u = qip::uniform_range(spec.range.min, spec.range.max, N);
    field.v = field.u;
    break;
  }

  const auto rows = field.rows();
  const auto cols = field.cols();
  field.panels = empty_panels(mode, orbital, rows * cols);

  // Each point written independently. Exceptions may not leave an OpenMP
  // region: first one is kept and re-thrown after the loop
  std::exception_ptr error = nullptr;
#pragma omp parallel for
  for (std::size_t row = 0; row < rows; ++row) {
    try {
      for (std::size_t col = 0; col < cols; ++col) {
        const auto i = row * cols + col;
        switch (mode) {
        case FieldMode::radial_distribution:
          field.panels[0].values[i] = orbital.radial_distribution(field.u[col]);
          break;
        case FieldMode::spherical_harmonic: {
          const auto Y =
              orbital.harmonic(M_PI * field.v[row], M_PI * field.u[col]);
          field.panels[0].values[i] = Y.real();
          field.panels[1].values[i] = Y.imag();
        } break;
        case FieldMode::density:
        case FieldMode::real:
        case FieldMode::imag:
        case FieldMode::real_imag: {
          const auto [x, y, z] =
              plane_point(spec.plane, spec.value, field.u[col], field.v[row]);
          store_planar(mode, orbital.psi(x, y, z), field.panels, i);
        } break;
        }
      }
    } catch (...) {
#pragma omp critical(sample_error)
      if (!error)
        error = std::current_exception();
    }
  }
  if (error)
    std::rethrow_exception(error);

  return field;
}

} // namespace Slice
