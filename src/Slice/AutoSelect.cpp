#include "AutoSelect.hpp"
#include "Orbital/Hydrogen.hpp"
#include "Orbital/QuantumNumbers.hpp"
#include "Orbital/Radial.hpp"
#include "Sampler.hpp"
#include "horbital/Errors.hpp"
#include "qip/Maths.hpp"
#include "qip/String.hpp"
#include "qip/Vector.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_integration.h>
#include <gsl/gsl_math.h>
#include <gsl/gsl_roots.h>
#include <memory>
#include <vector>

namespace Slice {

//==============================================================================
namespace Helper {

struct RadialParams {
  int n, l;
  double target;
};

// r^2 R^2. NaN (rather than an exception) is passed back through GSL
double Pr_gsl(double r, void *p) {
  const auto params = static_cast<const RadialParams *>(p);
  try {
    return Orbital::radial_distribution(params->n, params->l, r);
  } catch (const horbital::NumericalError &) {
    return GSL_NAN;
  }
}

// P(r) - target
double coverage_gsl(double r, void *p) {
  const auto params = static_cast<const RadialParams *>(p);
  try {
    return cumulative_radial_probability(params->n, params->l, r) -
           params->target;
  } catch (const horbital::NumericalError &) {
    return GSL_NAN;
  }
}

// Radius enclosing 'coverage' of the probability. Brent root of P(r)-coverage
double coverage_radius(int n, int l, double coverage) {
  constexpr double rel_err_lim = 1.0e-8;
  constexpr int max_iterations = 200;
  gsl_set_error_handler_off();

  RadialParams params{n, l, coverage};
  gsl_function F;
  F.function = &coverage_gsl;
  F.params = &params;

  std::unique_ptr<gsl_root_fsolver, decltype(&gsl_root_fsolver_free)> solver{
      gsl_root_fsolver_alloc(gsl_root_fsolver_brent), &gsl_root_fsolver_free};

  // P(0) = 0 < coverage < P(12n^2) ~ 1
  const auto r_max = 12.0 * double(n * n);
  auto status = gsl_root_fsolver_set(solver.get(), &F, 0.0, r_max);
  for (int iter = 0; iter < max_iterations && status == GSL_SUCCESS; ++iter) {
    status = gsl_root_fsolver_iterate(solver.get());
    if (status != GSL_SUCCESS)
      break;
    const auto r_lower = gsl_root_fsolver_x_lower(solver.get());
    const auto r_upper = gsl_root_fsolver_x_upper(solver.get());
    status = gsl_root_test_interval(r_lower, r_upper, 0.0, rel_err_lim);
    if (status == GSL_SUCCESS)
      return gsl_root_fsolver_root(solver.get());
    if (status == GSL_CONTINUE)
      status = GSL_SUCCESS;
  }
  const auto reason =
      status == GSL_SUCCESS ? "did not converge" : gsl_strerror(status);
  throw horbital::NumericalError(
      fmt::format("Could not find radius enclosing {} of probability for "
                  "n={}, l={}: {}",
                  coverage, n, l, reason));
}

// Half-width from the extent of |R| (signed modes)
double signed_extent(int n, int l) {
  const auto r_max = 12.0 * double(n * n);
  const auto r = qip::uniform_range(0.0, r_max, 12000);
  const auto Rnl = Orbital::radial(n, l, r);
  const auto peak = qip::max_abs(Rnl);
  if (peak <= 0.0)
    return 6.0;

  const auto cutoff = 2.0e-3 * peak;
  auto support_radius = 4.0;
  for (auto i = Rnl.size(); i-- > 0;) {
    if (std::abs(Rnl[i]) >= cutoff) {
      support_radius = r[i];
      break;
    }
  }

  // Ensure the outer-most node (and the lobe beyond it) is visible
  const auto nodes = Orbital::radial_nodes(n, l);
  const auto last_node = nodes.empty() ? 0.0 : nodes.back();
  return std::max(1.25 * support_radius, 1.8 * last_node);
}

} // namespace Helper

//==============================================================================
double cumulative_radial_probability(int n, int l, double r) {
  if (r <= 0.0)
    return 0.0;

  constexpr double abs_err_lim = 1.0e-12;
  constexpr double rel_err_lim = 1.0e-10;
  constexpr unsigned long max_num_subintvls = 1000;
  gsl_set_error_handler_off();

  Helper::RadialParams params{n, l, 0.0};
  gsl_function f_gsl;
  f_gsl.function = &Helper::Pr_gsl;
  f_gsl.params = &params;

  std::unique_ptr<gsl_integration_workspace,
                  decltype(&gsl_integration_workspace_free)>
      gsl_int_wrk{gsl_integration_workspace_alloc(max_num_subintvls + 1),
                  &gsl_integration_workspace_free};

  double result{0.0};
  double abs_err{0.0};
  const auto status = gsl_integration_qag(
      &f_gsl, 0.0, r, abs_err_lim, rel_err_lim, max_num_subintvls,
      GSL_INTEG_GAUSS41, gsl_int_wrk.get(), &result, &abs_err);

  // Roundoff limited results are still accurate to far better than needed
  if ((status != GSL_SUCCESS && status != GSL_EROUND) ||
      !std::isfinite(result)) {
    throw horbital::NumericalError(fmt::format(
        "Radial probability integral failed for n={}, l={}, r={}: {}", n, l,
        r, gsl_strerror(status)));
  }
  return result;
}

//==============================================================================
double auto_extent(const Orbital::QuantumNumbers &qn, FieldMode mode,
                   double coverage) {
  const auto n = qn.n();
  const auto l = qn.l();
  coverage = qip::clamp(coverage, 0.95, 0.999);

  const auto density_like = is_density_family(mode) ||
                            mode == FieldMode::spherical_harmonic;

  const auto raw_extent = density_like ?
                              1.15 * Helper::coverage_radius(n, l, coverage) :
                              Helper::signed_extent(n, l);

  const auto min_extent = 4.0;
  const auto max_extent =
      density_like ? std::max(10.0, 8.0 * double(n)) :
                     std::max(10.0, (6.0 + 2.0 * double(l)) * double(n));
  return qip::clamp(raw_extent, min_extent, max_extent);
}

Range auto_range(const Orbital::QuantumNumbers &qn, FieldMode mode) {
  const auto extent = auto_extent(qn, mode);
  return mode == FieldMode::radial_distribution ? Range{0.0, extent} :
                                                  Range{-extent, extent};
}

//==============================================================================
Plane auto_plane(const Orbital::QuantumNumbers &qn, FieldMode mode,
                 double extent) {
  if (!is_planar(mode))
    return Plane::none;

  const Orbital::Hydrogen orbital{qn};
  auto best_plane = Plane::z;
  auto best_score = -1.0;
  for (const auto plane : {Plane::z, Plane::x, Plane::y}) {
    const SliceSpec spec{plane, 0.0, {-extent, extent}, 121};
    const auto field = sample(orbital, spec, mode);

    std::vector<double> f;
    if (mode == FieldMode::real_imag) {
      const auto &re = field.panels.at(0).values;
      const auto &im = field.panels.at(1).values;
      f.reserve(re.size());
      for (std::size_t i = 0; i < re.size(); ++i)
        f.push_back(std::hypot(re[i], im[i]));
    } else {
      f = field.panels.at(0).values;
    }

    std::vector<double> abs_f;
    abs_f.reserve(f.size());
    for (const auto x : f)
      abs_f.push_back(std::abs(x));

    const auto score =
        qip::percentile(abs_f, 99.5) + qip::standard_deviation(f);
    if (score > best_score) {
      best_score = score;
      best_plane = plane;
    }
  }
  return best_plane;
}

//==============================================================================
std::optional<Plane> parse_plane_request(std::string_view name) {
  if (qip::ci_compare(name, "auto"))
    return std::nullopt;
  return parse_plane(name);
}

SliceSpec resolve(const Orbital::QuantumNumbers &qn, FieldMode mode,
                  const SliceRequest &request) {
  SliceSpec spec;
  spec.resolution = request.resolution;

  if (!is_planar(mode)) {
    const auto mode_str = mode_name(mode);
    if (request.plane) {
      throw horbital::InvalidSliceSpecError(
          fmt::format("Mode {} does not use a plane (got plane={})", mode_str,
                      plane_name(*request.plane)));
    }
    if (request.value) {
      throw horbital::InvalidSliceSpecError(
          fmt::format("Mode {} does not use a plane value (got value={})",
                      mode_str, *request.value));
    }
    if (mode == FieldMode::spherical_harmonic && request.range) {
      throw horbital::InvalidSliceSpecError(
          fmt::format("Mode {} covers all angles and does not use a range",
                      mode_str));
    }
    spec.plane = Plane::none;
    spec.value = 0.0;
    // Validate before the range is auto-estimated; {0,1} is a placeholder
    spec.range = request.range.value_or(Range{0.0, 1.0});
    spec.validate(mode);
    if (!request.range)
      spec.range = auto_range(qn, mode);
    return spec;
  }

  // Planar modes: check everything given explicitly before evaluating
  spec.plane = request.plane.value_or(Plane::z);
  spec.value = request.value.value_or(0.0);
  if (request.range)
    spec.range = *request.range;
  spec.validate(mode);

  if (!request.range)
    spec.range = auto_range(qn, mode);
  if (!request.plane) {
    const auto extent =
        std::max(std::abs(spec.range.min), std::abs(spec.range.max));
    spec.plane = auto_plane(qn, mode, extent);
  }
  spec.validate(mode);
  return spec;
}

} // namespace Slice
