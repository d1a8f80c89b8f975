#include "Radial.hpp"
#include "horbital/Errors.hpp"
#include <cmath>
#include <fmt/format.h>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_math.h>
#include <gsl/gsl_roots.h>
#include <gsl/gsl_sf_gamma.h>
#include <gsl/gsl_sf_laguerre.h>
#include <gsl/gsl_sf_result.h>
#include <memory>
#include <vector>

namespace Orbital {

//==============================================================================
namespace Hidden {

// Generalised Laguerre polynomial L_k^a(x), via GSL recurrence
double laguerre(int k, double a, double x) {
  gsl_set_error_handler_off();
  gsl_sf_result gsl_res;
  const auto status = gsl_sf_laguerre_n_e(k, a, x, &gsl_res);
  if (status == GSL_EUNDRFLW)
    return 0.0;
  if (status != GSL_SUCCESS) {
    throw horbital::NumericalError(
        fmt::format("gsl_sf_laguerre_n_e(k={}, a={}, x={}): {}", k, a, x,
                    gsl_strerror(status)));
  }
  return gsl_res.val;
}

// log(N): N = (2/n)^{3/2} sqrt[(n-l-1)! / (2n (n+l)!)]
double log_norm(int n, int l) {
  const auto dn = double(n);
  return 1.5 * std::log(2.0 / dn) +
         0.5 * (gsl_sf_lnfact(unsigned(n - l - 1)) - std::log(2.0 * dn) -
                gsl_sf_lnfact(unsigned(n + l)));
}

// For use with gsl_function
struct RadialParams {
  int n, l;
};

// Exceptions must not propagate through GSL: NaN makes the solver return
// GSL_EBADFUNC, which is reported by the caller
double radial_gsl(double r, void *p) {
  const auto params = static_cast<const RadialParams *>(p);
  try {
    return radial(params->n, params->l, r);
  } catch (const horbital::NumericalError &) {
    return GSL_NAN;
  }
}

} // namespace Hidden

//==============================================================================
double radial_norm(int n, int l) { return std::exp(Hidden::log_norm(n, l)); }

//------------------------------------------------------------------------------
double radial(int n, int l, double r) {
  const auto rho = 2.0 * r / double(n);
  const auto lag = Hidden::laguerre(n - l - 1, double(2 * l + 1), rho);
  if (rho <= 0.0) {
    // rho^l -> 0 for l>0; rho^0 = 1
    return l == 0 ? radial_norm(n, l) * lag : 0.0;
  }
  if (lag == 0.0)
    return 0.0;
  // Combine exp(-rho/2) rho^l |L| in log domain: avoids inf*0 at large r
  const auto log_abs = Hidden::log_norm(n, l) - 0.5 * rho +
                       double(l) * std::log(rho) + std::log(std::abs(lag));
  return std::copysign(std::exp(log_abs), lag);
}

std::vector<double> radial(int n, int l, const std::vector<double> &r) {
  std::vector<double> Rnl;
  Rnl.reserve(r.size());
  for (const auto ri : r) {
    Rnl.push_back(radial(n, l, ri));
  }
  return Rnl;
}

//------------------------------------------------------------------------------
double radial_distribution(int n, int l, double r) {
  const auto Rnl = radial(n, l, r);
  return r * r * Rnl * Rnl;
}

//==============================================================================
std::vector<double> radial_nodes(int n, int l) {
  const auto num_nodes = std::size_t(n - l - 1);
  std::vector<double> nodes;
  if (num_nodes == 0)
    return nodes;
  nodes.reserve(num_nodes);

  Hidden::RadialParams params{n, l};
  gsl_function F;
  F.function = &Hidden::radial_gsl;
  F.params = &params;

  gsl_set_error_handler_off();
  std::unique_ptr<gsl_root_fsolver, decltype(&gsl_root_fsolver_free)> solver{
      gsl_root_fsolver_alloc(gsl_root_fsolver_brent), &gsl_root_fsolver_free};

  // Scan for sign changes, then polish each bracket
  const auto r_max = 4.0 * double(n * n);
  const auto num_steps = 2000 * n;
  const auto dr = r_max / double(num_steps);
  auto r_prev = dr;
  auto f_prev = radial(n, l, r_prev);
  for (int i = 2; i <= num_steps && nodes.size() < num_nodes; ++i) {
    const auto r = double(i) * dr;
    const auto f = radial(n, l, r);
    if (f == 0.0) {
      nodes.push_back(r);
    } else if (f_prev != 0.0 && std::signbit(f) != std::signbit(f_prev)) {
      gsl_root_fsolver_set(solver.get(), &F, r_prev, r);
      int status = GSL_CONTINUE;
      for (int iter = 0; iter < 100 && status == GSL_CONTINUE; ++iter) {
        status = gsl_root_fsolver_iterate(solver.get());
        if (status != GSL_SUCCESS)
          break;
        const auto r_lower = gsl_root_fsolver_x_lower(solver.get());
        const auto r_upper = gsl_root_fsolver_x_upper(solver.get());
        status = gsl_root_test_interval(r_lower, r_upper, 0.0, 1.0e-12);
      }
      if (status != GSL_SUCCESS) {
        throw horbital::NumericalError(fmt::format(
            "Radial node search failed for n={}, l={}: {}", n, l,
            gsl_strerror(status)));
      }
      nodes.push_back(gsl_root_fsolver_root(solver.get()));
    }
    r_prev = r;
    f_prev = f;
  }
  return nodes;
}

} // namespace Orbital
