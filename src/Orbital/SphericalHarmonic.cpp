#include "SphericalHarmonic.hpp"
#include "horbital/Errors.hpp"
#include "qip/Maths.hpp"
#include <cmath>
#include <complex>
#include <cstdlib>
#include <fmt/format.h>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_sf_legendre.h>
#include <gsl/gsl_sf_result.h>

namespace Orbital {

//==============================================================================
double sphPlm(int l, int m, double x) {
  gsl_set_error_handler_off();
  gsl_sf_result gsl_res;
  const auto status = gsl_sf_legendre_sphPlm_e(l, m, x, &gsl_res);
  if (status == GSL_EUNDRFLW)
    return 0.0;
  if (status != GSL_SUCCESS) {
    throw horbital::NumericalError(
        fmt::format("gsl_sf_legendre_sphPlm_e(l={}, m={}, x={}): {}", l, m, x,
                    gsl_strerror(status)));
  }
  return gsl_res.val;
}

//==============================================================================
std::complex<double> Ylm(int l, int m, double theta, double phi) {
  const auto am = std::abs(m);
  const auto x = qip::clamp(std::cos(theta), -1.0, 1.0);
  const auto plm = sphPlm(l, am, x);

  // On the poles, P_l^m(+/-1) = 0 for m!=0, and phi is ill-defined
  if (std::abs(x) == 1.0)
    return {am == 0 ? plm : 0.0, 0.0};

  const auto mphi = double(am) * phi;
  const std::complex<double> Y{plm * std::cos(mphi), plm * std::sin(mphi)};
  // Y_l^{-m} = (-1)^m conj(Y_l^m)
  return m >= 0 ? Y : double(qip::parity(am)) * std::conj(Y);
}

} // namespace Orbital
