#pragma once
#include <complex>

namespace Orbital {

//! Complex spherical harmonic Y_lm(theta, phi), Condon-Shortley phase.
/*!
@details
 Y_lm = sqrt[(2l+1)/(4pi) (l-|m|)!/(l+|m|)!] P_l^|m|(cos theta) e^{i|m|phi}
 for m >= 0, and Y_l^{-m} = (-1)^m conj(Y_l^m).

The normalised associated Legendre function is from GSL
(gsl_sf_legendre_sphPlm), which is stable for large l. cos(theta) is clamped
to [-1,1]. On the poles (|cos theta| = 1) the phase is not evaluated and the
result is real (zero unless m = 0). Assumes |m| <= l.
*/
std::complex<double> Ylm(int l, int m, double theta, double phi);

//! Normalised associated Legendre function, incl. Condon-Shortley phase:
//! sqrt[(2l+1)/(4pi) (l-m)!/(l+m)!] P_l^m(x), m >= 0. |x| <= 1.
double sphPlm(int l, int m, double x);

} // namespace Orbital
