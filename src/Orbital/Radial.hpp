#pragma once
#include <vector>

namespace Orbital {

//! Hydrogen radial function R_nl(r), atomic units. r >= 0.
/*!
@details
 R_nl(r) = N exp(-rho/2) rho^l L_{n-l-1}^{2l+1}(rho),  rho = 2r/n,
 N = (2/n)^{3/2} sqrt[(n-l-1)! / (2n (n+l)!)].

Normalised: Int_0^inf R^2 r^2 dr = 1. The factorial ratio is formed via
log-factorials, and L is evaluated by GSL's recurrence, so this is stable for
large n. Assumes valid (n,l) (see QuantumNumbers). Throws
horbital::NumericalError if GSL reports a failure (underflow gives 0).
*/
double radial(int n, int l, double r);

//! radial() evaluated on each point of r
std::vector<double> radial(int n, int l, const std::vector<double> &r);

//! Radial probability density P(r) = r^2 R_nl(r)^2
double radial_distribution(int n, int l, double r);

//! Normalisation constant N of R_nl (see radial())
double radial_norm(int n, int l);

//! Location of the radial nodes (zeros of R_nl for r>0), ascending. There are
//! n-l-1 of them. Found by bracketed bisection on a scan out to 4n^2.
std::vector<double> radial_nodes(int n, int l);

} // namespace Orbital
