#pragma once

//! @brief Physical constants used to report atomic-unit results
//! @details
//! All horbital calculations are in atomic units (a0 = 1, E_H = 1); these are
//! only used to convert lengths and energies for printing.
//! CODATA 2022 values: https://physics.nist.gov/cuu/Constants/
namespace PhysConst {

//! Bohr radius, a0, in nm: 0.052 917 721 054 4(82) nm
constexpr double aB_nm = 0.0529177210544;

//! Hartree (atomic energy unit = 2Ry) in eV: 27.211 386 245 981(30) eV
constexpr double Hartree_eV = 27.211386245981;

} // namespace PhysConst
