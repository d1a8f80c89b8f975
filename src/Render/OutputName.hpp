#pragma once
#include "Orbital/QuantumNumbers.hpp"
#include "Slice/SliceSpec.hpp"
#include <string>
#include <string_view>

namespace Render {

//! Plane part of the output name: x/y/z for planar modes, 'r' for
//! radial_distribution, 'angles' for spherical_harmonic
std::string plane_token(Slice::FieldMode mode, Slice::Plane plane);

//! Plane value as a filename-safe token: 0 -> "0p0", -1.5 -> "m1p5"
std::string value_token(double value);

//! e.g., orbital_n2_l1_m0_real_z0p0.png
std::string default_output_name(const Orbital::QuantumNumbers &qn,
                                Slice::FieldMode mode,
                                std::string_view plane_token, double value,
                                std::string_view ext = "png");

} // namespace Render
