#pragma once
#include <cmath>
#include <type_traits>

namespace qip {

//==============================================================================
//! Returns sign of value. Note: sign(0)==0
template <typename T>
constexpr int sign(T value) {
  static_assert(std::is_arithmetic_v<T>,
                "In sign(T value), T must be arithmetic");
  return (T(0) < value) - (value < T(0));
}

//! Clamps value to [lower, upper]
template <typename T>
constexpr T clamp(T value, T lower, T upper) {
  static_assert(std::is_arithmetic_v<T>,
                "In clamp(T value, T lower, T upper), T must be arithmetic");
  if (value < lower)
    return lower;
  if (value > upper)
    return upper;
  return value;
}

//! (-1)^n, for integer n
constexpr int parity(int n) { return (n % 2 == 0) ? 1 : -1; }

} // namespace qip
