#pragma once
#include <algorithm>
#include <cassert>
#include <cmath>
#include <numeric>
#include <type_traits>
#include <vector>

namespace qip {

//==============================================================================
//! Produces a uniformly distributed range of values between [first,last] with
//! number steps. number must be at least 2. first+last are guarenteed to be the
//! first and last points in the range.
template <typename T, typename N>
std::vector<T> uniform_range(T first, T last, N number) {
  static_assert(std::is_floating_point_v<T>,
                "In uniform_range(T, T, N), T must be floating point");
  static_assert(std::is_integral_v<N>,
                "In uniform_range(T, T, N), N must be integral");
  assert(number >= 2);

  std::vector<T> range;
  range.reserve(static_cast<std::size_t>(number));
  const auto interval = last - first;
  range.push_back(first); // guarentee first is first
  for (N i = 1; i < number - 1; ++i) {
    const auto eps = static_cast<T>(i) / static_cast<T>(number - 1);
    range.push_back(first + eps * interval);
  }
  range.push_back(last); // guarentee last is last
  return range;
}

//! Produces a logarithmically distributed range of values between
//! [first,last] with number steps. Both first, last must be positive.
template <typename T, typename N>
std::vector<T> logarithmic_range(T first, T last, N number) {
  static_assert(std::is_floating_point_v<T>,
                "In logarithmic_range(T, T, N), T must be floating point");
  static_assert(std::is_integral_v<N>,
                "In logarithmic_range(T, T, N), N must be integral");
  assert(number >= 2 && first > 0 && last > 0);

  std::vector<T> range;
  range.reserve(static_cast<std::size_t>(number));
  const auto log_ratio = std::log(last / first);
  range.push_back(first);
  for (N i = 1; i < number - 1; ++i) {
    const auto eps = static_cast<T>(i) / static_cast<T>(number - 1);
    range.push_back(first * std::exp(log_ratio * eps));
  }
  range.push_back(last);
  return range;
}

//==============================================================================
//! Maximum |v| over any number of vectors; 0 if all empty
template <typename T, typename... Args>
T max_abs(const std::vector<T> &first, const Args &...rest) {
  static_assert(std::is_floating_point_v<T>,
                "In max_abs(std::vector<T>), T must be floating point");
  T max{0};
  for (const auto &x : first) {
    if (std::abs(x) > max)
      max = std::abs(x);
  }
  if constexpr (sizeof...(rest) != 0) {
    return std::max(max, max_abs(rest...));
  } else {
    return max;
  }
}

//! Smallest strictly positive value; returns 0 if there are none
template <typename T>
T min_positive(const std::vector<T> &v) {
  T min{0};
  for (const auto &x : v) {
    if (x > T{0} && (min == T{0} || x < min))
      min = x;
  }
  return min;
}

//! Linearly-interpolated percentile (p in [0,100]) of the values. Copies.
template <typename T>
T percentile(std::vector<T> v, double p) {
  if (v.empty())
    return T{0};
  std::sort(v.begin(), v.end());
  const auto pos = (p / 100.0) * double(v.size() - 1);
  const auto i0 = static_cast<std::size_t>(std::floor(pos));
  const auto i1 = std::min(i0 + 1, v.size() - 1);
  const auto frac = pos - double(i0);
  return v[i0] + T(frac) * (v[i1] - v[i0]);
}

//! Population standard deviation
template <typename T>
T standard_deviation(const std::vector<T> &v) {
  if (v.empty())
    return T{0};
  const auto mean = std::accumulate(v.cbegin(), v.cend(), T{0}) / T(v.size());
  T sum2{0};
  for (const auto &x : v)
    sum2 += (x - mean) * (x - mean);
  return std::sqrt(sum2 / T(v.size()));
}

} // namespace qip
