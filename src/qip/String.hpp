#pragma once
#include <algorithm>
#include <cctype>
#include <functional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace qip {

//==============================================================================
//! return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
inline char tolower(char ch) {
  // https://en.cppreference.com/w/cpp/string/byte/tolower
  return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

//! Case insensitive string compare. Essentially: LowerCase(s1)==LowerCase(s2)
inline bool ci_compare(std::string_view s1, std::string_view s2) {
  return std::equal(
      s1.cbegin(), s1.cend(), s2.cbegin(), s2.cend(),
      [](char c1, char c2) { return qip::tolower(c1) == qip::tolower(c2); });
}

//! Compares two strings, s1 and s2. s2 may contain ONE wildcard ('*') which
//! will match anything. Case Insensitive version
inline bool ci_wc_compare(std::string_view s1, std::string_view s2) {
  const auto wc = std::find(s2.cbegin(), s2.cend(), '*');
  if (wc == s2.cend())
    return ci_compare(s1, s2);

  const auto pos_wc = std::size_t(std::distance(s2.cbegin(), wc));

  const auto s1_front = s1.substr(0, pos_wc);
  const auto s2_front = s2.substr(0, pos_wc);

  // number of characters following the '*'
  const auto len_back = std::size_t(std::distance(wc + 1, s2.cend()));

  const auto pos_1_back = s1.length() > len_back ? s1.length() - len_back : 0;
  const auto s1_back = s1.substr(pos_1_back, std::string::npos);
  const auto s2_back = s2.substr(pos_wc + 1, std::string::npos);

  return ci_compare(s1_front, s2_front) && ci_compare(s1_back, s2_back);
}

//==============================================================================
//! A simple non-optimised implementation of the Levenshtein distance (case
//! insensitive)
inline auto ci_Levenstein(std::string_view a, std::string_view b) {
  // https://en.wikipedia.org/wiki/Levenshtein_distance
  std::vector<size_t> d_t((a.size() + 1) * (b.size() + 1), size_t(-1));
  auto d = [&](size_t ia, size_t ib) -> size_t & {
    return d_t[ia * (b.size() + 1) + ib];
  };
  std::function<size_t(size_t, size_t)> LevensteinInt =
      [&](size_t ia, size_t ib) -> size_t {
    if (d(ia, ib) != size_t(-1))
      return d(ia, ib);
    size_t dist = 0;
    if (ib >= b.size())
      dist = a.size() - ia;
    else if (ia >= a.size())
      dist = b.size() - ib;
    else if (qip::tolower(a[ia]) == qip::tolower(b[ib]))
      dist = LevensteinInt(ia + 1, ib + 1);
    else
      dist = 1 + std::min(std::min(LevensteinInt(ia, ib + 1),
                                   LevensteinInt(ia + 1, ib)),
                          LevensteinInt(ia + 1, ib + 1));
    d(ia, ib) = dist;
    return dist;
  };
  return LevensteinInt(0, 0);
}

//! Finds the closest match (case insensitive) in list to test_string (return
//! iterator)
inline auto ci_closest_match(std::string_view test_string,
                             const std::vector<std::string> &list) {
  auto compare = [&test_string](const auto &s1, const auto &s2) {
    return qip::ci_Levenstein(s1, test_string) <
           qip::ci_Levenstein(s2, test_string);
  };
  return std::min_element(list.cbegin(), list.cend(), compare);
}

//==============================================================================
//! Checks if a string-like s is integer-like (including -)
inline bool string_is_integer(std::string_view s) {
  return !s.empty() &&
         std::find_if(s.cbegin() + 1, s.cend(),
                      [](auto c) { return !std::isdigit(c); }) == s.end() &&
         (std::isdigit(s[0]) || ((s[0] == '-' || s[0] == '+') && s.size() > 1));
}

//==============================================================================
//! Splits a string by delimeter into a vector
inline std::vector<std::string> split(const std::string &s, char delim = ' ') {
  std::vector<std::string> out;
  std::stringstream ss(s);
  std::string tmp;
  while (getline(ss, tmp, delim)) {
    out.push_back(tmp);
  }
  return out;
}

//! Takes vector of strings, concats into single string, with optional delimeter
inline std::string concat(const std::vector<std::string> &v,
                          const std::string &delim = "") {
  std::string out;
  for (std::size_t i = 0; i < v.size(); ++i) {
    out += v[i];
    if (i != v.size() - 1)
      out += delim;
  }
  return out;
}

//! Replaces every occurance of 'from' by 'to'
inline std::string replace(std::string s, char from, char to) {
  std::replace(s.begin(), s.end(), from, to);
  return s;
}

//==============================================================================
//! Word-wraps text at 'at' characters; every line is prefixed with 'indent'.
//! Existing newlines are kept.
inline std::string wrap(const std::string &text, std::size_t at = 80,
                        const std::string &indent = "") {
  std::string out;
  for (const auto &line : split(text, '\n')) {
    std::string current = indent;
    std::stringstream words(line);
    std::string word;
    bool first = true;
    while (words >> word) {
      if (!first && current.size() + 1 + word.size() > at) {
        out += current + '\n';
        current = indent;
        first = true;
      }
      current += (first ? "" : " ") + word;
      first = false;
    }
    out += current + '\n';
  }
  return out;
}

} // namespace qip
