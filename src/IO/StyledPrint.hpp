#pragma once
#include <fmt/color.h>
#include <fmt/format.h>
#include <string_view>
#include <unistd.h> // isatty

//! fmt::print wrappers for warning/error banners
namespace fmt2 {

static const bool enable_fmt_text_style = isatty(STDOUT_FILENO);

//! wrapper for text_style formatted fmt::print. Will only apply styling if
//! output is a terminal (stops ANSI characters written to file with >> or |tee)
template <typename... Args>
void styled_print(const fmt::text_style &ts, const Args &...args) {
  fmt::print(enable_fmt_text_style ? ts : fmt::text_style(), args...);
}

inline void warning(std::string_view message) {
  styled_print(fg(fmt::color::orange), "\nWARNING\n");
  fmt::print("{}\n", message);
}

inline void error(std::string_view kind, std::string_view message) {
  styled_print(fg(fmt::color::red), "\nERROR: {}\n", kind);
  fmt::print("{}\n", message);
}

} // namespace fmt2
