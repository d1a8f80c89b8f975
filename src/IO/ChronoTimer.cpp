#include "ChronoTimer.hpp"
#include <chrono>
#include <fmt/format.h>
#include <string>
#include <utility>

namespace IO {

//==============================================================================
ChronoTimer::ChronoTimer(std::string name) : m_name(std::move(name)) {
  start();
}

ChronoTimer::~ChronoTimer() {
  if (!m_name.empty())
    fmt::print("{}: T = {}\n", m_name, reading_str());
}

//==============================================================================
void ChronoTimer::start() {
  // note: starting a running timer begins a new lap
  if (m_running)
    stop();
  m_running = true;
  m_tstart = std::chrono::high_resolution_clock::now();
}

void ChronoTimer::stop() {
  if (!m_running)
    return;
  m_total_time_ms += lap_reading_ms();
  m_running = false;
}

//==============================================================================
double ChronoTimer::lap_reading_ms() const {
  if (!m_running)
    return 0.0;
  const auto tcurrent = std::chrono::high_resolution_clock::now();
  const auto duration =
      std::chrono::duration_cast<std::chrono::microseconds>(tcurrent - m_tstart)
          .count();
  return double(duration) * 1.0e-3;
}

double ChronoTimer::reading_ms() const {
  return lap_reading_ms() + m_total_time_ms;
}

std::string ChronoTimer::reading_str() const {
  return convert_HR(reading_ms());
}

std::string ChronoTimer::lap_reading_str() const {
  return convert_HR(lap_reading_ms());
}

//==============================================================================
std::string ChronoTimer::convert_HR(double t) {
  if (t < 1000.0)
    return fmt::format("{:.2f} ms", t);
  if (t < 60000.0)
    return fmt::format("{:.2f} s", t / 1000.0);
  if (t < 3600000.0)
    return fmt::format("{:.2f} mins", t / 60000.0);
  return fmt::format("{:.2f} hours", t / 3600000.0);
}

} // namespace IO
