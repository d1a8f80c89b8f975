#pragma once
#include <chrono>
#include <string>

namespace IO {

/*!
@brief Times code using std::chrono.
@details
 - Timer starts on construction.
 - If given a name, prints the total time to screen when destroyed.
 - start() begins a new "lap" (adding the current lap to the total), stop()
   pauses timing.
 - reading_ms() returns total elapsed time in ms; reading_str() formats it in
   ms, s, mins, or hours (e.g., "1.56 s").
*/
class ChronoTimer {
public:
  explicit ChronoTimer(std::string name = "");
  ~ChronoTimer();

  ChronoTimer(const ChronoTimer &) = delete;
  ChronoTimer &operator=(const ChronoTimer &) = delete;

  void start();
  void stop();

  double reading_ms() const;
  double lap_reading_ms() const;
  std::string reading_str() const;
  std::string lap_reading_str() const;

  //! Converts time (in ms) into human-readable string
  static std::string convert_HR(double t_ms);

private:
  std::string m_name;
  bool m_running{false};
  double m_total_time_ms{0.0};
  std::chrono::high_resolution_clock::time_point m_tstart{};
};

} // namespace IO
