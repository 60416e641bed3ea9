// Repository: h264ts
// Component: Clock Utilities
// Purpose: Conversions between microsecond durations and 90kHz MPEG clock ticks.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_MUX_CLOCK_UTILS_HPP_
#define H264TS_MUX_CLOCK_UTILS_HPP_

#include <cstdint>

namespace h264ts::mux {

// ClockUtils converts timestamps into the 90kHz domain used by PES headers.
// All conversions are integer-only so two equal durations always map to the
// same tick count.
class ClockUtils {
 public:
  static constexpr int64_t kClockRate90k = 90000;
  static constexpr int64_t kMicrosecondsPerSecond = 1000000;

  // Converts microseconds to 90kHz ticks: round(us * 90000 / 1e6).
  // Halves round away from zero.
  static int64_t MicrosecondsTo90k(int64_t us);

  // Converts 90kHz ticks back to microseconds, rounding half away from zero.
  static int64_t Ticks90kToMicroseconds(int64_t ticks_90k);
};

}  // namespace h264ts::mux

#endif  // H264TS_MUX_CLOCK_UTILS_HPP_
