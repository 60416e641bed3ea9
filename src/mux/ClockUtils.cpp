// Repository: h264ts
// Component: Clock Utilities
// Purpose: Conversions between microsecond durations and 90kHz MPEG clock ticks.
// Copyright (c) 2025 RetroVue

#include "h264ts/mux/ClockUtils.hpp"

namespace h264ts::mux {

namespace {

int64_t DivideRoundHalfAway(int64_t numerator, int64_t denominator) {
  const int64_t half = denominator / 2;
  return numerator >= 0 ? (numerator + half) / denominator
                        : (numerator - half) / denominator;
}

}  // namespace

int64_t ClockUtils::MicrosecondsTo90k(int64_t us) {
  return DivideRoundHalfAway(us * kClockRate90k, kMicrosecondsPerSecond);
}

int64_t ClockUtils::Ticks90kToMicroseconds(int64_t ticks_90k) {
  return DivideRoundHalfAway(ticks_90k * kMicrosecondsPerSecond, kClockRate90k);
}

}  // namespace h264ts::mux
