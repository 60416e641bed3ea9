// Repository: h264ts
// Component: Access-Unit Encoder Statistics
// Purpose: Statistics structure for AccessUnitEncoder.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_ENCODER_ENCODER_STATS_H_
#define H264TS_ENCODER_ENCODER_STATS_H_

#include <cstdint>

namespace h264ts::encoder {

// Statistics for AccessUnitEncoder
// POD struct - snapshot returned by GetStats()
struct EncoderStats {
  uint64_t access_units_received = 0;   // Encode() calls on an open encoder
  uint64_t dropped_not_ready = 0;       // Dropped while SPS or PPS was missing
  uint64_t dropped_before_idr = 0;      // Dropped while waiting for the first IDR
  uint64_t packets_written = 0;         // PES packets handed to the muxer
  uint64_t sps_decodes = 0;             // SPS decodes (initial plus in-band changes)
  uint64_t payload_bytes = 0;           // Annex-B bytes written
  uint64_t errors = 0;                  // Encode() calls that returned an error
};

}  // namespace h264ts::encoder

#endif  // H264TS_ENCODER_ENCODER_STATS_H_
