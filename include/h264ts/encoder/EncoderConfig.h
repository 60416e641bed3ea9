// Repository: h264ts
// Component: Access-Unit Encoder Configuration
// Purpose: Configuration structure for AccessUnitEncoder.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_ENCODER_ENCODER_CONFIG_H_
#define H264TS_ENCODER_ENCODER_CONFIG_H_

#include <cstdint>

namespace h264ts::encoder {

// Configuration for AccessUnitEncoder
// POD struct - immutable after construction
struct EncoderConfig {
  uint16_t video_pid = 256;             // Elementary stream PID, also carries the PCR
  int64_t pts_offset_us = 400000;       // Added to every PTS (decoder buffering headroom)
  int mux_buffer_size = 16 * 1024;      // AVIO buffer between muxer and sink
};

}  // namespace h264ts::encoder

#endif  // H264TS_ENCODER_ENCODER_CONFIG_H_
