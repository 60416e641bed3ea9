// Repository: h264ts
// Component: NAL Unit Types
// Purpose: H.264 NAL unit and access unit representations.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_BITSTREAM_NAL_UNIT_H_
#define H264TS_BITSTREAM_NAL_UNIT_H_

#include <cstdint>
#include <string>
#include <vector>

namespace h264ts::bitstream {

// H.264 NAL unit types (ITU-T H.264 Table 7-1)
enum class NALUnitType : uint8_t {
  UNSPECIFIED = 0,
  CODED_SLICE_NON_IDR = 1,    // P-frame or B-frame slice
  CODED_SLICE_DATA_PARTITION_A = 2,
  CODED_SLICE_DATA_PARTITION_B = 3,
  CODED_SLICE_DATA_PARTITION_C = 4,
  CODED_SLICE_IDR = 5,        // IDR frame (keyframe)
  SEI = 6,                    // Supplemental Enhancement Information
  SPS = 7,                    // Sequence Parameter Set
  PPS = 8,                    // Picture Parameter Set
  ACCESS_UNIT_DELIMITER = 9,
  END_OF_SEQUENCE = 10,
  END_OF_STREAM = 11,
  FILLER_DATA = 12,
  SPS_EXTENSION = 13,
  PREFIX_NAL = 14,
  SUBSET_SPS = 15,
  // 16-18 reserved
  CODED_SLICE_AUX = 19,
  CODED_SLICE_EXTENSION = 20,
  // 21-23 reserved
  // 24-31 unspecified
};

// A single NAL unit, without start code, starting with the NAL header byte.
using NALUnit = std::vector<uint8_t>;

// An access unit: every NAL unit of one picture plus its presentation time.
struct AccessUnit {
  std::vector<NALUnit> nal_units;
  int64_t pts_us = 0;  // Presentation timestamp in microseconds
};

// Extracts the 5-bit type tag from the NAL header.
// The NAL unit must be non-empty.
NALUnitType GetNALUnitType(const NALUnit& nal_unit);

// Returns true if any NAL unit in the list is an IDR slice.
bool IDRPresent(const std::vector<NALUnit>& nal_units);

// Human-readable name for logging.
std::string NALUnitTypeName(NALUnitType type);

}  // namespace h264ts::bitstream

#endif  // H264TS_BITSTREAM_NAL_UNIT_H_
