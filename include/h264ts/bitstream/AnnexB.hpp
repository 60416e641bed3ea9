// Repository: h264ts
// Component: Annex-B Framing
// Purpose: Packs NAL units into and splits them out of Annex-B byte streams.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_BITSTREAM_ANNEXB_HPP_
#define H264TS_BITSTREAM_ANNEXB_HPP_

#include "h264ts/bitstream/NALUnit.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace h264ts::bitstream {

class AnnexB {
 public:
  // 4-byte start code written before every NAL unit.
  static constexpr uint8_t kStartCode[] = {0x00, 0x00, 0x00, 0x01};
  static constexpr size_t kStartCodeSize = 4;

  // Concatenates NAL units, each prefixed with a 4-byte start code.
  // Returns false if the list is empty or contains an empty NAL unit.
  static bool Encode(const std::vector<NALUnit>& nal_units, std::vector<uint8_t>& out);

  // Splits an Annex-B byte stream into NAL units (start codes removed).
  // Accepts both 00 00 01 and 00 00 00 01 start codes. Leading bytes before
  // the first start code are ignored. Trailing zero bytes of each NAL unit
  // belong to the next start code and are stripped.
  static std::vector<NALUnit> Split(const uint8_t* data, size_t size);

 private:
  // Offset of the first byte after the next start code, or size if none.
  static size_t FindNALStart(const uint8_t* data, size_t size, size_t offset);

  // Offset where the next start code begins, or size if none.
  static size_t FindNALEnd(const uint8_t* data, size_t size, size_t nal_start);
};

}  // namespace h264ts::bitstream

#endif  // H264TS_BITSTREAM_ANNEXB_HPP_
