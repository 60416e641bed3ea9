// Repository: h264ts
// Component: Annex-B Framing
// Purpose: Packs NAL units into and splits them out of Annex-B byte streams.
// Copyright (c) 2025 RetroVue

#include "h264ts/bitstream/AnnexB.hpp"

namespace h264ts::bitstream {

bool AnnexB::Encode(const std::vector<NALUnit>& nal_units, std::vector<uint8_t>& out) {
  if (nal_units.empty()) {
    return false;
  }

  size_t total_size = 0;
  for (const auto& nal_unit : nal_units) {
    if (nal_unit.empty()) {
      return false;
    }
    total_size += kStartCodeSize + nal_unit.size();
  }

  std::vector<uint8_t> encoded;
  encoded.reserve(total_size);
  for (const auto& nal_unit : nal_units) {
    encoded.insert(encoded.end(), kStartCode, kStartCode + kStartCodeSize);
    encoded.insert(encoded.end(), nal_unit.begin(), nal_unit.end());
  }

  out.swap(encoded);
  return true;
}

std::vector<NALUnit> AnnexB::Split(const uint8_t* data, size_t size) {
  std::vector<NALUnit> nal_units;
  if (data == nullptr || size == 0) {
    return nal_units;
  }

  size_t offset = 0;
  while (offset < size) {
    const size_t nal_start = FindNALStart(data, size, offset);
    if (nal_start >= size) {
      break;
    }

    size_t nal_end = FindNALEnd(data, size, nal_start);
    const size_t next_offset = nal_end;

    // Zero bytes before the next start code are trailing_zero_8bits
    while (nal_end > nal_start && data[nal_end - 1] == 0x00) {
      nal_end--;
    }
    if (nal_end > nal_start) {
      nal_units.emplace_back(data + nal_start, data + nal_end);
    }

    offset = next_offset;
  }

  return nal_units;
}

size_t AnnexB::FindNALStart(const uint8_t* data, size_t size, size_t offset) {
  // 00 00 01 also matches the tail of 00 00 00 01
  while (offset + 3 <= size) {
    if (data[offset] == 0x00 && data[offset + 1] == 0x00 && data[offset + 2] == 0x01) {
      return offset + 3;
    }
    offset++;
  }
  return size;
}

size_t AnnexB::FindNALEnd(const uint8_t* data, size_t size, size_t nal_start) {
  size_t offset = nal_start + 1;  // Skip the NAL header
  while (offset + 3 <= size) {
    if (data[offset] == 0x00 && data[offset + 1] == 0x00 && data[offset + 2] == 0x01) {
      return offset;
    }
    offset++;
  }
  return size;
}

}  // namespace h264ts::bitstream
