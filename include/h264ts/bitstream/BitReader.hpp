// Repository: h264ts
// Component: Bit Reader
// Purpose: MSB-first bit reader with Exp-Golomb decoding for H.264 RBSP data.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_BITSTREAM_BIT_READER_HPP_
#define H264TS_BITSTREAM_BIT_READER_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace h264ts::bitstream {

// Removes emulation prevention bytes (00 00 03 -> 00 00) from a NAL payload.
std::vector<uint8_t> RemoveEmulationPrevention(const uint8_t* data, size_t size);

// BitReader reads an RBSP buffer bit by bit.
// All read methods return false once the buffer is exhausted; the output
// value is left untouched in that case.
class BitReader {
 public:
  BitReader(const uint8_t* data, size_t size);

  bool ReadBit(uint32_t& value);
  bool ReadBits(unsigned count, uint32_t& value);
  bool ReadFlag(bool& value);
  bool SkipBits(size_t count);

  // ue(v)
  bool ReadUE(uint32_t& value);

  // se(v)
  bool ReadSE(int32_t& value);

  size_t BitsRemaining() const { return size_ * 8 - bit_pos_; }

 private:
  const uint8_t* data_;
  size_t size_;
  size_t bit_pos_;
};

}  // namespace h264ts::bitstream

#endif  // H264TS_BITSTREAM_BIT_READER_HPP_
