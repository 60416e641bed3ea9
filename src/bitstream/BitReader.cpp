// Repository: h264ts
// Component: Bit Reader
// Purpose: MSB-first bit reader with Exp-Golomb decoding for H.264 RBSP data.
// Copyright (c) 2025 RetroVue

#include "h264ts/bitstream/BitReader.hpp"

namespace h264ts::bitstream {

std::vector<uint8_t> RemoveEmulationPrevention(const uint8_t* data, size_t size) {
  std::vector<uint8_t> rbsp;
  rbsp.reserve(size);

  size_t zero_count = 0;
  for (size_t i = 0; i < size; ++i) {
    if (zero_count >= 2 && data[i] == 0x03) {
      // Drop the emulation prevention byte
      zero_count = 0;
      continue;
    }
    rbsp.push_back(data[i]);
    zero_count = (data[i] == 0x00) ? zero_count + 1 : 0;
  }

  return rbsp;
}

BitReader::BitReader(const uint8_t* data, size_t size)
    : data_(data), size_(size), bit_pos_(0) {}

bool BitReader::ReadBit(uint32_t& value) {
  if (bit_pos_ >= size_ * 8) {
    return false;
  }
  const uint8_t byte = data_[bit_pos_ / 8];
  value = (byte >> (7 - (bit_pos_ % 8))) & 0x01;
  bit_pos_++;
  return true;
}

bool BitReader::ReadBits(unsigned count, uint32_t& value) {
  if (count > 32 || BitsRemaining() < count) {
    return false;
  }
  uint32_t result = 0;
  for (unsigned i = 0; i < count; ++i) {
    uint32_t bit = 0;
    ReadBit(bit);
    result = (result << 1) | bit;
  }
  value = result;
  return true;
}

bool BitReader::ReadFlag(bool& value) {
  uint32_t bit = 0;
  if (!ReadBit(bit)) {
    return false;
  }
  value = bit != 0;
  return true;
}

bool BitReader::SkipBits(size_t count) {
  if (BitsRemaining() < count) {
    return false;
  }
  bit_pos_ += count;
  return true;
}

bool BitReader::ReadUE(uint32_t& value) {
  unsigned leading_zeros = 0;
  uint32_t bit = 0;
  while (true) {
    if (!ReadBit(bit)) {
      return false;
    }
    if (bit != 0) {
      break;
    }
    leading_zeros++;
    if (leading_zeros > 31) {
      return false;
    }
  }

  uint32_t suffix = 0;
  if (leading_zeros > 0 && !ReadBits(leading_zeros, suffix)) {
    return false;
  }
  value = static_cast<uint32_t>((uint64_t{1} << leading_zeros) - 1 + suffix);
  return true;
}

bool BitReader::ReadSE(int32_t& value) {
  uint32_t code = 0;
  if (!ReadUE(code)) {
    return false;
  }
  // 1 -> 1, 2 -> -1, 3 -> 2, 4 -> -2, ...
  const int64_t magnitude = (static_cast<int64_t>(code) + 1) / 2;
  value = static_cast<int32_t>((code & 0x01) ? magnitude : -magnitude);
  return true;
}

}  // namespace h264ts::bitstream
