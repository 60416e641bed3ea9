// Repository: h264ts
// Component: DTS Extractor
// Purpose: Derives decode timestamps from presentation timestamps and slice POC.
// Copyright (c) 2025 RetroVue

#include "h264ts/bitstream/DTSExtractor.hpp"
#include "h264ts/bitstream/BitReader.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace h264ts::bitstream {

namespace {

// Slice header fields up to pic_order_cnt_lsb fit well within this many bytes
constexpr size_t kSliceHeaderProbeSize = 32;

uint32_t MaxPicOrderCntLsb(const SPS& sps) {
  return uint32_t{1} << (sps.log2_max_pic_order_cnt_lsb_minus4 + 4);
}

// Wraps the POC difference into the signed half range of MaxPicOrderCntLsb.
int32_t GetPOCDiff(uint32_t poc, uint32_t expected_poc, const SPS& sps) {
  const int32_t max_poc = static_cast<int32_t>(MaxPicOrderCntLsb(sps));
  const int32_t half = (max_poc / 2) - 1;
  int32_t diff = static_cast<int32_t>(poc) - static_cast<int32_t>(expected_poc);
  if (diff < -half) {
    diff += max_poc;
  } else if (diff > half) {
    diff -= max_poc;
  }
  return diff;
}

const NALUnit* FindNonIDRSlice(const std::vector<NALUnit>& nal_units) {
  for (const auto& nal_unit : nal_units) {
    if (!nal_unit.empty() &&
        GetNALUnitType(nal_unit) == NALUnitType::CODED_SLICE_NON_IDR) {
      return &nal_unit;
    }
  }
  return nullptr;
}

}  // namespace

bool ReadPicOrderCntLsb(const NALUnit& slice, const SPS& sps, uint32_t& pic_order_cnt_lsb) {
  if (slice.size() < 2) {
    return false;
  }
  if (sps.pic_order_cnt_type != 0) {
    return false;
  }

  const bool is_idr = GetNALUnitType(slice) == NALUnitType::CODED_SLICE_IDR;
  const size_t probe = std::min(slice.size() - 1, kSliceHeaderProbeSize);
  const std::vector<uint8_t> rbsp = RemoveEmulationPrevention(slice.data() + 1, probe);
  BitReader reader(rbsp.data(), rbsp.size());

  uint32_t value = 0;
  if (!reader.ReadUE(value)) return false;  // first_mb_in_slice
  if (!reader.ReadUE(value)) return false;  // slice_type
  if (!reader.ReadUE(value)) return false;  // pic_parameter_set_id
  if (sps.separate_colour_plane_flag && !reader.SkipBits(2)) {
    return false;  // colour_plane_id
  }
  if (!reader.SkipBits(sps.log2_max_frame_num_minus4 + 4)) return false;  // frame_num

  if (!sps.frame_mbs_only_flag) {
    // field_pic_flag changes POC semantics
    return false;
  }

  if (is_idr && !reader.ReadUE(value)) return false;  // idr_pic_id

  return reader.ReadBits(sps.log2_max_pic_order_cnt_lsb_minus4 + 4, pic_order_cnt_lsb);
}

DTSExtractor::DTSExtractor()
    : prev_pts_us_(0),
      prev_dts_us_(0),
      prev_poc_diff_(0),
      expected_poc_(0),
      prev_dts_valid_(false) {}

DTSExtractor::~DTSExtractor() = default;

void DTSExtractor::Reset() {
  prev_pts_us_ = 0;
  prev_dts_us_ = 0;
  prev_poc_diff_ = 0;
  expected_poc_ = 0;
  prev_dts_valid_ = false;
}

bool DTSExtractor::Extract(const std::vector<NALUnit>& nal_units,
                           bool idr_present,
                           int64_t pts_us,
                           const SPS& sps,
                           int64_t& dts_us) {
  int64_t dts = 0;
  int32_t poc_diff = 0;
  if (!ExtractInner(nal_units, idr_present, pts_us, sps, dts, poc_diff)) {
    return false;
  }

  if (prev_dts_valid_ && dts <= prev_dts_us_) {
    std::cerr << "[DTSExtractor] DTS is not monotonically increasing | prev_dts_us="
              << prev_dts_us_ << " dts_us=" << dts << std::endl;
    return false;
  }

  prev_pts_us_ = pts_us;
  prev_dts_us_ = dts;
  prev_poc_diff_ = poc_diff;
  prev_dts_valid_ = true;

  dts_us = dts;
  return true;
}

bool DTSExtractor::ExtractInner(const std::vector<NALUnit>& nal_units,
                                bool idr_present,
                                int64_t pts_us,
                                const SPS& sps,
                                int64_t& dts_us,
                                int32_t& poc_diff) {
  if (sps.pic_order_cnt_type == 1) {
    std::cerr << "[DTSExtractor] pic_order_cnt_type = 1 is not supported" << std::endl;
    return false;
  }

  if (idr_present || sps.pic_order_cnt_type == 2) {
    // No reordering possible across an IDR, and POC type 2 forbids it
    expected_poc_ = 0;
    dts_us = pts_us;
    poc_diff = 0;
    return true;
  }

  // Advance before reading so the expectation survives a failed frame
  expected_poc_ = (expected_poc_ + 2) & (MaxPicOrderCntLsb(sps) - 1);

  const NALUnit* slice = FindNonIDRSlice(nal_units);
  if (slice == nullptr) {
    std::cerr << "[DTSExtractor] Non-IDR slice not found in access unit" << std::endl;
    return false;
  }

  uint32_t poc = 0;
  if (!ReadPicOrderCntLsb(*slice, sps, poc)) {
    std::cerr << "[DTSExtractor] Unable to read pic_order_cnt_lsb from slice header"
              << std::endl;
    return false;
  }

  poc_diff = GetPOCDiff(poc, expected_poc_, sps);
  if (poc_diff == 0) {
    dts_us = pts_us;
    return true;
  }

  // Frame following an unreordered frame: interpolate from previous PTS
  if (prev_poc_diff_ == 0) {
    const int32_t divisor = poc_diff / 2 + 1;
    if (divisor == 0) {
      std::cerr << "[DTSExtractor] Invalid frame POC | poc=" << poc
                << " expected=" << expected_poc_ << std::endl;
      return false;
    }
    dts_us = prev_pts_us_ + std::llround(static_cast<double>(pts_us - prev_pts_us_) /
                                         static_cast<double>(divisor));
    return true;
  }

  // poc_diff : prev_poc_diff = (pts - dts) : (prev_pts - prev_dts)
  dts_us = pts_us + std::llround(static_cast<double>(prev_dts_us_ - prev_pts_us_) *
                                 static_cast<double>(poc_diff) /
                                 static_cast<double>(prev_poc_diff_));
  return true;
}

}  // namespace h264ts::bitstream
