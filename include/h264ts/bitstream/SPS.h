// Repository: h264ts
// Component: Sequence Parameter Set
// Purpose: Decodes H.264 SPS NAL units into the fields needed for timing.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_BITSTREAM_SPS_H_
#define H264TS_BITSTREAM_SPS_H_

#include "h264ts/bitstream/NALUnit.h"

#include <cstdint>
#include <vector>

namespace h264ts::bitstream {

// VUI timing fields (subset of Annex E).
struct VUITiming {
  bool present = false;
  uint32_t num_units_in_tick = 0;
  uint32_t time_scale = 0;
  bool fixed_frame_rate_flag = false;
};

// Decoded Sequence Parameter Set (ITU-T H.264 7.3.2.1.1).
// Only fields up to and including VUI timing info are decoded.
struct SPS {
  uint32_t profile_idc = 0;
  uint32_t constraint_flags = 0;  // constraint_set0..5 in the high bits
  uint32_t level_idc = 0;
  uint32_t seq_parameter_set_id = 0;

  uint32_t chroma_format_idc = 1;
  bool separate_colour_plane_flag = false;
  uint32_t bit_depth_luma_minus8 = 0;
  uint32_t bit_depth_chroma_minus8 = 0;

  uint32_t log2_max_frame_num_minus4 = 0;
  uint32_t pic_order_cnt_type = 0;
  uint32_t log2_max_pic_order_cnt_lsb_minus4 = 0;
  bool delta_pic_order_always_zero_flag = false;
  int32_t offset_for_non_ref_pic = 0;
  int32_t offset_for_top_to_bottom_field = 0;
  std::vector<int32_t> offset_for_ref_frame;

  uint32_t max_num_ref_frames = 0;
  bool gaps_in_frame_num_value_allowed_flag = false;
  uint32_t pic_width_in_mbs_minus1 = 0;
  uint32_t pic_height_in_map_units_minus1 = 0;
  bool frame_mbs_only_flag = true;
  bool mb_adaptive_frame_field_flag = false;
  bool direct_8x8_inference_flag = false;

  bool frame_cropping_flag = false;
  uint32_t frame_crop_left_offset = 0;
  uint32_t frame_crop_right_offset = 0;
  uint32_t frame_crop_top_offset = 0;
  uint32_t frame_crop_bottom_offset = 0;

  bool vui_parameters_present_flag = false;
  VUITiming timing;

  // Picture width in pixels after cropping.
  int Width() const;

  // Picture height in pixels after cropping.
  int Height() const;

  // Frame rate from VUI timing, 0.0 when absent.
  double FrameRate() const;
};

// Parses an SPS NAL unit (header byte included, emulation prevention bytes
// still present). Returns false if the NAL is not an SPS, is truncated, or
// uses values outside the ranges allowed by the standard.
bool ParseSPS(const NALUnit& nal_unit, SPS& sps);

}  // namespace h264ts::bitstream

#endif  // H264TS_BITSTREAM_SPS_H_
