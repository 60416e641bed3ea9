// Repository: h264ts
// Component: Sequence Parameter Set
// Purpose: Decodes H.264 SPS NAL units into the fields needed for timing.
// Copyright (c) 2025 RetroVue

#include "h264ts/bitstream/SPS.h"
#include "h264ts/bitstream/BitReader.hpp"

#include <utility>

namespace h264ts::bitstream {

namespace {

constexpr uint8_t kExtendedSAR = 255;

// Profiles carrying chroma_format_idc and scaling matrices in the SPS.
bool IsHighProfile(uint32_t profile_idc) {
  switch (profile_idc) {
    case 100:
    case 110:
    case 122:
    case 244:
    case 44:
    case 83:
    case 86:
    case 118:
    case 128:
    case 138:
    case 139:
    case 134:
    case 135:
      return true;
    default:
      return false;
  }
}

bool SkipScalingList(BitReader& reader, int size) {
  int32_t last_scale = 8;
  int32_t next_scale = 8;
  for (int j = 0; j < size; ++j) {
    if (next_scale != 0) {
      int32_t delta_scale = 0;
      if (!reader.ReadSE(delta_scale)) {
        return false;
      }
      next_scale = (last_scale + delta_scale + 256) % 256;
    }
    last_scale = (next_scale == 0) ? last_scale : next_scale;
  }
  return true;
}

bool ParseVUITiming(BitReader& reader, VUITiming& timing) {
  bool flag = false;
  uint32_t value = 0;

  // aspect_ratio_info_present_flag
  if (!reader.ReadFlag(flag)) return false;
  if (flag) {
    if (!reader.ReadBits(8, value)) return false;
    if (value == kExtendedSAR && !reader.SkipBits(32)) return false;
  }

  // overscan_info_present_flag
  if (!reader.ReadFlag(flag)) return false;
  if (flag && !reader.SkipBits(1)) return false;

  // video_signal_type_present_flag
  if (!reader.ReadFlag(flag)) return false;
  if (flag) {
    if (!reader.SkipBits(4)) return false;  // video_format, video_full_range_flag
    bool colour_description_present = false;
    if (!reader.ReadFlag(colour_description_present)) return false;
    if (colour_description_present && !reader.SkipBits(24)) return false;
  }

  // chroma_loc_info_present_flag
  if (!reader.ReadFlag(flag)) return false;
  if (flag) {
    if (!reader.ReadUE(value) || !reader.ReadUE(value)) return false;
  }

  // timing_info_present_flag
  if (!reader.ReadFlag(timing.present)) return false;
  if (timing.present) {
    if (!reader.ReadBits(32, timing.num_units_in_tick)) return false;
    if (!reader.ReadBits(32, timing.time_scale)) return false;
    if (!reader.ReadFlag(timing.fixed_frame_rate_flag)) return false;
  }

  return true;
}

}  // namespace

int SPS::Width() const {
  int crop_unit_x = 1;
  if (!separate_colour_plane_flag && chroma_format_idc != 0) {
    crop_unit_x = (chroma_format_idc == 3) ? 1 : 2;
  }
  const int width = static_cast<int>(pic_width_in_mbs_minus1 + 1) * 16;
  if (!frame_cropping_flag) {
    return width;
  }
  return width - crop_unit_x * static_cast<int>(frame_crop_left_offset + frame_crop_right_offset);
}

int SPS::Height() const {
  const int field_factor = frame_mbs_only_flag ? 1 : 2;
  int crop_unit_y = field_factor;
  if (!separate_colour_plane_flag && chroma_format_idc != 0) {
    crop_unit_y = ((chroma_format_idc == 1) ? 2 : 1) * field_factor;
  }
  const int height = field_factor * static_cast<int>(pic_height_in_map_units_minus1 + 1) * 16;
  if (!frame_cropping_flag) {
    return height;
  }
  return height - crop_unit_y * static_cast<int>(frame_crop_top_offset + frame_crop_bottom_offset);
}

double SPS::FrameRate() const {
  if (!timing.present || timing.num_units_in_tick == 0) {
    return 0.0;
  }
  return static_cast<double>(timing.time_scale) /
         (2.0 * static_cast<double>(timing.num_units_in_tick));
}

bool ParseSPS(const NALUnit& nal_unit, SPS& sps) {
  if (nal_unit.size() < 4 || GetNALUnitType(nal_unit) != NALUnitType::SPS) {
    return false;
  }

  const std::vector<uint8_t> rbsp =
      RemoveEmulationPrevention(nal_unit.data() + 1, nal_unit.size() - 1);
  BitReader reader(rbsp.data(), rbsp.size());

  SPS parsed;
  uint32_t reserved = 0;
  if (!reader.ReadBits(8, parsed.profile_idc)) return false;
  if (!reader.ReadBits(6, parsed.constraint_flags)) return false;
  if (!reader.ReadBits(2, reserved)) return false;
  if (!reader.ReadBits(8, parsed.level_idc)) return false;
  if (!reader.ReadUE(parsed.seq_parameter_set_id) || parsed.seq_parameter_set_id > 31) {
    return false;
  }

  if (IsHighProfile(parsed.profile_idc)) {
    if (!reader.ReadUE(parsed.chroma_format_idc) || parsed.chroma_format_idc > 3) {
      return false;
    }
    if (parsed.chroma_format_idc == 3 &&
        !reader.ReadFlag(parsed.separate_colour_plane_flag)) {
      return false;
    }
    if (!reader.ReadUE(parsed.bit_depth_luma_minus8)) return false;
    if (!reader.ReadUE(parsed.bit_depth_chroma_minus8)) return false;
    if (!reader.SkipBits(1)) return false;  // qpprime_y_zero_transform_bypass_flag

    bool seq_scaling_matrix_present = false;
    if (!reader.ReadFlag(seq_scaling_matrix_present)) return false;
    if (seq_scaling_matrix_present) {
      const int num_lists = (parsed.chroma_format_idc != 3) ? 8 : 12;
      for (int i = 0; i < num_lists; ++i) {
        bool list_present = false;
        if (!reader.ReadFlag(list_present)) return false;
        if (list_present && !SkipScalingList(reader, i < 6 ? 16 : 64)) {
          return false;
        }
      }
    }
  }

  if (!reader.ReadUE(parsed.log2_max_frame_num_minus4) ||
      parsed.log2_max_frame_num_minus4 > 12) {
    return false;
  }

  if (!reader.ReadUE(parsed.pic_order_cnt_type) || parsed.pic_order_cnt_type > 2) {
    return false;
  }

  if (parsed.pic_order_cnt_type == 0) {
    if (!reader.ReadUE(parsed.log2_max_pic_order_cnt_lsb_minus4) ||
        parsed.log2_max_pic_order_cnt_lsb_minus4 > 12) {
      return false;
    }
  } else if (parsed.pic_order_cnt_type == 1) {
    if (!reader.ReadFlag(parsed.delta_pic_order_always_zero_flag)) return false;
    if (!reader.ReadSE(parsed.offset_for_non_ref_pic)) return false;
    if (!reader.ReadSE(parsed.offset_for_top_to_bottom_field)) return false;
    uint32_t cycle_length = 0;
    if (!reader.ReadUE(cycle_length) || cycle_length > 255) return false;
    parsed.offset_for_ref_frame.resize(cycle_length);
    for (auto& offset : parsed.offset_for_ref_frame) {
      if (!reader.ReadSE(offset)) return false;
    }
  }

  if (!reader.ReadUE(parsed.max_num_ref_frames)) return false;
  if (!reader.ReadFlag(parsed.gaps_in_frame_num_value_allowed_flag)) return false;
  if (!reader.ReadUE(parsed.pic_width_in_mbs_minus1)) return false;
  if (!reader.ReadUE(parsed.pic_height_in_map_units_minus1)) return false;
  if (!reader.ReadFlag(parsed.frame_mbs_only_flag)) return false;
  if (!parsed.frame_mbs_only_flag &&
      !reader.ReadFlag(parsed.mb_adaptive_frame_field_flag)) {
    return false;
  }
  if (!reader.ReadFlag(parsed.direct_8x8_inference_flag)) return false;

  if (!reader.ReadFlag(parsed.frame_cropping_flag)) return false;
  if (parsed.frame_cropping_flag) {
    if (!reader.ReadUE(parsed.frame_crop_left_offset)) return false;
    if (!reader.ReadUE(parsed.frame_crop_right_offset)) return false;
    if (!reader.ReadUE(parsed.frame_crop_top_offset)) return false;
    if (!reader.ReadUE(parsed.frame_crop_bottom_offset)) return false;
  }

  if (!reader.ReadFlag(parsed.vui_parameters_present_flag)) return false;
  if (parsed.vui_parameters_present_flag && !ParseVUITiming(reader, parsed.timing)) {
    return false;
  }

  sps = std::move(parsed);
  return true;
}

}  // namespace h264ts::bitstream
