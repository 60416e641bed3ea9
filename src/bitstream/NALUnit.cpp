// Repository: h264ts
// Component: NAL Unit Types
// Purpose: H.264 NAL unit and access unit representations.
// Copyright (c) 2025 RetroVue

#include "h264ts/bitstream/NALUnit.h"

namespace h264ts::bitstream {

NALUnitType GetNALUnitType(const NALUnit& nal_unit) {
  // NAL header format (H.264):
  // +---------------+
  // |0|NRI|  Type   |
  // +---------------+
  const uint8_t type = nal_unit[0] & 0x1F;

  if (type <= 23) {
    return static_cast<NALUnitType>(type);
  }
  return NALUnitType::UNSPECIFIED;
}

bool IDRPresent(const std::vector<NALUnit>& nal_units) {
  for (const auto& nal_unit : nal_units) {
    if (!nal_unit.empty() &&
        GetNALUnitType(nal_unit) == NALUnitType::CODED_SLICE_IDR) {
      return true;
    }
  }
  return false;
}

std::string NALUnitTypeName(NALUnitType type) {
  switch (type) {
    case NALUnitType::CODED_SLICE_NON_IDR:
      return "NonIDR";
    case NALUnitType::CODED_SLICE_DATA_PARTITION_A:
      return "DataPartitionA";
    case NALUnitType::CODED_SLICE_DATA_PARTITION_B:
      return "DataPartitionB";
    case NALUnitType::CODED_SLICE_DATA_PARTITION_C:
      return "DataPartitionC";
    case NALUnitType::CODED_SLICE_IDR:
      return "IDR";
    case NALUnitType::SEI:
      return "SEI";
    case NALUnitType::SPS:
      return "SPS";
    case NALUnitType::PPS:
      return "PPS";
    case NALUnitType::ACCESS_UNIT_DELIMITER:
      return "AUD";
    case NALUnitType::END_OF_SEQUENCE:
      return "EndOfSequence";
    case NALUnitType::END_OF_STREAM:
      return "EndOfStream";
    case NALUnitType::FILLER_DATA:
      return "FillerData";
    case NALUnitType::SPS_EXTENSION:
      return "SPSExtension";
    case NALUnitType::PREFIX_NAL:
      return "Prefix";
    case NALUnitType::SUBSET_SPS:
      return "SubsetSPS";
    case NALUnitType::CODED_SLICE_AUX:
      return "SliceAux";
    case NALUnitType::CODED_SLICE_EXTENSION:
      return "SliceExtension";
    default:
      return "Unspecified";
  }
}

}  // namespace h264ts::bitstream
