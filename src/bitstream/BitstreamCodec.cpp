// Repository: h264ts
// Component: Bitstream Codec
// Purpose: SPS decoding, Annex-B packing and DTS extraction used by the encoder.
// Copyright (c) 2025 RetroVue

#include "h264ts/bitstream/BitstreamCodec.h"
#include "h264ts/bitstream/AnnexB.hpp"

#include <iostream>

namespace h264ts::bitstream {

bool H264BitstreamCodec::DecodeSPS(const NALUnit& nal_unit, SPS& sps) {
  if (!ParseSPS(nal_unit, sps)) {
    std::cerr << "[H264BitstreamCodec] Failed to decode SPS (" << nal_unit.size()
              << " bytes)" << std::endl;
    return false;
  }
  std::cout << "[H264BitstreamCodec] SPS decoded | profile=" << sps.profile_idc
            << " level=" << sps.level_idc << " size=" << sps.Width() << "x" << sps.Height()
            << " poc_type=" << sps.pic_order_cnt_type << std::endl;
  return true;
}

bool H264BitstreamCodec::PackAnnexB(const std::vector<NALUnit>& nal_units,
                                    std::vector<uint8_t>& out) {
  if (!AnnexB::Encode(nal_units, out)) {
    std::cerr << "[H264BitstreamCodec] Annex-B packing failed (empty NAL list or NAL unit)"
              << std::endl;
    return false;
  }
  return true;
}

bool H264BitstreamCodec::ExtractDTS(const std::vector<NALUnit>& nal_units,
                                    bool idr_present,
                                    int64_t pts_us,
                                    const SPS& sps,
                                    int64_t& dts_us) {
  return dts_extractor_.Extract(nal_units, idr_present, pts_us, sps, dts_us);
}

}  // namespace h264ts::bitstream
