// Repository: h264ts
// Component: Bitstream Codec
// Purpose: SPS decoding, Annex-B packing and DTS extraction used by the encoder.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_BITSTREAM_BITSTREAM_CODEC_H_
#define H264TS_BITSTREAM_BITSTREAM_CODEC_H_

#include "h264ts/bitstream/DTSExtractor.hpp"
#include "h264ts/bitstream/NALUnit.h"
#include "h264ts/bitstream/SPS.h"

#include <cstdint>
#include <vector>

namespace h264ts::bitstream {

// BitstreamCodec is the H.264 capability set the AccessUnitEncoder relies on.
// Virtual so tests can substitute a recording double.
class BitstreamCodec {
 public:
  virtual ~BitstreamCodec() = default;

  // Decodes an SPS NAL unit. Returns false on malformed input.
  virtual bool DecodeSPS(const NALUnit& nal_unit, SPS& sps) = 0;

  // Packs NAL units into one Annex-B buffer. Returns false on empty input.
  virtual bool PackAnnexB(const std::vector<NALUnit>& nal_units, std::vector<uint8_t>& out) = 0;

  // Derives the DTS of an access unit. Stateful: must be called once per
  // access unit in decode order.
  virtual bool ExtractDTS(const std::vector<NALUnit>& nal_units,
                          bool idr_present,
                          int64_t pts_us,
                          const SPS& sps,
                          int64_t& dts_us) = 0;
};

// H264BitstreamCodec implements BitstreamCodec with the in-tree parsers.
class H264BitstreamCodec : public BitstreamCodec {
 public:
  H264BitstreamCodec() = default;
  ~H264BitstreamCodec() override = default;

  H264BitstreamCodec(const H264BitstreamCodec&) = delete;
  H264BitstreamCodec& operator=(const H264BitstreamCodec&) = delete;

  bool DecodeSPS(const NALUnit& nal_unit, SPS& sps) override;
  bool PackAnnexB(const std::vector<NALUnit>& nal_units, std::vector<uint8_t>& out) override;
  bool ExtractDTS(const std::vector<NALUnit>& nal_units,
                  bool idr_present,
                  int64_t pts_us,
                  const SPS& sps,
                  int64_t& dts_us) override;

 private:
  DTSExtractor dts_extractor_;
};

}  // namespace h264ts::bitstream

#endif  // H264TS_BITSTREAM_BITSTREAM_CODEC_H_
