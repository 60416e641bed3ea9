// Repository: h264ts
// Component: DTS Extractor
// Purpose: Derives decode timestamps from presentation timestamps and slice POC.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_BITSTREAM_DTS_EXTRACTOR_HPP_
#define H264TS_BITSTREAM_DTS_EXTRACTOR_HPP_

#include "h264ts/bitstream/NALUnit.h"
#include "h264ts/bitstream/SPS.h"

#include <cstdint>
#include <vector>

namespace h264ts::bitstream {

// Reads pic_order_cnt_lsb from the header of a coded slice NAL unit.
// Requires pic_order_cnt_type == 0 and a progressive stream.
bool ReadPicOrderCntLsb(const NALUnit& slice, const SPS& sps, uint32_t& pic_order_cnt_lsb);

// DTSExtractor derives DTS for each access unit of a stream in decode order.
// It compares the picture order count of each frame with the POC expected
// when frames are not reordered, and scales the difference by the distance
// observed on the previous frame. State carries across calls, so access
// units must be passed in strict decode order, one stream per instance.
class DTSExtractor {
 public:
  DTSExtractor();
  ~DTSExtractor();

  // Disable copy and move
  DTSExtractor(const DTSExtractor&) = delete;
  DTSExtractor& operator=(const DTSExtractor&) = delete;
  DTSExtractor(DTSExtractor&&) = delete;
  DTSExtractor& operator=(DTSExtractor&&) = delete;

  // nal_units: NAL units of the access unit (parameter sets may be included)
  // idr_present: true if the access unit contains an IDR slice
  // pts_us: presentation timestamp in microseconds
  // sps: active sequence parameter set
  // dts_us: receives the decode timestamp in microseconds
  // Returns false if the POC cannot be read or the derived DTS is invalid.
  // On failure the previous-frame state is left untouched.
  bool Extract(const std::vector<NALUnit>& nal_units,
               bool idr_present,
               int64_t pts_us,
               const SPS& sps,
               int64_t& dts_us);

  // Forget all history (next access unit is treated like the first one).
  void Reset();

 private:
  bool ExtractInner(const std::vector<NALUnit>& nal_units,
                    bool idr_present,
                    int64_t pts_us,
                    const SPS& sps,
                    int64_t& dts_us,
                    int32_t& poc_diff);

  int64_t prev_pts_us_;
  int64_t prev_dts_us_;
  int32_t prev_poc_diff_;
  uint32_t expected_poc_;
  bool prev_dts_valid_;
};

}  // namespace h264ts::bitstream

#endif  // H264TS_BITSTREAM_DTS_EXTRACTOR_HPP_
