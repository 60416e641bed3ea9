// Repository: h264ts
// Component: Access-Unit Encoder
// Purpose: Turns H.264 access units into timestamped PES packets of an MPEG transport stream.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_ENCODER_ACCESS_UNIT_ENCODER_H_
#define H264TS_ENCODER_ACCESS_UNIT_ENCODER_H_

#include "h264ts/bitstream/BitstreamCodec.h"
#include "h264ts/bitstream/NALUnit.h"
#include "h264ts/bitstream/SPS.h"
#include "h264ts/encoder/EncoderConfig.h"
#include "h264ts/encoder/EncoderStats.h"
#include "h264ts/encoder/EncoderStatus.h"
#include "h264ts/mux/TSMuxer.h"
#include "h264ts/output/OutputSink.h"

#include <cstdint>
#include <memory>
#include <optional>

namespace h264ts::encoder {

// Lifecycle of an encoder. Transitions only move forward.
enum class EncoderState {
  kCreated,    // Constructed, Open() not yet called
  kOpened,     // Open, SPS or PPS still missing
  kReady,      // Parameter sets known, waiting for the first IDR
  kStreaming,  // First IDR seen, every access unit is written
  kClosed
};

const char* ToString(EncoderState state);

// AccessUnitEncoder writes one H.264 elementary stream into a transport
// stream. For every access unit it:
//   - prefixes an access unit delimiter and drops in-band AUD and SEI units,
//   - stores SPS/PPS and repeats them in front of every IDR slice,
//   - drops access units until parameter sets and a first IDR are known,
//   - rebases the PTS on the first access unit, derives the DTS and adds
//     a fixed offset to the PTS,
//   - hands one PES packet to the muxer.
//
// Not thread-safe. One encoder per output stream.
class AccessUnitEncoder {
 public:
  // Collaborators are owned by the encoder. Nothing is opened until Open().
  AccessUnitEncoder(const EncoderConfig& config,
                    std::unique_ptr<bitstream::BitstreamCodec> codec,
                    std::unique_ptr<mux::TSMuxer> muxer,
                    std::unique_ptr<output::OutputSink> sink);

  // Closes the encoder if still open.
  ~AccessUnitEncoder();

  // Disable copy and move
  AccessUnitEncoder(const AccessUnitEncoder&) = delete;
  AccessUnitEncoder& operator=(const AccessUnitEncoder&) = delete;
  AccessUnitEncoder(AccessUnitEncoder&&) = delete;
  AccessUnitEncoder& operator=(AccessUnitEncoder&&) = delete;

  // Seeds the parameter sets (either may be absent), opens the sink and
  // initializes the muxer. A supplied SPS must decode. If a step after
  // opening the sink fails the sink is closed again.
  EncoderStatus Open(const std::optional<bitstream::NALUnit>& initial_sps,
                     const std::optional<bitstream::NALUnit>& initial_pps);

  // Encodes one access unit. Access units dropped by the readiness or
  // first-IDR gate return kOk without writing anything.
  EncoderStatus Encode(const bitstream::AccessUnit& access_unit);

  // Writes the trailer, flushes and releases the sink.
  // Returns kClosed when already closed.
  EncoderStatus Close();

  EncoderState state() const;

  EncoderStats GetStats() const { return stats_; }

 private:
  // Builds the output NAL list and updates the stored parameter sets.
  EncoderStatus FilterNALUnits(const std::vector<bitstream::NALUnit>& input,
                               std::vector<bitstream::NALUnit>& filtered);

  // Stores an SPS, decoding it when it differs from the stored one.
  EncoderStatus UpdateSPS(const bitstream::NALUnit& nal_unit);

  EncoderStatus Fail(EncoderStatus status);

  EncoderConfig config_;
  std::unique_ptr<bitstream::BitstreamCodec> codec_;
  std::unique_ptr<mux::TSMuxer> muxer_;
  std::unique_ptr<output::OutputSink> sink_;

  // Parameter set state
  std::optional<bitstream::NALUnit> sps_;
  std::optional<bitstream::NALUnit> pps_;
  bitstream::SPS decoded_sps_;

  // Timestamp baseline, captured from the first valid access unit
  bool baseline_captured_ = false;
  int64_t baseline_pts_us_ = 0;

  bool opened_ = false;
  bool closed_ = false;
  bool first_idr_received_ = false;
  bool first_packet_written_ = false;

  EncoderStats stats_;
};

}  // namespace h264ts::encoder

#endif  // H264TS_ENCODER_ACCESS_UNIT_ENCODER_H_
