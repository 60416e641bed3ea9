// Repository: h264ts
// Component: Access-Unit Encoder Contract Tests
// Purpose: Contract tests for parameter-set handling, gating and timestamps of AccessUnitEncoder.
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include "h264ts/bitstream/AnnexB.hpp"
#include "h264ts/encoder/AccessUnitEncoder.h"
#include "h264ts/mux/ClockUtils.hpp"
#include "fixtures/bitstream/NALFactory.h"
#include "fixtures/encoder/MemorySink.h"
#include "fixtures/encoder/RecordingBitstreamCodec.h"
#include "fixtures/encoder/StubTSMuxer.h"

namespace h264ts::tests::contracts {

namespace {

using bitstream::AccessUnit;
using bitstream::NALUnit;
using encoder::AccessUnitEncoder;
using encoder::EncoderConfig;
using encoder::EncoderState;
using encoder::EncoderStatus;
using fixtures::encoder::MemorySink;
using fixtures::encoder::RecordingBitstreamCodec;
using fixtures::encoder::StubTSMuxer;
using mux::ClockUtils;
using mux::EncodedPacket;
using namespace fixtures::bitstream;

const NALUnit kAUD = {0x09, 0xF0};

constexpr int64_t kOffsetUs = 400'000;
constexpr int64_t kFrameUs = 40'000;

int64_t Ticks(int64_t us) {
  return ClockUtils::MicrosecondsTo90k(us);
}

std::vector<NALUnit> Unpack(const EncodedPacket& packet) {
  return bitstream::AnnexB::Split(packet.payload.data(), packet.payload.size());
}

}  // namespace

class AccessUnitEncoderContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    sps_ = MakeSPS(params_);
    pps_ = MakePPS();
    idr_ = MakeIDRSlice(params_);
    CreateEncoder(EncoderConfig());
  }

  void CreateEncoder(const EncoderConfig& config) {
    auto codec = std::make_unique<RecordingBitstreamCodec>();
    auto muxer = std::make_unique<StubTSMuxer>();
    auto sink = std::make_unique<MemorySink>();
    codec_ = codec.get();
    muxer_ = muxer.get();
    sink_ = sink.get();
    encoder_ = std::make_unique<AccessUnitEncoder>(config, std::move(codec), std::move(muxer),
                                                   std::move(sink));
  }

  void OpenWithParameterSets() {
    ASSERT_EQ(encoder_->Open(sps_, pps_), EncoderStatus::kOk);
  }

  NALUnit PSlice(uint32_t poc) const { return MakeNonIDRSlice(params_, poc); }

  const std::vector<EncodedPacket>& packets() const { return muxer_->packets(); }

  SPSParams params_;
  NALUnit sps_;
  NALUnit pps_;
  NALUnit idr_;

  RecordingBitstreamCodec* codec_ = nullptr;
  StubTSMuxer* muxer_ = nullptr;
  MemorySink* sink_ = nullptr;
  std::unique_ptr<AccessUnitEncoder> encoder_;
};

// ---------------------------------------------------------------------------
// Open
// ---------------------------------------------------------------------------

TEST_F(AccessUnitEncoderContractTest, AUE_001_OpenConfiguresSingleVideoStream) {
  EXPECT_EQ(encoder_->state(), EncoderState::kCreated);
  OpenWithParameterSets();

  EXPECT_TRUE(sink_->IsOpen());
  EXPECT_EQ(muxer_->GetInitCount(), 1);
  EXPECT_EQ(muxer_->config().video_pid, 256);
  EXPECT_EQ(muxer_->config().pcr_pid, 256);
  EXPECT_EQ(muxer_->config().stream_type, mux::kStreamTypeH264);
  EXPECT_EQ(codec_->GetDecodeCount(), 1);
  EXPECT_EQ(encoder_->state(), EncoderState::kReady);
  EXPECT_EQ(encoder_->GetStats().sps_decodes, 1u);
}

TEST_F(AccessUnitEncoderContractTest, AUE_002_OpenWithoutParameterSets) {
  ASSERT_EQ(encoder_->Open(std::nullopt, std::nullopt), EncoderStatus::kOk);
  EXPECT_EQ(codec_->GetDecodeCount(), 0);
  EXPECT_EQ(encoder_->state(), EncoderState::kOpened);
}

TEST_F(AccessUnitEncoderContractTest, AUE_003_OpenRejectsUndecodableSPS) {
  const NALUnit broken_sps = {0x67, 0x42, 0x00, 0x0A};
  EXPECT_EQ(encoder_->Open(broken_sps, pps_), EncoderStatus::kParameterSetError);
  EXPECT_EQ(sink_->GetOpenCount(), 0);
  EXPECT_EQ(muxer_->GetInitCount(), 0);
  EXPECT_EQ(encoder_->state(), EncoderState::kCreated);
}

TEST_F(AccessUnitEncoderContractTest, AUE_004_OpenReportsSinkFailure) {
  sink_->SetShouldFailOpen(true);
  EXPECT_EQ(encoder_->Open(sps_, pps_), EncoderStatus::kIOError);
  EXPECT_EQ(muxer_->GetInitCount(), 0);
}

TEST_F(AccessUnitEncoderContractTest, AUE_005_OpenReleasesSinkWhenMuxerFails) {
  muxer_->SetShouldFailInit(true);
  EXPECT_EQ(encoder_->Open(sps_, pps_), EncoderStatus::kMuxError);
  EXPECT_FALSE(sink_->IsOpen());
  EXPECT_EQ(sink_->GetCloseCount(), 1);
}

TEST_F(AccessUnitEncoderContractTest, AUE_006_CustomPidReachesMuxerAndPackets) {
  EncoderConfig config;
  config.video_pid = 300;
  CreateEncoder(config);
  OpenWithParameterSets();

  EXPECT_EQ(muxer_->config().video_pid, 300);
  EXPECT_EQ(muxer_->config().pcr_pid, 300);

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);
  ASSERT_EQ(packets().size(), 1u);
  EXPECT_EQ(packets()[0].pid, 300);
}

// ---------------------------------------------------------------------------
// Preconditions
// ---------------------------------------------------------------------------

TEST_F(AccessUnitEncoderContractTest, AUE_007_EncodeBeforeOpenIsRejected) {
  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kClosed);
  EXPECT_TRUE(packets().empty());
}

TEST_F(AccessUnitEncoderContractTest, AUE_008_EmptyInputIsRejected) {
  OpenWithParameterSets();

  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({}, 0)), EncoderStatus::kInvalidInput);
  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({idr_, {}}, 0)), EncoderStatus::kInvalidInput);
  EXPECT_TRUE(packets().empty());
  EXPECT_EQ(encoder_->GetStats().errors, 2u);

  // Rejected access units do not fix the timestamp baseline
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 2'000'000)), EncoderStatus::kOk);
  ASSERT_EQ(packets().size(), 1u);
  EXPECT_EQ(packets()[0].pts_90k, Ticks(kOffsetUs));
}

TEST_F(AccessUnitEncoderContractTest, AUE_009_ClosedEncoderRejectsCalls) {
  OpenWithParameterSets();
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);

  EXPECT_EQ(encoder_->Close(), EncoderStatus::kOk);
  EXPECT_EQ(encoder_->state(), EncoderState::kClosed);
  EXPECT_EQ(encoder_->Close(), EncoderStatus::kClosed);
  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(2)}, kFrameUs)), EncoderStatus::kClosed);
  EXPECT_EQ(encoder_->Open(sps_, pps_), EncoderStatus::kClosed);
  EXPECT_EQ(packets().size(), 1u);
}

// ---------------------------------------------------------------------------
// NAL filtering
// ---------------------------------------------------------------------------

TEST_F(AccessUnitEncoderContractTest, AUE_010_KeyframeCarriesParameterSets) {
  OpenWithParameterSets();

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);
  ASSERT_EQ(packets().size(), 1u);

  const EncodedPacket& packet = packets()[0];
  EXPECT_TRUE(packet.random_access);
  EXPECT_EQ(Unpack(packet), std::vector<NALUnit>({kAUD, sps_, pps_, idr_}));
}

TEST_F(AccessUnitEncoderContractTest, AUE_011_EveryIDRIsPrefixed) {
  OpenWithParameterSets();

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(2)}, kFrameUs)), EncoderStatus::kOk);
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 2 * kFrameUs)), EncoderStatus::kOk);
  ASSERT_EQ(packets().size(), 3u);

  for (const EncodedPacket& packet : packets()) {
    const std::vector<NALUnit> nal_units = Unpack(packet);
    ASSERT_FALSE(nal_units.empty());
    EXPECT_EQ(nal_units.front(), kAUD);
    if (packet.random_access) {
      ASSERT_EQ(nal_units.size(), 4u);
      EXPECT_EQ(nal_units[1], sps_);
      EXPECT_EQ(nal_units[2], pps_);
      EXPECT_EQ(bitstream::GetNALUnitType(nal_units[3]), bitstream::NALUnitType::CODED_SLICE_IDR);
    }
  }
  EXPECT_FALSE(packets()[1].random_access);
  EXPECT_EQ(Unpack(packets()[1]), std::vector<NALUnit>({kAUD, PSlice(2)}));
}

TEST_F(AccessUnitEncoderContractTest, AUE_012_DelimitersAndSEIAreReplaced) {
  OpenWithParameterSets();
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({MakeAUD(), MakeSEI(), PSlice(2), MakeSEI()},
                                            kFrameUs)),
            EncoderStatus::kOk);
  ASSERT_EQ(packets().size(), 2u);
  EXPECT_EQ(Unpack(packets()[1]), std::vector<NALUnit>({kAUD, PSlice(2)}));
}

TEST_F(AccessUnitEncoderContractTest, AUE_013_InBandParameterSetsAreConsumed) {
  ASSERT_EQ(encoder_->Open(std::nullopt, std::nullopt), EncoderStatus::kOk);

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({MakeAUD(), sps_, pps_, idr_}, 0)),
            EncoderStatus::kOk);
  ASSERT_EQ(packets().size(), 1u);
  // Stored once, emitted once, in front of the IDR
  EXPECT_EQ(Unpack(packets()[0]), std::vector<NALUnit>({kAUD, sps_, pps_, idr_}));
}

TEST_F(AccessUnitEncoderContractTest, AUE_014_UnknownTypesPassThroughInOrder) {
  OpenWithParameterSets();
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);

  const NALUnit filler = {0x0C, 0xFF, 0xFF, 0x80};
  const NALUnit end_of_sequence = {0x0A};
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(2), filler, end_of_sequence}, kFrameUs)),
            EncoderStatus::kOk);
  ASSERT_EQ(packets().size(), 2u);
  EXPECT_EQ(Unpack(packets()[1]),
            std::vector<NALUnit>({kAUD, PSlice(2), filler, end_of_sequence}));
}

// ---------------------------------------------------------------------------
// Gating
// ---------------------------------------------------------------------------

TEST_F(AccessUnitEncoderContractTest, AUE_015_NothingBeforeParameterSets) {
  ASSERT_EQ(encoder_->Open(std::nullopt, std::nullopt), EncoderStatus::kOk);

  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);
  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({sps_, idr_}, kFrameUs)), EncoderStatus::kOk);
  EXPECT_TRUE(packets().empty());
  EXPECT_EQ(encoder_->GetStats().dropped_not_ready, 2u);
  EXPECT_EQ(encoder_->state(), EncoderState::kOpened);

  // PPS completes the set; the IDR in the same access unit is written
  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({pps_, idr_}, 2 * kFrameUs)), EncoderStatus::kOk);
  ASSERT_EQ(packets().size(), 1u);
  EXPECT_EQ(Unpack(packets()[0]), std::vector<NALUnit>({kAUD, sps_, pps_, idr_}));
  EXPECT_EQ(encoder_->state(), EncoderState::kStreaming);
}

TEST_F(AccessUnitEncoderContractTest, AUE_016_NothingBeforeFirstIDR) {
  OpenWithParameterSets();

  for (uint32_t i = 1; i <= 3; ++i) {
    EXPECT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(2 * i)}, i * kFrameUs)),
              EncoderStatus::kOk);
  }
  EXPECT_TRUE(packets().empty());
  EXPECT_EQ(encoder_->GetStats().dropped_before_idr, 3u);
  EXPECT_EQ(encoder_->state(), EncoderState::kReady);
  EXPECT_TRUE(codec_->dts_calls().empty());

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 4 * kFrameUs)), EncoderStatus::kOk);
  EXPECT_EQ(encoder_->state(), EncoderState::kStreaming);

  // The gate never closes again
  for (uint32_t i = 1; i <= 5; ++i) {
    EXPECT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(2 * i)}, (4 + i) * kFrameUs)),
              EncoderStatus::kOk);
  }
  EXPECT_EQ(packets().size(), 6u);
  EXPECT_EQ(encoder_->GetStats().packets_written, 6u);
  EXPECT_EQ(encoder_->GetStats().dropped_before_idr, 3u);
}

TEST_F(AccessUnitEncoderContractTest, AUE_017_EarlyNonIDRAccessUnitIsDroppedSilently) {
  OpenWithParameterSets();

  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({MakeAUD(), MakeSEI(), PSlice(2)}, 0)),
            EncoderStatus::kOk);
  EXPECT_TRUE(packets().empty());
  EXPECT_TRUE(sink_->data().empty());
  EXPECT_EQ(encoder_->GetStats().errors, 0u);
}

// ---------------------------------------------------------------------------
// Parameter set tracking
// ---------------------------------------------------------------------------

TEST_F(AccessUnitEncoderContractTest, AUE_018_IdenticalSPSIsNotDecodedAgain) {
  OpenWithParameterSets();
  ASSERT_EQ(codec_->GetDecodeCount(), 1);

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({sps_, pps_, idr_}, 0)), EncoderStatus::kOk);
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({sps_, PSlice(2)}, kFrameUs)), EncoderStatus::kOk);
  EXPECT_EQ(codec_->GetDecodeCount(), 1);
  EXPECT_EQ(encoder_->GetStats().sps_decodes, 1u);
}

TEST_F(AccessUnitEncoderContractTest, AUE_019_ChangedSPSIsDecodedAndRepeated) {
  OpenWithParameterSets();
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);

  // level_idc is a whole byte: the two SPS differ in exactly one byte
  SPSParams changed_params = params_;
  changed_params.level_idc = 31;
  const NALUnit changed_sps = MakeSPS(changed_params);
  ASSERT_EQ(changed_sps.size(), sps_.size());

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({changed_sps, PSlice(2)}, kFrameUs)),
            EncoderStatus::kOk);
  EXPECT_EQ(codec_->GetDecodeCount(), 2);
  ASSERT_FALSE(codec_->dts_calls().empty());
  EXPECT_EQ(codec_->dts_calls().back().sps.level_idc, 31u);

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 2 * kFrameUs)), EncoderStatus::kOk);
  ASSERT_EQ(packets().size(), 3u);
  EXPECT_EQ(Unpack(packets()[2]), std::vector<NALUnit>({kAUD, changed_sps, pps_, idr_}));
}

TEST_F(AccessUnitEncoderContractTest, AUE_020_ChangedSPSDrivesSliceParsing) {
  OpenWithParameterSets();
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);

  // Narrower pic_order_cnt_lsb field
  SPSParams narrow = params_;
  narrow.log2_max_pic_order_cnt_lsb_minus4 = 0;
  const NALUnit narrow_sps = MakeSPS(narrow);

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({narrow_sps, pps_, MakeIDRSlice(narrow)}, kFrameUs)),
            EncoderStatus::kOk);
  for (uint32_t i = 1; i <= 10; ++i) {
    const int64_t pts = (1 + i) * kFrameUs;
    ASSERT_EQ(encoder_->Encode(MakeAccessUnit({MakeNonIDRSlice(narrow, 2 * i)}, pts)),
              EncoderStatus::kOk)
        << "frame " << i;
    // POC read with the new field width: no reordering detected
    ASSERT_TRUE(packets().back().dts_90k.has_value());
    EXPECT_EQ(*packets().back().dts_90k, Ticks(pts)) << "frame " << i;
  }
}

TEST_F(AccessUnitEncoderContractTest, AUE_021_UndecodableInBandSPSIsReported) {
  OpenWithParameterSets();
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);

  const NALUnit broken_sps = {0x67, 0x42, 0x00, 0x0A};
  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({broken_sps, idr_}, kFrameUs)),
            EncoderStatus::kParameterSetError);
  EXPECT_EQ(packets().size(), 1u);
  EXPECT_EQ(encoder_->GetStats().errors, 1u);

  // The stored SPS is still the previous one
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 2 * kFrameUs)), EncoderStatus::kOk);
  EXPECT_EQ(Unpack(packets().back()), std::vector<NALUnit>({kAUD, sps_, pps_, idr_}));
}

TEST_F(AccessUnitEncoderContractTest, AUE_022_LatestPPSIsRepeated) {
  OpenWithParameterSets();
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);

  const NALUnit new_pps = {0x68, 0xCE, 0x06, 0xE2};
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({new_pps, PSlice(2)}, kFrameUs)), EncoderStatus::kOk);
  EXPECT_EQ(Unpack(packets().back()), std::vector<NALUnit>({kAUD, PSlice(2)}));

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 2 * kFrameUs)), EncoderStatus::kOk);
  EXPECT_EQ(Unpack(packets().back()), std::vector<NALUnit>({kAUD, sps_, new_pps, idr_}));
}

// ---------------------------------------------------------------------------
// Timestamps
// ---------------------------------------------------------------------------

TEST_F(AccessUnitEncoderContractTest, AUE_023_PTSIsRebasedOnFirstAccessUnit) {
  OpenWithParameterSets();

  const int64_t t0 = 7'000'000;
  // First access unit is gated out but still fixes the baseline
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(2)}, t0)), EncoderStatus::kOk);

  const std::vector<int64_t> times = {t0 + kFrameUs, t0 + 2 * kFrameUs, t0 + 3 * kFrameUs};
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, times[0])), EncoderStatus::kOk);
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(2)}, times[1])), EncoderStatus::kOk);

  // A parameter set change does not move the baseline
  SPSParams changed_params = params_;
  changed_params.level_idc = 40;
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({MakeSPS(changed_params), pps_, idr_}, times[2])),
            EncoderStatus::kOk);

  ASSERT_EQ(packets().size(), times.size());
  for (size_t i = 0; i < times.size(); ++i) {
    EXPECT_EQ(packets()[i].pts_90k, Ticks(times[i] - t0 + kOffsetUs)) << "packet " << i;
    EXPECT_EQ(codec_->dts_calls()[i].pts_us, times[i] - t0) << "packet " << i;
  }
}

TEST_F(AccessUnitEncoderContractTest, AUE_024_ExtractorSeesFilteredAccessUnit) {
  OpenWithParameterSets();

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({MakeSEI(), idr_}, 500)), EncoderStatus::kOk);
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({MakeAUD(), PSlice(2)}, 500 + kFrameUs)),
            EncoderStatus::kOk);

  ASSERT_EQ(codec_->dts_calls().size(), 2u);
  EXPECT_TRUE(codec_->dts_calls()[0].idr_present);
  EXPECT_EQ(codec_->dts_calls()[0].pts_us, 0);
  EXPECT_EQ(codec_->dts_calls()[0].nal_units, std::vector<NALUnit>({kAUD, sps_, pps_, idr_}));
  EXPECT_FALSE(codec_->dts_calls()[1].idr_present);
  EXPECT_EQ(codec_->dts_calls()[1].pts_us, kFrameUs);
  EXPECT_EQ(codec_->dts_calls()[1].nal_units, std::vector<NALUnit>({kAUD, PSlice(2)}));
}

TEST_F(AccessUnitEncoderContractTest, AUE_025_OffsetPTSWithUnshiftedDTS) {
  OpenWithParameterSets();

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({sps_, pps_, idr_}, 0)), EncoderStatus::kOk);
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(2)}, kFrameUs)), EncoderStatus::kOk);
  ASSERT_EQ(packets().size(), 2u);

  // DTS follows the rebased PTS, PTS carries the offset: both are written
  EXPECT_EQ(packets()[0].pts_90k, 36'000);
  ASSERT_TRUE(packets()[0].dts_90k.has_value());
  EXPECT_EQ(*packets()[0].dts_90k, 0);

  EXPECT_EQ(packets()[1].pts_90k, 39'600);
  ASSERT_TRUE(packets()[1].dts_90k.has_value());
  EXPECT_EQ(*packets()[1].dts_90k, 3'600);
}

TEST_F(AccessUnitEncoderContractTest, AUE_026_PTSOnlyWhenDTSEqualsOffsetPTS) {
  codec_->SetDTSDelta(kOffsetUs);
  OpenWithParameterSets();

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({MakeAUD(), sps_, pps_, idr_}, 0)),
            EncoderStatus::kOk);
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(2)}, kFrameUs)), EncoderStatus::kOk);
  ASSERT_EQ(packets().size(), 2u);

  EXPECT_EQ(Unpack(packets()[0]), std::vector<NALUnit>({kAUD, sps_, pps_, idr_}));
  EXPECT_EQ(packets()[0].pts_90k, Ticks(400'000));
  EXPECT_FALSE(packets()[0].dts_90k.has_value());

  EXPECT_EQ(Unpack(packets()[1]), std::vector<NALUnit>({kAUD, PSlice(2)}));
  EXPECT_EQ(packets()[1].pts_90k, Ticks(440'000));
  EXPECT_FALSE(packets()[1].dts_90k.has_value());
}

TEST_F(AccessUnitEncoderContractTest, AUE_027_DTSNeverExceedsPTS) {
  OpenWithParameterSets();

  // Decode order I0 P3 B1 B2 P6 B4 B5
  struct Frame {
    bool idr;
    uint32_t poc;
    uint32_t slice_type;
    int64_t pts;
  };
  const std::vector<Frame> frames = {
      {true, 0, 2, 0},
      {false, 6, 0, 3 * kFrameUs},
      {false, 2, 1, 1 * kFrameUs},
      {false, 4, 1, 2 * kFrameUs},
      {false, 12, 0, 6 * kFrameUs},
      {false, 8, 1, 4 * kFrameUs},
      {false, 10, 1, 5 * kFrameUs},
  };

  for (const Frame& frame : frames) {
    const NALUnit slice = frame.idr ? idr_ : MakeNonIDRSlice(params_, frame.poc, frame.slice_type);
    ASSERT_EQ(encoder_->Encode(MakeAccessUnit({slice}, frame.pts)), EncoderStatus::kOk);
  }

  ASSERT_EQ(packets().size(), frames.size());
  int64_t previous_dts = -1;
  for (size_t i = 0; i < packets().size(); ++i) {
    const EncodedPacket& packet = packets()[i];
    const int64_t dts = packet.dts_90k.value_or(packet.pts_90k);
    EXPECT_LE(dts, packet.pts_90k) << "packet " << i;
    EXPECT_GT(dts, previous_dts) << "packet " << i;
    EXPECT_EQ(packet.pts_90k, Ticks(frames[i].pts + kOffsetUs)) << "packet " << i;
    previous_dts = dts;
  }
  // One frame of reordering delay
  EXPECT_EQ(*packets()[1].dts_90k, Ticks(kFrameUs));
  EXPECT_EQ(*packets()[2].dts_90k, Ticks(2 * kFrameUs));
}

TEST_F(AccessUnitEncoderContractTest, AUE_028_TicksUseOneRoundingRule) {
  codec_->SetDTSDelta(kOffsetUs);
  OpenWithParameterSets();

  // 29.97 fps timestamps are not whole ticks
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(2)}, 33'367)), EncoderStatus::kOk);
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(4)}, 66'733)), EncoderStatus::kOk);

  ASSERT_EQ(packets().size(), 3u);
  // 433'367 us = 39003.03 ticks, 466'733 us = 42005.97 ticks
  EXPECT_EQ(packets()[1].pts_90k, 39'003);
  EXPECT_EQ(packets()[2].pts_90k, 42'006);
  // Equal durations compare equal, so the header stays PTS-only
  EXPECT_FALSE(packets()[1].dts_90k.has_value());
  EXPECT_FALSE(packets()[2].dts_90k.has_value());
}

TEST_F(AccessUnitEncoderContractTest, AUE_029_ConfigurableOffset) {
  EncoderConfig config;
  config.pts_offset_us = 0;
  CreateEncoder(config);
  OpenWithParameterSets();

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 1'000'000)), EncoderStatus::kOk);
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(2)}, 1'040'000)), EncoderStatus::kOk);

  // No offset: without reordering the DTS equals the PTS
  EXPECT_EQ(packets()[0].pts_90k, 0);
  EXPECT_FALSE(packets()[0].dts_90k.has_value());
  EXPECT_EQ(packets()[1].pts_90k, 3'600);
  EXPECT_FALSE(packets()[1].dts_90k.has_value());
}

// ---------------------------------------------------------------------------
// Packetization and errors
// ---------------------------------------------------------------------------

TEST_F(AccessUnitEncoderContractTest, AUE_030_PacketHeaderFields) {
  OpenWithParameterSets();
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({PSlice(2)}, kFrameUs)), EncoderStatus::kOk);

  for (const EncodedPacket& packet : packets()) {
    EXPECT_EQ(packet.pid, 256);
    EXPECT_EQ(packet.stream_id, 0xE0);
    EXPECT_EQ(packet.marker_bits, 2);
  }

  std::vector<uint8_t> expected_payload;
  ASSERT_TRUE(bitstream::AnnexB::Encode({kAUD, sps_, pps_, idr_}, expected_payload));
  EXPECT_EQ(packets()[0].payload, expected_payload);

  const encoder::EncoderStats stats = encoder_->GetStats();
  EXPECT_EQ(stats.access_units_received, 2u);
  EXPECT_EQ(stats.packets_written, 2u);
  EXPECT_EQ(stats.payload_bytes, packets()[0].payload.size() + packets()[1].payload.size());
  EXPECT_EQ(sink_->data().size(), stats.payload_bytes);
}

TEST_F(AccessUnitEncoderContractTest, AUE_031_CodecFailuresAreReported) {
  OpenWithParameterSets();

  codec_->SetShouldFailPack(true);
  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kCodecError);
  codec_->SetShouldFailPack(false);

  codec_->SetShouldFailExtract(true);
  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, kFrameUs)), EncoderStatus::kCodecError);
  codec_->SetShouldFailExtract(false);

  EXPECT_TRUE(packets().empty());
  EXPECT_EQ(encoder_->GetStats().errors, 2u);

  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 2 * kFrameUs)), EncoderStatus::kOk);
  EXPECT_EQ(packets().size(), 1u);
}

TEST_F(AccessUnitEncoderContractTest, AUE_032_MuxAndOutputFailuresAreDistinguished) {
  OpenWithParameterSets();

  muxer_->SetShouldFailWrite(true);
  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kMuxError);
  muxer_->SetShouldFailWrite(false);

  sink_->SetShouldFailWrite(true);
  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, kFrameUs)), EncoderStatus::kIOError);
  EXPECT_TRUE(packets().empty());
}

// ---------------------------------------------------------------------------
// Close
// ---------------------------------------------------------------------------

TEST_F(AccessUnitEncoderContractTest, AUE_033_CloseFlushesMuxerThenSink) {
  OpenWithParameterSets();
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);

  EXPECT_EQ(encoder_->Close(), EncoderStatus::kOk);
  EXPECT_EQ(muxer_->GetFlushCount(), 1);
  EXPECT_EQ(muxer_->GetCleanupCount(), 1);
  EXPECT_EQ(sink_->GetFlushCount(), 1);
  EXPECT_EQ(sink_->GetCloseCount(), 1);
  EXPECT_FALSE(sink_->IsOpen());
}

TEST_F(AccessUnitEncoderContractTest, AUE_034_CloseReportsFlushFailure) {
  OpenWithParameterSets();
  muxer_->SetShouldFailFlush(true);

  EXPECT_EQ(encoder_->Close(), EncoderStatus::kMuxError);
  // Resources are released regardless
  EXPECT_EQ(sink_->GetCloseCount(), 1);
  EXPECT_EQ(encoder_->state(), EncoderState::kClosed);
}

TEST_F(AccessUnitEncoderContractTest, AUE_035_DestructorClosesOpenEncoder) {
  bool sink_closed = false;
  sink_->SetClosedFlag(&sink_closed);
  OpenWithParameterSets();
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);

  encoder_.reset();
  EXPECT_TRUE(sink_closed);
}

TEST_F(AccessUnitEncoderContractTest, AUE_036_CloseWithoutOpen) {
  EXPECT_EQ(encoder_->Close(), EncoderStatus::kOk);
  EXPECT_EQ(sink_->GetOpenCount(), 0);
  EXPECT_EQ(encoder_->Close(), EncoderStatus::kClosed);
}

TEST_F(AccessUnitEncoderContractTest, AUE_038_ReorderDeeperThanOffsetIsRejected) {
  OpenWithParameterSets();

  // 1 fps, decode order I0 P3 B1: the B frame's DTS lands 2 s in, after its 1.4 s PTS
  constexpr int64_t kSecondUs = 1'000'000;
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({idr_}, 0)), EncoderStatus::kOk);
  ASSERT_EQ(encoder_->Encode(MakeAccessUnit({MakeNonIDRSlice(params_, 6)}, 3 * kSecondUs)),
            EncoderStatus::kOk);
  EXPECT_EQ(encoder_->Encode(MakeAccessUnit({MakeNonIDRSlice(params_, 2, 1)}, kSecondUs)),
            EncoderStatus::kCodecError);

  ASSERT_EQ(packets().size(), 2u);
  for (const EncodedPacket& packet : packets()) {
    EXPECT_LE(packet.dts_90k.value_or(packet.pts_90k), packet.pts_90k);
  }
  EXPECT_EQ(encoder_->GetStats().errors, 1u);
  EXPECT_EQ(encoder_->GetStats().packets_written, 2u);
}

TEST_F(AccessUnitEncoderContractTest, AUE_037_StatusNames) {
  EXPECT_STREQ(encoder::ToString(EncoderStatus::kOk), "kOk");
  EXPECT_STREQ(encoder::ToString(EncoderStatus::kParameterSetError), "kParameterSetError");
  EXPECT_STREQ(encoder::ToString(EncoderStatus::kClosed), "kClosed");
  EXPECT_STREQ(encoder::ToString(EncoderState::kStreaming), "Streaming");
}

}  // namespace h264ts::tests::contracts
