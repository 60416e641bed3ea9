// Repository: h264ts
// Component: Access-Unit Encoder
// Purpose: Turns H.264 access units into timestamped PES packets of an MPEG transport stream.
// Copyright (c) 2025 RetroVue

#include "h264ts/encoder/AccessUnitEncoder.h"

#include "h264ts/mux/ClockUtils.hpp"

#include <iostream>
#include <utility>

namespace h264ts::encoder {

namespace {

// Access unit delimiter with primary_pic_type 7 (any slice type)
const bitstream::NALUnit kAccessUnitDelimiter = {0x09, 0xF0};

// Drop notices are logged once per this many drops
constexpr uint64_t kDropLogInterval = 100;

}  // namespace

const char* ToString(EncoderState state) {
  switch (state) {
    case EncoderState::kCreated:
      return "Created";
    case EncoderState::kOpened:
      return "Opened";
    case EncoderState::kReady:
      return "Ready";
    case EncoderState::kStreaming:
      return "Streaming";
    case EncoderState::kClosed:
      return "Closed";
  }
  return "Unknown";
}

AccessUnitEncoder::AccessUnitEncoder(const EncoderConfig& config,
                                     std::unique_ptr<bitstream::BitstreamCodec> codec,
                                     std::unique_ptr<mux::TSMuxer> muxer,
                                     std::unique_ptr<output::OutputSink> sink)
    : config_(config),
      codec_(std::move(codec)),
      muxer_(std::move(muxer)),
      sink_(std::move(sink)) {}

AccessUnitEncoder::~AccessUnitEncoder() {
  if (!closed_) {
    const EncoderStatus status = Close();
    if (status != EncoderStatus::kOk) {
      std::cerr << "[AccessUnitEncoder] Close on destruction failed: " << ToString(status)
                << std::endl;
    }
  }
}

EncoderStatus AccessUnitEncoder::Open(const std::optional<bitstream::NALUnit>& initial_sps,
                                      const std::optional<bitstream::NALUnit>& initial_pps) {
  if (closed_) {
    return EncoderStatus::kClosed;
  }
  if (opened_) {
    return EncoderStatus::kOk;  // Already open
  }
  if (!codec_ || !muxer_ || !sink_) {
    std::cerr << "[AccessUnitEncoder] Missing codec, muxer or sink" << std::endl;
    return EncoderStatus::kInvalidInput;
  }

  if (initial_sps) {
    if (initial_sps->empty()) {
      std::cerr << "[AccessUnitEncoder] Initial SPS is empty" << std::endl;
      return EncoderStatus::kParameterSetError;
    }
    if (!codec_->DecodeSPS(*initial_sps, decoded_sps_)) {
      std::cerr << "[AccessUnitEncoder] Initial SPS could not be decoded" << std::endl;
      return EncoderStatus::kParameterSetError;
    }
    stats_.sps_decodes++;
    sps_ = *initial_sps;
  }
  if (initial_pps) {
    if (initial_pps->empty()) {
      std::cerr << "[AccessUnitEncoder] Initial PPS is empty" << std::endl;
      return EncoderStatus::kParameterSetError;
    }
    pps_ = *initial_pps;
  }

  if (!sink_->Open()) {
    std::cerr << "[AccessUnitEncoder] Failed to open output sink" << std::endl;
    return EncoderStatus::kIOError;
  }

  mux::MuxerConfig mux_config;
  mux_config.video_pid = config_.video_pid;
  mux_config.pcr_pid = config_.video_pid;
  mux_config.stream_type = mux::kStreamTypeH264;
  mux_config.avio_buffer_size = config_.mux_buffer_size;

  if (!muxer_->Initialize(mux_config, *sink_)) {
    std::cerr << "[AccessUnitEncoder] Failed to initialize muxer" << std::endl;
    muxer_->Cleanup();
    sink_->Close();
    return EncoderStatus::kMuxError;
  }

  opened_ = true;
  std::cout << "[AccessUnitEncoder] Opened | pid=" << config_.video_pid
            << " pts_offset_us=" << config_.pts_offset_us
            << " sps=" << (sps_ ? "yes" : "no") << " pps=" << (pps_ ? "yes" : "no")
            << std::endl;
  return EncoderStatus::kOk;
}

EncoderStatus AccessUnitEncoder::Encode(const bitstream::AccessUnit& access_unit) {
  if (closed_) {
    return EncoderStatus::kClosed;
  }
  if (!opened_) {
    std::cerr << "[AccessUnitEncoder] Encode() called before Open()" << std::endl;
    return EncoderStatus::kClosed;
  }

  stats_.access_units_received++;

  if (access_unit.nal_units.empty()) {
    std::cerr << "[AccessUnitEncoder] Empty access unit" << std::endl;
    return Fail(EncoderStatus::kInvalidInput);
  }
  for (const auto& nal_unit : access_unit.nal_units) {
    if (nal_unit.empty()) {
      std::cerr << "[AccessUnitEncoder] Access unit contains an empty NAL unit" << std::endl;
      return Fail(EncoderStatus::kInvalidInput);
    }
  }

  if (!baseline_captured_) {
    baseline_pts_us_ = access_unit.pts_us;
    baseline_captured_ = true;
  }

  std::vector<bitstream::NALUnit> filtered;
  EncoderStatus status = FilterNALUnits(access_unit.nal_units, filtered);
  if (status != EncoderStatus::kOk) {
    return Fail(status);
  }

  // Readiness gate
  if (!sps_ || !pps_) {
    stats_.dropped_not_ready++;
    if (stats_.dropped_not_ready % kDropLogInterval == 1) {
      std::cout << "[AccessUnitEncoder] Waiting for SPS/PPS | dropped="
                << stats_.dropped_not_ready << std::endl;
    }
    return EncoderStatus::kOk;
  }

  const bool idr_present = bitstream::IDRPresent(filtered);

  // First-IDR gate
  if (!first_idr_received_) {
    if (!idr_present) {
      stats_.dropped_before_idr++;
      if (stats_.dropped_before_idr % kDropLogInterval == 1) {
        std::cout << "[AccessUnitEncoder] Waiting for first IDR | dropped="
                  << stats_.dropped_before_idr << std::endl;
      }
      return EncoderStatus::kOk;
    }
    first_idr_received_ = true;
  }

  mux::EncodedPacket packet;
  if (!codec_->PackAnnexB(filtered, packet.payload)) {
    return Fail(EncoderStatus::kCodecError);
  }

  int64_t pts_us = access_unit.pts_us - baseline_pts_us_;
  int64_t dts_us = 0;
  if (!codec_->ExtractDTS(filtered, idr_present, pts_us, decoded_sps_, dts_us)) {
    std::cerr << "[AccessUnitEncoder] DTS extraction failed | pts_us=" << pts_us << std::endl;
    return Fail(EncoderStatus::kCodecError);
  }
  pts_us += config_.pts_offset_us;

  // Reordering deeper than the offset cannot be represented
  if (dts_us > pts_us) {
    std::cerr << "[AccessUnitEncoder] DTS after PTS | dts_us=" << dts_us
              << " pts_us=" << pts_us << std::endl;
    return Fail(EncoderStatus::kCodecError);
  }

  packet.pid = config_.video_pid;
  packet.random_access = idr_present;
  packet.stream_id = mux::kVideoStreamId;
  packet.marker_bits = mux::kPESMarkerBits;
  packet.pts_90k = mux::ClockUtils::MicrosecondsTo90k(pts_us);
  if (dts_us != pts_us) {
    packet.dts_90k = mux::ClockUtils::MicrosecondsTo90k(dts_us);
  }

  if (!muxer_->WritePacket(packet)) {
    if (sink_->HasError()) {
      std::cerr << "[AccessUnitEncoder] Output write failed" << std::endl;
      return Fail(EncoderStatus::kIOError);
    }
    std::cerr << "[AccessUnitEncoder] Muxer rejected packet | pts_90k=" << packet.pts_90k
              << std::endl;
    return Fail(EncoderStatus::kMuxError);
  }

  stats_.packets_written++;
  stats_.payload_bytes += packet.payload.size();

  if (!first_packet_written_) {
    first_packet_written_ = true;
    std::cout << "[AccessUnitEncoder] First packet written | pts_90k=" << packet.pts_90k
              << " dts_90k=" << packet.dts_90k.value_or(packet.pts_90k)
              << " bytes=" << packet.payload.size() << std::endl;
  }
  return EncoderStatus::kOk;
}

EncoderStatus AccessUnitEncoder::Close() {
  if (closed_) {
    return EncoderStatus::kClosed;
  }
  closed_ = true;

  if (!opened_) {
    return EncoderStatus::kOk;
  }

  EncoderStatus status = EncoderStatus::kOk;
  if (!muxer_->Flush()) {
    status = sink_->HasError() ? EncoderStatus::kIOError : EncoderStatus::kMuxError;
    std::cerr << "[AccessUnitEncoder] Muxer flush failed: " << ToString(status) << std::endl;
  }
  muxer_->Cleanup();

  if (!sink_->Flush() && status == EncoderStatus::kOk) {
    std::cerr << "[AccessUnitEncoder] Sink flush failed" << std::endl;
    status = EncoderStatus::kIOError;
  }
  sink_->Close();
  if (sink_->HasError() && status == EncoderStatus::kOk) {
    status = EncoderStatus::kIOError;
  }

  std::cout << "[AccessUnitEncoder] Closed | received=" << stats_.access_units_received
            << " written=" << stats_.packets_written
            << " dropped_not_ready=" << stats_.dropped_not_ready
            << " dropped_before_idr=" << stats_.dropped_before_idr
            << " errors=" << stats_.errors << std::endl;
  return status;
}

EncoderState AccessUnitEncoder::state() const {
  if (closed_) {
    return EncoderState::kClosed;
  }
  if (!opened_) {
    return EncoderState::kCreated;
  }
  if (!sps_ || !pps_) {
    return EncoderState::kOpened;
  }
  if (!first_idr_received_) {
    return EncoderState::kReady;
  }
  return EncoderState::kStreaming;
}

EncoderStatus AccessUnitEncoder::FilterNALUnits(const std::vector<bitstream::NALUnit>& input,
                                                std::vector<bitstream::NALUnit>& filtered) {
  filtered.clear();
  filtered.reserve(input.size() + 3);
  filtered.push_back(kAccessUnitDelimiter);

  for (const auto& nal_unit : input) {
    switch (bitstream::GetNALUnitType(nal_unit)) {
      case bitstream::NALUnitType::SPS: {
        const EncoderStatus status = UpdateSPS(nal_unit);
        if (status != EncoderStatus::kOk) {
          return status;
        }
        break;
      }

      case bitstream::NALUnitType::PPS:
        pps_ = nal_unit;
        break;

      case bitstream::NALUnitType::ACCESS_UNIT_DELIMITER:
      case bitstream::NALUnitType::SEI:
        break;

      case bitstream::NALUnitType::CODED_SLICE_IDR:
        // Every IDR carries the parameter sets needed to decode it
        if (sps_ && pps_) {
          filtered.push_back(*sps_);
          filtered.push_back(*pps_);
        }
        filtered.push_back(nal_unit);
        break;

      default:
        filtered.push_back(nal_unit);
        break;
    }
  }
  return EncoderStatus::kOk;
}

EncoderStatus AccessUnitEncoder::UpdateSPS(const bitstream::NALUnit& nal_unit) {
  if (!sps_ || *sps_ != nal_unit) {
    bitstream::SPS decoded;
    if (!codec_->DecodeSPS(nal_unit, decoded)) {
      std::cerr << "[AccessUnitEncoder] In-band SPS could not be decoded" << std::endl;
      return EncoderStatus::kParameterSetError;
    }
    decoded_sps_ = std::move(decoded);
    stats_.sps_decodes++;
    if (sps_) {
      std::cout << "[AccessUnitEncoder] SPS changed" << std::endl;
    }
  }
  sps_ = nal_unit;
  return EncoderStatus::kOk;
}

EncoderStatus AccessUnitEncoder::Fail(EncoderStatus status) {
  stats_.errors++;
  return status;
}

}  // namespace h264ts::encoder
