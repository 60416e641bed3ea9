// Repository: h264ts
// Component: Access-Unit Reader
// Purpose: Demuxes an H.264 video stream into Annex-B access units using libavformat.
// Copyright (c) 2025 RetroVue

#include "h264ts/input/AccessUnitReader.h"

#include "h264ts/bitstream/AnnexB.hpp"

#include <cmath>
#include <iostream>
#include <utility>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavcodec/bsf.h>
#include <libavformat/avformat.h>
#include <libavutil/log.h>  // For av_log_set_level
#include <libavutil/mathematics.h>
}

namespace h264ts::input {

namespace {

// Frame rate assumed when neither the config nor the container has one
constexpr double kDefaultFrameRate = 25.0;

const AVRational kMicrosecondTimeBase = {1, 1000000};

bool ValidRate(AVRational rate) {
  return rate.num > 0 && rate.den > 0;
}

}  // namespace

AccessUnitReader::AccessUnitReader(const ReaderConfig& config)
    : config_(config),
      format_ctx_(nullptr),
      bsf_ctx_(nullptr),
      packet_(nullptr),
      filtered_packet_(nullptr),
      video_stream_index_(-1),
      start_time_(0),
      frame_rate_(0.0),
      draining_(false),
      eof_reached_(false),
      has_error_(false),
      access_units_read_(0) {}

AccessUnitReader::~AccessUnitReader() {
  Close();
}

bool AccessUnitReader::Open() {
  if (IsOpen()) {
    return true;  // Already open
  }

  std::cout << "[AccessUnitReader] Opening: " << config_.input_uri << std::endl;

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    Fail("Failed to open input", ret);
    format_ctx_ = nullptr;
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    Fail("Failed to find stream info", ret);
    Close();
    return false;
  }

  if (!FindVideoStream()) {
    std::cerr << "[AccessUnitReader] No H.264 video stream found" << std::endl;
    has_error_ = true;
    Close();
    return false;
  }

  if (!InitializeBitstreamFilter()) {
    Close();
    return false;
  }

  packet_ = av_packet_alloc();
  filtered_packet_ = av_packet_alloc();
  if (!packet_ || !filtered_packet_) {
    std::cerr << "[AccessUnitReader] Failed to allocate packets" << std::endl;
    has_error_ = true;
    Close();
    return false;
  }

  draining_ = false;
  eof_reached_ = false;
  access_units_read_ = 0;

  std::cout << "[AccessUnitReader] Opened | stream=" << video_stream_index_
            << " fps=" << frame_rate_ << " sps=" << (sps_ ? "yes" : "no")
            << " pps=" << (pps_ ? "yes" : "no") << std::endl;
  return true;
}

bool AccessUnitReader::ReadNext(bitstream::AccessUnit& access_unit) {
  if (!IsOpen() || eof_reached_ || has_error_) {
    return false;
  }

  while (true) {
    int ret = av_bsf_receive_packet(bsf_ctx_, filtered_packet_);
    if (ret == 0) {
      const bool converted = ConvertPacket(access_unit);
      av_packet_unref(filtered_packet_);
      if (converted) {
        access_units_read_++;
        return true;
      }
      continue;  // Packet without NAL units
    }
    if (ret == AVERROR_EOF) {
      eof_reached_ = true;
      std::cout << "[AccessUnitReader] End of stream | access_units="
                << access_units_read_ << std::endl;
      return false;
    }
    if (ret != AVERROR(EAGAIN)) {
      Fail("Bitstream filter failed", ret);
      return false;
    }

    // Filter needs more input
    if (draining_) {
      eof_reached_ = true;
      return false;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      draining_ = true;
      ret = av_bsf_send_packet(bsf_ctx_, nullptr);
      if (ret < 0) {
        Fail("Failed to drain bitstream filter", ret);
        return false;
      }
      continue;
    }
    if (ret < 0) {
      Fail("Failed to read packet", ret);
      return false;
    }

    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }

    ret = av_bsf_send_packet(bsf_ctx_, packet_);
    if (ret < 0) {
      av_packet_unref(packet_);
      Fail("Failed to send packet to bitstream filter", ret);
      return false;
    }
  }
}

void AccessUnitReader::Close() {
  av_packet_free(&filtered_packet_);
  av_packet_free(&packet_);
  av_bsf_free(&bsf_ctx_);

  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
    format_ctx_ = nullptr;
  }

  video_stream_index_ = -1;
}

bool AccessUnitReader::FindVideoStream() {
  for (unsigned int i = 0; i < format_ctx_->nb_streams; i++) {
    AVStream* stream = format_ctx_->streams[i];
    if (stream->codecpar->codec_type != AVMEDIA_TYPE_VIDEO ||
        stream->codecpar->codec_id != AV_CODEC_ID_H264) {
      continue;
    }

    video_stream_index_ = static_cast<int>(i);
    start_time_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;

    if (config_.frame_rate > 0.0) {
      frame_rate_ = config_.frame_rate;
    } else if (ValidRate(stream->avg_frame_rate)) {
      frame_rate_ = av_q2d(stream->avg_frame_rate);
    } else if (ValidRate(stream->r_frame_rate)) {
      frame_rate_ = av_q2d(stream->r_frame_rate);
    } else {
      frame_rate_ = kDefaultFrameRate;
    }
    return true;
  }

  return false;
}

bool AccessUnitReader::InitializeBitstreamFilter() {
  const AVBitStreamFilter* filter = av_bsf_get_by_name("h264_mp4toannexb");
  if (!filter) {
    std::cerr << "[AccessUnitReader] h264_mp4toannexb filter not available" << std::endl;
    has_error_ = true;
    return false;
  }

  int ret = av_bsf_alloc(filter, &bsf_ctx_);
  if (ret < 0) {
    Fail("Failed to allocate bitstream filter", ret);
    return false;
  }

  AVStream* stream = format_ctx_->streams[video_stream_index_];
  ret = avcodec_parameters_copy(bsf_ctx_->par_in, stream->codecpar);
  if (ret < 0) {
    Fail("Failed to copy codec parameters", ret);
    return false;
  }
  bsf_ctx_->time_base_in = stream->time_base;

  ret = av_bsf_init(bsf_ctx_);
  if (ret < 0) {
    Fail("Failed to initialize bitstream filter", ret);
    return false;
  }

  // After init the output extradata is Annex-B for avcC inputs
  ExtractParameterSets(bsf_ctx_->par_out->extradata, bsf_ctx_->par_out->extradata_size);
  return true;
}

void AccessUnitReader::ExtractParameterSets(const uint8_t* data, int size) {
  if (data == nullptr || size <= 0) {
    return;
  }

  for (auto& nal_unit : bitstream::AnnexB::Split(data, static_cast<size_t>(size))) {
    const bitstream::NALUnitType type = bitstream::GetNALUnitType(nal_unit);
    if (type == bitstream::NALUnitType::SPS && !sps_) {
      sps_ = std::move(nal_unit);
    } else if (type == bitstream::NALUnitType::PPS && !pps_) {
      pps_ = std::move(nal_unit);
    }
  }
}

bool AccessUnitReader::ConvertPacket(bitstream::AccessUnit& access_unit) {
  access_unit.nal_units = bitstream::AnnexB::Split(
      filtered_packet_->data, static_cast<size_t>(filtered_packet_->size));
  if (access_unit.nal_units.empty()) {
    return false;
  }

  if (filtered_packet_->pts != AV_NOPTS_VALUE) {
    const AVRational time_base = bsf_ctx_->time_base_out;
    access_unit.pts_us =
        av_rescale_q(filtered_packet_->pts - start_time_, time_base, kMicrosecondTimeBase);
  } else {
    // No container timestamps: assume a constant frame rate in decode order
    access_unit.pts_us = static_cast<int64_t>(
        std::llround(static_cast<double>(access_units_read_) * 1'000'000.0 / frame_rate_));
  }
  return true;
}

void AccessUnitReader::Fail(const char* what, int error_code) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(error_code, errbuf, AV_ERROR_MAX_STRING_SIZE);
  std::cerr << "[AccessUnitReader] " << what << ": " << errbuf << std::endl;
  has_error_ = true;
}

}  // namespace h264ts::input
