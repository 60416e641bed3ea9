// Repository: h264ts
// Component: FFmpeg MPEG-TS Muxer
// Purpose: TSMuxer backed by the libavformat mpegts muxer and a custom AVIO sink.
// Copyright (c) 2025 RetroVue

#include "h264ts/mux/FFmpegTSMuxer.hpp"
#include "h264ts/output/OutputSink.h"

#include <cstring>
#include <iostream>
#include <string>

extern "C" {
#include <libavutil/dict.h>
#include <libavutil/log.h>  // For av_log_set_level
#include <libavutil/mathematics.h>
#include <libavutil/mem.h>
}

namespace h264ts::mux {

namespace {

constexpr uint16_t kMinElementaryPid = 0x0010;
constexpr uint16_t kMaxElementaryPid = 0x1FFE;

}  // namespace

FFmpegTSMuxer::FFmpegTSMuxer()
    : sink_(nullptr),
      format_ctx_(nullptr),
      video_stream_(nullptr),
      avio_ctx_(nullptr),
      packet_(nullptr),
      is_initialized_(false),
      header_written_(false),
      trailer_written_(false),
      packets_written_(0) {}

FFmpegTSMuxer::~FFmpegTSMuxer() {
  Cleanup();
}

bool FFmpegTSMuxer::Initialize(const MuxerConfig& config, output::OutputSink& sink) {
  if (is_initialized_) {
    return true;  // Already initialized
  }

  if (config.video_pid < kMinElementaryPid || config.video_pid > kMaxElementaryPid) {
    std::cerr << "[FFmpegTSMuxer] Invalid video PID " << config.video_pid << std::endl;
    return false;
  }
  // libavformat places the PCR on the first video stream
  if (config.pcr_pid != config.video_pid) {
    std::cerr << "[FFmpegTSMuxer] PCR must be carried on the video PID (pcr_pid="
              << config.pcr_pid << " video_pid=" << config.video_pid << ")" << std::endl;
    return false;
  }
  if (config.stream_type != kStreamTypeH264) {
    std::cerr << "[FFmpegTSMuxer] Unsupported stream_type " << static_cast<int>(config.stream_type)
              << std::endl;
    return false;
  }

  config_ = config;
  sink_ = &sink;
  packets_written_ = 0;

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, "mpegts", nullptr);
  if (ret < 0 || !format_ctx_) {
    LogAVError("Failed to allocate output context", ret);
    Cleanup();
    return false;
  }

  // Custom AVIO: every byte the muxer produces goes to the sink
  const int buffer_size = config_.avio_buffer_size > 0 ? config_.avio_buffer_size : 16 * 1024;
  uint8_t* buffer = static_cast<uint8_t*>(av_malloc(static_cast<size_t>(buffer_size)));
  if (!buffer) {
    std::cerr << "[FFmpegTSMuxer] Failed to allocate AVIO buffer" << std::endl;
    Cleanup();
    return false;
  }

  avio_ctx_ = avio_alloc_context(buffer, buffer_size, 1, this, nullptr,
                                 &FFmpegTSMuxer::AVIOWriteThunk, nullptr);
  if (!avio_ctx_) {
    std::cerr << "[FFmpegTSMuxer] Failed to allocate AVIO context" << std::endl;
    av_free(buffer);
    Cleanup();
    return false;
  }
  avio_ctx_->seekable = 0;
  format_ctx_->pb = avio_ctx_;
  format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;

  // Timestamps are written as given; no muxer-side delay is added
  format_ctx_->max_delay = 0;

  video_stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!video_stream_) {
    std::cerr << "[FFmpegTSMuxer] Failed to create video stream" << std::endl;
    Cleanup();
    return false;
  }

  // Stream ids >= 16 are used verbatim as the elementary PID
  video_stream_->id = config_.video_pid;
  video_stream_->codecpar->codec_type = AVMEDIA_TYPE_VIDEO;
  video_stream_->codecpar->codec_id = AV_CODEC_ID_H264;
  video_stream_->time_base.num = 1;
  video_stream_->time_base.den = 90000;  // MPEG-TS timebase is 90kHz

  AVDictionary* muxer_opts = nullptr;
  // VBR mode: PCR follows timestamps instead of a fixed bitrate clock
  av_dict_set(&muxer_opts, "muxrate", "0", 0);
  // Repeat PAT/PMT before every keyframe so playback can start there
  av_dict_set(&muxer_opts, "mpegts_flags", "+pat_pmt_at_frames", 0);

  ret = avformat_write_header(format_ctx_, &muxer_opts);
  av_dict_free(&muxer_opts);
  if (ret < 0) {
    LogAVError("Failed to write header", ret);
    Cleanup();
    return false;
  }
  header_written_ = true;

  packet_ = av_packet_alloc();
  if (!packet_) {
    std::cerr << "[FFmpegTSMuxer] Failed to allocate packet" << std::endl;
    Cleanup();
    return false;
  }

  is_initialized_ = true;
  std::cout << "[FFmpegTSMuxer] Muxer initialized | video_pid=" << config_.video_pid
            << " pcr_pid=" << config_.pcr_pid << std::endl;
  return true;
}

bool FFmpegTSMuxer::WritePacket(const EncodedPacket& packet) {
  if (!is_initialized_ || trailer_written_) {
    std::cerr << "[FFmpegTSMuxer] WritePacket() called on a muxer that is not open" << std::endl;
    return false;
  }

  if (packet.pid != config_.video_pid) {
    std::cerr << "[FFmpegTSMuxer] Unknown PID " << packet.pid << std::endl;
    return false;
  }
  if (packet.stream_id != kVideoStreamId || packet.marker_bits != kPESMarkerBits) {
    std::cerr << "[FFmpegTSMuxer] Unsupported PES header | stream_id="
              << static_cast<int>(packet.stream_id)
              << " marker_bits=" << static_cast<int>(packet.marker_bits) << std::endl;
    return false;
  }
  if (packet.payload.empty()) {
    std::cerr << "[FFmpegTSMuxer] Empty payload" << std::endl;
    return false;
  }

  int ret = av_new_packet(packet_, static_cast<int>(packet.payload.size()));
  if (ret < 0) {
    LogAVError("Failed to allocate packet payload", ret);
    return false;
  }
  std::memcpy(packet_->data, packet.payload.data(), packet.payload.size());

  packet_->stream_index = video_stream_->index;
  packet_->pts = packet.pts_90k;
  // Equal PTS and DTS make the muxer emit a PTS-only PES header
  packet_->dts = packet.dts_90k.value_or(packet.pts_90k);
  if (packet.random_access) {
    packet_->flags |= AV_PKT_FLAG_KEY;
  }

  // The muxer may have adjusted the stream time base in avformat_write_header
  const AVRational tb90k = {1, 90000};
  av_packet_rescale_ts(packet_, tb90k, video_stream_->time_base);

  ret = av_write_frame(format_ctx_, packet_);
  av_packet_unref(packet_);
  if (ret < 0) {
    LogAVError("Error writing packet", ret);
    return false;
  }

  if (sink_->HasError()) {
    std::cerr << "[FFmpegTSMuxer] Sink reported a write failure" << std::endl;
    return false;
  }

  packets_written_++;
  return true;
}

bool FFmpegTSMuxer::Flush() {
  if (!is_initialized_) {
    return false;
  }

  if (header_written_ && !trailer_written_) {
    // Trailer drains any queued packets and flushes the AVIO buffer
    int ret = av_write_trailer(format_ctx_);
    trailer_written_ = true;
    if (ret < 0) {
      LogAVError("Error writing trailer", ret);
      return false;
    }
    std::cout << "[FFmpegTSMuxer] Trailer written | packets=" << packets_written_ << std::endl;
  }

  avio_flush(avio_ctx_);
  if (avio_ctx_->error < 0) {
    LogAVError("Error flushing output", avio_ctx_->error);
    return false;
  }
  return !sink_->HasError();
}

void FFmpegTSMuxer::Cleanup() {
  if (avio_ctx_) {
    if (avio_ctx_->buffer) {
      av_freep(&avio_ctx_->buffer);
    }
    avio_context_free(&avio_ctx_);
    if (format_ctx_) {
      format_ctx_->pb = nullptr;
    }
  }

  av_packet_free(&packet_);

  if (format_ctx_) {
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }

  video_stream_ = nullptr;
  sink_ = nullptr;
  header_written_ = false;
  trailer_written_ = false;
  is_initialized_ = false;
}

#if LIBAVFORMAT_VERSION_MAJOR >= 61
int FFmpegTSMuxer::AVIOWriteThunk(void* opaque, const uint8_t* buf, int buf_size) {
#else
int FFmpegTSMuxer::AVIOWriteThunk(void* opaque, uint8_t* buf, int buf_size) {
#endif
  if (opaque == nullptr) {
    return AVERROR(EINVAL);
  }
  auto* muxer = static_cast<FFmpegTSMuxer*>(opaque);
  return muxer->HandleAVIOWrite(buf, buf_size);
}

int FFmpegTSMuxer::HandleAVIOWrite(const uint8_t* buf, int buf_size) {
  if (buf_size <= 0) {
    return 0;
  }
  if (sink_ == nullptr || !sink_->Write(buf, static_cast<size_t>(buf_size))) {
    return AVERROR(EIO);
  }
  return buf_size;
}

void FFmpegTSMuxer::LogAVError(const char* what, int error_code) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(error_code, errbuf, AV_ERROR_MAX_STRING_SIZE);
  std::cerr << "[FFmpegTSMuxer] " << what << ": " << errbuf << std::endl;
}

}  // namespace h264ts::mux
