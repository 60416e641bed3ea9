// Repository: h264ts
// Component: FFmpeg MPEG-TS Muxer
// Purpose: TSMuxer backed by the libavformat mpegts muxer and a custom AVIO sink.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_MUX_FFMPEG_TS_MUXER_HPP_
#define H264TS_MUX_FFMPEG_TS_MUXER_HPP_

#include "h264ts/mux/TSMuxer.h"

#include <cstdint>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

namespace h264ts::mux {

// FFmpegTSMuxer owns the libavformat muxer handles.
// It opens the muxer in Initialize(), writes one AVPacket per
// WritePacket() and writes the trailer in Flush().
//
// Stream layout: PAT, PMT with one H.264 stream at config.video_pid, PCR on
// the same PID. The PES header carries PTS only when the packet DTS is
// absent or equal to the PTS.
class FFmpegTSMuxer : public TSMuxer {
 public:
  FFmpegTSMuxer();
  ~FFmpegTSMuxer() override;

  // Disable copy and move
  FFmpegTSMuxer(const FFmpegTSMuxer&) = delete;
  FFmpegTSMuxer& operator=(const FFmpegTSMuxer&) = delete;
  FFmpegTSMuxer(FFmpegTSMuxer&&) = delete;
  FFmpegTSMuxer& operator=(FFmpegTSMuxer&&) = delete;

  bool Initialize(const MuxerConfig& config, output::OutputSink& sink) override;
  bool WritePacket(const EncodedPacket& packet) override;
  bool Flush() override;
  void Cleanup() override;
  bool IsInitialized() const override { return is_initialized_; }

  uint64_t PacketsWritten() const { return packets_written_; }

 private:
  // libavformat 61 made the write callback buffer const
#if LIBAVFORMAT_VERSION_MAJOR >= 61
  static int AVIOWriteThunk(void* opaque, const uint8_t* buf, int buf_size);
#else
  static int AVIOWriteThunk(void* opaque, uint8_t* buf, int buf_size);
#endif
  int HandleAVIOWrite(const uint8_t* buf, int buf_size);

  // Logs an FFmpeg error code with context.
  static void LogAVError(const char* what, int error_code);

  MuxerConfig config_;
  output::OutputSink* sink_;

  AVFormatContext* format_ctx_;
  AVStream* video_stream_;
  AVIOContext* avio_ctx_;
  AVPacket* packet_;

  bool is_initialized_;
  bool header_written_;
  bool trailer_written_;
  uint64_t packets_written_;
};

}  // namespace h264ts::mux

#endif  // H264TS_MUX_FFMPEG_TS_MUXER_HPP_
