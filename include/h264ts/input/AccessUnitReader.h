// Repository: h264ts
// Component: Access-Unit Reader
// Purpose: Demuxes an H.264 video stream into Annex-B access units using libavformat.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_INPUT_ACCESS_UNIT_READER_H_
#define H264TS_INPUT_ACCESS_UNIT_READER_H_

#include <cstdint>
#include <optional>
#include <string>

#include "h264ts/bitstream/NALUnit.h"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVBSFContext;
struct AVPacket;

namespace h264ts::input {

// ReaderConfig holds configuration for AccessUnitReader.
struct ReaderConfig {
  std::string input_uri;     // File path or URI to read
  double frame_rate = 0.0;   // Used for streams without timestamps (0 = from container)
};

// AccessUnitReader yields one access unit per demuxed video packet.
//
// Packets of MP4/MKV-style inputs are converted to Annex-B with the
// h264_mp4toannexb bitstream filter and split into NAL units. Inputs that
// are already Annex-B pass through unchanged.
//
// Usage:
// 1. Construct with config
// 2. Call Open()
// 3. Call ReadNext() until it returns false, then check IsEOF()
// 4. Call Close() or rely on destructor
class AccessUnitReader {
 public:
  explicit AccessUnitReader(const ReaderConfig& config);
  ~AccessUnitReader();

  // Disable copy and move
  AccessUnitReader(const AccessUnitReader&) = delete;
  AccessUnitReader& operator=(const AccessUnitReader&) = delete;
  AccessUnitReader(AccessUnitReader&&) = delete;
  AccessUnitReader& operator=(AccessUnitReader&&) = delete;

  // Opens the input and selects the first H.264 video stream.
  // Returns true on success, false on failure.
  bool Open();

  // Reads the next access unit in decode order.
  // Returns false at end of stream or on error.
  bool ReadNext(bitstream::AccessUnit& access_unit);

  void Close();

  bool IsOpen() const { return format_ctx_ != nullptr; }
  bool IsEOF() const { return eof_reached_; }
  bool HasError() const { return has_error_; }

  // Parameter sets found in the stream's codec extradata, if any.
  const std::optional<bitstream::NALUnit>& sps() const { return sps_; }
  const std::optional<bitstream::NALUnit>& pps() const { return pps_; }

  // Frame rate used for untimestamped packets.
  double frame_rate() const { return frame_rate_; }

  uint64_t AccessUnitsRead() const { return access_units_read_; }

 private:
  bool FindVideoStream();
  bool InitializeBitstreamFilter();

  // Collects SPS/PPS from the Annex-B extradata the filter produces.
  void ExtractParameterSets(const uint8_t* data, int size);

  // Converts the filtered packet. Returns false if it holds no NAL units.
  bool ConvertPacket(bitstream::AccessUnit& access_unit);

  void Fail(const char* what, int error_code);

  ReaderConfig config_;

  AVFormatContext* format_ctx_;
  AVBSFContext* bsf_ctx_;
  AVPacket* packet_;
  AVPacket* filtered_packet_;

  int video_stream_index_;
  int64_t start_time_;
  double frame_rate_;
  bool draining_;
  bool eof_reached_;
  bool has_error_;
  uint64_t access_units_read_;

  std::optional<bitstream::NALUnit> sps_;
  std::optional<bitstream::NALUnit> pps_;
};

}  // namespace h264ts::input

#endif  // H264TS_INPUT_ACCESS_UNIT_READER_H_
