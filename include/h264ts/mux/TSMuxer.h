// Repository: h264ts
// Component: MPEG-TS Muxer
// Purpose: Interface for packaging encoded packets into an MPEG transport stream.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_MUX_TS_MUXER_H_
#define H264TS_MUX_TS_MUXER_H_

#include <cstdint>
#include <optional>
#include <vector>

namespace h264ts::output {
class OutputSink;
}  // namespace h264ts::output

namespace h264ts::mux {

// PES stream_id for the first MPEG video stream
constexpr uint8_t kVideoStreamId = 0xE0;

// PMT stream_type for H.264 video (ISO/IEC 13818-1 Table 2-34)
constexpr uint8_t kStreamTypeH264 = 0x1B;

// The two fixed bits that open the PES optional header ('10')
constexpr uint8_t kPESMarkerBits = 2;

// Muxer configuration
struct MuxerConfig {
  uint16_t video_pid = 256;               // Elementary stream PID
  uint16_t pcr_pid = 256;                 // PID carrying the PCR
  uint8_t stream_type = kStreamTypeH264;  // PMT stream_type
  int avio_buffer_size = 16 * 1024;       // Bytes buffered before the sink sees them
};

// EncodedPacket is one PES payload ready for packetization.
// Transient: built per access unit and handed to the muxer immediately.
struct EncodedPacket {
  uint16_t pid = 256;
  bool random_access = false;             // Adaptation field random_access_indicator
  int64_t pts_90k = 0;
  std::optional<int64_t> dts_90k;         // Absent: PES header carries PTS only
  uint8_t stream_id = kVideoStreamId;
  uint8_t marker_bits = kPESMarkerBits;
  std::vector<uint8_t> payload;           // Annex-B access unit
};

// TSMuxer packages PES payloads into 188-byte transport stream packets.
// Virtual so tests can substitute a recording double.
class TSMuxer {
 public:
  virtual ~TSMuxer() = default;

  // Configure a single video elementary stream writing into sink.
  // The sink must outlive the muxer.
  // Returns true on success, false on failure.
  virtual bool Initialize(const MuxerConfig& config, output::OutputSink& sink) = 0;

  // Mux one packet. Returns true on success, false on failure.
  virtual bool WritePacket(const EncodedPacket& packet) = 0;

  // Finish the stream and push buffered data into the sink.
  // Returns true on success, false on failure.
  virtual bool Flush() = 0;

  // Release muxer resources without writing anything further.
  virtual void Cleanup() = 0;

  // Check if muxer is initialized
  virtual bool IsInitialized() const = 0;
};

}  // namespace h264ts::mux

#endif  // H264TS_MUX_TS_MUXER_H_
