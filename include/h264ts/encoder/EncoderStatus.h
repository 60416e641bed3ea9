// Repository: h264ts
// Component: Encoder Status
// Purpose: Result codes returned by AccessUnitEncoder operations.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_ENCODER_ENCODER_STATUS_H_
#define H264TS_ENCODER_ENCODER_STATUS_H_

namespace h264ts::encoder {

// Outcome of an encoder operation. Failures are not rolled back: bytes the
// muxer already handed to the sink stay there, and parameter sets stored
// before the failing NAL unit stay stored.
enum class EncoderStatus {
  kOk,
  kIOError,            // Output sink could not be opened or written
  kParameterSetError,  // SPS could not be decoded
  kCodecError,         // Annex-B packing or DTS extraction failed, or DTS after PTS
  kMuxError,           // Transport stream muxer rejected the packet
  kInvalidInput,       // Empty access unit or empty NAL unit
  kClosed              // Encoder not open
};

// Returns a stable name for logs ("kOk", "kIOError", ...).
const char* ToString(EncoderStatus status);

}  // namespace h264ts::encoder

#endif  // H264TS_ENCODER_ENCODER_STATUS_H_
