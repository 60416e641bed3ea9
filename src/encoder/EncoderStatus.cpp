// Repository: h264ts
// Component: Encoder Status
// Purpose: Result codes returned by AccessUnitEncoder operations.
// Copyright (c) 2025 RetroVue

#include "h264ts/encoder/EncoderStatus.h"

namespace h264ts::encoder {

const char* ToString(EncoderStatus status) {
  switch (status) {
    case EncoderStatus::kOk:
      return "kOk";
    case EncoderStatus::kIOError:
      return "kIOError";
    case EncoderStatus::kParameterSetError:
      return "kParameterSetError";
    case EncoderStatus::kCodecError:
      return "kCodecError";
    case EncoderStatus::kMuxError:
      return "kMuxError";
    case EncoderStatus::kInvalidInput:
      return "kInvalidInput";
    case EncoderStatus::kClosed:
      return "kClosed";
  }
  return "kUnknown";
}

}  // namespace h264ts::encoder
