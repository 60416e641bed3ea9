// Repository: h264ts
// Component: OutputSink Interface
// Purpose: Base interface for byte-ordered transport stream destinations.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_OUTPUT_OUTPUT_SINK_H_
#define H264TS_OUTPUT_OUTPUT_SINK_H_

#include <cstddef>
#include <cstdint>

namespace h264ts::output {

// OutputSink receives muxed transport stream bytes in order.
// Sinks may buffer internally; Flush() and Close() push buffered bytes out.
// A sink is used by exactly one encoder and is not thread-safe.
class OutputSink {
 public:
  virtual ~OutputSink() = default;

  // Acquires the destination. Returns false if it cannot be opened.
  virtual bool Open() = 0;

  // Appends bytes. Returns false if the sink is closed or the write failed.
  virtual bool Write(const uint8_t* data, size_t size) = 0;

  // Pushes buffered bytes to the destination.
  virtual bool Flush() = 0;

  // Flushes and releases the destination. Safe to call multiple times.
  virtual void Close() = 0;

  // Returns true between a successful Open() and Close().
  virtual bool IsOpen() const = 0;

  // Returns true once any write or flush has failed.
  virtual bool HasError() const = 0;
};

}  // namespace h264ts::output

#endif  // H264TS_OUTPUT_OUTPUT_SINK_H_
