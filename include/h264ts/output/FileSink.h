// Repository: h264ts
// Component: File Sink
// Purpose: Buffered file destination for transport stream output.
// Copyright (c) 2025 RetroVue

#ifndef H264TS_OUTPUT_FILE_SINK_H_
#define H264TS_OUTPUT_FILE_SINK_H_

#include "h264ts/output/OutputSink.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace h264ts::output {

// File sink configuration
struct FileSinkConfig {
  std::string path;                  // Output file (created or truncated)
  size_t buffer_size = 64 * 1024;    // Bytes held before a write(2)
  int file_mode = 0644;              // Permissions for a newly created file
};

// FileSink writes to a file descriptor through an in-process buffer.
// The descriptor is released by Close() or, at the latest, the destructor.
class FileSink : public OutputSink {
 public:
  explicit FileSink(const FileSinkConfig& config);
  ~FileSink() override;

  // Disable copy and move
  FileSink(const FileSink&) = delete;
  FileSink& operator=(const FileSink&) = delete;
  FileSink(FileSink&&) = delete;
  FileSink& operator=(FileSink&&) = delete;

  bool Open() override;
  bool Write(const uint8_t* data, size_t size) override;
  bool Flush() override;
  void Close() override;
  bool IsOpen() const override { return fd_ >= 0; }
  bool HasError() const override { return has_error_; }

  // Total bytes accepted by Write().
  uint64_t BytesWritten() const { return bytes_written_; }

 private:
  // Writes the whole range to fd_, retrying on EINTR and short writes.
  bool WriteFully(const uint8_t* data, size_t size);

  FileSinkConfig config_;
  int fd_;
  std::vector<uint8_t> buffer_;
  uint64_t bytes_written_;
  bool has_error_;
};

}  // namespace h264ts::output

#endif  // H264TS_OUTPUT_FILE_SINK_H_
