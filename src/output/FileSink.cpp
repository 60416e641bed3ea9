// Repository: h264ts
// Component: File Sink
// Purpose: Buffered file destination for transport stream output.
// Copyright (c) 2025 RetroVue

#include "h264ts/output/FileSink.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>

namespace h264ts::output {

FileSink::FileSink(const FileSinkConfig& config)
    : config_(config),
      fd_(-1),
      bytes_written_(0),
      has_error_(false) {}

FileSink::~FileSink() {
  Close();
}

bool FileSink::Open() {
  if (fd_ >= 0) {
    return true;  // Already open
  }

  if (config_.path.empty()) {
    std::cerr << "[FileSink] No output path configured" << std::endl;
    return false;
  }

  fd_ = ::open(config_.path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
               static_cast<mode_t>(config_.file_mode));
  if (fd_ < 0) {
    std::cerr << "[FileSink] Failed to open " << config_.path << ": "
              << std::strerror(errno) << std::endl;
    return false;
  }

  buffer_.clear();
  buffer_.reserve(config_.buffer_size);
  bytes_written_ = 0;
  has_error_ = false;

  std::cout << "[FileSink] Opened " << config_.path << std::endl;
  return true;
}

bool FileSink::Write(const uint8_t* data, size_t size) {
  if (fd_ < 0 || has_error_) {
    return false;
  }
  if (size == 0) {
    return true;
  }

  if (buffer_.size() + size > config_.buffer_size) {
    if (!Flush()) {
      return false;
    }
    // Larger than the whole buffer: bypass it
    if (size >= config_.buffer_size) {
      if (!WriteFully(data, size)) {
        return false;
      }
      bytes_written_ += size;
      return true;
    }
  }

  buffer_.insert(buffer_.end(), data, data + size);
  bytes_written_ += size;
  return true;
}

bool FileSink::Flush() {
  if (fd_ < 0) {
    return false;
  }
  if (buffer_.empty()) {
    return !has_error_;
  }
  const bool ok = WriteFully(buffer_.data(), buffer_.size());
  buffer_.clear();
  return ok;
}

void FileSink::Close() {
  if (fd_ < 0) {
    return;
  }

  if (!Flush()) {
    std::cerr << "[FileSink] Flush on close failed for " << config_.path << std::endl;
  }

  if (::close(fd_) < 0) {
    std::cerr << "[FileSink] Failed to close " << config_.path << ": "
              << std::strerror(errno) << std::endl;
    has_error_ = true;
  }
  fd_ = -1;

  std::cout << "[FileSink] Closed " << config_.path << " | bytes=" << bytes_written_
            << std::endl;
}

bool FileSink::WriteFully(const uint8_t* data, size_t size) {
  size_t offset = 0;
  while (offset < size) {
    const ssize_t written = ::write(fd_, data + offset, size - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[FileSink] Write failed for " << config_.path << ": "
                << std::strerror(errno) << std::endl;
      has_error_ = true;
      return false;
    }
    offset += static_cast<size_t>(written);
  }
  return true;
}

}  // namespace h264ts::output
