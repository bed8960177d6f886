/* @file FileLogger.cpp
 * @brief chunked fwrite-backed CSV writer
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring> // for strerror
#include <iostream>
#include <utility>

// divewatch headers
#include "io/FileLogger.hpp"

using namespace divewatch::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)),
      written_(std::exchange(other.written_, 0)) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
    written_ = std::exchange(other.written_, 0);
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "w");
  if (fp_ == nullptr) {
    std::cerr << "[FileLogger] open " << path << ": " << std::strerror(errno) << '\n';
    return false;
  }
  buffer_.reserve(kChunkSize);
  written_ = 0;
  return true;
}

void FileLogger::write(const std::string& csv) {
  if (fp_ == nullptr)
    return;
  buffer_.insert(buffer_.end(), csv.begin(), csv.end());
  if (buffer_.size() >= kChunkSize)
    flush();
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;

  std::size_t total = 0;
  while (total < buffer_.size()) {
    const std::size_t n = std::min(kChunkSize, buffer_.size() - total);
    const std::size_t written = std::fwrite(buffer_.data() + total, 1, n, fp_);
    written_ += written;
    if (written != n) {
      std::cerr << "[FileLogger] short write: " << std::strerror(errno) << '\n';
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(total + written));
      return false;
    }
    total += written;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (fp_ == nullptr)
    return;
  if (!flush())
    std::cerr << "[FileLogger] buffered lines lost on close\n";
  std::fclose(fp_);
  fp_ = nullptr;
}
