/* @file Logger.cpp
 * @brief worker thread that drains LogEvents into a CSV run file
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <string>
#include <utility>

// divewatch headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"
#include "io/FileLogger.hpp"

using namespace divewatch::core;

namespace {

  constexpr std::chrono::milliseconds kDrainPoll{ 50 };

  // CSV-escape free text: quote when it contains separators or quotes.
  std::string csvField(const std::string& in) {
    if (in.find_first_of(",\"\n") == std::string::npos)
      return in;
    std::string out = "\"";
    for (char c : in) {
      if (c == '"')
        out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

} // namespace

const char* divewatch::core::toString(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  default:
    return "unknown";
  }
}

Logger::Logger(std::size_t capacity)
    : csvFile_(std::make_unique<io::FileLogger>()),
      buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)) {}

Logger::~Logger() { finishRun(); }

bool Logger::startNewRun(const std::string& csvPath) {
  if (running_)
    finishRun();

  if (!csvFile_->open(csvPath)) {
    std::cerr << "[Logger] cannot open run file: " << csvPath << '\n';
    return false;
  }
  csvFile_->write("timestamp_ms,level,component,message\n");

  running_ = true;
  worker_ = std::thread([this] { drain(); });
  return true;
}

void Logger::log(LogLevel level, std::string component, std::string message) {
  log(LogEvent{ std::chrono::system_clock::now(), level, std::move(component), std::move(message) });
}

void Logger::log(LogEvent event) {
  if (event.level >= echoLevel_.load()) {
    std::lock_guard<std::mutex> lock(echoMtx_);
    std::cerr << '[' << event.component << "] " << event.message << '\n';
  }
  if (running_)
    buffer_->push(std::move(event));
}

void Logger::finishRun() {
  if (!running_.exchange(false))
    return;
  buffer_->wake();
  if (worker_.joinable())
    worker_.join();

  // whatever was queued after the worker's last pass
  while (auto ev = buffer_->tryPop())
    writeRow(*ev);

  if (buffer_->dropped() > 0)
    std::cerr << "[Logger] dropped " << buffer_->dropped() << " events (buffer full)\n";
  csvFile_->close();
}

void Logger::drain() {
  while (running_) {
    if (auto ev = buffer_->popWait(kDrainPoll))
      writeRow(*ev);
  }
}

void Logger::writeRow(const LogEvent& event) {
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(event.when.time_since_epoch()).count();
  csvFile_->write(std::to_string(ms) + ',' + toString(event.level) + ',' +
                  csvField(event.component) + ',' + csvField(event.message) + '\n');
}
