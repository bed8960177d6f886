#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV event logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace divewatch {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warn, Error };

    const char* toString(LogLevel level);

    struct LogEvent {
      std::chrono::system_clock::time_point when{};
      LogLevel level{ LogLevel::Info };
      std::string component; ///< e.g. "RegionScheduler"
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Every component logs through here; a worker drains events to CSV.
 *
 *  * `log()` is non-blocking; when the buffer is full the oldest event is lost.
 *  * Events at or above the echo level also go to stderr as "[Component] msg",
 *    whether or not a run is open.
 */
    class Logger {

    public:
      explicit Logger(std::size_t capacity = 1024);
      ~Logger(); ///< finishRun()

      // --- public API ---
      bool startNewRun(const std::string& csvPath); ///< open file + launch worker thread
      void log(LogEvent event);                     ///< enqueue event (non-blocking)
      void log(LogLevel level, std::string component, std::string message);
      void finishRun(); ///< flush + join worker thread

      void setEchoLevel(LogLevel level) { echoLevel_ = level; }
      bool running() const { return running_; }

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void drain();
      void writeRow(const LogEvent& event);

      std::unique_ptr<io::FileLogger> csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> echoLevel_{ LogLevel::Warn };
      std::mutex echoMtx_;
    };

  } // namespace core
} // namespace divewatch
