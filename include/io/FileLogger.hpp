#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered CSV writer for the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace divewatch {
  namespace io {

    /**
 * @class FileLogger
 * @brief Owns the FILE* behind a Logger run file and batches CSV rows into 4 kB fwrites.
 *
 *  * Not thread-safe; only the Logger worker (or finishRun after the join) touches it.
 *  * A failed flush keeps the unwritten tail buffered for the next attempt.
 */
    class FileLogger {
    public:
      static constexpr std::size_t kChunkSize = 4096;

      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one CSV line (caller includes trailing '\n'). */
      void write(const std::string& csv);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      /// Bytes handed to the OS since the last open().
      std::size_t bytesWritten() const { return written_; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      FILE* fp_{ nullptr };
      std::vector<char> buffer_;
      std::size_t written_{ 0 };
    };

  } // namespace io
} // namespace divewatch
