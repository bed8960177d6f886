#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded, thread-safe FIFO that drops the oldest entry when full.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace divewatch {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity circular queue shared by one producer side and one consumer.
 *
 *  * `push()` never blocks; overflow overwrites the oldest slot.
 *  * `popWait()` blocks the consumer for at most \p timeout.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be non-zero");
      }

      /// @returns false if an older entry had to be dropped to make room.
      bool push(T value) {
        bool kept = true;
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (size_ == slots_.size()) {
            head_ = (head_ + 1) % slots_.size();
            --size_;
            ++dropped_;
            kept = false;
          }
          slots_[(head_ + size_) % slots_.size()] = std::move(value);
          ++size_;
        }
        cv_.notify_one();
        return kept;
      }

      std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        return popLocked();
      }

      std::optional<T> popWait(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return size_ > 0; });
        return popLocked();
      }

      /// Wake a consumer blocked in popWait() (used on shutdown).
      void wake() { cv_.notify_all(); }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return size_;
      }

      std::size_t capacity() const { return slots_.size(); }

      std::size_t dropped() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return dropped_;
      }

    private:
      std::optional<T> popLocked() {
        if (size_ == 0)
          return std::nullopt;
        std::optional<T> out{ std::move(slots_[head_]) };
        head_ = (head_ + 1) % slots_.size();
        --size_;
        return out;
      }

      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t size_{ 0 };
      std::size_t dropped_{ 0 };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace divewatch
