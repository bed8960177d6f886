#pragma once
/** @file  Clock.hpp
 *  @brief Injectable time source (wall clock in production, manual in replay/tests).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <mutex>

namespace divewatch {
  namespace core {

    using TimePoint = std::chrono::system_clock::time_point;   ///< timestamps, log rows
    using SteadyPoint = std::chrono::steady_clock::time_point; ///< durations, deadlines

    /**
 * @class Clock
 * @brief Wall time for stamping events, monotonic time for measuring them.
 *
 *  * Cycle durations, throttle windows and dwell times use `monotonic()` so a
 *    wall-clock step (NTP, timezone, user edit) cannot stretch or shrink them.
 */
    class Clock {
    public:
      virtual ~Clock() = default;
      virtual TimePoint now() const = 0;
      virtual SteadyPoint monotonic() const = 0;
    };

    class SystemClock : public Clock {
    public:
      TimePoint now() const override { return std::chrono::system_clock::now(); }
      SteadyPoint monotonic() const override { return std::chrono::steady_clock::now(); }
    };

    /**
 * @class ManualClock
 * @brief Clock that only moves when told to.
 *
 *  * Replay tool sets it from track timestamps; tests advance it explicitly.
 *  * `advance()` moves both timelines; `stepWall()` moves wall time only.
 *  * `set()` jumps wall time; monotonic time follows forward jumps only.
 */
    class ManualClock : public Clock {
    public:
      explicit ManualClock(TimePoint start = TimePoint{}) : now_{ start } {}

      TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return now_;
      }

      SteadyPoint monotonic() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return steady_;
      }

      void set(TimePoint t) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (t > now_)
          steady_ += std::chrono::duration_cast<SteadyPoint::duration>(t - now_);
        now_ = t;
      }

      template <typename Rep, typename Period> void advance(std::chrono::duration<Rep, Period> d) {
        std::lock_guard<std::mutex> lock(mtx_);
        now_ += std::chrono::duration_cast<TimePoint::duration>(d);
        steady_ += std::chrono::duration_cast<SteadyPoint::duration>(d);
      }

      template <typename Rep, typename Period> void stepWall(std::chrono::duration<Rep, Period> d) {
        std::lock_guard<std::mutex> lock(mtx_);
        now_ += std::chrono::duration_cast<TimePoint::duration>(d);
      }

    private:
      mutable std::mutex mtx_;
      TimePoint now_;
      SteadyPoint steady_{};
    };

  } // namespace core
} // namespace divewatch
