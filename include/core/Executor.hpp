#pragma once
/** @file  Executor.hpp
 *  @brief Serialized execution context every scheduler mutation runs on.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "core/Clock.hpp"

namespace divewatch {
  namespace core {

    /**
 * @class SerialExecutor
 * @brief Mailbox that runs posted tasks one at a time, in post order.
 *
 *  * `post()` is thread-safe and never runs the task inline.
 *  * `postAfter()` queues the task once `delay` of monotonic time has passed.
 *  * Platform callbacks are funnelled through here before touching state.
 */
    class SerialExecutor {
    public:
      using Task = std::function<void()>;

      virtual ~SerialExecutor() = default;
      virtual void post(Task task) = 0;
      virtual void postAfter(std::chrono::milliseconds delay, Task task) = 0;
    };

    /**
 * @class TaskGuard
 * @brief Ties tasks posted by an object to that object's lifetime.
 *
 *  * A `wrap()`ped task runs under the guard's lock and is skipped once closed.
 *  * `close()` blocks until a wrapped task that is already running returns, so
 *    an owner that closes first in its destructor is never used after free.
 *  * Never close a guard from inside one of its own tasks.
 */
    class TaskGuard {
    public:
      TaskGuard();
      ~TaskGuard(); ///< close()

      /// The returned task holds only the guard's shared state, never the owner.
      SerialExecutor::Task wrap(SerialExecutor::Task task) const;

      void close();
      bool closed() const;

      TaskGuard(const TaskGuard&) = delete;
      TaskGuard& operator=(const TaskGuard&) = delete;

    private:
      struct State {
        std::mutex mtx;
        bool open{ true };
      };
      std::shared_ptr<State> state_;
    };

    /**
 * @class WorkerExecutor
 * @brief One worker thread draining a condition-variable guarded deque.
 *
 *  * Delayed tasks wait in a deadline map keyed on steady_clock.
 *  * `shutdown()` runs what is queued and drops timers that are not yet due.
 */
    class WorkerExecutor : public SerialExecutor {
    public:
      WorkerExecutor();
      ~WorkerExecutor() override; ///< drains remaining tasks, then joins

      void post(Task task) override;
      void postAfter(std::chrono::milliseconds delay, Task task) override;

      /// Stop accepting work, run what is queued, join the worker.
      void shutdown();

      WorkerExecutor(const WorkerExecutor&) = delete;
      WorkerExecutor& operator=(const WorkerExecutor&) = delete;

    private:
      void pump();
      void promoteDue(std::chrono::steady_clock::time_point now); ///< caller holds mtx_

      std::deque<Task> queue_;
      std::multimap<std::chrono::steady_clock::time_point, Task> timers_;
      std::mutex mtx_;
      std::condition_variable cv_;
      std::atomic<bool> running_{ true };
      std::thread worker_;
    };

    /**
 * @class ManualExecutor
 * @brief Deterministic executor drained explicitly by the owner loop.
 *
 *  * Used by the replay tool and unit tests.
 *  * Tasks posted while draining run in the same `runPending()` call.
 *  * Delayed tasks fire during `runPending()` once the clock's monotonic time
 *    reaches their deadline; `postAfter()` without a clock throws.
 */
    class ManualExecutor : public SerialExecutor {
    public:
      explicit ManualExecutor(std::shared_ptr<const Clock> clock = nullptr);

      void post(Task task) override;
      void postAfter(std::chrono::milliseconds delay, Task task) override;

      /// Runs queued and due tasks until none are left; returns how many ran.
      std::size_t runPending();

      std::size_t pending() const;
      std::size_t scheduled() const; ///< delayed tasks not yet due

    private:
      std::shared_ptr<const Clock> clock_;
      std::deque<Task> queue_;
      std::multimap<SteadyPoint, Task> timers_;
      mutable std::mutex mtx_;
    };

  } // namespace core
} // namespace divewatch
