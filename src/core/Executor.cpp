/* @file Executor.cpp
 * @brief worker-thread and manual mailboxes for the serialized context
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

// divewatch headers
#include "core/Executor.hpp"

using namespace divewatch::core;

namespace {

  // A task must never take the mailbox down with it.
  void runGuarded(const SerialExecutor::Task& task) {
    try {
      task();
    } catch (const std::exception& e) {
      std::cerr << "[Executor] task threw: " << e.what() << '\n';
    }
  }

} // namespace

// -------------------------------------------------------------------
// TaskGuard
// -------------------------------------------------------------------
TaskGuard::TaskGuard() : state_(std::make_shared<State>()) {}

TaskGuard::~TaskGuard() { close(); }

SerialExecutor::Task TaskGuard::wrap(SerialExecutor::Task task) const {
  return [state = state_, task = std::move(task)] {
    std::lock_guard<std::mutex> lock(state->mtx);
    if (state->open)
      task();
  };
}

void TaskGuard::close() {
  std::lock_guard<std::mutex> lock(state_->mtx);
  state_->open = false;
}

bool TaskGuard::closed() const {
  std::lock_guard<std::mutex> lock(state_->mtx);
  return !state_->open;
}

// -------------------------------------------------------------------
// WorkerExecutor
// -------------------------------------------------------------------
WorkerExecutor::WorkerExecutor() : worker_([this] { pump(); }) {}

WorkerExecutor::~WorkerExecutor() { shutdown(); }

void WorkerExecutor::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_)
      return;
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void WorkerExecutor::postAfter(std::chrono::milliseconds delay, Task task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_)
      return;
    timers_.emplace(std::chrono::steady_clock::now() + delay, std::move(task));
  }
  cv_.notify_one();
}

void WorkerExecutor::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

void WorkerExecutor::promoteDue(std::chrono::steady_clock::time_point now) {
  while (!timers_.empty() && timers_.begin()->first <= now) {
    queue_.push_back(std::move(timers_.begin()->second));
    timers_.erase(timers_.begin());
  }
}

void WorkerExecutor::pump() {
  std::unique_lock<std::mutex> lock(mtx_);
  while (true) {
    promoteDue(std::chrono::steady_clock::now());
    if (!queue_.empty()) {
      Task task = std::move(queue_.front());
      queue_.pop_front();
      lock.unlock();
      runGuarded(task);
      lock.lock();
      continue;
    }
    if (!running_)
      return; // stopped and drained; pending timers are dropped

    if (timers_.empty())
      cv_.wait(lock);
    else
      cv_.wait_until(lock, timers_.begin()->first);
  }
}

// -------------------------------------------------------------------
// ManualExecutor
// -------------------------------------------------------------------
ManualExecutor::ManualExecutor(std::shared_ptr<const Clock> clock) : clock_(std::move(clock)) {}

void ManualExecutor::post(Task task) {
  std::lock_guard<std::mutex> lock(mtx_);
  queue_.push_back(std::move(task));
}

void ManualExecutor::postAfter(std::chrono::milliseconds delay, Task task) {
  if (!clock_)
    throw std::logic_error("[ManualExecutor] delayed task posted without a clock");
  const SteadyPoint due = clock_->monotonic() + delay;
  std::lock_guard<std::mutex> lock(mtx_);
  timers_.emplace(due, std::move(task));
}

std::size_t ManualExecutor::runPending() {
  std::size_t ran = 0;
  while (true) {
    Task task;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (clock_) {
        const SteadyPoint now = clock_->monotonic();
        while (!timers_.empty() && timers_.begin()->first <= now) {
          queue_.push_back(std::move(timers_.begin()->second));
          timers_.erase(timers_.begin());
        }
      }
      if (queue_.empty())
        break;
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    runGuarded(task);
    ++ran;
  }
  return ran;
}

std::size_t ManualExecutor::pending() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return queue_.size();
}

std::size_t ManualExecutor::scheduled() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return timers_.size();
}
