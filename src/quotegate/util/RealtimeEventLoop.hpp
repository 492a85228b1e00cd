/* Copyright 2024 Automated Algo (www.automatedalgo.com)

This file is part of Automated Algo's "Quotegate" project.

Quotegate is free software: you can redistribute it and/or modify it under the
terms of the GNU Lesser General Public License as published by the Free
Software Foundation, either version 3 of the License, or (at your option) any
later version.

Quotegate is distributed in the hope that it will be useful, but WITHOUT ANY
WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A
PARTICULAR PURPOSE. See the GNU Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License along
with Quotegate. If not, see <https://www.gnu.org/licenses/>.
*/

#pragma once

#include <quotegate/util/EventLoop.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace quotegate
{

/** Event thread.  Functions posted to the loop run one at a time, in order
 * of posting, on a single dedicated thread; timers run once due. */
class RealtimeEventLoop : public EventLoop
{
public:
  /* The on_exception handler is invoked from within a catch block whenever a
   * dispatched function throws; it returns true to request loop termination. */
  explicit RealtimeEventLoop(std::string thread_label,
                             std::function<bool()> on_exception = {});
  RealtimeEventLoop(const RealtimeEventLoop&) = delete;
  RealtimeEventLoop& operator=(const RealtimeEventLoop&) = delete;
  ~RealtimeEventLoop();

  /** Stop the loop and join its thread.  Work not yet started is dropped. */
  void sync_stop();

  void dispatch(std::function<void()> fn) override;

  void dispatch(std::chrono::milliseconds, timer_fn fn) override;

private:
  using clock_type = std::chrono::steady_clock;

  void run();
  void invoke(const std::function<void()>&);
  void handle_exception();

  std::string _thread_label;
  std::function<bool()> _on_exception;
  std::atomic<bool> _stopping{false};

  std::mutex _mutex;
  std::condition_variable _condvar;
  std::deque<std::function<void()>> _pending;
  std::multimap<clock_type::time_point, timer_fn> _timers;

  std::thread _thread; // last member, started once the rest is constructed
};

} // namespace quotegate
