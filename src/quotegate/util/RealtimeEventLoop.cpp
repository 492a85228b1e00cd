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

#include <quotegate/util/RealtimeEventLoop.hpp>
#include <quotegate/core/Logger.hpp>

#include <vector>

namespace quotegate
{

RealtimeEventLoop::RealtimeEventLoop(std::string thread_label,
                                     std::function<bool()> on_exception)
  : _thread_label(std::move(thread_label)),
    _on_exception(std::move(on_exception)),
    _thread(&RealtimeEventLoop::run, this)
{
}


RealtimeEventLoop::~RealtimeEventLoop() { sync_stop(); }


void RealtimeEventLoop::sync_stop()
{
  {
    std::lock_guard<std::mutex> guard(_mutex);
    _stopping = true;
    _condvar.notify_one();
  }

  if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id())
    _thread.join();
}


void RealtimeEventLoop::dispatch(std::function<void()> fn)
{
  std::lock_guard<std::mutex> guard(_mutex);
  _pending.push_back(std::move(fn));
  _condvar.notify_one();
}


void RealtimeEventLoop::dispatch(std::chrono::milliseconds delay, timer_fn fn)
{
  std::lock_guard<std::mutex> guard(_mutex);
  _timers.emplace(clock_type::now() + delay, std::move(fn));
  _condvar.notify_one();
}


void RealtimeEventLoop::run()
{
  Logger::instance().register_thread_id(_thread_label);

  std::deque<std::function<void()>> ready;
  std::vector<timer_fn> due;

  std::unique_lock<std::mutex> lock(_mutex);
  while (!_stopping) {
    auto tp_now = clock_type::now();
    auto due_end = _timers.upper_bound(tp_now);

    if (_pending.empty() && due_end == _timers.begin()) {
      if (_timers.empty())
        _condvar.wait(lock);
      else
        _condvar.wait_until(lock, _timers.begin()->first);
      continue;
    }

    ready.swap(_pending);
    for (auto iter = _timers.begin(); iter != due_end; ++iter)
      due.push_back(std::move(iter->second));
    _timers.erase(_timers.begin(), due_end);

    lock.unlock();

    for (auto& fn : ready)
      if (!_stopping)
        invoke(fn);

    for (auto& fn : due) {
      if (_stopping)
        break;
      std::chrono::milliseconds repeat{0};
      invoke([&]() { repeat = fn(); });
      if (repeat.count() > 0)
        dispatch(repeat, std::move(fn));
    }

    ready.clear();
    due.clear();
    lock.lock();
  }
}


void RealtimeEventLoop::invoke(const std::function<void()>& fn)
{
  try {
    fn();
  } catch (...) {
    handle_exception();
  }
}


void RealtimeEventLoop::handle_exception()
{
  if (!_on_exception) {
    log_exception(_thread_label.c_str());
    return;
  }

  try {
    if (_on_exception())
      _stopping = true;
  } catch (...) {
    log_exception("event loop exception handler");
  }
}

} // namespace quotegate
