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

#include <chrono>
#include <functional>

namespace quotegate
{

/* Somewhere to run work off the caller's thread: the streaming heartbeat,
 * websocket pings and asynchronous provider requests. */
class EventLoop
{
public:
  /* Returns the delay until the next invocation; zero ends the timer. */
  using timer_fn = std::function<std::chrono::milliseconds()>;

  virtual ~EventLoop() = default;

  virtual void dispatch(std::function<void()> fn) = 0;

  /* Run `fn` after `delay`, and again after each delay it returns. */
  virtual void dispatch(std::chrono::milliseconds delay, timer_fn fn) = 0;
};

} // namespace quotegate
