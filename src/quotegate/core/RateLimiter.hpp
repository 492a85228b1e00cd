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
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace quotegate
{

/* Fixed-window call pacing, keyed by provider name.  acquire() blocks the
 * caller until a slot in the current window is available; callers for
 * different providers never wait on each other. */
class RateLimiter
{
public:
  using clock_type = std::chrono::steady_clock;
  using clock_fn = std::function<clock_type::time_point()>;

  explicit RateLimiter(clock_fn clock = {});

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  /* Register or replace the limit for a provider.  A max_calls of zero or
   * less removes the limit. */
  void set_limit(const std::string& provider, int max_calls,
                 std::chrono::milliseconds window);

  /* Block until a call to `provider` may be issued, and reserve it.  A
   * provider without a registered limit is never delayed. */
  void acquire(const std::string& provider);

  /* Number of calls granted in the provider's current window; diagnostics */
  int calls_in_window(const std::string& provider) const;

private:
  struct WindowState {
    std::mutex mutex;
    std::condition_variable condvar;
    int max_calls = 0;
    std::chrono::milliseconds window{0};
    clock_type::time_point window_start{};
    int calls = 0;
    bool started = false;
  };

  std::shared_ptr<WindowState> find(const std::string& provider) const;

  clock_type::time_point now() const { return _clock ? _clock() : clock_type::now(); }

  clock_fn _clock;

  mutable std::mutex _states_mutex;
  std::map<std::string, std::shared_ptr<WindowState>> _states;
};

} // namespace quotegate
