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

#include <quotegate/core/RateLimiter.hpp>
#include <quotegate/core/Logger.hpp>

namespace quotegate
{

RateLimiter::RateLimiter(clock_fn clock) : _clock(std::move(clock)) {}


void RateLimiter::set_limit(const std::string& provider, int max_calls,
                            std::chrono::milliseconds window)
{
  std::lock_guard<std::mutex> guard(_states_mutex);

  if (max_calls <= 0 || window.count() <= 0) {
    _states.erase(provider);
    LOG_INFO("rate limit removed for " << QUOTE(provider));
    return;
  }

  // callers already waiting on a replaced state finish against the old limit
  auto state = std::make_shared<WindowState>();
  state->max_calls = max_calls;
  state->window = window;
  _states[provider] = std::move(state);

  LOG_INFO("rate limit for " << QUOTE(provider) << ": " << max_calls
           << " calls per " << window.count() << "ms");
}


std::shared_ptr<RateLimiter::WindowState> RateLimiter::find(
    const std::string& provider) const
{
  std::lock_guard<std::mutex> guard(_states_mutex);
  auto iter = _states.find(provider);
  return iter == _states.end() ? nullptr : iter->second;
}


void RateLimiter::acquire(const std::string& provider)
{
  auto state = find(provider);
  if (!state)
    return;

  std::unique_lock<std::mutex> lock(state->mutex);
  bool waited = false;

  while (true) {
    auto tp_now = now();

    if (!state->started) {
      state->started = true;
      state->window_start = tp_now;
      state->calls = 0;
    }

    auto window_end = state->window_start + state->window;
    if (tp_now >= window_end) {
      /* Roll forward.  When a caller waited for the reset the new window
       * starts at the reset instant; after an idle period it starts now. */
      state->window_start = (tp_now - window_end < state->window) ? window_end : tp_now;
      state->calls = 0;
      state->condvar.notify_all();
      continue;
    }

    if (state->calls < state->max_calls) {
      ++state->calls;
      if (waited)
        LOG_DEBUG("rate limit slot granted for " << QUOTE(provider));
      return;
    }

    if (!waited)
      LOG_DEBUG("rate limit reached for " << QUOTE(provider) << ", waiting "
                << std::chrono::duration_cast<std::chrono::milliseconds>(
                       window_end - tp_now).count() << "ms");
    waited = true;
    state->condvar.wait_until(lock, window_end);
  }
}


int RateLimiter::calls_in_window(const std::string& provider) const
{
  auto state = find(provider);
  if (!state)
    return 0;
  std::lock_guard<std::mutex> lock(state->mutex);
  return state->calls;
}

} // namespace quotegate
