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
#include <mutex>

namespace quotegate {

  /* Cooperative cancellation flag.  Requests are sticky until reset(). */
  class StopFlag {
  public:
    StopFlag();

    StopFlag(const StopFlag &) = delete;

    void request_stop();

    bool is_requested() const;

    /* Clear a previous request, ready for a new run */
    void reset();

    /* Returns true if stop was requested before the duration elapsed */
    bool wait_for_requested(std::chrono::milliseconds);

  private:
    mutable std::mutex _mutex;
    std::condition_variable _condition;
    bool _is_requested;
  };

}
