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

#include <quotegate/util/StopFlag.hpp>

namespace quotegate {


StopFlag::StopFlag()
  : _is_requested(false)
{
}


void StopFlag::request_stop()
{
  std::unique_lock<std::mutex> lock(_mutex);
  _is_requested = true;
  _condition.notify_all();
}


bool StopFlag::is_requested() const
{
  std::unique_lock<std::mutex> lock(_mutex);
  return _is_requested;
}


void StopFlag::reset()
{
  std::unique_lock<std::mutex> lock(_mutex);
  _is_requested = false;
}


bool StopFlag::wait_for_requested(std::chrono::milliseconds duration)
{
  std::unique_lock<std::mutex> lock(_mutex);
  return _condition.wait_for(lock, duration,
                             [&]{ return _is_requested; } );
}

}
