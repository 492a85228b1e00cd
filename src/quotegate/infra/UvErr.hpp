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

#include <ostream>
#include <string>

namespace quotegate
{

/** Stores a libuv error code, as returned from the libuv system call
 * wrappers. */
class UvErr
{
public:
  /** Default constructor represents success (ie not-an-error). */
  UvErr() noexcept : _value(0) {}

  UvErr(int libuv_error_code) noexcept : _value(libuv_error_code) {}

  /** Return libuv error code, eg, UV_EOF indicate end of file */
  int value() const noexcept { return _value; }

  /** Convert to the errno value; libuv codes are negated errno on unix */
  int os_value() const noexcept { return -_value; }

  bool is_eof() const;

  /** Check if error value is non-zero, indicating an error */
  explicit operator bool() const noexcept { return _value != 0; }

  /* Obtain explanatory error message related to error value */
  const char* message() const;

private:
  int _value;
};

inline std::ostream& operator<<(std::ostream& os, UvErr ec)
{
  return (os << ec.os_value() << "(" << ec.message() << ")");
}

} // namespace quotegate
