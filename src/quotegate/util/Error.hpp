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

#include <sstream>
#include <stdexcept>

#define THROW( args ) do {                                   \
    std::ostringstream _s;                                   \
    _s << args;                                              \
    throw quotegate::Error(__FILE__, __LINE__, _s.str());    \
  } while (0)


namespace quotegate
{

class Error: public std::runtime_error
{
public:

  Error(std::string filename, int linenumber, std::string msg)
    : std::runtime_error(msg),
      _file(std::move(filename)),
      _ln(linenumber)
  {
  }

  const std::string& file()  const noexcept { return _file; }
  int line() const noexcept { return _ln; }

private:
  std::string _file;
  int _ln;
};


/* Failure to establish a streaming connection, raised synchronously to the
 * caller that requested the connection. */
class ConnectionError : public Error
{
public:
  explicit ConnectionError(const std::string& what) : Error("", 0, what) {}
};


/* Failure at the transport level of a request/response call, eg timeout, DNS
 * failure, connection reset. */
class TransportError : public Error
{
public:
  explicit TransportError(const std::string& what) : Error("", 0, what) {}
};

} // namespace quotegate
