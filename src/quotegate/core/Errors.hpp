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

/* Classification of failures reported by the dispatcher and the streaming
 * session. */
enum class ErrorKind {
  transport,
  http_status,
  decode,
  connection_closed,
  callback
};

inline const char* to_string(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::transport:
      return "transport";
    case ErrorKind::http_status:
      return "http_status";
    case ErrorKind::decode:
      return "decode";
    case ErrorKind::connection_closed:
      return "connection_closed";
    case ErrorKind::callback:
      return "callback";
  }
  return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, ErrorKind kind)
{
  return os << to_string(kind);
}

/* Error delivered to a streaming consumer's error callback */
struct StreamError {
  ErrorKind kind;
  std::string message;
};

} // namespace quotegate
