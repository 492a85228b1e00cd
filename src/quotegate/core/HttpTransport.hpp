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

#include <quotegate/core/Request.hpp>

namespace quotegate
{

/* Performs one HTTP request/response exchange.  Any response that arrives is
 * returned whatever its status; only connectivity failures (timeout, name
 * resolution, connection reset) throw, as TransportError. */
class HttpTransport
{
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse perform(const HttpRequest&) = 0;
};

} // namespace quotegate
