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

#include <quotegate/core/HttpTransport.hpp>

#include <string>

namespace quotegate
{

/* Percent-encode `s` for use in a url query; throws TransportError if
 * libcurl cannot encode it. */
std::string url_encode(const std::string& s);

/* HttpTransport built on libcurl easy handles.  Each perform() uses its own
 * handle, so a single instance can be shared between threads. */
class CurlTransport : public HttpTransport
{
public:
  CurlTransport();

  HttpResponse perform(const HttpRequest&) override;
};

} // namespace quotegate
