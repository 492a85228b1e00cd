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

#include <quotegate/core/Errors.hpp>
#include <quotegate/util/json.hpp>

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace quotegate
{

enum class HttpMethod { get, post };

enum class ResponseFormat { json, delimited_text };

const char* to_string(HttpMethod);
const char* to_string(ResponseFormat);

/* Description of one provider call, relative to the provider endpoint. */
struct RequestDescriptor {
  std::string target_path;
  std::map<std::string, std::string> query;
  HttpMethod method = HttpMethod::get;
  ResponseFormat response_format = ResponseFormat::json;
  std::string body; // POST only
};


/* Fully resolved request, as handed to an HttpTransport.  Query values are
 * raw; the transport is responsible for url-encoding them. */
struct HttpRequest {
  HttpMethod method = HttpMethod::get;
  std::string url;
  std::vector<std::pair<std::string, std::string>> query;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  std::chrono::milliseconds timeout{0};
  std::chrono::milliseconds connect_timeout{0};
};


struct HttpResponse {
  long status = 0;
  std::string body;
};


/* Result of a dispatched call: either the decoded payload or a classified
 * failure. */
class CallOutcome
{
public:
  struct Failure {
    ErrorKind kind;
    std::string message;
  };

  static CallOutcome success(json payload);
  static CallOutcome failure(ErrorKind, std::string message);

  bool ok() const { return std::holds_alternative<json>(_value); }

  /* Throws Error if this is a failure */
  const json& payload() const;

  /* Throws Error if this is a success */
  const Failure& error() const;

private:
  explicit CallOutcome(std::variant<json, Failure> v) : _value(std::move(v)) {}

  std::variant<json, Failure> _value;
};

std::ostream& operator<<(std::ostream&, const CallOutcome&);

} // namespace quotegate
