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

#include <quotegate/core/Request.hpp>
#include <quotegate/util/Error.hpp>

namespace quotegate
{

const char* to_string(HttpMethod m)
{
  switch (m) {
    case HttpMethod::get:
      return "GET";
    case HttpMethod::post:
      return "POST";
  }
  return "UNKNOWN";
}


const char* to_string(ResponseFormat f)
{
  switch (f) {
    case ResponseFormat::json:
      return "json";
    case ResponseFormat::delimited_text:
      return "delimited_text";
  }
  return "unknown";
}


CallOutcome CallOutcome::success(json payload)
{
  return CallOutcome(std::variant<json, Failure>(std::in_place_index<0>,
                                                 std::move(payload)));
}


CallOutcome CallOutcome::failure(ErrorKind kind, std::string message)
{
  return CallOutcome(std::variant<json, Failure>(
      std::in_place_index<1>, Failure{kind, std::move(message)}));
}


const json& CallOutcome::payload() const
{
  if (auto p = std::get_if<json>(&_value))
    return *p;
  auto& f = std::get<Failure>(_value);
  THROW("call failed, no payload; " << f.kind << ": " << f.message);
}


const CallOutcome::Failure& CallOutcome::error() const
{
  if (auto p = std::get_if<Failure>(&_value))
    return *p;
  THROW("call succeeded, no failure");
}


std::ostream& operator<<(std::ostream& os, const CallOutcome& outcome)
{
  if (outcome.ok())
    os << "success";
  else
    os << "failure(" << outcome.error().kind << ", "
       << outcome.error().message << ")";
  return os;
}

} // namespace quotegate
