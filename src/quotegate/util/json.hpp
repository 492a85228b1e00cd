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

#define JSON_USE_IMPLICIT_CONVERSIONS 0
#include <nlohmann/json.hpp>

using json = nlohmann::json;

#include <sstream>
#include <stdexcept>
#include <string>

namespace quotegate
{

/* Malformed or unexpected provider payload */
class parse_error : public std::runtime_error
{
public:
  explicit parse_error(std::string s) : std::runtime_error(std::move(s)) {}
};

#define THROW_PARSE_ERROR(X)                                                   \
  do {                                                                         \
    std::ostringstream oss;                                                    \
    oss << X;                                                                  \
    throw quotegate::parse_error(oss.str());                                   \
  } while (false)


/* Parse raw bytes into a json value; throws parse_error with the parser
 * message and the byte offset on malformed input. */
json decode_json(const char* buf, size_t len);

/* Load a json file which may contain comments; throws ConfigError if the
 * file cannot be read or parsed. */
json read_json_config_file(const std::string& path);

} // namespace quotegate
