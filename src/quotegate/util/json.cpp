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

#include <quotegate/util/json.hpp>
#include <quotegate/util/Config.hpp>
#include <quotegate/core/Logger.hpp>

#include <fstream>

namespace quotegate
{

json decode_json(const char* buf, size_t len)
{
  try {
    return json::parse(buf, buf + len);
  } catch (const json::parse_error& e) {
    THROW_PARSE_ERROR("json decode failed at byte " << e.byte << ": "
                      << e.what());
  }
}


json read_json_config_file(const std::string& path)
{
  std::ifstream ifs(path);
  if (!ifs.is_open())
    throw ConfigError("failed to open config file '" + path + "'");

  try {
    return json::parse(ifs, nullptr, /* allow_exceptions */ true,
                       /* ignore_comments */ true);
  } catch (const json::parse_error& e) {
    throw ConfigError("config file '" + path + "' is not valid json, " +
                      e.what());
  }
}

} // namespace quotegate
