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

#include <quotegate/util/Config.hpp>
#include <quotegate/core/Logger.hpp>

#include <cstdlib>
#include <regex>

namespace quotegate
{

std::string interpolate_string(const std::string& s)
{
  static const std::regex re("\\$\\{([a-zA-Z0-9_]*)\\}");

  std::string out;
  std::smatch sm;
  auto curr = s.cbegin();
  while (std::regex_search(curr, s.cend(), sm, re)) {
    out.append(sm.prefix().first, sm.prefix().second);
    if (const char* value = ::getenv(sm.str(1).c_str()))
      out += value;
    curr = sm.suffix().first;
  }
  out.append(curr, s.cend());
  return out;
}


Config Config::empty_config() { return Config(json::object()); }


bool Config::has(const std::string& field) const
{
  return _raw.is_object() && _raw.find(field) != _raw.end();
}


std::vector<std::string> Config::keys() const
{
  std::vector<std::string> names;
  if (_raw.is_object())
    for (auto& item : _raw.items())
      names.push_back(item.key());
  return names;
}


const json& Config::find_field(const std::string& field) const
{
  std::ostringstream oss;
  if (!_raw.is_object()) {
    oss << "required json object when getting field " << QUOTE(field);
    throw ConfigError(oss.str());
  }

  auto iter = _raw.find(field);
  if (iter == _raw.end()) {
    oss << "field not found, " << QUOTE(field);
    if (!_path.empty())
      oss << " in " << QUOTE(_path);
    throw MissingFieldConfigError(oss.str());
  }
  return *iter;
}


ConfigError Config::type_error(const std::string& field, const char* type) const
{
  std::ostringstream oss;
  oss << "field not of type " << type << ", " << QUOTE(field);
  if (!_path.empty())
    oss << " in " << QUOTE(_path);
  return ConfigError(oss.str());
}


Config Config::get_sub_config(const std::string& field) const
{
  auto& value = find_field(field);
  if (!value.is_object() && !value.is_array())
    throw type_error(field, "json-object or json-array");
  return Config(value, _path.empty() ? field : _path + "." + field);
}


Config Config::get_sub_config(const std::string& field,
                              Config default_value) const
{
  return has(field) ? get_sub_config(field) : default_value;
}


bool Config::get_bool(const std::string& field, bool default_value) const
{
  if (!has(field))
    return default_value;
  auto& value = find_field(field);
  if (!value.is_boolean())
    throw type_error(field, "boolean");
  return value.get<bool>();
}


std::string Config::get_string(const std::string& field) const
{
  auto& value = find_field(field);
  if (!value.is_string())
    throw type_error(field, "string");
  return interpolate_string(value.get<std::string>());
}


std::string Config::get_string(const std::string& field,
                               const std::string& default_value) const
{
  return has(field) ? get_string(field) : default_value;
}


uint64_t Config::get_uint(const std::string& field,
                          uint64_t default_value) const
{
  if (!has(field))
    return default_value;
  auto& value = find_field(field);
  if (!value.is_number_unsigned())
    throw type_error(field, "unsigned-number");
  return value.get<uint64_t>();
}


std::chrono::milliseconds Config::get_millis(
    const std::string& field, std::chrono::milliseconds default_value) const
{
  return std::chrono::milliseconds(
      get_uint(field, static_cast<uint64_t>(default_value.count())));
}

} // namespace quotegate
