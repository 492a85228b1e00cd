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

#include <quotegate/util/json.hpp>
#include <quotegate/util/Error.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace quotegate
{

class ConfigError : public Error
{
public:
  explicit ConfigError(const std::string& what) : Error("", 0, what) {}
};

class MissingFieldConfigError : public ConfigError
{
public:
  explicit MissingFieldConfigError(const std::string& what) : ConfigError(what) {}
};


/* Replace each ${NAME} in `s` with the value of environment variable NAME, or
 * with empty string if the variable is not set. */
std::string interpolate_string(const std::string& s);


/* Read-only view of a json configuration object.  String values have their
 * ${NAME} references interpolated when read.  Getters without a default
 * throw MissingFieldConfigError for an absent field, and all getters throw
 * ConfigError for a field of the wrong type. */
class Config
{
public:
  explicit Config(json raw = {}, std::string path = "")
    : _raw(std::move(raw)), _path(std::move(path))
  {
  }

  static Config empty_config();

  [[nodiscard]] bool has(const std::string& field) const;

  /* Names of the fields of this object, in key order */
  [[nodiscard]] std::vector<std::string> keys() const;

  bool get_bool(const std::string& field, bool default_value) const;

  Config get_sub_config(const std::string& field) const;
  Config get_sub_config(const std::string& field, Config default_value) const;

  std::string get_string(const std::string& field) const;
  std::string get_string(const std::string& field,
                         const std::string& default_value) const;

  uint64_t get_uint(const std::string& field, uint64_t default_value) const;

  /* Read an unsigned field expressed in milliseconds */
  std::chrono::milliseconds get_millis(const std::string& field,
                                       std::chrono::milliseconds default_value) const;

private:
  const json& find_field(const std::string& field) const;
  ConfigError type_error(const std::string& field, const char* type) const;

  json _raw;
  std::string _path;
};

} // namespace quotegate
