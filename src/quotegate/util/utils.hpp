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

#include <cctype>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace quotegate
{

/*
 * Split a string based on a single delimiter.
 */
std::vector<std::string> split(const std::string_view& str, char delim);

/* Join items into a single string, placing `delim` between each */
template <typename C>
std::string join(const C& items, const std::string& delim)
{
  std::string out;
  for (auto& item : items) {
    if (!out.empty())
      out += delim;
    out += item;
  }
  return out;
}

/* Copy of `str` without leading and trailing whitespace */
inline std::string trim(std::string_view str)
{
  auto is_space = [](char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  while (!str.empty() && is_space(str.front()))
    str.remove_prefix(1);
  while (!str.empty() && is_space(str.back()))
    str.remove_suffix(1);
  return std::string(str);
}


/* Standard base64 encoding, with padding */
std::string base64_encode(const unsigned char* src, size_t len);

class scope_guard
{
public:
  template <class Callable>
  scope_guard(Callable&& undo_func) : _fn(std::forward<Callable>(undo_func))
  {
  }

  ~scope_guard()
  {
    if (_fn)
      _fn(); // must not throw
  }

  scope_guard(const scope_guard&) = delete;

  void operator=(const scope_guard&) = delete;

private:
  std::function<void()> _fn;
};

std::string demangle(const char* name);

/* Describe the exception currently being handled; must be called from within
 * a catch block. */
std::string current_exception_text();

void log_exception(const char* site);

/* As log_exception, and include the message whose processing failed */
void log_message_exception(const char* source, const std::string& data);

std::string str_tolower(std::string s);

/* Install a signal handler for SIGINT (Control-C), and wait
 * for it occur. */
void wait_for_sigint();

} // namespace quotegate
