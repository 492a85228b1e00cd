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

#include <map>
#include <memory>
#include <string>

// types brought in from the nodejs http-parser library (global namespace)
struct http_parser;
struct http_parser_settings;

namespace quotegate
{

/* Incremental parser of an HTTP response head, used to read the server reply
 * to a websocket upgrade request.  Parsing stops at the end of the headers;
 * any bytes after that belong to the upgraded protocol. */
class HttpParser
{
public:
  static constexpr unsigned int status_code_switching_protocols = 101;

  HttpParser();
  ~HttpParser();

  /* Feed bytes; returns the number consumed, which is less than `len` once
   * the headers are complete. */
  size_t handle_input(char* const data, size_t const len);

  /** have we completed parsing headers? */
  [[nodiscard]] bool is_complete() const { return _state == state::complete; }

  /** does header indicate connection upgrade? */
  [[nodiscard]] bool is_upgrade() const;

  /** access the http-parser error code */
  [[nodiscard]] unsigned int error() const;

  [[nodiscard]] std::string error_text() const;

  [[nodiscard]] bool is_good() const;

  /** is field present in headers? field should be lowercase */
  bool has(const std::string& field) const
  {
    return _headers.find(field) != _headers.end();
  }

  /** return header field, otherwise throw; field should be lowercase */
  [[nodiscard]] const std::string& get(const std::string& field) const;

  [[nodiscard]] const std::string& http_status_phrase() const { return _http_status; }

  [[nodiscard]] unsigned int http_status_code() const { return _http_status_code; }

private:
  void store_current_header_field();
  int on_headers_complete();
  int on_header_field(const char* s, size_t n);
  int on_header_value(const char* s, size_t n);
  int on_status(const char* s, size_t n);

  std::map<std::string, std::string> _headers;

  std::unique_ptr<::http_parser_settings> _settings;
  std::unique_ptr<::http_parser> _parser;

  enum class state { parsing_field, parsing_value, complete };
  state _state = state::parsing_field;

  std::string _current_field;
  std::string _current_value;

  unsigned int _http_status_code = 0;
  std::string _http_status;
};

} // namespace quotegate
