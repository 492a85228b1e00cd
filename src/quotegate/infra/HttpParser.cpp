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

#include <quotegate/infra/HttpParser.hpp>
#include <quotegate/util/Error.hpp>

#include <http_parser.h>

#include <cctype>

namespace quotegate
{

unsigned int HttpParser::error() const { return _parser->http_errno; }

bool HttpParser::is_good() const { return error() == HPE_OK; }

bool HttpParser::is_upgrade() const { return _parser->upgrade != 0; }

std::string HttpParser::error_text() const
{
  return std::string(
      ::http_errno_description(static_cast<enum ::http_errno>(_parser->http_errno)));
}


HttpParser::HttpParser()
  : _settings(new ::http_parser_settings),
    _parser(new ::http_parser)
{
  ::http_parser_settings_init(_settings.get());
  ::http_parser_init(_parser.get(), HTTP_RESPONSE);

  _parser->data = this;

  // callbacks are captureless lambdas, so they convert to function pointers

  _settings->on_headers_complete = [](::http_parser* p) {
    return static_cast<HttpParser*>(p->data)->on_headers_complete();
  };

  _settings->on_header_field = [](::http_parser* p, const char* s, size_t n) {
    return static_cast<HttpParser*>(p->data)->on_header_field(s, n);
  };

  _settings->on_header_value = [](::http_parser* p, const char* s, size_t n) {
    return static_cast<HttpParser*>(p->data)->on_header_value(s, n);
  };

  _settings->on_status = [](::http_parser* p, const char* s, size_t n) {
    return static_cast<HttpParser*>(p->data)->on_status(s, n);
  };
}


/* Defined here so the unique_ptr deleters see the complete http_parser
 * types. */
HttpParser::~HttpParser() {}


const std::string& HttpParser::get(const std::string& field) const
{
  auto it = _headers.find(field);
  if (it == _headers.end())
    THROW("http header field not found, " << field);
  return it->second;
}


void HttpParser::store_current_header_field()
{
  if (!_current_field.empty()) {
    for (auto& c : _current_field)
      c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    // a repeated header field has its values combined into a comma list
    auto it = _headers.find(_current_field);
    if (it != _headers.end()) {
      it->second.append(",");
      it->second.append(_current_value);
    } else
      _headers.insert({_current_field, _current_value});
  }

  _current_field.clear();
  _current_value.clear();
}


int HttpParser::on_header_field(const char* s, size_t n)
{
  if (_state == state::parsing_field)
    _current_field.append(s, n);
  else {
    store_current_header_field();
    _current_field.assign(s, n);
    _state = state::parsing_field;
  }
  return 0;
}


int HttpParser::on_header_value(const char* s, size_t n)
{
  if (_state == state::parsing_field) {
    _current_value.assign(s, n);
    _state = state::parsing_value;
  } else
    _current_value.append(s, n);
  return 0;
}


size_t HttpParser::handle_input(char* const data, size_t const len)
{
  if (_state == state::complete)
    THROW("http parse already complete");
  return ::http_parser_execute(_parser.get(), _settings.get(), data, len);
}


int HttpParser::on_headers_complete()
{
  store_current_header_field();
  _state = state::complete;
  _http_status_code = _parser->status_code;
  return 0;
}


int HttpParser::on_status(const char* s, size_t n)
{
  _http_status.append(s, n);
  return 0;
}

} // namespace quotegate
