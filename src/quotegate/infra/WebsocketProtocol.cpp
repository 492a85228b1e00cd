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

#include <quotegate/infra/WebsocketProtocol.hpp>
#include <quotegate/infra/HttpParser.hpp>
#include <quotegate/infra/WebsocketppImpl.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/util/utils.hpp>

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <sstream>

namespace quotegate
{

/* Wraps a websocketpp message so the header can forward declare it */
struct websocketpp_msg {
  WebsocketppImpl::message_ptr ptr;
};


static const char* const accept_key_guid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

static const char* const websocket_version = "13";


/* Does a comma separated header value list `token`?  Tokens compare case
 * insensitively; `token` must be lowercase. */
static bool has_token(const std::string& header_value, const char* token)
{
  for (auto& item : split(header_value, ','))
    if (str_tolower(trim(item)) == token)
      return true;
  return false;
}


WebsocketProtocol::WebsocketProtocol(options opts, callbacks cbs)
  : _options(std::move(opts)),
    _callbacks(std::move(cbs)),
    _inbound(_options.buffer_initial_size, _options.buffer_max_size),
    _http_parser(new HttpParser),
    _websock_impl(new WebsocketppImpl),
    _last_pong(std::chrono::steady_clock::now() - _options.pong_min_interval)
{
  if (_options.ping_interval.count() == 0)
    _options.max_missed_pings = 0;
}


WebsocketProtocol::~WebsocketProtocol() = default;


std::string WebsocketProtocol::make_accept_key(const std::string& key)
{
  std::string text = key + accept_key_guid;
  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1(reinterpret_cast<const unsigned char*>(text.data()), text.size(), digest);
  return base64_encode(digest, sizeof(digest));
}


void WebsocketProtocol::initiate()
{
  if (_state != state::init)
    throw protocol_error("websocket handshake already initiated");

  unsigned char nonce[16];
  if (RAND_bytes(nonce, sizeof(nonce)) != 1)
    throw protocol_error("failed to generate Sec-WebSocket-Key");
  std::string key = base64_encode(nonce, sizeof(nonce));
  _expected_accept_key = make_accept_key(key);

  std::string request = "GET " + _options.request_uri + " HTTP/1.1\r\n";
  auto add_header = [&request](const std::string& name, const std::string& value) {
    request += name;
    request += ": ";
    request += value;
    request += "\r\n";
  };
  if (!_options.host_header.empty())
    add_header("Host", _options.host_header);
  add_header("Upgrade", "websocket");
  add_header("Connection", "Upgrade");
  add_header("Sec-WebSocket-Key", key);
  add_header("Sec-WebSocket-Version", websocket_version);
  add_header("Cache-Control", "no-cache");
  for (auto& item : _options.extra_headers)
    add_header(item.first, item.second);
  request += "\r\n";

  _state = state::awaiting_upgrade;

  // the request target can carry a credential
  LOG_DEBUG("http_tx: GET upgrade, host " << QUOTE(_options.host_header));
  _callbacks.write(request.data(), request.size());
}


void WebsocketProtocol::io_on_read(char* src, size_t len)
{
  while (len > 0) {
    size_t taken = _inbound.append(src, len);
    src += taken;
    len -= taken;

    size_t used = 0;
    while (used < _inbound.size() && _state != state::closed)
      used += decode(_inbound.data() + used, _inbound.size() - used);

    if (_state == state::closed)
      return; // anything after the close is ignored

    _inbound.drop_front(used);
  }
}


size_t WebsocketProtocol::decode(char* p, size_t n)
{
  switch (_state) {
    case state::init:
      throw handshake_error("data received before upgrade request sent");
    case state::awaiting_upgrade:
      return decode_upgrade_response(p, n);
    default:
      return decode_frame(p, n);
  }
}


size_t WebsocketProtocol::decode_upgrade_response(char* p, size_t n)
{
  size_t used = _http_parser->handle_input(p, n);
  LOG_DEBUG("http_rx: " << std::string(p, used));

  if (!_http_parser->is_good())
    throw handshake_error("bad http header: " + _http_parser->error_text());
  if (_http_parser->is_complete())
    check_upgrade_response();
  return used;
}


void WebsocketProtocol::check_upgrade_response()
{
  const HttpParser& http = *_http_parser;

  if (http.http_status_code() != HttpParser::status_code_switching_protocols)
    throw handshake_error("websocket upgrade rejected, http status " +
                          std::to_string(http.http_status_code()) + " " +
                          http.http_status_phrase());

  if (!http.is_upgrade() || !http.has("upgrade") ||
      !has_token(http.get("upgrade"), "websocket"))
    throw handshake_error("http header is not a websocket upgrade");

  if (!http.has("sec-websocket-accept"))
    throw handshake_error("http header missing sec-websocket-accept");
  if (http.get("sec-websocket-accept") != _expected_accept_key)
    throw handshake_error("incorrect key for Sec-WebSocket-Accept");

  _state = state::open;
  if (_callbacks.on_open)
    _callbacks.on_open();
}


size_t WebsocketProtocol::decode_frame(char* p, size_t n)
{
  auto* proc = _websock_impl->processor();

  // consume() stops at the end of the next complete message
  websocketpp::lib::error_code ec;
  size_t used = proc->consume(reinterpret_cast<uint8_t*>(p), n, ec);
  if (ec)
    throw protocol_error(ec.message());
  if (proc->get_error())
    throw protocol_error("websocket parser fatal error");

  _missed_pings = 0;

  if (proc->ready()) {
    websocketpp_msg msg{proc->get_message()};
    if (!msg.ptr)
      throw protocol_error("null message from websocketpp");
    LOG_DEBUG("frame_rx: " << WebsocketppImpl::frame_to_string(msg.ptr));
    on_frame(msg);
  }
  return used;
}


void WebsocketProtocol::on_frame(const websocketpp_msg& msg)
{
  namespace opcode = websocketpp::frame::opcode;
  const std::string& payload = msg.ptr->get_payload();

  switch (msg.ptr->get_opcode()) {
    case opcode::text:
    case opcode::binary:
      if (_state == state::open && _callbacks.on_message)
        _callbacks.on_message(payload.data(), payload.size());
      break;
    case opcode::ping:
      on_ping(payload);
      break;
    case opcode::close:
      on_close_frame(payload);
      break;
    default:
      break; // pong
  }
}


void WebsocketProtocol::on_ping(const std::string& payload)
{
  auto now = std::chrono::steady_clock::now();
  if (_state != state::open || now - _last_pong < _options.pong_min_interval)
    return;
  _last_pong = now;
  send_control(control::pong, payload);
}


void WebsocketProtocol::on_close_frame(const std::string& payload)
{
  websocketpp::lib::error_code ec;
  auto code = websocketpp::close::extract_code(payload, ec);

  std::ostringstream reason;
  if (_state == state::closing) {
    reason << "closed, code " << code;
  } else {
    send_control(control::close, {}, websocketpp::close::status::normal);
    reason << "closed by peer, code " << code;
    std::string text = websocketpp::close::extract_reason(payload, ec);
    if (!text.empty())
      reason << ", " << text;
  }
  set_closed(reason.str());
}


void WebsocketProtocol::send_msg(const char* buf, size_t len)
{
  if (_state != state::open)
    throw protocol_error("websocket not open");

  auto& manager = _websock_impl->msg_manager();
  auto in = manager->get_message(websocketpp::frame::opcode::text, len);
  auto out = manager->get_message();
  if (!in || !out)
    throw protocol_error("failed to obtain msg object");
  in->append_payload(buf, len);

  auto ec = _websock_impl->processor()->prepare_data_frame(in, out);
  if (ec)
    throw protocol_error(ec.message());
  write_frame(websocketpp_msg{out});
}


void WebsocketProtocol::send_control(control kind, const std::string& payload,
                                     uint16_t close_code)
{
  auto* proc = _websock_impl->processor();
  auto out = _websock_impl->msg_manager()->get_message();
  if (!out)
    throw protocol_error("failed to obtain msg object");

  websocketpp::lib::error_code ec;
  switch (kind) {
    case control::ping:
      ec = proc->prepare_ping(payload, out);
      break;
    case control::pong:
      ec = proc->prepare_pong(payload, out);
      break;
    case control::close:
      ec = proc->prepare_close(close_code, payload, out);
      break;
  }
  if (ec)
    throw protocol_error("failed to build control frame, " + ec.message());
  write_frame(websocketpp_msg{out});
}


void WebsocketProtocol::write_frame(const websocketpp_msg& msg)
{
  LOG_DEBUG("frame_tx: " << WebsocketppImpl::frame_to_string(msg.ptr));

  const std::string& header = msg.ptr->get_header();
  const std::string& payload = msg.ptr->get_payload();
  _callbacks.write(header.data(), header.size());
  if (!payload.empty())
    _callbacks.write(payload.data(), payload.size());
}


void WebsocketProtocol::on_timer()
{
  if (_state != state::open || _options.ping_interval.count() == 0)
    return;

  if (_missed_pings >= _options.max_missed_pings) {
    send_control(control::close, {}, websocketpp::close::status::protocol_error);
    set_closed("no reply to " + std::to_string(_missed_pings) + " pings");
    return;
  }

  // counted as missed until the peer sends something
  ++_missed_pings;
  send_control(control::ping);
}


bool WebsocketProtocol::initiate_close()
{
  if (_state != state::open)
    return false;
  _state = state::closing;
  send_control(control::close, {}, websocketpp::close::status::normal);
  return true;
}


void WebsocketProtocol::set_closed(std::string reason)
{
  if (_state == state::closed)
    return;
  _state = state::closed;
  if (_callbacks.on_closed)
    _callbacks.on_closed(std::move(reason));
}

} // namespace quotegate
