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

#include <quotegate/infra/DecodeBuffer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace quotegate
{

class HttpParser;
class WebsocketppImpl;
struct websocketpp_msg;


/* The server did not accept the upgrade request */
class handshake_error : public std::runtime_error
{
public:
  explicit handshake_error(const std::string& msg) : std::runtime_error(msg) {}
};


/* Malformed frame, or a call the current protocol state does not allow */
class protocol_error : public std::runtime_error
{
public:
  explicit protocol_error(const std::string& msg) : std::runtime_error(msg) {}
};


/* Client side of RFC 6455: the HTTP upgrade handshake, then framing.  No IO
 * is done here.  Outbound bytes leave through callbacks::write and inbound
 * bytes arrive through io_on_read().  Single threaded; callers use the IO
 * thread. */
class WebsocketProtocol
{
public:
  struct options {
    std::string request_uri;
    std::string host_header; /* omitted from the request when empty */
    std::vector<std::pair<std::string, std::string>> extra_headers;

    /* Zero disables pings.  The default stays below the one minute idle
     * timeout common to load balancers. */
    std::chrono::milliseconds ping_interval{30000};

    /* peer pings arriving faster than this are not answered */
    std::chrono::milliseconds pong_min_interval{1000};

    /* close after this many consecutive pings with no inbound data */
    int max_missed_pings = 2;

    size_t buffer_initial_size = 1024;
    size_t buffer_max_size = 65536;

    explicit options(std::string uri = "/") : request_uri(std::move(uri)) {}
  };

  struct callbacks {
    std::function<void(const char*, size_t)> write;
    std::function<void(const char*, size_t)> on_message;
    std::function<void()> on_open;
    std::function<void(std::string)> on_closed; /* arg is the close reason */
  };

  WebsocketProtocol(options, callbacks);
  ~WebsocketProtocol();

  /* Write the upgrade request.  Allowed once. */
  void initiate();

  /* Decode bytes from the peer.  Throws handshake_error or protocol_error. */
  void io_on_read(char*, size_t);

  /* Send one text frame; the protocol must be open */
  void send_msg(const char*, size_t);

  /* Send a close frame and wait for the peer's reply.  Returns false when
   * not open. */
  bool initiate_close();

  /* Ping heartbeat, called once per ping interval */
  void on_timer();

  bool is_open() const { return _state == state::open; }

  bool is_closed() const { return _state == state::closed; }

  const options& get_options() const { return _options; }

  const std::string& expected_accept_key() const { return _expected_accept_key; }

  /* Sec-WebSocket-Accept value for a given Sec-WebSocket-Key */
  static std::string make_accept_key(const std::string& key);

private:
  enum class state { init, awaiting_upgrade, open, closing, closed };
  enum class control { ping, pong, close };

  size_t decode(char*, size_t);
  size_t decode_upgrade_response(char*, size_t);
  size_t decode_frame(char*, size_t);
  void check_upgrade_response();
  void on_frame(const websocketpp_msg&);
  void on_ping(const std::string&);
  void on_close_frame(const std::string&);

  void send_control(control, const std::string& payload = {},
                    uint16_t close_code = 0);
  void write_frame(const websocketpp_msg&);
  void set_closed(std::string reason);

  state _state = state::init;
  options _options;
  callbacks _callbacks;
  DecodeBuffer _inbound;
  std::unique_ptr<HttpParser> _http_parser;
  std::unique_ptr<WebsocketppImpl> _websock_impl;
  std::string _expected_accept_key;
  std::chrono::steady_clock::time_point _last_pong;
  int _missed_pings = 0;
};

} // namespace quotegate
