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

#include <quotegate/core/StreamChannel.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace quotegate
{

class EventLoop;
class IoLoop;
class SslContext;
class WebsocketClient;
struct WebsocketInbox;


/* Components of a ws:// or wss:// URL */
struct WsUrl {
  bool secure = false;
  std::string host;
  int port = 0;
  std::string resource; // path and query, at least "/"

  /* host, with the port appended when it is not the scheme default */
  std::string host_header() const;
};

/* Throws ConnectionError if `url` is not a valid websocket URL. */
WsUrl parse_ws_url(const std::string& url);


/* StreamChannel over a websocket.  Inbound messages are queued by the IO
 * thread and collected by the thread calling next(). */
class WebsocketChannel : public StreamChannel
{
public:
  WebsocketChannel(std::shared_ptr<WebsocketInbox>,
                   std::shared_ptr<WebsocketClient>);
  ~WebsocketChannel() override;

  void send(const std::string& msg) override;
  Event next(std::string& payload, std::string& reason) override;
  void interrupt() override;
  void close() override;

private:
  std::shared_ptr<WebsocketInbox> _inbox;
  std::shared_ptr<WebsocketClient> _client;
};


/* Opens websocket channels, using TLS for wss:// URLs. */
class WebsocketConnector : public StreamConnector
{
public:
  /* `ev`, if provided, runs the websocket ping heartbeat every
   * `ping_interval`; a zero interval disables pings. */
  WebsocketConnector(IoLoop&, SslContext&, EventLoop* ev = nullptr,
                     std::chrono::milliseconds ping_interval =
                         std::chrono::seconds(30));

  std::unique_ptr<StreamChannel> connect(
      const std::string& url, std::chrono::milliseconds timeout) override;

private:
  IoLoop& _io_loop;
  SslContext& _ssl;
  EventLoop* _ev;
  std::chrono::milliseconds _ping_interval;
};

} // namespace quotegate
