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

#include <quotegate/infra/UvErr.hpp>
#include <quotegate/infra/WebsocketProtocol.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace quotegate
{

class EventLoop;
class IoLoop;
class TcpSocket;

/*
 * Asynchronous websocket client, running over an already connected socket.
 * The handshake, framing and ping heartbeat all run on the IO thread; user
 * callbacks are invoked there too.
 */
class WebsocketClient : public std::enable_shared_from_this<WebsocketClient>
{
public:
  using MsgCallback = std::function<void(const char*, size_t)>;
  using OnOpenCallback = std::function<void()>;
  using OnCloseCallback = std::function<void(std::string)>;

  /* Create a client and begin the upgrade handshake.  `ev`, when provided,
   * drives the ping timer. */
  static std::shared_ptr<WebsocketClient> create(IoLoop&,
                                                 EventLoop* ev,
                                                 std::unique_ptr<TcpSocket> sock,
                                                 WebsocketProtocol::options,
                                                 MsgCallback msg_cb,
                                                 OnOpenCallback on_open,
                                                 OnCloseCallback on_close);

  ~WebsocketClient();

  /* Send a text frame.  Throws Error if the websocket is not open. */
  void send(const char*, size_t);
  void send(const std::string& s) { send(s.data(), s.size()); }

  bool is_open() const { return _is_open; }

  /* Begin the closing handshake; the socket is closed once the peer
   * replies, or immediately if the websocket never opened. */
  void close();

private:
  WebsocketClient(IoLoop&, EventLoop*, std::unique_ptr<TcpSocket>,
                  WebsocketProtocol::options, MsgCallback, OnOpenCallback,
                  OnCloseCallback);

  void start();
  void start_ping_timer();
  void run_on_io(std::function<void(WebsocketClient&)>);

  void io_start();
  void io_on_read(char* src, size_t len);
  void io_on_error(UvErr ec);
  void io_handle_closed(std::string reason);

  IoLoop& _io_loop;
  EventLoop* _event_loop;
  MsgCallback _msg_cb;
  OnOpenCallback _on_open;
  OnCloseCallback _on_close;
  std::atomic<bool> _is_open;
  std::atomic<bool> _close_reported{false};
  std::unique_ptr<WebsocketProtocol> _proto;
  std::unique_ptr<TcpSocket> _socket; // keep last, closed first
};

} // namespace quotegate
