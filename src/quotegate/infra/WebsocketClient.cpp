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

#include <quotegate/infra/WebsocketClient.hpp>
#include <quotegate/infra/IoLoop.hpp>
#include <quotegate/infra/TcpSocket.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/util/Error.hpp>
#include <quotegate/util/EventLoop.hpp>

namespace quotegate
{

std::shared_ptr<WebsocketClient> WebsocketClient::create(
    IoLoop& io_loop, EventLoop* ev, std::unique_ptr<TcpSocket> sock,
    WebsocketProtocol::options opts, MsgCallback msg_cb,
    OnOpenCallback on_open, OnCloseCallback on_close)
{
  std::shared_ptr<WebsocketClient> sp(
      new WebsocketClient(io_loop, ev, std::move(sock), std::move(opts),
                          std::move(msg_cb), std::move(on_open),
                          std::move(on_close)));
  sp->start();
  return sp;
}


WebsocketClient::WebsocketClient(IoLoop& io_loop, EventLoop* ev,
                                 std::unique_ptr<TcpSocket> sock,
                                 WebsocketProtocol::options opts,
                                 MsgCallback msg_cb, OnOpenCallback on_open,
                                 OnCloseCallback on_close)
  : _io_loop(io_loop),
    _event_loop(ev),
    _msg_cb(std::move(msg_cb)),
    _on_open(std::move(on_open)),
    _on_close(std::move(on_close)),
    _is_open(false),
    _socket(std::move(sock))
{
  WebsocketProtocol::callbacks callbacks;

  // the protocol, like the socket, is owned by this object, and the socket is
  // closed before either is destroyed
  callbacks.write = [this](const char* buf, size_t len) {
    _socket->write(buf, len);
  };
  callbacks.on_message = [this](const char* buf, size_t len) {
    if (_msg_cb)
      _msg_cb(buf, len);
  };
  callbacks.on_open = [this]() {
    _is_open = true;
    if (_on_open)
      _on_open();
  };
  callbacks.on_closed = [this](std::string reason) {
    io_handle_closed(std::move(reason));
  };

  _proto.reset(new WebsocketProtocol(std::move(opts), std::move(callbacks)));
}


WebsocketClient::~WebsocketClient()
{
  _is_open = false;
  // socket destructor completes the close, so no IO callback follows
  _socket.reset();
}


void WebsocketClient::start()
{
  run_on_io([](WebsocketClient& self) { self.io_start(); });
  start_ping_timer();
}


void WebsocketClient::run_on_io(std::function<void(WebsocketClient&)> fn)
{
  if (_io_loop.this_thread_is_io()) {
    fn(*this);
    return;
  }

  try {
    _io_loop.push_fn([wp = weak_from_this(), fn = std::move(fn)]() {
      if (auto sp = wp.lock())
        fn(*sp);
    });
  } catch (IoLoopClosed&) {
    THROW("websocket unusable, IO loop closed");
  }
}


void WebsocketClient::start_ping_timer()
{
  auto interval = _proto->get_options().ping_interval;
  if (!_event_loop || interval.count() <= 0)
    return;

  auto timerfn = [wp = weak_from_this(),
                  interval]() -> std::chrono::milliseconds {
    auto sp = wp.lock();
    if (!sp || sp->_close_reported)
      return std::chrono::milliseconds(0); // cancel timer

    try {
      sp->_io_loop.push_fn([wp]() {
        if (auto sp = wp.lock())
          sp->_proto->on_timer();
      });
    } catch (IoLoopClosed&) {
      return std::chrono::milliseconds(0);
    }
    return interval;
  };
  _event_loop->dispatch(interval, std::move(timerfn));
}


void WebsocketClient::io_start()
{
  /* IO thread */
  _socket->start_read(
      [this](char* s, size_t n) { this->io_on_read(s, n); },
      [this](UvErr ec) { this->io_on_error(ec); });

  try {
    _proto->initiate();
  } catch (std::exception& e) {
    io_handle_closed(std::string("websocket handshake failed: ") + e.what());
  }
}


void WebsocketClient::io_on_read(char* src, size_t len)
{
  /* IO thread */
  if (len == 0 || _close_reported)
    return;

  try {
    _proto->io_on_read(src, len);
  } catch (handshake_error& e) {
    io_handle_closed(std::string("websocket handshake failed: ") + e.what());
  } catch (std::exception& e) {
    io_handle_closed(std::string("websocket protocol error: ") + e.what());
  }
}


void WebsocketClient::io_on_error(UvErr ec)
{
  /* IO thread */
  if (ec.is_eof())
    io_handle_closed("connection closed by peer");
  else
    io_handle_closed("lost websocket connection, error " + ec.message());
}


void WebsocketClient::io_handle_closed(std::string reason)
{
  /* IO thread */
  _is_open = false;
  if (!_close_reported) {
    _close_reported = true;
    LOG_INFO("websocket " << _socket->node() << ":" << _socket->service()
             << " closed, " << reason);
    if (_on_close) {
      try {
        _on_close(std::move(reason));
      } catch (...) {
        log_exception("websocket on_close");
      }
    }
  }
  _socket->io_close();
}


void WebsocketClient::send(const char* buf, size_t len)
{
  if (!_is_open)
    THROW("websocket not open");

  if (_io_loop.this_thread_is_io()) {
    _proto->send_msg(buf, len);
    return;
  }

  std::string copy(buf, len);
  run_on_io([copy = std::move(copy)](WebsocketClient& self) {
    if (self._proto->is_open())
      self._proto->send_msg(copy.data(), copy.size());
    else
      LOG_WARN("websocket closed, outbound message dropped");
  });
}


void WebsocketClient::close()
{
  run_on_io([](WebsocketClient& self) {
    if (!self._proto->initiate_close())
      self.io_handle_closed("closed by local request");
  });
}

} // namespace quotegate
