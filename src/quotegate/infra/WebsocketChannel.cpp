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

#include <quotegate/infra/WebsocketChannel.hpp>
#include <quotegate/infra/IoLoop.hpp>
#include <quotegate/infra/SslSocket.hpp>
#include <quotegate/infra/TcpSocket.hpp>
#include <quotegate/infra/WebsocketClient.hpp>
#include <quotegate/infra/ssl.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/util/Error.hpp>
#include <quotegate/util/utils.hpp>

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>

namespace quotegate
{

/* State shared between the IO thread, which delivers websocket events, and
 * the channel reader. */
struct WebsocketInbox {
  std::mutex mutex;
  std::condition_variable condvar;
  std::deque<std::string> messages;
  bool closed = false;
  std::string reason;
  bool interrupt_pending = false;

  std::promise<bool> opened;
  bool open_set = false;

  void push(const char* buf, size_t len)
  {
    std::lock_guard<std::mutex> guard(mutex);
    if (closed)
      return;
    messages.emplace_back(buf, len);
    condvar.notify_all();
  }

  void set_open()
  {
    std::lock_guard<std::mutex> guard(mutex);
    if (!open_set) {
      open_set = true;
      opened.set_value(true);
    }
  }

  void set_closed(std::string why)
  {
    std::lock_guard<std::mutex> guard(mutex);
    if (!closed) {
      closed = true;
      reason = std::move(why);
    }
    if (!open_set) {
      open_set = true;
      opened.set_value(false);
    }
    condvar.notify_all();
  }

  std::string close_reason()
  {
    std::lock_guard<std::mutex> guard(mutex);
    return reason;
  }
};


std::string WsUrl::host_header() const
{
  bool default_port = (secure && port == 443) || (!secure && port == 80);
  bool ipv6 = host.find(':') != std::string::npos;
  std::string h = ipv6 ? "[" + host + "]" : host;
  return default_port ? h : h + ":" + std::to_string(port);
}


WsUrl parse_ws_url(const std::string& url)
{
  WsUrl result;

  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos)
    throw ConnectionError("websocket url has no scheme");

  auto scheme = str_tolower(url.substr(0, scheme_end));
  if (scheme == "wss")
    result.secure = true;
  else if (scheme != "ws")
    throw ConnectionError("websocket url scheme not supported, '" + scheme +
                          "'");

  auto rest = url.substr(scheme_end + 3);
  auto auth_end = rest.find_first_of("/?");
  std::string authority = rest.substr(0, auth_end);
  if (auth_end == std::string::npos)
    result.resource = "/";
  else if (rest[auth_end] == '?')
    result.resource = "/" + rest.substr(auth_end);
  else
    result.resource = rest.substr(auth_end);

  std::string port_str;
  if (!authority.empty() && authority[0] == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos)
      throw ConnectionError("websocket url has malformed host");
    result.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':')
        throw ConnectionError("websocket url has malformed host");
      port_str = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.find(':');
    result.host = authority.substr(0, colon);
    if (colon != std::string::npos)
      port_str = authority.substr(colon + 1);
  }

  if (result.host.empty())
    throw ConnectionError("websocket url has no host");

  if (port_str.empty())
    result.port = result.secure ? 443 : 80;
  else {
    if (port_str.find_first_not_of("0123456789") != std::string::npos ||
        port_str.size() > 5)
      throw ConnectionError("websocket url has invalid port '" + port_str +
                            "'");
    result.port = std::stoi(port_str);
    if (result.port <= 0 || result.port > 65535)
      throw ConnectionError("websocket url has invalid port '" + port_str +
                            "'");
  }

  return result;
}


WebsocketChannel::WebsocketChannel(std::shared_ptr<WebsocketInbox> inbox,
                                   std::shared_ptr<WebsocketClient> client)
  : _inbox(std::move(inbox)), _client(std::move(client))
{
}


WebsocketChannel::~WebsocketChannel()
{
  close();
  _client.reset();
}


void WebsocketChannel::send(const std::string& msg)
{
  {
    std::lock_guard<std::mutex> guard(_inbox->mutex);
    if (_inbox->closed)
      THROW("stream channel closed, " << _inbox->reason);
  }
  _client->send(msg);
}


StreamChannel::Event WebsocketChannel::next(std::string& payload,
                                            std::string& reason)
{
  std::unique_lock<std::mutex> lock(_inbox->mutex);
  _inbox->condvar.wait(lock, [this]() {
    return _inbox->interrupt_pending || !_inbox->messages.empty() ||
           _inbox->closed;
  });

  if (_inbox->interrupt_pending) {
    _inbox->interrupt_pending = false;
    return Event::interrupted;
  }

  if (!_inbox->messages.empty()) {
    payload = std::move(_inbox->messages.front());
    _inbox->messages.pop_front();
    return Event::message;
  }

  reason = _inbox->reason;
  return Event::closed;
}


void WebsocketChannel::interrupt()
{
  std::lock_guard<std::mutex> guard(_inbox->mutex);
  _inbox->interrupt_pending = true;
  _inbox->condvar.notify_all();
}


void WebsocketChannel::close()
{
  {
    std::lock_guard<std::mutex> guard(_inbox->mutex);
    if (_inbox->closed)
      return;
  }

  _inbox->set_closed("closed by local request");

  try {
    _client->close();
  } catch (const Error& e) {
    LOG_WARN("websocket close request failed, " << e.what());
  }
}


WebsocketConnector::WebsocketConnector(IoLoop& io_loop, SslContext& ssl,
                                       EventLoop* ev,
                                       std::chrono::milliseconds ping_interval)
  : _io_loop(io_loop), _ssl(ssl), _ev(ev), _ping_interval(ping_interval)
{
}


std::unique_ptr<StreamChannel> WebsocketConnector::connect(
    const std::string& url, std::chrono::milliseconds timeout)
{
  auto const deadline = std::chrono::steady_clock::now() + timeout;
  auto ws_url = parse_ws_url(url);
  auto const endpoint = ws_url.host + ":" + std::to_string(ws_url.port);

  // the resource can hold a credential, so it is not logged
  LOG_INFO("websocket connecting to " << (ws_url.secure ? "wss://" : "ws://")
           << endpoint);

  std::unique_ptr<TcpSocket> sock;
  if (ws_url.secure)
    sock.reset(new SslSocket(&_ssl, _io_loop));
  else
    sock.reset(new TcpSocket(_io_loop));

  auto connect_fut = sock->connect(ws_url.host, ws_url.port);
  if (connect_fut.wait_until(deadline) == std::future_status::timeout)
    throw ConnectionError("timeout during connect to " + endpoint);

  auto err = connect_fut.get();
  if (err)
    throw ConnectionError("connect to " + endpoint + " failed, " +
                          err.message());

  auto inbox = std::make_shared<WebsocketInbox>();
  auto open_fut = inbox->opened.get_future();

  WebsocketProtocol::options opts(ws_url.resource);
  opts.host_header = ws_url.host_header();
  opts.ping_interval = _ping_interval;
  if (_ping_interval.count() == 0)
    opts.max_missed_pings = 0;

  auto client = WebsocketClient::create(
      _io_loop, _ev, std::move(sock), std::move(opts),
      [inbox](const char* buf, size_t len) { inbox->push(buf, len); },
      [inbox]() { inbox->set_open(); },
      [inbox](std::string reason) { inbox->set_closed(std::move(reason)); });

  if (open_fut.wait_until(deadline) == std::future_status::timeout)
    throw ConnectionError("timeout during websocket handshake with " +
                          endpoint);

  if (!open_fut.get())
    throw ConnectionError(inbox->close_reason());

  LOG_INFO("websocket open to " << endpoint);
  return std::unique_ptr<StreamChannel>(
      new WebsocketChannel(std::move(inbox), std::move(client)));
}

} // namespace quotegate
