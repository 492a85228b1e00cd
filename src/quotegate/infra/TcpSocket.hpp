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

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

#include <uv.h>

namespace quotegate
{

class IoLoop;

/* Client TCP connection driven by the libuv IO thread.  User callbacks are
 * invoked on the IO thread.  write() and close() may be called from any
 * thread. */
class TcpSocket
{
public:
  using io_on_read = std::function<void(char*, size_t)>;
  using io_on_error = std::function<void(UvErr)>;

  explicit TcpSocket(IoLoop&);

  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;

  /* Closes the socket, waiting for the close to complete unless called on the
   * IO thread. */
  virtual ~TcpSocket();

  /* Resolve `node` and connect.  The future is set on completion with the
   * result, which is a UvErr of UV_ECANCELED if the socket was closed before
   * the connect completed. */
  std::future<UvErr> connect(std::string node, int port);

  /* Start delivery of inbound bytes.  Any read failure or end-of-stream is
   * reported once through `on_error`, after which the socket is closed. */
  virtual void start_read(io_on_read on_read, io_on_error on_error);

  /* Queue bytes for writing.  Throws Error if the socket is not connected. */
  virtual void write(const char*, size_t);

  /* Request socket close.  The returned future is set once the close has
   * completed on the IO thread. */
  std::shared_future<void> close();

  bool is_connected() const;
  bool is_closed() const;

  const std::string& node() const { return _node; }
  const std::string& service() const { return _service; }

  /* IO thread: begin closing the uv handle */
  void io_close();

protected:
  /* IO thread: connection established, before the user is told */
  virtual void io_on_connected() {}

  /* IO thread: bytes received from the peer */
  virtual void io_on_bytes(char*, size_t);

  /* IO thread: write raw bytes to the uv stream */
  void io_write(const char*, size_t);

  /* IO thread: report a fatal error to the user, once, and close */
  void io_fail(UvErr);

  /* Close and wait, detaching from the uv handle.  Derived classes call this
   * from their destructor, so that no IO callback reaches a partially
   * destroyed object. */
  void close_for_destruction();

  IoLoop& _loop;
  io_on_read _user_on_read;

private:
  enum class socket_state {
    uninitialised,
    connecting,
    connected,
    closing,
    closed
  };

  struct connect_context;

  static void on_resolved(uv_getaddrinfo_t*, int, struct addrinfo*);
  static void on_connect(uv_connect_t*, int);
  static void complete_connect(connect_context*, UvErr);
  void io_start_connect(connect_context*);
  void io_start_read();
  void io_connect_completed(UvErr);
  void io_on_close_complete();
  void set_closed_promise();

  uv_tcp_t* _uv_tcp = nullptr;

  mutable std::mutex _state_mutex;
  socket_state _state = socket_state::uninitialised;

  std::string _node;
  std::string _service;

  io_on_error _user_on_error;
  bool _error_reported = false;
  UvErr _last_error;

  connect_context* _connect = nullptr; // guarded by _state_mutex
  bool _destructing = false;

  std::mutex _promise_mutex;
  bool _close_promise_set = false;
  std::promise<void> _closed_promise;
  std::shared_future<void> _closed_future;
};

} // namespace quotegate
