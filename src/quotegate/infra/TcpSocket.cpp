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

#include <quotegate/infra/TcpSocket.hpp>
#include <quotegate/infra/IoLoop.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/util/Error.hpp>

#include <cstring>
#include <vector>

namespace quotegate
{

/* State of one connection attempt.  Deleted by whichever libuv callback
 * completes the attempt; `owner` is cleared if the socket closes first. */
struct TcpSocket::connect_context {
  explicit connect_context(TcpSocket* s) : owner(s) {}

  TcpSocket* owner;
  std::promise<UvErr> promise;
  uv_getaddrinfo_t resolver;
  uv_connect_t request;
};


struct write_request {
  uv_write_t req;
  std::vector<char> data;
};


TcpSocket::TcpSocket(IoLoop& loop)
  : _loop(loop), _closed_future(_closed_promise.get_future().share())
{
}


TcpSocket::~TcpSocket() { close_for_destruction(); }


void TcpSocket::close_for_destruction()
{
  {
    std::lock_guard<std::mutex> guard(_state_mutex);
    if (_destructing)
      return;
    _destructing = true;
    if (_state == socket_state::uninitialised || _state == socket_state::closed)
      return;
  }

  if (!_loop.this_thread_is_io()) {
    close().wait();
    return;
  }

  /* On the IO thread we cannot wait for the close callback, so detach from
   * the handle and let libuv free it later. */
  {
    std::lock_guard<std::mutex> guard(_state_mutex);
    if (_connect) {
      _connect->owner = nullptr;
      _connect = nullptr;
    }
    _state = socket_state::closed;
  }
  if (_uv_tcp) {
    auto handle = reinterpret_cast<uv_handle_t*>(_uv_tcp);
    static_cast<HandleData*>(handle->data)->detach();
    if (!uv_is_closing(handle))
      uv_close(handle, free_socket);
    _uv_tcp = nullptr;
  }
}


bool TcpSocket::is_connected() const
{
  std::lock_guard<std::mutex> guard(_state_mutex);
  return _state == socket_state::connected;
}


bool TcpSocket::is_closed() const
{
  std::lock_guard<std::mutex> guard(_state_mutex);
  return _state == socket_state::closed;
}


std::future<UvErr> TcpSocket::connect(std::string node, int port)
{
  auto ctx = new connect_context(this);
  auto fut = ctx->promise.get_future();

  {
    std::lock_guard<std::mutex> guard(_state_mutex);
    if (_state != socket_state::uninitialised) {
      delete ctx;
      THROW("connect() already called for " << _node << ":" << _service);
    }
    _state = socket_state::connecting;
    _node = std::move(node);
    _service = std::to_string(port);
    _connect = ctx;
  }

  try {
    _loop.push_fn([this, ctx]() { io_start_connect(ctx); });
  } catch (IoLoopClosed&) {
    {
      std::lock_guard<std::mutex> guard(_state_mutex);
      _connect = nullptr;
      _state = socket_state::closed;
    }
    ctx->promise.set_value(UvErr(UV_ECANCELED));
    delete ctx;
    set_closed_promise();
  }

  return fut;
}


void TcpSocket::io_start_connect(connect_context* ctx)
{
  /* IO thread */
  if (!ctx->owner) {
    complete_connect(ctx, UV_ECANCELED);
    return;
  }

  struct addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;

  ctx->resolver.data = ctx;
  int r = uv_getaddrinfo(_loop.uv_loop(), &ctx->resolver, &TcpSocket::on_resolved,
                         _node.c_str(), _service.c_str(), &hints);
  if (r < 0)
    complete_connect(ctx, r);
}


void TcpSocket::on_resolved(uv_getaddrinfo_t* req, int status,
                            struct addrinfo* res)
{
  /* IO thread */
  auto ctx = static_cast<connect_context*>(req->data);
  scope_guard free_res([res]() {
    if (res)
      uv_freeaddrinfo(res);
  });

  if (status < 0) {
    complete_connect(ctx, status);
    return;
  }

  TcpSocket* sock = ctx->owner;
  if (!sock) {
    complete_connect(ctx, UV_ECANCELED);
    return;
  }

  sock->_uv_tcp = new uv_tcp_t();
  uv_tcp_init(sock->_loop.uv_loop(), sock->_uv_tcp);
  sock->_uv_tcp->data = new HandleData(sock);
  uv_tcp_nodelay(sock->_uv_tcp, 1);

  ctx->request.data = ctx;
  int r = uv_tcp_connect(&ctx->request, sock->_uv_tcp, res->ai_addr,
                         &TcpSocket::on_connect);
  if (r < 0)
    complete_connect(ctx, r);
}


void TcpSocket::on_connect(uv_connect_t* req, int status)
{
  /* IO thread */
  complete_connect(static_cast<connect_context*>(req->data), status);
}


void TcpSocket::complete_connect(connect_context* ctx, UvErr ec)
{
  /* IO thread */
  std::unique_ptr<connect_context> owned(ctx);

  if (!ctx->owner) {
    ctx->promise.set_value(UvErr(UV_ECANCELED));
    return;
  }

  ctx->owner->io_connect_completed(ec);
  ctx->promise.set_value(ec);
}


void TcpSocket::io_connect_completed(UvErr ec)
{
  /* IO thread */
  {
    std::lock_guard<std::mutex> guard(_state_mutex);
    _connect = nullptr;
    if (ec) {
      _last_error = ec;
      return;
    }
    if (_state == socket_state::connecting)
      _state = socket_state::connected;
  }

  LOG_DEBUG("connected to " << _node << ":" << _service);
  io_on_connected();
}


void TcpSocket::start_read(io_on_read on_read, io_on_error on_error)
{
  _user_on_read = std::move(on_read);
  _user_on_error = std::move(on_error);

  if (_loop.this_thread_is_io())
    io_start_read();
  else
    try {
      _loop.push_fn([this]() { io_start_read(); });
    } catch (IoLoopClosed&) {
      THROW("cannot start_read, IO loop closed");
    }
}


void TcpSocket::io_start_read()
{
  /* IO thread */
  if (!is_connected() || !_uv_tcp) {
    io_fail(_last_error ? _last_error : UvErr(UV_ENOTCONN));
    return;
  }

  auto alloc_cb = [](uv_handle_t*, size_t suggested, uv_buf_t* buf) {
    buf->base = new char[suggested];
    buf->len = suggested;
  };

  auto read_cb = [](uv_stream_t* stream, ssize_t nread, const uv_buf_t* buf) {
    std::unique_ptr<char[]> owned(buf->base);
    auto hd = static_cast<HandleData*>(stream->data);
    TcpSocket* sock = hd ? hd->tcp_socket_ptr() : nullptr;
    if (!sock)
      return;

    if (nread > 0) {
      try {
        sock->io_on_bytes(buf->base, static_cast<size_t>(nread));
      } catch (const std::exception& e) {
        LOG_WARN("socket read handler failed: " << e.what());
        sock->io_fail(UV_EPROTO);
      }
    } else if (nread < 0)
      sock->io_fail(static_cast<int>(nread));
  };

  int r = uv_read_start(reinterpret_cast<uv_stream_t*>(_uv_tcp), alloc_cb,
                        read_cb);
  if (r < 0)
    io_fail(r);
}


void TcpSocket::io_on_bytes(char* src, size_t len)
{
  if (_user_on_read)
    _user_on_read(src, len);
}


void TcpSocket::io_fail(UvErr ec)
{
  /* IO thread */
  _last_error = ec;
  if (!_error_reported && _user_on_error) {
    _error_reported = true;
    try {
      _user_on_error(ec);
    } catch (...) {
      log_exception("socket error callback");
    }
  }
  io_close();
}


void TcpSocket::write(const char* src, size_t len)
{
  if (!is_connected())
    THROW("socket " << _node << ":" << _service << " not connected");

  if (_loop.this_thread_is_io()) {
    io_write(src, len);
    return;
  }

  std::vector<char> copy(src, src + len);
  try {
    _loop.push_fn([this, copy = std::move(copy)]() {
      io_write(copy.data(), copy.size());
    });
  } catch (IoLoopClosed&) {
    THROW("cannot write, IO loop closed");
  }
}


void TcpSocket::io_write(const char* src, size_t len)
{
  /* IO thread */
  if (!_uv_tcp || !is_connected() || len == 0)
    return;

  auto wr = new write_request;
  wr->req.data = wr;
  wr->data.assign(src, src + len);
  uv_buf_t buf = uv_buf_init(wr->data.data(),
                             static_cast<unsigned int>(wr->data.size()));

  int r = uv_write(&wr->req, reinterpret_cast<uv_stream_t*>(_uv_tcp), &buf, 1,
                   [](uv_write_t* req, int status) {
                     std::unique_ptr<write_request> owned(
                         static_cast<write_request*>(req->data));
                     if (status < 0 && status != UV_ECANCELED) {
                       auto hd = static_cast<HandleData*>(req->handle->data);
                       if (hd && hd->tcp_socket_ptr())
                         hd->tcp_socket_ptr()->io_fail(status);
                     }
                   });
  if (r < 0) {
    delete wr;
    io_fail(r);
  }
}


std::shared_future<void> TcpSocket::close()
{
  {
    std::lock_guard<std::mutex> guard(_state_mutex);
    if (_state == socket_state::closed)
      return _closed_future;
    if (_state == socket_state::uninitialised) {
      _state = socket_state::closed;
      set_closed_promise();
      return _closed_future;
    }
  }

  if (_loop.this_thread_is_io())
    io_close();
  else
    try {
      _loop.push_fn([this]() { io_close(); });
    } catch (IoLoopClosed&) {
      // the IO loop closes every remaining handle as it shuts down
      if (!_uv_tcp)
        io_on_close_complete();
    }

  return _closed_future;
}


void TcpSocket::io_close()
{
  /* IO thread */
  {
    std::lock_guard<std::mutex> guard(_state_mutex);
    if (_connect) {
      _connect->owner = nullptr;
      _connect = nullptr;
    }
    if (_state == socket_state::closing || _state == socket_state::closed)
      return;
    _state = socket_state::closing;
  }

  auto handle = reinterpret_cast<uv_handle_t*>(_uv_tcp);
  if (handle && !uv_is_closing(handle)) {
    uv_close(handle, [](uv_handle_t* h) {
      auto hd = static_cast<HandleData*>(h->data);
      TcpSocket* sock = hd ? hd->tcp_socket_ptr() : nullptr;
      free_socket(h);
      if (sock)
        sock->io_on_close_complete();
    });
  } else
    io_on_close_complete();
}


void TcpSocket::io_on_close_complete()
{
  {
    std::lock_guard<std::mutex> guard(_state_mutex);
    _state = socket_state::closed;
    _uv_tcp = nullptr;
  }
  set_closed_promise();
}


void TcpSocket::set_closed_promise()
{
  // callers may hold _state_mutex
  std::lock_guard<std::mutex> guard(_promise_mutex);
  if (!_close_promise_set) {
    _close_promise_set = true;
    _closed_promise.set_value();
  }
}

} // namespace quotegate
