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

#include <quotegate/infra/IoLoop.hpp>
#include <quotegate/infra/TcpSocket.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/util/Error.hpp>

#include <csignal>

namespace quotegate
{

void free_socket(uv_handle_t* h)
{
  if (h) {
    delete static_cast<HandleData*>(h->data);
    delete reinterpret_cast<uv_tcp_t*>(h);
  }
}


IoLoop::IoLoop()
  : _uv_loop(std::make_unique<uv_loop_t>()),
    _wakeup(std::make_unique<uv_async_t>())
{
  UvErr err = uv_loop_init(_uv_loop.get());
  if (err)
    THROW("uv_loop_init failed, " << err);
  _uv_loop->data = this;

  _wakeup->data = this;
  uv_async_init(_uv_loop.get(), _wakeup.get(), [](uv_async_t* h) {
    static_cast<IoLoop*>(h->data)->on_wakeup();
  });

  // a write to a reset connection must not raise SIGPIPE
  signal(SIGPIPE, SIG_IGN);

  _thread = std::thread([this]() {
    _io_thread_id = std::this_thread::get_id();
    Logger::instance().register_thread_id("libuv");
    run();
    _io_thread_id = std::thread::id();
  });
}


IoLoop::~IoLoop()
{
  sync_stop();
  uv_loop_close(_uv_loop.get());
}


void IoLoop::sync_stop()
{
  {
    std::lock_guard<std::mutex> guard(_queue_mutex);
    if (_state == state::open) {
      _state = state::closing;
      uv_async_send(_wakeup.get());
    }
  }

  if (_thread.joinable() && _thread.get_id() != std::this_thread::get_id())
    _thread.join();
}


void IoLoop::push_fn(std::function<void()> fn)
{
  std::lock_guard<std::mutex> guard(_queue_mutex);
  if (_state != state::open)
    throw IoLoopClosed();
  _queue.push_back(std::move(fn));

  // sent under the lock, so the wakeup handle cannot have been closed yet
  uv_async_send(_wakeup.get());
}


void IoLoop::on_wakeup()
{
  std::vector<std::function<void()>> work;
  bool closing = false;
  {
    std::lock_guard<std::mutex> guard(_queue_mutex);
    work.swap(_queue);
    if (_state == state::closing) {
      _state = state::closed;
      closing = true;
    }
  }

  for (auto& fn : work)
    try {
      fn();
    } catch (...) {
      log_exception("IoLoop function");
    }

  if (closing)
    close_handles();
}


/* Once every handle is closed uv_run returns and the IO thread exits. */
void IoLoop::close_handles()
{
  uv_close(reinterpret_cast<uv_handle_t*>(_wakeup.get()), nullptr);

  uv_walk(
      _uv_loop.get(),
      [](uv_handle_t* handle, void*) {
        if (uv_is_closing(handle))
          return;

        auto* owner = static_cast<HandleData*>(handle->data);
        if (!owner || owner->check() != HandleData::DATA_CHECK) {
          LOG_WARN("closing unowned uv handle, type " << handle->type);
          uv_close(handle, nullptr);
        }
        else if (owner->tcp_socket_ptr())
          owner->tcp_socket_ptr()->io_close();
        else
          uv_close(handle, free_socket);
      },
      nullptr);
}


void IoLoop::run()
{
  while (true) {
    try {
      if (uv_run(_uv_loop.get(), UV_RUN_DEFAULT) == 0)
        return;
    } catch (...) {
      log_exception("IoLoop");
    }
  }
}

} // namespace quotegate
