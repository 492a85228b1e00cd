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

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <uv.h>

namespace quotegate
{

class TcpSocket;

/* Attached to the data member of each uv handle created by this library, so
 * that the IoLoop can identify its owner during shutdown. */
class HandleData
{
public:
  const static uint64_t DATA_CHECK = 0x5555555555555555;

  explicit HandleData(TcpSocket* ptr) : _check(DATA_CHECK), _tcp_socket_ptr(ptr)
  {
  }

  uint64_t check() const { return _check; }

  /* Null once the owning socket has been detached */
  TcpSocket* tcp_socket_ptr() { return _tcp_socket_ptr; }

  void detach() { _tcp_socket_ptr = nullptr; }

private:
  uint64_t _check; /* retain as first member */
  TcpSocket* _tcp_socket_ptr;
};

/* uv_close callback for socket handles */
void free_socket(uv_handle_t* h);


class IoLoopClosed : public std::exception
{
public:
  const char* what() const noexcept override { return "IoLoop closed"; }
};


/* Owns the libuv loop and the thread that runs it.  Sockets are only touched
 * on this thread; other threads hand work over with push_fn. */
class IoLoop
{
public:
  IoLoop();
  IoLoop(const IoLoop&) = delete;
  IoLoop& operator=(const IoLoop&) = delete;
  ~IoLoop();

  /* Close every open handle and join the IO thread.  Functions already
   * pushed are run first. */
  void sync_stop();

  /* Queue a function for the IO thread.  Throws IoLoopClosed once
   * sync_stop has begun. */
  void push_fn(std::function<void()>);

  uv_loop_t* uv_loop() { return _uv_loop.get(); }

  bool this_thread_is_io() const
  {
    return _io_thread_id.load() == std::this_thread::get_id();
  }

private:
  void on_wakeup();
  void close_handles();
  void run();

  std::unique_ptr<uv_loop_t> _uv_loop;
  std::unique_ptr<uv_async_t> _wakeup;

  std::mutex _queue_mutex;
  enum class state { open, closing, closed } _state = state::open;
  std::vector<std::function<void()>> _queue;

  std::atomic<std::thread::id> _io_thread_id{std::thread::id()};

  std::thread _thread; // last member, started once the rest is constructed
};

} // namespace quotegate
