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

#include <chrono>
#include <memory>
#include <string>

namespace quotegate
{

/* One established, message-oriented streaming connection. */
class StreamChannel
{
public:
  enum class Event {
    message,    // `payload` holds the next inbound message
    closed,     // connection has ended; `reason` describes why
    interrupted // interrupt() was called while waiting
  };

  virtual ~StreamChannel() = default;

  /* Queue an outbound text message.  Throws Error if the channel is closed. */
  virtual void send(const std::string& msg) = 0;

  /* Block until the next inbound message, connection end, or interrupt.
   * Messages already received are returned before a close is reported. */
  virtual Event next(std::string& payload, std::string& reason) = 0;

  /* Wake a thread blocked in next(); may be called from any thread.  An
   * interrupt raised while no thread is waiting is delivered to the next
   * call to next(). */
  virtual void interrupt() = 0;

  /* Begin an orderly close; safe to call more than once. */
  virtual void close() = 0;
};


/* Opens StreamChannel instances; the seam between the subscription session
 * and the network. */
class StreamConnector
{
public:
  virtual ~StreamConnector() = default;

  /* Throws ConnectionError if the connection cannot be established within
   * the timeout. */
  virtual std::unique_ptr<StreamChannel> connect(
      const std::string& url, std::chrono::milliseconds timeout) = 0;
};

} // namespace quotegate
