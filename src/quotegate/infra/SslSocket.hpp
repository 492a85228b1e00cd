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

#include <quotegate/infra/TcpSocket.hpp>

#include <memory>
#include <mutex>
#include <string>

namespace quotegate
{

class SslContext;
class SslSession;
enum class sslstatus;

/* TLS client socket.  Encryption runs on the IO thread using OpenSSL memory
 * BIOs; user bytes written before the handshake completes are queued. */
class SslSocket : public TcpSocket
{
public:
  SslSocket(SslContext*, IoLoop&);

  ~SslSocket() override;

  void write(const char*, size_t) override;

private:
  void io_on_connected() override;
  void io_on_bytes(char*, size_t) override;

  sslstatus io_handshake();
  bool io_decrypt(const char*, size_t);
  void io_encrypt_pending();
  bool io_send_network_out();

  std::string peer() const { return node() + ":" + service(); }

  SslContext* _ssl_context;
  std::unique_ptr<SslSession> _session;

  enum class handshake { pending, done, failed } _handshake = handshake::pending;

  // plaintext written by the user, not yet passed to SSL_write
  std::mutex _plaintext_mutex;
  std::string _plaintext;
};

} // namespace quotegate
