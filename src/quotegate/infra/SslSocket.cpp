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

#include <quotegate/infra/SslSocket.hpp>
#include <quotegate/infra/IoLoop.hpp>
#include <quotegate/infra/ssl.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/util/Error.hpp>

namespace quotegate
{

static constexpr size_t ssl_chunk_size = 4096;


SslSocket::SslSocket(SslContext* ssl_context, IoLoop& loop)
  : TcpSocket(loop), _ssl_context(ssl_context)
{
  if (!_ssl_context)
    THROW("SslSocket requires an SSL context");
}


SslSocket::~SslSocket()
{
  // close on the IO thread first; it must not reach the session of a
  // partially destroyed socket
  close_for_destruction();
}


void SslSocket::io_on_connected()
{
  /* IO thread */
  try {
    _session = std::make_unique<SslSession>(*_ssl_context, node());
  } catch (const std::exception& e) {
    LOG_ERROR("SSL session setup failed for " << peer() << ": " << e.what());
    io_fail(UV_EPROTO);
    return;
  }

  // send the ClientHello now rather than waiting for user data
  if (io_handshake() == sslstatus::fail)
    io_fail(UV_EPROTO);
}


/* Write out everything SSL has queued for the peer */
bool SslSocket::io_send_network_out()
{
  char buf[ssl_chunk_size];
  while (true) {
    int n = BIO_read(_session->network_out(), buf, sizeof(buf));
    if (n > 0)
      io_write(buf, n);
    else
      return BIO_should_retry(_session->network_out()) || n == 0;
  }
}


sslstatus SslSocket::io_handshake()
{
  /* IO thread */
  SSL* ssl = _session->ssl();
  sslstatus status = get_sslstatus(ssl, SSL_do_handshake(ssl));

  if (status == sslstatus::fail) {
    if (_handshake == handshake::pending) {
      _handshake = handshake::failed;
      long verify = SSL_get_verify_result(ssl);
      LOG_ERROR(peer() << ", SSL handshake failed, "
                << SslContext::error_queue_text()
                << (verify != X509_V_OK ? X509_verify_cert_error_string(verify)
                                        : ""));
    }
    return status;
  }

  // handshake records, including the final Finished, go out now
  if (!io_send_network_out())
    return sslstatus::fail;

  if (SSL_is_init_finished(ssl) && _handshake == handshake::pending) {
    _handshake = handshake::done;
    LOG_DEBUG(peer() << ", SSL handshake complete, " << SSL_get_version(ssl));
    io_encrypt_pending();
  }

  return status;
}


void SslSocket::io_on_bytes(char* src, size_t len)
{
  /* IO thread */
  if (!io_decrypt(src, len))
    io_fail(UV_EPROTO);
}


/* Feed ciphertext from the socket through SSL, passing any plaintext to the
 * user.  Returns false when the connection cannot continue. */
bool SslSocket::io_decrypt(const char* src, size_t len)
{
  if (!_session)
    return false;

  SSL* ssl = _session->ssl();
  char buf[ssl_chunk_size];

  while (len > 0) {
    int n = BIO_write(_session->network_in(), src, static_cast<int>(len));
    if (n <= 0)
      return false;
    src += n;
    len -= n;

    if (!SSL_is_init_finished(ssl)) {
      if (io_handshake() == sslstatus::fail)
        return false;
      if (!SSL_is_init_finished(ssl))
        continue;
    }

    do {
      n = SSL_read(ssl, buf, sizeof(buf));
      if (n > 0 && _user_on_read)
        _user_on_read(buf, n);
    } while (n > 0);

    switch (get_sslstatus(ssl, n)) {
      case sslstatus::fail:
        LOG_ERROR(peer() << ", SSL read failed, "
                  << SslContext::error_queue_text());
        return false;
      case sslstatus::want_io:
        // eg a post-handshake message that needs a reply
        if (!io_send_network_out())
          return false;
        break;
      case sslstatus::ok:
        break;
    }
  }

  return true;
}


void SslSocket::write(const char* buf, size_t n)
{
  if (!is_connected())
    THROW("socket " << peer() << " not connected");

  {
    std::lock_guard<std::mutex> guard(_plaintext_mutex);
    _plaintext.append(buf, n);
  }

  if (_loop.this_thread_is_io())
    io_encrypt_pending();
  else
    try {
      _loop.push_fn([this]() { io_encrypt_pending(); });
    } catch (IoLoopClosed&) {
      THROW("cannot write, IO loop closed");
    }
}


void SslSocket::io_encrypt_pending()
{
  /* IO thread */
  if (!_session || _handshake != handshake::done)
    return;

  std::string plain;
  {
    std::lock_guard<std::mutex> guard(_plaintext_mutex);
    plain.swap(_plaintext);
  }

  size_t offset = 0;
  while (offset < plain.size()) {
    int n = SSL_write(_session->ssl(), plain.data() + offset,
                      static_cast<int>(plain.size() - offset));
    if (n > 0)
      offset += n;

    if ((n <= 0 && get_sslstatus(_session->ssl(), n) == sslstatus::fail) ||
        !io_send_network_out()) {
      LOG_ERROR(peer() << ", SSL write failed, "
                << SslContext::error_queue_text());
      io_fail(UV_EPROTO);
      return;
    }

    if (n <= 0)
      break;
  }

  // whatever SSL did not take goes back ahead of later writes
  if (offset < plain.size()) {
    std::lock_guard<std::mutex> guard(_plaintext_mutex);
    _plaintext.insert(0, plain, offset, std::string::npos);
  }
}

} // namespace quotegate
