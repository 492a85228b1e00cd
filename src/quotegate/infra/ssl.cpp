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

#include <quotegate/infra/ssl.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/util/Error.hpp>

namespace quotegate
{

sslstatus get_sslstatus(SSL* ssl, int n)
{
  switch (SSL_get_error(ssl, n)) {
    case SSL_ERROR_NONE:
      return sslstatus::ok;
    case SSL_ERROR_WANT_READ:
    case SSL_ERROR_WANT_WRITE:
      return sslstatus::want_io;
    default:
      return sslstatus::fail;
  }
}


std::string SslContext::error_queue_text()
{
  std::string text;
  char buf[256];
  while (unsigned long ec = ERR_get_error()) {
    ERR_error_string_n(ec, buf, sizeof(buf));
    if (!text.empty())
      text += "; ";
    text += buf;
  }
  return text;
}


void SslContext::throw_error(const std::string& what)
{
  auto queue = error_queue_text();
  THROW(what << (queue.empty() ? "" : ": ") << queue);
}


SslContext::SslContext(const SslConfig& conf) : _config(conf)
{
  OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS |
                       OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                   nullptr);

  _ctx = SSL_CTX_new(TLS_client_method());
  if (!_ctx)
    throw_error("SSL_CTX_new failed");

  SSL_CTX_set_security_level(_ctx, _config.security_level);
  SSL_CTX_set_mode(_ctx, SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

  if (SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION) != 1)
    throw_error("SSL_CTX_set_min_proto_version failed");

  if (!_config.verify_peer) {
    LOG_WARN("SSL peer verification disabled");
    SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);
    return;
  }

  int loaded = _config.ca_file.empty()
                   ? SSL_CTX_set_default_verify_paths(_ctx)
                   : SSL_CTX_load_verify_locations(_ctx, _config.ca_file.c_str(),
                                                   nullptr);
  if (loaded != 1)
    throw_error("failed to load CA certificates" +
                (_config.ca_file.empty() ? std::string()
                                         : " from " + _config.ca_file));
  SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
}


SslContext::~SslContext()
{
  if (_ctx)
    SSL_CTX_free(_ctx);
}


SslSession::SslSession(SslContext& ctx, const std::string& host)
  : _ssl(SSL_new(ctx.context()))
{
  if (!_ssl)
    SslContext::throw_error("SSL_new failed");

  _network_in = BIO_new(BIO_s_mem());
  _network_out = BIO_new(BIO_s_mem());
  if (!_network_in || !_network_out) {
    BIO_free(_network_in);
    BIO_free(_network_out);
    SslContext::throw_error("BIO_new failed");
  }
  SSL_set_bio(_ssl.get(), _network_in, _network_out);
  SSL_set_connect_state(_ssl.get());

  if (host.empty())
    return;

  SSL_set_tlsext_host_name(_ssl.get(), host.c_str());
  if (ctx.config().verify_peer && SSL_set1_host(_ssl.get(), host.c_str()) != 1)
    SslContext::throw_error("SSL_set1_host failed for " + host);
}

} // namespace quotegate
