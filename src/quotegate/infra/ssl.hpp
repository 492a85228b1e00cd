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

#include <memory>
#include <string>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace quotegate
{

struct SslConfig {
  /* OpenSSL security level; 2 accepts the certificates providers use today */
  int security_level = 2;

  /* Verify the server certificate chain and host name */
  bool verify_peer = true;

  /* Optional CA bundle; the system default paths are used when empty */
  std::string ca_file;
};


/* OpenSSL context for client connections, shared by every TLS socket. */
class SslContext
{
public:
  explicit SslContext(const SslConfig& conf = SslConfig{});
  SslContext(const SslContext&) = delete;
  SslContext& operator=(const SslContext&) = delete;
  ~SslContext();

  SSL_CTX* context() { return _ctx; }

  const SslConfig& config() const { return _config; }

  /* Empty the calling thread's OpenSSL error queue, returning its entries
   * joined with "; " */
  static std::string error_queue_text();

  /* Throw Error with `what` and the contents of the error queue */
  [[noreturn]] static void throw_error(const std::string& what);

private:
  SSL_CTX* _ctx = nullptr;
  SslConfig _config;
};


/* One client TLS session.  Ciphertext moves through a pair of memory BIOs,
 * which the SSL object owns: the socket feeds received bytes into
 * network_in() and sends whatever appears on network_out(). */
class SslSession
{
public:
  /* `host` is used for SNI, and for certificate name checks when peer
   * verification is enabled. */
  SslSession(SslContext& ctx, const std::string& host);

  SSL* ssl() const { return _ssl.get(); }
  BIO* network_in() const { return _network_in; }
  BIO* network_out() const { return _network_out; }

private:
  struct ssl_deleter {
    void operator()(SSL* p) const { SSL_free(p); }
  };

  std::unique_ptr<SSL, ssl_deleter> _ssl;
  BIO* _network_in = nullptr;
  BIO* _network_out = nullptr;
};

/* Collapse SSL_get_error into the three outcomes the socket acts on */
enum class sslstatus { ok, want_io, fail };
sslstatus get_sslstatus(SSL* ssl, int n);

} // namespace quotegate
