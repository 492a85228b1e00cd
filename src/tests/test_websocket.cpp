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

#include "quicktest.hpp"

#include <quotegate/infra/DecodeBuffer.hpp>
#include <quotegate/infra/IoLoop.hpp>
#include <quotegate/infra/TcpSocket.hpp>
#include <quotegate/infra/WebsocketChannel.hpp>
#include <quotegate/infra/WebsocketProtocol.hpp>
#include <quotegate/infra/ssl.hpp>
#include <quotegate/util/Error.hpp>

#include <future>

using namespace std;
using namespace quotegate;


/* Drives a WebsocketProtocol with bytes a server would send, and records
 * what the client writes. */
struct ProtocolHarness {
  std::string wire;
  vector<string> messages;
  vector<string> closed;
  int opened = 0;
  std::unique_ptr<WebsocketProtocol> proto;

  explicit ProtocolHarness(WebsocketProtocol::options opts)
  {
    WebsocketProtocol::callbacks cb;
    cb.write = [this](const char* p, size_t n) { wire.append(p, n); };
    cb.on_message = [this](const char* p, size_t n) {
      messages.emplace_back(p, n);
    };
    cb.on_open = [this]() { ++opened; };
    cb.on_closed = [this](std::string reason) { closed.push_back(reason); };
    proto = std::make_unique<WebsocketProtocol>(std::move(opts), std::move(cb));
  }

  void feed(std::string bytes) { proto->io_on_read(&bytes[0], bytes.size()); }

  std::string upgrade_response(const std::string& accept_key) const
  {
    return "HTTP/1.1 101 Switching Protocols\r\n"
           "Upgrade: websocket\r\n"
           "Connection: Upgrade\r\n"
           "Sec-WebSocket-Accept: " + accept_key + "\r\n\r\n";
  }

  /* bytes written by the client since the previous call */
  std::string take_wire()
  {
    std::string out;
    out.swap(wire);
    return out;
  }
};


static WebsocketProtocol::options test_options()
{
  WebsocketProtocol::options opts("/v1/quotes?apikey=abc");
  opts.host_header = "ws.example.com";
  opts.pong_min_interval = std::chrono::milliseconds(0);
  return opts;
}


static std::string frame(std::initializer_list<unsigned char> bytes,
                         const std::string& payload = {})
{
  std::string s(bytes.begin(), bytes.end());
  return s + payload;
}


TEST_CASE("accept_key")
{
  // sample handshake from RFC 6455, section 1.3
  REQUIRE(WebsocketProtocol::make_accept_key("dGhlIHNhbXBsZSBub25jZQ==") ==
          "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}


TEST_CASE("decode_buffer_limit")
{
  DecodeBuffer buf(2, 4);
  REQUIRE(buf.append("abcdef", 6) == 4);
  REQUIRE(std::string(buf.data(), buf.size()) == "abcd");
  REQUIRE_THROWS_AS(buf.append("e", 1), Error);

  buf.drop_front(3);
  REQUIRE(std::string(buf.data(), buf.size()) == "d");
  REQUIRE(buf.append("ef", 2) == 2);
  REQUIRE(std::string(buf.data(), buf.size()) == "def");
}


TEST_CASE("upgrade_request")
{
  ProtocolHarness h(test_options());
  h.proto->initiate();

  auto request = h.take_wire();
  CAPTURE(request);
  REQUIRE(request.find("GET /v1/quotes?apikey=abc HTTP/1.1\r\n") == 0);
  REQUIRE(request.find("Host: ws.example.com\r\n") != string::npos);
  REQUIRE(request.find("Upgrade: websocket\r\n") != string::npos);
  REQUIRE(request.find("Sec-WebSocket-Version: 13\r\n") != string::npos);
  REQUIRE(request.substr(request.size() - 4) == "\r\n\r\n");

  auto key_pos = request.find("Sec-WebSocket-Key: ");
  REQUIRE(key_pos != string::npos);
  auto key_end = request.find("\r\n", key_pos);
  auto key = request.substr(key_pos + 19, key_end - key_pos - 19);
  REQUIRE(key.size() == 24);
  REQUIRE(WebsocketProtocol::make_accept_key(key) ==
          h.proto->expected_accept_key());

  REQUIRE_THROWS_AS(h.proto->initiate(), protocol_error);
}


TEST_CASE("handshake_and_text_frame")
{
  ProtocolHarness h(test_options());
  h.proto->initiate();
  h.take_wire();

  REQUIRE_THROWS_AS(h.proto->send_msg("x", 1), protocol_error);

  // response head and first frame arrive in one read
  h.feed(h.upgrade_response(h.proto->expected_accept_key()) +
         frame({0x81, 0x05}, "hello"));

  REQUIRE(h.opened == 1);
  REQUIRE(h.proto->is_open());
  REQUIRE(h.messages == vector<string>{"hello"});

  // a frame split over two reads
  h.feed(frame({0x81, 0x06}, "wor"));
  REQUIRE(h.messages.size() == 1);
  h.feed("ld!");
  REQUIRE(h.messages.size() == 2);
  REQUIRE(h.messages[1] == "world!");

  // client frames are masked text frames
  h.proto->send_msg("hi", 2);
  auto out = h.take_wire();
  REQUIRE(out.size() == 2 + 4 + 2);
  REQUIRE(static_cast<unsigned char>(out[0]) == 0x81);
  REQUIRE(static_cast<unsigned char>(out[1]) == (0x80 | 2));

  // ping is answered with a pong
  h.feed(frame({0x89, 0x00}));
  out = h.take_wire();
  REQUIRE(!out.empty());
  REQUIRE(static_cast<unsigned char>(out[0]) == 0x8A);
  REQUIRE(h.closed.empty());
}


TEST_CASE("peer_close_frame")
{
  ProtocolHarness h(test_options());
  h.proto->initiate();
  h.feed(h.upgrade_response(h.proto->expected_accept_key()));
  h.take_wire();

  h.feed(frame({0x88, 0x02, 0x03, 0xE8}));

  auto out = h.take_wire();
  REQUIRE(!out.empty());
  REQUIRE(static_cast<unsigned char>(out[0]) == 0x88);
  REQUIRE(h.closed.size() == 1);
  REQUIRE(h.closed[0].find("1000") != string::npos);
  REQUIRE(h.proto->is_closed());

  // nothing further is delivered once closed
  h.feed(frame({0x81, 0x01}, "x"));
  REQUIRE(h.messages.empty());
  REQUIRE(h.closed.size() == 1);
}


TEST_CASE("local_close_handshake")
{
  ProtocolHarness h(test_options());
  h.proto->initiate();
  REQUIRE(!h.proto->initiate_close());

  h.feed(h.upgrade_response(h.proto->expected_accept_key()));
  h.take_wire();

  REQUIRE(h.proto->initiate_close());
  auto out = h.take_wire();
  REQUIRE(static_cast<unsigned char>(out[0]) == 0x88);
  REQUIRE(h.closed.empty());

  h.feed(frame({0x88, 0x02, 0x03, 0xE8}));
  REQUIRE(h.closed.size() == 1);
  REQUIRE(h.take_wire().empty()); // close is not echoed twice
}


TEST_CASE("missed_pings")
{
  auto opts = test_options();
  opts.ping_interval = std::chrono::milliseconds(100);
  opts.max_missed_pings = 2;
  ProtocolHarness h(opts);
  h.proto->initiate();
  h.feed(h.upgrade_response(h.proto->expected_accept_key()));
  h.take_wire();

  h.proto->on_timer();
  REQUIRE(static_cast<unsigned char>(h.take_wire()[0]) == 0x89);

  // any inbound data counts as a reply
  h.feed(frame({0x8A, 0x00}));
  h.proto->on_timer();
  h.proto->on_timer();
  REQUIRE(h.closed.empty());

  h.take_wire();
  h.proto->on_timer();
  REQUIRE(h.closed.size() == 1);
  REQUIRE(static_cast<unsigned char>(h.take_wire()[0]) == 0x88);
}


TEST_CASE("handshake_rejected")
{
  {
    ProtocolHarness h(test_options());
    h.proto->initiate();
    REQUIRE_THROWS_AS(h.feed(h.upgrade_response("bm90IHRoZSByaWdodCBrZXk=")),
                      handshake_error);
    REQUIRE(h.opened == 0);
  }
  {
    ProtocolHarness h(test_options());
    h.proto->initiate();
    REQUIRE_THROWS_AS(h.feed("HTTP/1.1 401 Unauthorized\r\n"
                             "Content-Length: 0\r\n\r\n"),
                      handshake_error);
  }
  {
    ProtocolHarness h(test_options());
    h.proto->initiate();
    REQUIRE_THROWS_AS(h.feed("not http at all\r\n\r\n"), handshake_error);
  }
}


TEST_CASE("parse_ws_url")
{
  auto u = parse_ws_url("wss://ws.finnhub.io?token=abc");
  REQUIRE(u.secure);
  REQUIRE(u.host == "ws.finnhub.io");
  REQUIRE(u.port == 443);
  REQUIRE(u.resource == "/?token=abc");
  REQUIRE(u.host_header() == "ws.finnhub.io");

  u = parse_ws_url("ws://localhost:8080/v1/quotes/price?apikey=k");
  REQUIRE(!u.secure);
  REQUIRE(u.host == "localhost");
  REQUIRE(u.port == 8080);
  REQUIRE(u.resource == "/v1/quotes/price?apikey=k");
  REQUIRE(u.host_header() == "localhost:8080");

  u = parse_ws_url("WS://[::1]:9000");
  REQUIRE(u.host == "::1");
  REQUIRE(u.resource == "/");
  REQUIRE(u.host_header() == "[::1]:9000");

  REQUIRE_THROWS_AS(parse_ws_url("https://example.com"), ConnectionError);
  REQUIRE_THROWS_AS(parse_ws_url("example.com"), ConnectionError);
  REQUIRE_THROWS_AS(parse_ws_url("ws://:80/"), ConnectionError);
  REQUIRE_THROWS_AS(parse_ws_url("ws://host:99999/"), ConnectionError);
  REQUIRE_THROWS_AS(parse_ws_url("ws://host:8x/"), ConnectionError);
}


TEST_CASE("connect_refused")
{
  IoLoop io;
  SslContext ssl;

  {
    TcpSocket sock(io);
    auto fut = sock.connect("127.0.0.1", 1);
    REQUIRE(fut.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    auto err = fut.get();
    CAPTURE(err);
    REQUIRE(static_cast<bool>(err));
    REQUIRE(!sock.is_connected());
  }

  WebsocketConnector connector(io, ssl);
  REQUIRE_THROWS_AS(
      connector.connect("ws://127.0.0.1:1/", std::chrono::seconds(5)),
      ConnectionError);

  io.sync_stop();
}


QUICKTEST_MAIN()
