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

#include <quotegate/core/ProviderConfig.hpp>
#include <quotegate/core/StreamChannel.hpp>
#include <quotegate/core/SubscriptionManager.hpp>
#include <quotegate/util/Error.hpp>
#include <quotegate/util/RealtimeEventLoop.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

using namespace std;
using namespace quotegate;


/* In-memory channel; the test plays the part of the remote provider */
class FakeChannel : public StreamChannel
{
public:
  void send(const std::string& msg) override
  {
    std::lock_guard<std::mutex> guard(_mutex);
    if (_closed)
      THROW("fake channel closed");
    _sent.push_back(msg);
    _cv.notify_all();
  }

  Event next(std::string& payload, std::string& reason) override
  {
    std::unique_lock<std::mutex> lock(_mutex);
    _cv.wait(lock, [this]() {
      return _interrupt || !_inbound.empty() || _peer_closed;
    });
    if (_interrupt) {
      _interrupt = false;
      return Event::interrupted;
    }
    if (!_inbound.empty()) {
      payload = std::move(_inbound.front());
      _inbound.pop_front();
      return Event::message;
    }
    reason = _close_reason;
    return Event::closed;
  }

  void interrupt() override
  {
    std::lock_guard<std::mutex> guard(_mutex);
    _interrupt = true;
    _cv.notify_all();
  }

  void close() override
  {
    std::lock_guard<std::mutex> guard(_mutex);
    _closed = true;
    ++_close_calls;
  }

  /* provider side */

  void deliver(std::string msg)
  {
    std::lock_guard<std::mutex> guard(_mutex);
    _inbound.push_back(std::move(msg));
    _cv.notify_all();
  }

  void peer_close(std::string reason)
  {
    std::lock_guard<std::mutex> guard(_mutex);
    _peer_closed = true;
    _close_reason = std::move(reason);
    _cv.notify_all();
  }

  vector<string> sent()
  {
    std::lock_guard<std::mutex> guard(_mutex);
    return _sent;
  }

  bool wait_for_sent(size_t n, std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(_mutex);
    return _cv.wait_for(lock, timeout, [&]() { return _sent.size() >= n; });
  }

  int close_calls()
  {
    std::lock_guard<std::mutex> guard(_mutex);
    return _close_calls;
  }

private:
  std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<std::string> _inbound;
  vector<string> _sent;
  bool _interrupt = false;
  bool _peer_closed = false;
  bool _closed = false;
  int _close_calls = 0;
  std::string _close_reason;
};


/* Hands out a prepared FakeChannel, keeping a pointer for the test */
class FakeConnector : public StreamConnector
{
public:
  std::atomic<FakeChannel*> channel{nullptr};
  std::string last_url;

  FakeChannel* ch() { return channel.load(); }
  bool refuse = false;

  std::unique_ptr<StreamChannel> connect(const std::string& url,
                                         std::chrono::milliseconds) override
  {
    last_url = url;
    if (refuse)
      throw ConnectionError("connection refused");
    auto ch = std::make_unique<FakeChannel>();
    channel = ch.get();
    return ch;
  }
};


static ProviderConfig stream_provider()
{
  ProviderConfig pc;
  pc.name = "fakeprov";
  pc.endpoint = "https://api.example.com";
  pc.stream_endpoint = "wss://stream.example.com/v1";
  pc.credential = "tok";
  return pc;
}


TEST_CASE("control_message_format")
{
  auto msg = SubscriptionManager::control_message("subscribe", {"AAPL", "MSFT"});
  auto j = json::parse(msg);
  REQUIRE(j["action"] == "subscribe");
  REQUIRE(j["params"]["symbols"] == "AAPL,MSFT");
}


TEST_CASE("subscription_set")
{
  FakeConnector connector;
  SubscriptionManager mgr(stream_provider(), connector);

  mgr.subscribe({"AAPL", "MSFT"});
  mgr.unsubscribe({"AAPL"});
  REQUIRE(mgr.subscriptions() == set<string>{"MSFT"});

  // unsubscribe is idempotent
  mgr.unsubscribe({"AAPL"});
  mgr.unsubscribe({"NOPE"});
  REQUIRE(mgr.subscriptions() == set<string>{"MSFT"});

  mgr.subscribe({"MSFT", ""});
  REQUIRE(mgr.subscriptions().size() == 1);
  REQUIRE(mgr.state() == ConnectionState::disconnected);

  // stopping a session that never started has no effect
  mgr.stop();
  REQUIRE(mgr.state() == ConnectionState::disconnected);
}


TEST_CASE("start_sends_single_subscribe")
{
  FakeConnector connector;
  SubscriptionManager mgr(stream_provider(), connector);

  vector<ConnectionState> states;
  mgr.set_state_observer([&](ConnectionState s) { states.push_back(s); });

  mgr.subscribe({"AAPL"});
  mgr.start();

  REQUIRE(connector.last_url == "wss://stream.example.com/v1?apikey=tok");
  REQUIRE(mgr.state() == ConnectionState::receiving);
  auto sent = connector.ch()->sent();
  REQUIRE(sent.size() == 1);
  auto j = json::parse(sent[0]);
  REQUIRE(j["action"] == "subscribe");
  REQUIRE(j["params"]["symbols"] == "AAPL");

  REQUIRE(states == vector<ConnectionState>({ConnectionState::connecting,
                                             ConnectionState::subscribed,
                                             ConnectionState::receiving}));

  // while connected, changes send only the delta
  mgr.subscribe({"AAPL", "TSLA"});
  mgr.unsubscribe({"AAPL"});
  mgr.unsubscribe({"AAPL"});
  sent = connector.ch()->sent();
  REQUIRE(sent.size() == 3);
  REQUIRE(json::parse(sent[1])["params"]["symbols"] == "TSLA");
  REQUIRE(json::parse(sent[2])["action"] == "unsubscribe");
  REQUIRE(json::parse(sent[2])["params"]["symbols"] == "AAPL");

  REQUIRE_THROWS_AS(mgr.start(), Error);
}


TEST_CASE("connect_failure")
{
  FakeConnector connector;
  connector.refuse = true;
  SubscriptionManager mgr(stream_provider(), connector);

  vector<StreamError> errors;
  REQUIRE_THROWS_AS(
      mgr.run({"AAPL"}, [](const json&) {},
              [&](const StreamError& e) { errors.push_back(e); }),
      ConnectionError);
  REQUIRE(mgr.state() == ConnectionState::disconnected);
  REQUIRE(errors.empty());

  // a provider without a stream endpoint cannot start
  auto pc = stream_provider();
  pc.stream_endpoint.clear();
  SubscriptionManager no_stream(pc, connector);
  REQUIRE_THROWS_AS(no_stream.start(), ConnectionError);
  REQUIRE(no_stream.state() == ConnectionState::disconnected);
}


TEST_CASE("malformed_message_isolated")
{
  FakeConnector connector;
  SubscriptionManager mgr(stream_provider(), connector);

  vector<json> received;
  vector<StreamError> errors;
  mgr.subscribe({"AAPL"});
  mgr.set_callbacks(
      [&](const json& j) {
        received.push_back(j);
        if (received.size() == 2)
          mgr.stop();
      },
      [&](const StreamError& e) { errors.push_back(e); });
  mgr.start();

  connector.ch()->deliver(R"({"type":"trade","p":1.5})");
  connector.ch()->deliver(R"({"type":"trade",)");
  connector.ch()->deliver(R"({"type":"trade","p":1.6})");

  mgr.receive();

  REQUIRE(received.size() == 2);
  REQUIRE(received[1]["p"] == 1.6);
  REQUIRE(errors.size() == 1);
  REQUIRE(errors[0].kind == ErrorKind::decode);
  REQUIRE(mgr.state() == ConnectionState::disconnected);
}


TEST_CASE("callback_exception_isolated")
{
  FakeConnector connector;
  SubscriptionManager mgr(stream_provider(), connector);

  int calls = 0;
  vector<StreamError> errors;
  mgr.set_callbacks(
      [&](const json&) {
        if (++calls == 1)
          throw std::runtime_error("consumer failed");
        mgr.stop();
      },
      [&](const StreamError& e) { errors.push_back(e); });
  mgr.start();

  connector.ch()->deliver("{}");
  connector.ch()->deliver("{}");
  mgr.receive();

  REQUIRE(calls == 2);
  REQUIRE(errors.size() == 1);
  REQUIRE(errors[0].kind == ErrorKind::callback);
  REQUIRE(errors[0].message.find("consumer failed") != string::npos);
}


TEST_CASE("peer_close")
{
  FakeConnector connector;
  SubscriptionManager mgr(stream_provider(), connector);

  vector<ConnectionState> states;
  vector<StreamError> errors;
  mgr.set_callbacks([](const json&) {},
                    [&](const StreamError& e) { errors.push_back(e); });
  mgr.subscribe({"AAPL"});
  mgr.start();
  mgr.set_state_observer([&](ConnectionState s) { states.push_back(s); });

  connector.ch()->deliver(R"({"type":"ping"})");
  connector.ch()->peer_close("closed by peer, code 1000");
  mgr.receive();

  REQUIRE(states == vector<ConnectionState>({ConnectionState::closing,
                                             ConnectionState::disconnected}));
  REQUIRE(errors.size() == 1);
  REQUIRE(errors[0].kind == ErrorKind::connection_closed);
  REQUIRE(errors[0].message == "closed by peer, code 1000");
  REQUIRE(mgr.subscriptions() == set<string>{"AAPL"});

  // subscription set survives, so the session can be restarted
  mgr.start();
  REQUIRE(connector.ch()->sent().size() == 1);
  mgr.stop();
  mgr.receive();
  REQUIRE(mgr.state() == ConnectionState::disconnected);
}


TEST_CASE("stop_from_other_thread")
{
  FakeConnector connector;
  SubscriptionManager mgr(stream_provider(), connector);

  vector<StreamError> errors;
  std::promise<void> first;
  bool first_set = false;

  auto fut = std::async(std::launch::async, [&]() {
    mgr.run({"AAPL"},
            [&](const json&) {
              if (!first_set) {
                first_set = true;
                first.set_value();
              }
            },
            [&](const StreamError& e) { errors.push_back(e); });
  });

  // wait for the subscribe, which is sent once the session is receiving
  for (int i = 0; i < 500 && connector.ch() == nullptr; ++i)
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  REQUIRE(connector.ch() != nullptr);
  REQUIRE(connector.ch()->wait_for_sent(1, std::chrono::seconds(5)));

  connector.ch()->deliver("{}");
  REQUIRE(first.get_future().wait_for(std::chrono::seconds(5)) ==
          std::future_status::ready);

  mgr.stop();
  REQUIRE(fut.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
  fut.get();

  REQUIRE(errors.empty());
  REQUIRE(mgr.state() == ConnectionState::disconnected);
}


TEST_CASE("heartbeat")
{
  RealtimeEventLoop ev("ev");
  FakeConnector connector;

  auto pc = stream_provider();
  pc.heartbeat_interval = std::chrono::milliseconds(50);
  pc.heartbeat_message = R"({"action":"heartbeat"})";
  SubscriptionManager mgr(pc, connector, &ev);

  mgr.subscribe({"AAPL"});
  mgr.start();

  REQUIRE(connector.ch()->wait_for_sent(3, std::chrono::seconds(5)));
  auto sent = connector.ch()->sent();
  REQUIRE(sent[1] == pc.heartbeat_message);

  mgr.stop();
  mgr.receive();
  ev.sync_stop();
}


QUICKTEST_MAIN()
