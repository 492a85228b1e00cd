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

#include <quotegate/core/HttpTransport.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/core/ProviderConfig.hpp>
#include <quotegate/core/RateLimiter.hpp>
#include <quotegate/core/RequestDispatcher.hpp>
#include <quotegate/infra/CurlTransport.hpp>
#include <quotegate/util/Config.hpp>
#include <quotegate/util/DelimitedText.hpp>
#include <quotegate/util/Error.hpp>
#include <quotegate/util/RealtimeEventLoop.hpp>
#include <quotegate/util/json.hpp>
#include <quotegate/util/utils.hpp>

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <iostream>
#include <sstream>
#include <thread>

#include <stdlib.h>

using namespace std;
using namespace quotegate;


/* Transport returning a canned response, and recording each request */
class StubTransport : public HttpTransport
{
public:
  HttpResponse response{200, R"({"c":189.5,"h":190.1,"l":187.2})"};
  bool fail_transport = false;
  vector<HttpRequest> requests;

  HttpResponse perform(const HttpRequest& request) override
  {
    requests.push_back(request);
    if (fail_transport)
      throw TransportError("http-request failed, error 'Timeout was reached'");
    return response;
  }
};


static ProviderConfig test_provider(int max_calls = 0)
{
  ProviderConfig pc;
  pc.name = "testprov";
  pc.endpoint = "https://api.example.com/v1/";
  pc.credential = "secret";
  pc.credential_name = "apikey";
  pc.max_calls = max_calls;
  pc.window = std::chrono::seconds(1);
  return pc;
}


TEST_CASE("utils")
{
  REQUIRE(split("", ',').empty());
  REQUIRE(split(",", ',') == vector<string>({"", ""}));
  REQUIRE(split("a,b", ',') == vector<string>({"a", "b"}));
  REQUIRE(split("a,,b", ',') == vector<string>({"a", "", "b"}));

  REQUIRE(trim(" a	 ") == "a");
  REQUIRE(trim("  ").empty());
  REQUIRE(trim("").empty());

  REQUIRE(join(vector<string>{"AAPL", "MSFT"}, ",") == "AAPL,MSFT");
  REQUIRE(str_tolower("WSS") == "wss");

  const unsigned char hello[] = {'h', 'e', 'l', 'l', 'o'};
  REQUIRE(base64_encode(hello, sizeof(hello)) == "aGVsbG8=");
  REQUIRE(base64_encode(hello, 0).empty());
}


TEST_CASE("json")
{
  std::string rawstr =
      R"({"type":"trade","data":[{"s":"AAPL","p":189.5,"v":100}]})";

  auto msg = decode_json(rawstr.data(), rawstr.size());
  REQUIRE(msg["type"] == "trade");
  REQUIRE(msg["data"].size() == 1);

  std::string bad = R"({"type":"trade",)";
  REQUIRE_THROWS_AS(decode_json(bad.data(), bad.size()), parse_error);

  REQUIRE_THROWS_AS(read_json_config_file("/nonexistent/quotegate.json"),
                    ConfigError);
}


TEST_CASE("config_interpolation")
{
  ::setenv("QUOTEGATE_TEST_KEY", "k123", 1);
  ::unsetenv("QUOTEGATE_TEST_UNSET");

  REQUIRE(interpolate_string("${QUOTEGATE_TEST_KEY}") == "k123");
  REQUIRE(interpolate_string("a-${QUOTEGATE_TEST_KEY}-b") == "a-k123-b");
  REQUIRE(interpolate_string("x${QUOTEGATE_TEST_UNSET}y") == "xy");
  REQUIRE(interpolate_string("plain") == "plain");

  json raw = json::parse(R"({"providers":{"finnhub":{"credential":"${QUOTEGATE_TEST_KEY}",
     "max_calls":30, "window_ms":30000}}, "logging":{"level":"warn"}})");
  Config config(raw, "test");

  auto providers = config.get_sub_config("providers");
  REQUIRE(providers.keys() == vector<string>{"finnhub"});
  auto pc = ProviderConfig::from_config("finnhub",
                                        providers.get_sub_config("finnhub"));
  REQUIRE(pc.credential == "k123");
  REQUIRE(pc.max_calls == 30);
  REQUIRE(pc.window == std::chrono::milliseconds(30000));
  // fields not overridden come from the preset
  REQUIRE(pc.endpoint == "https://finnhub.io/api/v1");
  REQUIRE(pc.credential_placement == CredentialPlacement::header);

  REQUIRE(config.get_sub_config("logging").get_string("level") == "warn");
  REQUIRE(config.get_uint("absent", 5) == 5);
  REQUIRE_THROWS_AS(config.get_string("absent"), MissingFieldConfigError);
  REQUIRE_THROWS_AS(config.get_sub_config("logging").get_bool("level", false),
                    ConfigError);
}


TEST_CASE("provider_presets")
{
  auto finnhub = ProviderConfig::preset("finnhub");
  REQUIRE(finnhub.max_calls == 60);
  REQUIRE(finnhub.window == std::chrono::seconds(60));

  auto av = ProviderConfig::preset("alphavantage");
  REQUIRE(av.max_calls == 5);
  REQUIRE(av.endpoint == "https://www.alphavantage.co/query");
  REQUIRE_THROWS_AS(av.stream_url(), ConfigError);

  auto td = ProviderConfig::preset("twelvedata");
  REQUIRE(td.max_calls == 8);
  REQUIRE(td.heartbeat_interval == std::chrono::seconds(10));

  REQUIRE_THROWS_AS(ProviderConfig::preset("nosuch"), ConfigError);

  // a provider without preset needs an endpoint
  Config empty(json::object());
  REQUIRE_THROWS_AS(ProviderConfig::from_config("custom", empty), ConfigError);

  finnhub.credential = "";
  av.credential = "x";
  auto missing = missing_credentials({finnhub, av});
  REQUIRE(missing == vector<string>{"finnhub"});

  finnhub.credential = "tok";
  REQUIRE(finnhub.stream_url() == "wss://ws.finnhub.io?token=tok");

  // reserved characters in a credential are percent-encoded
  finnhub.credential = "a&b+c#d";
  REQUIRE(finnhub.stream_url() == "wss://ws.finnhub.io?token=a%26b%2Bc%23d");

  json too_many = json::parse(R"({"max_calls": 4294967296})");
  REQUIRE_THROWS_AS(ProviderConfig::from_config("finnhub", Config(too_many)),
                    ConfigError);
  json int_max = json::parse(R"({"max_calls": 2147483647})");
  REQUIRE(ProviderConfig::from_config("finnhub", Config(int_max)).max_calls ==
          2147483647);
}


TEST_CASE("delimited_text")
{
  auto rows = decode_delimited_text(
      "timestamp,open,close\r\n2024-05-01,10.5,11\n\n2024-05-02,\"1,000\",12\n");
  REQUIRE(rows.is_array());
  REQUIRE(rows.size() == 2);
  REQUIRE(rows[0]["timestamp"] == "2024-05-01");
  REQUIRE(rows[0]["close"] == "11");
  REQUIRE(rows[1]["open"] == "1,000");

  REQUIRE(decode_delimited_text("").empty());
  REQUIRE(decode_delimited_text("a,b\n").empty());

  REQUIRE_THROWS_AS(decode_delimited_text("a,b\n1,2,3\n"), parse_error);
  REQUIRE_THROWS_AS(split_delimited_line("x,\"open"), parse_error);

  REQUIRE(split_delimited_line("a;\"b;\"\"c\"\"\"", ';') ==
          vector<string>({"a", "b;\"c\""}));
}


TEST_CASE("rate_limiter_within_limit")
{
  RateLimiter limiter;
  limiter.set_limit("p", 5, std::chrono::seconds(60));

  auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 5; ++i)
    limiter.acquire("p");
  auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE(elapsed < std::chrono::milliseconds(500));
  REQUIRE(limiter.calls_in_window("p") == 5);

  // unregistered providers are never delayed
  limiter.acquire("other");
  REQUIRE(limiter.calls_in_window("other") == 0);
}


TEST_CASE("rate_limiter_window_rollover")
{
  auto fake_now = std::chrono::steady_clock::now();
  RateLimiter limiter([&fake_now]() { return fake_now; });
  limiter.set_limit("p", 2, std::chrono::seconds(10));

  limiter.acquire("p");
  limiter.acquire("p");
  REQUIRE(limiter.calls_in_window("p") == 2);

  fake_now += std::chrono::seconds(10);
  limiter.acquire("p");
  REQUIRE(limiter.calls_in_window("p") == 1);

  // a limit of zero removes throttling
  limiter.set_limit("p", 0, std::chrono::seconds(10));
  for (int i = 0; i < 10; ++i)
    limiter.acquire("p");
  REQUIRE(limiter.calls_in_window("p") == 0);
}


TEST_CASE("rate_limiter_blocks_over_limit")
{
  RateLimiter limiter;
  StubTransport transport;
  RequestDispatcher dispatcher(limiter, transport);

  auto pc = test_provider(1);
  limiter.set_limit(pc.name, pc.max_calls, pc.window);

  RequestDescriptor desc;
  desc.target_path = "quote";
  desc.query["symbol"] = "AAPL";

  auto start = std::chrono::steady_clock::now();
  int ok_count = 0;
  for (int i = 0; i < 3; ++i)
    ok_count += dispatcher.send(pc, desc).ok() ? 1 : 0;
  auto elapsed = std::chrono::steady_clock::now() - start;

  CAPTURE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
  REQUIRE(ok_count == 3);
  REQUIRE(transport.requests.size() == 3);
  REQUIRE(elapsed >= std::chrono::milliseconds(2000));
}


TEST_CASE("rate_limiter_concurrent_callers")
{
  const int max_calls = 2;
  const int callers = 7;
  const auto window = std::chrono::milliseconds(250);

  RateLimiter limiter;
  limiter.set_limit("p", max_calls, window);

  std::mutex mutex;
  vector<std::chrono::steady_clock::time_point> grants;
  std::atomic<int> over_limit{0};

  auto start = std::chrono::steady_clock::now();
  vector<std::thread> threads;
  for (int i = 0; i < callers; ++i)
    threads.emplace_back([&]() {
      limiter.acquire("p");
      if (limiter.calls_in_window("p") > max_calls)
        ++over_limit;
      std::lock_guard<std::mutex> guard(mutex);
      grants.push_back(std::chrono::steady_clock::now());
    });
  for (auto& t : threads)
    t.join();
  auto elapsed = std::chrono::steady_clock::now() - start;

  CAPTURE(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
  REQUIRE(grants.size() == static_cast<size_t>(callers));
  REQUIRE(over_limit == 0);

  // seven callers at two per window need four windows
  REQUIRE(elapsed >= 3 * window);

  // grants separated by max_calls others fall in different windows; allow
  // for the delay between a grant and its timestamp being taken
  std::sort(grants.begin(), grants.end());
  for (size_t i = max_calls; i < grants.size(); ++i)
    REQUIRE(grants[i] - grants[i - max_calls] >=
            window - std::chrono::milliseconds(50));
}


TEST_CASE("rate_limiter_providers_independent")
{
  RateLimiter limiter;
  limiter.set_limit("slow", 1, std::chrono::seconds(2));
  limiter.set_limit("fast", 100, std::chrono::seconds(2));

  limiter.acquire("slow");
  auto blocked = std::async(std::launch::async, [&]() { limiter.acquire("slow"); });

  auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < 10; ++i)
    limiter.acquire("fast");
  REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(500));

  blocked.get();
  REQUIRE(limiter.calls_in_window("slow") == 1);
}


TEST_CASE("credential_placement")
{
  RequestDescriptor desc;
  desc.target_path = "/quote";
  desc.query["symbol"] = "AAPL";

  auto pc = test_provider();
  auto req = RequestDispatcher::build_request(pc, desc);
  REQUIRE(req.url == "https://api.example.com/v1/quote");
  REQUIRE(req.method == HttpMethod::get);
  REQUIRE(req.query.size() == 2);
  REQUIRE(req.query[0] == make_pair(string("symbol"), string("AAPL")));
  REQUIRE(req.query[1] == make_pair(string("apikey"), string("secret")));
  REQUIRE(req.headers.empty());

  pc.credential_placement = CredentialPlacement::header;
  pc.credential_name = "X-Finnhub-Token";
  req = RequestDispatcher::build_request(pc, desc);
  REQUIRE(req.query.size() == 1);
  REQUIRE(req.headers.size() == 1);
  REQUIRE(req.headers[0] == make_pair(string("X-Finnhub-Token"), string("secret")));

  // an empty path targets the endpoint itself
  desc.target_path = "";
  REQUIRE(RequestDispatcher::build_request(pc, desc).url ==
          "https://api.example.com/v1");

  desc.method = HttpMethod::post;
  desc.body = R"({"symbol":"AAPL"})";
  req = RequestDispatcher::build_request(pc, desc);
  REQUIRE(req.body == desc.body);
  REQUIRE(req.headers.size() == 2);

  pc.endpoint = "";
  REQUIRE_THROWS_AS(RequestDispatcher::build_request(pc, desc), Error);
}


TEST_CASE("missing_endpoint_outcome")
{
  RateLimiter limiter;
  StubTransport transport;
  RequestDispatcher dispatcher(limiter, transport);

  auto pc = test_provider(1);
  pc.endpoint = "";
  limiter.set_limit(pc.name, pc.max_calls, pc.window);

  RequestDescriptor desc;
  desc.target_path = "quote";
  auto outcome = dispatcher.send(pc, desc);

  REQUIRE(!outcome.ok());
  REQUIRE(outcome.error().kind == ErrorKind::transport);
  REQUIRE(outcome.error().message.find("empty endpoint") != string::npos);
  REQUIRE(transport.requests.empty());
  REQUIRE(limiter.calls_in_window(pc.name) == 0);
}


TEST_CASE("credentials_not_logged")
{
  std::ostringstream oss;
  Logger::instance().set_output(&oss);
  Logger::instance().set_level(Logger::level::debug);

  RateLimiter limiter;
  CurlTransport transport;
  RequestDispatcher dispatcher(limiter, transport);

  // nothing listens on port 1, so each request fails at connect
  auto pc = test_provider();
  pc.endpoint = "http://127.0.0.1:1/v1";
  pc.credential = "Zq7SecretApiKey";
  pc.connect_timeout = std::chrono::seconds(2);
  pc.request_timeout = std::chrono::seconds(2);

  RequestDescriptor desc;
  desc.target_path = "quote";
  desc.query["symbol"] = "AAPL";

  auto in_query = dispatcher.send(pc, desc);

  pc.credential_placement = CredentialPlacement::header;
  pc.credential_name = "X-Finnhub-Token";
  auto in_header = dispatcher.send(pc, desc);

  Logger::instance().set_output(nullptr);
  Logger::instance().set_level(Logger::level::info);

  REQUIRE(!in_query.ok());
  REQUIRE(in_query.error().kind == ErrorKind::transport);
  REQUIRE(!in_header.ok());
  REQUIRE(in_query.error().message.find("Zq7SecretApiKey") == string::npos);

  CAPTURE(oss.str());
  REQUIRE(oss.str().find("http request GET http://127.0.0.1:1/v1/quote") !=
          string::npos);
  REQUIRE(oss.str().find("apikey") != string::npos);
  REQUIRE(oss.str().find("X-Finnhub-Token") != string::npos);
  REQUIRE(oss.str().find("Zq7SecretApiKey") == string::npos);
}


TEST_CASE("http_status_failure")
{
  RateLimiter limiter;
  StubTransport transport;
  RequestDispatcher dispatcher(limiter, transport);

  transport.response.status = 429;
  transport.response.body = std::string(2000, 'x');

  RequestDescriptor desc;
  desc.target_path = "quote";
  auto outcome = dispatcher.send(test_provider(), desc);

  REQUIRE(!outcome.ok());
  REQUIRE(outcome.error().kind == ErrorKind::http_status);
  REQUIRE(outcome.error().message.find("429 ") == 0);
  REQUIRE(outcome.error().message.size() ==
          4 + RequestDispatcher::body_excerpt_length);
  REQUIRE_THROWS_AS(outcome.payload(), Error);

  transport.response.status = 500;
  transport.response.body = "internal";
  outcome = dispatcher.send(test_provider(), desc);
  REQUIRE(outcome.error().message == "500 internal");
}


TEST_CASE("transport_failure")
{
  RateLimiter limiter;
  StubTransport transport;
  transport.fail_transport = true;
  RequestDispatcher dispatcher(limiter, transport);

  RequestDescriptor desc;
  desc.target_path = "quote";
  auto outcome = dispatcher.send(test_provider(), desc);

  REQUIRE(!outcome.ok());
  REQUIRE(outcome.error().kind == ErrorKind::transport);
  REQUIRE(outcome.error().message.find("Timeout") != string::npos);
}


TEST_CASE("decode_outcomes")
{
  RateLimiter limiter;
  StubTransport transport;
  RequestDispatcher dispatcher(limiter, transport);

  RequestDescriptor desc;
  desc.target_path = "quote";

  auto outcome = dispatcher.send(test_provider(), desc);
  REQUIRE(outcome.ok());
  REQUIRE(outcome.payload()["c"] == 189.5);
  REQUIRE_THROWS_AS(outcome.error(), Error);

  transport.response.body = "<html>not json</html>";
  outcome = dispatcher.send(test_provider(), desc);
  REQUIRE(!outcome.ok());
  REQUIRE(outcome.error().kind == ErrorKind::decode);

  desc.response_format = ResponseFormat::delimited_text;
  transport.response.body = "symbol,price\nAAPL,189.5\n";
  outcome = dispatcher.send(test_provider(), desc);
  REQUIRE(outcome.ok());
  REQUIRE(outcome.payload().size() == 1);
  REQUIRE(outcome.payload()[0]["price"] == "189.5");

  std::ostringstream oss;
  oss << outcome;
  REQUIRE(!oss.str().empty());
}


TEST_CASE("send_async")
{
  RateLimiter limiter;
  StubTransport transport;
  RealtimeEventLoop requests("requests");
  RequestDispatcher dispatcher(limiter, transport, &requests);

  RequestDescriptor desc;
  desc.target_path = "quote";

  std::promise<CallOutcome> done;
  auto fut = done.get_future();
  dispatcher.send_async(test_provider(), desc,
                        [&done](CallOutcome o) { done.set_value(std::move(o)); });

  REQUIRE(fut.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
  REQUIRE(fut.get().ok());

  RequestDispatcher no_loop(limiter, transport);
  REQUIRE_THROWS_AS(no_loop.send_async(test_provider(), desc, [](CallOutcome) {}),
                    Error);
  requests.sync_stop();
}


TEST_CASE("logger_levels")
{
  std::ostringstream oss;
  Logger::instance().set_output(&oss);
  Logger::instance().set_level(Logger::level::warn);

  LOG_INFO("hidden");
  LOG_WARN("visible " << 42);
  try {
    throw std::runtime_error("unexpected field type");
  } catch (...) {
    log_message_exception("finnhub", R"({"type":"trade","data":7})");
  }

  Logger::instance().set_output(nullptr);
  Logger::instance().set_level(Logger::level::info);

  REQUIRE(oss.str().find("hidden") == string::npos);
  REQUIRE(oss.str().find("| WARN  | visible 42") != string::npos);
  REQUIRE(oss.str().find("from: finnhub, error: unexpected field type") !=
          string::npos);
  REQUIRE(oss.str().find(R"({"type":"trade","data":7})") != string::npos);
  REQUIRE(Logger::string_to_level("debug") == Logger::level::debug);
  REQUIRE_THROWS_AS(Logger::string_to_level("loud"), ConfigError);
}


QUICKTEST_MAIN()
