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

#include <quotegate/core/ProviderConfig.hpp>
#include <quotegate/util/Config.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace quotegate
{

class EventLoop;
class IoLoop;
class RateLimiter;
class RealtimeEventLoop;
class RequestDispatcher;
class SslContext;
class SubscriptionManager;
class CurlTransport;
class WebsocketConnector;

/* Responsible for creating and providing access to the components shared by
 * all provider calls and streaming sessions of a process: the IO and event
 * threads, TLS context, rate limiter, dispatcher and websocket connector. */
class Services
{
public:
  explicit Services(Config config = Config::empty_config());
  ~Services();

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;

  /* Utility method used to configure logging and create services */
  static std::unique_ptr<Services> create(Config = Config::empty_config());

  /* Throws ConfigError if no provider has that name */
  const ProviderConfig& provider(const std::string& name) const;

  std::vector<ProviderConfig> providers() const;

  /* Create a streaming session for the named provider */
  std::unique_ptr<SubscriptionManager> make_subscription_manager(
      const std::string& name);

  RequestDispatcher& dispatcher() { return *_dispatcher; }
  RateLimiter& rate_limiter() { return *_rate_limiter; }
  EventLoop* evloop();
  IoLoop& ioloop() { return *_ioloop; }
  Config& config() { return _config; }

  // Utility method, typically called by a program main thread, to wait
  // until interrupted (control-c).
  void run();

private:
  Config _config;
  std::map<std::string, ProviderConfig> _providers;

  std::unique_ptr<IoLoop> _ioloop;
  std::unique_ptr<RealtimeEventLoop> _evloop;
  std::unique_ptr<RealtimeEventLoop> _requests_loop;
  std::unique_ptr<SslContext> _ssl;
  std::unique_ptr<RateLimiter> _rate_limiter;
  std::unique_ptr<CurlTransport> _transport;
  std::unique_ptr<RequestDispatcher> _dispatcher;
  std::unique_ptr<WebsocketConnector> _connector;
};

} // namespace quotegate
