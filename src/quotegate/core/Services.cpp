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

#include <quotegate/core/Services.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/core/RateLimiter.hpp>
#include <quotegate/core/RequestDispatcher.hpp>
#include <quotegate/core/SubscriptionManager.hpp>
#include <quotegate/infra/CurlTransport.hpp>
#include <quotegate/infra/IoLoop.hpp>
#include <quotegate/infra/WebsocketChannel.hpp>
#include <quotegate/infra/ssl.hpp>
#include <quotegate/util/RealtimeEventLoop.hpp>

#include <typeinfo>

namespace quotegate
{

static bool log_loop_exception()
{
  try {
    throw;
  } catch (const std::exception& e) {
    LOG_ERROR("caught exception at event loop: ("
              << demangle(typeid(e).name()) << ") " << e.what());
  } catch (...) {
    LOG_ERROR("caught unknown exception at event loop");
  }
  return false; // dont terminate the eventloop
}


static std::map<std::string, ProviderConfig> load_providers(const Config& config)
{
  std::map<std::string, ProviderConfig> providers;

  if (config.has("providers")) {
    auto section = config.get_sub_config("providers");
    for (auto& name : section.keys())
      providers[name] =
          ProviderConfig::from_config(name, section.get_sub_config(name));
  } else {
    for (auto& name : ProviderConfig::preset_names())
      providers[name] = ProviderConfig::preset(name);
  }

  return providers;
}


static SslConfig load_ssl_config(const Config& config)
{
  SslConfig ssl;
  ssl.security_level = static_cast<int>(
      config.get_uint("security_level", static_cast<uint64_t>(ssl.security_level)));
  ssl.verify_peer = config.get_bool("verify_peer", ssl.verify_peer);
  ssl.ca_file = config.get_string("ca_file", "");
  return ssl;
}


Services::Services(Config config)
  : _config(std::move(config)),
    _providers(load_providers(_config)),
    _ioloop(std::make_unique<IoLoop>()),
    _evloop(std::make_unique<RealtimeEventLoop>("ev", log_loop_exception)),
    _requests_loop(
        std::make_unique<RealtimeEventLoop>("requests", log_loop_exception)),
    _ssl(std::make_unique<SslContext>(load_ssl_config(
        _config.get_sub_config("ssl", Config::empty_config())))),
    _rate_limiter(std::make_unique<RateLimiter>()),
    _transport(std::make_unique<CurlTransport>()),
    _dispatcher(std::make_unique<RequestDispatcher>(
        *_rate_limiter, *_transport, _requests_loop.get()))
{
  auto ws_config = _config.get_sub_config("websocket", Config::empty_config());
  _connector = std::make_unique<WebsocketConnector>(
      *_ioloop, *_ssl, _evloop.get(),
      ws_config.get_millis("ping_interval_ms", std::chrono::seconds(30)));

  for (auto& item : _providers) {
    auto& pc = item.second;
    _rate_limiter->set_limit(pc.name, pc.max_calls, pc.window);
    if (pc.max_calls > 0)
      LOG_INFO("provider " << QUOTE(pc.name) << " limited to "
               << pc.max_calls << " calls per " << pc.window.count() << "ms");
    else
      LOG_INFO("provider " << QUOTE(pc.name) << " unthrottled");
  }

  std::vector<ProviderConfig> all;
  for (auto& item : _providers)
    all.push_back(item.second);
  auto missing = missing_credentials(all);
  if (!missing.empty())
    LOG_NOTICE(missing.size() << " of " << all.size()
               << " providers have no credential");
}


Services::~Services()
{
  /* assumed called on main thread */
  _requests_loop->sync_stop();
  _evloop->sync_stop();
  _ioloop->sync_stop();
}


std::unique_ptr<Services> Services::create(Config config)
{
  Logger::instance().register_thread_id("main");
  Logger::configure_from_config(
      config.get_sub_config("logging", Config::empty_config()));
  return std::make_unique<Services>(std::move(config));
}


const ProviderConfig& Services::provider(const std::string& name) const
{
  auto it = _providers.find(name);
  if (it == _providers.end())
    throw ConfigError("provider not configured, '" + name + "'");
  return it->second;
}


std::vector<ProviderConfig> Services::providers() const
{
  std::vector<ProviderConfig> result;
  for (auto& item : _providers)
    result.push_back(item.second);
  return result;
}


std::unique_ptr<SubscriptionManager> Services::make_subscription_manager(
    const std::string& name)
{
  return std::make_unique<SubscriptionManager>(provider(name), *_connector,
                                               _evloop.get());
}


EventLoop* Services::evloop() { return _evloop.get(); }


void Services::run() { wait_for_sigint(); }

} // namespace quotegate
