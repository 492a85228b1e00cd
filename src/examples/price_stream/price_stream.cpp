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

#include <quotegate/core/Logger.hpp>
#include <quotegate/core/RequestDispatcher.hpp>
#include <quotegate/core/Services.hpp>
#include <quotegate/core/SubscriptionManager.hpp>
#include <quotegate/util/Config.hpp>
#include <quotegate/util/Error.hpp>
#include <quotegate/util/json.hpp>

#include <iostream>
#include <thread>

using namespace quotegate;

/*
Example of fetching a snapshot quote for each symbol, and then streaming live
prices from a provider, until control-c.

  price_stream <config.json> <provider> <symbol>...

Credentials come from the config file, typically by ${ENV} interpolation.
*/


static void fetch_quotes(Services& services, const ProviderConfig& provider,
                         const std::vector<std::string>& symbols)
{
  for (auto& symbol : symbols) {
    RequestDescriptor desc;
    desc.target_path = "quote";
    desc.query["symbol"] = symbol;

    auto outcome = services.dispatcher().send(provider, desc);
    if (outcome.ok())
      LOG_INFO(symbol << " quote: " << outcome.payload().dump());
    else
      LOG_WARN(symbol << " quote failed: " << outcome);
  }
}


static int stream_prices(Services& services, const std::string& provider,
                         const std::vector<std::string>& symbols)
{
  auto manager = services.make_subscription_manager(provider);

  auto on_message = [](const json& msg) { std::cout << msg.dump() << "\n"; };
  auto on_error = [](const StreamError& err) {
    LOG_WARN("stream error (" << err.kind << "): " << err.message);
  };

  manager->subscribe(symbols);
  manager->set_callbacks(on_message, on_error);
  try {
    manager->start();
  } catch (const ConnectionError& e) {
    LOG_ERROR("stream connect failed: " << e.what());
    return 1;
  }

  // receive on a separate thread, so that main can wait for control-c
  std::thread receiver([&manager]() {
    try {
      manager->receive();
    } catch (const Error& e) {
      LOG_WARN("stream receive ended: " << e.what());
    }
  });

  services.run();
  LOG_INFO("control-c detected");
  manager->stop();
  receiver.join();
  return 0;
}


int main(int argc, char** argv)
{
  if (argc < 4) {
    std::cerr << "usage: " << argv[0]
              << " <config.json> <provider> <symbol>...\n";
    return 1;
  }

  try {
    Config config(read_json_config_file(argv[1]), argv[1]);
    auto services = Services::create(config);

    std::string provider = argv[2];
    std::vector<std::string> symbols(argv + 3, argv + argc);

    auto& pc = services->provider(provider);
    fetch_quotes(*services, pc, symbols);

    if (pc.stream_endpoint.empty()) {
      LOG_NOTICE(provider << " has no stream endpoint");
      return 0;
    }
    return stream_prices(*services, provider, symbols);
  } catch (const std::exception& e) {
    LOG_ERROR("price_stream failed: " << e.what());
    return 1;
  }
}
