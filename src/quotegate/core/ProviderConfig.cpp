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

#include <quotegate/core/ProviderConfig.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/infra/CurlTransport.hpp>
#include <quotegate/util/Config.hpp>

#include <algorithm>
#include <cstdlib>
#include <limits>

namespace quotegate
{

static std::string env_or_empty(const char* name)
{
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}


const std::vector<std::string>& ProviderConfig::preset_names()
{
  static const std::vector<std::string> names = {
      "finnhub", "alphavantage", "twelvedata"};
  return names;
}


ProviderConfig ProviderConfig::preset(const std::string& name)
{
  ProviderConfig pc;
  pc.name = name;
  pc.window = std::chrono::seconds(60);

  if (name == "finnhub") {
    pc.endpoint = "https://finnhub.io/api/v1";
    pc.stream_endpoint = "wss://ws.finnhub.io";
    pc.credential = env_or_empty("FINNHUB_API_KEY");
    pc.credential_placement = CredentialPlacement::header;
    pc.credential_name = "X-Finnhub-Token";
    pc.stream_credential_name = "token";
    pc.max_calls = 60;
  }
  else if (name == "alphavantage") {
    pc.endpoint = "https://www.alphavantage.co/query";
    pc.credential = env_or_empty("ALPHAVANTAGE_API_KEY");
    pc.credential_placement = CredentialPlacement::query;
    pc.credential_name = "apikey";
    pc.max_calls = 5;
  }
  else if (name == "twelvedata") {
    pc.endpoint = "https://api.twelvedata.com";
    pc.stream_endpoint = "wss://ws.twelvedata.com/v1/quotes/price";
    pc.credential = env_or_empty("TWELVEDATA_API_KEY");
    pc.credential_placement = CredentialPlacement::query;
    pc.credential_name = "apikey";
    pc.max_calls = 8;
    pc.heartbeat_interval = std::chrono::seconds(10);
    pc.heartbeat_message = R"({"action":"heartbeat"})";
  }
  else
    throw ConfigError("no preset for provider " + name);

  return pc;
}


ProviderConfig ProviderConfig::from_config(const std::string& name,
                                           const Config& config)
{
  ProviderConfig pc;
  bool is_preset = false;
  for (auto& preset_name : preset_names())
    if (preset_name == name)
      is_preset = true;

  if (is_preset)
    pc = preset(name);
  else {
    pc.name = name;
    pc.endpoint = config.get_string("endpoint");
  }

  pc.endpoint = config.get_string("endpoint", pc.endpoint);
  pc.stream_endpoint = config.get_string("stream_endpoint", pc.stream_endpoint);
  pc.credential = config.get_string("credential", pc.credential);
  if (config.has("credential_placement"))
    pc.credential_placement =
        parse_credential_placement(config.get_string("credential_placement"));
  pc.credential_name = config.get_string("credential_name", pc.credential_name);
  pc.stream_credential_name =
      config.get_string("stream_credential_name", pc.stream_credential_name);

  auto max_calls = config.get_uint(
      "max_calls", static_cast<uint64_t>(std::max(pc.max_calls, 0)));
  if (max_calls > static_cast<uint64_t>(std::numeric_limits<int>::max()))
    throw ConfigError("provider " + name + " max_calls out of range, " +
                      std::to_string(max_calls));
  pc.max_calls = static_cast<int>(max_calls);
  pc.window = config.get_millis("window_ms", pc.window);
  pc.request_timeout = config.get_millis("request_timeout_ms", pc.request_timeout);
  pc.connect_timeout = config.get_millis("connect_timeout_ms", pc.connect_timeout);
  pc.heartbeat_interval =
      config.get_millis("heartbeat_interval_ms", pc.heartbeat_interval);
  pc.heartbeat_message =
      config.get_string("heartbeat_message", pc.heartbeat_message);

  if (pc.window.count() <= 0)
    throw ConfigError("provider " + name + " has non-positive window_ms");

  return pc;
}


std::string ProviderConfig::stream_url() const
{
  if (stream_endpoint.empty())
    throw ConfigError("provider " + name + " has no stream endpoint");

  std::string url = stream_endpoint;
  if (!credential.empty()) {
    url += (url.find('?') == std::string::npos) ? "?" : "&";
    url += stream_credential_name + "=" + url_encode(credential);
  }
  return url;
}


CredentialPlacement parse_credential_placement(const std::string& s)
{
  if (s == "query")
    return CredentialPlacement::query;
  if (s == "header")
    return CredentialPlacement::header;
  throw ConfigError("credential_placement not recognised, " + s);
}


const char* to_string(CredentialPlacement cp)
{
  switch (cp) {
    case CredentialPlacement::query:
      return "query";
    case CredentialPlacement::header:
      return "header";
  }
  return "unknown";
}


std::vector<std::string> missing_credentials(
    const std::vector<ProviderConfig>& providers)
{
  std::vector<std::string> missing;
  for (auto& pc : providers)
    if (pc.credential.empty()) {
      LOG_WARN("provider " << QUOTE(pc.name) << " has no credential");
      missing.push_back(pc.name);
    }
  return missing;
}

} // namespace quotegate
