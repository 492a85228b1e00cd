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

#include <chrono>
#include <string>
#include <vector>

namespace quotegate
{
class Config;

enum class CredentialPlacement { query, header };

/* Connection and pacing parameters for one market-data provider.  Built once
 * per session and not modified afterwards. */
struct ProviderConfig {
  std::string name;
  std::string credential;
  std::string endpoint;
  std::string stream_endpoint;

  int max_calls = 0; // <= 0 means unthrottled
  std::chrono::milliseconds window{std::chrono::seconds(60)};

  CredentialPlacement credential_placement = CredentialPlacement::query;
  std::string credential_name = "apikey";

  /* Query parameter carrying the credential on the streaming connect url */
  std::string stream_credential_name = "apikey";

  std::chrono::milliseconds request_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};

  std::chrono::milliseconds heartbeat_interval{0};
  std::string heartbeat_message;

  /* Built-in settings for a known provider name; throws ConfigError for an
   * unknown name. */
  static ProviderConfig preset(const std::string& name);

  /* Start from the preset for `name`, when there is one, and override with
   * any fields present in `config`. */
  static ProviderConfig from_config(const std::string& name,
                                    const Config& config);

  static const std::vector<std::string>& preset_names();

  std::string stream_url() const;
};

CredentialPlacement parse_credential_placement(const std::string&);

const char* to_string(CredentialPlacement);

/* Names of the providers which do not have a credential. */
std::vector<std::string> missing_credentials(
    const std::vector<ProviderConfig>& providers);

} // namespace quotegate
