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

#include <quotegate/core/RequestDispatcher.hpp>
#include <quotegate/core/HttpTransport.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/core/RateLimiter.hpp>
#include <quotegate/util/DelimitedText.hpp>
#include <quotegate/util/Error.hpp>
#include <quotegate/util/EventLoop.hpp>

namespace quotegate
{

RequestDispatcher::RequestDispatcher(RateLimiter& limiter,
                                     HttpTransport& transport,
                                     EventLoop* requests)
  : _limiter(limiter), _transport(transport), _requests(requests)
{
}


HttpRequest RequestDispatcher::build_request(const ProviderConfig& config,
                                             const RequestDescriptor& desc)
{
  if (config.endpoint.empty())
    THROW("empty endpoint for provider " << QUOTE(config.name) << ", path "
          << QUOTE(desc.target_path));

  auto path = desc.target_path;
  path.erase(0, path.find_first_not_of('/'));
  auto base = config.endpoint;
  while (!base.empty() && base.back() == '/')
    base.pop_back();

  HttpRequest request;
  request.method = desc.method;
  request.url = path.empty() ? base : base + "/" + path;
  request.timeout = config.request_timeout;
  request.connect_timeout = config.connect_timeout;

  for (auto& item : desc.query)
    request.query.emplace_back(item.first, item.second);

  if (!config.credential.empty()) {
    if (config.credential_placement == CredentialPlacement::query)
      request.query.emplace_back(config.credential_name, config.credential);
    else
      request.headers.emplace_back(config.credential_name, config.credential);
  }

  if (desc.method == HttpMethod::post) {
    request.body = desc.body;
    if (!desc.body.empty())
      request.headers.emplace_back("Content-Type", "application/json");
  }

  return request;
}


CallOutcome RequestDispatcher::send(const ProviderConfig& config,
                                    const RequestDescriptor& desc)
{
  // an unusable descriptor fails without taking a rate-limit slot
  HttpRequest request;
  try {
    request = build_request(config, desc);
  }
  catch (const Error& e) {
    LOG_WARN(config.name << " request not sent: " << e.what());
    return CallOutcome::failure(ErrorKind::transport, e.what());
  }

  _limiter.acquire(config.name);

  HttpResponse response;
  try {
    response = _transport.perform(request);
  }
  catch (const TransportError& e) {
    LOG_WARN(config.name << " " << to_string(desc.method) << " "
             << QUOTE(desc.target_path) << " transport failure: " << e.what());
    return CallOutcome::failure(ErrorKind::transport, e.what());
  }

  return classify(config, desc, response);
}


CallOutcome RequestDispatcher::classify(const ProviderConfig& config,
                                        const RequestDescriptor& desc,
                                        HttpResponse& response)
{
  if (response.status < 200 || response.status > 299) {
    std::ostringstream oss;
    oss << response.status << " "
        << response.body.substr(0, body_excerpt_length);
    LOG_WARN(config.name << " " << to_string(desc.method) << " "
             << QUOTE(desc.target_path) << " http status "
             << response.status);
    return CallOutcome::failure(ErrorKind::http_status, oss.str());
  }

  try {
    switch (desc.response_format) {
      case ResponseFormat::json:
        return CallOutcome::success(
            decode_json(response.body.data(), response.body.size()));
      case ResponseFormat::delimited_text:
        return CallOutcome::success(decode_delimited_text(response.body));
    }
  }
  catch (const parse_error& e) {
    LOG_WARN(config.name << " " << QUOTE(desc.target_path)
             << " response decode failed: " << e.what());
    return CallOutcome::failure(ErrorKind::decode, e.what());
  }

  return CallOutcome::failure(ErrorKind::decode, "unsupported response format");
}


void RequestDispatcher::send_async(ProviderConfig config, RequestDescriptor desc,
                                   outcome_fn on_outcome)
{
  if (!_requests)
    THROW("send_async requires a request event loop");

  if (!on_outcome)
    THROW("on_outcome callback cannot be none");

  _requests->dispatch([this, config = std::move(config),
                       desc = std::move(desc),
                       on_outcome = std::move(on_outcome)]() {
    on_outcome(send(config, desc));
  });
}

} // namespace quotegate
