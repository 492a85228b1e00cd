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
#include <quotegate/core/Request.hpp>

#include <functional>

namespace quotegate
{
class EventLoop;
class HttpTransport;
class RateLimiter;

/* Issues provider calls.  Each call first takes a slot from the RateLimiter,
 * then performs the request over the HttpTransport and classifies the result
 * into a CallOutcome.  Calls are never retried. */
class RequestDispatcher
{
public:
  using outcome_fn = std::function<void(CallOutcome)>;

  /* The event loop is optional; it is required only for send_async. */
  RequestDispatcher(RateLimiter&, HttpTransport&, EventLoop* requests = nullptr);

  /* Synchronous call; blocks for the rate-limit slot and the transport.
   * Every failure is returned in the outcome, including a provider without
   * an endpoint, which is a transport failure. */
  CallOutcome send(const ProviderConfig&, const RequestDescriptor&);

  /* Perform send() on the request event loop, and deliver the outcome to
   * `on_outcome` on that thread.  Calls complete in submission order. */
  void send_async(ProviderConfig, RequestDescriptor, outcome_fn on_outcome);

  /* Resolve the descriptor against the provider; throws Error for a provider
   * without an endpoint.  Exposed for diagnostics. */
  static HttpRequest build_request(const ProviderConfig&,
                                   const RequestDescriptor&);

  static constexpr size_t body_excerpt_length = 512;

private:
  CallOutcome classify(const ProviderConfig&, const RequestDescriptor&,
                       HttpResponse&);

  RateLimiter& _limiter;
  HttpTransport& _transport;
  EventLoop* _requests;
};

} // namespace quotegate
