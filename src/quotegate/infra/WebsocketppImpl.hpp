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

#include <websocketpp/close.hpp>
#include <websocketpp/concurrency/basic.hpp>
#include <websocketpp/extensions/permessage_deflate/disabled.hpp>
#include <websocketpp/http/request.hpp>
#include <websocketpp/http/response.hpp>
#include <websocketpp/message_buffer/alloc.hpp>
#include <websocketpp/message_buffer/message.hpp>
#include <websocketpp/processors/hybi13.hpp>
#include <websocketpp/random/random_device.hpp>

#include <memory>
#include <string>

namespace quotegate
{

/* Type configuration for the websocketpp hybi13 processor.  Only framing is
 * taken from websocketpp; the handshake and all IO are done elsewhere. */
struct WebsocketConfig {
  using request_type = websocketpp::http::parser::request;
  using response_type = websocketpp::http::parser::response;

  using message_type = websocketpp::message_buffer::message<
      websocketpp::message_buffer::alloc::con_msg_manager>;
  using con_msg_manager_type =
      websocketpp::message_buffer::alloc::con_msg_manager<message_type>;

  // source of the per-frame masking key
  using rng_type =
      websocketpp::random::random_device::int_generator<uint32_t,
                                                        websocketpp::concurrency::basic>;

  // compression is never negotiated
  struct deflate_config {
    using request_type = websocketpp::http::parser::request;
  };
  using permessage_deflate_type =
      websocketpp::extensions::permessage_deflate::disabled<deflate_config>;

  /* inbound messages above this fail with message_too_big */
  static const size_t max_message_size = 32000000;

  static const bool enable_extensions = false;
};


/* Owns a client mode hybi13 processor together with the message manager and
 * random generator it refers to. */
class WebsocketppImpl
{
public:
  using processor_type = websocketpp::processor::hybi13<WebsocketConfig>;
  using message_ptr = WebsocketConfig::message_type::ptr;

  WebsocketppImpl()
    : _messages(std::make_shared<WebsocketConfig::con_msg_manager_type>()),
      _processor(std::make_unique<processor_type>(false, false, _messages, _rng))
  {
  }

  processor_type* processor() { return _processor.get(); }

  processor_type::msg_manager_ptr& msg_manager() { return _messages; }

  /* One line description of a frame, for debug logging */
  static std::string frame_to_string(const message_ptr&);

private:
  WebsocketConfig::rng_type _rng;
  processor_type::msg_manager_ptr _messages;
  std::unique_ptr<processor_type> _processor;
};

} // namespace quotegate
