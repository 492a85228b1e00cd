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

#include <quotegate/infra/WebsocketppImpl.hpp>

#include <sstream>

namespace quotegate
{

static const char* opcode_name(websocketpp::frame::opcode::value op)
{
  switch (op) {
    case websocketpp::frame::opcode::continuation:
      return "continuation";
    case websocketpp::frame::opcode::text:
      return "text";
    case websocketpp::frame::opcode::binary:
      return "binary";
    case websocketpp::frame::opcode::close:
      return "close";
    case websocketpp::frame::opcode::ping:
      return "ping";
    case websocketpp::frame::opcode::pong:
      return "pong";
    default:
      return "reserved";
  }
}


std::string WebsocketppImpl::frame_to_string(const message_ptr& msg)
{
  if (!msg)
    return "null";

  std::ostringstream oss;
  oss << "opcode: " << opcode_name(msg->get_opcode())
      << ", fin: " << msg->get_fin()
      << ", header_len: " << msg->get_header().size()
      << ", payload_len: " << msg->get_payload().size();

  if (msg->get_opcode() == websocketpp::frame::opcode::text) {
    static const size_t max_shown = 256;
    auto& payload = msg->get_payload();
    oss << ", payload: " << payload.substr(0, max_shown);
    if (payload.size() > max_shown)
      oss << "...";
  }
  return oss.str();
}

} // namespace quotegate
