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

#include <quotegate/core/SubscriptionManager.hpp>
#include <quotegate/core/Logger.hpp>
#include <quotegate/core/StreamChannel.hpp>
#include <quotegate/util/Error.hpp>
#include <quotegate/util/EventLoop.hpp>
#include <quotegate/util/utils.hpp>

namespace quotegate
{

const char* to_string(ConnectionState s)
{
  switch (s) {
    case ConnectionState::disconnected:
      return "disconnected";
    case ConnectionState::connecting:
      return "connecting";
    case ConnectionState::subscribed:
      return "subscribed";
    case ConnectionState::receiving:
      return "receiving";
    case ConnectionState::closing:
      return "closing";
  }
  return "unknown";
}


std::ostream& operator<<(std::ostream& os, ConnectionState s)
{
  return os << to_string(s);
}


SubscriptionManager::SubscriptionManager(ProviderConfig config,
                                         StreamConnector& connector,
                                         EventLoop* ev)
  : _config(std::move(config)), _connector(connector), _ev(ev)
{
}


SubscriptionManager::~SubscriptionManager()
{
  std::shared_ptr<StreamChannel> channel;
  {
    std::lock_guard<std::mutex> guard(_mutex);
    channel = std::move(_channel);
    _heartbeat_token.reset();
  }
  if (channel)
    channel->close();
}


std::string SubscriptionManager::control_message(
    const std::string& action, const std::vector<std::string>& symbols)
{
  json msg = {{"action", action}, {"params", {{"symbols", join(symbols, ",")}}}};
  return msg.dump();
}


void SubscriptionManager::set_state(ConnectionState s, transitions& changes)
{
  if (_state == s)
    return;
  LOG_INFO(_config.name << " stream " << _state << " -> " << s);
  _state = s;
  changes.push_back(s);
}


void SubscriptionManager::notify(const transitions& changes)
{
  state_fn observer;
  {
    std::lock_guard<std::mutex> guard(_mutex);
    observer = _on_state;
  }
  if (!observer)
    return;

  for (auto s : changes) {
    try {
      observer(s);
    } catch (...) {
      log_exception("stream state observer");
    }
  }
}


/* Caller must hold _mutex */
void SubscriptionManager::send_control(const std::string& action,
                                       const std::vector<std::string>& symbols)
{
  if (symbols.empty() || !_channel)
    return;
  if (_state != ConnectionState::subscribed &&
      _state != ConnectionState::receiving)
    return;

  auto msg = control_message(action, symbols);
  LOG_INFO(_config.name << " stream sending " << msg);
  try {
    _channel->send(msg);
  } catch (const Error& e) {
    // connection loss is reported by the receive loop
    LOG_WARN(_config.name << " stream " << action << " not sent: " << e.what());
  }
}


void SubscriptionManager::subscribe(const std::vector<std::string>& symbols)
{
  std::lock_guard<std::mutex> guard(_mutex);
  std::vector<std::string> added;
  for (auto& sym : symbols)
    if (!sym.empty() && _symbols.insert(sym).second)
      added.push_back(sym);
  send_control("subscribe", added);
}


void SubscriptionManager::unsubscribe(const std::vector<std::string>& symbols)
{
  std::lock_guard<std::mutex> guard(_mutex);
  std::vector<std::string> removed;
  for (auto& sym : symbols)
    if (_symbols.erase(sym))
      removed.push_back(sym);
  send_control("unsubscribe", removed);
}


void SubscriptionManager::set_callbacks(message_fn on_message, error_fn on_error)
{
  std::lock_guard<std::mutex> guard(_mutex);
  _on_message = std::move(on_message);
  _on_error = std::move(on_error);
}


void SubscriptionManager::set_state_observer(state_fn fn)
{
  std::lock_guard<std::mutex> guard(_mutex);
  _on_state = std::move(fn);
}


ConnectionState SubscriptionManager::state() const
{
  std::lock_guard<std::mutex> guard(_mutex);
  return _state;
}


std::set<std::string> SubscriptionManager::subscriptions() const
{
  std::lock_guard<std::mutex> guard(_mutex);
  return _symbols;
}


void SubscriptionManager::start()
{
  transitions changes;
  {
    std::lock_guard<std::mutex> guard(_mutex);
    if (_state != ConnectionState::disconnected)
      THROW(_config.name << " stream already started, state " << _state);
    _stop.reset();
    set_state(ConnectionState::connecting, changes);
  }
  notify(changes);
  changes.clear();

  std::unique_ptr<StreamChannel> channel;
  try {
    auto url = _config.stream_url();
    LOG_INFO(_config.name << " stream connecting to " << _config.stream_endpoint);
    channel = _connector.connect(url, _config.connect_timeout);
    if (!channel)
      throw ConnectionError("connector returned no channel");
  }
  catch (const std::exception& e) {
    LOG_WARN(_config.name << " stream connect failed: " << e.what());
    {
      std::lock_guard<std::mutex> guard(_mutex);
      set_state(ConnectionState::disconnected, changes);
    }
    notify(changes);
    if (dynamic_cast<const ConnectionError*>(&e))
      throw;
    throw ConnectionError(_config.name + " stream connect failed: " + e.what());
  }

  std::shared_ptr<StreamChannel> active = std::move(channel);
  {
    std::lock_guard<std::mutex> guard(_mutex);
    _channel = active;
    set_state(ConnectionState::subscribed, changes);
    send_control("subscribe",
                 std::vector<std::string>(_symbols.begin(), _symbols.end()));
    set_state(ConnectionState::receiving, changes);
  }
  notify(changes);

  start_heartbeat(active);
}


void SubscriptionManager::start_heartbeat(
    const std::shared_ptr<StreamChannel>& channel)
{
  if (!_ev || _config.heartbeat_interval.count() <= 0 ||
      _config.heartbeat_message.empty())
    return;

  auto token = std::make_shared<bool>(true);
  {
    std::lock_guard<std::mutex> guard(_mutex);
    _heartbeat_token = token;
  }

  std::weak_ptr<bool> wp_token = token;
  std::weak_ptr<StreamChannel> wp_channel = channel;
  auto interval = _config.heartbeat_interval;
  auto msg = _config.heartbeat_message;
  auto name = _config.name;

  _ev->dispatch(interval, [=]() -> std::chrono::milliseconds {
    auto alive = wp_token.lock();
    auto ch = wp_channel.lock();
    if (!alive || !ch)
      return std::chrono::milliseconds(0);
    try {
      ch->send(msg);
    } catch (const Error& e) {
      LOG_WARN(name << " heartbeat not sent: " << e.what());
      return std::chrono::milliseconds(0);
    }
    LOG_DEBUG(name << " heartbeat sent");
    return interval;
  });
}


void SubscriptionManager::report(ErrorKind kind, std::string message)
{
  error_fn on_error;
  {
    std::lock_guard<std::mutex> guard(_mutex);
    on_error = _on_error;
  }

  if (!on_error) {
    LOG_WARN(_config.name << " stream " << kind << " error: " << message);
    return;
  }

  try {
    on_error(StreamError{kind, std::move(message)});
  } catch (...) {
    log_exception("stream error callback");
  }
}


void SubscriptionManager::handle_message(const std::string& payload)
{
  json msg;
  try {
    msg = decode_json(payload.data(), payload.size());
  } catch (const parse_error& e) {
    log_message_exception(_config.name.c_str(), payload);
    report(ErrorKind::decode, e.what());
    return;
  }

  message_fn on_message;
  {
    std::lock_guard<std::mutex> guard(_mutex);
    on_message = _on_message;
  }
  if (!on_message)
    return;

  try {
    on_message(msg);
  } catch (...) {
    log_message_exception(_config.name.c_str(), payload);
    report(ErrorKind::callback, current_exception_text());
  }
}


void SubscriptionManager::receive()
{
  std::shared_ptr<StreamChannel> channel;
  {
    std::lock_guard<std::mutex> guard(_mutex);
    if (_state != ConnectionState::receiving || !_channel)
      THROW(_config.name << " stream not receiving, state " << _state);
    channel = _channel;
  }

  while (!_stop.is_requested()) {
    std::string payload;
    std::string reason;
    auto event = channel->next(payload, reason);

    if (event == StreamChannel::Event::interrupted)
      continue;

    if (event == StreamChannel::Event::closed) {
      if (!_stop.is_requested()) {
        LOG_WARN(_config.name << " stream connection lost: " << reason);
        report(ErrorKind::connection_closed, reason);
      }
      break;
    }

    handle_message(payload);
  }

  teardown(channel);
}


void SubscriptionManager::teardown(const std::shared_ptr<StreamChannel>& channel)
{
  transitions changes;
  {
    std::lock_guard<std::mutex> guard(_mutex);
    set_state(ConnectionState::closing, changes);
    _heartbeat_token.reset();
  }
  notify(changes);
  changes.clear();

  channel->close();

  {
    std::lock_guard<std::mutex> guard(_mutex);
    _channel.reset();
    set_state(ConnectionState::disconnected, changes);
  }
  notify(changes);
}


void SubscriptionManager::stop()
{
  std::lock_guard<std::mutex> guard(_mutex);
  if (_state == ConnectionState::disconnected)
    return;
  _stop.request_stop();
  if (_channel)
    _channel->interrupt();
}


void SubscriptionManager::run(const std::vector<std::string>& symbols,
                              message_fn on_message, error_fn on_error)
{
  subscribe(symbols);
  set_callbacks(std::move(on_message), std::move(on_error));
  start();
  receive();
}

} // namespace quotegate
