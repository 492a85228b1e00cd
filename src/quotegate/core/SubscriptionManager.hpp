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

#include <quotegate/core/Errors.hpp>
#include <quotegate/core/ProviderConfig.hpp>
#include <quotegate/util/StopFlag.hpp>
#include <quotegate/util/json.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace quotegate
{
class EventLoop;
class StreamChannel;
class StreamConnector;

enum class ConnectionState {
  disconnected,
  connecting,
  subscribed,
  receiving,
  closing
};

const char* to_string(ConnectionState);

std::ostream& operator<<(std::ostream&, ConnectionState);


/* Owns one streaming session to a provider: the desired symbol set, the
 * connection state, and the receive loop that decodes each inbound event and
 * hands it to the consumer.
 *
 * The receive loop runs on the thread that calls receive() (or run()).
 * subscribe(), unsubscribe() and stop() may be called from any thread,
 * including from inside the consumer callbacks.  The manager must outlive any
 * running receive loop.
 */
class SubscriptionManager
{
public:
  using message_fn = std::function<void(const json&)>;
  using error_fn = std::function<void(const StreamError&)>;
  using state_fn = std::function<void(ConnectionState)>;

  /* `ev` is used for heartbeat timers; it may be null, in which case no
   * heartbeat is sent. */
  SubscriptionManager(ProviderConfig, StreamConnector&, EventLoop* ev = nullptr);

  SubscriptionManager(const SubscriptionManager&) = delete;
  SubscriptionManager& operator=(const SubscriptionManager&) = delete;

  ~SubscriptionManager();

  /* Add symbols to the subscription set.  When connected, a control message
   * naming only the newly added symbols is sent. */
  void subscribe(const std::vector<std::string>& symbols);

  /* Remove symbols from the subscription set.  When connected, a control
   * message naming only the removed symbols is sent.  Removing symbols not
   * present has no effect. */
  void unsubscribe(const std::vector<std::string>& symbols);

  void set_callbacks(message_fn on_message, error_fn on_error = {});

  /* Invoked after every state transition, from the thread that caused it. */
  void set_state_observer(state_fn);

  /* Connect, and subscribe to the current symbol set.  On failure the state
   * returns to disconnected and ConnectionError is thrown. */
  void start();

  /* Receive loop; returns after stop() or connection loss, once the session
   * is disconnected. */
  void receive();

  /* Request the receive loop to end at its next message boundary.  Has no
   * effect when disconnected. */
  void stop();

  /* subscribe(symbols), then start() and receive(). */
  void run(const std::vector<std::string>& symbols, message_fn on_message,
           error_fn on_error = {});

  ConnectionState state() const;

  std::set<std::string> subscriptions() const;

  const ProviderConfig& provider() const { return _config; }

  static std::string control_message(const std::string& action,
                                     const std::vector<std::string>& symbols);

private:
  using transitions = std::vector<ConnectionState>;

  void set_state(ConnectionState, transitions&);
  void notify(const transitions&);
  void send_control(const std::string& action,
                    const std::vector<std::string>& symbols);
  void handle_message(const std::string& payload);
  void report(ErrorKind, std::string message);
  void start_heartbeat(const std::shared_ptr<StreamChannel>&);
  void teardown(const std::shared_ptr<StreamChannel>&);

  const ProviderConfig _config;
  StreamConnector& _connector;
  EventLoop* _ev;

  mutable std::mutex _mutex;
  ConnectionState _state = ConnectionState::disconnected;
  std::set<std::string> _symbols;
  std::shared_ptr<StreamChannel> _channel;
  std::shared_ptr<bool> _heartbeat_token;

  message_fn _on_message;
  error_fn _on_error;
  state_fn _on_state;

  StopFlag _stop;
};

} // namespace quotegate
