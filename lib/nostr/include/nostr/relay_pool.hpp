#pragma once

#include <async/async_queue.hpp>
#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <concepts>
#include <concepts/websocket_stream.hpp>
#include <core/errors.hpp>
#include <cstdint>
#include <core/id_generator.hpp>
#include <core/overload.hpp>
#include <functional>
#include <map>
#include <memory>
#include <nostr/event.hpp>
#include <nostr/events.hpp>
#include <nostr/filter.hpp>
#include <nostr/options.hpp>
#include <nostr/relay_session.hpp>
#include <nostr/seen_set.hpp>
#include <set>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <transport/websocket_stream.hpp>
#include <tuple>
#include <vector>

namespace tidepool::nostr {

/**
 * @brief What subscribe() hands back: the allocated id and the stream its updates arrive on.
 */
struct subscription
{
  std::string id;
  std::shared_ptr<events::subscription_queue_t> updates;
};

/**
 * @brief Fans requests out to a set of relay sessions and merges what comes back.
 *
 * The public API may be called from any thread and never blocks: arguments supplied by the caller are
 * checked synchronously, then a command is queued to the coordination coroutine, run(). That coroutine
 * alone owns the URL to session map, the open subscriptions and the de-duplication set.
 *
 * Inbound events are validated, checked against the subscription's filters and de-duplicated per
 * (subscription, event id) before they reach the subscriber. Each relay's end-of-replay marker is
 * forwarded once, and a replay_complete update follows once every relay present when the subscription
 * opened has sent one.
 *
 * @tparam Stream Stream type satisfying concepts::websocket_stream
 */
template<concepts::websocket_stream Stream>
  requires std::constructible_from<typename Stream::connection_params_t, transport::websocket_connection_params>
class relay_pool : public std::enable_shared_from_this<relay_pool<Stream>>
{
public:
  using stream_factory_t = std::function<std::shared_ptr<Stream>(const std::string &relay_url)>;
  using session_t = relay_session<Stream>;
  using in_queue_t = async::async_queue<events::pool::in_t>;
  using notification_queue_t = async::async_queue<events::notification_t>;
  using wire_queue_t = async::async_queue<events::wire_message>;

  /**
   * @brief Constructs an idle pool; call start() to spawn its coordination coroutine.
   *
   * @param io_context Context every session and the pool run on
   * @param factory Creates a stream for a relay URL, once per connection attempt
   * @param options Pool and session settings
   */
  relay_pool(const std::shared_ptr<boost::asio::io_context> &io_context, stream_factory_t factory, pool_options options = {})
    : io_context_(io_context), factory_(std::move(factory)), options_(options),
      in_queue_(std::make_shared<in_queue_t>(io_context, options.coordination_queue_capacity)),
      notifications_(std::make_shared<notification_queue_t>(io_context, options.notification_queue_capacity)),
      wire_messages_(std::make_shared<wire_queue_t>(io_context, options.wire_queue_capacity)),
      seen_(options.seen_capacity)
  {}

  relay_pool(const relay_pool &) = delete;
  auto operator=(const relay_pool &) -> relay_pool & = delete;
  relay_pool(relay_pool &&) = delete;
  auto operator=(relay_pool &&) -> relay_pool & = delete;
  ~relay_pool() = default;

  /**
   * @brief Spawns run() on the io_context. The coroutine keeps the pool alive until shutdown.
   */
  auto start() -> void
  {
    boost::asio::co_spawn(
      *io_context_,
      // NOLINTNEXTLINE(cppcoreguidelines-avoid-capturing-lambda-coroutines)
      [self = this->shared_from_this()]() -> boost::asio::awaitable<void> { co_await self->run(); },
      boost::asio::detached);
  }

  /**
   * @brief Registers a relay. Adding a URL that is already present does nothing.
   *
   * @param relay_url ws:// or wss:// URL
   * @param connect Start connecting immediately
   * @throws core::pool_error (invalid_relay_url, pool_stopped)
   */
  auto add_relay(const std::string &relay_url, bool connect = false) -> void
  {
    ensure_running();
    try {
      std::ignore = transport::parse_relay_url(relay_url);
    } catch (const core::transport_error &e) {
      throw core::pool_error(core::pool_errc::invalid_relay_url, e.what());
    }
    push(events::pool::add_relay{ .relay_url = relay_url, .connect = connect });
  }

  /**
   * @brief Terminates and forgets a relay. Unknown URLs are ignored.
   */
  auto remove_relay(const std::string &relay_url) -> void
  {
    ensure_running();
    push(events::pool::remove_relay{ .relay_url = relay_url });
  }

  /// Connects every registered relay that is disconnected
  auto connect() -> void
  {
    ensure_running();
    push(events::pool::connect{});
  }

  auto connect_relay(const std::string &relay_url) -> void
  {
    ensure_running();
    push(events::pool::connect{ .relay_url = relay_url });
  }

  /**
   * @brief Validates an event and broadcasts it to every relay.
   *
   * Disconnected relays buffer the event until they connect. Per-relay verdicts arrive as
   * publish_acknowledged notifications.
   * @throws core::event_validation_error if the event is not valid
   * @throws core::pool_error (pool_stopped)
   */
  auto publish(const event &evt) -> void
  {
    ensure_running();
    validate(evt);
    push(events::pool::publish{ .event = evt });
  }

  /**
   * @brief Opens a subscription on every current and future relay.
   *
   * @param filters OR-combined filters, at least one
   * @return The allocated id and the subscriber stream
   * @throws std::invalid_argument for an empty or contradictory filter set
   * @throws core::pool_error (pool_stopped)
   */
  auto subscribe(std::vector<filter> filters) -> subscription
  {
    ensure_running();
    if (filters.empty()) { throw std::invalid_argument("a subscription needs at least one filter"); }
    for (const auto &entry : filters) { entry.validate(); }

    auto result = subscription{ .id = ids_.next(),
      .updates = std::make_shared<events::subscription_queue_t>(io_context_, options_.subscription_queue_capacity) };
    push(events::pool::subscribe{ .subscription_id = result.id, .filters = std::move(filters), .updates = result.updates });
    return result;
  }

  /**
   * @brief Closes a subscription everywhere. Closing an unknown or already closed id does nothing.
   */
  auto unsubscribe(const std::string &subscription_id) -> void
  {
    if (stopped_) { return; }
    push(events::pool::unsubscribe{ .subscription_id = subscription_id });
  }

  /// Requests a status_report on the notification stream
  auto query_status() -> void
  {
    ensure_running();
    push(events::pool::query_status{});
  }

  /**
   * @brief Terminates every session and closes all streams. Further API calls raise pool_error.
   */
  auto shutdown() -> void
  {
    if (stopped_.exchange(true)) { return; }
    in_queue_->push(events::pool::shutdown{});
  }

  [[nodiscard]] auto notifications() const -> std::shared_ptr<notification_queue_t> { return notifications_; }

  /// Every frame exchanged with any relay; populated only when pool_options::observe_wire is set
  [[nodiscard]] auto wire_messages() const -> std::shared_ptr<wire_queue_t> { return wire_messages_; }

  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto run_once(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    auto evt = co_await in_queue_->pop(cancel_slot);
    std::visit([&](auto &&input) { handle(std::forward<decltype(input)>(input)); }, std::move(evt));
    co_return;
  }

  // NOLINTNEXTLINE(performance-unnecessary-value-param)
  auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<void>
  {
    try {
      while (true) { co_await run_once(cancel_slot); }
    } catch (const boost::system::system_error &e) {
      if (e.code() == boost::asio::error::operation_aborted
          or e.code() == boost::asio::experimental::error::channel_cancelled
          or e.code() == boost::asio::experimental::error::channel_closed) {
        spdlog::debug("[relay_pool] Cancelled, exiting run loop");
        co_return;
      }
      spdlog::error("[relay_pool] Unexpected error in run loop: {}", e.what());
      throw;
    }
  }

private:
  struct subscription_state
  {
    std::vector<filter> filters;
    std::shared_ptr<events::subscription_queue_t> updates;
    std::set<std::string> awaiting_eose;
    std::set<std::string> eose_forwarded;
    bool replay_signalled{ false };
  };

  std::shared_ptr<boost::asio::io_context> io_context_;
  stream_factory_t factory_;
  pool_options options_;
  std::shared_ptr<in_queue_t> in_queue_;
  std::shared_ptr<notification_queue_t> notifications_;
  std::shared_ptr<wire_queue_t> wire_messages_;
  core::id_generator ids_;
  std::atomic<bool> stopped_{ false };

  // Owned by the coordination coroutine
  std::map<std::string, std::shared_ptr<session_t>> sessions_;
  std::map<std::string, relay_status> statuses_;
  std::map<std::string, subscription_state> subscriptions_;
  std::vector<std::string> subscription_order_;
  seen_set seen_;
  std::uint64_t next_serial_{ 0 };

  static constexpr auto command_retry_delay = std::chrono::milliseconds(50);

  auto ensure_running() const -> void
  {
    if (stopped_) { throw core::pool_error(core::pool_errc::pool_stopped, "relay pool has been shut down"); }
  }

  auto push(events::pool::in_t command) -> void
  {
    if (not in_queue_->push(std::move(command))) {
      throw core::pool_error(core::pool_errc::pool_stopped, "relay pool is not accepting commands");
    }
  }

  auto notify(events::notification_t notification) -> void { notifications_->push(std::move(notification)); }

  auto deliver(const std::string &subscription_id, subscription_state &state, events::subscription_update_t update)
    -> bool
  {
    if (state.updates->push(std::move(update))) { return true; }
    spdlog::warn("[relay_pool] Subscriber of {} is not keeping up, update dropped", subscription_id);
    return false;
  }

  /// Messages from a session that has since been removed or replaced are not credited to the current one
  [[nodiscard]] auto is_current(const std::string &relay_url, std::uint64_t serial) const -> bool
  {
    auto iter = sessions_.find(relay_url);
    return iter != sessions_.end() and iter->second->serial() == serial;
  }

  static auto terminate_session(const std::shared_ptr<session_t> &session) -> void
  {
    if (not session->post(events::session::terminate{})) { session->stop(); }
  }

  static auto connect_session(session_t &session) -> void
  {
    if (not session.post(events::session::connect{})) {
      spdlog::warn("[relay_pool] Connect for {} not queued: session is backlogged", session.url());
    }
  }

  static auto open_on(const std::string &subscription_id, const std::vector<filter> &filters, session_t &session) -> bool
  {
    if (session.post(events::session::open_subscription{ .subscription_id = subscription_id, .filters = filters })) {
      return true;
    }
    spdlog::warn("[relay_pool] Could not open {} on {}: session is backlogged", subscription_id, session.url());
    return false;
  }

  /// Sends CLOSE, retrying while the session's queue is full
  auto close_on(const std::string &subscription_id, const std::shared_ptr<session_t> &session) -> void
  {
    if (session->post(events::session::close_subscription{ .subscription_id = subscription_id })) { return; }
    if (not session->accepting()) { return; }

    spdlog::warn("[relay_pool] {} is backlogged, retrying CLOSE for {}", session->url(), subscription_id);
    boost::asio::co_spawn(
      *io_context_,
      // NOLINTNEXTLINE(cppcoreguidelines-avoid-capturing-lambda-coroutines)
      [session, subscription_id]() -> boost::asio::awaitable<void> {
        boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
        while (session->accepting()) {
          timer.expires_after(command_retry_delay);
          co_await timer.async_wait(boost::asio::use_awaitable);
          if (session->post(events::session::close_subscription{ .subscription_id = subscription_id })) { co_return; }
        }
      },
      boost::asio::detached);
  }

  auto check_replay_complete(const std::string &subscription_id, subscription_state &state) -> void
  {
    if (state.replay_signalled or not state.awaiting_eose.empty()) { return; }
    state.replay_signalled = true;
    spdlog::debug("[relay_pool] Subscription {} replay complete", subscription_id);
    deliver(subscription_id, state, events::replay_complete{ .subscription_id = subscription_id });
  }

  auto spawn_session(const std::string &relay_url) -> std::shared_ptr<session_t>
  {
    auto session = std::make_shared<session_t>(
      relay_url,
      typename Stream::connection_params_t(transport::parse_relay_url(relay_url)),
      [factory = factory_, relay_url]() { return factory(relay_url); },
      io_context_,
      options_.relay,
      in_queue_,
      options_.observe_wire ? wire_messages_ : nullptr,
      ++next_serial_);

    boost::asio::co_spawn(
      *io_context_,
      // NOLINTNEXTLINE(cppcoreguidelines-avoid-capturing-lambda-coroutines)
      [session]() -> boost::asio::awaitable<void> { co_await session->run(); },
      boost::asio::detached);
    return session;
  }

  auto handle(const events::pool::add_relay &cmd) -> void
  {
    if (sessions_.contains(cmd.relay_url)) {
      spdlog::debug("[relay_pool] Relay {} already present", cmd.relay_url);
      if (cmd.connect) { connect_session(*sessions_.at(cmd.relay_url)); }
      return;
    }

    auto session = spawn_session(cmd.relay_url);
    for (const auto &subscription_id : subscription_order_) {
      std::ignore = open_on(subscription_id, subscriptions_.at(subscription_id).filters, *session);
    }
    if (cmd.connect) { connect_session(*session); }

    sessions_.emplace(cmd.relay_url, std::move(session));
    statuses_[cmd.relay_url] = relay_status::disconnected;
    spdlog::info("[relay_pool] Added relay {}", cmd.relay_url);
  }

  auto handle(const events::pool::remove_relay &cmd) -> void
  {
    auto iter = sessions_.find(cmd.relay_url);
    if (iter == sessions_.end()) { return; }

    terminate_session(iter->second);
    sessions_.erase(iter);
    statuses_.erase(cmd.relay_url);
    spdlog::info("[relay_pool] Removed relay {}", cmd.relay_url);

    for (auto &[subscription_id, state] : subscriptions_) {
      state.awaiting_eose.erase(cmd.relay_url);
      check_replay_complete(subscription_id, state);
    }
  }

  auto handle(const events::pool::connect &cmd) -> void
  {
    if (cmd.relay_url.empty()) {
      for (const auto &[relay_url, session] : sessions_) { connect_session(*session); }
      return;
    }
    if (auto iter = sessions_.find(cmd.relay_url); iter != sessions_.end()) {
      connect_session(*iter->second);
    } else {
      spdlog::warn("[relay_pool] Connect requested for unknown relay {}", cmd.relay_url);
    }
  }

  auto handle(const events::pool::publish &cmd) -> void
  {
    if (sessions_.empty()) { spdlog::warn("[relay_pool] Publishing {} with no relays configured", cmd.event.id); }
    for (const auto &[relay_url, session] : sessions_) {
      if (not session->post(events::session::publish{ .event = cmd.event })) {
        spdlog::warn("[relay_pool] Event {} not queued for {}: session is backlogged", cmd.event.id, relay_url);
      }
    }
  }

  auto handle(events::pool::subscribe &&cmd) -> void
  {
    subscription_state state{ .filters = cmd.filters, .updates = std::move(cmd.updates) };
    for (const auto &[relay_url, session] : sessions_) {
      if (open_on(cmd.subscription_id, cmd.filters, *session)) { state.awaiting_eose.insert(relay_url); }
    }

    spdlog::debug("[relay_pool] Opened subscription {} on {} relays", cmd.subscription_id, sessions_.size());
    subscription_order_.push_back(cmd.subscription_id);
    auto [iter, inserted] = subscriptions_.emplace(cmd.subscription_id, std::move(state));
    check_replay_complete(iter->first, iter->second);
  }

  auto handle(const events::pool::unsubscribe &cmd) -> void
  {
    if (subscriptions_.erase(cmd.subscription_id) == 0) { return; }
    std::erase(subscription_order_, cmd.subscription_id);

    for (const auto &[relay_url, session] : sessions_) { close_on(cmd.subscription_id, session); }
    spdlog::debug("[relay_pool] Closed subscription {}", cmd.subscription_id);
  }

  auto handle(const events::pool::query_status & /*cmd*/) -> void
  {
    events::status_report report{ .relays = {}, .subscriptions = subscriptions_.size() };
    for (const auto &[relay_url, status] : statuses_) {
      report.relays.push_back(events::relay_state{ .relay_url = relay_url, .status = status });
    }
    notify(std::move(report));
  }

  auto handle(const events::pool::shutdown & /*cmd*/) -> void
  {
    spdlog::info("[relay_pool] Shutting down {} relays", sessions_.size());
    for (const auto &[relay_url, session] : sessions_) { terminate_session(session); }
    sessions_.clear();
    statuses_.clear();

    for (auto &[subscription_id, state] : subscriptions_) { state.updates->close(); }
    subscriptions_.clear();
    subscription_order_.clear();

    notifications_->close();
    wire_messages_->close();
    in_queue_->close();
  }

  auto handle(events::pool::session_status &&evt) -> void
  {
    if (sessions_.contains(evt.relay_url)) {
      if (not is_current(evt.relay_url, evt.session_serial)) {
        spdlog::debug("[relay_pool] Ignoring status from replaced session of {}", evt.relay_url);
        return;
      }
      statuses_[evt.relay_url] = evt.status;
    }
    notify(events::relay_status_changed{ .relay_url = std::move(evt.relay_url), .status = evt.status, .error = std::move(evt.error) });
  }

  auto handle(events::pool::session_message &&evt) -> void
  {
    if (not is_current(evt.relay_url, evt.session_serial)) {
      spdlog::debug("[relay_pool] Dropping message from removed relay {}", evt.relay_url);
      return;
    }

    const auto &relay_url = evt.relay_url;
    std::visit(core::overload{ [&](protocol::event_delivery &msg) { on_event(relay_url, std::move(msg)); },
                 [&](protocol::ok &msg) {
                   if (msg.accepted) {
                     spdlog::debug("[relay_pool] {} accepted {}", relay_url, msg.event_id);
                   } else {
                     spdlog::warn("[relay_pool] {} rejected {}: {}", relay_url, msg.event_id, msg.message);
                   }
                   notify(events::publish_acknowledged{ .relay_url = relay_url,
                     .event_id = std::move(msg.event_id),
                     .accepted = msg.accepted,
                     .message = std::move(msg.message) });
                 },
                 [&](protocol::eose &msg) { on_eose(relay_url, msg.subscription_id); },
                 [&](protocol::notice &msg) {
                   spdlog::info("[relay_pool] Notice from {}: {}", relay_url, msg.message);
                   notify(events::relay_notice{ .relay_url = relay_url, .message = std::move(msg.message) });
                 },
                 [&](protocol::auth &msg) {
                   notify(events::auth_requested{ .relay_url = relay_url, .challenge = std::move(msg.challenge) });
                 },
                 [&](protocol::closed &msg) { on_closed(relay_url, msg); } },
      evt.message);
  }

  auto on_event(const std::string &relay_url, protocol::event_delivery &&msg) -> void
  {
    auto iter = subscriptions_.find(msg.subscription_id);
    if (iter == subscriptions_.end()) {
      spdlog::debug("[relay_pool] Dropping event for unknown subscription {} from {}", msg.subscription_id, relay_url);
      return;
    }

    try {
      validate(msg.event);
    } catch (const core::event_validation_error &e) {
      spdlog::warn("[relay_pool] Dropping invalid event from {}: {}", relay_url, e.what());
      return;
    }

    if (not matches_any(iter->second.filters, msg.event)) {
      spdlog::warn("[relay_pool] Dropping event {} from {}: outside subscription {}",
        msg.event.id,
        relay_url,
        msg.subscription_id);
      return;
    }

    auto key = msg.subscription_id + ":" + msg.event.id;
    if (not seen_.insert(key)) {
      spdlog::debug("[relay_pool] Duplicate event {} from {}", msg.event.id, relay_url);
      return;
    }

    // A copy from another relay may still get through
    if (not deliver(msg.subscription_id,
          iter->second,
          events::event_received{ .subscription_id = msg.subscription_id, .relay_url = relay_url, .event = std::move(msg.event) })) {
      seen_.erase(key);
    }
  }

  auto on_eose(const std::string &relay_url, const std::string &subscription_id) -> void
  {
    auto iter = subscriptions_.find(subscription_id);
    if (iter == subscriptions_.end()) { return; }

    auto &state = iter->second;
    if (state.eose_forwarded.insert(relay_url).second) {
      deliver(subscription_id, state, events::end_of_stored_events{ .subscription_id = subscription_id, .relay_url = relay_url });
    }
    state.awaiting_eose.erase(relay_url);
    check_replay_complete(subscription_id, state);
  }

  auto on_closed(const std::string &relay_url, const protocol::closed &msg) -> void
  {
    auto iter = subscriptions_.find(msg.subscription_id);
    if (iter == subscriptions_.end()) { return; }

    spdlog::info("[relay_pool] {} closed subscription {}: {}", relay_url, msg.subscription_id, msg.message);
    auto &state = iter->second;
    deliver(msg.subscription_id,
      state,
      events::subscription_closed{ .subscription_id = msg.subscription_id, .relay_url = relay_url, .message = msg.message });
    state.awaiting_eose.erase(relay_url);
    check_replay_complete(msg.subscription_id, state);
  }
};

/// Pool over real WebSocket connections
using websocket_relay_pool = relay_pool<transport::websocket_stream>;

/**
 * @brief Creates and starts a pool whose sessions connect with Boost.Beast.
 */
inline auto make_websocket_relay_pool(const std::shared_ptr<boost::asio::io_context> &io_context,
  pool_options options = {}) -> std::shared_ptr<websocket_relay_pool>
{
  auto pool = std::make_shared<websocket_relay_pool>(
    io_context,
    [io_context](const std::string & /*relay_url*/) { return std::make_shared<transport::websocket_stream>(io_context); },
    options);
  pool->start();
  return pool;
}

}// namespace tidepool::nostr
