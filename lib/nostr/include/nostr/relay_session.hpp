#pragma once

#include <algorithm>
#include <async/async_queue.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <concepts/websocket_stream.hpp>
#include <core/errors.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <fmt/format.h>
#include <functional>
#include <iterator>
#include <memory>
#include <nostr/backoff.hpp>
#include <nostr/events.hpp>
#include <nostr/options.hpp>
#include <nostr/protocol.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tidepool::nostr {

/**
 * @brief Owns the connection to one relay and everything that must survive reconnects.
 *
 * All state is touched only by the run() coroutine. Commands from the pool and completions from the
 * stream arrive through the same queue; completions carry the connection generation they belong to so
 * callbacks from a stream that has since been replaced are ignored.
 *
 * While disconnected, published events wait in a bounded buffer (oldest dropped when full) and
 * subscriptions are only recorded. Each successful connect re-sends one REQ per recorded subscription
 * and then flushes the buffered events, in order.
 *
 * @tparam Stream Stream type satisfying concepts::websocket_stream; a fresh one is made for every attempt
 */
template<concepts::websocket_stream Stream>
class relay_session : public std::enable_shared_from_this<relay_session<Stream>>
{
public:
  using stream_factory_t = std::function<std::shared_ptr<Stream>()>;
  using params_t = typename Stream::connection_params_t;
  using in_queue_t = async::async_queue<events::session::in_t>;
  using pool_queue_t = async::async_queue<events::pool::in_t>;
  using wire_queue_t = async::async_queue<events::wire_message>;

  /**
   * @brief Constructs a disconnected session.
   *
   * @param url Relay URL, used for reporting
   * @param params Connection parameters passed to every stream
   * @param factory Creates a stream per connection attempt
   * @param io_context Context the session's timer and queue run on
   * @param options Backoff and buffering settings
   * @param pool_queue Receives status changes and decoded relay messages
   * @param wire_queue Receives every frame sent or received; may be null
   * @param serial Tag carried on everything sent to pool_queue, so a replaced session can be told apart
   */
  relay_session(std::string url,
    params_t params,
    stream_factory_t factory,
    const std::shared_ptr<boost::asio::io_context> &io_context,
    relay_options options,
    std::shared_ptr<pool_queue_t> pool_queue,
    std::shared_ptr<wire_queue_t> wire_queue = nullptr,
    std::uint64_t serial = 0)
    : url_(std::move(url)), serial_(serial), params_(std::move(params)), factory_(std::move(factory)), io_context_(io_context),
      options_(options), backoff_(options.backoff),
      in_queue_(std::make_shared<in_queue_t>(io_context, options.command_queue_capacity)),
      pool_queue_(std::move(pool_queue)), wire_queue_(std::move(wire_queue)), timer_(*io_context)
  {}

  relay_session(const relay_session &) = delete;
  auto operator=(const relay_session &) -> relay_session & = delete;
  relay_session(relay_session &&) = delete;
  auto operator=(relay_session &&) -> relay_session & = delete;
  ~relay_session() = default;

  /**
   * @brief Enqueues a command. Safe from any thread.
   * @return false if the session has terminated or its queue is full
   */
  auto post(events::session::in_t command) -> bool { return in_queue_->push(std::move(command)); }

  /**
   * @brief Terminates the session without going through its command queue. Safe from any thread.
   *
   * Buffered commands are discarded; run() releases the connection and reports terminated on its way out.
   */
  auto stop() -> void { in_queue_->close(); }

  /// False once the session has terminated or been stopped
  [[nodiscard]] auto accepting() const -> bool { return in_queue_->is_open(); }

  [[nodiscard]] auto url() const -> const std::string & { return url_; }

  [[nodiscard]] auto serial() const -> std::uint64_t { return serial_; }

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
      while (status_ != relay_status::terminated) { co_await run_once(cancel_slot); }
    } catch (const boost::system::system_error &e) {
      if (e.code() == boost::asio::error::operation_aborted
          or e.code() == boost::asio::experimental::error::channel_cancelled
          or e.code() == boost::asio::experimental::error::channel_closed) {
        spdlog::debug("[relay_session] {} cancelled, exiting run loop", url_);
        if (e.code() == boost::asio::experimental::error::channel_closed and status_ != relay_status::terminated) {
          release();
        }
        co_return;
      }
      spdlog::error("[relay_session] {} unexpected error in run loop: {}", url_, e.what());
      throw;
    }
    spdlog::debug("[relay_session] {} terminated", url_);
  }

private:
  /// A frame waiting to be written, kept with its decoded form for observation
  struct outbound_frame
  {
    protocol::client_message message;
    std::shared_ptr<const std::string> text;
  };

  std::string url_;
  std::uint64_t serial_;
  params_t params_;
  stream_factory_t factory_;
  std::shared_ptr<boost::asio::io_context> io_context_;
  relay_options options_;
  backoff backoff_;
  std::shared_ptr<in_queue_t> in_queue_;
  std::shared_ptr<pool_queue_t> pool_queue_;
  std::shared_ptr<wire_queue_t> wire_queue_;
  boost::asio::steady_timer timer_;

  relay_status status_{ relay_status::disconnected };
  std::uint64_t generation_{ 0 };
  std::shared_ptr<Stream> stream_;
  bool writing_{ false };
  std::deque<outbound_frame> outbound_;
  std::vector<std::pair<std::string, std::vector<filter>>> subscriptions_;

  static auto make_frame(protocol::client_message message) -> outbound_frame
  {
    auto text = std::make_shared<const std::string>(protocol::serialize(message));
    return { .message = std::move(message), .text = std::move(text) };
  }

  [[nodiscard]] auto is_stale(std::uint64_t generation) const -> bool
  {
    if (generation == generation_) { return false; }
    spdlog::debug("[relay_session] {} ignoring callback from connection {} (current {})", url_, generation, generation_);
    return true;
  }

  auto set_status(relay_status status, std::string error = {}) -> void
  {
    status_ = status;
    pool_queue_->push(events::pool::session_status{
      .relay_url = url_, .session_serial = serial_, .status = status, .error = std::move(error) });
  }

  auto observe(events::direction dir, std::variant<protocol::client_message, protocol::relay_message> message) -> void
  {
    if (wire_queue_) {
      wire_queue_->push(events::wire_message{ .relay_url = url_, .direction = dir, .message = std::move(message) });
    }
  }

  auto begin_connect() -> void
  {
    ++generation_;
    set_status(relay_status::connecting);
    spdlog::info("[relay_session] {} connecting (attempt {})", url_, backoff_.attempts() + 1);

    try {
      stream_ = factory_();
    } catch (const std::exception &e) {
      on_connection_lost(fmt::format("cannot create stream: {}", e.what()));
      return;
    }

    stream_->async_connect(params_,
      [queue = in_queue_, generation = generation_](const boost::system::error_code &error, std::size_t /*bytes*/) {
        if (error) {
          queue->push(events::session::transport_connect_failed{ .generation = generation, .error = error.message() });
        } else {
          queue->push(events::session::transport_connected{ .generation = generation });
        }
      });
  }

  auto start_read() -> void
  {
    stream_->async_read(
      [queue = in_queue_, generation = generation_](const boost::system::error_code &error, std::string text) {
        if (error) {
          queue->push(events::session::transport_closed{ .generation = generation, .error = error.message() });
        } else {
          queue->push(events::session::frame_received{ .generation = generation, .text = std::move(text) });
        }
      });
  }

  auto write_next() -> void
  {
    if (writing_ or status_ != relay_status::connected or outbound_.empty()) { return; }

    auto frame = std::move(outbound_.front());
    outbound_.pop_front();
    writing_ = true;

    spdlog::trace("[relay_session] {} >> {}", url_, *frame.text);
    observe(events::direction::outbound, frame.message);

    stream_->async_write(*frame.text,
      [queue = in_queue_, generation = generation_, text = frame.text](
        const boost::system::error_code &error, std::size_t /*bytes*/) {
        queue->push(
          events::session::frame_written{ .generation = generation, .error = error ? error.message() : std::string{} });
      });
  }

  auto enqueue(outbound_frame frame) -> void
  {
    if (outbound_.size() >= options_.max_pending_frames) {
      spdlog::warn("[relay_session] {} outbound buffer full ({}), dropping oldest {} frame",
        url_,
        options_.max_pending_frames,
        protocol::message_type(outbound_.front().message));
      outbound_.pop_front();
    }
    outbound_.push_back(std::move(frame));
    write_next();
  }

  auto close_stream() -> void
  {
    if (not stream_) { return; }
    auto stream = std::move(stream_);
    // The handler owns the stream until the close completes
    stream->async_close([stream](const boost::system::error_code & /*error*/, std::size_t /*bytes*/) {});
  }

  auto schedule_reconnect() -> void
  {
    const auto delay = backoff_.next_delay();
    spdlog::info("[relay_session] {} reconnecting in {} ms", url_, delay.count());

    timer_.expires_after(delay);
    timer_.async_wait([queue = in_queue_, generation = generation_](const boost::system::error_code &error) {
      if (not error) { queue->push(events::session::reconnect_due{ .generation = generation }); }
    });
  }

  auto on_connection_lost(std::string reason) -> void
  {
    if (status_ == relay_status::connected) { backoff_.on_disconnected(); }
    spdlog::warn("[relay_session] {} connection lost: {}", url_, reason);

    close_stream();
    writing_ = false;

    // REQ and CLOSE are rebuilt from the subscription set on reconnect
    std::erase_if(outbound_, [](const outbound_frame &frame) {
      return not std::holds_alternative<protocol::event_message>(frame.message);
    });

    set_status(relay_status::disconnected, std::move(reason));
    schedule_reconnect();
  }

  auto handle(const events::session::connect & /*cmd*/) -> void
  {
    if (status_ != relay_status::disconnected) { return; }
    timer_.cancel();
    begin_connect();
  }

  auto handle(events::session::publish &&cmd) -> void
  {
    if (status_ == relay_status::terminated) { return; }
    enqueue(make_frame(protocol::event_message{ .event = std::move(cmd.event) }));
  }

  auto handle(const events::session::open_subscription &cmd) -> void
  {
    if (status_ == relay_status::terminated) { return; }

    auto existing = std::ranges::find_if(
      subscriptions_, [&cmd](const auto &entry) { return entry.first == cmd.subscription_id; });
    if (existing != subscriptions_.end()) {
      existing->second = cmd.filters;
    } else {
      subscriptions_.emplace_back(cmd.subscription_id, cmd.filters);
    }

    if (status_ == relay_status::connected) {
      enqueue(make_frame(protocol::req{ .subscription_id = cmd.subscription_id, .filters = cmd.filters }));
    }
  }

  auto handle(const events::session::close_subscription &cmd) -> void
  {
    const auto removed = std::erase_if(
      subscriptions_, [&cmd](const auto &entry) { return entry.first == cmd.subscription_id; });

    if (removed > 0 and status_ == relay_status::connected) {
      enqueue(make_frame(protocol::close{ .subscription_id = cmd.subscription_id }));
    }
  }

  /// Drops the connection and every pending frame, then reports terminated
  auto release() -> void
  {
    ++generation_;
    timer_.cancel();
    close_stream();
    outbound_.clear();
    subscriptions_.clear();
    writing_ = false;

    spdlog::info("[relay_session] {} terminated", url_);
    set_status(relay_status::terminated);
  }

  auto handle(const events::session::terminate & /*cmd*/) -> void
  {
    if (status_ == relay_status::terminated) { return; }
    release();
    in_queue_->close();
  }

  auto handle(const events::session::transport_connected &evt) -> void
  {
    if (is_stale(evt.generation) or status_ != relay_status::connecting) { return; }

    backoff_.on_connected();
    set_status(relay_status::connected);

    // Subscriptions go out before anything queued while disconnected; queued events keep their order.
    std::deque<outbound_frame> frames;
    for (const auto &[subscription_id, filters] : subscriptions_) {
      frames.push_back(make_frame(protocol::req{ .subscription_id = subscription_id, .filters = filters }));
    }
    spdlog::info("[relay_session] {} connected, restoring {} subscriptions and flushing {} queued frames",
      url_,
      frames.size(),
      outbound_.size());
    std::move(outbound_.begin(), outbound_.end(), std::back_inserter(frames));
    outbound_ = std::move(frames);

    start_read();
    write_next();
  }

  auto handle(const events::session::transport_connect_failed &evt) -> void
  {
    if (is_stale(evt.generation) or status_ != relay_status::connecting) { return; }
    on_connection_lost(evt.error);
  }

  auto handle(const events::session::transport_closed &evt) -> void
  {
    if (is_stale(evt.generation) or status_ != relay_status::connected) { return; }
    on_connection_lost(evt.error);
  }

  auto handle(events::session::frame_received &&evt) -> void
  {
    if (is_stale(evt.generation) or status_ != relay_status::connected) { return; }

    spdlog::trace("[relay_session] {} << {}", url_, evt.text);
    try {
      auto message = protocol::parse_relay_message(evt.text);
      observe(events::direction::inbound, message);
      pool_queue_->push(
        events::pool::session_message{ .relay_url = url_, .session_serial = serial_, .message = std::move(message) });
    } catch (const core::protocol_error &e) {
      spdlog::warn("[relay_session] {} dropping malformed frame: {}", url_, e.what());
    }

    start_read();
  }

  auto handle(const events::session::frame_written &evt) -> void
  {
    if (is_stale(evt.generation) or status_ != relay_status::connected) { return; }

    writing_ = false;
    if (not evt.error.empty()) {
      on_connection_lost(evt.error);
      return;
    }
    write_next();
  }

  auto handle(const events::session::reconnect_due &evt) -> void
  {
    if (is_stale(evt.generation) or status_ != relay_status::disconnected) { return; }
    begin_connect();
  }
};

}// namespace tidepool::nostr
