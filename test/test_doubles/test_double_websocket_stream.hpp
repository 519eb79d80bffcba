#pragma once

#include <concepts/websocket_stream.hpp>
#include <transport/websocket_stream.hpp>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tidepool::test {

/**
 * @brief In-memory relay connection. Completions are posted to the io_context, never run inline.
 */
class test_double_websocket_stream : public std::enable_shared_from_this<test_double_websocket_stream>
{
public:
  using connection_params_t = transport::websocket_connection_params;
  using handler_t = std::function<void(const boost::system::error_code &, std::size_t)>;
  using read_handler_t = std::function<void(const boost::system::error_code &, std::string)>;

  explicit test_double_websocket_stream(const std::shared_ptr<boost::asio::io_context> &io_context)
    : io_context_(io_context)
  {}

  auto set_connect_failure(bool fail) -> void { should_fail_connect_ = fail; }
  auto set_write_failure(bool fail) -> void { should_fail_write_ = fail; }

  /// Queues a frame from the relay, completing a pending read
  auto deliver(std::string frame) -> void
  {
    inbound_.push_back(std::move(frame));
    complete_pending_read();
  }

  /// Simulates the relay dropping the connection
  auto drop_connection() -> void
  {
    connected_ = false;
    dropped_ = true;
    complete_pending_read();
  }

  [[nodiscard]] auto get_connections() const -> const std::vector<connection_params_t> & { return connections_; }
  [[nodiscard]] auto get_writes() const -> const std::vector<std::string> & { return writes_; }
  [[nodiscard]] auto is_connected() const -> bool { return connected_; }
  [[nodiscard]] auto was_closed() const -> bool { return closed_; }

  auto async_connect(const connection_params_t &params, handler_t handler) -> void
  {
    connections_.push_back(params);

    boost::asio::post(*io_context_, [self = shared_from_this(), handler = std::move(handler)]() {
      if (self->should_fail_connect_) {
        handler(boost::asio::error::connection_refused, 0);
      } else {
        self->connected_ = true;
        handler(boost::system::error_code{}, 0);
      }
    });
  }

  auto async_write(std::string_view text, handler_t handler) -> void
  {
    writes_.emplace_back(text);

    boost::asio::post(*io_context_, [self = shared_from_this(), bytes = text.size(), handler = std::move(handler)]() {
      if (self->should_fail_write_ or not self->connected_) {
        handler(boost::asio::error::broken_pipe, 0);
      } else {
        handler(boost::system::error_code{}, bytes);
      }
    });
  }

  auto async_read(read_handler_t handler) -> void
  {
    pending_read_handler_ = std::move(handler);
    complete_pending_read();
  }

  auto async_close(handler_t handler) -> void
  {
    connected_ = false;
    closed_ = true;
    complete_pending_read();

    boost::asio::post(*io_context_, [handler = std::move(handler)]() { handler(boost::system::error_code{}, 0); });
  }

private:
  auto complete_pending_read() -> void
  {
    if (not pending_read_handler_) { return; }

    auto handler = std::move(pending_read_handler_);
    pending_read_handler_ = nullptr;

    if (closed_) {
      boost::asio::post(*io_context_, [handler = std::move(handler)]() { handler(boost::asio::error::operation_aborted, {}); });
    } else if (dropped_) {
      boost::asio::post(*io_context_, [handler = std::move(handler)]() { handler(boost::asio::error::connection_reset, {}); });
    } else if (not inbound_.empty()) {
      auto frame = std::move(inbound_.front());
      inbound_.pop_front();
      boost::asio::post(*io_context_,
        [handler = std::move(handler), frame = std::move(frame)]() { handler(boost::system::error_code{}, frame); });
    } else {
      pending_read_handler_ = std::move(handler);
    }
  }

  std::shared_ptr<boost::asio::io_context> io_context_;

  bool should_fail_connect_{ false };
  bool should_fail_write_{ false };
  bool connected_{ false };
  bool dropped_{ false };
  bool closed_{ false };

  std::vector<connection_params_t> connections_;
  std::vector<std::string> writes_;
  std::deque<std::string> inbound_;
  read_handler_t pending_read_handler_;
};

static_assert(tidepool::concepts::websocket_stream<test_double_websocket_stream>);

}// namespace tidepool::test
