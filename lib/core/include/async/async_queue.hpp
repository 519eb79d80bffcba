#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>

namespace tidepool::async {

/**
 * @brief Bounded, thread-safe asynchronous queue used as the mailbox of every coroutine component.
 *
 * @tparam T The type of elements stored in the queue
 *
 * Producers on any thread call push(), which never blocks. A single consumer coroutine awaits pop().
 * Once closed, pending and future pops complete with boost::asio::experimental::error::channel_closed.
 */
template<typename T> class async_queue
{
public:
  /// Capacity used when none is given
  static constexpr std::size_t default_capacity{ 1024 };

  /**
   * @brief Constructs a new async queue.
   *
   * @param io_context Shared pointer to the Boost.Asio io_context for async operations
   * @param capacity Maximum number of buffered elements
   */
  explicit async_queue(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::size_t capacity = default_capacity)
    : io_context_(io_context), channel_(*io_context_, capacity), capacity_(capacity), size_(0)
  {}

  async_queue(const async_queue &) = delete;
  auto operator=(const async_queue &) -> async_queue & = delete;
  async_queue(async_queue &&) = delete;
  auto operator=(async_queue &&) -> async_queue & = delete;
  ~async_queue() = default;

  /**
   * @brief Pushes a value onto the queue (non-blocking).
   *
   * @param value The value to push (moved into the queue)
   * @return false if the queue is full or closed and the value was dropped
   */
  auto push(T value) -> bool
  {
    if (not channel_.try_send(boost::system::error_code{}, std::move(value))) {
      if (channel_.is_open()) { spdlog::warn("[async_queue] queue full (capacity {}), dropping value", capacity_); }
      return false;
    }
    ++size_;
    return true;
  }

  /**
   * @brief Asynchronously pops a value from the queue (coroutine).
   *
   * @param cancel_slot Optional cancellation slot for operation cancellation
   * @return Awaitable that yields the next value from the queue
   * @throws boost::system::system_error on cancellation or when the queue is closed
   */
  auto pop(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<T>
  {
    boost::system::error_code err;

    if (cancel_slot) {
      auto val = co_await channel_.async_receive(boost::asio::bind_cancellation_slot(
        *cancel_slot, boost::asio::redirect_error(boost::asio::use_awaitable, err)));
      if (err) { throw boost::system::system_error(err); }
      --size_;
      co_return val;
    }

    auto val = co_await channel_.async_receive(boost::asio::redirect_error(boost::asio::use_awaitable, err));
    if (err) { throw boost::system::system_error(err); }
    --size_;
    co_return val;
  }

  /**
   * @brief Attempts to pop a value without blocking.
   *
   * @return Optional containing the value if available, std::nullopt if queue is empty
   */
  auto try_pop() -> std::optional<T>
  {
    std::optional<T> value;
    const bool received = channel_.try_receive([&value](boost::system::error_code err, T rx_value) {
      if (not err) { value.emplace(std::move(rx_value)); }
    });

    if (received and value.has_value()) {
      --size_;
      return value;
    }
    return std::nullopt;
  }

  [[nodiscard]] auto empty() const -> bool { return size_.load() == 0; }

  [[nodiscard]] auto size() const -> std::size_t { return size_.load(); }

  [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

  [[nodiscard]] auto is_open() const -> bool { return channel_.is_open(); }

  /**
   * @brief Closes the queue. Buffered values are discarded by the channel and pops fail.
   */
  auto close() -> void { channel_.close(); }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
  std::size_t capacity_;
  std::atomic<std::size_t> size_;
};

}// namespace tidepool::async
