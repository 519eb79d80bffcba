#pragma once

#include "test_double_websocket_stream.hpp"

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace tidepool::test {

/**
 * @brief Stream factory for pools and sessions that remembers every stream it hands out, per relay URL.
 */
class test_double_relay_network
{
public:
  explicit test_double_relay_network(const std::shared_ptr<boost::asio::io_context> &io_context)
    : io_context_(io_context)
  {}

  /// Streams created for this URL from now on refuse to connect
  auto set_unreachable(const std::string &relay_url, bool unreachable) -> void
  {
    if (unreachable) {
      unreachable_.insert(relay_url);
    } else {
      unreachable_.erase(relay_url);
    }
  }

  auto create(const std::string &relay_url) -> std::shared_ptr<test_double_websocket_stream>
  {
    auto stream = std::make_shared<test_double_websocket_stream>(io_context_);
    stream->set_connect_failure(unreachable_.contains(relay_url));
    streams_[relay_url].push_back(stream);
    return stream;
  }

  [[nodiscard]] auto factory()
  {
    return [this](const std::string &relay_url) { return create(relay_url); };
  }

  [[nodiscard]] auto attempts(const std::string &relay_url) const -> std::size_t
  {
    auto iter = streams_.find(relay_url);
    return iter == streams_.end() ? 0 : iter->second.size();
  }

  /// Most recent stream for the URL; null if none was created
  [[nodiscard]] auto latest(const std::string &relay_url) const -> std::shared_ptr<test_double_websocket_stream>
  {
    auto iter = streams_.find(relay_url);
    if (iter == streams_.end() or iter->second.empty()) { return nullptr; }
    return iter->second.back();
  }

  /// Frames written to the URL across every connection
  [[nodiscard]] auto all_writes(const std::string &relay_url) const -> std::vector<std::string>
  {
    std::vector<std::string> out;
    if (auto iter = streams_.find(relay_url); iter != streams_.end()) {
      for (const auto &stream : iter->second) {
        out.insert(out.end(), stream->get_writes().begin(), stream->get_writes().end());
      }
    }
    return out;
  }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  std::set<std::string> unreachable_;
  std::map<std::string, std::vector<std::shared_ptr<test_double_websocket_stream>>> streams_;
};

/**
 * @brief Runs ready handlers until the predicate holds or the timeout passes.
 *
 * @return The final value of the predicate
 */
template<typename Predicate>
auto run_until(boost::asio::io_context &io_context,
  Predicate predicate,
  std::chrono::milliseconds timeout = std::chrono::seconds(2)) -> bool
{
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (not predicate() and std::chrono::steady_clock::now() < deadline) {
    io_context.restart();
    io_context.run_for(std::chrono::milliseconds(1));
  }
  return predicate();
}

/**
 * @brief Runs every handler that is ready now, without waiting for timers.
 */
inline auto drain(boost::asio::io_context &io_context) -> void
{
  io_context.restart();
  while (io_context.poll() > 0) { io_context.restart(); }
}

}// namespace tidepool::test
