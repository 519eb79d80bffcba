#pragma once

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace tidepool::transport {

/**
 * @brief Where and how to open a WebSocket connection.
 */
struct websocket_connection_params
{
  std::string host;///< Hostname or IP address
  std::string port;///< Port number
  std::string path;///< Request target, at least "/"
  bool secure{ true };///< TLS (wss://) or plain TCP (ws://)

  auto operator==(const websocket_connection_params &) const -> bool = default;
};

/**
 * @brief Splits a ws:// or wss:// URL into connection parameters.
 *
 * @param url Relay URL such as "wss://relay.example.com" or "ws://127.0.0.1:7777/path"
 * @return Parsed parameters; the port defaults to 443 for wss and 80 for ws
 * @throws core::transport_error for other schemes, an empty host or a malformed port
 */
[[nodiscard]] auto parse_relay_url(std::string_view url) -> websocket_connection_params;

/**
 * @brief Text-frame WebSocket client over plain TCP or TLS, built on Boost.Beast.
 */
class websocket_stream
{
public:
  using connection_params_t = websocket_connection_params;
  using handler_t = std::function<void(const boost::system::error_code &, std::size_t)>;
  using read_handler_t = std::function<void(const boost::system::error_code &, std::string)>;

  /**
   * @brief Constructs an unconnected stream.
   *
   * @param io_context Boost.Asio io_context for async operations
   */
  explicit websocket_stream(const std::shared_ptr<boost::asio::io_context> &io_context);

  /**
   * @brief Resolves, connects, performs the TLS handshake when secure, then the WebSocket upgrade.
   *
   * @param params Connection parameters
   * @param handler Completion handler called with the first error or success
   */
  auto async_connect(const websocket_connection_params &params, handler_t handler) -> void;

  /**
   * @brief Writes one text frame. The text must stay alive until the handler runs.
   */
  auto async_write(std::string_view text, handler_t handler) -> void;

  /**
   * @brief Reads one complete message and hands its payload to the handler.
   */
  auto async_read(read_handler_t handler) -> void;

  /**
   * @brief Performs the closing handshake; completes immediately when never connected.
   */
  auto async_close(handler_t handler) -> void;

private:
  using plain_ws_t = boost::beast::websocket::stream<boost::beast::tcp_stream>;
  using tls_ws_t = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

  static constexpr int connection_timeout_seconds = 30;

  auto on_resolved(const websocket_connection_params &params,
    const boost::asio::ip::tcp::resolver::results_type &results,
    handler_t handler) -> void;

  template<typename WebSocket>
  auto upgrade(WebSocket &ws, const websocket_connection_params &params, handler_t handler) -> void;

  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::ssl::context ssl_context_;
  boost::asio::ip::tcp::resolver resolver_;
  std::unique_ptr<plain_ws_t> plain_ws_;
  std::unique_ptr<tls_ws_t> tls_ws_;
  boost::beast::flat_buffer read_buffer_;
};

}// namespace tidepool::transport
