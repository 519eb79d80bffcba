#include <transport/websocket_stream.hpp>

#include "internal_use_only/config.hpp"
#include <charconv>
#include <chrono>
#include <core/errors.hpp>
#include <fmt/format.h>

namespace tidepool::transport {

namespace beast = boost::beast;

auto parse_relay_url(std::string_view url) -> websocket_connection_params
{
  constexpr std::string_view tls_scheme = "wss://";
  constexpr std::string_view plain_scheme = "ws://";

  websocket_connection_params params;
  std::string_view rest;
  if (url.starts_with(tls_scheme)) {
    params.secure = true;
    params.port = "443";
    rest = url.substr(tls_scheme.size());
  } else if (url.starts_with(plain_scheme)) {
    params.secure = false;
    params.port = "80";
    rest = url.substr(plain_scheme.size());
  } else {
    throw core::transport_error("unsupported scheme in relay url '" + std::string(url) + "'");
  }

  const auto path_start = rest.find('/');
  const auto authority = rest.substr(0, path_start);
  params.path = path_start == std::string_view::npos ? "/" : std::string(rest.substr(path_start));

  const auto port_start = authority.rfind(':');
  if (port_start != std::string_view::npos and authority.find(']') == std::string_view::npos) {
    const auto port = authority.substr(port_start + 1);
    unsigned int number = 0;
    const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), number);
    if (port.empty() or ec != std::errc{} or ptr != port.data() + port.size() or number == 0 or number > 65535) {
      throw core::transport_error("malformed port in relay url '" + std::string(url) + "'");
    }
    params.port = std::string(port);
    params.host = std::string(authority.substr(0, port_start));
  } else {
    params.host = std::string(authority);
  }

  if (params.host.empty()) { throw core::transport_error("missing host in relay url '" + std::string(url) + "'"); }
  return params;
}

websocket_stream::websocket_stream(const std::shared_ptr<boost::asio::io_context> &io_context)
  : io_context_(io_context), strand_(boost::asio::make_strand(*io_context)),
    ssl_context_(boost::asio::ssl::context::tlsv12_client), resolver_(strand_)
{
  ssl_context_.set_default_verify_paths();
  ssl_context_.set_verify_mode(boost::asio::ssl::verify_peer);
}

auto websocket_stream::async_connect(const websocket_connection_params &params, handler_t handler) -> void
{
  if (params.secure) {
    tls_ws_ = std::make_unique<tls_ws_t>(strand_, ssl_context_);
  } else {
    plain_ws_ = std::make_unique<plain_ws_t>(strand_);
  }

  resolver_.async_resolve(params.host,
    params.port,
    [this, params, handler = std::move(handler)](const boost::system::error_code &error_code,
      const boost::asio::ip::tcp::resolver::results_type &results) mutable {
      if (error_code) {
        handler(error_code, 0);
        return;
      }
      on_resolved(params, results, std::move(handler));
    });
}

auto websocket_stream::on_resolved(const websocket_connection_params &params,
  const boost::asio::ip::tcp::resolver::results_type &results,
  handler_t handler) -> void
{
  auto &tcp = plain_ws_ ? beast::get_lowest_layer(*plain_ws_) : beast::get_lowest_layer(*tls_ws_);
  tcp.expires_after(std::chrono::seconds(connection_timeout_seconds));

  tcp.async_connect(results,
    [this, params, handler = std::move(handler)](
      const boost::system::error_code &connect_error, const boost::asio::ip::tcp::endpoint & /*endpoint*/) mutable {
      if (connect_error) {
        handler(connect_error, 0);
        return;
      }

      if (plain_ws_) {
        upgrade(*plain_ws_, params, std::move(handler));
        return;
      }

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-cstyle-cast,hicpp-no-array-decay)
      if (not SSL_set_tlsext_host_name(tls_ws_->next_layer().native_handle(), params.host.c_str())) {
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif
        handler(boost::asio::error::operation_not_supported, 0);
        return;
      }

      tls_ws_->next_layer().async_handshake(boost::asio::ssl::stream_base::client,
        [this, params, handler = std::move(handler)](const boost::system::error_code &ssl_error) mutable {
          if (ssl_error) {
            handler(ssl_error, 0);
            return;
          }
          upgrade(*tls_ws_, params, std::move(handler));
        });
    });
}

template<typename WebSocket>
auto websocket_stream::upgrade(WebSocket &ws, const websocket_connection_params &params, handler_t handler) -> void
{
  beast::get_lowest_layer(ws).expires_never();

  ws.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::client));
  ws.set_option(beast::websocket::stream_base::decorator([](beast::websocket::request_type &req) {
    req.set(boost::beast::http::field::user_agent,
      fmt::format("{} {}/{}", BOOST_BEAST_VERSION_STRING, cmake::project_name, cmake::project_version));
  }));
  ws.text(true);

  const auto host = params.host + ":" + params.port;
  ws.async_handshake(host, params.path, [handler = std::move(handler)](const boost::system::error_code &ws_error) {
    handler(ws_error, 0);
  });
}

auto websocket_stream::async_write(std::string_view text, handler_t handler) -> void
{
  auto on_written = [handler = std::move(handler)](const boost::system::error_code &error_code,
                      std::size_t bytes_transferred) { handler(error_code, bytes_transferred); };
  const auto buffer = boost::asio::buffer(text.data(), text.size());

  if (plain_ws_) {
    plain_ws_->async_write(buffer, std::move(on_written));
  } else if (tls_ws_) {
    tls_ws_->async_write(buffer, std::move(on_written));
  } else {
    boost::asio::post(strand_, [on_written = std::move(on_written)]() mutable {
      on_written(boost::asio::error::not_connected, 0);
    });
  }
}

auto websocket_stream::async_read(read_handler_t handler) -> void
{
  if (not plain_ws_ and not tls_ws_) {
    boost::asio::post(strand_, [handler = std::move(handler)]() { handler(boost::asio::error::not_connected, {}); });
    return;
  }

  read_buffer_.clear();
  auto on_read = [this, handler = std::move(handler)](
                   const boost::system::error_code &error_code, std::size_t /*bytes_transferred*/) {
    if (error_code) {
      handler(error_code, {});
      return;
    }
    auto text = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());
    handler(error_code, std::move(text));
  };

  if (plain_ws_) {
    plain_ws_->async_read(read_buffer_, std::move(on_read));
  } else {
    tls_ws_->async_read(read_buffer_, std::move(on_read));
  }
}

auto websocket_stream::async_close(handler_t handler) -> void
{
  auto on_closed = [handler = std::move(handler)](const boost::system::error_code &error_code) {
    handler(error_code, 0);
  };

  if (plain_ws_ and plain_ws_->is_open()) {
    plain_ws_->async_close(beast::websocket::close_code::normal, std::move(on_closed));
  } else if (tls_ws_ and tls_ws_->is_open()) {
    tls_ws_->async_close(beast::websocket::close_code::normal, std::move(on_closed));
  } else {
    resolver_.cancel();
    if (plain_ws_) { beast::get_lowest_layer(*plain_ws_).cancel(); }
    if (tls_ws_) { beast::get_lowest_layer(*tls_ws_).cancel(); }
    boost::asio::post(strand_, [on_closed = std::move(on_closed)]() { on_closed(boost::system::error_code{}); });
  }
}

}// namespace tidepool::transport
