#pragma once

#include <boost/system/error_code.hpp>
#include <concepts>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace tidepool::concepts {

/**
 * @brief Message-oriented text stream to one relay.
 *
 * Implementations invoke every handler exactly once, never from inside the initiating call,
 * and keep at most one read and one write outstanding. The caller keeps written text alive until
 * the write handler runs. Each stream type names its connection parameter type.
 */
template<typename T>
concept websocket_stream = requires(T &stream,
  typename T::connection_params_t params,
  std::string_view text,
  std::function<void(const boost::system::error_code &, std::size_t)> handler,
  std::function<void(const boost::system::error_code &, std::string)> read_handler) {
  typename T::connection_params_t;
  { stream.async_connect(params, handler) } -> std::same_as<void>;
  { stream.async_write(text, handler) } -> std::same_as<void>;
  { stream.async_read(read_handler) } -> std::same_as<void>;
  { stream.async_close(handler) } -> std::same_as<void>;
};

}// namespace tidepool::concepts
