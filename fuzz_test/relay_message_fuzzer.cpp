#include <core/errors.hpp>
#include <cstddef>
#include <cstdint>
#include <nostr/event.hpp>
#include <nostr/protocol.hpp>
#include <string_view>
#include <tuple>
#include <variant>

// Feeds arbitrary frames to the relay message parser and validates any embedded event
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string_view frame(reinterpret_cast<const char *>(Data), Size);

  try {
    auto message = tidepool::nostr::protocol::parse_relay_message(frame);
    std::ignore = tidepool::nostr::protocol::message_type(message);
    if (const auto *delivery = std::get_if<tidepool::nostr::protocol::event_delivery>(&message)) {
      std::ignore = tidepool::nostr::is_valid(delivery->event);
    }
    std::ignore = tidepool::nostr::protocol::serialize(message);
  } catch (const tidepool::core::protocol_error &) {
    return 0;
  }

  return 0;
}
