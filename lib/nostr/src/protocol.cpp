#include <nostr/protocol.hpp>

#include <core/errors.hpp>
#include <core/overload.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace tidepool::nostr::protocol {

namespace {
  auto fail(std::string_view type, const std::string &detail) -> core::protocol_error
  {
    return core::protocol_error(std::string(type) + ": " + detail);
  }

  auto parse_array(std::string_view frame) -> nlohmann::json
  {
    auto json = nlohmann::json::parse(frame, nullptr, false);
    if (json.is_discarded()) { throw core::protocol_error("frame is not valid JSON"); }
    if (not json.is_array() or json.empty()) { throw core::protocol_error("frame is not a non-empty JSON array"); }
    if (not json[0].is_string()) { throw core::protocol_error("message type is not a string"); }
    return json;
  }

  auto expect_arity(const nlohmann::json &json, std::string_view type, std::size_t arity) -> void
  {
    if (json.size() != arity) {
      throw fail(type, "expected " + std::to_string(arity) + " elements, got " + std::to_string(json.size()));
    }
  }

  auto string_at(const nlohmann::json &json, std::size_t index, std::string_view type) -> std::string
  {
    if (not json[index].is_string()) { throw fail(type, "element " + std::to_string(index) + " is not a string"); }
    return json[index].get<std::string>();
  }

  auto subscription_id_at(const nlohmann::json &json, std::size_t index, std::string_view type) -> std::string
  {
    auto subscription_id = string_at(json, index, type);
    try {
      validate_subscription_id(subscription_id);
    } catch (const std::invalid_argument &err) {
      throw fail(type, err.what());
    }
    return subscription_id;
  }

  auto event_at(const nlohmann::json &json, std::size_t index, std::string_view type) -> event
  {
    try {
      return event::from_json(json[index]);
    } catch (const core::event_validation_error &err) {
      throw fail(type, err.what());
    }
  }
}// namespace

auto validate_subscription_id(std::string_view subscription_id) -> void
{
  if (subscription_id.empty()) { throw std::invalid_argument("subscription id must not be empty"); }
  if (subscription_id.size() > max_subscription_id_length) {
    throw std::invalid_argument("subscription id exceeds 64 characters");
  }
}

auto serialize(const client_message &message) -> std::string
{
  return std::visit(core::overload{ [](const event_message &msg) {
                                     return nlohmann::json::array({ "EVENT", msg.event.to_json() }).dump();
                                   },
                      [](const req &msg) {
                        auto json = nlohmann::json::array({ "REQ", msg.subscription_id });
                        for (const auto &entry : msg.filters) { json.push_back(entry.to_json()); }
                        return json.dump();
                      },
                      [](const close &msg) { return nlohmann::json::array({ "CLOSE", msg.subscription_id }).dump(); } },
    message);
}

auto serialize(const relay_message &message) -> std::string
{
  return std::visit(
    core::overload{ [](const event_delivery &msg) {
                     return nlohmann::json::array({ "EVENT", msg.subscription_id, msg.event.to_json() }).dump();
                   },
      [](const ok &msg) { return nlohmann::json::array({ "OK", msg.event_id, msg.accepted, msg.message }).dump(); },
      [](const eose &msg) { return nlohmann::json::array({ "EOSE", msg.subscription_id }).dump(); },
      [](const notice &msg) { return nlohmann::json::array({ "NOTICE", msg.message }).dump(); },
      [](const auth &msg) { return nlohmann::json::array({ "AUTH", msg.challenge }).dump(); },
      [](const closed &msg) { return nlohmann::json::array({ "CLOSED", msg.subscription_id, msg.message }).dump(); } },
    message);
}

auto parse_relay_message(std::string_view frame) -> relay_message
{
  const auto json = parse_array(frame);
  const auto type = json[0].get<std::string>();

  if (type == "EVENT") {
    expect_arity(json, type, 3);
    return event_delivery{ .subscription_id = subscription_id_at(json, 1, type), .event = event_at(json, 2, type) };
  }
  if (type == "OK") {
    // Some relays omit the message element
    if (json.size() != 3 and json.size() != 4) { throw fail(type, "expected 3 or 4 elements"); }
    if (not json[2].is_boolean()) { throw fail(type, "element 2 is not a boolean"); }
    return ok{ .event_id = string_at(json, 1, type),
      .accepted = json[2].get<bool>(),
      .message = json.size() == 4 ? string_at(json, 3, type) : std::string{} };
  }
  if (type == "EOSE") {
    expect_arity(json, type, 2);
    return eose{ .subscription_id = subscription_id_at(json, 1, type) };
  }
  if (type == "NOTICE") {
    expect_arity(json, type, 2);
    return notice{ .message = string_at(json, 1, type) };
  }
  if (type == "AUTH") {
    expect_arity(json, type, 2);
    return auth{ .challenge = string_at(json, 1, type) };
  }
  if (type == "CLOSED") {
    if (json.size() != 2 and json.size() != 3) { throw fail(type, "expected 2 or 3 elements"); }
    return closed{ .subscription_id = subscription_id_at(json, 1, type),
      .message = json.size() == 3 ? string_at(json, 2, type) : std::string{} };
  }
  throw core::protocol_error("unknown relay message type " + type);
}

auto parse_client_message(std::string_view frame) -> client_message
{
  const auto json = parse_array(frame);
  const auto type = json[0].get<std::string>();

  if (type == "EVENT") {
    expect_arity(json, type, 2);
    return event_message{ .event = event_at(json, 1, type) };
  }
  if (type == "REQ") {
    if (json.size() < 3) { throw fail(type, "expected at least one filter"); }
    req message{ .subscription_id = subscription_id_at(json, 1, type), .filters = {} };
    for (std::size_t index = 2; index < json.size(); ++index) {
      try {
        message.filters.push_back(filter::from_json(json[index]));
      } catch (const std::invalid_argument &err) {
        throw fail(type, err.what());
      }
    }
    return message;
  }
  if (type == "CLOSE") {
    expect_arity(json, type, 2);
    return close{ .subscription_id = subscription_id_at(json, 1, type) };
  }
  throw core::protocol_error("unknown client message type " + type);
}

auto message_type(const client_message &message) -> std::string_view
{
  return std::visit(core::overload{ [](const event_message &) -> std::string_view { return "EVENT"; },
                      [](const req &) -> std::string_view { return "REQ"; },
                      [](const close &) -> std::string_view { return "CLOSE"; } },
    message);
}

auto message_type(const relay_message &message) -> std::string_view
{
  return std::visit(core::overload{ [](const event_delivery &) -> std::string_view { return "EVENT"; },
                      [](const ok &) -> std::string_view { return "OK"; },
                      [](const eose &) -> std::string_view { return "EOSE"; },
                      [](const notice &) -> std::string_view { return "NOTICE"; },
                      [](const auth &) -> std::string_view { return "AUTH"; },
                      [](const closed &) -> std::string_view { return "CLOSED"; } },
    message);
}

}// namespace tidepool::nostr::protocol
