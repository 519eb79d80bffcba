#pragma once

#include <memory>
#include <nostr/event_builder.hpp>
#include <nostr/keys.hpp>
#include <nostr/relay_pool.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tidepool::nostr {

/**
 * @brief Signs events with one identity and publishes them through a relay pool.
 *
 * Every publishing helper returns the signed event so callers can track its id against
 * publish_acknowledged notifications.
 */
template<concepts::websocket_stream Stream> class client
{
public:
  client(keys identity, std::shared_ptr<relay_pool<Stream>> pool)
    : identity_(std::move(identity)), pool_(std::move(pool))
  {}

  [[nodiscard]] auto identity() const -> const keys & { return identity_; }

  [[nodiscard]] auto pool() const -> const std::shared_ptr<relay_pool<Stream>> & { return pool_; }

  auto add_relay(const std::string &relay_url, bool connect = false) -> void { pool_->add_relay(relay_url, connect); }

  auto remove_relay(const std::string &relay_url) -> void { pool_->remove_relay(relay_url); }

  auto connect() -> void { pool_->connect(); }

  /**
   * @brief Signs the built event and broadcasts it.
   * @throws core::key_error if the identity is verify-only
   */
  auto publish(const event_builder &builder) -> event
  {
    auto signed_event = builder.to_event(identity_);
    pool_->publish(signed_event);
    return signed_event;
  }

  auto publish_text_note(std::string content, std::vector<tag> tags = {}) -> event
  {
    return publish(event_builder::text_note(std::move(content), std::move(tags)));
  }

  auto update_profile(const metadata &profile) -> event { return publish(event_builder::set_metadata(profile)); }

  auto add_recommended_relay(std::string relay_url) -> event
  {
    return publish(event_builder::add_recommended_relay(std::move(relay_url)));
  }

  auto set_contact_list(const std::vector<contact> &contacts) -> event
  {
    return publish(event_builder::set_contact_list(contacts));
  }

  auto delete_event(const std::string &event_id, std::optional<std::string> reason = std::nullopt) -> event
  {
    return publish(event_builder::delete_events({ event_id }, std::move(reason)));
  }

  auto react(const event &target, bool positive = true) -> event
  {
    return publish(event_builder::reaction(target, positive));
  }

  auto subscribe(std::vector<filter> filters) -> subscription { return pool_->subscribe(std::move(filters)); }

  auto unsubscribe(const std::string &subscription_id) -> void { pool_->unsubscribe(subscription_id); }

  [[nodiscard]] auto notifications() const { return pool_->notifications(); }

private:
  keys identity_;
  std::shared_ptr<relay_pool<Stream>> pool_;
};

}// namespace tidepool::nostr
