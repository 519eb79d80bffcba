#include <nostr/event_builder.hpp>

#include <platform/time_utils.hpp>

namespace tidepool::nostr {

event_builder::event_builder(enum kind kind, std::string content, std::vector<tag> tags)
  : kind_(kind), content_(std::move(content)), tags_(std::move(tags))
{}

auto event_builder::text_note(std::string content, std::vector<tag> tags) -> event_builder
{
  return { kind::text_note, std::move(content), std::move(tags) };
}

auto event_builder::set_metadata(const metadata &profile) -> event_builder
{
  return { kind::set_metadata, profile.serialize() };
}

auto event_builder::add_recommended_relay(std::string relay_url) -> event_builder
{
  return { kind::recommend_relay, std::move(relay_url) };
}

auto event_builder::set_contact_list(const std::vector<contact> &contacts) -> event_builder
{
  std::vector<tag> tags;
  tags.reserve(contacts.size());
  for (const auto &entry : contacts) { tags.push_back({ "p", entry.pubkey, entry.relay_url, entry.alias }); }
  return { kind::contact_list, "", std::move(tags) };
}

auto event_builder::delete_events(const std::vector<std::string> &event_ids, std::optional<std::string> reason)
  -> event_builder
{
  std::vector<tag> tags;
  tags.reserve(event_ids.size());
  for (const auto &event_id : event_ids) { tags.push_back({ "e", event_id }); }
  return { kind::event_deletion, reason.value_or(""), std::move(tags) };
}

auto event_builder::reaction(const event &target, bool positive) -> event_builder
{
  return { kind::reaction, positive ? "+" : "-", { { "e", target.id }, { "p", target.pubkey } } };
}

auto event_builder::created_at(std::uint64_t timestamp) -> event_builder &
{
  created_at_ = timestamp;
  return *this;
}

auto event_builder::to_unsigned_event() const -> unsigned_event
{
  return { .created_at = created_at_.value_or(platform::unix_timestamp_now()),
    .kind = kind_,
    .tags = tags_,
    .content = content_ };
}

auto event_builder::to_event(const keys &signer) const -> event { return to_unsigned_event().sign(signer); }

}// namespace tidepool::nostr
