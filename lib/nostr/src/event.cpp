#include <nostr/event.hpp>

#include <core/errors.hpp>
#include <crypto/hex.hpp>
#include <crypto/sha256.hpp>
#include <nlohmann/json.hpp>
#include <nostr/keys.hpp>

#include <limits>

namespace tidepool::nostr {

namespace {
  constexpr std::size_t id_hex_length = 64;
  constexpr std::size_t pubkey_hex_length = 64;
  constexpr std::size_t sig_hex_length = 128;

  auto malformed(const std::string &detail) -> core::event_validation_error
  {
    return { core::validation_reason::malformed_field, detail };
  }

  auto string_field(const nlohmann::json &json, const char *name) -> std::string
  {
    const auto iter = json.find(name);
    if (iter == json.end() or not iter->is_string()) { throw malformed(std::string(name) + " must be a string"); }
    return iter->get<std::string>();
  }

  auto tags_to_json(const std::vector<tag> &tags) -> nlohmann::json
  {
    auto json = nlohmann::json::array();
    for (const auto &entry : tags) { json.push_back(entry); }
    return json;
  }

  auto tags_from_json(const nlohmann::json &json) -> std::vector<tag>
  {
    if (not json.is_array()) { throw malformed("tags must be an array"); }
    std::vector<tag> tags;
    tags.reserve(json.size());
    for (const auto &tag_json : json) {
      if (not tag_json.is_array()) { throw malformed("each tag must be an array"); }
      tag entry;
      for (const auto &element : tag_json) {
        if (not element.is_string()) { throw malformed("tag elements must be strings"); }
        entry.push_back(element.get<std::string>());
      }
      tags.push_back(std::move(entry));
    }
    return tags;
  }

  auto check_shapes(const event &evt) -> void
  {
    if (not crypto::is_lower_hex(evt.id, id_hex_length)) { throw malformed("id must be 64 lowercase hex characters"); }
    if (not crypto::is_lower_hex(evt.pubkey, pubkey_hex_length)) {
      throw malformed("pubkey must be 64 lowercase hex characters");
    }
    if (not crypto::is_lower_hex(evt.sig, sig_hex_length)) {
      throw malformed("sig must be 128 lowercase hex characters");
    }
  }
}// namespace

auto canonical_serialization(std::string_view pubkey,
  std::uint64_t created_at,
  enum kind kind,
  const std::vector<tag> &tags,
  std::string_view content) -> std::string
{
  const auto canonical = nlohmann::json::array(
    { 0, std::string(pubkey), created_at, static_cast<std::uint16_t>(kind), tags_to_json(tags), std::string(content) });
  try {
    return canonical.dump();
  } catch (const nlohmann::json::type_error &err) {
    throw malformed(std::string("not valid UTF-8: ") + err.what());
  }
}

auto compute_event_id(std::string_view pubkey,
  std::uint64_t created_at,
  enum kind kind,
  const std::vector<tag> &tags,
  std::string_view content) -> std::string
{
  return crypto::to_hex(crypto::sha256(canonical_serialization(pubkey, created_at, kind, tags, content)));
}

auto event::compute_id() const -> std::string { return compute_event_id(pubkey, created_at, kind, tags, content); }

auto event::from_json(const nlohmann::json &json) -> event
{
  if (not json.is_object()) { throw malformed("event must be a JSON object"); }

  event evt;
  evt.id = string_field(json, "id");
  evt.pubkey = string_field(json, "pubkey");
  evt.content = string_field(json, "content");
  evt.sig = string_field(json, "sig");

  const auto created_at = json.find("created_at");
  if (created_at == json.end() or not created_at->is_number_unsigned()) {
    throw malformed("created_at must be a non-negative integer");
  }
  evt.created_at = created_at->get<std::uint64_t>();

  const auto kind_value = json.find("kind");
  if (kind_value == json.end() or not kind_value->is_number_unsigned()
      or kind_value->get<std::uint64_t>() > std::numeric_limits<std::uint16_t>::max()) {
    throw malformed("kind must be an integer in [0, 65535]");
  }
  evt.kind = static_cast<enum kind>(kind_value->get<std::uint16_t>());

  const auto tags = json.find("tags");
  if (tags == json.end()) { throw malformed("tags missing"); }
  evt.tags = tags_from_json(*tags);

  return evt;
}

auto event::deserialize(const std::string &json) -> std::optional<event>
{
  try {
    return from_json(nlohmann::json::parse(json));
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

auto event::to_json() const -> nlohmann::json
{
  return nlohmann::json{ { "id", id },
    { "pubkey", pubkey },
    { "created_at", created_at },
    { "kind", static_cast<std::uint16_t>(kind) },
    { "tags", tags_to_json(tags) },
    { "content", content },
    { "sig", sig } };
}

auto event::serialize() const -> std::string { return to_json().dump(); }

auto unsigned_event::sign(const keys &signer) const -> event
{
  event evt{ .id = "",
    .pubkey = signer.public_key_hex(),
    .created_at = created_at,
    .kind = kind,
    .tags = tags,
    .content = content,
    .sig = "" };
  evt.id = evt.compute_id();

  const auto id_bytes = crypto::from_hex_array<32>(evt.id);
  evt.sig = crypto::to_hex(signer.sign(*id_bytes));
  return evt;
}

auto validate(const event &evt) -> void
{
  check_shapes(evt);

  if (evt.compute_id() != evt.id) {
    throw core::event_validation_error(core::validation_reason::id_mismatch, "id does not match content of " + evt.id);
  }

  if (not keys::verify(evt.pubkey, evt.id, evt.sig)) {
    throw core::event_validation_error(core::validation_reason::invalid_signature, "bad signature on " + evt.id);
  }
}

auto is_valid(const event &evt) noexcept -> bool
{
  try {
    validate(evt);
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

}// namespace tidepool::nostr
