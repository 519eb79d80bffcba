#include <nostr/metadata.hpp>

#include <array>
#include <nlohmann/json.hpp>
#include <utility>

namespace tidepool::nostr {

namespace {
  using field_t = std::optional<std::string> metadata::*;

  constexpr std::array<std::pair<const char *, field_t>, 8> fields{ {
    { "name", &metadata::name },
    { "display_name", &metadata::display_name },
    { "about", &metadata::about },
    { "website", &metadata::website },
    { "picture", &metadata::picture },
    { "nip05", &metadata::nip05 },
    { "lud06", &metadata::lud06 },
    { "lud16", &metadata::lud16 },
  } };
}// namespace

auto metadata::serialize() const -> std::string
{
  auto json = nlohmann::json::object();
  for (const auto &[key, member] : fields) {
    if (const auto &value = this->*member; value) { json[key] = *value; }
  }
  return json.dump();
}

auto metadata::deserialize(const std::string &json) -> std::optional<metadata>
{
  try {
    const auto json_obj = nlohmann::json::parse(json);
    if (not json_obj.is_object()) { return std::nullopt; }

    metadata result;
    for (const auto &[key, member] : fields) {
      const auto iter = json_obj.find(key);
      if (iter == json_obj.end() or iter->is_null()) { continue; }
      if (not iter->is_string()) { return std::nullopt; }
      result.*member = iter->get<std::string>();
    }
    return result;
  } catch (const nlohmann::json::exception &) {
    return std::nullopt;
  }
}

}// namespace tidepool::nostr
