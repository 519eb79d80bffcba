#include <nostr/filter.hpp>

#include <algorithm>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace tidepool::nostr {

namespace {
  template<typename T> auto contains(const std::vector<T> &values, const T &value) -> bool
  {
    return std::ranges::find(values, value) != values.end();
  }

  auto string_list(const nlohmann::json &json, const std::string &key) -> std::vector<std::string>
  {
    if (not json.is_array()) { throw std::invalid_argument(key + " must be an array"); }
    std::vector<std::string> out;
    for (const auto &element : json) {
      if (not element.is_string()) { throw std::invalid_argument(key + " must contain strings"); }
      out.push_back(element.get<std::string>());
    }
    return out;
  }

  auto unsigned_value(const nlohmann::json &json, const std::string &key) -> std::uint64_t
  {
    if (not json.is_number_unsigned()) { throw std::invalid_argument(key + " must be a non-negative integer"); }
    return json.get<std::uint64_t>();
  }
}// namespace

auto filter::matches(const event &evt) const -> bool
{
  if (ids and not contains(*ids, evt.id)) { return false; }
  if (authors and not contains(*authors, evt.pubkey)) { return false; }
  if (kinds and not contains(*kinds, evt.kind)) { return false; }
  if (since and evt.created_at < *since) { return false; }
  if (until and evt.created_at > *until) { return false; }

  for (const auto &[name, values] : tags) {
    const auto tagged = std::ranges::any_of(evt.tags, [&name, &values](const nostr::tag &entry) {
      return entry.size() >= 2 and entry[0] == name and contains(values, entry[1]);
    });
    if (not tagged) { return false; }
  }
  return true;
}

auto filter::validate() const -> void
{
  if (since and until and *since > *until) {
    throw std::invalid_argument("filter since " + std::to_string(*since) + " is after until " + std::to_string(*until));
  }
  for (const auto &[name, values] : tags) {
    if (name.empty()) { throw std::invalid_argument("filter tag name is empty"); }
    if (values.empty()) { throw std::invalid_argument("filter tag #" + name + " has no values"); }
  }
}

auto filter::to_json() const -> nlohmann::json
{
  auto json = nlohmann::json::object();
  if (ids) { json["ids"] = *ids; }
  if (authors) { json["authors"] = *authors; }
  if (kinds) {
    auto kind_json = nlohmann::json::array();
    for (const auto value : *kinds) { kind_json.push_back(static_cast<std::uint16_t>(value)); }
    json["kinds"] = std::move(kind_json);
  }
  for (const auto &[name, values] : tags) { json["#" + name] = values; }
  if (since) { json["since"] = *since; }
  if (until) { json["until"] = *until; }
  if (limit) { json["limit"] = *limit; }
  return json;
}

auto filter::from_json(const nlohmann::json &json) -> filter
{
  if (not json.is_object()) { throw std::invalid_argument("filter must be a JSON object"); }

  filter result;
  for (const auto &[key, value] : json.items()) {
    if (key == "ids") {
      result.ids = string_list(value, key);
    } else if (key == "authors") {
      result.authors = string_list(value, key);
    } else if (key == "kinds") {
      if (not value.is_array()) { throw std::invalid_argument("kinds must be an array"); }
      std::vector<enum kind> kinds;
      for (const auto &element : value) {
        const auto number = unsigned_value(element, key);
        if (number > 0xFFFFU) { throw std::invalid_argument("kind out of range"); }
        kinds.push_back(static_cast<enum kind>(number));
      }
      result.kinds = std::move(kinds);
    } else if (key == "since") {
      result.since = unsigned_value(value, key);
    } else if (key == "until") {
      result.until = unsigned_value(value, key);
    } else if (key == "limit") {
      result.limit = static_cast<std::size_t>(unsigned_value(value, key));
    } else if (key.size() > 1 and key.front() == '#') {
      result.tags[key.substr(1)] = string_list(value, key);
    }
  }
  return result;
}

auto filter::id(std::string value) -> filter &
{
  if (not ids) { ids.emplace(); }
  ids->push_back(std::move(value));
  return *this;
}

auto filter::author(std::string value) -> filter &
{
  if (not authors) { authors.emplace(); }
  authors->push_back(std::move(value));
  return *this;
}

auto filter::kind(enum kind value) -> filter &
{
  if (not kinds) { kinds.emplace(); }
  kinds->push_back(value);
  return *this;
}

auto filter::tag(const std::string &name, std::string value) -> filter &
{
  tags[name].push_back(std::move(value));
  return *this;
}

auto filter::since_time(std::uint64_t timestamp) -> filter &
{
  since = timestamp;
  return *this;
}

auto filter::until_time(std::uint64_t timestamp) -> filter &
{
  until = timestamp;
  return *this;
}

auto filter::limit_to(std::size_t count) -> filter &
{
  limit = count;
  return *this;
}

auto matches_any(const std::vector<filter> &filters, const event &evt) -> bool
{
  return std::ranges::any_of(filters, [&evt](const filter &candidate) { return candidate.matches(evt); });
}

}// namespace tidepool::nostr
