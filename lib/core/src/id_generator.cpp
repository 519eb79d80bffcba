#include <core/id_generator.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

namespace tidepool::core {

namespace {
  constexpr std::size_t prefix_length = 16;
}

id_generator::id_generator()
{
  auto uuid = random_uuid();
  std::erase(uuid, '-');
  prefix_ = uuid.substr(0, prefix_length);
}

auto id_generator::next() -> std::string { return fmt::format("{}:{}", prefix_, ++counter_); }

auto id_generator::random_uuid() -> std::string
{
  static thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

}// namespace tidepool::core
