#include <platform/time_utils.hpp>

#include <chrono>
#include <ctime>
#include <fmt/format.h>
#include <tuple>

namespace tidepool::platform {

auto unix_timestamp_now() -> std::uint64_t
{
  using namespace std::chrono;
  return static_cast<std::uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

auto format_unix_timestamp(std::uint64_t timestamp) -> std::string
{
  const auto time_value = static_cast<std::time_t>(timestamp);

  std::tm time_tm{};
#if defined(_WIN32)
  std::ignore = localtime_s(&time_tm, &time_value);
#else
  std::ignore = localtime_r(&time_value, &time_tm);
#endif

  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}",
    time_tm.tm_year + 1900,
    time_tm.tm_mon + 1,
    time_tm.tm_mday,
    time_tm.tm_hour,
    time_tm.tm_min,
    time_tm.tm_sec);
}

}// namespace tidepool::platform
