#pragma once

#include "internal_use_only/config.hpp"
#include <cli_utils/cli_parser.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <string>

namespace tidepool::cli_utils {

inline auto configure_logging(const cli_args &args) -> void
{
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  if (args.verbose) { spdlog::set_level(spdlog::level::debug); }
}

inline auto print_app_banner(const std::string &npub, std::size_t relay_count) -> void
{
  fmt::print("{} v{}\n", tidepool::cmake::project_name, tidepool::cmake::project_version);
  fmt::print("Identity: {}\n", npub);
  fmt::print("Relays: {}\n\n", relay_count);
}

}// namespace tidepool::cli_utils
