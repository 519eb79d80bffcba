#pragma once

#include <CLI/CLI.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <platform/env_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace tidepool::cli_utils {

struct cli_args
{
  std::vector<std::string> relays{ "wss://relay.damus.io", "wss://nos.lol" };
  std::string key_file;
  std::vector<std::uint16_t> kinds{ 1 };
  std::vector<std::string> authors;
  std::size_t limit = 20;
  std::string publish_text;
  std::uint32_t run_seconds = 0;
  bool observe_wire = false;
  bool verbose = false;
  bool show_version = false;
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_option("-r,--relay", args.relays, "Relay URL (repeatable)")->capture_default_str();
  app.add_option("-k,--key-file", args.key_file, "File holding a hex or nsec secret key");
  app.add_option("-K,--kind", args.kinds, "Event kind to subscribe to (repeatable)")->capture_default_str();
  app.add_option("-a,--author", args.authors, "Author public key in hex (repeatable)");
  app.add_option("-l,--limit", args.limit, "Stored events requested per relay")->capture_default_str();
  app.add_option("-p,--publish", args.publish_text, "Publish a text note before subscribing");
  app.add_option("-t,--time", args.run_seconds, "Stop after this many seconds, 0 runs until interrupted")
    ->capture_default_str();
  app.add_flag("-w,--wire", args.observe_wire, "Print every frame exchanged with relays");
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");
}

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "tidepool - multi-relay Nostr client", "tidepool" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  if (not args.key_file.empty()) { args.key_file = platform::expand_tilde_path(args.key_file); }

  return args;
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (args.relays.empty()) {
    spdlog::error("At least one relay is required");
    return false;
  }
  if (args.kinds.empty() and args.authors.empty()) {
    spdlog::error("Subscribe to at least one kind or author");
    return false;
  }
  return true;
}

}// namespace tidepool::cli_utils
