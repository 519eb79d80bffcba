#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/errors.hpp>
#include <core/overload.hpp>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fmt/core.h>
#include <memory>
#include <nostr/client.hpp>
#include <nostr/relay_pool.hpp>
#include <platform/env_utils.hpp>
#include <platform/time_utils.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace {

using tidepool::nostr::events::notification_t;
using tidepool::nostr::events::subscription_update_t;
using tidepool::nostr::events::wire_message;

auto load_identity(const tidepool::cli_utils::cli_args &args) -> tidepool::nostr::keys
{
  if (args.key_file.empty()) {
    spdlog::info("No key file given, using a fresh identity");
    return tidepool::nostr::keys::generate();
  }
  return tidepool::nostr::keys::from_secret_key_string(tidepool::platform::read_trimmed_file(args.key_file));
}

auto print_updates(std::shared_ptr<tidepool::nostr::events::subscription_queue_t> updates)
  -> boost::asio::awaitable<void>
{
  using namespace tidepool::nostr::events;
  try {
    while (true) {
      auto update = co_await updates->pop();
      std::visit(tidepool::core::overload{ [](const event_received &evt) {
                                            fmt::print("[{}] {}... via {}\n  {}\n",
                                              tidepool::platform::format_unix_timestamp(evt.event.created_at),
                                              evt.event.pubkey.substr(0, 12),
                                              evt.relay_url,
                                              evt.event.content);
                                          },
                   [](const end_of_stored_events &evt) { spdlog::info("{} finished replaying", evt.relay_url); },
                   [](const replay_complete & /*evt*/) { fmt::print("-- all relays caught up, streaming live --\n"); },
                   [](const subscription_closed &evt) {
                     spdlog::warn("{} closed the subscription: {}", evt.relay_url, evt.message);
                   } },
        update);
    }
  } catch (const boost::system::system_error &e) {
    spdlog::debug("Subscription stream ended: {}", e.what());
  }
}

auto print_notifications(std::shared_ptr<tidepool::async::async_queue<notification_t>> notifications)
  -> boost::asio::awaitable<void>
{
  using namespace tidepool::nostr::events;
  try {
    while (true) {
      auto notification = co_await notifications->pop();
      std::visit(tidepool::core::overload{ [](const relay_status_changed &evt) {
                                            spdlog::info("{} is {}{}",
                                              evt.relay_url,
                                              tidepool::nostr::to_string(evt.status),
                                              evt.error.empty() ? "" : " (" + evt.error + ")");
                                          },
                   [](const publish_acknowledged &evt) {
                     spdlog::info("{} {} event {} {}",
                       evt.relay_url,
                       evt.accepted ? "accepted" : "rejected",
                       evt.event_id,
                       evt.message);
                   },
                   [](const relay_notice &evt) { spdlog::info("Notice from {}: {}", evt.relay_url, evt.message); },
                   [](const auth_requested &evt) { spdlog::info("{} requests authentication", evt.relay_url); },
                   [](const status_report &evt) {
                     for (const auto &relay : evt.relays) {
                       fmt::print("{}: {}\n", relay.relay_url, tidepool::nostr::to_string(relay.status));
                     }
                   } },
        notification);
    }
  } catch (const boost::system::system_error &e) {
    spdlog::debug("Notification stream ended: {}", e.what());
  }
}

auto print_wire(std::shared_ptr<tidepool::async::async_queue<wire_message>> frames) -> boost::asio::awaitable<void>
{
  try {
    while (true) {
      auto frame = co_await frames->pop();
      const auto text = std::visit([](const auto &message) { return tidepool::nostr::protocol::serialize(message); },
        frame.message);
      fmt::print("{} {} {}\n",
        frame.direction == tidepool::nostr::events::direction::outbound ? ">>" : "<<",
        frame.relay_url,
        text);
    }
  } catch (const boost::system::system_error &e) {
    spdlog::debug("Wire stream ended: {}", e.what());
  }
}

}// namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = tidepool::cli_utils::parse_cli_args(argc, argv);

  if (args.show_version) {
    fmt::print("{} v{}\n", tidepool::cmake::project_name, tidepool::cmake::project_version);
    return 0;
  }

  if (not tidepool::cli_utils::validate_cli_args(args)) { return 1; }

  tidepool::cli_utils::configure_logging(args);

  try {
    auto identity = load_identity(args);
    tidepool::cli_utils::print_app_banner(identity.to_npub(), args.relays.size());

    auto io_context = std::make_shared<boost::asio::io_context>();
    auto pool = tidepool::nostr::make_websocket_relay_pool(
      io_context, tidepool::nostr::pool_options{ .observe_wire = args.observe_wire });
    tidepool::nostr::client<tidepool::transport::websocket_stream> client(identity, pool);

    boost::asio::co_spawn(*io_context, print_notifications(pool->notifications()), boost::asio::detached);
    if (args.observe_wire) { boost::asio::co_spawn(*io_context, print_wire(pool->wire_messages()), boost::asio::detached); }

    for (const auto &relay_url : args.relays) { client.add_relay(relay_url, true); }

    if (not args.publish_text.empty()) {
      auto note = client.publish_text_note(args.publish_text);
      spdlog::info("Published text note {}", note.id);
    }

    tidepool::nostr::filter subscription_filter;
    for (const auto kind : args.kinds) { subscription_filter.kind(static_cast<tidepool::nostr::kind>(kind)); }
    for (const auto &author : args.authors) { subscription_filter.author(author); }
    subscription_filter.limit_to(args.limit);

    auto subscription = client.subscribe({ subscription_filter });
    boost::asio::co_spawn(*io_context, print_updates(subscription.updates), boost::asio::detached);

    boost::asio::steady_timer grace_timer(*io_context);
    auto stop = [&pool, &grace_timer, io_context]() {
      pool->shutdown();
      grace_timer.expires_after(std::chrono::seconds(2));
      grace_timer.async_wait([io_context](const boost::system::error_code & /*error*/) { io_context->stop(); });
    };

    boost::asio::signal_set signals(*io_context, SIGINT, SIGTERM);
    signals.async_wait([&stop](const boost::system::error_code &error, int /*signal*/) {
      if (not error) { stop(); }
    });

    boost::asio::steady_timer run_timer(*io_context);
    if (args.run_seconds > 0) {
      run_timer.expires_after(std::chrono::seconds(args.run_seconds));
      run_timer.async_wait([&stop, &signals](const boost::system::error_code &error) {
        if (not error) {
          signals.cancel();
          stop();
        }
      });
    }

    io_context->run();
  } catch (const tidepool::core::key_error &e) {
    spdlog::error("Cannot load identity: {}", e.what());
    return 1;
  } catch (const std::exception &e) {
    spdlog::error("Fatal: {}", e.what());
    return 1;
  }

  return 0;
}
