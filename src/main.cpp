#include "livelink/api/open_platform_client.hpp"
#include "livelink/cli/config_loader.hpp"
#include "livelink/errors.hpp"
#include "livelink/live/event_bus.hpp"
#include "livelink/live/event_formatter.hpp"
#include "livelink/live/live_manager.hpp"
#include "livelink/live/session_info.hpp"

#include <CLI/CLI.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using livelink::live::EventBus;
using livelink::live::EventQueue;
using livelink::live::LiveManager;
using livelink::live::SessionState;

struct Options {
    std::string config_path;
    std::string identity_code;
    std::string log_level;
    bool interactive{false};
};

std::vector<std::string> tokenize(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

void print_help() {
    std::cout << "Commands:\n"
              << "  help                Show this message\n"
              << "  start [code]        Start a live session (optional identity code)\n"
              << "  stop                Stop the active session\n"
              << "  status              Show the active session\n"
              << "  exit / quit         Stop the session and exit\n";
}

// Prints live events from the consumer queue and status announcements from the bus.
class ConsolePrinter {
public:
    ConsolePrinter(std::shared_ptr<EventQueue> queue, std::shared_ptr<EventBus::Subscription> subscription)
        : queue_(std::move(queue)), subscription_(std::move(subscription)) {
        thread_ = std::thread([this] { loop(); });
    }

    ~ConsolePrinter() {
        running_ = false;
        queue_->close();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void loop() {
        while (running_) {
            while (auto message = subscription_->try_next()) {
                if (message->event_name != livelink::live::kLiveEventName) {
                    spdlog::info("{}", message->encode());
                }
            }
            auto event = queue_->pop(std::chrono::milliseconds(200));
            if (!event) {
                continue;
            }
            if (auto formatted = livelink::live::format_event(*event)) {
                std::cout << formatted->to_string() << std::endl;
            } else {
                spdlog::debug("Unhandled live command {}: {}", event->cmd, event->data.dump());
            }
        }
    }

    std::shared_ptr<EventQueue> queue_;
    std::shared_ptr<EventBus::Subscription> subscription_;
    std::atomic<bool> running_{true};
    std::thread thread_;
};

bool session_finished(const LiveManager& manager) {
    const auto state = manager.session_state();
    return state && (*state == SessionState::Closed || *state == SessionState::Failed);
}

void announce_stopped(EventBus& bus, const std::optional<livelink::live::SessionInfo>& info) {
    if (info) {
        auto payload = livelink::live::session_payload(*info);
        payload["active"] = false;
        bus.publish("live.stopped", std::move(payload));
    }
}

int run_until_signal(LiveManager& manager, EventBus& bus) {
    const auto info = manager.start();
    bus.publish("live.started", livelink::live::session_payload(info));

    boost::asio::io_context io_context;
    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    boost::asio::steady_timer watchdog(io_context);

    signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::info("Received signal {}, stopping", signal_number);
        }
        watchdog.cancel();
    });

    std::function<void()> arm_watchdog = [&] {
        watchdog.expires_after(std::chrono::seconds(1));
        watchdog.async_wait([&](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            if (session_finished(manager)) {
                spdlog::warn("Live session ended on its own");
                signals.cancel();
                return;
            }
            arm_watchdog();
        });
    };
    arm_watchdog();
    io_context.run();

    announce_stopped(bus, manager.stop());
    return 0;
}

int run_interactive(LiveManager& manager, EventBus& bus) {
    print_help();
    std::string line;
    while (std::cout << "> " && std::getline(std::cin, line)) {
        auto tokens = tokenize(line);
        if (tokens.empty()) {
            continue;
        }
        const std::string& cmd = tokens.front();
        try {
            if (cmd == "help") {
                print_help();
            } else if (cmd == "start") {
                const auto info = tokens.size() >= 2 ? manager.start(tokens[1]) : manager.start();
                bus.publish("live.started", livelink::live::session_payload(info));
                std::cout << "Session " << info.session_id << " started for room " << info.room_id << " ("
                          << info.anchor_name << ")\n";
            } else if (cmd == "stop") {
                const auto info = manager.stop();
                if (!info) {
                    std::cout << "No active session.\n";
                    continue;
                }
                announce_stopped(bus, info);
                std::cout << "Session " << info->session_id << " stopped.\n";
            } else if (cmd == "status") {
                const auto info = manager.status();
                auto payload = info ? livelink::live::session_payload(*info) : livelink::live::inactive_payload();
                if (const auto state = manager.session_state()) {
                    payload["state"] = livelink::live::to_string(*state);
                }
                bus.publish("live.status", payload);
                std::cout << payload.dump(2) << "\n";
            } else if (cmd == "exit" || cmd == "quit") {
                break;
            } else {
                std::cout << "Unknown command: " << cmd << " (type 'help')\n";
            }
        } catch (const livelink::LiveError& ex) {
            std::cout << "Error: " << ex.what() << "\n";
        }
    }

    announce_stopped(bus, manager.stop());
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    Options opts;
    opts.config_path = livelink::cli::default_config_path();

    CLI::App app{"Live open platform push client"};
    app.add_option("-c,--config", opts.config_path, "YAML configuration file")->check(CLI::ExistingFile);
    app.add_option("--identity-code", opts.identity_code, "Streamer identity code (overrides live.identity_code)");
    app.add_option("--log-level", opts.log_level, "trace, debug, info, warn, error (overrides logging.level)");
    app.add_flag("-i,--interactive", opts.interactive, "Read start/stop/status commands from stdin");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    try {
        auto config = livelink::cli::load_config(opts.config_path);
        if (!opts.identity_code.empty()) {
            config.live.identity_code = opts.identity_code;
        }
        spdlog::set_level(livelink::cli::parse_log_level(opts.log_level.empty() ? config.log_level : opts.log_level));

        auto bus = std::make_shared<EventBus>();
        auto queue = std::make_shared<EventQueue>(config.queue_capacity);
        auto client = std::make_shared<livelink::api::OpenPlatformClient>(config.live);
        ConsolePrinter printer(queue, bus->subscribe());

        LiveManager manager(config.live, client, bus, queue);
        spdlog::info("Using open platform at {} (app {})", config.live.base_url(), config.live.app_id);

        return opts.interactive ? run_interactive(manager, *bus) : run_until_signal(manager, *bus);
    } catch (const livelink::ConfigError& ex) {
        spdlog::error("Configuration error: {}", ex.what());
        return 2;
    } catch (const std::exception& ex) {
        spdlog::error("Fatal error: {}", ex.what());
        return 1;
    }
}
