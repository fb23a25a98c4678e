/*
MIT License

Copyright (c) 2019 Vladislav Troinich

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <csignal>
#include <cxxopts.hpp>
#include <iostream>
#include <limits>
#include <memory>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vbox_asio/config.hpp>
#include <vbox_asio/vbox_asio.hpp>

#include "include/worker.hpp"
#include "modes/query.hpp"
#include "modes/watcher.hpp"

using vbox_tool::output_mode;
using vbox_tool::query_args;
using vbox_tool::query_kind;
using vbox_tool::querier;
using vbox_tool::watcher;
using vbox_tool::worker;

const std::string watch_mode("watch");

// Absent options read as 0; values outside T are rejected instead of wrapping
template <typename T>
bool ranged_arg(const cxxopts::ParseResult& result, const char* name, T& out,
                const std::shared_ptr<spdlog::logger>& console) {
    out = 0;
    if (!result.count(name))
        return true;

    auto text = result[name].as<std::string>();
    auto value = vbox_asio::parse_number<T>(text);
    if (!value.has_value()) {
        console->error("--{} must be a number between 0 and {}, got '{}'", name,
                       static_cast<unsigned>(std::numeric_limits<T>::max()), text);
        return false;
    }
    out = *value;
    return true;
}

int main(int argc, char* argv[]) {
    try {
        cxxopts::Options options(argv[0], " - query and control a Vitrea vBox");
        vbox_asio::connect_config conf;
        std::string mode;
        int stats_interval = 0;
        /* clang-format off */
        options.add_options()
        ("h,help", "Print help")
        ("d,debug", "Enable debugging")
        ("address", "Address of the vBox", cxxopts::value<std::string>())
        ("port", "Port of the vBox", cxxopts::value<uint16_t>())
        ("user", "Username", cxxopts::value<std::string>())
        ("pass", "Password", cxxopts::value<std::string>())
        ("protocol", "Protocol version: v1 or v2 (default: v2)", cxxopts::value<std::string>())
        ("mode", "rooms, nodes, room, node, key, params, on, off, release or watch", cxxopts::value<std::string>(mode))
        ("id", "Room or node id (room/node mode)", cxxopts::value<std::string>())
        ("node", "Node id (key/params/on/off/release mode)", cxxopts::value<std::string>())
        ("key", "Key id (key/params/on/off/release mode)", cxxopts::value<std::string>())
        ("dimmer", "Dimmer ratio 0-100 (on mode)", cxxopts::value<std::string>())
        ("timer", "Seconds before the key reverts (on mode)", cxxopts::value<std::string>())
        ("timeout", "Request timeout in ms (default: 10000)", cxxopts::value<int>())
        ("heartbeat", "Heartbeat interval in ms, 0 disables (default: 3000)", cxxopts::value<int>())
        ("no_reconnect", "Do not reconnect after the connection drops")
        ("ignore_acks", "Log acknowledgements at debug level only")
        ("all", "Print every unsolicited frame, not only key status (watch mode)")
        ("stats_interval", "stat interval seconds (watch mode)", cxxopts::value<int>(stats_interval))
        ("json", "Output responses as JSON")
        ;
        /* clang-format on */
        options.parse_positional({"mode"});
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        auto console = spdlog::stdout_color_mt("console");

        if (result.count("debug")) {
            console->set_level(spdlog::level::debug);
        }

        if (result.count("mode") == 0) {
            console->error("Please specify mode");
            return 1;
        }

        auto env_status = vbox_asio::load_config_from_env(conf);
        if (env_status.failed()) {
            console->warn("ignoring environment: {}", env_status.error());
        }

        if (result.count("address")) {
            conf.address = result["address"].as<std::string>();
        }
        if (result.count("port")) {
            conf.port = result["port"].as<uint16_t>();
        }
        if (result.count("user")) {
            conf.user = result["user"].as<std::string>();
        }
        if (result.count("pass")) {
            conf.password = result["pass"].as<std::string>();
        }
        if (result.count("protocol")) {
            conf.version = vbox_asio::parse_protocol_version(result["protocol"].as<std::string>());
        }
        if (result.count("timeout")) {
            conf.request_timeout = std::chrono::milliseconds(result["timeout"].as<int>());
        }
        if (result.count("heartbeat")) {
            conf.heartbeat_interval = std::chrono::milliseconds(result["heartbeat"].as<int>());
        }
        if (result.count("no_reconnect")) {
            conf.should_reconnect = false;
        }
        if (result.count("ignore_acks")) {
            conf.ignore_ack_logs = true;
        }

        output_mode out_mode = result.count("json") ? output_mode::json : output_mode::normal;

        bool is_watch = mode == watch_mode;
        query_args args;
        if (!is_watch) {
            auto kind = magic_enum::enum_cast<query_kind>(mode);
            if (!kind.has_value()) {
                console->error("Invalid mode. Use --help to see available modes");
                return 1;
            }
            args.kind = kind.value();
            if (!ranged_arg(result, "id", args.id, console) ||
                !ranged_arg(result, "node", args.node, console) ||
                !ranged_arg(result, "key", args.key, console) ||
                !ranged_arg(result, "dimmer", args.dimmer, console) ||
                !ranged_arg(result, "timer", args.timer, console)) {
                return 1;
            }

            bool needs_id = args.kind == query_kind::room || args.kind == query_kind::node;
            bool needs_key = args.kind != query_kind::rooms && args.kind != query_kind::nodes && !needs_id;
            if (needs_id && !result.count("id")) {
                console->error("{} mode requires --id", mode);
                return 1;
            }
            if (needs_key && (!result.count("node") || !result.count("key"))) {
                console->error("{} mode requires --node and --key", mode);
                return 1;
            }
        }

        asio::io_context ioc;
        int exit_code = 0;

        auto conn = vbox_asio::create_connection(
            ioc,
            [&](vbox_asio::iconnection& /*c*/) -> asio::awaitable<void> {
                console->info("on connected");
                co_return;
            },
            [&](vbox_asio::iconnection& /*c*/) -> asio::awaitable<void> {
                console->info("on disconnected");
                co_return;
            },
            [&](vbox_asio::iconnection& /*c*/, vbox_asio::string_view err) -> asio::awaitable<void> {
                console->error("on error: {}", err);
                exit_code = 1;
                ioc.stop();
                co_return;
            },
            console);

        std::unique_ptr<worker> w;
        if (is_watch) {
            w = std::make_unique<watcher>(ioc, console, conn, stats_interval, out_mode,
                                          result.count("all") > 0);
        } else {
            // Short-lived query, no point reconnecting behind it
            conf.should_reconnect = false;
            w = std::make_unique<querier>(ioc, console, conn, args, out_mode);
        }

        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const asio::error_code& ec, int /*signo*/) {
            if (ec)
                return;
            console->info("interrupted, disconnecting");
            conn->disconnect();
            ioc.stop();
        });

        asio::co_spawn(
            ioc,
            [&]() -> asio::awaitable<void> {
                auto s = co_await conn->connect(conf);
                if (s.failed()) {
                    console->error("connect failed: {}", s.error());
                    exit_code = 1;
                    ioc.stop();
                    co_return;
                }
                co_await w->run();
            },
            asio::detached);

        ioc.run();
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
}
