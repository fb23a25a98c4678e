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

#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "interface.hpp"

namespace vbox_asio {

namespace env {
    constexpr auto prefix = "VITREA_VBOX_";

    constexpr auto host = "HOST";
    constexpr auto port = "PORT";
    constexpr auto username = "USERNAME";
    constexpr auto password = "PASSWORD";
    constexpr auto version = "VERSION";
    constexpr auto should_reconnect = "SHOULD_RECONNECT";
    constexpr auto request_timeout = "REQUEST_TIMEOUT";
    constexpr auto request_buffer = "REQUEST_BUFFER";
    constexpr auto ignore_ack_logs = "IGNORE_ACK_LOGS";
    constexpr auto heartbeat_interval = "HEARTBEAT_INTERVAL";
}

using env_lookup_fn = std::function<optional<std::string>(const std::string& name)>;

inline optional<std::string> process_env(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (v == nullptr)
        return std::nullopt;
    return std::string(v);
}

inline std::string to_lower(string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// 1/true/yes/on and 0/false/no/off, case-insensitive
[[nodiscard]] inline optional<bool> parse_bool(string_view s) {
    auto v = to_lower(s);
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

// Anything other than v1 selects v2
[[nodiscard]] inline protocol_version parse_protocol_version(string_view s) {
    auto v = to_lower(s);
    if (v == "v1" || v == "1")
        return protocol_version::v1;
    return protocol_version::v2;
}

template <class T>
[[nodiscard]] inline optional<T> parse_number(string_view s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size())
        return std::nullopt;
    return value;
}

// "alice" -> "a***e"
[[nodiscard]] inline std::string redact(string_view secret) {
    if (secret.empty())
        return {};
    if (secret.size() <= 2)
        return "***";
    return fmt::format("{}***{}", secret.front(), secret.back());
}

[[nodiscard]] inline std::string describe(const connect_config& conf) {
    return fmt::format("{}:{} user={} password={} version={} reconnect={} heartbeat={}ms "
                       "timeout={}ms buffer={}ms",
                       conf.address, conf.port, redact(conf.user.value_or("")),
                       redact(conf.password.value_or("")), magic_enum::enum_name(conf.version),
                       conf.should_reconnect, conf.heartbeat_interval.count(),
                       conf.request_timeout.count(), conf.request_buffer.count());
}

/**
 * @brief Overlay VITREA_VBOX_* variables onto conf.
 *
 * Unset variables keep the current value. Values that do not parse are skipped and listed
 * in the returned invalid_config status; the remaining variables are still applied.
 */
inline status load_config_from_env(connect_config& conf, const env_lookup_fn& lookup = process_env) {
    std::vector<std::string> bad;

    auto get = [&lookup](const char* name) { return lookup(std::string(env::prefix) + name); };

    auto apply_bool = [&](const char* name, bool& target) {
        if (auto v = get(name)) {
            if (auto b = parse_bool(*v)) {
                target = *b;
            } else {
                bad.push_back(fmt::format("{}{}={}", env::prefix, name, *v));
            }
        }
    };

    auto apply_ms = [&](const char* name, std::chrono::milliseconds& target) {
        if (auto v = get(name)) {
            if (auto n = parse_number<uint32_t>(*v)) {
                target = std::chrono::milliseconds(*n);
            } else {
                bad.push_back(fmt::format("{}{}={}", env::prefix, name, *v));
            }
        }
    };

    if (auto v = get(env::host); v && !v->empty()) {
        conf.address = *v;
    }

    if (auto v = get(env::port)) {
        if (auto n = parse_number<uint16_t>(*v); n && *n > 0) {
            conf.port = *n;
        } else {
            bad.push_back(fmt::format("{}{}={}", env::prefix, env::port, *v));
        }
    }

    if (auto v = get(env::username)) {
        conf.user = *v;
    }

    if (auto v = get(env::password)) {
        conf.password = *v;
    }

    if (auto v = get(env::version)) {
        conf.version = parse_protocol_version(*v);
    }

    apply_bool(env::should_reconnect, conf.should_reconnect);
    apply_bool(env::ignore_ack_logs, conf.ignore_ack_logs);
    apply_ms(env::request_timeout, conf.request_timeout);
    apply_ms(env::request_buffer, conf.request_buffer);
    apply_ms(env::heartbeat_interval, conf.heartbeat_interval);

    if (!bad.empty()) {
        return status(error_code::invalid_config, fmt::format("{}", fmt::join(bad, ", ")));
    }
    return status();
}

} // namespace vbox_asio
