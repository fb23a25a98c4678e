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

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <span>
#include <string>
#include <type_traits>
#include <variant>

#include "interface.hpp"
#include "protocol.hpp"

namespace vbox_asio {

namespace detail {

// Out-of-range payload reads return zero
inline uint8_t at(const bytes_t& p, std::size_t i) noexcept {
    return i < p.size() ? p[i] : uint8_t{0};
}

inline std::span<const uint8_t> tail(const bytes_t& p, std::size_t from) noexcept {
    if (from >= p.size())
        return {};
    return std::span<const uint8_t>(p).subspan(from);
}

} // namespace detail

struct response_factory {
    using parser_fn = response_body (*)(const frame&);

    static response_body parse_generic(const frame& f) {
        return generic_unused_response{f.command, f.payload};
    }

    static response_body parse_acknowledgement(const frame&) {
        return acknowledgement{};
    }

    static response_body parse_room_meta_data(const frame& f) {
        room_meta_data_response r;
        r.room_id = detail::at(f.payload, 0);
        r.name = decode_utf16le(detail::tail(f.payload, 1));
        return r;
    }

    static response_body parse_room_count(const frame& f) {
        room_count_response r;
        r.count = detail::at(f.payload, 0);
        auto ids = detail::tail(f.payload, 1);
        r.ids.assign(ids.begin(), ids.end());
        return r;
    }

    static response_body parse_node_count(const frame& f) {
        node_count_response r;
        r.count = detail::at(f.payload, 0);
        auto ids = detail::tail(f.payload, 1);
        r.ids.assign(ids.begin(), ids.end());
        return r;
    }

    static response_body parse_node_meta_data(const frame& f) {
        static constexpr std::size_t mac_index = 1;
        static constexpr std::size_t total_keys_index = 10;
        static constexpr std::size_t keys_index = 11;

        const auto& p = f.payload;
        node_meta_data_response r;
        r.node_id = detail::at(p, 0);
        for (std::size_t i = 0; i < r.mac_address.size(); ++i) {
            r.mac_address[i] = detail::at(p, mac_index + i);
        }
        r.total_keys = detail::at(p, total_keys_index);

        r.keys.reserve(r.total_keys);
        for (uint8_t k = 0; k < r.total_keys; ++k) {
            r.keys.push_back(node_key{k, detail::at(p, keys_index + k)});
        }

        const std::size_t o = keys_index + r.total_keys;
        r.lock = static_cast<lock_status>(detail::at(p, o));
        r.led_level = static_cast<led_brightness>(detail::at(p, o + 1));
        if (o + 5 < p.size()) {
            r.version = fmt::format("{}.{}{}", p[o + 3], p[o + 4], p[o + 5]);
        } else {
            r.version = "0.0.0";
        }
        r.room_id = detail::at(p, o + 7);
        return r;
    }

    static response_body parse_node_meta_data_v2(const frame& f) {
        return node_meta_data_v2_response{detail::at(f.payload, 0), f.payload};
    }

    static response_body parse_key_status(const frame& f) {
        key_status_response r;
        r.node_id = detail::at(f.payload, 0);
        r.key_id = detail::at(f.payload, 1);
        r.power = static_cast<key_power>(detail::at(f.payload, 2));
        return r;
    }

    static response_body parse_key_parameters(const frame& f) {
        static constexpr std::size_t name_index = 12;

        key_parameters_response r;
        r.node_id = detail::at(f.payload, 0);
        r.key_id = detail::at(f.payload, 1);
        r.category = static_cast<key_category>(detail::at(f.payload, 2));
        r.dimmer_ratio = detail::at(f.payload, 3);
        r.name = decode_utf16le(detail::tail(f.payload, name_index));
        return r;
    }

    static response_body parse_key_parameters_v2(const frame& f) {
        return key_parameters_v2_response{detail::at(f.payload, 0), detail::at(f.payload, 1),
                                          f.payload};
    }

    static response_body parse_internal_unit_statuses(const frame& f) {
        return internal_unit_statuses_response{f.payload};
    }

    // nullptr for codes without a dedicated parser
    [[nodiscard]] static parser_fn lookup(uint8_t code, protocol_version version) noexcept {
        const bool v1 = version == protocol_version::v1;

        switch (static_cast<command_id>(code)) {
        case command_id::acknowledgement:
            return &parse_acknowledgement;
        case command_id::room_meta_data:
            return &parse_room_meta_data;
        case command_id::room_count:
            return &parse_room_count;
        case command_id::node_meta_data:
            return v1 ? &parse_node_meta_data : &parse_node_meta_data_v2;
        case command_id::node_count:
            return &parse_node_count;
        case command_id::key_status:
            return &parse_key_status;
        case command_id::key_parameters:
            return v1 ? &parse_key_parameters : &parse_key_parameters_v2;
        case command_id::internal_unit_statuses:
            return &parse_internal_unit_statuses;
        default:
            return nullptr;
        }
    }

    [[nodiscard]] static response from_frame(const frame& f, protocol_version version) {
        response r;
        r.code = f.command;
        r.message_id = f.message_id;

        auto parser = lookup(f.command, version);
        r.body = parser ? parser(f) : parse_generic(f);
        return r;
    }
};

// Short human readable form for logs
[[nodiscard]] inline std::string describe(const response& r) {
    auto code_name = magic_enum::enum_name(static_cast<command_id>(r.code));
    std::string name = code_name.empty() ? fmt::format("{:#04x}", r.code) : std::string(code_name);

    return std::visit(
        [&](const auto& body) -> std::string {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, acknowledgement>) {
                return fmt::format("{} id={}", name, r.message_id);
            } else if constexpr (std::is_same_v<T, room_count_response> ||
                                 std::is_same_v<T, node_count_response>) {
                return fmt::format("{} id={} count={} ids=[{}]", name, r.message_id, body.count,
                                   fmt::join(body.ids, ","));
            } else if constexpr (std::is_same_v<T, room_meta_data_response>) {
                return fmt::format("{} id={} room={} name='{}'", name, r.message_id, body.room_id,
                                   body.name);
            } else if constexpr (std::is_same_v<T, node_meta_data_response>) {
                return fmt::format("{} id={} node={} keys={} room={} version={} locked={}", name,
                                   r.message_id, body.node_id, body.total_keys, body.room_id,
                                   body.version, body.is_locked());
            } else if constexpr (std::is_same_v<T, key_status_response>) {
                return fmt::format("{} id={} node={} key={} power={}", name, r.message_id,
                                   body.node_id, body.key_id, magic_enum::enum_name(body.power));
            } else if constexpr (std::is_same_v<T, key_parameters_response>) {
                return fmt::format("{} id={} node={} key={} category={} dimmer={} name='{}'", name,
                                   r.message_id, body.node_id, body.key_id,
                                   magic_enum::enum_name(body.category), body.dimmer_ratio,
                                   body.name);
            } else if constexpr (std::is_same_v<T, generic_unused_response> ||
                                 std::is_same_v<T, internal_unit_statuses_response>) {
                return fmt::format("{} id={} payload={}", name, r.message_id,
                                   to_hex_string(body.payload));
            } else {
                return fmt::format("{} id={} node={} payload={}", name, r.message_id,
                                   body.node_id, to_hex_string(body.payload));
            }
        },
        r.body);
}

} // namespace vbox_asio
