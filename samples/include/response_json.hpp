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

#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <vbox_asio/protocol.hpp>
#include <vbox_asio/responses.hpp>

namespace vbox_tool {

inline nlohmann::json to_json(const vbox_asio::response& r) {
    using namespace vbox_asio;
    using nlohmann::json;

    json j;
    j["code"] = r.code;
    j["message_id"] = r.message_id;

    auto code_name = magic_enum::enum_name(static_cast<command_id>(r.code));
    if (!code_name.empty()) {
        j["type"] = std::string(code_name);
    }

    std::visit(
        [&j](const auto& body) {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, room_count_response> ||
                          std::is_same_v<T, node_count_response>) {
                j["count"] = body.count;
                j["ids"] = body.ids;
            } else if constexpr (std::is_same_v<T, room_meta_data_response>) {
                j["room_id"] = body.room_id;
                j["name"] = body.name;
            } else if constexpr (std::is_same_v<T, node_meta_data_response>) {
                j["node_id"] = body.node_id;
                j["mac_address"] = to_hex_string(body.mac_address);
                j["total_keys"] = body.total_keys;
                j["keys"] = json::array();
                for (const auto& k : body.keys) {
                    j["keys"].push_back({{"id", k.id}, {"type", k.type}});
                }
                j["locked"] = body.is_locked();
                j["led_level"] = std::string(magic_enum::enum_name(body.led_level));
                j["version"] = body.version;
                j["room_id"] = body.room_id;
            } else if constexpr (std::is_same_v<T, key_status_response>) {
                j["node_id"] = body.node_id;
                j["key_id"] = body.key_id;
                auto power = magic_enum::enum_name(body.power);
                j["power"] = power.empty() ? std::to_string(static_cast<int>(body.power))
                                           : std::string(power);
            } else if constexpr (std::is_same_v<T, key_parameters_response>) {
                j["node_id"] = body.node_id;
                j["key_id"] = body.key_id;
                j["category"] = std::string(magic_enum::enum_name(body.category));
                j["dimmer_ratio"] = body.dimmer_ratio;
                j["name"] = body.name;
            } else if constexpr (std::is_same_v<T, node_meta_data_v2_response>) {
                j["node_id"] = body.node_id;
                j["payload"] = to_hex_string(body.payload);
            } else if constexpr (std::is_same_v<T, key_parameters_v2_response>) {
                j["node_id"] = body.node_id;
                j["key_id"] = body.key_id;
                j["payload"] = to_hex_string(body.payload);
            } else if constexpr (std::is_same_v<T, generic_unused_response> ||
                                 std::is_same_v<T, internal_unit_statuses_response>) {
                j["payload"] = to_hex_string(body.payload);
            }
        },
        r.body);

    return j;
}

} // namespace vbox_tool
