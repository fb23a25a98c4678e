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

#include <cstdint>
#include <string_view>

#include "interface.hpp"
#include "protocol.hpp"

namespace vbox_asio::requests {

inline request login(string_view user, string_view password) {
    request r;
    r.command = command_id::login;
    r.reply_code = command_id::acknowledgement;

    auto u = encode_utf16le(user);
    auto p = encode_utf16le(password);
    r.payload.reserve(u.size() + p.size() + 2);
    r.payload.push_back(protocol::login_field_marker);
    r.payload.insert(r.payload.end(), u.begin(), u.end());
    r.payload.push_back(protocol::login_field_marker);
    r.payload.insert(r.payload.end(), p.begin(), p.end());
    return r;
}

// Explicit heartbeat; the scheduler posts one with expects_response cleared
inline request heartbeat() {
    request r;
    r.command = command_id::heartbeat;
    r.reply_code = command_id::acknowledgement;
    return r;
}

inline request toggle_heartbeat(bool enable, bool unsolicited_updates) {
    request r;
    r.command = command_id::toggle_heartbeat;
    r.payload = {static_cast<uint8_t>(enable ? 1 : 0),
                 static_cast<uint8_t>(unsolicited_updates ? 1 : 0)};
    r.reply_code = command_id::acknowledgement;
    return r;
}

inline request room_meta_data(uint8_t room_id) {
    request r;
    r.command = command_id::room_meta_data;
    r.payload = {room_id};
    r.reply_code = command_id::room_meta_data;
    return r;
}

inline request room_count() {
    request r;
    r.command = command_id::room_count;
    r.reply_code = command_id::room_count;
    return r;
}

inline request node_meta_data(uint8_t node_id) {
    request r;
    r.command = command_id::node_meta_data;
    r.payload = {node_id};
    r.reply_code = command_id::node_meta_data;
    return r;
}

inline request node_count() {
    request r;
    r.command = command_id::node_count;
    r.reply_code = command_id::node_count;
    return r;
}

// The box answers with whatever code suits the node, so any code correlates
inline request node_status(uint8_t node_id) {
    request r;
    r.command = command_id::node_status;
    r.payload = {node_id};
    return r;
}

/**
 * @brief Switch a key.
 * @param dimmer  0..100, meaningful for dimmers only
 * @param timer   seconds before the key reverts, 0 = none
 */
inline request toggle_key_status(uint8_t node_id, uint8_t key_id, key_power power,
                                 uint8_t dimmer = 0, uint16_t timer = 0) {
    request r;
    r.command = command_id::toggle_key_status;
    r.payload = {node_id,
                 key_id,
                 static_cast<uint8_t>(power),
                 dimmer,
                 static_cast<uint8_t>(timer >> 8),
                 static_cast<uint8_t>(timer & 0xFF)};
    r.reply_code = command_id::acknowledgement;
    return r;
}

inline request key_status(uint8_t node_id, uint8_t key_id) {
    request r;
    r.command = command_id::key_status;
    r.payload = {node_id, key_id};
    r.reply_code = command_id::key_status;
    return r;
}

inline request key_parameters(uint8_t node_id, uint8_t key_id) {
    request r;
    r.command = command_id::key_parameters;
    r.payload = {node_id, key_id};
    r.reply_code = command_id::key_parameters;
    return r;
}

inline request internal_unit_statuses() {
    request r;
    r.command = command_id::internal_unit_statuses;
    r.reply_code = command_id::internal_unit_statuses;
    return r;
}

} // namespace vbox_asio::requests
